#include "stmeta/easy.hpp"
#include "stmeta/safetensors.hpp"

#include "test_common.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using stmeta::ErrorKind;
using stmeta::Json;
using testutil::make_raw_container;

static std::vector<std::uint8_t> make_sample() {
    std::vector<stmeta::easy::TensorSpec> tensors;
    tensors.push_back(stmeta::easy::make_f32("w", {2, 2}, {1.0f, 2.0f, 3.0f, 4.0f}));
    tensors.push_back(stmeta::easy::make_i64("ids", {3}, {7, 8, 9}));

    Json::Object meta;
    meta.emplace_back("format", Json::string("pt"));
    meta.emplace_back("tags", stmeta::parse_json(R"(["a","b"])"));
    meta.emplace_back("rank", Json::integer(4));
    return stmeta::easy::build_container(tensors, meta);
}

static std::vector<std::uint8_t> payload_of(const std::vector<std::uint8_t>& bytes) {
    const stmeta::DecodedHeader d = stmeta::decode(bytes);
    return std::vector<std::uint8_t>(bytes.begin() + static_cast<std::ptrdiff_t>(d.payload_offset), bytes.end());
}

int main() {
    const std::vector<std::uint8_t> sample = make_sample();
    const std::vector<std::uint8_t> sample_payload = payload_of(sample);
    CHECK(sample_payload.size() == 4 * sizeof(float) + 3 * sizeof(std::int64_t));

    // Decode basics
    {
        const stmeta::DecodedHeader d = stmeta::decode(sample);
        CHECK(d.raw_header.is_object());
        CHECK(d.payload_offset == 8 + d.header_length);
        CHECK(stmeta::read_u64_le(sample.data()) == d.header_length);
        CHECK(stmeta::tensor_count(d.raw_header) == 2);
        CHECK(d.raw_header.as_object().front().first == stmeta::kMetadataKey);
    }

    // Extract: JSON text becomes structured, plain text stays raw
    {
        const stmeta::ExtractedMetadata md = stmeta::extract_metadata(stmeta::decode(sample).raw_header);
        CHECK(md.metadata.size() == 3);

        const stmeta::MetadataValue* fmt = md.find("format");
        CHECK(fmt && fmt->is_raw() && fmt->raw() == "pt");

        const stmeta::MetadataValue* tags = md.find("tags");
        CHECK(tags && tags->is_structured());
        CHECK(tags->structured().is_array());
        CHECK(tags->structured().as_array().size() == 2);
        CHECK(tags->structured().as_array()[1].as_string() == "b");

        const stmeta::MetadataValue* rank = md.find("rank");
        CHECK(rank && rank->is_structured() && rank->structured().is_number());
        CHECK(rank->structured().as_number().value == 4.0);

        CHECK(md.formatted_metadata.size() == 3);
        CHECK(md.formatted_metadata[1].first == "tags");
        CHECK(md.formatted_metadata[1].second.as_string() == R"(["a","b"])");
        CHECK(md.formatted_metadata[2].second.as_string() == "4");
    }

    // Round trip: re-encoding the extracted metadata reproduces the input
    {
        const stmeta::ExtractedMetadata md = stmeta::extract_metadata(stmeta::decode(sample).raw_header);
        const std::vector<std::uint8_t> again = stmeta::encode_update(sample, md.metadata);
        CHECK(again == sample);

        const std::vector<std::uint8_t> again_fmt = stmeta::encode_update(sample, md.formatted_metadata);
        CHECK(again_fmt == sample);
    }

    // Update: payload untouched, length prefix matches the new header
    {
        Json::Object update;
        update.emplace_back("description", Json::string("a much longer description than before"));
        update.emplace_back("config", stmeta::parse_json(R"({"hidden":2,"act":"gelu"})"));
        update.emplace_back("flag", Json::boolean(true));
        update.emplace_back("none", Json::null());

        const std::vector<std::uint8_t> out = stmeta::encode_update(sample, update);
        CHECK(payload_of(out) == sample_payload);

        const stmeta::DecodedHeader d = stmeta::decode(out);
        CHECK(d.header_length == out.size() - 8 - sample_payload.size());
        CHECK(stmeta::tensor_count(d.raw_header) == 2);

        const stmeta::ExtractedMetadata md = stmeta::extract_metadata(d.raw_header);
        CHECK(md.metadata.size() == 4);
        CHECK(md.find("format") == nullptr);
        CHECK(md.find("description")->is_raw());
        CHECK(md.find("config")->is_structured());
        CHECK(stmeta::json_equal(md.find("config")->structured(), stmeta::parse_json(R"({"act":"gelu","hidden":2})")));
        CHECK(md.find("flag")->structured().as_bool());
        CHECK(md.find("none")->structured().is_null());

        CHECK(md.formatted_metadata[1].second.as_string() == R"({"hidden":2,"act":"gelu"})");
        CHECK(md.formatted_metadata[2].second.as_string() == "true");
        CHECK(md.formatted_metadata[3].second.as_string() == "null");
    }

    // Tensor descriptors survive verbatim, including integers beyond 2^53
    {
        const std::string header =
            R"({"big":{"dtype":"U8","shape":[4],"data_offsets":[0,9007199254740993]},)"
            R"("__metadata__":{"k":"v"},"small":{"dtype":"F16","shape":[],"data_offsets":[0,2]}})";
        const std::vector<std::uint8_t> in = make_raw_container(header, {1, 2, 3, 4});

        Json::Object update;
        update.emplace_back("k", Json::string("w"));
        const std::vector<std::uint8_t> out = stmeta::encode_update(in, update);

        const std::string text(out.begin() + 8, out.end() - 4);
        CHECK(text ==
              R"({"big":{"dtype":"U8","shape":[4],"data_offsets":[0,9007199254740993]},)"
              R"("__metadata__":{"k":"w"},"small":{"dtype":"F16","shape":[],"data_offsets":[0,2]}})");
        CHECK(payload_of(out) == std::vector<std::uint8_t>({1, 2, 3, 4}));
    }

    // Missing __metadata__ is inserted first; empty update writes an empty object
    {
        const std::vector<std::uint8_t> in = make_raw_container(R"({"t":{"dtype":"U8","shape":[1],"data_offsets":[0,1]}})", {9});
        CHECK_THROWS_KIND(stmeta::extract_metadata(stmeta::decode(in).raw_header), ErrorKind::NoMetadata);

        Json::Object update;
        update.emplace_back("x", Json::string("y"));
        const std::vector<std::uint8_t> out = stmeta::encode_update(in, update);
        const stmeta::DecodedHeader d = stmeta::decode(out);
        CHECK(d.raw_header.as_object().front().first == stmeta::kMetadataKey);
        CHECK(d.raw_header.as_object().size() == 2);

        const std::vector<std::uint8_t> emptied = stmeta::encode_update(out, Json::Object{});
        const stmeta::DecodedHeader e = stmeta::decode(emptied);
        CHECK(e.raw_header.find(stmeta::kMetadataKey)->as_object().empty());
        CHECK_THROWS_KIND(stmeta::extract_metadata(e.raw_header), ErrorKind::NoMetadata);
        CHECK(payload_of(emptied) == std::vector<std::uint8_t>({9}));
    }

    // Structured string values keep their JSON quoting on the way back
    {
        const std::vector<std::uint8_t> in = make_raw_container(R"({"__metadata__":{"q":"\"quoted\""}})");
        const stmeta::ExtractedMetadata md = stmeta::extract_metadata(stmeta::decode(in).raw_header);
        CHECK(md.find("q")->is_structured());
        CHECK(md.find("q")->structured().as_string() == "quoted");
        CHECK(stmeta::encode_update(in, md.metadata) == in);
    }

    // Non-string metadata values from other producers pass through as structured
    {
        const std::vector<std::uint8_t> in = make_raw_container(R"({"__metadata__":{"n":12,"l":[1,2]}})");
        const stmeta::ExtractedMetadata md = stmeta::extract_metadata(stmeta::decode(in).raw_header);
        CHECK(md.find("n")->structured().as_number().raw == "12");
        CHECK(md.formatted_metadata[1].second.as_string() == "[1,2]");
    }

    // Truncated input
    {
        const std::vector<std::uint8_t> four = {1, 0, 0, 0};
        CHECK_THROWS_KIND(stmeta::decode(four), ErrorKind::TruncatedInput);
        CHECK_THROWS_KIND(stmeta::decode(std::vector<std::uint8_t>{}), ErrorKind::TruncatedInput);

        std::vector<std::uint8_t> short_header = make_raw_container("{}");
        stmeta::write_u64_le(short_header.data(), 100);
        CHECK_THROWS_KIND(stmeta::decode(short_header), ErrorKind::TruncatedInput);
    }

    // Length with a non-zero high word
    {
        std::vector<std::uint8_t> bytes = make_raw_container("{}");
        stmeta::write_u64_le(bytes.data(), (1ull << 32) | 2ull);
        CHECK_THROWS_KIND(stmeta::decode(bytes), ErrorKind::MalformedHeader);
    }

    // Invalid UTF-8 in the header
    {
        const std::vector<std::uint8_t> bad = make_raw_container(std::string("{\"\xff\xfe\":1}"));
        CHECK_THROWS_KIND(stmeta::decode(bad), ErrorKind::InvalidEncoding);
        const std::vector<std::uint8_t> overlong = make_raw_container(std::string("{\"\xc0\xaf\":1}"));
        CHECK_THROWS_KIND(stmeta::decode(overlong), ErrorKind::InvalidEncoding);
    }

    // Header JSON problems
    {
        CHECK_THROWS_KIND(stmeta::decode(make_raw_container("[1,2]")), ErrorKind::MalformedHeader);
        CHECK_THROWS_KIND(stmeta::decode(make_raw_container("{\"a\":")), ErrorKind::MalformedHeader);
        CHECK_THROWS_KIND(stmeta::decode(make_raw_container("")), ErrorKind::MalformedHeader);
        CHECK_THROWS_KIND(stmeta::decode(make_raw_container("{} x")), ErrorKind::MalformedHeader);
    }

    // Metadata shape problems
    {
        CHECK_THROWS_KIND(stmeta::extract_metadata(stmeta::decode(make_raw_container("{}")).raw_header),
                          ErrorKind::NoMetadata);
        CHECK_THROWS_KIND(stmeta::extract_metadata(stmeta::decode(make_raw_container(R"({"__metadata__":{}})")).raw_header),
                          ErrorKind::NoMetadata);
        CHECK_THROWS_KIND(stmeta::extract_metadata(stmeta::decode(make_raw_container(R"({"__metadata__":5})")).raw_header),
                          ErrorKind::MalformedHeader);
    }

    // Values that cannot be written as JSON
    {
        Json::Object update;
        update.emplace_back("nan", Json::number(std::numeric_limits<double>::quiet_NaN()));
        CHECK_THROWS_KIND(stmeta::encode_update(sample, update), ErrorKind::SerializationError);

        Json::Object nested;
        nested.emplace_back("inf", Json::array({Json::number(std::numeric_limits<double>::infinity())}));
        CHECK_THROWS_KIND(stmeta::encode_update(sample, nested), ErrorKind::SerializationError);
    }

    // Metadata that would leave the header without valid UTF-8
    {
        Json::Object bad_value;
        bad_value.emplace_back("k", Json::string("a\xff" "b"));
        CHECK_THROWS_KIND(stmeta::encode_update(sample, bad_value), ErrorKind::SerializationError);

        Json::Object bad_nested;
        bad_nested.emplace_back("tags", Json::array({Json::string("ok"), Json::string("\xc0\xaf")}));
        CHECK_THROWS_KIND(stmeta::encode_update(sample, bad_nested), ErrorKind::SerializationError);

        Json::Object bad_key;
        bad_key.emplace_back(std::string("k\xfe"), Json::string("v"));
        CHECK_THROWS_KIND(stmeta::encode_update(sample, bad_key), ErrorKind::SerializationError);

        std::vector<std::pair<std::string, stmeta::MetadataValue>> bad_raw;
        bad_raw.emplace_back("r", stmeta::MetadataValue{stmeta::Raw{"\xed\xa0\x80"}});
        CHECK_THROWS_KIND(stmeta::encode_update(sample, bad_raw), ErrorKind::SerializationError);

        Json::Object fine;
        fine.emplace_back("name", Json::string("caff\xc3\xa8 \xe2\x82\xac"));
        const std::vector<std::uint8_t> out = stmeta::encode_update(sample, fine);
        CHECK(stmeta::extract_metadata(stmeta::decode(out).raw_header).find("name")->raw() == "caff\xc3\xa8 \xe2\x82\xac");
    }

    // Updating a broken container fails with the decode error
    {
        CHECK_THROWS_KIND(stmeta::encode_update(std::vector<std::uint8_t>{0, 0}, Json::Object{}),
                          ErrorKind::TruncatedInput);
    }

    // CRC over the payload only
    {
        Json::Object update;
        update.emplace_back("other", Json::string("value"));
        const std::vector<std::uint8_t> out = stmeta::encode_update(sample, update);
        CHECK(stmeta::payload_crc32(out, stmeta::decode(out)) == stmeta::payload_crc32(sample, stmeta::decode(sample)));
        CHECK(stmeta::hex8(0xCBF43926u) == "CBF43926");
        const std::string check = "123456789";
        CHECK(stmeta::crc32(reinterpret_cast<const std::uint8_t*>(check.data()), check.size()) == 0xCBF43926u);
    }

    std::cout << "All tests passed.\n";
    return 0;
}
