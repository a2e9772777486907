#include "stmeta/api.hpp"

#include "test_common.hpp"

#include <iostream>
#include <string>

using stmeta::ErrorKind;
using stmeta::Json;

int main() {
    // Status mapping
    {
        CHECK(stmeta::api::http_status_for(ErrorKind::NotFound) == 404);
        CHECK(stmeta::api::http_status_for(ErrorKind::NoMetadata) == 404);
        CHECK(stmeta::api::http_status_for(ErrorKind::AccessDenied) == 403);
        CHECK(stmeta::api::http_status_for(ErrorKind::InvalidJson) == 400);
        CHECK(stmeta::api::http_status_for(ErrorKind::SerializationError) == 400);
        CHECK(stmeta::api::http_status_for(ErrorKind::TruncatedInput) == 422);
        CHECK(stmeta::api::http_status_for(ErrorKind::InvalidEncoding) == 422);
        CHECK(stmeta::api::http_status_for(ErrorKind::MalformedHeader) == 422);
        CHECK(stmeta::api::http_status_for(ErrorKind::Unsupported) == 422);
        CHECK(stmeta::api::http_status_for(ErrorKind::Io) == 500);
        CHECK(stmeta::api::http_status_for(ErrorKind::VerificationFailed) == 500);
    }

    // Error bodies
    {
        const Json e = stmeta::api::error_to_json("Access denied: ../x", ErrorKind::AccessDenied);
        CHECK(stmeta::dump_json(e) == R"({"error":"Access denied: ../x","kind":"access_denied"})");
        CHECK(stmeta::to_string(ErrorKind::NoMetadata) == "no_metadata");
    }

    // Request bodies: bare object or wrapped in "metadata"
    {
        const Json::Object bare = stmeta::api::metadata_from_request(R"({"a":"1","b":[1,2]})");
        CHECK(bare.size() == 2);
        CHECK(bare[0].first == "a");

        const Json::Object wrapped = stmeta::api::metadata_from_request(R"({"metadata":{"x":"y"}})");
        CHECK(wrapped.size() == 1);
        CHECK(wrapped[0].first == "x");

        // A lone "metadata" key with a non-object value is an ordinary entry
        const Json::Object plain = stmeta::api::metadata_from_request(R"({"metadata":"text"})");
        CHECK(plain.size() == 1);
        CHECK(plain[0].second.as_string() == "text");

        const Json::Object empty = stmeta::api::metadata_from_request("{}");
        CHECK(empty.empty());

        CHECK_THROWS_KIND(stmeta::api::metadata_from_request("[1]"), ErrorKind::InvalidJson);
        CHECK_THROWS_KIND(stmeta::api::metadata_from_request("not json"), ErrorKind::InvalidJson);
        CHECK_THROWS_KIND(stmeta::api::metadata_from_request(""), ErrorKind::InvalidJson);
        CHECK_THROWS_KIND(stmeta::api::metadata_from_request("{\"k\":\"a\xff" "b\"}"), ErrorKind::InvalidJson);
    }

    // Report views
    {
        stmeta::MetadataReport r;
        r.file.name = "m.safetensors";
        r.file.relative_path = "m.safetensors";
        r.file.format = stmeta::FileFormat::Safetensors;
        r.header_length = 120;
        r.payload_offset = 128;
        r.tensor_count = 3;

        Json j = stmeta::api::report_to_json(r);
        CHECK(j.find("metadata")->is_null());
        CHECK(j.find("formatted_metadata")->is_null());
        CHECK(j.find("payload_crc32") == nullptr);
        CHECK(j.find("header_length")->as_number().raw == "120");
        CHECK(j.find("file")->find("format")->as_string() == "safetensors");

        stmeta::ExtractedMetadata md;
        md.metadata.emplace_back("k", stmeta::MetadataValue{stmeta::Structured{Json::integer(1)}});
        md.metadata.emplace_back("s", stmeta::MetadataValue{stmeta::Raw{"text"}});
        md.formatted_metadata.emplace_back("k", Json::string("1"));
        md.formatted_metadata.emplace_back("s", Json::string("text"));
        r.metadata = md;
        r.payload_crc32 = 0xABCDu;

        j = stmeta::api::report_to_json(r);
        CHECK(stmeta::dump_json(*j.find("metadata")) == R"({"k":1,"s":"text"})");
        CHECK(stmeta::dump_json(*j.find("formatted_metadata")) == R"({"k":"1","s":"text"})");
        CHECK(j.find("payload_crc32")->as_string() == "0000ABCD");
    }

    // Listing and info views
    {
        stmeta::FileInfo f;
        f.name = "a.gguf";
        f.size = 10;
        f.relative_path = "sub/a.gguf";
        f.format = stmeta::FileFormat::Gguf;

        const Json list = stmeta::api::file_list_to_json({f}, "/models");
        CHECK(list.find("total")->as_number().raw == "1");
        CHECK(list.find("files")->as_array()[0].find("format")->as_string() == "gguf");
        CHECK(list.find("directory")->as_string() == "/models");

        stmeta::LibraryConfig cfg;
        cfg.root = "/models";
        const Json info = stmeta::api::server_info_to_json(cfg);
        CHECK(info.find("server_mode")->as_bool());
        CHECK(info.find("supported_formats")->as_array().size() == 2);
        CHECK(info.find("files_directory")->as_string() == "/models");
    }

    std::cout << "All tests passed.\n";
    return 0;
}
