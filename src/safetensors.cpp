#include "stmeta/safetensors.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <string_view>

#include <zlib.h>

namespace stmeta {

// ------------------------------
// Small helpers
// ------------------------------

std::uint64_t read_u64_le(const std::uint8_t* p) {
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | static_cast<std::uint64_t>(p[i]);
    }
    return v;
}

void write_u64_le(std::uint8_t* p, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
    }
}

std::uint32_t crc32(const std::uint8_t* data, std::size_t size) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    // zlib takes a uInt length; feed large buffers in chunks.
    constexpr std::size_t kChunk = 1u << 30;
    while (size > 0) {
        std::size_t n = std::min(size, kChunk);
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(n));
        data += n;
        size -= n;
    }
    return static_cast<std::uint32_t>(crc);
}

std::uint32_t payload_crc32(const std::vector<std::uint8_t>& full_bytes, const DecodedHeader& decoded) {
    if (decoded.payload_offset > full_bytes.size()) {
        throw StmetaError(ErrorKind::TruncatedInput, "payload offset beyond end of input");
    }
    const std::size_t off = static_cast<std::size_t>(decoded.payload_offset);
    return crc32(full_bytes.data() + off, full_bytes.size() - off);
}

std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

// ------------------------------
// Metadata values
// ------------------------------

const Json& MetadataValue::structured() const {
    if (!is_structured()) throw StmetaError(ErrorKind::MalformedHeader, "metadata value is not structured");
    return std::get<Structured>(v).value;
}

const std::string& MetadataValue::raw() const {
    if (!is_raw()) throw StmetaError(ErrorKind::MalformedHeader, "metadata value is not raw text");
    return std::get<Raw>(v).text;
}

Json MetadataValue::to_json() const {
    if (is_structured()) return structured();
    return Json::string(raw());
}

const MetadataValue* ExtractedMetadata::find(const std::string& key) const {
    for (const auto& kv : metadata) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

Json ExtractedMetadata::metadata_json() const {
    Json out = Json::object();
    for (const auto& kv : metadata) {
        out.set(kv.first, kv.second.to_json());
    }
    return out;
}

Json ExtractedMetadata::formatted_json() const {
    return Json::object(formatted_metadata);
}

std::string metadata_value_to_string(const Json& value) {
    if (value.is_string()) return value.as_string();
    if (value.is_bool()) return value.as_bool() ? "true" : "false";
    if (value.is_null()) return "null";
    // Numbers keep their JSON text, composites are dumped compactly; both reject non-finite values.
    return dump_json(value);
}

static std::string tagged_value_to_string(const MetadataValue& value) {
    if (value.is_raw()) return value.raw();
    const Json& j = value.structured();
    // A structured string came from JSON text ("\"x\""); write the text back, not the bare string.
    if (j.is_string()) return dump_json(j);
    return metadata_value_to_string(j);
}

std::size_t tensor_count(const Json& raw_header) {
    if (!raw_header.is_object()) return 0;
    const auto& obj = raw_header.as_object();
    return static_cast<std::size_t>(std::count_if(obj.begin(), obj.end(), [](const auto& kv) {
        return kv.first != kMetadataKey;
    }));
}

// ------------------------------
// Codec
// ------------------------------

DecodedHeader decode(const std::uint8_t* data, std::size_t size) {
    if (size < kLengthPrefixSize) {
        throw StmetaError(ErrorKind::TruncatedInput,
                          "input has " + std::to_string(size) + " bytes, need 8 for the header length");
    }

    const std::uint64_t header_len = read_u64_le(data);
    if ((header_len >> 32) != 0) {
        throw StmetaError(ErrorKind::MalformedHeader,
                          "header length high word is non-zero (" + std::to_string(header_len) + ")");
    }
    const std::uint64_t available = static_cast<std::uint64_t>(size) - kLengthPrefixSize;
    if (header_len > available) {
        throw StmetaError(ErrorKind::TruncatedInput,
                          "header length " + std::to_string(header_len) + " exceeds the " +
                              std::to_string(available) + " bytes available");
    }

    const std::uint8_t* header = data + kLengthPrefixSize;
    const std::size_t len = static_cast<std::size_t>(header_len);
    if (!is_valid_utf8(header, len)) {
        throw StmetaError(ErrorKind::InvalidEncoding, "header is not valid UTF-8");
    }

    DecodedHeader out;
    try {
        out.raw_header = parse_json(std::string_view(reinterpret_cast<const char*>(header), len));
    } catch (const StmetaError& e) {
        throw StmetaError(ErrorKind::MalformedHeader, std::string("header JSON: ") + e.what());
    }
    if (!out.raw_header.is_object()) {
        throw StmetaError(ErrorKind::MalformedHeader, "header JSON is not an object");
    }
    out.header_length = header_len;
    out.payload_offset = kLengthPrefixSize + header_len;
    return out;
}

DecodedHeader decode(const std::vector<std::uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

ExtractedMetadata extract_metadata(const Json& raw_header) {
    const Json* md = raw_header.find(kMetadataKey);
    if (!md) {
        throw StmetaError(ErrorKind::NoMetadata, "header has no __metadata__ entry");
    }
    if (!md->is_object()) {
        throw StmetaError(ErrorKind::MalformedHeader, "__metadata__ is not an object");
    }
    const auto& entries = md->as_object();
    if (entries.empty()) {
        throw StmetaError(ErrorKind::NoMetadata, "__metadata__ is empty");
    }

    ExtractedMetadata out;
    out.metadata.reserve(entries.size());
    out.formatted_metadata.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        if (!value.is_string()) {
            // Other producers may store non-string values; pass them through.
            out.metadata.emplace_back(key, MetadataValue{Structured{value}});
            out.formatted_metadata.emplace_back(key, Json::string(dump_json(value)));
            continue;
        }

        const std::string& text = value.as_string();
        try {
            out.metadata.emplace_back(key, MetadataValue{Structured{parse_json(text)}});
        } catch (const StmetaError& e) {
            if (e.kind() != ErrorKind::InvalidJson) throw;
            out.metadata.emplace_back(key, MetadataValue{Raw{text}});
        }
        out.formatted_metadata.emplace_back(key, value);
    }
    return out;
}

// The header must stay UTF-8; nested strings of composites end up inside `value`.
static void require_utf8_entry(const std::string& key, const std::string& value) {
    if (!is_valid_utf8(key)) {
        throw StmetaError(ErrorKind::SerializationError, "metadata key is not valid UTF-8");
    }
    if (!is_valid_utf8(value)) {
        throw StmetaError(ErrorKind::SerializationError, "metadata value for '" + key + "' is not valid UTF-8");
    }
}

static std::vector<std::uint8_t> assemble(const std::vector<std::uint8_t>& full_bytes,
                                          DecodedHeader decoded,
                                          Json new_meta) {
    Json header = std::move(decoded.raw_header);
    if (Json* existing = header.find(kMetadataKey)) {
        *existing = std::move(new_meta);
    } else {
        auto& obj = header.as_object();
        obj.insert(obj.begin(), Json::Object::value_type(kMetadataKey, std::move(new_meta)));
    }

    const std::string text = dump_json(header);
    const std::size_t payload_off = static_cast<std::size_t>(decoded.payload_offset);
    const std::size_t payload_size = full_bytes.size() - payload_off;

    std::vector<std::uint8_t> out(static_cast<std::size_t>(kLengthPrefixSize) + text.size() + payload_size);
    write_u64_le(out.data(), static_cast<std::uint64_t>(text.size()));
    std::memcpy(out.data() + kLengthPrefixSize, text.data(), text.size());
    if (payload_size > 0) {
        std::memcpy(out.data() + kLengthPrefixSize + text.size(), full_bytes.data() + payload_off, payload_size);
    }
    return out;
}

std::vector<std::uint8_t> encode_update(const std::vector<std::uint8_t>& full_bytes,
                                        const Json::Object& new_metadata) {
    DecodedHeader decoded = decode(full_bytes);

    Json meta = Json::object();
    for (const auto& [key, value] : new_metadata) {
        std::string text = metadata_value_to_string(value);
        require_utf8_entry(key, text);
        meta.set(key, Json::string(std::move(text)));
    }
    return assemble(full_bytes, std::move(decoded), std::move(meta));
}

std::vector<std::uint8_t> encode_update(
    const std::vector<std::uint8_t>& full_bytes,
    const std::vector<std::pair<std::string, MetadataValue>>& new_metadata) {
    DecodedHeader decoded = decode(full_bytes);

    Json meta = Json::object();
    for (const auto& [key, value] : new_metadata) {
        std::string text = tagged_value_to_string(value);
        require_utf8_entry(key, text);
        meta.set(key, Json::string(std::move(text)));
    }
    return assemble(full_bytes, std::move(decoded), std::move(meta));
}

} // namespace stmeta
