#pragma once

#include "stmeta/error.hpp"
#include "stmeta/json.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace stmeta {

// Reserved header key holding the string-to-string metadata map.
inline constexpr const char* kMetadataKey = "__metadata__";

// Size of the little-endian header length prefix.
inline constexpr std::uint64_t kLengthPrefixSize = 8;

// ------------------------------
// Codec data model
// ------------------------------

struct DecodedHeader {
    Json raw_header;               // always an object
    std::uint64_t header_length{0};
    std::uint64_t payload_offset{0}; // 8 + header_length
};

// A metadata value that parsed as JSON.
struct Structured {
    Json value;
};

// A metadata value kept as the original string because it is not JSON text.
struct Raw {
    std::string text;
};

struct MetadataValue {
    std::variant<Structured, Raw> v;

    bool is_structured() const noexcept { return std::holds_alternative<Structured>(v); }
    bool is_raw() const noexcept { return std::holds_alternative<Raw>(v); }
    const Json& structured() const;
    const std::string& raw() const;

    // Structured values as-is, raw values as JSON strings.
    Json to_json() const;
};

struct ExtractedMetadata {
    // Decoded view, in header order.
    std::vector<std::pair<std::string, MetadataValue>> metadata;
    // On-disk string view, in header order.
    Json::Object formatted_metadata;

    const MetadataValue* find(const std::string& key) const;
    Json metadata_json() const;
    Json formatted_json() const;
};

// ------------------------------
// Codec
// ------------------------------

/// Parse the length prefix and the JSON header. Pure; the payload is not touched.
DecodedHeader decode(const std::uint8_t* data, std::size_t size);
DecodedHeader decode(const std::vector<std::uint8_t>& bytes);

/// Read `__metadata__` from a decoded header.
/// Throws StmetaError(NoMetadata) when the key is absent or empty.
ExtractedMetadata extract_metadata(const Json& raw_header);

/// Rebuild the container with a new `__metadata__` object; the payload is copied verbatim.
std::vector<std::uint8_t> encode_update(const std::vector<std::uint8_t>& full_bytes,
                                        const Json::Object& new_metadata);

std::vector<std::uint8_t> encode_update(
    const std::vector<std::uint8_t>& full_bytes,
    const std::vector<std::pair<std::string, MetadataValue>>& new_metadata);

/// On-disk string form of a single metadata value.
std::string metadata_value_to_string(const Json& value);

/// Number of tensor descriptors (every key except `__metadata__`).
std::size_t tensor_count(const Json& raw_header);

std::uint64_t read_u64_le(const std::uint8_t* p);
void write_u64_le(std::uint8_t* p, std::uint64_t v);

// ------------------------------
// Checksums (zlib)
// ------------------------------

std::uint32_t crc32(const std::uint8_t* data, std::size_t size);
std::uint32_t payload_crc32(const std::vector<std::uint8_t>& full_bytes, const DecodedHeader& decoded);
std::string hex8(std::uint32_t v);

// ------------------------------
// File I/O (caller side of the codec)
// ------------------------------

struct HeaderFileInfo {
    DecodedHeader decoded;
    std::uint64_t file_size{0};
};

/// Read a whole file into memory.
std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path& file);

/// Read the length prefix and header from a file handle without loading the payload.
HeaderFileInfo read_header_only(const std::filesystem::path& file);

/// Replace `file` with `bytes` through a temp file in the same directory and a rename.
void write_file_atomic(const std::filesystem::path& file, const std::vector<std::uint8_t>& bytes);

} // namespace stmeta
