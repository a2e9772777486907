#pragma once

#include "stmeta/safetensors.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stmeta {

enum class FileFormat {
    Safetensors,
    Gguf,
    Unknown,
};

std::string to_string(FileFormat f);
FileFormat file_format_from_path(const std::filesystem::path& p);

struct LibraryConfig {
    std::filesystem::path root{};
    // Matched case-insensitively against the end of the file name.
    std::vector<std::string> extensions{".safetensors", ".gguf"};
};

struct FileInfo {
    std::string name{};
    std::uint64_t size{0};
    double modified{0.0}; // seconds since the Unix epoch
    std::string path{};   // absolute
    std::string relative_path{}; // relative to the root, '/' separated
    FileFormat format{FileFormat::Unknown};
};

struct MetadataReport {
    FileInfo file{};
    std::uint64_t header_length{0};
    std::uint64_t payload_offset{0};
    std::size_t tensor_count{0};
    // Only set when the report was produced from a full read (update path).
    std::optional<std::uint32_t> payload_crc32{};
    // Absent when the file carries no `__metadata__`.
    std::optional<ExtractedMetadata> metadata{};
};

/// The served directory: listing, path resolution, and the read/write paths around the codec.
/// Thread-safe; concurrent updates of the same file are serialized.
class ModelLibrary {
public:
    explicit ModelLibrary(LibraryConfig cfg);

    const std::filesystem::path& root() const noexcept { return cfg_.root; }
    const LibraryConfig& config() const noexcept { return cfg_; }

    bool is_recognized(const std::filesystem::path& p) const;

    std::vector<FileInfo> list_files() const;
    std::size_t count_files() const;

    /// Resolve a caller-supplied relative path. Throws StmetaError(AccessDenied) when the
    /// result leaves the root.
    std::filesystem::path resolve(const std::string& relative) const;

    FileInfo file_info(const std::filesystem::path& absolute) const;

    MetadataReport read_metadata(const std::string& relative) const;
    MetadataReport update_metadata(const std::string& relative, const Json::Object& metadata);

private:
    std::filesystem::path resolve_existing_file(const std::string& relative) const;
    std::mutex& lock_for(const std::filesystem::path& absolute);

    LibraryConfig cfg_;
    std::mutex locks_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> path_locks_;
};

} // namespace stmeta
