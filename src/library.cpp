#include "stmeta/library.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>

namespace stmeta {

namespace fs = std::filesystem;

// ------------------------------
// Small helpers
// ------------------------------

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static double to_unix_seconds(fs::file_time_type t) {
    using namespace std::chrono;
    // file_time_type has no portable epoch in C++17; shift through "now" on both clocks.
    const auto sys = system_clock::now() + duration_cast<system_clock::duration>(t - fs::file_time_type::clock::now());
    return duration_cast<duration<double>>(sys.time_since_epoch()).count();
}

std::string to_string(FileFormat f) {
    switch (f) {
        case FileFormat::Safetensors: return "safetensors";
        case FileFormat::Gguf: return "gguf";
        default: return "unknown";
    }
}

FileFormat file_format_from_path(const fs::path& p) {
    const std::string name = lower(p.filename().string());
    if (ends_with(name, ".safetensors")) return FileFormat::Safetensors;
    if (ends_with(name, ".gguf")) return FileFormat::Gguf;
    return FileFormat::Unknown;
}

// ------------------------------
// ModelLibrary
// ------------------------------

ModelLibrary::ModelLibrary(LibraryConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.root.empty()) {
        throw StmetaError(ErrorKind::NotFound, "files directory not configured");
    }
    std::error_code ec;
    const fs::file_status st = fs::status(cfg_.root, ec);
    if (ec || !fs::exists(st)) {
        throw StmetaError(ErrorKind::NotFound, "Directory does not exist: " + cfg_.root.string());
    }
    if (!fs::is_directory(st)) {
        throw StmetaError(ErrorKind::Io, "Path is not a directory: " + cfg_.root.string());
    }
    fs::path canonical_root = fs::canonical(cfg_.root, ec);
    if (ec) {
        throw StmetaError(ErrorKind::Io, "failed to resolve " + cfg_.root.string() + ": " + ec.message());
    }
    cfg_.root = std::move(canonical_root);
    for (auto& ext : cfg_.extensions) ext = lower(ext);
}

bool ModelLibrary::is_recognized(const fs::path& p) const {
    const std::string name = lower(p.filename().string());
    return std::any_of(cfg_.extensions.begin(), cfg_.extensions.end(),
                       [&](const std::string& ext) { return ends_with(name, ext); });
}

FileInfo ModelLibrary::file_info(const fs::path& absolute) const {
    FileInfo info;
    info.name = absolute.filename().string();
    info.size = static_cast<std::uint64_t>(fs::file_size(absolute));
    info.modified = to_unix_seconds(fs::last_write_time(absolute));
    info.path = absolute.string();
    info.relative_path = absolute.lexically_relative(cfg_.root).generic_string();
    info.format = file_format_from_path(absolute);
    return info;
}

std::vector<FileInfo> ModelLibrary::list_files() const {
    std::vector<FileInfo> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(cfg_.root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw StmetaError(ErrorKind::Io, "Error listing files: " + ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw StmetaError(ErrorKind::Io, "Error listing files: " + ec.message());
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) continue;
        if (!is_recognized(it->path())) continue;
        try {
            files.push_back(file_info(it->path()));
        } catch (const fs::filesystem_error&) {
            // Vanished or unreadable between the walk and the stat; leave it out of the listing.
            continue;
        }
    }

    std::sort(files.begin(), files.end(), [](const FileInfo& a, const FileInfo& b) {
        return lower(a.name) < lower(b.name);
    });
    return files;
}

std::size_t ModelLibrary::count_files() const {
    std::size_t n = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(cfg_.root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw StmetaError(ErrorKind::Io, "Error listing files: " + ec.message());
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw StmetaError(ErrorKind::Io, "Error listing files: " + ec.message());
        }
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && !entry_ec && is_recognized(it->path())) ++n;
    }
    return n;
}

fs::path ModelLibrary::resolve(const std::string& relative) const {
    const fs::path rel(relative);
    if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) {
        throw StmetaError(ErrorKind::AccessDenied, "Access denied: " + relative);
    }

    std::error_code ec;
    const fs::path candidate = fs::weakly_canonical(cfg_.root / rel, ec);
    if (ec) {
        throw StmetaError(ErrorKind::Io, "failed to resolve " + relative + ": " + ec.message());
    }

    // Component-wise containment: "/data2" is not inside "/data".
    const fs::path inside = candidate.lexically_relative(cfg_.root);
    if (inside.empty() || inside.begin()->string() == "..") {
        throw StmetaError(ErrorKind::AccessDenied, "Access denied: " + relative);
    }
    return candidate;
}

fs::path ModelLibrary::resolve_existing_file(const std::string& relative) const {
    fs::path p = resolve(relative);
    std::error_code ec;
    if (!fs::is_regular_file(p, ec) || ec) {
        throw StmetaError(ErrorKind::NotFound, "File not found: " + relative);
    }
    return p;
}

std::mutex& ModelLibrary::lock_for(const fs::path& absolute) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    auto& slot = path_locks_[absolute.string()];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

static void require_safetensors(const fs::path& p, const std::string& relative) {
    if (file_format_from_path(p) != FileFormat::Safetensors) {
        throw StmetaError(ErrorKind::Unsupported,
                          "metadata is only available for .safetensors files: " + relative);
    }
}

static std::optional<ExtractedMetadata> metadata_or_none(const Json& raw_header) {
    try {
        return extract_metadata(raw_header);
    } catch (const StmetaError& e) {
        if (e.kind() != ErrorKind::NoMetadata) throw;
        return std::nullopt;
    }
}

MetadataReport ModelLibrary::read_metadata(const std::string& relative) const {
    const fs::path p = resolve_existing_file(relative);
    require_safetensors(p, relative);

    HeaderFileInfo head = read_header_only(p);

    MetadataReport report;
    report.file = file_info(p);
    report.header_length = head.decoded.header_length;
    report.payload_offset = head.decoded.payload_offset;
    report.tensor_count = tensor_count(head.decoded.raw_header);
    report.metadata = metadata_or_none(head.decoded.raw_header);
    return report;
}

MetadataReport ModelLibrary::update_metadata(const std::string& relative, const Json::Object& metadata) {
    const fs::path p = resolve_existing_file(relative);
    require_safetensors(p, relative);

    std::lock_guard<std::mutex> guard(lock_for(p));

    const std::vector<std::uint8_t> original = read_file_bytes(p);
    const DecodedHeader before = decode(original);
    const std::uint32_t before_crc = payload_crc32(original, before);
    const std::uint64_t before_payload = original.size() - before.payload_offset;

    // Encoding failures leave the file untouched.
    const std::vector<std::uint8_t> updated = encode_update(original, metadata);
    write_file_atomic(p, updated);

    const std::vector<std::uint8_t> reread = read_file_bytes(p);
    const DecodedHeader after = decode(reread);
    const std::uint32_t after_crc = payload_crc32(reread, after);
    const std::uint64_t after_payload = reread.size() - after.payload_offset;
    if (after_crc != before_crc || after_payload != before_payload) {
        throw StmetaError(ErrorKind::VerificationFailed,
                          "payload changed after metadata update of " + relative + " (crc32 " +
                              hex8(before_crc) + " -> " + hex8(after_crc) + ")");
    }

    MetadataReport report;
    report.file = file_info(p);
    report.header_length = after.header_length;
    report.payload_offset = after.payload_offset;
    report.tensor_count = tensor_count(after.raw_header);
    report.payload_crc32 = after_crc;
    report.metadata = metadata_or_none(after.raw_header);
    return report;
}

} // namespace stmeta
