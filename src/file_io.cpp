#include "stmeta/safetensors.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#if !defined(_WIN32)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace stmeta {

namespace fs = std::filesystem;

// Headers are small; anything above this is treated as a corrupt length prefix.
static constexpr std::uint64_t kMaxHeaderLen = 100ull * 1024ull * 1024ull; // 100 MiB

std::vector<std::uint8_t> read_file_bytes(const fs::path& file) {
    std::ifstream is(file, std::ios::binary);
    if (!is) throw StmetaError(ErrorKind::Io, "failed to open file: " + file.string());

    is.seekg(0, std::ios::end);
    std::streamoff size = is.tellg();
    if (size < 0) throw StmetaError(ErrorKind::Io, "failed to size file: " + file.string());
    is.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> out(static_cast<std::size_t>(size));
    if (!out.empty()) {
        is.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
        if (!is) throw StmetaError(ErrorKind::Io, "failed reading file: " + file.string());
    }
    return out;
}

HeaderFileInfo read_header_only(const fs::path& file) {
    std::ifstream is(file, std::ios::binary);
    if (!is) throw StmetaError(ErrorKind::Io, "failed to open file: " + file.string());

    std::error_code ec;
    const std::uint64_t file_size = fs::file_size(file, ec);
    if (ec) throw StmetaError(ErrorKind::Io, "failed to size file: " + file.string() + ": " + ec.message());

    std::array<std::uint8_t, 8> prefix{};
    is.read(reinterpret_cast<char*>(prefix.data()), static_cast<std::streamsize>(prefix.size()));
    if (!is) {
        throw StmetaError(ErrorKind::TruncatedInput,
                          "file has " + std::to_string(file_size) + " bytes, need 8 for the header length");
    }

    const std::uint64_t header_len = read_u64_le(prefix.data());
    if ((header_len >> 32) == 0 && header_len > kMaxHeaderLen) {
        throw StmetaError(ErrorKind::MalformedHeader,
                          "header length " + std::to_string(header_len) + " exceeds the 100 MiB limit");
    }
    if (header_len > kMaxHeaderLen || header_len > file_size - prefix.size()) {
        // Let the codec produce the precise error (high word or truncation) on what we have.
        std::vector<std::uint8_t> head(prefix.begin(), prefix.end());
        HeaderFileInfo info;
        info.decoded = decode(head);
        info.file_size = file_size;
        return info;
    }

    std::vector<std::uint8_t> head(prefix.size() + static_cast<std::size_t>(header_len));
    std::copy(prefix.begin(), prefix.end(), head.begin());
    if (header_len > 0) {
        is.read(reinterpret_cast<char*>(head.data() + prefix.size()), static_cast<std::streamsize>(header_len));
        if (!is) throw StmetaError(ErrorKind::TruncatedInput, "unexpected EOF reading header JSON");
    }

    HeaderFileInfo info;
    info.decoded = decode(head);
    info.file_size = file_size;
    return info;
}

static fs::path temp_path_for(const fs::path& file) {
    static std::atomic<unsigned> counter{0};
#if defined(_WIN32)
    const unsigned long pid = 0;
#else
    const unsigned long pid = static_cast<unsigned long>(::getpid());
#endif
    fs::path tmp = file;
    tmp.replace_filename("." + file.filename().string() + ".tmp-" + std::to_string(pid) + "-" +
                         std::to_string(counter.fetch_add(1)));
    return tmp;
}

// Push a file's data (or a directory's entries) to stable storage.
static void sync_path(const fs::path& p, bool directory) {
#if defined(_WIN32)
    (void)p;
    (void)directory;
#else
    const int fd = ::open(p.c_str(), directory ? (O_RDONLY | O_DIRECTORY) : O_RDONLY);
    if (fd < 0) {
        throw StmetaError(ErrorKind::Io, "failed to open " + p.string() + " for sync: " + std::strerror(errno));
    }
    const int rc = ::fsync(fd);
    const int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw StmetaError(ErrorKind::Io, "fsync failed for " + p.string() + ": " + std::strerror(err));
    }
#endif
}

void write_file_atomic(const fs::path& file, const std::vector<std::uint8_t>& bytes) {
    const fs::path tmp = temp_path_for(file);
    {
        std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
        if (!os) throw StmetaError(ErrorKind::Io, "failed to open for write: " + tmp.string());
        if (!bytes.empty()) {
            os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }
        os.flush();
        if (!os) {
            os.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw StmetaError(ErrorKind::Io, "failed writing temp file: " + tmp.string());
        }
    }

    std::error_code ec;
    const fs::file_status original = fs::status(file, ec);
    if (!ec && fs::exists(original)) {
        fs::permissions(tmp, original.permissions(), fs::perm_options::replace, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw StmetaError(ErrorKind::Io, "failed to copy permissions to " + tmp.string() + ": " + ec.message());
        }
    }
    ec.clear();

    try {
        sync_path(tmp, false);
    } catch (const StmetaError&) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw;
    }

    fs::rename(tmp, file, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StmetaError(ErrorKind::Io, "failed to replace " + file.string() + ": " + ec.message());
    }

    // The rename itself is only durable once the directory entry is flushed.
    const fs::path dir = file.has_parent_path() ? file.parent_path() : fs::path(".");
    sync_path(dir, true);
}

} // namespace stmeta
