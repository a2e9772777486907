#pragma once

#include "stmeta/error.hpp"
#include "stmeta/safetensors.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

// Evaluates expr and checks it throws StmetaError with the given kind.
#define CHECK_THROWS_KIND(expr, expected_kind) do { \
    bool _threw = false; \
    try { \
        (void)(expr); \
    } catch (const stmeta::StmetaError& _e) { \
        _threw = (_e.kind() == (expected_kind)); \
    } \
    if (!_threw) { \
        std::ostringstream _oss; \
        _oss << "CHECK_THROWS_KIND failed: " #expr " did not throw " #expected_kind " at " \
             << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

namespace testutil {

// Length prefix + header text + payload, with no validation.
inline std::vector<std::uint8_t> make_raw_container(const std::string& header,
                                                    const std::vector<std::uint8_t>& payload = {}) {
    std::vector<std::uint8_t> out(8 + header.size());
    stmeta::write_u64_le(out.data(), static_cast<std::uint64_t>(header.size()));
    std::memcpy(out.data() + 8, header.data(), header.size());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

inline void write_bytes(const std::filesystem::path& p, const std::vector<std::uint8_t>& bytes) {
    std::ofstream os(p, std::ios::binary | std::ios::trunc);
    CHECK(static_cast<bool>(os));
    os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    CHECK(static_cast<bool>(os));
}

// Fresh directory under the system temp dir, removed on destruction.
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& tag) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = std::filesystem::temp_directory_path() / ("stmeta_" + tag + "_" + std::to_string(stamp));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

} // namespace testutil
