#pragma once

#include "stmeta/safetensors.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace stmeta::easy {

// Pack a typed vector into little-endian element bytes.
// safetensors stores tensor data little-endian regardless of the host.
namespace detail {
inline bool is_little_endian() {
    const std::uint16_t x = 1;
    return *reinterpret_cast<const std::uint8_t*>(&x) == 1;
}

inline void bswap_inplace(std::uint8_t* buf, std::size_t elem_size, std::size_t n_elems) {
    if (!buf || elem_size <= 1 || n_elems == 0) return;
    for (std::size_t i = 0; i < n_elems; ++i) {
        std::uint8_t* p = buf + i * elem_size;
        for (std::size_t a = 0, b = elem_size - 1; a < b; ++a, --b) {
            std::uint8_t t = p[a];
            p[a] = p[b];
            p[b] = t;
        }
    }
}
} // namespace detail

template <typename T>
inline std::vector<std::uint8_t> pack_le(const std::vector<T>& v) {
    static_assert(std::is_trivially_copyable_v<T>, "pack_le requires trivially copyable types");
    std::vector<std::uint8_t> out(sizeof(T) * v.size());
    if (!out.empty()) {
        std::memcpy(out.data(), v.data(), out.size());
        if (!detail::is_little_endian()) {
            detail::bswap_inplace(out.data(), sizeof(T), v.size());
        }
    }
    return out;
}

struct TensorSpec {
    std::string name;
    std::string dtype; // "F32", "I64", ...; written as given
    std::vector<std::uint64_t> shape;
    std::vector<std::uint8_t> data;
};

inline TensorSpec make_f32(std::string name, std::vector<std::uint64_t> shape, const std::vector<float>& values) {
    return TensorSpec{std::move(name), "F32", std::move(shape), pack_le(values)};
}

inline TensorSpec make_i64(std::string name, std::vector<std::uint64_t> shape,
                           const std::vector<std::int64_t>& values) {
    return TensorSpec{std::move(name), "I64", std::move(shape), pack_le(values)};
}

/// Build a complete container: tensors laid out back to back in the given order.
/// `metadata` values go through the same string conversion as encode_update().
inline std::vector<std::uint8_t> build_container(const std::vector<TensorSpec>& tensors,
                                                 const Json::Object& metadata = {}) {
    Json header = Json::object();
    if (!metadata.empty()) {
        Json meta = Json::object();
        for (const auto& [key, value] : metadata) {
            meta.set(key, Json::string(metadata_value_to_string(value)));
        }
        header.set(kMetadataKey, std::move(meta));
    }

    std::uint64_t offset = 0;
    for (const auto& t : tensors) {
        Json::Array shape;
        for (auto d : t.shape) shape.push_back(Json::unsigned_integer(d));
        const std::uint64_t end = offset + t.data.size();

        Json desc = Json::object();
        desc.set("dtype", Json::string(t.dtype));
        desc.set("shape", Json::array(std::move(shape)));
        desc.set("data_offsets", Json::array({Json::unsigned_integer(offset), Json::unsigned_integer(end)}));
        header.set(t.name, std::move(desc));
        offset = end;
    }

    const std::string text = dump_json(header);
    std::vector<std::uint8_t> out(static_cast<std::size_t>(kLengthPrefixSize) + text.size());
    write_u64_le(out.data(), static_cast<std::uint64_t>(text.size()));
    std::memcpy(out.data() + kLengthPrefixSize, text.data(), text.size());
    for (const auto& t : tensors) {
        out.insert(out.end(), t.data.begin(), t.data.end());
    }
    return out;
}

} // namespace stmeta::easy
