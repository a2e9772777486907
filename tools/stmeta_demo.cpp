#include "stmeta/easy.hpp"

#include <cstdint>
#include <iostream>
#include <vector>

int main() {
    try {
        using namespace stmeta;

        // 2x3 weight matrix, row-major
        std::vector<easy::TensorSpec> tensors;
        tensors.push_back(easy::make_f32("layer0.weight", {2, 3}, {0.1f, 0.2f, 0.3f, 0.4f, 0.5f, 0.6f}));
        tensors.push_back(easy::make_f32("layer0.bias", {3}, {0.0f, 0.0f, 1.0f}));

        std::vector<std::int64_t> ids(16);
        for (std::size_t i = 0; i < ids.size(); ++i) ids[i] = static_cast<std::int64_t>(i);
        tensors.push_back(easy::make_i64("position_ids", {1, 16}, ids));

        Json::Object meta;
        meta.emplace_back("format", Json::string("pt"));
        meta.emplace_back("name", Json::string("demo model"));

        const std::string file = "demo_out.safetensors";
        write_file_atomic(file, easy::build_container(tensors, meta));
        std::cout << "Wrote: " << file << "\n";

        // Rewrite the metadata with structured values.
        Json::Object update;
        update.emplace_back("name", Json::string("demo model"));
        update.emplace_back("tags", Json::array({Json::string("demo"), Json::string("f32")}));
        update.emplace_back("config", parse_json(R"({"hidden":3,"layers":1})"));

        const std::vector<std::uint8_t> before = read_file_bytes(file);
        const std::vector<std::uint8_t> after = encode_update(before, update);
        write_file_atomic(file, after);

        const HeaderFileInfo info = read_header_only(file);
        std::cout << "Header: " << info.decoded.header_length << " bytes, "
                  << tensor_count(info.decoded.raw_header) << " tensors, payload crc32 "
                  << hex8(payload_crc32(after, decode(after))) << "\n";

        const ExtractedMetadata md = extract_metadata(info.decoded.raw_header);
        for (const auto& [key, value] : md.metadata) {
            std::cout << "  " << key << (value.is_structured() ? " (json) " : " (text) ")
                      << dump_json(value.to_json()) << "\n";
        }

        std::cout << "OK\n";
        return 0;

    } catch (const stmeta::StmetaError& e) {
        std::cerr << "stmeta error [" << stmeta::to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
