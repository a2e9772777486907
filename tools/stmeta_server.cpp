#include "stmeta/library.hpp"
#include "stmeta/log.hpp"
#include "stmeta/server.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

namespace {

void usage() {
    std::cerr <<
        "stmeta_server - serve a directory of weight files and edit safetensors metadata\n"
        "\n"
        "Usage:\n"
        "  stmeta_server --directory <DIR> [--host <HOST>] [--port <PORT>] [--index <FILE>]\n"
        "                [--debug] [--no-cors] [--no-color]\n"
        "\n"
        "Options:\n"
        "  -d, --directory  directory containing .safetensors/.gguf files (required)\n"
        "      --host       host to bind to (default: 127.0.0.1)\n"
        "  -p, --port       port to bind to (default: 5000)\n"
        "      --index      HTML page served at / (default: index.html next to the binary)\n"
        "      --debug      verbose logging\n";
}

struct Args {
    std::string directory;
    std::string host{"127.0.0.1"};
    int port{5000};
    std::string index;
    bool debug{false};
    bool cors{true};
    bool no_color{false};
};

bool parse_args(int argc, char** argv, Args& a) {
    int i = 1;
    while (i < argc) {
        std::string opt = argv[i++];
        if ((opt == "--directory" || opt == "-d") && i < argc) a.directory = argv[i++];
        else if (opt == "--host" && i < argc) a.host = argv[i++];
        else if ((opt == "--port" || opt == "-p") && i < argc) {
            try {
                a.port = std::stoi(argv[i++]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i - 1] << "\n";
                return false;
            }
        }
        else if (opt == "--index" && i < argc) a.index = argv[i++];
        else if (opt == "--debug") a.debug = true;
        else if (opt == "--no-cors") a.cors = false;
        else if (opt == "--no-color") a.no_color = true;
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }
    if (a.directory.empty()) {
        std::cerr << "--directory is required\n";
        return false;
    }
    if (a.port <= 0 || a.port > 65535) {
        std::cerr << "Invalid port: " << a.port << "\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    stmeta::log::init(a.debug, !a.no_color && stmeta::is_tty());

    try {
        stmeta::LibraryConfig lc;
        lc.root = a.directory;
        stmeta::ModelLibrary library(lc);

        stmeta::ServerConfig sc;
        sc.host = a.host;
        sc.port = a.port;
        sc.cors = a.cors;
        sc.index_html = a.index.empty()
                            ? std::filesystem::absolute(argv[0]).parent_path() / "index.html"
                            : std::filesystem::path(a.index);

        spdlog::info("Starting safetensors metadata server");
        spdlog::info("Files directory: {}", library.root().string());
        spdlog::info("Server will be available at: http://{}:{}", a.host, a.port);
        spdlog::info("Found {} compatible files", library.count_files());

        stmeta::MetadataServer server(library, sc);
        const stmeta::ScopedSignalStop signals(server);

        if (!server.listen()) {
            spdlog::error("failed to bind {}:{}", a.host, a.port);
            return 1;
        }
        return 0;
    } catch (const stmeta::StmetaError& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}
