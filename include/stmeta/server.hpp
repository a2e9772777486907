#pragma once

#include "stmeta/library.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace httplib {
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace stmeta {

struct ServerConfig {
    std::string host{"127.0.0.1"};
    int port{5000};
    bool cors{true};
    std::filesystem::path index_html{}; // served at "/"
    int read_timeout_sec{30};
    int write_timeout_sec{300}; // large weight files stream slowly
    std::size_t max_body_bytes{16u * 1024u * 1024u};
};

/// HTTP front end over a ModelLibrary.
class MetadataServer {
public:
    MetadataServer(ModelLibrary& library, ServerConfig cfg);
    ~MetadataServer();

    MetadataServer(const MetadataServer&) = delete;
    MetadataServer& operator=(const MetadataServer&) = delete;

    /// Blocks until stop() is called or binding fails. Returns false on bind failure.
    bool listen();
    void stop();
    bool is_running() const;

    const ServerConfig& config() const noexcept { return cfg_; }

private:
    void setup_middleware();
    void setup_routes();

    void handle_index(const httplib::Request& req, httplib::Response& res);
    void handle_list_files(const httplib::Request& req, httplib::Response& res);
    void handle_serve_file(const httplib::Request& req, httplib::Response& res);
    void handle_get_metadata(const httplib::Request& req, httplib::Response& res);
    void handle_update_metadata(const httplib::Request& req, httplib::Response& res);
    void handle_info(const httplib::Request& req, httplib::Response& res);

    void send_json(httplib::Response& res, const std::string& body, int status = 200);
    void send_error(httplib::Response& res, const std::string& message, ErrorKind kind);

    ModelLibrary& library_;
    ServerConfig cfg_;
    std::unique_ptr<httplib::Server> svr_;
};

/// Routes SIGINT/SIGTERM to server.stop() for its lifetime.
/// The handlers are reset to the default on destruction, so no signal
/// can reach a server that has gone out of scope.
class ScopedSignalStop {
public:
    explicit ScopedSignalStop(MetadataServer& server);
    ~ScopedSignalStop();

    ScopedSignalStop(const ScopedSignalStop&) = delete;
    ScopedSignalStop& operator=(const ScopedSignalStop&) = delete;

    /// The server currently wired to the signals, or nullptr.
    static MetadataServer* active() noexcept;
};

} // namespace stmeta
