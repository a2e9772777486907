#include "stmeta/server.hpp"

#include "stmeta/api.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iterator>
#include <vector>

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace stmeta {

namespace fs = std::filesystem;

static constexpr const char* kMimeJson = "application/json";
static constexpr std::size_t kStreamChunk = 64u * 1024u;

MetadataServer::MetadataServer(ModelLibrary& library, ServerConfig cfg)
    : library_(library), cfg_(std::move(cfg)), svr_(std::make_unique<httplib::Server>()) {
    svr_->set_read_timeout(cfg_.read_timeout_sec, 0);
    svr_->set_write_timeout(cfg_.write_timeout_sec, 0);
    svr_->set_payload_max_length(cfg_.max_body_bytes);

    svr_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        const auto level = res.status >= 500 ? spdlog::level::err
                           : res.status >= 400 ? spdlog::level::warn
                                               : spdlog::level::info;
        spdlog::log(level, "{} {} {}", req.method, req.path, res.status);
    });

    setup_middleware();
    setup_routes();
}

MetadataServer::~MetadataServer() = default;

bool MetadataServer::listen() {
    spdlog::info("listening on http://{}:{}", cfg_.host, cfg_.port);
    return svr_->listen(cfg_.host, cfg_.port);
}

void MetadataServer::stop() {
    svr_->stop();
}

bool MetadataServer::is_running() const {
    return svr_->is_running();
}

// ------------------------------
// Middleware
// ------------------------------

void MetadataServer::setup_middleware() {
    svr_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (cfg_.cors) {
            res.set_header("Access-Control-Allow-Origin", "*");
        }
        if (req.method == "OPTIONS") {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization, X-Requested-With");
            res.set_header("Access-Control-Max-Age", "86400");
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }
        spdlog::debug("request {} {} from {}", req.method, req.path, req.remote_addr);
        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr_->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (res.status == 404 && res.body.empty()) {
            send_error(res, "Not found: " + req.path, ErrorKind::NotFound);
        }
    });

    svr_->set_exception_handler([this](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const StmetaError& e) {
            send_error(res, e.what(), e.kind());
        } catch (const std::exception& e) {
            send_error(res, std::string("Server error: ") + e.what(), ErrorKind::Io);
        }
    });
}

// ------------------------------
// Routes
// ------------------------------

void MetadataServer::setup_routes() {
    svr_->Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_index(req, res);
    });
    svr_->Get("/api/files", [this](const httplib::Request& req, httplib::Response& res) {
        handle_list_files(req, res);
    });
    svr_->Get(R"(/api/file/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_serve_file(req, res);
    });
    svr_->Get(R"(/api/metadata/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_get_metadata(req, res);
    });
    svr_->Post(R"(/api/metadata/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_update_metadata(req, res);
    });
    svr_->Put(R"(/api/metadata/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_update_metadata(req, res);
    });
    svr_->Get("/api/info", [this](const httplib::Request& req, httplib::Response& res) {
        handle_info(req, res);
    });
}

void MetadataServer::handle_index(const httplib::Request&, httplib::Response& res) {
    std::ifstream is(cfg_.index_html, std::ios::binary);
    if (cfg_.index_html.empty() || !is) {
        res.status = 404;
        res.set_content("index.html not found. Looking for it at: " + cfg_.index_html.string(), "text/plain");
        return;
    }
    std::string html((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    res.set_content(html, "text/html; charset=utf-8");
}

void MetadataServer::handle_list_files(const httplib::Request&, httplib::Response& res) {
    try {
        const auto files = library_.list_files();
        send_json(res, dump_json(api::file_list_to_json(files, library_.root())));
    } catch (const StmetaError& e) {
        send_error(res, e.what(), e.kind());
    }
}

void MetadataServer::handle_serve_file(const httplib::Request& req, httplib::Response& res) {
    const std::string relative = req.matches[1];
    try {
        const fs::path p = library_.resolve(relative);
        std::error_code ec;
        if (!fs::is_regular_file(p, ec) || ec) {
            send_error(res, "File not found", ErrorKind::NotFound);
            return;
        }
        const std::uint64_t size = fs::file_size(p, ec);
        if (ec) {
            send_error(res, "Error serving file: " + ec.message(), ErrorKind::Io);
            return;
        }

        auto stream = std::make_shared<std::ifstream>(p, std::ios::binary);
        if (!*stream) {
            send_error(res, "Error serving file: cannot open " + relative, ErrorKind::Io);
            return;
        }

        res.set_header("Content-Disposition", "inline; filename=\"" + p.filename().string() + "\"");
        res.set_content_provider(
            static_cast<std::size_t>(size), "application/octet-stream",
            [stream](std::size_t offset, std::size_t length, httplib::DataSink& sink) {
                std::vector<char> buf(std::min(length, kStreamChunk));
                stream->clear();
                stream->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
                stream->read(buf.data(), static_cast<std::streamsize>(buf.size()));
                const std::streamsize n = stream->gcount();
                if (n <= 0) return false;
                return sink.write(buf.data(), static_cast<std::size_t>(n));
            });
    } catch (const StmetaError& e) {
        send_error(res, e.what(), e.kind());
    }
}

void MetadataServer::handle_get_metadata(const httplib::Request& req, httplib::Response& res) {
    const std::string relative = req.matches[1];
    try {
        const MetadataReport report = library_.read_metadata(relative);
        if (!report.metadata) {
            send_error(res, "No metadata found", ErrorKind::NoMetadata);
            return;
        }
        send_json(res, dump_json(api::report_to_json(report)));
    } catch (const StmetaError& e) {
        send_error(res, e.what(), e.kind());
    }
}

void MetadataServer::handle_update_metadata(const httplib::Request& req, httplib::Response& res) {
    const std::string relative = req.matches[1];
    try {
        const Json::Object metadata = api::metadata_from_request(req.body);
        const MetadataReport report = library_.update_metadata(relative, metadata);
        spdlog::info("updated metadata of {} ({} keys)", relative, metadata.size());
        send_json(res, dump_json(api::report_to_json(report)));
    } catch (const StmetaError& e) {
        send_error(res, e.what(), e.kind());
    }
}

void MetadataServer::handle_info(const httplib::Request&, httplib::Response& res) {
    send_json(res, dump_json(api::server_info_to_json(library_.config())));
}

// ------------------------------
// Response utilities
// ------------------------------

void MetadataServer::send_json(httplib::Response& res, const std::string& body, int status) {
    res.status = status;
    res.set_content(body, kMimeJson);
}

void MetadataServer::send_error(httplib::Response& res, const std::string& message, ErrorKind kind) {
    const int status = api::http_status_for(kind);
    if (status >= 500) {
        spdlog::error("{}", message);
    } else {
        spdlog::debug("{}: {}", to_string(kind), message);
    }
    send_json(res, dump_json(api::error_to_json(message, kind)), status);
}

// ------------------------------
// Signal wiring
// ------------------------------

namespace {

std::atomic<MetadataServer*> g_signal_target{nullptr};

void stop_on_signal(int) {
    if (MetadataServer* s = g_signal_target.load()) s->stop();
}

} // namespace

ScopedSignalStop::ScopedSignalStop(MetadataServer& server) {
    MetadataServer* expected = nullptr;
    if (!g_signal_target.compare_exchange_strong(expected, &server)) {
        throw StmetaError(ErrorKind::Unsupported, "another server already owns the stop signals");
    }
    std::signal(SIGINT, stop_on_signal);
    std::signal(SIGTERM, stop_on_signal);
}

ScopedSignalStop::~ScopedSignalStop() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_signal_target.store(nullptr);
}

MetadataServer* ScopedSignalStop::active() noexcept {
    return g_signal_target.load();
}

} // namespace stmeta
