#include "server.hpp"

#include "cors.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

namespace vrm {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternal = 500;
constexpr const char *kAllowedMethods = "GET, POST, OPTIONS";
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, const lookup::LookupService &lookup_service)
    : config_(config), lookup_service_(lookup_service) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    // Worker pool size bounds concurrent lookups on this side; the upstream
    // connection pool bounds them on the other
    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to responses for allowlisted origins
    server_->set_post_routing_handler(
        [origins = config_.cors_allowed_origins](const httplib::Request &req, httplib::Response &res) {
            const auto allow_origin = match_cors_origin(origins, req.get_header_value("Origin"));
            if (!allow_origin) {
                return;
            }

            res.set_header("Access-Control-Allow-Origin", *allow_origin);
            if (*allow_origin != "*") {
                res.set_header("Vary", "Origin");
            }
            res.set_header("Access-Control-Allow-Methods", kAllowedMethods);

            const std::string requested_headers = req.get_header_value("Access-Control-Request-Headers");
            res.set_header("Access-Control-Allow-Headers",
                           requested_headers.empty() ? std::string("Content-Type") : requested_headers);
        });

    setup_routes();

    // JSON error envelope for HTTP errors raised outside the handlers (unknown routes etc.)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        // If content was already set by the handler, don't override it
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusMethodNotAllowed) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Method not allowed: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        } else if (res.status != kStatusInternal) {
            return;
        }

        res.set_content(make_error_response(code, message).dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        res.status = kStatusInternal;
        res.set_content(make_error_response(StatusCode::INTERNAL, msg).dump(), "application/json");
    });

    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind);
        if (port_ < 0) {
            error = "Failed to bind to " + config_.bind + " on any port";
            server_.reset();
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind, config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            server_.reset();
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    server_->Get("/", [this](const httplib::Request &req, httplib::Response &res) { handle_get_root(req, res); });

    server_->Get("/health",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_health(req, res); });

    server_->Get("/openapi.json",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_openapi(req, res); });

    server_->Get("/docs", [this](const httplib::Request &req, httplib::Response &res) { handle_get_docs(req, res); });

    server_->Post("/lookup",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_lookup(req, res); });

    // OPTIONS catch-all for CORS preflight; allow headers are added by the post-routing handler
    server_->Options(R"(/.*)", [](const httplib::Request &, httplib::Response &res) { res.status = kStatusNoContent; });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET  /");
    LOG_INFO("[HTTP]   GET  /health");
    LOG_INFO("[HTTP]   GET  /openapi.json");
    LOG_INFO("[HTTP]   GET  /docs");
    LOG_INFO("[HTTP]   POST /lookup");
}

}  // namespace http
}  // namespace vrm
