#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace vrm {
namespace runtime {

Runtime::Runtime(const ServiceConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing VRM lookup service");

    if (!validate_config(config_, error)) {
        return false;
    }

    if (!init_upstream(error)) {
        shutdown();
        return false;
    }

    lookup_service_ = std::make_unique<lookup::LookupService>(*dvla_client_);

    if (!init_http(error)) {
        shutdown();
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_upstream(std::string &error) {
    std::string origin;
    std::string path;
    if (!split_url(config_.upstream.url, origin, path)) {
        error = "Invalid upstream URL: " + config_.upstream.url;
        return false;
    }

    connection_pool_ = std::make_unique<upstream::ConnectionPool>(
        origin, static_cast<size_t>(config_.upstream.pool_size), std::chrono::milliseconds(config_.upstream.timeout_ms));

    dvla_client_ = std::make_unique<upstream::DvlaClient>(config_.upstream, *connection_pool_);

    if (dvla_client_->is_configured()) {
        LOG_INFO("[Runtime] Upstream client ready: " << origin << path);
    } else {
        LOG_WARN("[Runtime] Upstream API key missing; lookups will report not found");
    }
    return true;
}

bool Runtime::init_http(std::string &error) {
    LOG_INFO("[Runtime] Creating HTTP server");
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *lookup_service_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }
    LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << http_server_->get_port());
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
        http_server_.reset();
    }

    lookup_service_.reset();
    dvla_client_.reset();

    if (connection_pool_) {
        LOG_INFO("[Runtime] Closing upstream connection pool");
        connection_pool_.reset();
    }
}

}  // namespace runtime
}  // namespace vrm
