#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"
#include "lookup/lookup_service.hpp"
#include "upstream/connection_pool.hpp"
#include "upstream/dvla_client.hpp"

namespace vrm {
namespace runtime {

/**
 * @brief Owns the process-wide components
 *
 * Creation order: connection pool -> DVLA client -> lookup service -> HTTP
 * server. shutdown() releases them in reverse, so the server thread is
 * joined before the pool it borrows from goes away. A failed initialize()
 * releases whatever it had created, and the destructor calls shutdown().
 */
class Runtime {
public:
    explicit Runtime(const ServiceConfig &config);
    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    // Initialize all components and start the HTTP server; nothing is left running on failure
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop the server and release the connection pool. Safe to call twice.
    void shutdown();

    int http_port() const { return http_server_ ? http_server_->get_port() : 0; }
    bool upstream_configured() const { return dvla_client_ && dvla_client_->is_configured(); }

private:
    bool init_upstream(std::string &error);
    bool init_http(std::string &error);

    ServiceConfig config_;

    std::unique_ptr<upstream::ConnectionPool> connection_pool_;
    std::unique_ptr<upstream::DvlaClient> dvla_client_;
    std::unique_ptr<lookup::LookupService> lookup_service_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace vrm
