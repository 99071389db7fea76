#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "lookup/lookup_service.hpp"
#include "runtime/config.hpp"

namespace vrm {
namespace http {

/**
 * @brief HTTP server wrapper for the lookup service
 *
 * Thin adapter that exposes LookupService over REST endpoints. It runs in a
 * separate thread and delegates every lookup to the service.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - LookupService and the upstream connection pool are safe for concurrent use
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    /**
     * @brief Construct HTTP server
     *
     * @param config HTTP configuration (bind address, port, CORS, workers)
     * @param lookup_service Lookup service; must outlive the server
     */
    HttpServer(const runtime::HttpConfig &config, const lookup::LookupService &lookup_service);

    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Start HTTP server
     *
     * Binds to the configured address/port (any free port when port is 0)
     * and starts the server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Signals shutdown and waits for server thread to exit.
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Port the server is bound to (resolved when configured as 0)
     */
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    const lookup::LookupService &lookup_service_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Route handlers (implemented in handlers/*.cpp)
    void handle_get_root(const httplib::Request &req, httplib::Response &res);
    void handle_get_health(const httplib::Request &req, httplib::Response &res);
    void handle_get_openapi(const httplib::Request &req, httplib::Response &res);
    void handle_get_docs(const httplib::Request &req, httplib::Response &res);
    void handle_post_lookup(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace vrm
