#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vrm {
namespace upstream {

/**
 * @brief Fixed-size pool of keep-alive HTTP clients for one upstream origin
 *
 * httplib::Client serializes requests on its own socket, so concurrent
 * lookups each lease a dedicated client instead of sharing one.
 *
 * Thread Safety:
 * - acquire() and lease release are thread-safe
 * - Pool configuration (origin, size, timeouts) is fixed at construction
 *
 * Usage Pattern:
 * ```cpp
 * auto lease = pool.acquire(std::chrono::milliseconds(500));
 * if (lease) {
 *     auto res = lease->client().Post(path, headers, body, "application/json");
 * }
 * ```
 */
class ConnectionPool {
public:
    /**
     * @brief RAII handle to a leased client; returns it to the pool on destruction
     */
    class Lease {
    public:
        Lease(ConnectionPool *pool, std::unique_ptr<httplib::Client> client);
        ~Lease();

        Lease(Lease &&other) noexcept;
        Lease &operator=(Lease &&other) noexcept;
        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;

        httplib::Client &client() { return *client_; }

    private:
        void release();

        ConnectionPool *pool_;
        std::unique_ptr<httplib::Client> client_;
    };

    /**
     * @param origin scheme://host[:port] of the upstream service
     * @param size Number of clients (and so concurrent upstream requests)
     * @param timeout Connection, read and write timeout applied to each client
     */
    ConnectionPool(std::string origin, size_t size, std::chrono::milliseconds timeout);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool &) = delete;
    ConnectionPool &operator=(const ConnectionPool &) = delete;

    /**
     * @brief Lease an idle client, waiting at most @p wait for one to free up
     *
     * @return Lease, or std::nullopt if every client stayed busy
     */
    std::optional<Lease> acquire(std::chrono::milliseconds wait);

    const std::string &origin() const { return origin_; }
    size_t size() const { return size_; }
    size_t idle_count() const;

private:
    void give_back(std::unique_ptr<httplib::Client> client);
    std::unique_ptr<httplib::Client> make_client() const;

    std::string origin_;
    size_t size_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<httplib::Client>> idle_;
};

}  // namespace upstream
}  // namespace vrm
