#include "connection_pool.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace vrm {
namespace upstream {

ConnectionPool::Lease::Lease(ConnectionPool *pool, std::unique_ptr<httplib::Client> client)
    : pool_(pool), client_(std::move(client)) {}

ConnectionPool::Lease::~Lease() { release(); }

ConnectionPool::Lease::Lease(Lease &&other) noexcept : pool_(other.pool_), client_(std::move(other.client_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease &ConnectionPool::Lease::operator=(Lease &&other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        client_ = std::move(other.client_);
        other.pool_ = nullptr;
    }
    return *this;
}

void ConnectionPool::Lease::release() {
    if (pool_ != nullptr && client_) {
        pool_->give_back(std::move(client_));
    }
    pool_ = nullptr;
}

ConnectionPool::ConnectionPool(std::string origin, size_t size, std::chrono::milliseconds timeout)
    : origin_(std::move(origin)), size_(size), timeout_(timeout) {
    idle_.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        idle_.push_back(make_client());
    }
    LOG_INFO("[Pool] Created " << size_ << " client(s) for " << origin_ << " (timeout " << timeout_.count()
                               << "ms)");
}

ConnectionPool::~ConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() != size_) {
        LOG_WARN("[Pool] Destroyed with " << (size_ - idle_.size()) << " client(s) still leased");
    }
    for (auto &client : idle_) {
        client->stop();
    }
    idle_.clear();
}

std::unique_ptr<httplib::Client> ConnectionPool::make_client() const {
    auto client = std::make_unique<httplib::Client>(origin_);
    client->set_keep_alive(true);
    client->set_connection_timeout(timeout_);
    client->set_read_timeout(timeout_);
    client->set_write_timeout(timeout_);
    return client;
}

std::optional<ConnectionPool::Lease> ConnectionPool::acquire(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, wait, [this] { return !idle_.empty(); })) {
        return std::nullopt;
    }

    auto client = std::move(idle_.back());
    idle_.pop_back();
    return Lease(this, std::move(client));
}

size_t ConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

void ConnectionPool::give_back(std::unique_ptr<httplib::Client> client) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(client));
    }
    available_.notify_one();
}

}  // namespace upstream
}  // namespace vrm
