/**
 * @file dvla_client_test.cpp
 * @brief DvlaClient against a local stub of the vehicle enquiry endpoint
 *
 * The stub is a real httplib::Server on an ephemeral port, so the tests
 * exercise request shape, status mapping, truncation and timeouts end to end.
 */

#include "upstream/dvla_client.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "upstream/connection_pool.hpp"

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

// cpp-httplib's threading trips ThreadSanitizer; see http_handlers_test.cpp
#if defined(__SANITIZE_THREAD__)
#define VRM_SKIP_HTTP_TESTS 1
#elif defined(__has_feature)
#if __has_feature(thread_sanitizer)
#define VRM_SKIP_HTTP_TESTS 1
#else
#define VRM_SKIP_HTTP_TESTS 0
#endif
#else
#define VRM_SKIP_HTTP_TESTS 0
#endif

#if !VRM_SKIP_HTTP_TESTS

using namespace vrm;
using namespace vrm::upstream;

namespace {
constexpr const char *kEnquiryPath = "/vehicle-enquiry/v1/vehicles";
}

class DvlaClientTest : public ::testing::Test {
protected:
    using Handler = std::function<void(const httplib::Request &, httplib::Response &)>;

    void SetUp() override {
        stub = std::make_unique<httplib::Server>();
        stub->Post(kEnquiryPath, [this](const httplib::Request &req, httplib::Response &res) {
            request_count.fetch_add(1);
            {
                std::lock_guard<std::mutex> lock(mutex);
                last_api_key = req.get_header_value("x-api-key");
                last_content_type = req.get_header_value("Content-Type");
                last_body = req.body;
            }
            Handler current;
            {
                std::lock_guard<std::mutex> lock(mutex);
                current = handler;
            }
            if (current) {
                current(req, res);
            }
        });

        port = stub->bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        stub_thread = std::thread([this]() { stub->listen_after_bind(); });

        for (int i = 0; i < 50 && !stub->is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT_TRUE(stub->is_running());

        config.url = "http://127.0.0.1:" + std::to_string(port) + kEnquiryPath;
        config.api_key = "test-key";
        config.timeout_ms = 2000;
        config.pool_size = 2;
    }

    void TearDown() override {
        client.reset();
        pool.reset();
        stub->stop();
        if (stub_thread.joinable()) {
            stub_thread.join();
        }
    }

    void respond_with(Handler h) {
        std::lock_guard<std::mutex> lock(mutex);
        handler = std::move(h);
    }

    void respond_with(int status, const std::string &body) {
        respond_with([status, body](const httplib::Request &, httplib::Response &res) {
            res.status = status;
            res.set_content(body, "application/json");
        });
    }

    DvlaClient &make_client() {
        std::string origin;
        std::string path;
        EXPECT_TRUE(runtime::split_url(config.url, origin, path));
        pool = std::make_unique<ConnectionPool>(origin, static_cast<size_t>(config.pool_size),
                                                std::chrono::milliseconds(config.timeout_ms));
        client = std::make_unique<DvlaClient>(config, *pool);
        return *client;
    }

    std::unique_ptr<httplib::Server> stub;
    std::thread stub_thread;
    int port = 0;

    std::mutex mutex;
    Handler handler;
    std::atomic<int> request_count{0};
    std::string last_api_key;
    std::string last_content_type;
    std::string last_body;

    runtime::UpstreamConfig config;
    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<DvlaClient> client;
};

TEST_F(DvlaClientTest, SendsRegistrationNumberAndApiKey) {
    respond_with(404, "{}");

    make_client().lookup("AB12CDE");

    ASSERT_EQ(request_count.load(), 1);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(last_api_key, "test-key");
    EXPECT_EQ(last_content_type, "application/json");
    auto body = nlohmann::json::parse(last_body);
    EXPECT_EQ(body, nlohmann::json({{"registrationNumber", "AB12CDE"}}));
}

TEST_F(DvlaClientTest, Status200IsFoundWithRecord) {
    respond_with(200, R"({"make":"FORD","model":"FIESTA","colour":"BLUE","yearOfManufacture":2015,"fuelType":"PETROL"})");

    auto result = make_client().lookup("AB12CDE");

    ASSERT_EQ(result.outcome, UpstreamOutcome::FOUND);
    EXPECT_EQ(result.http_status, 200);
    EXPECT_EQ(result.record["make"], "FORD");
    EXPECT_EQ(result.record["yearOfManufacture"], 2015);
}

TEST_F(DvlaClientTest, EmptyRecordIsNotFound) {
    respond_with(200, "{}");

    auto result = make_client().lookup("AB12CDE");

    EXPECT_EQ(result.outcome, UpstreamOutcome::NOT_FOUND);
}

TEST_F(DvlaClientTest, NonJsonSuccessBodyIsFailure) {
    respond_with(200, "<html>maintenance</html>");

    auto result = make_client().lookup("AB12CDE");

    EXPECT_EQ(result.outcome, UpstreamOutcome::FAILED);
    EXPECT_EQ(result.http_status, 502);
    EXPECT_EQ(result.message, "DVLA error: invalid JSON response");
}

TEST_F(DvlaClientTest, Status404IsNotFound) {
    respond_with(404, R"({"errors":[{"status":"404","title":"Vehicle Not Found"}]})");

    auto result = make_client().lookup("ZZ99ZZZ");

    EXPECT_EQ(result.outcome, UpstreamOutcome::NOT_FOUND);
    EXPECT_EQ(result.http_status, 404);
}

TEST_F(DvlaClientTest, Status400IsNotFound) {
    respond_with(400, R"({"errors":[{"status":"400","title":"Bad Request"}]})");

    auto result = make_client().lookup("!!!");

    EXPECT_EQ(result.outcome, UpstreamOutcome::NOT_FOUND);
    EXPECT_EQ(result.http_status, 400);
}

TEST_F(DvlaClientTest, ServerErrorIsFailureWithBody) {
    respond_with(500, "internal failure");

    auto result = make_client().lookup("AB12CDE");

    EXPECT_EQ(result.outcome, UpstreamOutcome::FAILED);
    EXPECT_EQ(result.http_status, 500);
    EXPECT_EQ(result.message, "DVLA error: internal failure");
}

TEST_F(DvlaClientTest, FailureBodyIsTruncatedTo200Characters) {
    respond_with(503, std::string(500, 'x'));

    auto result = make_client().lookup("AB12CDE");

    EXPECT_EQ(result.outcome, UpstreamOutcome::FAILED);
    EXPECT_EQ(result.http_status, 503);
    EXPECT_EQ(result.message, "DVLA error: " + std::string(200, 'x'));
}

TEST_F(DvlaClientTest, MissingApiKeyMakesNoRequest) {
    config.api_key.clear();
    respond_with(200, R"({"make":"FORD"})");

    auto &dvla = make_client();
    EXPECT_FALSE(dvla.is_configured());

    auto result = dvla.lookup("AB12CDE");

    EXPECT_EQ(result.outcome, UpstreamOutcome::NOT_CONFIGURED);
    EXPECT_EQ(request_count.load(), 0);
}

TEST_F(DvlaClientTest, SlowUpstreamTimesOut) {
    config.timeout_ms = 200;
    respond_with([](const httplib::Request &, httplib::Response &res) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));
        res.status = 200;
        res.set_content(R"({"make":"FORD"})", "application/json");
    });

    auto start = std::chrono::steady_clock::now();
    auto result = make_client().lookup("AB12CDE");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.outcome, UpstreamOutcome::FAILED);
    EXPECT_EQ(result.http_status, 504);
    EXPECT_EQ(result.message.rfind("DVLA error: ", 0), 0u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(900));
}

TEST_F(DvlaClientTest, UnreachableUpstreamIsFailure) {
    // Nothing listens on the stub port once it is stopped
    stub->stop();
    stub_thread.join();

    auto result = make_client().lookup("AB12CDE");

    EXPECT_EQ(result.outcome, UpstreamOutcome::FAILED);
    EXPECT_TRUE(result.http_status == 502 || result.http_status == 504);
}

#ifndef _WIN32
// Accepts one connection, reads the request and closes without answering
class DroppingPeer {
public:
    DroppingPeer() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (fd_ < 0 || ::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 1) != 0 || ::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
            return;
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this]() {
            const int conn = ::accept(fd_, nullptr, nullptr);
            if (conn < 0) {
                return;
            }
            char buffer[1024];
            (void)::recv(conn, buffer, sizeof(buffer), 0);
            ::close(conn);
        });
    }

    ~DroppingPeer() {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    int port() const { return port_; }

private:
    int fd_ = -1;
    int port_ = 0;
    std::thread thread_;
};

TEST_F(DvlaClientTest, ConnectionDroppedBeforeResponseIsBadGateway) {
    DroppingPeer peer;
    ASSERT_GT(peer.port(), 0);

    config.url = "http://127.0.0.1:" + std::to_string(peer.port()) + kEnquiryPath;
    config.timeout_ms = 2000;

    auto start = std::chrono::steady_clock::now();
    auto result = make_client().lookup("AB12CDE");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.outcome, UpstreamOutcome::FAILED);
    EXPECT_EQ(result.http_status, 502);
    EXPECT_EQ(result.message.rfind("DVLA error: ", 0), 0u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}
#endif

TEST_F(DvlaClientTest, PathComesFromConfiguredUrl) {
    EXPECT_EQ(make_client().path(), kEnquiryPath);
}

#endif  // !VRM_SKIP_HTTP_TESTS

TEST(TruncateUtf8Test, ShortTextUnchanged) {
    EXPECT_EQ(vrm::upstream::truncate_utf8("short", 200), "short");
    EXPECT_EQ(vrm::upstream::truncate_utf8("", 200), "");
}

TEST(TruncateUtf8Test, CutsAtCharacterCount) {
    EXPECT_EQ(vrm::upstream::truncate_utf8("abcdef", 3), "abc");
    EXPECT_EQ(vrm::upstream::truncate_utf8(std::string(201, 'a'), 200), std::string(200, 'a'));
}

TEST(TruncateUtf8Test, CountsMultiByteSequencesAsOneCharacter) {
    // "£" is two bytes, "€" three
    EXPECT_EQ(vrm::upstream::truncate_utf8("\xC2\xA3\xE2\x82\xAC" "abc", 2), "\xC2\xA3\xE2\x82\xAC");
    EXPECT_EQ(vrm::upstream::truncate_utf8("a\xE2\x82\xAC", 1), "a");
}
