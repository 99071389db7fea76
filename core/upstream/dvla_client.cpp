#include "dvla_client.hpp"

#include <chrono>

#include "logging/logger.hpp"

namespace vrm {
namespace upstream {

namespace {
constexpr int kStatusOk = 200;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusBadGateway = 502;
constexpr int kStatusServiceUnavailable = 503;
constexpr int kStatusGatewayTimeout = 504;
}  // namespace

std::string truncate_utf8(const std::string &text, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        // Count lead bytes only; continuation bytes are 10xxxxxx
        const auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) != 0x80) {
            if (chars == max_chars) {
                return text.substr(0, i);
            }
            ++chars;
        }
    }
    return text;
}

DvlaClient::DvlaClient(const runtime::UpstreamConfig &config, ConnectionPool &pool)
    : api_key_(config.api_key), timeout_(config.timeout_ms), pool_(pool) {
    std::string origin;
    if (!runtime::split_url(config.url, origin, path_)) {
        path_ = "/";
    }
}

UpstreamResult DvlaClient::failure(int http_status, const std::string &detail) {
    UpstreamResult result;
    result.outcome = UpstreamOutcome::FAILED;
    result.http_status = http_status;
    result.message = "DVLA error: " + detail;
    return result;
}

UpstreamResult DvlaClient::lookup(const std::string &registration_number) {
    if (!is_configured()) {
        UpstreamResult result;
        result.outcome = UpstreamOutcome::NOT_CONFIGURED;
        return result;
    }

    auto lease = pool_.acquire(timeout_);
    if (!lease) {
        LOG_WARN("[DVLA] No free upstream connection after " << timeout_.count() << "ms");
        return failure(kStatusServiceUnavailable, "no upstream connection available");
    }

    nlohmann::json payload = {{"registrationNumber", registration_number}};
    httplib::Headers headers = {{"x-api-key", api_key_}, {"Accept", "application/json"}};

    LOG_DEBUG("[DVLA] POST " << pool_.origin() << path_ << " registrationNumber=" << registration_number);
    const auto started = std::chrono::steady_clock::now();
    auto res = lease->client().Post(path_, headers, payload.dump(), "application/json");

    if (!res) {
        auto err = res.error();
        const auto elapsed = std::chrono::steady_clock::now() - started;
        LOG_ERROR("[DVLA] Request failed after "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()
                  << "ms: " << httplib::to_string(err));
        // httplib reports an expired read timeout as Error::Read, the same as a
        // peer reset; only a read that ran for the full timeout counts as one
        const bool timed_out = err == httplib::Error::ConnectionTimeout ||
                               (err == httplib::Error::Read && elapsed >= timeout_);
        return failure(timed_out ? kStatusGatewayTimeout : kStatusBadGateway, httplib::to_string(err));
    }

    LOG_DEBUG("[DVLA] Response status " << res->status);

    if (res->status == kStatusOk) {
        auto record = nlohmann::json::parse(res->body, nullptr, false);
        if (record.is_discarded() || !record.is_object()) {
            LOG_ERROR("[DVLA] 200 response was not a JSON object");
            return failure(kStatusBadGateway, "invalid JSON response");
        }

        UpstreamResult result;
        result.http_status = res->status;
        if (record.empty()) {
            result.outcome = UpstreamOutcome::NOT_FOUND;
            return result;
        }
        result.outcome = UpstreamOutcome::FOUND;
        result.record = std::move(record);
        return result;
    }

    if (res->status == kStatusBadRequest || res->status == kStatusNotFound) {
        UpstreamResult result;
        result.outcome = UpstreamOutcome::NOT_FOUND;
        result.http_status = res->status;
        return result;
    }

    LOG_WARN("[DVLA] Upstream returned HTTP " << res->status);
    return failure(res->status, truncate_utf8(res->body, kMaxErrorSnippetChars));
}

}  // namespace upstream
}  // namespace vrm
