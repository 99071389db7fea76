#pragma once

#include <cstddef>
#include <string>

#include "connection_pool.hpp"
#include "i_vehicle_client.hpp"
#include "runtime/config.hpp"

namespace vrm {
namespace upstream {

constexpr size_t kMaxErrorSnippetChars = 200;

/**
 * @brief Truncate to at most max_chars UTF-8 code points
 *
 * Never splits a multi-byte sequence, so the result stays valid for JSON encoding.
 */
std::string truncate_utf8(const std::string &text, size_t max_chars);

/**
 * @brief Client for the DVLA Vehicle Enquiry Service
 *
 * Issues one POST {"registrationNumber": ...} per lookup with the x-api-key
 * header, over a client leased from the shared ConnectionPool.
 *
 * Status mapping:
 * - 200 + non-empty JSON object -> FOUND
 * - 200 + empty object          -> NOT_FOUND
 * - 200 + anything else         -> FAILED (502)
 * - 400, 404                    -> NOT_FOUND
 * - other status                -> FAILED (status passthrough, body snippet)
 * - connect or read timeout     -> FAILED (504)
 * - other transport failure     -> FAILED (502), including a reset mid-response
 * - no free pooled connection   -> FAILED (503)
 *
 * Without an API key every lookup returns NOT_CONFIGURED and nothing is sent.
 * No retries.
 */
class DvlaClient : public IVehicleClient {
public:
    /**
     * @param config Upstream URL, API key and timeout; config.url must pass split_url()
     * @param pool Connection pool for the origin of config.url; must outlive the client
     */
    DvlaClient(const runtime::UpstreamConfig &config, ConnectionPool &pool);

    bool is_configured() const override { return !api_key_.empty(); }

    UpstreamResult lookup(const std::string &registration_number) override;

    const std::string &path() const { return path_; }

private:
    static UpstreamResult failure(int http_status, const std::string &detail);

    std::string api_key_;
    std::string path_;
    std::chrono::milliseconds timeout_;
    ConnectionPool &pool_;
};

}  // namespace upstream
}  // namespace vrm
