#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vrm {
namespace http {

/**
 * @brief Match a request Origin against the CORS allowlist
 *
 * Entries are exact origins, "*", or a pattern with one '*' wildcard
 * (e.g. "https://*.example.org").
 *
 * @return Value for Access-Control-Allow-Origin ("*" for a "*" entry, the
 *         request origin otherwise), or std::nullopt if nothing matches
 */
std::optional<std::string> match_cors_origin(const std::vector<std::string> &allowlist, const std::string &origin);

}  // namespace http
}  // namespace vrm
