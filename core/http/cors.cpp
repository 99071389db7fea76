#include "cors.hpp"

#include <algorithm>

namespace vrm {
namespace http {

namespace {

bool origin_matches(const std::string &allowed, const std::string &origin) {
    if (allowed == "*") {
        return true;
    }

    const auto wildcard_pos = allowed.find('*');
    if (wildcard_pos == std::string::npos) {
        return allowed == origin;
    }

    const std::string prefix = allowed.substr(0, wildcard_pos);
    const std::string suffix = allowed.substr(wildcard_pos + 1);
    if (origin.size() < prefix.size() + suffix.size()) {
        return false;
    }

    const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
    const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
    return prefix_ok && suffix_ok;
}

}  // namespace

std::optional<std::string> match_cors_origin(const std::vector<std::string> &allowlist, const std::string &origin) {
    if (origin.empty()) {
        return std::nullopt;
    }

    auto matched = std::find_if(allowlist.begin(), allowlist.end(),
                                [&origin](const std::string &allowed) { return origin_matches(allowed, origin); });
    if (matched == allowlist.end()) {
        return std::nullopt;
    }
    return *matched == "*" ? std::string("*") : origin;
}

}  // namespace http
}  // namespace vrm
