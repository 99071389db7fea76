#pragma once

#include <string>
#include <vector>

namespace vrm {
namespace runtime {

// Environment variables read once at startup
constexpr const char *kApiKeyEnvVar = "DVLA_API_KEY";
constexpr const char *kAllowedOriginsEnvVar = "ALLOWED_ORIGINS";

constexpr const char *kDefaultUpstreamUrl =
    "https://driver-vehicle-licensing.api.gov.uk/vehicle-enquiry/v1/vehicles";

// Local frontend dev servers, always allowed
const std::vector<std::string> &default_cors_origins();

struct HttpConfig {
    std::string bind = "127.0.0.1";  // Bind address
    int port = 8000;                 // HTTP port (0 = any free port)
    int thread_pool_size = 8;        // Worker thread pool size

    // CORS allowlist ("*" = allow all, one '*' wildcard per entry)
    std::vector<std::string> cors_allowed_origins = default_cors_origins();
};

struct UpstreamConfig {
    std::string url = kDefaultUpstreamUrl;  // Vehicle enquiry endpoint
    std::string api_key;                    // Normally from DVLA_API_KEY, never logged
    int timeout_ms = 10000;                 // Connect/read/write timeout per request
    int pool_size = 4;                      // Concurrent upstream connections
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct ServiceConfig {
    HttpConfig http;
    UpstreamConfig upstream;
    LoggingConfig logging;
};

// Loads configuration from a YAML file on top of the values already in config
bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ServiceConfig &config, std::string &error);

/**
 * @brief Load KEY=VALUE lines from a dotenv file into the process environment
 *
 * Variables already present in the environment are left untouched. Blank
 * lines and '#' comments are skipped; an optional "export " prefix and
 * matching single or double quotes around the value are stripped. Malformed
 * lines are logged and skipped. A missing file is not an error.
 *
 * @return false only if the file exists but cannot be read
 */
bool load_env_file(const std::string &path, std::string &error);

// Applies DVLA_API_KEY and ALLOWED_ORIGINS from the process environment
void apply_environment(ServiceConfig &config);

// Splits a comma separated origin list, trimming entries and dropping empty ones
std::vector<std::string> parse_origin_list(const std::string &csv);

// Appends origins not already present, keeping first-seen order
void merge_origins(std::vector<std::string> &target, const std::vector<std::string> &extra);

// "https://host[:port]/path" -> origin "https://host[:port]" and path "/path"
bool split_url(const std::string &url, std::string &origin, std::string &path);

}  // namespace runtime
}  // namespace vrm
