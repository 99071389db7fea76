#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "logging/logger.hpp"
#include "lookup/plate.hpp"

namespace vrm {
namespace runtime {

namespace {

bool set_env_if_absent(const std::string &name, const std::string &value) {
    if (std::getenv(name.c_str()) != nullptr) {
        return false;
    }
#ifdef _WIN32
    return _putenv_s(name.c_str(), value.c_str()) == 0;
#else
    return setenv(name.c_str(), value.c_str(), 0) == 0;
#endif
}

bool is_valid_env_name(const std::string &name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])) != 0) {
        return false;
    }
    return std::all_of(name.begin(), name.end(),
                       [](unsigned char c) { return std::isalnum(c) != 0 || c == '_'; });
}

std::string strip_quotes(const std::string &value) {
    if (value.size() >= 2) {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' || first == '\'') && first == last) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

}  // namespace

const std::vector<std::string> &default_cors_origins() {
    static const std::vector<std::string> origins = {
        "http://localhost:5173",
        "http://localhost:5174",
        "http://127.0.0.1:5173",
        "http://127.0.0.1:5174",
    };
    return origins;
}

std::vector<std::string> parse_origin_list(const std::string &csv) {
    std::vector<std::string> origins;
    std::stringstream stream(csv);
    std::string entry;
    while (std::getline(stream, entry, ',')) {
        entry = lookup::trim(entry);
        if (!entry.empty()) {
            origins.push_back(entry);
        }
    }
    return origins;
}

void merge_origins(std::vector<std::string> &target, const std::vector<std::string> &extra) {
    for (const auto &origin : extra) {
        if (std::find(target.begin(), target.end(), origin) == target.end()) {
            target.push_back(origin);
        }
    }
}

bool split_url(const std::string &url, std::string &origin, std::string &path) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return false;
    }

    const std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return false;
    }

    const auto host_start = scheme_end + 3;
    const auto path_start = url.find('/', host_start);
    const std::string host =
        url.substr(host_start, path_start == std::string::npos ? std::string::npos : path_start - host_start);
    if (host.empty()) {
        return false;
    }

    origin = scheme + "://" + host;
    path = path_start == std::string::npos ? "/" : url.substr(path_start);
    return true;
}

bool validate_config(const ServiceConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "http.bind must not be empty";
        return false;
    }
    if (config.http.port < 0 || config.http.port > 65535) {
        error = "HTTP port must be between 0 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }

    // Validate upstream settings
    std::string origin;
    std::string path;
    if (!split_url(config.upstream.url, origin, path)) {
        error = "upstream.url must be an http:// or https:// URL with a host: '" + config.upstream.url + "'";
        return false;
    }
    if (config.upstream.timeout_ms < 100) {
        error = "upstream.timeout_ms must be >= 100ms";
        return false;
    }
    if (config.upstream.pool_size < 1) {
        error = "upstream.pool_size must be at least 1";
        return false;
    }

    // Validate Logging settings
    if (!logging::parse_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "upstream", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }

            // Extra CORS origins (sequence or comma separated scalar), added to the dev defaults
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                if (origins_node.IsSequence()) {
                    std::vector<std::string> origins;
                    for (const auto &origin : origins_node) {
                        origins.push_back(origin.as<std::string>());
                    }
                    merge_origins(config.http.cors_allowed_origins, origins);
                } else if (origins_node.IsScalar()) {
                    merge_origins(config.http.cors_allowed_origins,
                                  parse_origin_list(origins_node.as<std::string>()));
                }
            }
        }

        // Load upstream config
        if (yaml["upstream"]) {
            const auto &upstream = yaml["upstream"];
            if (upstream["url"]) {
                config.upstream.url = upstream["url"].as<std::string>();
            }
            if (upstream["api_key"]) {
                config.upstream.api_key = upstream["api_key"].as<std::string>();
            }
            if (upstream["timeout_ms"]) {
                config.upstream.timeout_ms = upstream["timeout_ms"].as<int>();
            }
            if (upstream["pool_size"]) {
                config.upstream.pool_size = upstream["pool_size"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                                   << config.http.thread_pool_size << " workers)");
        LOG_INFO("[Config] Upstream: " << config.upstream.url << " (timeout " << config.upstream.timeout_ms
                                       << "ms, pool " << config.upstream.pool_size << ")");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool load_env_file(const std::string &path, std::string &error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_DEBUG("[Config] No env file at " << path);
        return true;
    }

    std::ifstream file(path);
    if (!file) {
        error = "Cannot open env file: " + path;
        return false;
    }

    int line_number = 0;
    int loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++line_number;
        line = lookup::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = lookup::trim(line.substr(7));
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("[Config] " << path << ":" << line_number << ": expected KEY=VALUE (skipped)");
            continue;
        }

        const std::string name = lookup::trim(line.substr(0, eq));
        if (!is_valid_env_name(name)) {
            LOG_WARN("[Config] " << path << ":" << line_number << ": invalid variable name '" << name
                                 << "' (skipped)");
            continue;
        }

        if (set_env_if_absent(name, strip_quotes(lookup::trim(line.substr(eq + 1))))) {
            ++loaded;
        }
    }

    LOG_INFO("[Config] Loaded " << loaded << " variable(s) from " << path);
    return true;
}

void apply_environment(ServiceConfig &config) {
    const char *api_key = std::getenv(kApiKeyEnvVar);
    if (api_key != nullptr && api_key[0] != '\0') {
        config.upstream.api_key = api_key;
    }

    const char *origins = std::getenv(kAllowedOriginsEnvVar);
    if (origins != nullptr) {
        merge_origins(config.http.cors_allowed_origins, parse_origin_list(origins));
    }

    if (config.upstream.api_key.empty()) {
        LOG_WARN("[Config] " << kApiKeyEnvVar << " not set; every lookup will report 'Vehicle not found'");
    }
}

}  // namespace runtime
}  // namespace vrm
