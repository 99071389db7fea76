// VRM Lookup Service
// UK vehicle registration lookup over the DVLA Vehicle Enquiry Service

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv)
{
    std::string config_path;          // Optional; defaults + environment when empty
    std::string env_file_path = ".env";

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--env-file" && i + 1 < argc)
        {
            env_file_path = argv[++i];
        }
        else if (arg.substr(0, 11) == "--env-file=")
        {
            env_file_path = arg.substr(11);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: vrm-lookup [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to YAML config file (optional)\n";
            std::cerr << "  --env-file=PATH  Path to dotenv file (default: .env)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  DVLA_API_KEY     DVLA Vehicle Enquiry Service API key\n";
            std::cerr << "  ALLOWED_ORIGINS  Extra CORS origins, comma separated\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!config_path.empty() && !std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    }

    LOG_INFO("UK VRM Lookup v1.0.0 starting...");

    std::string error;
    if (!vrm::runtime::load_env_file(env_file_path, error))
    {
        LOG_ERROR("Failed to load env file: " << error);
        return 1;
    }

    vrm::runtime::ServiceConfig config;
    if (!config_path.empty())
    {
        LOG_INFO("Loading config: " << config_path);
        if (!vrm::runtime::load_config(config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    vrm::runtime::apply_environment(config);

    vrm::logging::Logger::set_level(vrm::logging::string_to_level(config.logging.level));

    vrm::runtime::SignalHandler::install();

    // Runtime destructor releases the server and connection pool on every exit path
    vrm::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Service Ready");
    LOG_INFO("  Listening: " << config.http.bind << ":" << runtime.http_port());
    LOG_INFO("  Upstream: " << (runtime.upstream_configured() ? "configured" : "NOT configured"));
    LOG_INFO("  CORS origins: " << config.http.cors_allowed_origins.size());

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
