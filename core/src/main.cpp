// Tactile Server
// Config-based device server with CLI argument parsing

#include <iostream>
#include <string>
#include <filesystem>
#include "runtime/runtime.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "tactile-server.yaml"; // Default

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
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: tactile-server [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: tactile-server.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("Tactile server starting...");
    LOG_INFO("Loading config: " << config_path);

    // Load configuration
    tactile::runtime::RuntimeConfig config;
    std::string error;

    if (!tactile::runtime::load_config(config_path, config, error))
    {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    // Validated by load_config
    auto level = tactile::logging::parse_level(config.logging.level);
    tactile::logging::Logger::set_level(level.value_or(tactile::logging::Level::LVL_INFO));

    // Install before any socket exists so SIGPIPE is ignored from the start
    tactile::runtime::SignalHandler::install();

    tactile::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " << error);
        runtime.shutdown();
        return 1;
    }

    LOG_INFO("Server Ready");
    if (auto *listener = runtime.get_listener())
    {
        LOG_INFO("  Listening: " << config.listener.bind << ":" << listener->port());
    }
    LOG_INFO("  Protocol versions: " << config.server.min_version << "-" << config.server.max_version);
    LOG_INFO("  Max ping time: " << config.server.max_ping_time_ms << "ms");

    // Run main loop (blocking)
    runtime.run();

    runtime.shutdown();
    LOG_INFO("Shutdown complete");
    return 0;
}
