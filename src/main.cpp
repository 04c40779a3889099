/**
 * @file    main.cpp
 * @brief   Book Watch Service - Main Entry Point
 *
 * Description:
 *   Watches the bid and ask book-side accounts of the configured markets
 *   through the Kafka account feed, keeps the latest price-sorted orders per
 *   side and publishes them as JSON to order_book.[MARKET] topics.
 */

#include <iostream>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <filesystem>
#include <algorithm>
#include <map>
#include <yaml-cpp/yaml.h>

/* SpdLog library. */
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"

#include "BookWatchService.hpp"

/**
 * @brief Print application banner and version info
 */
void print_banner() {
    std::cout << R"(
╔══════════════════════════════════════════════════════════════╗
║                  Order Book Side Watcher v1.0                ║
║                   Equix Technologies Pty Ltd                 ║
╠══════════════════════════════════════════════════════════════╣
║  Input: book-side account updates (FlatBuffers via Kafka)    ║
║  Output: price-sorted order JSON to order_book.[MARKET]      ║
╚══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

/**
 * @brief Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  -c, --config PATH     Configuration file path (default: config/config.yaml)\n"
              << "  -t, --topic TOPIC     Account update Kafka topic (default: from config)\n"
              << "  -r, --runtime SECONDS Maximum runtime in seconds (0 = infinite)\n"
              << "  --stats-interval SEC  Statistics reporting interval (default: 30)\n"
              << "  -v, --verbose        Enable verbose logging (debug level)\n"
              << "  -q, --quiet          Quiet mode (warnings and errors only)\n"
              << "  -h, --help           Show this help message\n\n"
              << "Examples:\n"
              << "  " << program_name << " -c config/prod.yaml -t account_updates\n"
              << "  " << program_name << " --runtime 3600 -v\n\n";
}

/**
 * @brief Get log filename by day
 */
std::string get_log_filename(const std::string &log_folder) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << log_folder << "/book_watch_";
    ss << std::put_time(std::localtime(&t), "%Y_%m_%d") << ".log";
    return ss.str();
}

/**
 * @brief Setup logging with rotation
 */
std::shared_ptr<spdlog::logger> setup_logger(
    spdlog::level::level_enum level = spdlog::level::info,
    const std::string &log_folder = "logs") {

    // Ensure log directory exists
    std::filesystem::create_directories(log_folder);

    // 100MB per file, 50 files max (5GB total)
    size_t max_file_size = 100 * 1024 * 1024;
    size_t max_files = 50;

    std::string filename = get_log_filename(log_folder);
    auto logger = spdlog::rotating_logger_mt("book_watch_logger", filename, max_file_size, max_files);

    // Enhanced log pattern with thread ID and microsecond precision
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f][%t][%l][%s:%#][%!] %v");
    logger->set_level(level);

    // Set level for all sinks
    for (auto &sink: logger->sinks()) {
        sink->set_level(level);
    }

    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
    return logger;
}

/**
 * @brief Parse log level from string
 */
spdlog::level::level_enum parse_log_level(const std::string &level_str) {
    std::string lvl = level_str;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::tolower);

    if (lvl == "trace") return spdlog::level::trace;
    if (lvl == "debug") return spdlog::level::debug;
    if (lvl == "info") return spdlog::level::info;
    if (lvl == "warn" || lvl == "warning") return spdlog::level::warn;
    if (lvl == "err" || lvl == "error") return spdlog::level::err;
    if (lvl == "critical") return spdlog::level::critical;
    if (lvl == "off") return spdlog::level::off;

    return spdlog::level::info; // Default
}

/**
 * @brief Main entry point
 */
int main(int argc, char *argv[]) {
    print_banner();

    // Parse command line arguments
    std::string config_path = "config/config.yaml";
    std::string log_level_str = "info";
    std::string log_folder = "/tmp";
    uint32_t max_runtime_s = 0;
    std::map<std::string, std::string> cli_overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "-h" || arg == "--help")) {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-t" || arg == "--topic") && i + 1 < argc) {
            cli_overrides["topic"] = argv[++i];
        } else if ((arg == "-r" || arg == "--runtime") && i + 1 < argc) {
            max_runtime_s = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--stats-interval" && i + 1 < argc) {
            cli_overrides["stats_interval"] = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            cli_overrides["log_level"] = "debug";
        } else if (arg == "-q" || arg == "--quiet") {
            cli_overrides["log_level"] = "warn";
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load global configuration for logging
    try {
        YAML::Node global_config = YAML::LoadFile(config_path);
        if (global_config["global"]) {
            const auto& global = global_config["global"];
            if (global["log_level"]) log_level_str = global["log_level"].as<std::string>();
            if (global["log_path"]) log_folder = global["log_path"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        std::cerr << "Warning: Failed to load config for logging: " << e.what() << std::endl;
    }
    if (cli_overrides.count("log_level")) {
        log_level_str = cli_overrides["log_level"];
    }

    // Setup logging
    spdlog::level::level_enum log_level = parse_log_level(log_level_str);
    auto logger = setup_logger(log_level, log_folder);

    SPDLOG_INFO("Book Watch Service starting...");
    SPDLOG_INFO("Config: {}, Log level: {}, Max runtime: {}s", config_path, log_level_str, max_runtime_s);

    try {
        auto config = book_watch::load_service_config(config_path);

        // Apply command line overrides
        if (cli_overrides.count("topic")) {
            config.feed_config.topic = cli_overrides["topic"];
        }
        if (cli_overrides.count("stats_interval")) {
            config.stats_report_interval_s = static_cast<uint32_t>(std::stoul(cli_overrides["stats_interval"]));
        }

        if (config.markets.empty()) {
            SPDLOG_ERROR("No markets configured in {}", config_path);
            return 1;
        }

        SPDLOG_INFO("Service config loaded: topic={}, markets=[{}]",
                   config.feed_config.topic,
                   [&]() {
                       std::string names;
                       for (size_t i = 0; i < config.markets.size(); ++i) {
                           if (i > 0) names += ",";
                           names += config.markets[i].name;
                       }
                       return names;
                   }());

        book_watch::BookWatchService service(config);

        if (!service.initialize()) {
            SPDLOG_ERROR("Failed to initialize book watch service");
            return 1;
        }

        // Setup graceful shutdown handler
        book_watch::ServiceShutdownHandler shutdown_handler(service);

        // Start processing (blocking call)
        service.start_processing(max_runtime_s);

        SPDLOG_INFO("Book Watch Service finished successfully");
        return 0;

    } catch (const std::exception& e) {
        SPDLOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
