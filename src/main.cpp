#include "Observer.hpp"
#include "EventHandler.hpp"
#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include <iostream>
#include <atomic>
#include <thread>
#include <csignal>
#include <stdexcept>
#include <vector>
#include <unistd.h>

using namespace PollWatch;

namespace {

std::atomic<bool> g_shutdownRequested(false);

void signalHandler(int) {
    g_shutdownRequested.store(true);
}

} // namespace

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS]\n\n";
    std::cout << "Polling Filesystem Observer\n";
    std::cout << "Watches directory trees by periodic snapshots and reports created, modified, deleted and moved entries.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE      Path to configuration JSON file\n";
    std::cout << "  -p, --path PATH        Directory to watch (repeatable)\n";
    std::cout << "  -i, --interval MS      Default polling interval in milliseconds\n";
    std::cout << "  -j, --json             Print events as JSON lines\n";
    std::cout << "  -v, --verbose          Enable DEBUG logging\n";
    std::cout << "  -h, --help             Display this help message and exit\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " -p /var/data\n";
    std::cout << "  " << programName << " -p /srv/in -p /srv/out -i 500 --json\n";
    std::cout << "  " << programName << " --config /etc/pollwatch/pollwatch.json\n\n";
    std::cout << "At least one watch is required, from the config file or from -p.\n";
}

bool validateConfigFile(const std::string& filePath) {
    if (access(filePath.c_str(), F_OK) != 0) {
        std::cerr << "Error: config file not found: " << filePath << std::endl;
        return false;
    }

    if (access(filePath.c_str(), R_OK) != 0) {
        std::cerr << "Error: config file is not readable: " << filePath << std::endl;
        return false;
    }

    return true;
}

int main(int argc, char* argv[]) {
    std::string configFile;
    std::vector<std::string> cliPaths;
    int cliInterval = 0;
    bool jsonOutput = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires a file path argument." << std::endl;
                return 1;
            }
        } else if (arg == "-p" || arg == "--path") {
            if (i + 1 < argc) {
                cliPaths.push_back(argv[++i]);
            } else {
                std::cerr << "Error: " << arg << " requires a directory argument." << std::endl;
                return 1;
            }
        } else if (arg == "-i" || arg == "--interval") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value in milliseconds." << std::endl;
                return 1;
            }
            std::string value = argv[++i];
            try {
                size_t consumed = 0;
                cliInterval = std::stoi(value, &consumed);
                if (consumed != value.size() || cliInterval <= 0) {
                    throw std::invalid_argument(value);
                }
            } catch (const std::exception&) {
                std::cerr << "Error: invalid interval: " << value << std::endl;
                return 1;
            }
        } else if (arg == "-j" || arg == "--json") {
            jsonOutput = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            std::cerr << "Use -h or --help for usage information." << std::endl;
            return 1;
        }
    }

    ConfigLoader loader;
    if (!configFile.empty()) {
        if (!validateConfigFile(configFile)) {
            return 1;
        }
        if (!loader.loadFromFile(configFile)) {
            std::cerr << "Error: Failed to parse config file: " << configFile << std::endl;
            return 1;
        }
    }

    ServiceConfig config = loader.getConfig();
    if (cliInterval > 0) {
        config.observer.defaultIntervalMs = cliInterval;
    }
    if (jsonOutput) {
        config.jsonOutput = true;
    }
    if (verbose) {
        config.logLevel = "DEBUG";
    }
    for (const auto& path : cliPaths) {
        config.watches.push_back(WatchConfig{path, 0});
    }

    std::string error;
    if (!ConfigLoader::validate(config, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    if (config.watches.empty()) {
        std::cerr << "Error: no directory to watch. Use -p/--path or a config file with 'watches'." << std::endl;
        std::cerr << "Use -h or --help for usage information." << std::endl;
        return 1;
    }

    Logger& logger = Logger::getInstance();
    LogLevel level = LogLevel::INFO;
    Logger::parseLogLevel(config.logLevel, level);
    logger.setLogLevel(level);
    if (!config.logFile.empty()) {
        logger.setLogFile(config.logFile);
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    LOG_INFO("Polling observer starting...");

    Observer observer(config.observer);
    auto handler = std::make_shared<LoggingEventHandler>(config.jsonOutput);

    size_t registered = 0;
    for (const auto& watch : config.watches) {
        if (observer.addRule(watch.path, handler,
                               std::chrono::milliseconds(ConfigLoader::effectiveInterval(watch, config.observer)))) {
            registered++;
        } else {
            LOG_WARNING("Skipping watch " + watch.path);
        }
    }
    if (registered == 0) {
        LOG_ERROR("No watch could be registered");
        return 1;
    }

    std::thread dispatcher([&observer]() {
        try {
            observer.run();
        } catch (const std::exception& e) {
            LOG_ERROR("Exception in dispatcher: " + std::string(e.what()));
            g_shutdownRequested.store(true);
        }
    });

    while (!g_shutdownRequested.load() && observer.state() != ObserverState::STOPPED) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG_INFO("Shutdown requested");
    observer.stop();
    dispatcher.join();

    LOG_INFO("Polling observer stopped");
    logger.closeLogFile();
    return 0;
}
