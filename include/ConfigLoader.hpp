#pragma once
#include "EventQueue.hpp"
#include <string>
#include <vector>

// Forward declaration
namespace Json {
    class Value;
}

namespace PollWatch {

struct WatchConfig {
    std::string path;
    int intervalMs = 0;
};

struct ObserverConfig {
    int defaultIntervalMs = 1000;
    int queueCapacity = 10000;
    OverflowPolicy overflowPolicy = OverflowPolicy::BLOCK;
    int blockTimeoutMs = 5000;
    int popTimeoutMs = 200;
    int shutdownTimeoutMs = 10000;
    int degradedThreshold = 3;
};

struct ServiceConfig {
    ObserverConfig observer;
    std::string logLevel;
    std::string logFile;
    bool jsonOutput = false;
    std::vector<WatchConfig> watches;
};

/**
 * @brief Loads the service configuration from a JSON file
 *
 * Every key is optional; missing keys keep their defaults. A watch entry
 * without intervalMs keeps 0 and polls at defaultIntervalMs, resolved by
 * effectiveInterval() once command line overrides are applied.
 */
class ConfigLoader {
public:
    ConfigLoader();

    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& content);
    ServiceConfig getConfig() const;

    /**
     * @brief Check ranges and names
     * @param config Configuration to check
     * @param error Receives the first problem found
     * @return true if the configuration is usable
     */
    static bool validate(const ServiceConfig& config, std::string& error);

    static int effectiveInterval(const WatchConfig& watch, const ObserverConfig& observer);

private:
    ServiceConfig config_;
    void setDefaults();
    bool loadConfig(const Json::Value& root);
};

} // namespace PollWatch
