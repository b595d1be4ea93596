#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include <json/json.h>
#include <fstream>
#include <sstream>

namespace PollWatch {

namespace {

bool readInt(const Json::Value& root, const char* key, int& target) {
    if (!root.isMember(key)) {
        return true;
    }
    if (!root[key].isInt()) {
        LOG_ERROR(std::string("Config key '") + key + "' must be an integer");
        return false;
    }
    target = root[key].asInt();
    return true;
}

bool readString(const Json::Value& root, const char* key, std::string& target) {
    if (!root.isMember(key)) {
        return true;
    }
    if (!root[key].isString()) {
        LOG_ERROR(std::string("Config key '") + key + "' must be a string");
        return false;
    }
    target = root[key].asString();
    return true;
}

bool readBool(const Json::Value& root, const char* key, bool& target) {
    if (!root.isMember(key)) {
        return true;
    }
    if (!root[key].isBool()) {
        LOG_ERROR(std::string("Config key '") + key + "' must be a boolean");
        return false;
    }
    target = root[key].asBool();
    return true;
}

} // namespace

ConfigLoader::ConfigLoader() {
    setDefaults();
}

bool ConfigLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_WARNING("Config file not found: " + filename + ", using defaults");
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!loadFromString(buffer.str())) {
        LOG_ERROR("Error loading config file: " + filename);
        return false;
    }

    LOG_INFO("Configuration loaded from " + filename);
    return true;
}

bool ConfigLoader::loadFromString(const std::string& content) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(content);

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        LOG_ERROR("Error parsing config: " + errors);
        return false;
    }
    if (!root.isObject()) {
        LOG_ERROR("Config root must be a JSON object");
        return false;
    }

    return loadConfig(root);
}

bool ConfigLoader::loadConfig(const Json::Value& root) {
    ServiceConfig loaded = config_;
    ObserverConfig& observer = loaded.observer;

    if (!readInt(root, "defaultIntervalMs", observer.defaultIntervalMs) ||
        !readInt(root, "queueCapacity", observer.queueCapacity) ||
        !readInt(root, "blockTimeoutMs", observer.blockTimeoutMs) ||
        !readInt(root, "popTimeoutMs", observer.popTimeoutMs) ||
        !readInt(root, "shutdownTimeoutMs", observer.shutdownTimeoutMs) ||
        !readInt(root, "degradedThreshold", observer.degradedThreshold) ||
        !readString(root, "logLevel", loaded.logLevel) ||
        !readString(root, "logFile", loaded.logFile) ||
        !readBool(root, "jsonOutput", loaded.jsonOutput)) {
        return false;
    }

    if (root.isMember("overflowPolicy")) {
        if (!root["overflowPolicy"].isString() ||
            !parseOverflowPolicy(root["overflowPolicy"].asString(), observer.overflowPolicy)) {
            LOG_ERROR("Config key 'overflowPolicy' must be one of block, drop_oldest, drop_newest");
            return false;
        }
    }

    if (root.isMember("watches")) {
        const Json::Value& watches = root["watches"];
        if (!watches.isArray()) {
            LOG_ERROR("Config key 'watches' must be an array");
            return false;
        }

        loaded.watches.clear();
        for (const auto& item : watches) {
            WatchConfig watch;

            if (item.isString()) {
                watch.path = item.asString();
            } else if (item.isObject()) {
                if (!readString(item, "path", watch.path) || !readInt(item, "intervalMs", watch.intervalMs)) {
                    return false;
                }
            } else {
                LOG_ERROR("Each watch must be a path string or an object with 'path'");
                return false;
            }
            loaded.watches.push_back(watch);
        }
    }

    config_ = loaded;
    return true;
}

ServiceConfig ConfigLoader::getConfig() const {
    return config_;
}

bool ConfigLoader::validate(const ServiceConfig& config, std::string& error) {
    const ObserverConfig& observer = config.observer;

    if (observer.defaultIntervalMs <= 0) {
        error = "defaultIntervalMs must be positive";
        return false;
    }
    if (observer.queueCapacity <= 0) {
        error = "queueCapacity must be positive";
        return false;
    }
    if (observer.blockTimeoutMs <= 0) {
        error = "blockTimeoutMs must be positive";
        return false;
    }
    if (observer.popTimeoutMs <= 0) {
        error = "popTimeoutMs must be positive";
        return false;
    }
    if (observer.shutdownTimeoutMs <= 0) {
        error = "shutdownTimeoutMs must be positive";
        return false;
    }
    if (observer.degradedThreshold < 0) {
        error = "degradedThreshold must not be negative";
        return false;
    }

    LogLevel level;
    if (!Logger::parseLogLevel(config.logLevel, level)) {
        error = "Unknown logLevel: " + config.logLevel;
        return false;
    }

    for (const auto& watch : config.watches) {
        if (watch.path.empty()) {
            error = "Watch path must not be empty";
            return false;
        }
        if (watch.intervalMs < 0) {
            error = "intervalMs for " + watch.path + " must not be negative";
            return false;
        }
    }

    return true;
}

int ConfigLoader::effectiveInterval(const WatchConfig& watch, const ObserverConfig& observer) {
    return watch.intervalMs > 0 ? watch.intervalMs : observer.defaultIntervalMs;
}

void ConfigLoader::setDefaults() {
    config_.observer = ObserverConfig();
    config_.logLevel = "INFO";
    config_.logFile = "";
    config_.jsonOutput = false;
    config_.watches.clear();
}

} // namespace PollWatch
