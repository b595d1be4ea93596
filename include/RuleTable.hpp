#pragma once
#include "WatchTypes.hpp"
#include "EventHandler.hpp"
#include "EventProducer.hpp"
#include "EventQueue.hpp"
#include "DirectorySnapshot.hpp"
#include <map>
#include <mutex>
#include <memory>
#include <vector>
#include <string>
#include <cstdint>

namespace PollWatch {

struct Rule {
    WatchedPath watch;
    uint64_t id{0};
    std::shared_ptr<EventHandler> handler;
    std::shared_ptr<EventProducer> producer;
    bool live{false};
};

/**
 * @brief Canonical path -> rule, guarded by one mutex
 *
 * Lookups hand out copies of the handler/producer pointers so callers
 * never invoke a handler while the table is locked.
 */
class RuleTable {
public:
    RuleTable(std::shared_ptr<EventQueue> queue,
              std::shared_ptr<SnapshotProvider> provider,
              unsigned int degradedThreshold,
              ErrorCallback errorCallback);

    /**
     * @brief Register a rule and build its producer without starting it
     * @return The new producer, or nullptr when the path is already watched
     */
    std::shared_ptr<EventProducer> addRule(const WatchedPath& watch, std::shared_ptr<EventHandler> handler);

    /**
     * @brief Stop the rule's producer and erase the rule
     * @return The stopped (not yet joined) producer, or nullptr if unknown
     */
    std::shared_ptr<EventProducer> removeRule(const std::string& path);

    /**
     * @brief Stop and erase every rule
     */
    std::vector<std::shared_ptr<EventProducer>> removeAll();

    std::shared_ptr<EventHandler> findHandler(const std::string& path, uint64_t ruleId) const;
    std::shared_ptr<EventProducer> findProducer(const std::string& path) const;
    std::vector<std::shared_ptr<EventProducer>> producers() const;
    std::vector<std::string> paths() const;
    bool contains(const std::string& path) const;
    size_t size() const;

private:
    std::shared_ptr<EventQueue> queue_;
    std::shared_ptr<SnapshotProvider> provider_;
    unsigned int degradedThreshold_;
    ErrorCallback errorCallback_;

    mutable std::mutex mutex_;
    std::map<std::string, Rule> rules_;
    uint64_t nextRuleId_;
};

} // namespace PollWatch
