#include "RuleTable.hpp"
#include "Logger.hpp"

namespace PollWatch {

RuleTable::RuleTable(std::shared_ptr<EventQueue> queue,
                     std::shared_ptr<SnapshotProvider> provider,
                     unsigned int degradedThreshold,
                     ErrorCallback errorCallback)
    : queue_(std::move(queue)),
      provider_(std::move(provider)),
      degradedThreshold_(degradedThreshold),
      errorCallback_(std::move(errorCallback)),
      nextRuleId_(1) {}

std::shared_ptr<EventProducer> RuleTable::addRule(const WatchedPath& watch, std::shared_ptr<EventHandler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (rules_.find(watch.path) != rules_.end()) {
        LOG_DEBUG("Rule already registered for " + watch.path);
        return nullptr;
    }

    Rule rule;
    rule.watch = watch;
    rule.id = nextRuleId_++;
    rule.handler = std::move(handler);
    rule.producer = std::make_shared<EventProducer>(watch, rule.id, queue_, provider_,
                                                    degradedThreshold_, errorCallback_);
    rule.live = true;

    auto producer = rule.producer;
    rules_[watch.path] = std::move(rule);
    LOG_INFO("Rule added for " + watch.path + ", total rules: " + std::to_string(rules_.size()));
    return producer;
}

std::shared_ptr<EventProducer> RuleTable::removeRule(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rules_.find(path);
    if (it == rules_.end()) {
        return nullptr;
    }

    it->second.live = false;
    auto producer = it->second.producer;
    producer->stop();
    rules_.erase(it);

    LOG_INFO("Rule removed for " + path + ", total rules: " + std::to_string(rules_.size()));
    return producer;
}

std::vector<std::shared_ptr<EventProducer>> RuleTable::removeAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<EventProducer>> removed;
    for (auto& pair : rules_) {
        pair.second.live = false;
        pair.second.producer->stop();
        removed.push_back(pair.second.producer);
    }
    rules_.clear();
    return removed;
}

std::shared_ptr<EventHandler> RuleTable::findHandler(const std::string& path, uint64_t ruleId) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rules_.find(path);
    if (it == rules_.end() || !it->second.live || it->second.id != ruleId) {
        return nullptr;
    }
    return it->second.handler;
}

std::shared_ptr<EventProducer> RuleTable::findProducer(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rules_.find(path);
    if (it == rules_.end()) {
        return nullptr;
    }
    return it->second.producer;
}

std::vector<std::shared_ptr<EventProducer>> RuleTable::producers() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<EventProducer>> result;
    for (const auto& pair : rules_) {
        result.push_back(pair.second.producer);
    }
    return result;
}

std::vector<std::string> RuleTable::paths() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    for (const auto& pair : rules_) {
        result.push_back(pair.first);
    }
    return result;
}

bool RuleTable::contains(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.find(path) != rules_.end();
}

size_t RuleTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.size();
}

} // namespace PollWatch
