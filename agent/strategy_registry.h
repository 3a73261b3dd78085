#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "errors.h"

// Strategies keyed by the profile type they report through getType().
// Filled at construction time, read-only afterwards.
template <typename Strategy>
class StrategyRegistry {
public:
    void add(std::unique_ptr<Strategy> strategy) {
        if (!strategy) {
            throw ValidationError("strategy cannot be null");
        }
        std::string type = strategy->getType();
        if (type.empty()) {
            throw ValidationError("strategy type cannot be empty");
        }
        if (strategies_.count(type) > 0) {
            throw ValidationError("strategy already registered for type " + type);
        }
        strategies_[type] = std::move(strategy);
    }

    // Throws UnsupportedProfileError listing the registered types
    Strategy& find(const std::string& type) const {
        auto it = strategies_.find(type);
        if (it == strategies_.end()) {
            throw UnsupportedProfileError(type, types());
        }
        return *it->second;
    }

    bool contains(const std::string& type) const {
        return strategies_.count(type) > 0;
    }

    std::vector<std::string> types() const {
        std::vector<std::string> result;
        result.reserve(strategies_.size());
        for (const auto& entry : strategies_) {
            result.push_back(entry.first);
        }
        return result;
    }

    template <typename Fn>
    void forEach(Fn fn) const {
        for (const auto& entry : strategies_) {
            fn(*entry.second);
        }
    }

    size_t size() const { return strategies_.size(); }
    bool empty() const { return strategies_.empty(); }

private:
    std::map<std::string, std::unique_ptr<Strategy>> strategies_;
};
