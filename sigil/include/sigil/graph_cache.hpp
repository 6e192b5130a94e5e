#pragma once
// Graph cache: one built dependency graph per campaign and branch
//
// Built on first request, dropped by invalidate() whenever a condition or
// effect in that campaign changes. Readers share the lock; builds and
// invalidations take it exclusively.

#include "graph_builder.hpp"
#include "log.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace sigil {

class GraphCache {
public:
    using Builder = std::function<GraphBuild(const std::string& campaign, const std::string& branch)>;

    static std::string key(const std::string& campaign, const std::string& branch) {
        return campaign + ":" + branch;
    }

    std::shared_ptr<const GraphBuild> get_or_build(const std::string& campaign,
                                                   const std::string& branch,
                                                   const Builder& build) {
        const std::string k = key(campaign, branch);
        {
            std::shared_lock lock(mutex_);
            auto it = graphs_.find(k);
            if (it != graphs_.end()) {
                hits_++;
                return it->second;
            }
        }

        std::unique_lock lock(mutex_);
        // Another writer may have built it while we waited
        auto it = graphs_.find(k);
        if (it != graphs_.end()) {
            hits_++;
            return it->second;
        }
        misses_++;
        auto built = std::make_shared<const GraphBuild>(build(campaign, branch));
        graphs_.emplace(k, built);
        log::debug("cache", "Cached graph %s (%zu nodes)", k.c_str(), built->graph.node_count());
        return built;
    }

    std::shared_ptr<const GraphBuild> peek(const std::string& campaign, const std::string& branch) const {
        std::shared_lock lock(mutex_);
        auto it = graphs_.find(key(campaign, branch));
        return it != graphs_.end() ? it->second : nullptr;
    }

    bool invalidate(const std::string& campaign, const std::string& branch) {
        std::unique_lock lock(mutex_);
        bool removed = graphs_.erase(key(campaign, branch)) > 0;
        if (removed) log::debug("cache", "Invalidated graph %s:%s", campaign.c_str(), branch.c_str());
        return removed;
    }

    // Every branch of a campaign
    size_t invalidate_campaign(const std::string& campaign) {
        std::unique_lock lock(mutex_);
        const std::string prefix = campaign + ":";
        size_t removed = 0;
        for (auto it = graphs_.begin(); it != graphs_.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                it = graphs_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        graphs_.clear();
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return graphs_.size();
    }

    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }

    json stats() const {
        return {{"entries", size()}, {"hits", hits()}, {"misses", misses()}};
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const GraphBuild>> graphs_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace sigil
