#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace powerplan {

// Caller-owned memo for expensive loads (scenario files, catalogs).
// - Entries expire ttl after they were loaded (ttl <= 0: never).
// - Bounded by max_entries via LRU eviction.
// - One mutex guards everything; the loader runs under it, so concurrent
//   callers asking for the same key load it once.
// - A loader that throws leaves the cache unchanged.

struct ReadThroughCacheStats final {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;    // LRU bound
    std::uint64_t expirations = 0;  // TTL
};

template <class T, class Key = std::string>
class ReadThroughCache final {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ReadThroughCache(std::chrono::milliseconds ttl = std::chrono::minutes(5),
                              std::size_t max_entries = 64,
                              Clock clock = [] { return std::chrono::steady_clock::now(); })
        : ttl_(ttl), max_entries_(max_entries == 0 ? 1 : max_entries), clock_(std::move(clock)) {}

    ReadThroughCache(const ReadThroughCache&) = delete;
    ReadThroughCache& operator=(const ReadThroughCache&) = delete;

    // Cached value for key, or loader() stored and returned.
    template <class Loader>
    T get_or_load(const Key& key, Loader&& loader) {
        std::lock_guard<std::mutex> lock(mtx_);
        const auto now = clock_();

        auto it = map_.find(key);
        if (it != map_.end()) {
            if (!expired_(*it->second, now)) {
                ++stats_.hits;
                lru_.splice(lru_.begin(), lru_, it->second);
                return it->second->value;
            }
            ++stats_.expirations;
            lru_.erase(it->second);
            map_.erase(it);
        }

        ++stats_.misses;
        T value = std::forward<Loader>(loader)();
        lru_.push_front(Node{key, value, now});
        map_[key] = lru_.begin();

        while (map_.size() > max_entries_) {
            map_.erase(lru_.back().key);
            lru_.pop_back();
            ++stats_.evictions;
        }
        return value;
    }

    // Cached value without loading; expired entries count as absent.
    std::optional<T> peek(const Key& key) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = map_.find(key);
        if (it == map_.end() || expired_(*it->second, clock_())) return std::nullopt;
        return it->second->value;
    }

    void invalidate(const Key& key) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = map_.find(key);
        if (it == map_.end()) return;
        lru_.erase(it->second);
        map_.erase(it);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        lru_.clear();
        map_.clear();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return map_.size();
    }

    ReadThroughCacheStats stats() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return stats_;
    }

private:
    struct Node final {
        Key key;
        T value;
        std::chrono::steady_clock::time_point loaded_at;
    };

    bool expired_(const Node& n, std::chrono::steady_clock::time_point now) const {
        return ttl_.count() > 0 && now - n.loaded_at >= ttl_;
    }

    mutable std::mutex mtx_;
    std::chrono::milliseconds ttl_;
    std::size_t max_entries_;
    Clock clock_;

    ReadThroughCacheStats stats_{};
    std::list<Node> lru_;  // front = most recently used
    std::unordered_map<Key, typename std::list<Node>::iterator> map_;
};

} // namespace powerplan
