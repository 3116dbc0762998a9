#include "cache/Registry.hpp"
#include "log/Registry.hpp"

#include <mutex>
#include <nlohmann/json.hpp>

using namespace skiff::cache;
using namespace skiff;

namespace skiff::cache {

std::string to_string(const Scope scope) {
    switch (scope) {
        case Scope::Remote: return "remote";
        case Scope::Local: return "local";
        default: return "unknown";
    }
}

std::string to_string(const ListingKey& key) {
    return to_string(key.scope) + ":" + key.id;
}

void to_json(nlohmann::json& j, const CacheStats& s) {
    j = {
        {"remote_entries", s.remote_entries},
        {"local_entries", s.local_entries},
        {"hits", s.hits},
        {"misses", s.misses},
        {"evictions", s.evictions}
    };
}

}

Registry::Registry(const config::CachingConfig& cfg, NowFn now)
    : max_age_(cfg.maxAge()),
      now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

bool Registry::isExpired(const CacheEntry& entry, const Clock::time_point now) const {
    return now - entry.created > max_age_;
}

std::optional<remote::Listing> Registry::get(const ListingKey& key) const {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end() || isExpired(it->second, now_())) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second.entries;
}

std::optional<remote::Listing> Registry::getAllowStale(const ListingKey& key) const {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second.entries;
}

void Registry::put(const ListingKey& key, remote::Listing entries) {
    const auto created = now_();
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(key, CacheEntry{std::move(entries), created});
}

void Registry::invalidate(const ListingKey& key) {
    std::unique_lock lock(mutex_);
    if (entries_.erase(key) > 0)
        log::Registry::cache()->debug("[CacheRegistry] Invalidated {}", to_string(key));
}

size_t Registry::sweep() {
    const auto now = now_();
    size_t removed = 0;
    {
        std::unique_lock lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (isExpired(it->second, now)) {
                it = entries_.erase(it);
                ++removed;
            } else ++it;
        }
    }
    evictions_ += removed;
    return removed;
}

void Registry::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

CacheStats Registry::stats() const {
    CacheStats s;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [key, _] : entries_) {
            if (key.scope == Scope::Remote) ++s.remote_entries;
            else ++s.local_entries;
        }
    }
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.evictions = evictions_.load();
    return s;
}
