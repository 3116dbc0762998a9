#pragma once

#include "config/Config.hpp"
#include "remote/Entry.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace skiff::cache {

enum class Scope { Remote, Local };

std::string to_string(Scope scope);

// Identity of one folder listing: a remote folder id or a local directory path
struct ListingKey {
    Scope scope = Scope::Remote;
    std::string id;

    static ListingKey remote(std::string folderId) { return {Scope::Remote, std::move(folderId)}; }
    static ListingKey local(std::string dirPath) { return {Scope::Local, std::move(dirPath)}; }

    bool operator==(const ListingKey& other) const = default;
};

std::string to_string(const ListingKey& key);

struct ListingKeyHash {
    size_t operator()(const ListingKey& key) const noexcept {
        return std::hash<std::string>{}(key.id) ^ (static_cast<size_t>(key.scope) << 1);
    }
};

struct CacheStats {
    size_t remote_entries = 0;
    size_t local_entries = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
};

void to_json(nlohmann::json& j, const CacheStats& s);

// Time-bounded listing cache. get() never returns an entry older than max_age.
class Registry {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit Registry(const config::CachingConfig& cfg, NowFn now = {});

    [[nodiscard]] std::optional<remote::Listing> get(const ListingKey& key) const;

    // Returns whatever is stored regardless of age; never used on default paths
    [[nodiscard]] std::optional<remote::Listing> getAllowStale(const ListingKey& key) const;

    void put(const ListingKey& key, remote::Listing entries);

    void invalidate(const ListingKey& key);

    // Removes every expired entry and returns how many were dropped
    size_t sweep();

    void clear();

    [[nodiscard]] CacheStats stats() const;

    [[nodiscard]] std::chrono::minutes maxAge() const { return max_age_; }

private:
    struct CacheEntry {
        remote::Listing entries;
        Clock::time_point created;
    };

    std::chrono::minutes max_age_;
    NowFn now_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ListingKey, CacheEntry, ListingKeyHash> entries_;

    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};

    [[nodiscard]] bool isExpired(const CacheEntry& entry, Clock::time_point now) const;
};

}
