#pragma once

#include "cache/Registry.hpp"
#include "error/Error.hpp"

#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace skiff::remote { class Store; }
namespace skiff::concurrency { class ThreadPool; }

namespace skiff::cache {

struct LoadResult {
    ListingKey key;
    std::optional<remote::Listing> entries;
    ErrorCode error = ErrorCode::RemoteUnavailable;
    std::string reason;   // empty on success

    [[nodiscard]] bool ok() const { return entries.has_value(); }
};

using LoadCallback = std::function<void(const LoadResult&)>;

// Populates the listing cache from the store (remote scope) or the local
// filesystem (local scope). load() runs on the loader's own pool so callers
// never wait on I/O; fetch() is the blocking cache-first path for code that is
// already off the interface thread.
class Loader {
public:
    Loader(std::shared_ptr<Registry> cache, std::shared_ptr<remote::Store> store, unsigned int maxConcurrentLoads);
    ~Loader();

    Loader(const Loader&) = delete;
    Loader& operator=(const Loader&) = delete;

    // Always goes to the source; the future resolves to LoadResult::ok()
    std::future<bool> load(const ListingKey& key, LoadCallback callback = {});

    // Cached listing when fresh, otherwise a synchronous refresh. Throws skiff::Error.
    remote::Listing fetch(const ListingKey& key);

    // Fetches from the source and overwrites the cached listing. Throws skiff::Error.
    remote::Listing refresh(const ListingKey& key);

    // Fetch that reports failure as a result instead of throwing
    LoadResult tryRefresh(const ListingKey& key);

    void stop();

    [[nodiscard]] const std::shared_ptr<Registry>& cache() const { return cache_; }
    [[nodiscard]] const std::shared_ptr<remote::Store>& store() const { return store_; }

    static remote::Listing listLocal(const std::filesystem::path& dir);

private:
    std::shared_ptr<Registry> cache_;
    std::shared_ptr<remote::Store> store_;
    std::unique_ptr<concurrency::ThreadPool> pool_;
};

}
