#include "cache/Loader.hpp"
#include "cache/tasks/Load.hpp"
#include "concurrency/ThreadPool.hpp"
#include "remote/Store.hpp"
#include "log/Registry.hpp"

using namespace skiff::cache;
using namespace skiff;

namespace fs = std::filesystem;

Loader::Loader(std::shared_ptr<Registry> cache, std::shared_ptr<remote::Store> store, const unsigned int maxConcurrentLoads)
    : cache_(std::move(cache)),
      store_(std::move(store)),
      pool_(std::make_unique<concurrency::ThreadPool>("loads", maxConcurrentLoads)) {}

Loader::~Loader() {
    stop();
}

void Loader::stop() {
    pool_->stop();
}

std::future<bool> Loader::load(const ListingKey& key, LoadCallback callback) {
    const auto task = std::make_shared<tasks::Load>(*this, key, std::move(callback));
    auto future = task->promise.get_future();
    pool_->submit(task);
    return future;
}

remote::Listing Loader::fetch(const ListingKey& key) {
    if (auto cached = cache_->get(key)) return std::move(*cached);
    return refresh(key);
}

remote::Listing Loader::refresh(const ListingKey& key) {
    remote::Listing entries;

    if (key.scope == Scope::Remote) {
        if (!store_) throw RemoteUnavailable("No remote store configured");
        entries = store_->listChildren(key.id);
    } else {
        try {
            entries = listLocal(key.id);
        } catch (const fs::filesystem_error& e) {
            if (e.code() == std::errc::no_such_file_or_directory) throw NotFound(e.what());
            if (e.code() == std::errc::permission_denied) throw PermissionDenied(e.what());
            throw LocalIO(e.what());
        }
    }

    cache_->put(key, entries);
    return entries;
}

LoadResult Loader::tryRefresh(const ListingKey& key) {
    LoadResult result{key};
    try {
        result.entries = refresh(key);
    } catch (const std::exception& e) {
        result.error = classify(e);
        result.reason = e.what();
        log::Registry::cache()->warn("[CacheLoader] Failed to load {}: {}", to_string(key), e.what());
    }
    return result;
}

remote::Listing Loader::listLocal(const fs::path& dir) {
    if (!fs::is_directory(dir))
        throw fs::filesystem_error("Not a directory", dir, std::make_error_code(std::errc::no_such_file_or_directory));

    remote::Listing out;
    for (const auto& de : fs::directory_iterator(dir)) {
        std::error_code ec;
        remote::Entry e;
        e.id = de.path().string();
        e.name = de.path().filename().string();

        if (de.is_directory(ec)) {
            e.kind = remote::Kind::Folder;
        } else if (de.is_regular_file(ec)) {
            e.size = de.file_size(ec);
            if (ec) log::Registry::cache()->warn("[CacheLoader] Cannot size {}: {}", e.id, ec.message());
        } else {
            // dangling links, sockets, fifos and devices have nothing to transfer
            log::Registry::cache()->debug("[CacheLoader] Skipping {}: not a regular file or directory", e.id);
            continue;
        }

        out.push_back(std::move(e));
    }
    remote::sortListing(out);
    return out;
}
