#include "remote/Editor.hpp"
#include "remote/Store.hpp"
#include "cache/Registry.hpp"
#include "log/Registry.hpp"

using namespace skiff::remote;
using namespace skiff;

Editor::Editor(std::shared_ptr<Store> store, std::shared_ptr<cache::Registry> cache)
    : store_(std::move(store)), cache_(std::move(cache)) {}

std::string Editor::createFolder(const std::string& parentId, const std::string& name) {
    cache_->invalidate(cache::ListingKey::remote(parentId));
    auto id = store_->createFolder(parentId, name);
    log::Registry::audit()->info("[Editor] create-folder parent={} name={} id={}", parentId, name, id);
    return id;
}

void Editor::rename(const std::string& id, const std::string& parentId, const std::string& newName) {
    cache_->invalidate(cache::ListingKey::remote(parentId));
    cache_->invalidate(cache::ListingKey::remote(id));
    store_->rename(id, newName);
    log::Registry::audit()->info("[Editor] rename id={} name={}", id, newName);
}

void Editor::remove(const std::string& id, const std::string& parentId, const bool permanent) {
    cache_->invalidate(cache::ListingKey::remote(parentId));
    cache_->invalidate(cache::ListingKey::remote(id));
    store_->remove(id, permanent);
    log::Registry::audit()->info("[Editor] {} id={}", permanent ? "delete" : "trash", id);
}

Listing Editor::search(const std::string& query) {
    auto results = store_->search(query);
    log::Registry::remote()->debug("[Editor] search '{}' returned {} entries", query, results.size());
    return results;
}
