#pragma once

#include "remote/Entry.hpp"

#include <memory>
#include <string>

namespace skiff::cache { class Registry; }

namespace skiff::remote {

class Store;

// Mutating store commands. Each one drops the affected cached listings
// before calling the store, so the next browse re-fetches.
class Editor {
public:
    Editor(std::shared_ptr<Store> store, std::shared_ptr<cache::Registry> cache);

    std::string createFolder(const std::string& parentId, const std::string& name);

    void rename(const std::string& id, const std::string& parentId, const std::string& newName);

    void remove(const std::string& id, const std::string& parentId, bool permanent = false);

    Listing search(const std::string& query);

private:
    std::shared_ptr<Store> store_;
    std::shared_ptr<cache::Registry> cache_;
};

}
