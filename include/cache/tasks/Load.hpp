#pragma once

#include "concurrency/Task.hpp"
#include "cache/Loader.hpp"

namespace skiff::cache::tasks {

struct Load final : concurrency::PromisedTask {
    Loader& loader;
    ListingKey key;
    LoadCallback callback;

    Load(Loader& loader, ListingKey key, LoadCallback callback);

    void operator()() override;
};

}
