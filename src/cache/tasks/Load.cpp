#include "cache/tasks/Load.hpp"
#include "log/Registry.hpp"

using namespace skiff::cache::tasks;
using namespace skiff::cache;
using namespace skiff;

Load::Load(Loader& loader, ListingKey key, LoadCallback callback)
    : loader(loader), key(std::move(key)), callback(std::move(callback)) {}

void Load::operator()() {
    const auto result = loader.tryRefresh(key);

    if (callback) {
        try {
            callback(result);
        } catch (const std::exception& e) {
            log::Registry::cache()->error("[LoadTask] Callback for {} threw: {}", to_string(key), e.what());
        }
    }

    promise.set_value(result.ok());
}
