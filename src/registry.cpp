#include "deltastore/storage/registry.hpp"
#include "deltastore/core/log.hpp"

#include <algorithm>

namespace deltastore {

ObjectStoreRef DefaultObjectStoreRegistry::register_store(const Url& url, ObjectStoreRef store) {
    auto key = url.to_string();
    if (!store) {
        throw StorageError(ErrorKind::Generic, "Cannot register a null object store for " + key);
    }
    auto previous = stores_.insert_or_assign(key, std::move(store));
    if (previous) {
        log_debug("Replaced object store for %s (was %s)",
                  key.c_str(), (*previous)->to_string().c_str());
        return *previous;
    }
    return nullptr;
}

ObjectStoreRef DefaultObjectStoreRegistry::get_store(const Url& url) const {
    auto key = url.to_string();
    auto store = stores_.find(key);
    if (!store) {
        throw StorageError(ErrorKind::NotRegistered,
            "No suitable object store found for " + key + ". did you forget to register it?");
    }
    return *store;
}

std::string DefaultObjectStoreRegistry::to_string() const {
    auto keys = stores_.keys();
    std::sort(keys.begin(), keys.end());

    std::string out = "DefaultObjectStoreRegistry { urls: [";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) out += ", ";
        out += "\"" + keys[i] + "\"";
    }
    out += "] }";
    return out;
}

DefaultObjectStoreRegistry& object_stores() {
    static DefaultObjectStoreRegistry* registry = new DefaultObjectStoreRegistry();
    return *registry;
}

} // namespace deltastore
