#pragma once

#include "deltastore/core/sharded_map.hpp"
#include "deltastore/storage/backend.hpp"
#include "deltastore/storage/url.hpp"

#include <string>

namespace deltastore {

// Live store instances keyed by exact table URL
class ObjectStoreRegistry {
public:
    using StoreMap = ShardedMap<std::string, ObjectStoreRef>;

    virtual ~ObjectStoreRegistry() = default;

    // Register store under url; returns the store it replaced, or nullptr.
    // A null store is rejected with StorageError.
    virtual ObjectStoreRef register_store(const Url& url, ObjectStoreRef store) = 0;

    // Throws StorageError(NotRegistered) when nothing is registered for url
    virtual ObjectStoreRef get_store(const Url& url) const = 0;

    virtual const StoreMap& all_stores() const = 0;
};

class DefaultObjectStoreRegistry : public ObjectStoreRegistry {
public:
    DefaultObjectStoreRegistry() = default;

    ObjectStoreRef register_store(const Url& url, ObjectStoreRef store) override;
    ObjectStoreRef get_store(const Url& url) const override;
    const StoreMap& all_stores() const override { return stores_; }

    // "DefaultObjectStoreRegistry { urls: [...] }"
    std::string to_string() const;

private:
    StoreMap stores_;
};

// Process-wide registry for top-level entry points
DefaultObjectStoreRegistry& object_stores();

} // namespace deltastore
