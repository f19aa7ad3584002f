#pragma once

#include "deltastore/core/sharded_map.hpp"
#include "deltastore/storage/backend.hpp"
#include "deltastore/storage/options.hpp"
#include "deltastore/storage/url.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace deltastore {

// Builds object stores for the URL schemes it is registered under
class ObjectStoreFactory {
public:
    virtual ~ObjectStoreFactory() = default;

    // Construct a store for url. Returns the store together with the path
    // inside it that the URL designates. Throws StorageError(InvalidLocation)
    // when the URL cannot be served.
    virtual std::pair<ObjectStoreRef, Path> parse_url_opts(const Url& url,
                                                           const StorageOptions& options) const = 0;
};

using ObjectStoreFactoryRef = std::shared_ptr<ObjectStoreFactory>;

// Built-in factory for memory:// and file:// locations.
// Stores are wrapped in PrefixStore (memory, non-root path) and LimitStore
// (when OBJECT_STORE_CONCURRENCY_LIMIT is set).
class DefaultObjectStoreFactory : public ObjectStoreFactory {
public:
    std::pair<ObjectStoreRef, Path> parse_url_opts(const Url& url,
                                                   const StorageOptions& options) const override;
};

// Scheme ("<scheme>://") to factory. Safe for concurrent use.
class FactoryRegistry {
public:
    FactoryRegistry() = default;

    FactoryRegistry(const FactoryRegistry&) = delete;
    FactoryRegistry& operator=(const FactoryRegistry&) = delete;

    // scheme may be "s3", "S3" or "s3://". Returns the replaced factory, or nullptr.
    // Throws StorageError for a null factory.
    ObjectStoreFactoryRef register_factory(std::string_view scheme, ObjectStoreFactoryRef factory);

    ObjectStoreFactoryRef get_factory(std::string_view scheme) const;
    bool contains(std::string_view scheme) const;

    // Registered keys, sorted
    std::vector<std::string> schemes() const;
    size_t size() const { return factories_.size(); }

    // Resolve url through the factory for its scheme; every call constructs a new store.
    // Throws StorageError(InvalidLocation) when no factory is registered.
    std::pair<ObjectStoreRef, Path> parse_url_opts(const Url& url,
                                                   const StorageOptions& options) const;

    ObjectStoreRef store_for(const Url& url, const StorageOptions& options) const;

    // Register DefaultObjectStoreFactory under memory:// and file://
    void register_defaults();

private:
    ShardedMap<std::string, ObjectStoreFactoryRef> factories_;
};

// Process-wide registry, created with the built-in factories on first use
FactoryRegistry& factories();

// Resolve a store for url through factories()
ObjectStoreRef store_for(const Url& url, const StorageOptions& options);

} // namespace deltastore
