#include "deltastore/storage/factory.hpp"
#include "deltastore/core/log.hpp"
#include "deltastore/storage/decorators.hpp"
#include "deltastore/storage/local.hpp"
#include "deltastore/storage/memory.hpp"

#include <algorithm>

namespace deltastore {

namespace {

[[noreturn]] void invalid_location(const Url& url, const std::string& reason) {
    throw StorageError(ErrorKind::InvalidLocation,
        "Invalid table location: " + url.to_string() + ": " + reason);
}

}  // namespace

std::pair<ObjectStoreRef, Path> DefaultObjectStoreFactory::parse_url_opts(
    const Url& url, const StorageOptions& options) const {
    if (url.scheme == "memory") {
        Path path;
        try {
            path = Path::from_url_path(url.path);
        } catch (const StorageError& e) {
            invalid_location(url, e.what());
        }
        ObjectStoreRef inner = std::make_shared<InMemoryStore>();
        auto store = limit_store_handler(url_prefix_handler(inner, path), options);
        return {store, path};
    }

    if (url.scheme == "file") {
        auto root = url.to_file_path();
        ObjectStoreRef inner;
        try {
            inner = std::make_shared<LocalFileSystemStore>(root);
        } catch (const StorageError& e) {
            invalid_location(url, e.what());
        }
        return {limit_store_handler(inner, options), Path("/")};
    }

    invalid_location(url, "unsupported scheme \"" + url.scheme + "\"");
}

ObjectStoreFactoryRef FactoryRegistry::register_factory(std::string_view scheme,
                                                        ObjectStoreFactoryRef factory) {
    auto key = scheme_key(scheme);
    if (!factory) {
        throw StorageError(ErrorKind::Generic,
            "Cannot register a null object store factory for " + key);
    }
    auto previous = factories_.insert_or_assign(key, std::move(factory));
    if (previous) {
        log_info("Replaced object store factory for %s", key.c_str());
        return *previous;
    }
    log_debug("Registered object store factory for %s", key.c_str());
    return nullptr;
}

ObjectStoreFactoryRef FactoryRegistry::get_factory(std::string_view scheme) const {
    return factories_.find(scheme_key(scheme)).value_or(nullptr);
}

bool FactoryRegistry::contains(std::string_view scheme) const {
    return factories_.contains(scheme_key(scheme));
}

std::vector<std::string> FactoryRegistry::schemes() const {
    auto keys = factories_.keys();
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::pair<ObjectStoreRef, Path> FactoryRegistry::parse_url_opts(const Url& url,
                                                                const StorageOptions& options) const {
    auto factory = get_factory(url.scheme);
    if (!factory) {
        throw StorageError(ErrorKind::InvalidLocation,
            "Invalid table location: " + url.to_string() +
            ": no object store factory registered for " + url.scheme_key());
    }
    auto resolved = factory->parse_url_opts(url, options);
    log_debug("Resolved %s to %s (root \"%s\")", url.to_string().c_str(),
              resolved.first->to_string().c_str(), resolved.second.as_string().c_str());
    return resolved;
}

ObjectStoreRef FactoryRegistry::store_for(const Url& url, const StorageOptions& options) const {
    return parse_url_opts(url, options).first;
}

void FactoryRegistry::register_defaults() {
    auto factory = std::make_shared<DefaultObjectStoreFactory>();
    register_factory("memory", factory);
    register_factory("file", factory);
}

FactoryRegistry& factories() {
    // Never destroyed: stores resolved at exit may still reference factories
    static FactoryRegistry* registry = [] {
        auto* r = new FactoryRegistry();
        r->register_defaults();
        return r;
    }();
    return *registry;
}

ObjectStoreRef store_for(const Url& url, const StorageOptions& options) {
    return factories().store_for(url, options);
}

} // namespace deltastore
