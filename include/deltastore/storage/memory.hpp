#pragma once

#include "deltastore/storage/backend.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace deltastore {

// In-process, ephemeral object store. Contents live as long as the store.
class InMemoryStore : public ObjectStore {
public:
    InMemoryStore();

    using ObjectStore::list;

    std::string to_string() const override { return "InMemory"; }

    PutResult put_opts(const Path& location,
                       std::span<const uint8_t> payload,
                       const PutOptions& options) override;
    GetResult get_opts(const Path& location, const GetOptions& options) override;
    HeadResult head(const Path& location) override;
    Status remove(const Path& location) override;
    ListResult list(const ListOptions& options) override;
    ListWithDelimiterResult list_with_delimiter(const std::optional<Path>& prefix) override;
    Status copy(const Path& from, const Path& to) override;
    Status copy_if_not_exists(const Path& from, const Path& to) override;
    Status rename(const Path& from, const Path& to) override;
    Status rename_if_not_exists(const Path& from, const Path& to) override;
    MultipartResult put_multipart_opts(const Path& location,
                                       const PutMultipartOptions& options) override;

    size_t object_count() const;

    // Shared with in-flight multipart uploads so they can outlive a call
    struct Storage;

private:
    std::shared_ptr<Storage> storage_;
};

} // namespace deltastore
