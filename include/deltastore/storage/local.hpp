#pragma once

#include "deltastore/core/constants.hpp"
#include "deltastore/storage/backend.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace deltastore {

// Object store rooted at a local directory.
// Writes go to a staging file beside the target and are renamed into place,
// so readers never observe a partially written object. Staging files carry a
// '#' in their name and are never listed.
class LocalFileSystemStore : public ObjectStore {
public:
    // Creates root if it does not exist. Throws StorageError on failure.
    explicit LocalFileSystemStore(const std::filesystem::path& root,
                                  size_t shard_count = constants::DEFAULT_LOCAL_STORE_SHARDS);

    using ObjectStore::list;

    std::string to_string() const override;

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

    const std::filesystem::path& root() const { return root_; }

    // Per-key reader/writer locks, shared with multipart uploads
    struct LockTable;

private:
    std::filesystem::path root_;
    std::shared_ptr<LockTable> locks_;

    Status check_key(const Path& location) const;
    std::filesystem::path key_to_path(const Path& location) const;
    std::optional<ObjectMeta> stat(const Path& location, Status& error) const;
};

} // namespace deltastore
