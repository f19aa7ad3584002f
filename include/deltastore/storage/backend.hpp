#pragma once

#include "deltastore/core/constants.hpp"
#include "deltastore/core/errors.hpp"
#include "deltastore/storage/path.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace deltastore {

using Bytes = std::vector<uint8_t>;

// Outcome shared by every operation result
struct Status {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    explicit operator bool() const { return success; }
};

// Metadata about a stored object
struct ObjectMeta {
    Path location;
    std::chrono::system_clock::time_point last_modified;
    uint64_t size = 0;
    std::optional<std::string> e_tag;
    std::optional<std::string> version;
};

// Half-open byte range [start, end)
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const { return end > start ? end - start : 0; }
    bool operator==(const ByteRange& other) const = default;
};

// Result of a put operation
struct PutResult : Status {
    std::optional<std::string> e_tag;
    std::optional<std::string> version;
};

// Result of a get operation
struct GetResult : Status {
    Bytes data;
    ObjectMeta meta;
    ByteRange range;
};

// Result of a head operation
struct HeadResult : Status {
    ObjectMeta meta;
};

// One page of a listing
struct ListResult : Status {
    std::vector<ObjectMeta> objects;
    bool truncated = false;
    std::string continuation_token;  // pass back in ListOptions to fetch the next page
};

// Result of a delimited (single level) listing
struct ListWithDelimiterResult : Status {
    std::vector<ObjectMeta> objects;
    std::vector<Path> common_prefixes;
};

enum class PutMode {
    Overwrite,  // replace whatever is there
    Create,     // fail with AlreadyExists if the location is taken
    Update      // fail with Precondition unless the stored e_tag matches
};

// Options for put operations
struct PutOptions {
    PutMode mode = PutMode::Overwrite;
    std::optional<std::string> expected_e_tag;  // required for PutMode::Update
    std::string content_type = "application/octet-stream";
    std::map<std::string, std::string> attributes;
};

// Options for get operations
struct GetOptions {
    std::optional<ByteRange> range;
    std::optional<std::string> if_match;
    std::optional<std::string> if_none_match;
    std::optional<std::chrono::system_clock::time_point> if_modified_since;
    std::optional<std::chrono::system_clock::time_point> if_unmodified_since;
    bool head = false;  // metadata only, no payload
};

// Options for list operations
struct ListOptions {
    std::optional<Path> prefix;
    std::optional<Path> offset;  // only locations strictly greater than this
    size_t max_keys = constants::DEFAULT_LIST_PAGE_SIZE;
    std::string continuation_token;
};

// Options for multipart uploads
struct PutMultipartOptions {
    std::string content_type = "application/octet-stream";
    std::map<std::string, std::string> attributes;
};

// A stateful multipart upload session. Parts are appended in call order;
// nothing is visible at the target location until complete() succeeds.
class MultipartUpload {
public:
    virtual ~MultipartUpload() = default;

    virtual Status put_part(std::span<const uint8_t> data) = 0;
    virtual PutResult complete() = 0;
    virtual Status abort() = 0;
};

struct MultipartResult : Status {
    std::unique_ptr<MultipartUpload> upload;
};

// Abstract interface for object store backends.
// Concrete stores (in-memory, local filesystem, cloud providers) and decorators
// (prefix, concurrency limit, IO runtime isolation, instrumentation) all
// implement this same contract. Environmental failures are reported in the
// returned Status; exceptions escaping an operation indicate a defect.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Displayed identity, e.g. "InMemory" or "LimitStore(8, InMemory)"
    virtual std::string to_string() const = 0;

    PutResult put(const Path& location, std::span<const uint8_t> payload) {
        return put_opts(location, payload, PutOptions{});
    }

    virtual PutResult put_opts(const Path& location,
                               std::span<const uint8_t> payload,
                               const PutOptions& options) = 0;

    GetResult get(const Path& location) {
        return get_opts(location, GetOptions{});
    }

    virtual GetResult get_opts(const Path& location, const GetOptions& options) = 0;

    virtual GetResult get_range(const Path& location, ByteRange range) {
        GetOptions options;
        options.range = range;
        return get_opts(location, options);
    }

    virtual HeadResult head(const Path& location) = 0;

    // Delete an object
    virtual Status remove(const Path& location) = 0;

    // One page of objects under options.prefix, sorted by location
    virtual ListResult list(const ListOptions& options) = 0;

    ListResult list(const std::optional<Path>& prefix = std::nullopt) {
        ListOptions options;
        options.prefix = prefix;
        return list(options);
    }

    ListResult list_with_offset(const std::optional<Path>& prefix, const Path& offset) {
        ListOptions options;
        options.prefix = prefix;
        options.offset = offset;
        return list(options);
    }

    virtual ListWithDelimiterResult list_with_delimiter(const std::optional<Path>& prefix) = 0;

    // Copy, overwriting the destination
    virtual Status copy(const Path& from, const Path& to) = 0;

    virtual Status copy_if_not_exists(const Path& from, const Path& to) = 0;

    // Move, overwriting the destination
    virtual Status rename(const Path& from, const Path& to) {
        auto status = copy(from, to);
        if (!status.success) return status;
        return remove(from);
    }

    virtual Status rename_if_not_exists(const Path& from, const Path& to) {
        auto status = copy_if_not_exists(from, to);
        if (!status.success) return status;
        return remove(from);
    }

    MultipartResult put_multipart(const Path& location) {
        return put_multipart_opts(location, PutMultipartOptions{});
    }

    virtual MultipartResult put_multipart_opts(const Path& location,
                                               const PutMultipartOptions& options) = 0;
};

// Sharable reference to an ObjectStore
using ObjectStoreRef = std::shared_ptr<ObjectStore>;

// Build a failed result of any Status-derived type
template <typename Result = Status>
Result failure(ErrorKind kind, std::string message) {
    Result result;
    result.success = false;
    result.error = kind;
    result.error_message = std::move(message);
    return result;
}

template <typename Result = Status>
Result succeeded() {
    Result result;
    result.success = true;
    return result;
}

// Copy the failure of one result into another result type
template <typename Result>
Result forward_failure(const Status& status) {
    return failure<Result>(status.error, status.error_message);
}

// Effective page size of a listing; max_keys of 0 means the default page
size_t list_page_size(const ListOptions& options);

// Drain every page of a listing
ListResult list_all(ObjectStore& store,
                    const std::optional<Path>& prefix = std::nullopt,
                    const std::optional<Path>& offset = std::nullopt);

// Apply GetOptions preconditions to an object's metadata.
// Returns a success Status when the read may proceed.
Status check_preconditions(const ObjectMeta& meta, const GetOptions& options);

// Clamp a requested range to an object of the given size
std::optional<ByteRange> resolve_range(const std::optional<ByteRange>& requested,
                                       uint64_t size,
                                       std::string& error_message);

} // namespace deltastore
