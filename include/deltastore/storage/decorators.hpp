#pragma once

#include "deltastore/storage/backend.hpp"
#include "deltastore/storage/options.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace deltastore {

// Scopes an inner store to a sub-tree. Every path argument is prefixed and the
// prefix is stripped from every returned location.
class PrefixStore : public ObjectStore {
public:
    PrefixStore(ObjectStoreRef inner, Path prefix);

    using ObjectStore::list;

    std::string to_string() const override;

    PutResult put_opts(const Path& location,
                       std::span<const uint8_t> payload,
                       const PutOptions& options) override;
    GetResult get_opts(const Path& location, const GetOptions& options) override;
    GetResult get_range(const Path& location, ByteRange range) override;
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

    const Path& prefix() const { return prefix_; }
    const ObjectStoreRef& inner() const { return inner_; }

private:
    ObjectStoreRef inner_;
    Path prefix_;

    Path full_path(const Path& location) const { return prefix_.join(location); }
    Path strip(const Path& location) const;
    ObjectMeta strip(ObjectMeta meta) const;
};

// Counting semaphore that admits waiters strictly in arrival order
class FifoSemaphore {
public:
    explicit FifoSemaphore(size_t permits) : permits_(permits) {}

    FifoSemaphore(const FifoSemaphore&) = delete;
    FifoSemaphore& operator=(const FifoSemaphore&) = delete;

    void acquire();
    void release();

    size_t permits() const { return permits_; }
    size_t in_flight() const;

    // RAII permit
    class Permit {
    public:
        explicit Permit(FifoSemaphore& semaphore) : semaphore_(semaphore) { semaphore_.acquire(); }
        ~Permit() { semaphore_.release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        FifoSemaphore& semaphore_;
    };

private:
    const size_t permits_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_flight_ = 0;
    uint64_t next_ticket_ = 0;
    uint64_t serving_ = 0;
};

// Bounds the number of concurrently in-flight operations on an inner store.
// Callers beyond the limit block until a permit frees up.
class LimitStore : public ObjectStore {
public:
    LimitStore(ObjectStoreRef inner, size_t max_requests);

    using ObjectStore::list;

    std::string to_string() const override;

    PutResult put_opts(const Path& location,
                       std::span<const uint8_t> payload,
                       const PutOptions& options) override;
    GetResult get_opts(const Path& location, const GetOptions& options) override;
    GetResult get_range(const Path& location, ByteRange range) override;
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

    size_t limit() const { return semaphore_->permits(); }
    size_t in_flight() const { return semaphore_->in_flight(); }
    const ObjectStoreRef& inner() const { return inner_; }

private:
    ObjectStoreRef inner_;
    std::shared_ptr<FifoSemaphore> semaphore_;
};

// Wraps store in a PrefixStore unless prefix is the root
ObjectStoreRef url_prefix_handler(ObjectStoreRef store, const Path& prefix);

// Wraps store in a LimitStore when OBJECT_STORE_CONCURRENCY_LIMIT holds a
// positive integer; otherwise returns store unchanged
ObjectStoreRef limit_store_handler(ObjectStoreRef store, const StorageOptions& options);

} // namespace deltastore
