#include "deltastore/storage/decorators.hpp"
#include "deltastore/core/log.hpp"

#include <charconv>

namespace deltastore {

// ============================================================================
// PrefixStore
// ============================================================================

PrefixStore::PrefixStore(ObjectStoreRef inner, Path prefix)
    : inner_(std::move(inner))
    , prefix_(std::move(prefix)) {}

std::string PrefixStore::to_string() const {
    return "PrefixObjectStore(" + prefix_.as_string() + ")";
}

Path PrefixStore::strip(const Path& location) const {
    return location.strip_prefix(prefix_).value_or(location);
}

ObjectMeta PrefixStore::strip(ObjectMeta meta) const {
    meta.location = strip(meta.location);
    return meta;
}

PutResult PrefixStore::put_opts(const Path& location,
                                std::span<const uint8_t> payload,
                                const PutOptions& options) {
    return inner_->put_opts(full_path(location), payload, options);
}

GetResult PrefixStore::get_opts(const Path& location, const GetOptions& options) {
    auto result = inner_->get_opts(full_path(location), options);
    result.meta = strip(std::move(result.meta));
    return result;
}

GetResult PrefixStore::get_range(const Path& location, ByteRange range) {
    auto result = inner_->get_range(full_path(location), range);
    result.meta = strip(std::move(result.meta));
    return result;
}

HeadResult PrefixStore::head(const Path& location) {
    auto result = inner_->head(full_path(location));
    result.meta = strip(std::move(result.meta));
    return result;
}

Status PrefixStore::remove(const Path& location) {
    return inner_->remove(full_path(location));
}

ListResult PrefixStore::list(const ListOptions& options) {
    ListOptions scoped = options;
    scoped.prefix = full_path(options.prefix.value_or(Path()));
    if (options.offset) scoped.offset = full_path(*options.offset);
    // Tokens are locations, so they cross the boundary like paths
    if (!options.continuation_token.empty()) {
        scoped.continuation_token = full_path(Path(options.continuation_token)).as_string();
    }

    auto result = inner_->list(scoped);
    for (auto& meta : result.objects) {
        meta = strip(std::move(meta));
    }
    if (!result.continuation_token.empty()) {
        result.continuation_token = strip(Path(result.continuation_token)).as_string();
    }
    return result;
}

ListWithDelimiterResult PrefixStore::list_with_delimiter(const std::optional<Path>& prefix) {
    auto result = inner_->list_with_delimiter(full_path(prefix.value_or(Path())));
    for (auto& meta : result.objects) {
        meta = strip(std::move(meta));
    }
    for (auto& common : result.common_prefixes) {
        common = strip(common);
    }
    return result;
}

Status PrefixStore::copy(const Path& from, const Path& to) {
    return inner_->copy(full_path(from), full_path(to));
}

Status PrefixStore::copy_if_not_exists(const Path& from, const Path& to) {
    return inner_->copy_if_not_exists(full_path(from), full_path(to));
}

Status PrefixStore::rename(const Path& from, const Path& to) {
    return inner_->rename(full_path(from), full_path(to));
}

Status PrefixStore::rename_if_not_exists(const Path& from, const Path& to) {
    return inner_->rename_if_not_exists(full_path(from), full_path(to));
}

MultipartResult PrefixStore::put_multipart_opts(const Path& location,
                                                const PutMultipartOptions& options) {
    return inner_->put_multipart_opts(full_path(location), options);
}

// ============================================================================
// FifoSemaphore
// ============================================================================

void FifoSemaphore::acquire() {
    std::unique_lock lock(mutex_);
    uint64_t ticket = next_ticket_++;
    cv_.wait(lock, [&] { return ticket == serving_ && in_flight_ < permits_; });
    ++serving_;
    ++in_flight_;
    // The next ticket holder may be admissible too
    cv_.notify_all();
}

void FifoSemaphore::release() {
    {
        std::lock_guard lock(mutex_);
        --in_flight_;
    }
    cv_.notify_all();
}

size_t FifoSemaphore::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

// ============================================================================
// LimitStore
// ============================================================================

namespace {

class LimitUpload : public MultipartUpload {
public:
    LimitUpload(std::unique_ptr<MultipartUpload> inner, std::shared_ptr<FifoSemaphore> semaphore)
        : inner_(std::move(inner))
        , semaphore_(std::move(semaphore)) {}

    Status put_part(std::span<const uint8_t> data) override {
        FifoSemaphore::Permit permit(*semaphore_);
        return inner_->put_part(data);
    }

    PutResult complete() override {
        FifoSemaphore::Permit permit(*semaphore_);
        return inner_->complete();
    }

    Status abort() override {
        FifoSemaphore::Permit permit(*semaphore_);
        return inner_->abort();
    }

private:
    std::unique_ptr<MultipartUpload> inner_;
    std::shared_ptr<FifoSemaphore> semaphore_;
};

}  // namespace

LimitStore::LimitStore(ObjectStoreRef inner, size_t max_requests)
    : inner_(std::move(inner))
    , semaphore_(std::make_shared<FifoSemaphore>(max_requests)) {
    if (max_requests == 0) {
        throw StorageError(ErrorKind::Generic, "LimitStore requires at least one permit");
    }
}

std::string LimitStore::to_string() const {
    return "LimitStore(" + std::to_string(limit()) + ", " + inner_->to_string() + ")";
}

PutResult LimitStore::put_opts(const Path& location,
                               std::span<const uint8_t> payload,
                               const PutOptions& options) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->put_opts(location, payload, options);
}

GetResult LimitStore::get_opts(const Path& location, const GetOptions& options) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->get_opts(location, options);
}

GetResult LimitStore::get_range(const Path& location, ByteRange range) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->get_range(location, range);
}

HeadResult LimitStore::head(const Path& location) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->head(location);
}

Status LimitStore::remove(const Path& location) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->remove(location);
}

ListResult LimitStore::list(const ListOptions& options) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->list(options);
}

ListWithDelimiterResult LimitStore::list_with_delimiter(const std::optional<Path>& prefix) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->list_with_delimiter(prefix);
}

Status LimitStore::copy(const Path& from, const Path& to) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->copy(from, to);
}

Status LimitStore::copy_if_not_exists(const Path& from, const Path& to) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->copy_if_not_exists(from, to);
}

Status LimitStore::rename(const Path& from, const Path& to) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->rename(from, to);
}

Status LimitStore::rename_if_not_exists(const Path& from, const Path& to) {
    FifoSemaphore::Permit permit(*semaphore_);
    return inner_->rename_if_not_exists(from, to);
}

MultipartResult LimitStore::put_multipart_opts(const Path& location,
                                               const PutMultipartOptions& options) {
    MultipartResult result;
    {
        FifoSemaphore::Permit permit(*semaphore_);
        result = inner_->put_multipart_opts(location, options);
    }
    if (result.success && result.upload) {
        result.upload = std::make_unique<LimitUpload>(std::move(result.upload), semaphore_);
    }
    return result;
}

// ============================================================================
// Handlers
// ============================================================================

ObjectStoreRef url_prefix_handler(ObjectStoreRef store, const Path& prefix) {
    if (prefix.is_root()) return store;
    return std::make_shared<PrefixStore>(std::move(store), prefix);
}

ObjectStoreRef limit_store_handler(ObjectStoreRef store, const StorageOptions& options) {
    auto value = options.get(constants::OBJECT_STORE_CONCURRENCY_LIMIT);
    if (!value) return store;

    size_t limit = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), limit);
    if (ec != std::errc() || ptr != value->data() + value->size()) {
        log_warn("Ignoring %s=\"%s\": not an unsigned integer",
                 constants::OBJECT_STORE_CONCURRENCY_LIMIT, value->c_str());
        return store;
    }
    if (limit == 0) return store;

    return std::make_shared<LimitStore>(std::move(store), limit);
}

} // namespace deltastore
