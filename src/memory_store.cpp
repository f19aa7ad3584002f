#include "deltastore/storage/memory.hpp"

#include <chrono>
#include <mutex>
#include <set>

namespace deltastore {

struct InMemoryStore::Storage {
    struct Entry {
        Bytes data;
        std::chrono::system_clock::time_point last_modified;
        std::string e_tag;
        std::map<std::string, std::string> attributes;
    };

    mutable std::shared_mutex mutex;
    std::map<std::string, Entry> entries;
    uint64_t next_etag = 0;

    ObjectMeta meta_for(const std::string& key, const Entry& entry) const {
        ObjectMeta meta;
        meta.location = Path(key);
        meta.last_modified = entry.last_modified;
        meta.size = entry.data.size();
        meta.e_tag = entry.e_tag;
        return meta;
    }

    // Caller holds the unique lock
    PutResult insert_locked(const Path& location,
                            Bytes data,
                            const PutOptions& options) {
        const auto& key = location.as_string();
        auto it = entries.find(key);

        if (options.mode == PutMode::Create && it != entries.end()) {
            return failure<PutResult>(ErrorKind::AlreadyExists,
                "Object already exists at " + key);
        }
        if (options.mode == PutMode::Update) {
            if (it == entries.end()) {
                return failure<PutResult>(ErrorKind::Precondition,
                    "Precondition failed for " + key + ": object does not exist");
            }
            if (!options.expected_e_tag || *options.expected_e_tag != it->second.e_tag) {
                return failure<PutResult>(ErrorKind::Precondition,
                    "Precondition failed for " + key + ": e_tag \"" + it->second.e_tag +
                    "\" does not match \"" + options.expected_e_tag.value_or("") + "\"");
            }
        }

        Entry entry;
        entry.data = std::move(data);
        entry.last_modified = std::chrono::system_clock::now();
        entry.e_tag = std::to_string(next_etag++);
        entry.attributes = options.attributes;

        PutResult result;
        result.success = true;
        result.e_tag = entry.e_tag;
        entries[key] = std::move(entry);
        return result;
    }
};

namespace {

class InMemoryUpload : public MultipartUpload {
public:
    InMemoryUpload(std::shared_ptr<InMemoryStore::Storage> storage,
                   Path location,
                   PutMultipartOptions options)
        : storage_(std::move(storage))
        , location_(std::move(location))
        , options_(std::move(options)) {}

    Status put_part(std::span<const uint8_t> data) override {
        if (finished_) {
            return failure(ErrorKind::Generic,
                "Multipart upload to " + location_.as_string() + " already finished");
        }
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return succeeded();
    }

    PutResult complete() override {
        if (finished_) {
            return failure<PutResult>(ErrorKind::Generic,
                "Multipart upload to " + location_.as_string() + " already finished");
        }
        finished_ = true;
        PutOptions put_options;
        put_options.content_type = options_.content_type;
        put_options.attributes = options_.attributes;

        std::unique_lock lock(storage_->mutex);
        return storage_->insert_locked(location_, std::move(buffer_), put_options);
    }

    Status abort() override {
        finished_ = true;
        buffer_.clear();
        return succeeded();
    }

private:
    std::shared_ptr<InMemoryStore::Storage> storage_;
    Path location_;
    PutMultipartOptions options_;
    Bytes buffer_;
    bool finished_ = false;
};

}  // namespace

InMemoryStore::InMemoryStore()
    : storage_(std::make_shared<Storage>()) {}

PutResult InMemoryStore::put_opts(const Path& location,
                                  std::span<const uint8_t> payload,
                                  const PutOptions& options) {
    std::unique_lock lock(storage_->mutex);
    return storage_->insert_locked(location, Bytes(payload.begin(), payload.end()), options);
}

GetResult InMemoryStore::get_opts(const Path& location, const GetOptions& options) {
    std::shared_lock lock(storage_->mutex);
    const auto& key = location.as_string();
    auto it = storage_->entries.find(key);
    if (it == storage_->entries.end()) {
        return failure<GetResult>(ErrorKind::NotFound, "Object not found: " + key);
    }

    auto meta = storage_->meta_for(key, it->second);
    auto status = check_preconditions(meta, options);
    if (!status.success) return forward_failure<GetResult>(status);

    std::string range_error;
    auto range = resolve_range(options.range, meta.size, range_error);
    if (!range) {
        return failure<GetResult>(ErrorKind::InvalidRange, range_error + " for " + key);
    }

    GetResult result;
    result.success = true;
    result.meta = std::move(meta);
    result.range = *range;
    if (!options.head) {
        const auto& data = it->second.data;
        result.data.assign(data.begin() + static_cast<std::ptrdiff_t>(range->start),
                           data.begin() + static_cast<std::ptrdiff_t>(range->end));
    }
    return result;
}

HeadResult InMemoryStore::head(const Path& location) {
    std::shared_lock lock(storage_->mutex);
    const auto& key = location.as_string();
    auto it = storage_->entries.find(key);
    if (it == storage_->entries.end()) {
        return failure<HeadResult>(ErrorKind::NotFound, "Object not found: " + key);
    }
    HeadResult result;
    result.success = true;
    result.meta = storage_->meta_for(key, it->second);
    return result;
}

Status InMemoryStore::remove(const Path& location) {
    std::unique_lock lock(storage_->mutex);
    storage_->entries.erase(location.as_string());
    return succeeded();
}

ListResult InMemoryStore::list(const ListOptions& options) {
    std::shared_lock lock(storage_->mutex);
    ListResult result;
    result.success = true;

    const Path prefix = options.prefix.value_or(Path());
    const size_t page_size = list_page_size(options);
    auto it = storage_->entries.begin();
    if (!options.continuation_token.empty()) {
        it = storage_->entries.upper_bound(options.continuation_token);
    } else if (!prefix.is_root()) {
        it = storage_->entries.lower_bound(prefix.as_string());
    }

    // Every key under prefix sorts before prefix + ('/' + 1)
    const std::string past_prefix = prefix.as_string() + static_cast<char>(DELIMITER + 1);

    for (; it != storage_->entries.end(); ++it) {
        Path location(it->first);
        if (!location.prefix_matches(prefix)) {
            if (!prefix.is_root() && it->first >= past_prefix) break;
            continue;
        }
        if (options.offset && !(*options.offset < location)) continue;

        if (result.objects.size() >= page_size) {
            result.truncated = true;
            result.continuation_token = result.objects.back().location.as_string();
            break;
        }
        result.objects.push_back(storage_->meta_for(it->first, it->second));
    }
    return result;
}

ListWithDelimiterResult InMemoryStore::list_with_delimiter(const std::optional<Path>& prefix) {
    std::shared_lock lock(storage_->mutex);
    ListWithDelimiterResult result;
    result.success = true;

    const Path base = prefix.value_or(Path());
    std::set<std::string> common;

    for (const auto& [key, entry] : storage_->entries) {
        Path location(key);
        auto rest = location.strip_prefix(base);
        if (!rest || rest->is_root()) continue;

        const auto& tail = rest->as_string();
        auto slash = tail.find(DELIMITER);
        if (slash == std::string::npos) {
            result.objects.push_back(storage_->meta_for(key, entry));
        } else {
            common.insert(base.child(tail.substr(0, slash)).as_string());
        }
    }

    for (const auto& p : common) {
        result.common_prefixes.emplace_back(p);
    }
    return result;
}

Status InMemoryStore::copy(const Path& from, const Path& to) {
    std::unique_lock lock(storage_->mutex);
    auto it = storage_->entries.find(from.as_string());
    if (it == storage_->entries.end()) {
        return failure(ErrorKind::NotFound, "Object not found: " + from.as_string());
    }
    PutOptions options;
    options.attributes = it->second.attributes;
    auto put = storage_->insert_locked(to, it->second.data, options);
    if (!put.success) return forward_failure<Status>(put);
    return succeeded();
}

Status InMemoryStore::copy_if_not_exists(const Path& from, const Path& to) {
    std::unique_lock lock(storage_->mutex);
    auto it = storage_->entries.find(from.as_string());
    if (it == storage_->entries.end()) {
        return failure(ErrorKind::NotFound, "Object not found: " + from.as_string());
    }
    PutOptions options;
    options.mode = PutMode::Create;
    options.attributes = it->second.attributes;
    auto put = storage_->insert_locked(to, it->second.data, options);
    if (!put.success) return forward_failure<Status>(put);
    return succeeded();
}

Status InMemoryStore::rename(const Path& from, const Path& to) {
    std::unique_lock lock(storage_->mutex);
    auto node = storage_->entries.extract(from.as_string());
    if (node.empty()) {
        return failure(ErrorKind::NotFound, "Object not found: " + from.as_string());
    }
    storage_->entries.insert_or_assign(to.as_string(), std::move(node.mapped()));
    return succeeded();
}

Status InMemoryStore::rename_if_not_exists(const Path& from, const Path& to) {
    std::unique_lock lock(storage_->mutex);
    if (storage_->entries.count(to.as_string()) != 0) {
        return failure(ErrorKind::AlreadyExists, "Object already exists at " + to.as_string());
    }
    auto node = storage_->entries.extract(from.as_string());
    if (node.empty()) {
        return failure(ErrorKind::NotFound, "Object not found: " + from.as_string());
    }
    storage_->entries.insert_or_assign(to.as_string(), std::move(node.mapped()));
    return succeeded();
}

MultipartResult InMemoryStore::put_multipart_opts(const Path& location,
                                                  const PutMultipartOptions& options) {
    MultipartResult result;
    result.success = true;
    result.upload = std::make_unique<InMemoryUpload>(storage_, location, options);
    return result;
}

size_t InMemoryStore::object_count() const {
    std::shared_lock lock(storage_->mutex);
    return storage_->entries.size();
}

} // namespace deltastore
