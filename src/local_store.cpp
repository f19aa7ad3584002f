#include "deltastore/storage/local.hpp"
#include "deltastore/core/log.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace deltastore {

namespace fs = std::filesystem;

// Sharded locks keyed by object location
struct LocalFileSystemStore::LockTable {
    struct Shard {
        mutable std::shared_mutex mutex;
    };
    std::vector<std::unique_ptr<Shard>> shards;

    explicit LockTable(size_t count) {
        shards.resize(std::max<size_t>(count, 1));
        for (auto& shard : shards) {
            shard = std::make_unique<Shard>();
        }
    }

    std::shared_mutex& for_key(const Path& location) const {
        size_t hash = std::hash<std::string>{}(location.as_string());
        return shards[hash % shards.size()]->mutex;
    }
};

namespace {

constexpr char STAGING_MARKER = '#';

std::atomic<uint64_t> staging_counter{0};

fs::path staging_path_for(const fs::path& target) {
    return fs::path(target.string() + STAGING_MARKER +
                    std::to_string(staging_counter.fetch_add(1, std::memory_order_relaxed)));
}

bool is_staging_name(const fs::path& path) {
    return path.filename().string().find(STAGING_MARKER) != std::string::npos;
}

ErrorKind kind_for_errno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::NotFound;
        case EEXIST:
            return ErrorKind::AlreadyExists;
        default:
            return ErrorKind::Generic;
    }
}

ErrorKind kind_for(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return ErrorKind::NotFound;
    }
    if (ec == std::errc::file_exists) return ErrorKind::AlreadyExists;
    return ErrorKind::Generic;
}

// Metadata for a regular file; inode, mtime and size make up the e_tag
std::optional<ObjectMeta> stat_file(const fs::path& file, const Path& location, Status& error) {
    struct stat st {};
    if (::stat(file.c_str(), &st) != 0) {
        int err = errno;
        error = failure(kind_for_errno(err),
            err == ENOENT || err == ENOTDIR
                ? "Object not found: " + location.as_string()
                : "Failed to stat " + file.string() + ": " + std::strerror(err));
        return std::nullopt;
    }
    if (!S_ISREG(st.st_mode)) {
        error = failure(ErrorKind::NotFound, "Object not found: " + location.as_string() +
                                             " is a directory");
        return std::nullopt;
    }

    auto mtime = std::chrono::seconds(st.st_mtim.tv_sec) +
                 std::chrono::nanoseconds(st.st_mtim.tv_nsec);

    ObjectMeta meta;
    meta.location = location;
    meta.last_modified = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(mtime));
    meta.size = static_cast<uint64_t>(st.st_size);

    char etag[64];
    std::snprintf(etag, sizeof(etag), "%llx-%llx-%llx",
                  static_cast<unsigned long long>(st.st_ino),
                  static_cast<unsigned long long>(
                      std::chrono::duration_cast<std::chrono::nanoseconds>(mtime).count()),
                  static_cast<unsigned long long>(st.st_size));
    meta.e_tag = etag;
    return meta;
}

Status write_file(const fs::path& file, std::span<const uint8_t> data) {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        return failure(ErrorKind::Generic, "Failed to create file " + file.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) {
        return failure(ErrorKind::Generic, "Failed to write data to " + file.string());
    }
    return succeeded();
}

void discard_staging(const fs::path& staging) {
    std::error_code ec;
    fs::remove(staging, ec);
    if (ec) {
        log_warn("Failed to remove staging file %s: %s",
                 staging.c_str(), ec.message().c_str());
    }
}

Status create_parent(const fs::path& target) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return failure(ErrorKind::Generic,
            "Failed to create directory " + target.parent_path().string() + ": " + ec.message());
    }
    return succeeded();
}

// Holds two shard locks, taken in a consistent order so copies and renames
// in opposite directions cannot deadlock
class PairLock {
public:
    PairLock(std::shared_mutex& a, std::shared_mutex& b) {
        if (&a == &b) {
            first_ = std::unique_lock(a);
            return;
        }
        bool a_first = std::less<std::shared_mutex*>{}(&a, &b);
        first_ = std::unique_lock(a_first ? a : b);
        second_ = std::unique_lock(a_first ? b : a);
    }

private:
    std::unique_lock<std::shared_mutex> first_;
    std::unique_lock<std::shared_mutex> second_;
};

class LocalUpload : public MultipartUpload {
public:
    LocalUpload(std::shared_ptr<LocalFileSystemStore::LockTable> locks,
                fs::path target,
                Path location)
        : locks_(std::move(locks))
        , target_(std::move(target))
        , staging_(staging_path_for(target_))
        , location_(std::move(location))
        , out_(staging_, std::ios::binary | std::ios::trunc) {}

    ~LocalUpload() override {
        if (!finished_) {
            out_.close();
            discard_staging(staging_);
        }
    }

    bool is_open() const { return out_.is_open(); }

    Status put_part(std::span<const uint8_t> data) override {
        if (finished_) {
            return failure(ErrorKind::Generic,
                "Multipart upload to " + location_.as_string() + " already finished");
        }
        out_.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!out_) {
            return failure(ErrorKind::Generic, "Failed to write part to " + staging_.string());
        }
        return succeeded();
    }

    PutResult complete() override {
        if (finished_) {
            return failure<PutResult>(ErrorKind::Generic,
                "Multipart upload to " + location_.as_string() + " already finished");
        }
        finished_ = true;
        out_.close();
        if (out_.fail()) {
            discard_staging(staging_);
            return failure<PutResult>(ErrorKind::Generic,
                "Failed to flush " + staging_.string());
        }

        std::unique_lock lock(locks_->for_key(location_));
        std::error_code ec;
        fs::rename(staging_, target_, ec);
        if (ec) {
            discard_staging(staging_);
            return failure<PutResult>(kind_for(ec),
                "Failed to rename " + staging_.string() + ": " + ec.message());
        }

        Status error;
        auto meta = stat_file(target_, location_, error);
        if (!meta) return forward_failure<PutResult>(error);

        PutResult result;
        result.success = true;
        result.e_tag = meta->e_tag;
        return result;
    }

    Status abort() override {
        if (finished_) return succeeded();
        finished_ = true;
        out_.close();
        std::error_code ec;
        fs::remove(staging_, ec);
        if (ec) {
            return failure(ErrorKind::Generic,
                "Failed to remove " + staging_.string() + ": " + ec.message());
        }
        return succeeded();
    }

private:
    std::shared_ptr<LocalFileSystemStore::LockTable> locks_;
    fs::path target_;
    fs::path staging_;
    Path location_;
    std::ofstream out_;
    bool finished_ = false;
};

}  // namespace

LocalFileSystemStore::LocalFileSystemStore(const fs::path& root, size_t shard_count)
    : root_(fs::absolute(root).lexically_normal())
    , locks_(std::make_shared<LockTable>(shard_count)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StorageError(ErrorKind::Generic,
            "Failed to create store root " + root_.string() + ": " + ec.message());
    }
    log_debug("LocalFileSystemStore initialized at %s with %zu shards",
              root_.c_str(), locks_->shards.size());
}

std::string LocalFileSystemStore::to_string() const {
    return "LocalFileSystem(file://" + root_.generic_string() + ")";
}

Status LocalFileSystemStore::check_key(const Path& location) const {
    try {
        Path::parse(location.as_string());
    } catch (const StorageError& e) {
        return failure(ErrorKind::InvalidPath, e.what());
    }
    for (const auto& part : location.parts()) {
        if (part.find(STAGING_MARKER) != std::string::npos) {
            return failure(ErrorKind::InvalidPath,
                "Path \"" + location.as_string() + "\" contains reserved character '#'");
        }
    }
    return succeeded();
}

fs::path LocalFileSystemStore::key_to_path(const Path& location) const {
    if (location.is_root()) return root_;
    return root_ / location.as_string();
}

std::optional<ObjectMeta> LocalFileSystemStore::stat(const Path& location, Status& error) const {
    return stat_file(key_to_path(location), location, error);
}

PutResult LocalFileSystemStore::put_opts(const Path& location,
                                         std::span<const uint8_t> payload,
                                         const PutOptions& options) {
    if (location.is_root()) {
        return failure<PutResult>(ErrorKind::InvalidPath, "Cannot write an object at the root");
    }
    auto status = check_key(location);
    if (!status.success) return forward_failure<PutResult>(status);

    std::unique_lock lock(locks_->for_key(location));
    auto path = key_to_path(location);

    if (options.mode != PutMode::Overwrite) {
        Status missing;
        auto current = stat(location, missing);
        if (options.mode == PutMode::Create && current) {
            return failure<PutResult>(ErrorKind::AlreadyExists,
                "Object already exists at " + location.as_string());
        }
        if (options.mode == PutMode::Update) {
            if (!current) {
                return failure<PutResult>(ErrorKind::Precondition,
                    "Precondition failed for " + location.as_string() + ": " +
                    missing.error_message);
            }
            if (!options.expected_e_tag || *options.expected_e_tag != current->e_tag) {
                return failure<PutResult>(ErrorKind::Precondition,
                    "Precondition failed for " + location.as_string() + ": e_tag \"" +
                    current->e_tag.value_or("") + "\" does not match \"" +
                    options.expected_e_tag.value_or("") + "\"");
            }
        }
    }

    status = create_parent(path);
    if (!status.success) return forward_failure<PutResult>(status);

    // Write to staging file then rename (atomic)
    auto staging = staging_path_for(path);
    status = write_file(staging, payload);
    if (!status.success) {
        discard_staging(staging);
        return forward_failure<PutResult>(status);
    }

    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        discard_staging(staging);
        return failure<PutResult>(ErrorKind::Generic, "Failed to rename file: " + ec.message());
    }

    Status error;
    auto meta = stat(location, error);
    if (!meta) return forward_failure<PutResult>(error);

    PutResult result;
    result.success = true;
    result.e_tag = meta->e_tag;
    return result;
}

GetResult LocalFileSystemStore::get_opts(const Path& location, const GetOptions& options) {
    auto status = check_key(location);
    if (!status.success) return forward_failure<GetResult>(status);

    std::shared_lock lock(locks_->for_key(location));

    Status error;
    auto meta = stat(location, error);
    if (!meta) return forward_failure<GetResult>(error);

    status = check_preconditions(*meta, options);
    if (!status.success) return forward_failure<GetResult>(status);

    std::string range_error;
    auto range = resolve_range(options.range, meta->size, range_error);
    if (!range) {
        return failure<GetResult>(ErrorKind::InvalidRange,
                                  range_error + " for " + location.as_string());
    }

    GetResult result;
    if (!options.head && range->length() > 0) {
        auto path = key_to_path(location);
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return failure<GetResult>(ErrorKind::NotFound,
                                      "Object not found: " + location.as_string());
        }
        file.seekg(static_cast<std::streamoff>(range->start));
        result.data.resize(range->length());
        file.read(reinterpret_cast<char*>(result.data.data()),
                  static_cast<std::streamsize>(range->length()));
        if (!file) {
            return failure<GetResult>(ErrorKind::Generic,
                                      "Failed to read file " + path.string());
        }
    }

    result.success = true;
    result.meta = std::move(*meta);
    result.range = *range;
    return result;
}

HeadResult LocalFileSystemStore::head(const Path& location) {
    auto status = check_key(location);
    if (!status.success) return forward_failure<HeadResult>(status);

    std::shared_lock lock(locks_->for_key(location));
    Status error;
    auto meta = stat(location, error);
    if (!meta) return forward_failure<HeadResult>(error);

    HeadResult result;
    result.success = true;
    result.meta = std::move(*meta);
    return result;
}

Status LocalFileSystemStore::remove(const Path& location) {
    auto status = check_key(location);
    if (!status.success) return status;
    if (location.is_root()) {
        return failure(ErrorKind::InvalidPath, "Cannot delete the store root");
    }

    std::unique_lock lock(locks_->for_key(location));
    auto path = key_to_path(location);

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return failure(ErrorKind::NotFound,
                       "Object not found: " + location.as_string() + " is a directory");
    }
    bool removed = fs::remove(path, ec);
    if (ec) {
        return failure(kind_for(ec), "Failed to delete " + path.string() + ": " + ec.message());
    }
    if (!removed) {
        return failure(ErrorKind::NotFound, "Object not found: " + location.as_string());
    }
    return succeeded();
}

ListResult LocalFileSystemStore::list(const ListOptions& options) {
    const Path prefix = options.prefix.value_or(Path());
    auto status = check_key(prefix);
    if (!status.success) return forward_failure<ListResult>(status);

    ListResult result;
    auto search_path = key_to_path(prefix);

    std::error_code ec;
    auto search_status = fs::status(search_path, ec);
    if (!fs::exists(search_status)) {
        result.success = true;
        return result;
    }

    std::vector<ObjectMeta> found;
    auto add = [&](const fs::path& file) {
        auto rel = file.lexically_relative(root_).generic_string();
        Path location(rel);
        if (options.offset && !(*options.offset < location)) return;
        if (!options.continuation_token.empty() &&
            location.as_string() <= options.continuation_token) {
            return;
        }
        Status error;
        if (auto meta = stat_file(file, location, error)) {
            found.push_back(std::move(*meta));
        }
        // A file deleted mid-scan is simply skipped
    };

    if (fs::is_regular_file(search_status)) {
        if (!is_staging_name(search_path)) add(search_path);
    } else {
        fs::recursive_directory_iterator it(search_path, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            std::error_code entry_ec;
            if (!it->is_regular_file(entry_ec) || is_staging_name(it->path())) continue;
            add(it->path());
        }
        if (ec) {
            return failure<ListResult>(ErrorKind::Generic,
                "Failed to list " + search_path.string() + ": " + ec.message());
        }
    }

    std::sort(found.begin(), found.end(), [](const ObjectMeta& a, const ObjectMeta& b) {
        return a.location < b.location;
    });

    const size_t page_size = list_page_size(options);
    if (found.size() > page_size) {
        found.resize(page_size);
        result.truncated = true;
        result.continuation_token = found.back().location.as_string();
    }

    result.success = true;
    result.objects = std::move(found);
    return result;
}

ListWithDelimiterResult LocalFileSystemStore::list_with_delimiter(const std::optional<Path>& prefix) {
    const Path base = prefix.value_or(Path());
    auto status = check_key(base);
    if (!status.success) return forward_failure<ListWithDelimiterResult>(status);

    ListWithDelimiterResult result;
    result.success = true;

    auto dir = key_to_path(base);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return result;

    fs::directory_iterator it(dir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        if (is_staging_name(it->path())) continue;
        auto name = it->path().filename().string();
        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) {
            result.common_prefixes.push_back(base.child(name));
        } else if (it->is_regular_file(entry_ec)) {
            Status error;
            if (auto meta = stat_file(it->path(), base.child(name), error)) {
                result.objects.push_back(std::move(*meta));
            }
        }
    }
    if (ec) {
        return failure<ListWithDelimiterResult>(ErrorKind::Generic,
            "Failed to list " + dir.string() + ": " + ec.message());
    }

    std::sort(result.objects.begin(), result.objects.end(),
              [](const ObjectMeta& a, const ObjectMeta& b) { return a.location < b.location; });
    std::sort(result.common_prefixes.begin(), result.common_prefixes.end());
    return result;
}

Status LocalFileSystemStore::copy(const Path& from, const Path& to) {
    for (const auto* p : {&from, &to}) {
        auto status = check_key(*p);
        if (!status.success) return status;
    }

    PairLock lock(locks_->for_key(from), locks_->for_key(to));
    auto src_path = key_to_path(from);
    auto dst_path = key_to_path(to);

    Status error;
    if (!stat(from, error)) return error;

    auto status = create_parent(dst_path);
    if (!status.success) return status;

    auto staging = staging_path_for(dst_path);
    std::error_code ec;
    fs::copy_file(src_path, staging, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        discard_staging(staging);
        return failure(kind_for(ec), "Failed to copy " + from.as_string() + ": " + ec.message());
    }
    fs::rename(staging, dst_path, ec);
    if (ec) {
        discard_staging(staging);
        return failure(ErrorKind::Generic, "Failed to rename file: " + ec.message());
    }
    return succeeded();
}

Status LocalFileSystemStore::copy_if_not_exists(const Path& from, const Path& to) {
    for (const auto* p : {&from, &to}) {
        auto status = check_key(*p);
        if (!status.success) return status;
    }

    PairLock lock(locks_->for_key(from), locks_->for_key(to));
    auto dst_path = key_to_path(to);

    Status error;
    if (!stat(from, error)) return error;

    auto status = create_parent(dst_path);
    if (!status.success) return status;

    // A hard link fails atomically when the destination exists
    std::error_code ec;
    fs::create_hard_link(key_to_path(from), dst_path, ec);
    if (ec == std::errc::file_exists) {
        return failure(ErrorKind::AlreadyExists, "Object already exists at " + to.as_string());
    }
    if (ec) {
        return failure(kind_for(ec), "Failed to copy " + from.as_string() + ": " + ec.message());
    }
    return succeeded();
}

Status LocalFileSystemStore::rename(const Path& from, const Path& to) {
    for (const auto* p : {&from, &to}) {
        auto status = check_key(*p);
        if (!status.success) return status;
    }

    PairLock lock(locks_->for_key(from), locks_->for_key(to));
    auto dst_path = key_to_path(to);

    Status error;
    if (!stat(from, error)) return error;

    auto status = create_parent(dst_path);
    if (!status.success) return status;

    std::error_code ec;
    fs::rename(key_to_path(from), dst_path, ec);
    if (ec) {
        return failure(kind_for(ec), "Failed to rename " + from.as_string() + ": " + ec.message());
    }
    return succeeded();
}

Status LocalFileSystemStore::rename_if_not_exists(const Path& from, const Path& to) {
    auto status = copy_if_not_exists(from, to);
    if (!status.success) return status;
    return remove(from);
}

MultipartResult LocalFileSystemStore::put_multipart_opts(const Path& location,
                                                         const PutMultipartOptions& /*options*/) {
    if (location.is_root()) {
        return failure<MultipartResult>(ErrorKind::InvalidPath,
                                        "Cannot write an object at the root");
    }
    auto status = check_key(location);
    if (!status.success) return forward_failure<MultipartResult>(status);

    auto path = key_to_path(location);
    status = create_parent(path);
    if (!status.success) return forward_failure<MultipartResult>(status);

    auto upload = std::make_unique<LocalUpload>(locks_, path, location);
    if (!upload->is_open()) {
        return failure<MultipartResult>(ErrorKind::Generic,
            "Failed to open staging file for " + location.as_string());
    }

    MultipartResult result;
    result.success = true;
    result.upload = std::move(upload);
    return result;
}

} // namespace deltastore
