#include "deltastore/storage/io_runtime.hpp"
#include "deltastore/core/constants.hpp"
#include "deltastore/core/log.hpp"

#include <pthread.h>

#include <mutex>
#include <thread>

namespace deltastore {

namespace {

thread_local const IoRuntime* current_runtime = nullptr;
thread_local bool thread_named = false;

}  // namespace

// ============================================================================
// RuntimeConfig
// ============================================================================

size_t RuntimeConfig::effective_worker_threads() const {
    if (!multi_threaded) return 1;
    if (worker_threads > 0) return worker_threads;
    size_t hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

std::string RuntimeConfig::effective_thread_name() const {
    return thread_name.value_or(constants::DEFAULT_IO_THREAD_NAME);
}

// ============================================================================
// IoRuntime
// ============================================================================

IoRuntime::WorkerScope::WorkerScope(const IoRuntime& runtime)
    : previous_(current_runtime) {
    current_runtime = &runtime;
    if (!thread_named) {
        // Linux limits thread names to 15 bytes
        auto name = runtime.thread_name_.substr(0, constants::MAX_THREAD_NAME_LENGTH);
        pthread_setname_np(pthread_self(), name.c_str());
        thread_named = true;
    }
}

IoRuntime::WorkerScope::~WorkerScope() {
    current_runtime = previous_;
}

IoRuntime::IoRuntime(const RuntimeConfig& config)
    : config_(config)
    , thread_name_(config.effective_thread_name())
    , pool_(std::make_unique<meridian::ThreadPool>(config.effective_worker_threads())) {
    log_debug("IO runtime \"%s\" started with %zu worker(s) (io=%s, time=%s)",
              thread_name_.c_str(), pool_->size(),
              config_.enable_io ? "on" : "off", config_.enable_time ? "on" : "off");
}

IoRuntime::~IoRuntime() {
    pool_->shutdown(false);
}

void IoRuntime::shutdown() {
    if (on_worker_thread()) {
        throw StorageError(ErrorKind::Generic,
            "IO runtime \"" + thread_name_ + "\" cannot be shut down from its own worker");
    }
    log_debug("IO runtime \"%s\" shutting down, dropping %zu queued unit(s)",
              thread_name_.c_str(), pool_->pending());
    pool_->shutdown(false);
}

bool IoRuntime::on_worker_thread() const {
    return current_runtime == this;
}

// ============================================================================
// Default runtime
// ============================================================================

RuntimeHandle shared_io_runtime(const RuntimeConfig* config) {
    static std::once_flag once;
    // Leaked so workers outlive static destruction
    static RuntimeHandle* runtime = nullptr;

    std::call_once(once, [config] {
        runtime = new RuntimeHandle(
            std::make_shared<IoRuntime>(config ? *config : RuntimeConfig{}));
    });

    if (config && !(*config == (*runtime)->config())) {
        log_warn("Default IO runtime already created as \"%s\" with %zu worker(s); "
                 "ignoring different configuration \"%s\"",
                 (*runtime)->thread_name().c_str(), (*runtime)->worker_count(),
                 config->effective_thread_name().c_str());
    }
    return *runtime;
}

RuntimeHandle IORuntime::get_handle() const {
    if (const auto* handle = std::get_if<RuntimeHandle>(&source_)) {
        if (*handle) return *handle;
        return shared_io_runtime(nullptr);
    }
    return shared_io_runtime(&std::get<RuntimeConfig>(source_));
}

// ============================================================================
// DeltaIOStorageBackend
// ============================================================================

DeltaIOStorageBackend::DeltaIOStorageBackend(ObjectStoreRef inner, RuntimeHandle runtime)
    : inner_(std::move(inner))
    , runtime_(std::move(runtime)) {
    if (!runtime_) {
        throw StorageError(ErrorKind::Generic, "DeltaIOStorageBackend requires an IO runtime");
    }
}

PutResult DeltaIOStorageBackend::put_opts(const Path& location,
                                          std::span<const uint8_t> payload,
                                          const PutOptions& options) {
    return spawn_io_rt("put", [bytes = Bytes(payload.begin(), payload.end()), options](
                                  ObjectStore& store, const Path& path) {
        return store.put_opts(path, bytes, options);
    }, location);
}

GetResult DeltaIOStorageBackend::get_opts(const Path& location, const GetOptions& options) {
    return spawn_io_rt("get", [options](ObjectStore& store, const Path& path) {
        return store.get_opts(path, options);
    }, location);
}

GetResult DeltaIOStorageBackend::get_range(const Path& location, ByteRange range) {
    return spawn_io_rt("get_range", [range](ObjectStore& store, const Path& path) {
        return store.get_range(path, range);
    }, location);
}

HeadResult DeltaIOStorageBackend::head(const Path& location) {
    return spawn_io_rt("head", [](ObjectStore& store, const Path& path) {
        return store.head(path);
    }, location);
}

Status DeltaIOStorageBackend::remove(const Path& location) {
    return spawn_io_rt("delete", [](ObjectStore& store, const Path& path) {
        return store.remove(path);
    }, location);
}

ListResult DeltaIOStorageBackend::list(const ListOptions& options) {
    return inner_->list(options);
}

ListWithDelimiterResult DeltaIOStorageBackend::list_with_delimiter(const std::optional<Path>& prefix) {
    return inner_->list_with_delimiter(prefix);
}

Status DeltaIOStorageBackend::copy(const Path& from, const Path& to) {
    return spawn_io_rt_from_to("copy", [](ObjectStore& store, const Path& src, const Path& dst) {
        return store.copy(src, dst);
    }, from, to);
}

Status DeltaIOStorageBackend::copy_if_not_exists(const Path& from, const Path& to) {
    return spawn_io_rt_from_to("copy_if_not_exists",
        [](ObjectStore& store, const Path& src, const Path& dst) {
            return store.copy_if_not_exists(src, dst);
        }, from, to);
}

Status DeltaIOStorageBackend::rename(const Path& from, const Path& to) {
    return spawn_io_rt_from_to("rename", [](ObjectStore& store, const Path& src, const Path& dst) {
        return store.rename(src, dst);
    }, from, to);
}

Status DeltaIOStorageBackend::rename_if_not_exists(const Path& from, const Path& to) {
    return spawn_io_rt_from_to("rename_if_not_exists",
        [](ObjectStore& store, const Path& src, const Path& dst) {
            return store.rename_if_not_exists(src, dst);
        }, from, to);
}

MultipartResult DeltaIOStorageBackend::put_multipart_opts(const Path& location,
                                                          const PutMultipartOptions& options) {
    return spawn_io_rt("put_multipart", [options](ObjectStore& store, const Path& path) {
        return store.put_multipart_opts(path, options);
    }, location);
}

ObjectStoreRef isolate_io(ObjectStoreRef store, const IORuntime& runtime) {
    return std::make_shared<DeltaIOStorageBackend>(std::move(store), runtime.get_handle());
}

} // namespace deltastore
