#pragma once

#include "deltastore/storage/backend.hpp"

#include <meridian/core/thread_pool.hpp>

#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace deltastore {

// Configuration of an isolated IO execution context
struct RuntimeConfig {
    bool multi_threaded = true;
    size_t worker_threads = 0;               // 0: one per hardware thread
    std::optional<std::string> thread_name;  // default "IO-runtime"
    bool enable_io = true;
    bool enable_time = true;

    bool operator==(const RuntimeConfig& other) const = default;

    size_t effective_worker_threads() const;
    std::string effective_thread_name() const;
};

// A dedicated worker pool that backend operations can be moved onto, so their
// blocking I/O never runs on the caller's threads.
class IoRuntime {
public:
    explicit IoRuntime(const RuntimeConfig& config = RuntimeConfig{});
    ~IoRuntime();

    IoRuntime(const IoRuntime&) = delete;
    IoRuntime& operator=(const IoRuntime&) = delete;

    // Queue fn on a worker. If the runtime is shut down, or shuts down before
    // fn starts, the returned future holds std::future_errc::broken_promise.
    // Exceptions thrown by fn are stored in the future.
    template <typename F>
    auto spawn(F fn) -> std::future<std::invoke_result_t<F&>>;

    // Stop accepting work and drop queued units; in-flight units finish.
    // Must not be called from one of this runtime's workers.
    void shutdown();
    bool is_shut_down() const { return pool_->is_stopping(); }

    // True when the calling thread is one of this runtime's workers
    bool on_worker_thread() const;

    size_t worker_count() const { return pool_->size(); }
    size_t pending() const { return pool_->pending(); }
    const std::string& thread_name() const { return thread_name_; }
    const RuntimeConfig& config() const { return config_; }

private:
    // Marks the current thread as running a unit of this runtime
    class WorkerScope {
    public:
        explicit WorkerScope(const IoRuntime& runtime);
        ~WorkerScope();

    private:
        const IoRuntime* previous_;
    };

    RuntimeConfig config_;
    std::string thread_name_;
    std::unique_ptr<meridian::ThreadPool> pool_;
};

using RuntimeHandle = std::shared_ptr<IoRuntime>;

// Process-wide default runtime, created on first request and never torn down.
// A later request with a different configuration receives the existing runtime
// and a warning is logged. Build an IoRuntime directly for an independent context.
RuntimeHandle shared_io_runtime(const RuntimeConfig* config = nullptr);

// An explicit runtime handle, or a configuration for the shared default runtime
class IORuntime {
public:
    IORuntime() = default;
    explicit IORuntime(RuntimeHandle handle) : source_(std::move(handle)) {}
    explicit IORuntime(RuntimeConfig config) : source_(std::move(config)) {}

    RuntimeHandle get_handle() const;

private:
    std::variant<RuntimeHandle, RuntimeConfig> source_;
};

// Redirects the operations of an inner store onto an IoRuntime.
// Listing runs directly on the caller's thread. A unit of work dropped before
// it ran is reported as a JoinError; an exception thrown by the inner store
// is rethrown in the caller.
class DeltaIOStorageBackend : public ObjectStore {
public:
    DeltaIOStorageBackend(ObjectStoreRef inner, RuntimeHandle runtime);

    using ObjectStore::list;

    std::string to_string() const override { return "DeltaIOStorageBackend"; }

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

    // Run op(store, path) on the runtime and wait for it
    template <typename F>
    auto spawn_io_rt(const char* op_name, F op, const Path& path)
        -> std::invoke_result_t<F&, ObjectStore&, const Path&>;

    // Run op(store, from, to) on the runtime and wait for it
    template <typename F>
    auto spawn_io_rt_from_to(const char* op_name, F op, const Path& from, const Path& to)
        -> std::invoke_result_t<F&, ObjectStore&, const Path&, const Path&>;

    const ObjectStoreRef& inner() const { return inner_; }
    const RuntimeHandle& runtime() const { return runtime_; }

private:
    ObjectStoreRef inner_;
    RuntimeHandle runtime_;

    template <typename Result>
    Result join(std::future<Result>& future, const char* op_name, const std::string& target) const;
};

// Wrap store so its I/O runs on runtime
ObjectStoreRef isolate_io(ObjectStoreRef store, const IORuntime& runtime = IORuntime{});

// ----------------------------------------------------------------------------

template <typename F>
auto IoRuntime::spawn(F fn) -> std::future<std::invoke_result_t<F&>> {
    using Result = std::invoke_result_t<F&>;
    try {
        return pool_->submit([this, fn = std::move(fn)]() mutable -> Result {
            WorkerScope scope(*this);
            return fn();
        });
    } catch (const std::runtime_error&) {
        // Pool is stopping: the promise is abandoned unset
        std::promise<Result> abandoned;
        return abandoned.get_future();
    }
}

template <typename Result>
Result DeltaIOStorageBackend::join(std::future<Result>& future,
                                   const char* op_name,
                                   const std::string& target) const {
    try {
        return future.get();
    } catch (const std::future_error& e) {
        if (e.code() != std::future_errc::broken_promise) throw;
        return failure<Result>(ErrorKind::JoinError,
            std::string("IO task ") + op_name + " " + target + " on runtime " +
            runtime_->thread_name() + " did not complete: " + e.what());
    }
}

template <typename F>
auto DeltaIOStorageBackend::spawn_io_rt(const char* op_name, F op, const Path& path)
    -> std::invoke_result_t<F&, ObjectStore&, const Path&> {
    ObjectStoreRef store = inner_;
    if (runtime_->on_worker_thread()) {
        return op(*store, path);
    }
    auto future = runtime_->spawn([store, path, op = std::move(op)]() mutable {
        return op(*store, path);
    });
    return join(future, op_name, path.as_string());
}

template <typename F>
auto DeltaIOStorageBackend::spawn_io_rt_from_to(const char* op_name, F op,
                                                const Path& from, const Path& to)
    -> std::invoke_result_t<F&, ObjectStore&, const Path&, const Path&> {
    ObjectStoreRef store = inner_;
    if (runtime_->on_worker_thread()) {
        return op(*store, from, to);
    }
    auto future = runtime_->spawn([store, from, to, op = std::move(op)]() mutable {
        return op(*store, from, to);
    });
    return join(future, op_name, from.as_string() + " -> " + to.as_string());
}

} // namespace deltastore
