#pragma once

#include "deltastore/storage/backend.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace deltastore {

class IoRuntime;
class LimitStore;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Object store operation metrics.
///
/// Owns a prometheus::Registry with per-operation counters (labels op, result),
/// per-operation duration histograms and byte counters.
class StoreMetrics {
public:
    explicit StoreMetrics(const std::map<std::string, std::string>& labels = {});

    StoreMetrics(const StoreMetrics&) = delete;
    StoreMetrics& operator=(const StoreMetrics&) = delete;

    prometheus::Counter& operations(const std::string& op, bool success);
    prometheus::Histogram& duration(const std::string& op);
    prometheus::Counter& bytes_written() { return *bytes_written_; }
    prometheus::Counter& bytes_read() { return *bytes_read_; }

    // Convenience for tests and the tool's summary line
    double operation_count(const std::string& op, bool success);

    const std::shared_ptr<prometheus::Registry>& registry() const { return registry_; }
    const std::map<std::string, std::string>& labels() const { return labels_; }

    // Prometheus text exposition of the whole registry
    std::string serialize() const;

private:
    std::map<std::string, std::string> labels_;
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* operations_family_;
    prometheus::Family<prometheus::Histogram>* duration_family_;
    prometheus::Counter* bytes_written_;
    prometheus::Counter* bytes_read_;
};

/// Decorator that records every operation it forwards to the inner store.
class InstrumentedStore : public ObjectStore {
public:
    InstrumentedStore(ObjectStoreRef inner, std::shared_ptr<StoreMetrics> metrics);

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

    const std::shared_ptr<StoreMetrics>& metrics() const { return metrics_; }

private:
    ObjectStoreRef inner_;
    std::shared_ptr<StoreMetrics> metrics_;

    template <typename Result, typename F>
    Result record(const char* op, F&& call);
};

/// Exports store metrics to a Prometheus textfile for node_exporter pickup.
///
/// A background writer thread periodically serializes the registry to a .prom
/// file using atomic temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param metrics         Metrics whose registry is exported.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    std::shared_ptr<StoreMetrics> metrics);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Set pointers for gauge snapshots (not owned).
    void set_runtime(const IoRuntime* runtime) { runtime_ = runtime; }
    void set_limit_store(const LimitStore* limit) { limit_ = limit; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Snapshot gauges and write the file now. Returns false on I/O failure.
    bool write_now();

private:
    void writer_loop();
    void update_gauges();
    bool write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;
    std::shared_ptr<StoreMetrics> metrics_;

    const IoRuntime* runtime_ = nullptr;
    const LimitStore* limit_ = nullptr;

    prometheus::Gauge* runtime_workers_;
    prometheus::Gauge* runtime_pending_;
    prometheus::Gauge* limit_permits_;
    prometheus::Gauge* limit_in_flight_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

} // namespace deltastore
