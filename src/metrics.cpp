#include "deltastore/metrics/store_metrics.hpp"
#include "deltastore/core/log.hpp"
#include "deltastore/storage/decorators.hpp"
#include "deltastore/storage/io_runtime.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace deltastore {

// ============================================================================
// StoreMetrics
// ============================================================================

StoreMetrics::StoreMetrics(const std::map<std::string, std::string>& labels)
    : labels_(labels)
    , registry_(std::make_shared<prometheus::Registry>()) {

    operations_family_ = &prometheus::BuildCounter()
        .Name("deltastore_operations_total")
        .Help("Object store operations by type and outcome")
        .Labels(labels)
        .Register(*registry_);

    duration_family_ = &prometheus::BuildHistogram()
        .Name("deltastore_operation_duration_seconds")
        .Help("Object store operation duration in seconds")
        .Labels(labels)
        .Register(*registry_);

    bytes_written_ = &prometheus::BuildCounter()
        .Name("deltastore_bytes_written_total")
        .Help("Total payload bytes written")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    bytes_read_ = &prometheus::BuildCounter()
        .Name("deltastore_bytes_read_total")
        .Help("Total payload bytes read")
        .Labels(labels)
        .Register(*registry_)
        .Add({});
}

prometheus::Counter& StoreMetrics::operations(const std::string& op, bool success) {
    return operations_family_->Add({{"op", op}, {"result", success ? "success" : "failure"}});
}

prometheus::Histogram& StoreMetrics::duration(const std::string& op) {
    return duration_family_->Add({{"op", op}}, prometheus::Histogram::BucketBoundaries{
        0.0005, 0.001, 0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30});
}

double StoreMetrics::operation_count(const std::string& op, bool success) {
    return operations(op, success).Value();
}

std::string StoreMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

// ============================================================================
// InstrumentedStore
// ============================================================================

InstrumentedStore::InstrumentedStore(ObjectStoreRef inner, std::shared_ptr<StoreMetrics> metrics)
    : inner_(std::move(inner))
    , metrics_(std::move(metrics)) {}

std::string InstrumentedStore::to_string() const {
    return "Instrumented(" + inner_->to_string() + ")";
}

template <typename Result, typename F>
Result InstrumentedStore::record(const char* op, F&& call) {
    Result result = [&] {
        ScopedTimer timer(metrics_->duration(op));
        return call();
    }();
    metrics_->operations(op, result.success).Increment();
    return result;
}

PutResult InstrumentedStore::put_opts(const Path& location,
                                      std::span<const uint8_t> payload,
                                      const PutOptions& options) {
    auto result = record<PutResult>("put", [&] {
        return inner_->put_opts(location, payload, options);
    });
    if (result.success) metrics_->bytes_written().Increment(static_cast<double>(payload.size()));
    return result;
}

GetResult InstrumentedStore::get_opts(const Path& location, const GetOptions& options) {
    auto result = record<GetResult>("get", [&] { return inner_->get_opts(location, options); });
    if (result.success) metrics_->bytes_read().Increment(static_cast<double>(result.data.size()));
    return result;
}

GetResult InstrumentedStore::get_range(const Path& location, ByteRange range) {
    auto result = record<GetResult>("get_range", [&] {
        return inner_->get_range(location, range);
    });
    if (result.success) metrics_->bytes_read().Increment(static_cast<double>(result.data.size()));
    return result;
}

HeadResult InstrumentedStore::head(const Path& location) {
    return record<HeadResult>("head", [&] { return inner_->head(location); });
}

Status InstrumentedStore::remove(const Path& location) {
    return record<Status>("delete", [&] { return inner_->remove(location); });
}

ListResult InstrumentedStore::list(const ListOptions& options) {
    return record<ListResult>("list", [&] { return inner_->list(options); });
}

ListWithDelimiterResult InstrumentedStore::list_with_delimiter(const std::optional<Path>& prefix) {
    return record<ListWithDelimiterResult>("list_with_delimiter", [&] {
        return inner_->list_with_delimiter(prefix);
    });
}

Status InstrumentedStore::copy(const Path& from, const Path& to) {
    return record<Status>("copy", [&] { return inner_->copy(from, to); });
}

Status InstrumentedStore::copy_if_not_exists(const Path& from, const Path& to) {
    return record<Status>("copy_if_not_exists", [&] {
        return inner_->copy_if_not_exists(from, to);
    });
}

Status InstrumentedStore::rename(const Path& from, const Path& to) {
    return record<Status>("rename", [&] { return inner_->rename(from, to); });
}

Status InstrumentedStore::rename_if_not_exists(const Path& from, const Path& to) {
    return record<Status>("rename_if_not_exists", [&] {
        return inner_->rename_if_not_exists(from, to);
    });
}

MultipartResult InstrumentedStore::put_multipart_opts(const Path& location,
                                                      const PutMultipartOptions& options) {
    return record<MultipartResult>("put_multipart", [&] {
        return inner_->put_multipart_opts(location, options);
    });
}

// ============================================================================
// MetricsExporter
// ============================================================================

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 std::shared_ptr<StoreMetrics> metrics)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , metrics_(std::move(metrics)) {

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(metrics_->labels())
            .Register(*metrics_->registry())
            .Add({});
    };

    runtime_workers_ = &gauge_reg("deltastore_io_runtime_workers", "IO runtime worker threads");
    runtime_pending_ = &gauge_reg("deltastore_io_runtime_pending", "Queued IO runtime units");
    limit_permits_ = &gauge_reg("deltastore_limit_permits", "Concurrency limit of the store");
    limit_in_flight_ = &gauge_reg("deltastore_limit_in_flight", "Operations holding a permit");
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    write_now();
}

bool MetricsExporter::write_now() {
    update_gauges();
    return write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_now();
    }
}

void MetricsExporter::update_gauges() {
    if (runtime_) {
        runtime_workers_->Set(static_cast<double>(runtime_->worker_count()));
        runtime_pending_->Set(static_cast<double>(runtime_->pending()));
    }
    if (limit_) {
        limit_permits_->Set(static_cast<double>(limit_->limit()));
        limit_in_flight_->Set(static_cast<double>(limit_->in_flight()));
    }
}

bool MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot open metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << metrics_->serialize();
    ofs.close();
    if (!ofs.good()) {
        log_warn("Failed writing metrics file %s", tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Failed to rename %s: %s", tmp_path.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

} // namespace deltastore
