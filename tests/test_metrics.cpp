// Tests for store metrics: counters recorded by InstrumentedStore and the
// Prometheus textfile written by MetricsExporter.

#include "deltastore/metrics/store_metrics.hpp"
#include "deltastore/storage/decorators.hpp"
#include "deltastore/storage/io_runtime.hpp"
#include "deltastore/storage/memory.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace deltastore;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

static bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return cond();
}

/// The sample line starting with prefix, or empty.
static std::string sample_line(const std::string& content, const std::string& prefix) {
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind(prefix, 0) == 0) return line;
    }
    return {};
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static Bytes bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

// ---------------------------------------------------------------------------
// InstrumentedStore
// ---------------------------------------------------------------------------

static void test_instrumented_store() {
    std::cout << "\n=== InstrumentedStore ===" << std::endl;

    {
        TEST(counts_success_and_failure);
        auto metrics = std::make_shared<StoreMetrics>();
        InstrumentedStore store(std::make_shared<InMemoryStore>(), metrics);
        ASSERT_EQ(store.to_string(), "Instrumented(InMemory)", "display");

        ASSERT_TRUE(store.put(Path("a"), bytes("hello")).success, "put");
        ASSERT_TRUE(store.put(Path("b"), bytes("hi")).success, "put");
        ASSERT_TRUE(store.get(Path("a")).success, "get");
        ASSERT_TRUE(!store.get(Path("missing")).success, "get missing");
        ASSERT_TRUE(store.remove(Path("b")).success, "delete");

        ASSERT_EQ(metrics->operation_count("put", true), 2.0, "put successes");
        ASSERT_EQ(metrics->operation_count("get", true), 1.0, "get successes");
        ASSERT_EQ(metrics->operation_count("get", false), 1.0, "get failures");
        ASSERT_EQ(metrics->operation_count("delete", true), 1.0, "delete successes");
        ASSERT_EQ(metrics->bytes_written().Value(), 7.0, "bytes written");
        ASSERT_EQ(metrics->bytes_read().Value(), 5.0, "bytes read");
        PASS();
    }
    {
        TEST(two_path_and_listing_operations);
        auto metrics = std::make_shared<StoreMetrics>();
        InstrumentedStore store(std::make_shared<InMemoryStore>(), metrics);
        store.put(Path("x/1"), bytes("1"));
        ASSERT_TRUE(store.copy(Path("x/1"), Path("x/2")).success, "copy");
        ASSERT_TRUE(!store.copy_if_not_exists(Path("x/1"), Path("x/2")).success, "copy exists");
        ASSERT_TRUE(store.rename(Path("x/2"), Path("x/3")).success, "rename");
        ASSERT_EQ(store.list(Path("x")).objects.size(), 2u, "list");
        ASSERT_TRUE(store.list_with_delimiter(std::nullopt).success, "list_with_delimiter");

        ASSERT_EQ(metrics->operation_count("copy", true), 1.0, "copy");
        ASSERT_EQ(metrics->operation_count("copy_if_not_exists", false), 1.0, "copy_if_not_exists");
        ASSERT_EQ(metrics->operation_count("rename", true), 1.0, "rename");
        ASSERT_EQ(metrics->operation_count("list", true), 1.0, "list");
        ASSERT_EQ(metrics->operation_count("list_with_delimiter", true), 1.0, "delimited list");
        PASS();
    }
    {
        TEST(serialized_registry_contains_families);
        StoreMetrics metrics(std::map<std::string, std::string>{{"scheme", "memory"}});
        metrics.operations("head", true).Increment();
        metrics.duration("head").Observe(0.002);
        auto text = metrics.serialize();
        ASSERT_TRUE(text.find("deltastore_operations_total") != std::string::npos, "counter family");
        ASSERT_TRUE(text.find("deltastore_operation_duration_seconds") != std::string::npos,
                    "histogram family");
        ASSERT_TRUE(text.find("op=\"head\"") != std::string::npos, "op label");
        ASSERT_TRUE(text.find("scheme=\"memory\"") != std::string::npos, "constant label");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// MetricsExporter
// ---------------------------------------------------------------------------

static void test_exporter() {
    std::cout << "\n=== MetricsExporter ===" << std::endl;

    auto tmpdir = make_temp_dir("deltastore-metrics");
    auto prom_path = tmpdir / "store.prom";

    {
        TEST(write_now_reports_gauges);
        auto metrics = std::make_shared<StoreMetrics>(
            std::map<std::string, std::string>{{"scheme", "memory"}});
        auto limited = std::make_shared<LimitStore>(std::make_shared<InMemoryStore>(), 4);
        RuntimeConfig config;
        config.worker_threads = 2;
        IoRuntime runtime(config);

        MetricsExporter exporter(prom_path, std::chrono::seconds(60), metrics);
        exporter.set_limit_store(limited.get());
        exporter.set_runtime(&runtime);
        ASSERT_TRUE(exporter.write_now(), "write should succeed");

        auto content = read_file(prom_path);
        auto permits = sample_line(content, "deltastore_limit_permits{");
        ASSERT_TRUE(!permits.empty(), "limit permits gauge present");
        ASSERT_TRUE(ends_with(permits, " 4"), "limit permits value: " + permits);
        auto workers = sample_line(content, "deltastore_io_runtime_workers{");
        ASSERT_TRUE(ends_with(workers, " 2"), "runtime workers value: " + workers);
        exporter.set_runtime(nullptr);
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(periodic_writer_and_final_snapshot);
        auto metrics = std::make_shared<StoreMetrics>();
        InstrumentedStore store(std::make_shared<InMemoryStore>(), metrics);
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), metrics);
        exporter.start();

        bool created = wait_for([&] { return fs::exists(prom_path); }, 5000);
        store.put(Path("late"), bytes("x"));
        exporter.stop();

        ASSERT_TRUE(created, ".prom file should be created");
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("op=\"put\"") != std::string::npos,
                    "final snapshot includes the last operation");

        auto tmp_path = prom_path;
        tmp_path += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp_path), ".tmp file should not persist");
        PASS();
    }
    {
        TEST(unwritable_path_reports_failure);
        auto metrics = std::make_shared<StoreMetrics>();
        MetricsExporter exporter(tmpdir / "no-such-dir" / "x.prom", std::chrono::seconds(60),
                                 metrics);
        ASSERT_TRUE(!exporter.write_now(), "write should fail");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "deltastore metrics test suite" << std::endl;
    std::cout << "=============================" << std::endl;

    test_instrumented_store();
    test_exporter();

    std::cout << "\n=============================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
