#pragma once

#include "deltastore/storage/io_runtime.hpp"
#include "deltastore/storage/options.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace deltastore {

/// Configuration for the deltastore-tool command line.
struct ToolConfig {
    // Positional: <command> <url> [args...]
    std::string command;
    std::string url;
    std::vector<std::string> args;

    // Passed to the object store factory
    StorageOptions storage_options;

    // Run store I/O on a dedicated runtime (DeltaIOStorageBackend)
    bool isolate_io = false;
    RuntimeConfig runtime;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    bool verbose = false;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<ToolConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    static void print_usage();
};

} // namespace deltastore
