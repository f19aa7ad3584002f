#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace deltastore::constants {

// Storage option keys
constexpr const char* OBJECT_STORE_CONCURRENCY_LIMIT = "OBJECT_STORE_CONCURRENCY_LIMIT";
constexpr const char* MAX_RETRIES = "max_retries";
constexpr const char* RETRY_TIMEOUT = "retry_timeout";
constexpr const char* BACKOFF_INIT = "backoff_config.init_backoff";
constexpr const char* BACKOFF_MAX = "backoff_config.max_backoff";
constexpr const char* BACKOFF_BASE = "backoff_config.base";

// Retry defaults (used when the option is absent)
constexpr size_t DEFAULT_MAX_RETRIES = 10;
constexpr std::chrono::seconds DEFAULT_RETRY_TIMEOUT{180};
constexpr std::chrono::milliseconds DEFAULT_INIT_BACKOFF{100};
constexpr std::chrono::seconds DEFAULT_MAX_BACKOFF{15};
constexpr double DEFAULT_BACKOFF_BASE = 2.0;

// Transaction log layout
constexpr const char* DELTA_LOG_DIR = "_delta_log";
constexpr int COMMIT_VERSION_DIGITS = 20;

// Listing
constexpr size_t DEFAULT_LIST_PAGE_SIZE = 1000;

// Sharded maps (registries, local store key locks)
constexpr size_t DEFAULT_REGISTRY_SHARDS = 32;
constexpr size_t DEFAULT_LOCAL_STORE_SHARDS = 256;

// IO runtime
constexpr const char* DEFAULT_IO_THREAD_NAME = "IO-runtime";
constexpr size_t MAX_THREAD_NAME_LENGTH = 15;  // pthread limit, excluding NUL

// Metrics
constexpr int DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace deltastore::constants
