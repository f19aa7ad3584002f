#pragma once

#include "deltastore/storage/io_runtime.hpp"
#include "deltastore/storage/options.hpp"

#include <nlohmann/json.hpp>

namespace deltastore {

// StorageOptions <-> JSON object of strings. Non-string values are rejected.
void to_json(nlohmann::json& j, const StorageOptions& options);
void from_json(const nlohmann::json& j, StorageOptions& options);

// RuntimeConfig <-> {"multi_threaded", "worker_threads", "thread_name",
// "enable_io", "enable_time"}. Missing fields keep their defaults.
void to_json(nlohmann::json& j, const RuntimeConfig& config);
void from_json(const nlohmann::json& j, RuntimeConfig& config);

} // namespace deltastore
