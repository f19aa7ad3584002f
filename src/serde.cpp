#include "deltastore/storage/serde.hpp"
#include "deltastore/core/errors.hpp"

namespace deltastore {

void to_json(nlohmann::json& j, const StorageOptions& options) {
    j = nlohmann::json::object();
    for (const auto& [key, value] : options.raw()) {
        j[key] = value;
    }
}

void from_json(const nlohmann::json& j, StorageOptions& options) {
    if (!j.is_object()) {
        throw StorageError(ErrorKind::OptionParse, "storage options must be a JSON object");
    }
    StorageOptions::Map values;
    for (const auto& [key, value] : j.items()) {
        if (!value.is_string()) {
            throw StorageError(ErrorKind::OptionParse,
                "storage option \"" + key + "\" must be a string, got " + value.dump());
        }
        values[key] = value.get<std::string>();
    }
    options = StorageOptions(std::move(values));
}

void to_json(nlohmann::json& j, const RuntimeConfig& config) {
    j = nlohmann::json{
        {"multi_threaded", config.multi_threaded},
        {"worker_threads", config.worker_threads},
        {"enable_io", config.enable_io},
        {"enable_time", config.enable_time},
    };
    if (config.thread_name) {
        j["thread_name"] = *config.thread_name;
    } else {
        j["thread_name"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, RuntimeConfig& config) {
    if (j.contains("multi_threaded")) config.multi_threaded = j["multi_threaded"].get<bool>();
    if (j.contains("worker_threads")) config.worker_threads = j["worker_threads"].get<size_t>();
    if (j.contains("enable_io")) config.enable_io = j["enable_io"].get<bool>();
    if (j.contains("enable_time")) config.enable_time = j["enable_time"].get<bool>();
    if (j.contains("thread_name")) {
        const auto& name = j["thread_name"];
        if (name.is_null()) {
            config.thread_name.reset();
        } else {
            config.thread_name = name.get<std::string>();
        }
    }
}

} // namespace deltastore
