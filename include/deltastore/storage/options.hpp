#pragma once

#include "deltastore/core/constants.hpp"

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace deltastore {

// String-keyed configuration passed to every factory. Keys are case-sensitive.
class StorageOptions {
public:
    using Map = std::map<std::string, std::string>;

    StorageOptions() = default;
    explicit StorageOptions(Map values) : values_(std::move(values)) {}
    StorageOptions(std::initializer_list<Map::value_type> values) : values_(values) {}

    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const { return values_.count(key) != 0; }
    void set(std::string key, std::string value);
    bool erase(const std::string& key) { return values_.erase(key) != 0; }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    const Map& raw() const { return values_; }

    bool operator==(const StorageOptions& other) const = default;

private:
    Map values_;
};

// Case-insensitive "1", "true", "on", "yes", "y"
bool str_is_truthy(std::string_view value);

// humantime-style duration: "300s", "1h 30m", "15min", "100ms".
// Returns nullopt when the text does not follow the grammar.
std::optional<std::chrono::nanoseconds> parse_duration(std::string_view text);

struct BackoffConfig {
    std::chrono::nanoseconds init_backoff = constants::DEFAULT_INIT_BACKOFF;
    std::chrono::nanoseconds max_backoff = constants::DEFAULT_MAX_BACKOFF;
    double base = constants::DEFAULT_BACKOFF_BASE;

    // Delay before the given retry attempt (0-based), capped at max_backoff
    std::chrono::nanoseconds delay_for(unsigned attempt) const;
};

struct RetryConfig {
    size_t max_retries = constants::DEFAULT_MAX_RETRIES;
    std::chrono::nanoseconds retry_timeout = constants::DEFAULT_RETRY_TIMEOUT;
    BackoffConfig backoff;
};

// Mixin for factories of backends that retry requests
class RetryConfigParse {
public:
    virtual ~RetryConfigParse() = default;

    // Reads max_retries, retry_timeout and backoff_config.* from options.
    // Absent keys keep defaults; a malformed value throws StorageError(OptionParse).
    RetryConfig parse_retry_config(const StorageOptions& options) const;
};

} // namespace deltastore
