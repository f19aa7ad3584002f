#include "deltastore/storage/options.hpp"
#include "deltastore/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>

namespace deltastore {

std::optional<std::string> StorageOptions::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void StorageOptions::set(std::string key, std::string value) {
    values_.insert_or_assign(std::move(key), std::move(value));
}

bool str_is_truthy(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "on" || lower == "yes" || lower == "y";
}

namespace {

// Length of one unit in nanoseconds, or 0 for an unknown unit
uint64_t unit_nanos(std::string_view unit) {
    constexpr uint64_t NS = 1;
    constexpr uint64_t US = 1000 * NS;
    constexpr uint64_t MS = 1000 * US;
    constexpr uint64_t SEC = 1000 * MS;
    constexpr uint64_t MIN = 60 * SEC;
    constexpr uint64_t HOUR = 60 * MIN;
    constexpr uint64_t DAY = 24 * HOUR;

    if (unit == "ns" || unit == "nsec" || unit == "nsecs" || unit == "nanos") return NS;
    if (unit == "us" || unit == "usec" || unit == "usecs" || unit == "micros") return US;
    if (unit == "ms" || unit == "msec" || unit == "msecs" || unit == "millis") return MS;
    if (unit == "s" || unit == "sec" || unit == "secs" || unit == "second" || unit == "seconds") return SEC;
    if (unit == "m" || unit == "min" || unit == "mins" || unit == "minute" || unit == "minutes") return MIN;
    if (unit == "h" || unit == "hr" || unit == "hrs" || unit == "hour" || unit == "hours") return HOUR;
    if (unit == "d" || unit == "day" || unit == "days") return DAY;
    if (unit == "w" || unit == "week" || unit == "weeks") return 7 * DAY;
    if (unit == "M" || unit == "month" || unit == "months") return 2'630'016 * SEC;   // 30.44 days
    if (unit == "y" || unit == "year" || unit == "years") return 31'557'600 * SEC;    // 365.25 days
    return 0;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    auto* begin = text.data();
    auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

[[noreturn]] void throw_parse_error(const char* key, const std::string& value, const char* as) {
    throw StorageError(ErrorKind::OptionParse,
        std::string("failed to parse \"") + value + "\" as " + as + " for option " + key);
}

}  // namespace

std::optional<std::chrono::nanoseconds> parse_duration(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size() && is_space(text[pos])) ++pos;
    if (pos == text.size()) return std::nullopt;

    uint64_t total = 0;
    while (pos < text.size()) {
        size_t digits_start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos == digits_start) return std::nullopt;

        auto number = parse_number<uint64_t>(text.substr(digits_start, pos - digits_start));
        if (!number) return std::nullopt;

        while (pos < text.size() && is_space(text[pos])) ++pos;
        size_t unit_start = pos;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos == unit_start) return std::nullopt;

        uint64_t unit = unit_nanos(text.substr(unit_start, pos - unit_start));
        if (unit == 0) return std::nullopt;

        constexpr uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        if (*number > (limit - total) / unit) return std::nullopt;
        total += *number * unit;

        while (pos < text.size() && is_space(text[pos])) ++pos;
    }
    return std::chrono::nanoseconds(static_cast<int64_t>(total));
}

std::chrono::nanoseconds BackoffConfig::delay_for(unsigned attempt) const {
    double scaled = static_cast<double>(init_backoff.count()) * std::pow(base, attempt);
    double cap = static_cast<double>(max_backoff.count());
    if (!std::isfinite(scaled) || scaled > cap) return max_backoff;
    return std::chrono::nanoseconds(static_cast<int64_t>(scaled));
}

RetryConfig RetryConfigParse::parse_retry_config(const StorageOptions& options) const {
    RetryConfig config;

    if (auto value = options.get(constants::MAX_RETRIES)) {
        auto parsed = parse_number<size_t>(*value);
        if (!parsed) throw_parse_error(constants::MAX_RETRIES, *value, "usize");
        config.max_retries = *parsed;
    }

    const std::pair<const char*, std::chrono::nanoseconds*> durations[] = {
        {constants::RETRY_TIMEOUT, &config.retry_timeout},
        {constants::BACKOFF_INIT, &config.backoff.init_backoff},
        {constants::BACKOFF_MAX, &config.backoff.max_backoff},
    };
    for (const auto& [key, target] : durations) {
        if (auto value = options.get(key)) {
            auto parsed = parse_duration(*value);
            if (!parsed) throw_parse_error(key, *value, "Duration");
            *target = *parsed;
        }
    }

    if (auto value = options.get(constants::BACKOFF_BASE)) {
        auto parsed = parse_number<double>(*value);
        if (!parsed) throw_parse_error(constants::BACKOFF_BASE, *value, "f64");
        config.backoff.base = *parsed;
    }

    return config;
}

} // namespace deltastore
