#include "deltastore/storage/retry.hpp"
#include "deltastore/core/log.hpp"

#include <algorithm>
#include <thread>

namespace deltastore {

bool is_transient(ErrorKind kind) {
    return kind == ErrorKind::Generic || kind == ErrorKind::JoinError;
}

namespace {

void wait_before_retry(const BackoffConfig& backoff, size_t attempt, size_t attempts) {
    if (attempt < attempts) {
        std::this_thread::sleep_for(backoff.delay_for(static_cast<unsigned>(attempt - 1)));
    }
}

}  // namespace

PutResult put_with_retries(ObjectStore& store,
                           const Path& location,
                           std::span<const uint8_t> payload,
                           size_t max_retries,
                           const BackoffConfig& backoff) {
    const size_t attempts = std::max<size_t>(max_retries, 1);
    PutResult result;
    for (size_t attempt = 1; attempt <= attempts; ++attempt) {
        result = store.put(location, payload);
        if (result.success || !is_transient(result.error)) return result;
        log_debug("put %s failed (attempt %zu of %zu): %s",
                  location.as_string().c_str(), attempt, attempts,
                  result.error_message.c_str());
        wait_before_retry(backoff, attempt, attempts);
    }
    return result;
}

Status delete_with_retries(ObjectStore& store,
                           const Path& location,
                           size_t max_retries,
                           const BackoffConfig& backoff) {
    const size_t attempts = std::max<size_t>(max_retries, 1);
    Status result;
    for (size_t attempt = 1; attempt <= attempts; ++attempt) {
        result = store.remove(location);
        if (result.success || result.error == ErrorKind::NotFound) return succeeded();
        if (!is_transient(result.error)) return result;
        log_debug("delete %s failed (attempt %zu of %zu): %s",
                  location.as_string().c_str(), attempt, attempts,
                  result.error_message.c_str());
        wait_before_retry(backoff, attempt, attempts);
    }
    return result;
}

} // namespace deltastore
