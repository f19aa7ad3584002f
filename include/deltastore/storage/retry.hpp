#pragma once

#include "deltastore/storage/backend.hpp"
#include "deltastore/storage/options.hpp"

#include <cstddef>
#include <span>

namespace deltastore {

// Failures worth another attempt: Generic I/O errors and dropped units of work
bool is_transient(ErrorKind kind);

// Put, retrying transient failures up to max_retries attempts in total,
// sleeping backoff.delay_for(n) before the n-th retry.
// Any other failure is returned immediately.
PutResult put_with_retries(ObjectStore& store,
                           const Path& location,
                           std::span<const uint8_t> payload,
                           size_t max_retries,
                           const BackoffConfig& backoff = BackoffConfig{});

// Delete, retrying transient failures. A missing object counts as deleted.
Status delete_with_retries(ObjectStore& store,
                           const Path& location,
                           size_t max_retries,
                           const BackoffConfig& backoff = BackoffConfig{});

} // namespace deltastore
