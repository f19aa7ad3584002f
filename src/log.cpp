#include "deltastore/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace deltastore {

namespace {

std::atomic<bool> g_verbose{false};

// Keeps lines from concurrent workers from interleaving
std::mutex g_log_mutex;

void vlog(FILE* out, const char* level, const char* fmt, va_list args) {
    std::lock_guard lock(g_log_mutex);
    fprintf(out, "[deltastore] %s", level);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void set_log_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool log_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_debug(const char* fmt, ...) {
    if (!log_verbose()) return;
    va_list args;
    va_start(args, fmt);
    vlog(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stdout, "", fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "WARN: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

} // namespace deltastore
