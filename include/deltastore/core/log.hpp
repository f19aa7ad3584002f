#pragma once

namespace deltastore {

// Enable debug output (off by default)
void set_log_verbose(bool verbose);
bool log_verbose();

// printf-style log helpers. Info goes to stdout, warnings and errors to stderr.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace deltastore
