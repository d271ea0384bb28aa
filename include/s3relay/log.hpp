#pragma once

namespace s3relay {

/// printf-style log helpers. Info and debug lines go to stdout, warnings and
/// errors to stderr. Each line is prefixed with a UTC timestamp.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only emitted when verbose logging is enabled (--verbose).
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose_logging(bool enabled);
bool verbose_logging();

}  // namespace s3relay
