#include "s3relay/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace s3relay {

namespace {

std::atomic<bool> g_verbose{false};

void write_line(FILE* out, const char* prefix, const char* fmt, va_list args) {
    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm tm;
    gmtime_r(&now, &tm);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm);

    // Keep concurrent connection threads from interleaving partial lines
    flockfile(out);
    fprintf(out, "%s %s", stamp, prefix);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
    funlockfile(out);
}

}  // namespace

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "", fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!g_verbose.load(std::memory_order_relaxed)) return;
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

void set_verbose_logging(bool enabled) {
    g_verbose.store(enabled, std::memory_order_relaxed);
}

bool verbose_logging() {
    return g_verbose.load(std::memory_order_relaxed);
}

}  // namespace s3relay
