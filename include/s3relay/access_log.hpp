#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace s3relay {

/// Append-only JSON-lines record of API activity, read back by idle
/// cullers through /api/kernels and /api/terminals.
class AccessLog {
public:
    /// Entries go to <dir>/access.log. A disabled log records nothing and
    /// reports the service as alive.
    AccessLog(const std::filesystem::path& dir, bool enabled);

    AccessLog(const AccessLog&) = delete;
    AccessLog& operator=(const AccessLog&) = delete;

    void record(const std::string& method, const std::string& path, int status,
                std::chrono::milliseconds duration);

    /// Last entry as a one-element array. execution_state is "idle" when the
    /// entry is older than ten minutes; a missing or empty log yields a
    /// fresh "alive" entry.
    nlohmann::json last_entry() const;

    const std::filesystem::path& path() const { return path_; }
    bool enabled() const { return enabled_; }

private:
    static nlohmann::json default_entry();

    std::filesystem::path path_;
    bool enabled_;
    mutable std::mutex mutex_;
};

/// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.000Z
std::string iso8601_now();

/// Parse the format produced by iso8601_now(). Empty on malformed input.
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& text);

}  // namespace s3relay
