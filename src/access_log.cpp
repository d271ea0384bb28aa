#include "s3relay/access_log.hpp"
#include "s3relay/constants.hpp"
#include "s3relay/log.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <fstream>

namespace s3relay {

namespace {

constexpr const char* SERVICE_NAME = "s3-relay";
constexpr std::streamoff TAIL_CHUNK = 1024;

// Last non-empty line of a file, read backwards in small chunks
std::string read_last_line(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) return {};

    std::streamoff position = file.tellg();
    std::string tail;
    while (position > 0) {
        std::streamoff read_size = std::min(TAIL_CHUNK, position);
        position -= read_size;
        std::string chunk(static_cast<size_t>(read_size), '\0');
        file.seekg(position);
        file.read(chunk.data(), read_size);
        tail.insert(0, chunk);

        // Trim trailing whitespace, then look for the line start
        size_t end = tail.find_last_not_of(" \t\r\n");
        if (end == std::string::npos) continue;
        size_t start = tail.rfind('\n', end);
        if (start != std::string::npos) {
            return tail.substr(start + 1, end - start);
        }
        if (position == 0) {
            return tail.substr(0, end + 1);
        }
    }
    return {};
}

}  // namespace

std::string iso8601_now() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& text) {
    std::tm tm{};
    int millis = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &millis);
    if (n < 6) return std::nullopt;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(millis);
}

AccessLog::AccessLog(const std::filesystem::path& dir, bool enabled)
    : path_(dir / "access.log")
    , enabled_(enabled) {
    if (!enabled_) return;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        log_warn("Access log disabled: cannot create %s: %s", dir.c_str(), ec.message().c_str());
        enabled_ = false;
    }
}

nlohmann::json AccessLog::default_entry() {
    return {
        {"id", SERVICE_NAME},
        {"name", SERVICE_NAME},
        {"last_activity", iso8601_now()},
        {"execution_state", "alive"},
        {"connections", 1},
    };
}

void AccessLog::record(const std::string& method, const std::string& path, int status,
                       std::chrono::milliseconds duration) {
    if (!enabled_) return;

    nlohmann::json entry = {
        {"id", SERVICE_NAME},
        {"name", SERVICE_NAME},
        {"last_activity", iso8601_now()},
        {"execution_state", "busy"},
        {"connections", 1},
        {"path", path},
        {"method", method},
        {"status", status},
        {"duration_ms", duration.count()},
    };

    std::lock_guard lock(mutex_);
    std::ofstream ofs(path_, std::ios::app);
    if (!ofs) {
        log_warn("Cannot append to access log %s", path_.c_str());
        return;
    }
    // Request paths are raw bytes; invalid UTF-8 becomes U+FFFD
    ofs << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

nlohmann::json AccessLog::last_entry() const {
    std::string line;
    {
        std::lock_guard lock(mutex_);
        std::error_code ec;
        if (!enabled_ || !std::filesystem::exists(path_, ec)) {
            return nlohmann::json::array({default_entry()});
        }
        line = read_last_line(path_);
    }
    if (line.empty()) {
        return nlohmann::json::array({default_entry()});
    }

    nlohmann::json entry;
    try {
        entry = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        log_warn("Unreadable access log entry: %s", e.what());
        return nlohmann::json::array({default_entry()});
    }

    if (entry.contains("last_activity") && entry["last_activity"].is_string()) {
        auto when = parse_iso8601(entry["last_activity"].get<std::string>());
        if (when && std::chrono::system_clock::now() - *when >
                        std::chrono::seconds(constants::ACCESS_IDLE_SECONDS)) {
            entry["execution_state"] = "idle";
        }
    }
    return nlohmann::json::array({entry});
}

}  // namespace s3relay
