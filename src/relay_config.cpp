#include "s3relay/relay_config.hpp"
#include "s3relay/net/http.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

namespace s3relay {

// --- BackendConfig ---

namespace {

bool valid_http_url(const std::string& url) {
    auto parsed = net::ParsedUrl::parse(url);
    return parsed && (parsed->scheme == "http" || parsed->scheme == "https") && !parsed->host.empty();
}

std::string mask(const std::string& secret) {
    return secret.empty() ? "" : "****";
}

}  // namespace

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "s3") {
        if (region.empty()) return "s3 backend requires 'region'";
        if (!endpoint.empty() && !valid_http_url(endpoint))
            return "s3 endpoint must be an http(s) URL: " + endpoint;
        if (access_key.empty() != secret_key.empty())
            return "s3 backend requires both access key and secret key, or neither";
        if (!http_proxy.empty() && !net::ParsedUrl::parse(http_proxy))
            return "invalid http proxy URL: " + http_proxy;
        if (!https_proxy.empty() && !net::ParsedUrl::parse(https_proxy))
            return "invalid https proxy URL: " + https_proxy;
    } else if (type == "local") {
        if (local_root.empty()) return "local backend requires 'local_root'";
        if (!std::filesystem::exists(local_root))
            return "local backend root does not exist: " + local_root.string();
        if (!std::filesystem::is_directory(local_root))
            return "local backend root is not a directory: " + local_root.string();
    } else {
        return "unknown backend type: " + type;
    }
    if (connect_timeout_secs == 0) return "connect timeout must be > 0";
    if (stall_timeout_secs == 0) return "stall timeout must be > 0";
    return {};
}

std::string BackendConfig::summary() const {
    if (type == "local") {
        return "local root=" + local_root.string();
    }
    std::string s = "s3 endpoint=" + (endpoint.empty() ? std::string("aws") : endpoint) +
                    " region=" + region;
    if (!default_bucket.empty()) s += " bucket=" + default_bucket;
    s += " access_key=" + (access_key.empty() ? std::string("(anonymous)") : mask(access_key));
    if (!http_proxy.empty() || !https_proxy.empty()) s += " proxy=" + proxy_for_endpoint();
    if (!verify_ssl) s += " verify_ssl=false";
    return s;
}

std::string BackendConfig::proxy_for_endpoint() const {
    if (endpoint.compare(0, 7, "http://") == 0) return http_proxy;
    // AWS endpoints (empty) are always https
    return https_proxy;
}

nlohmann::json backend_to_json(const BackendConfig& config, bool mask_secrets) {
    nlohmann::json j;
    j["type"] = config.type;
    j["endpoint"] = config.endpoint;
    j["region"] = config.region;
    j["access_key"] = mask_secrets ? mask(config.access_key) : config.access_key;
    j["secret_key"] = mask_secrets ? mask(config.secret_key) : config.secret_key;
    j["session_token"] = mask_secrets ? mask(config.session_token) : config.session_token;
    j["default_bucket"] = config.default_bucket;
    j["http_proxy"] = config.http_proxy;
    j["https_proxy"] = config.https_proxy;
    j["local_root"] = config.local_root.string();
    j["use_path_style"] = config.use_path_style;
    j["verify_ssl"] = config.verify_ssl;
    j["unsigned_payload"] = config.unsigned_payload;
    j["connect_timeout"] = config.connect_timeout_secs;
    j["stall_timeout"] = config.stall_timeout_secs;
    return j;
}

std::string backend_from_json(const nlohmann::json& j, BackendConfig& config) {
    if (!j.is_object()) return "backend settings must be a JSON object";

    // First key present wins; snake_case file keys and camelCase API keys
    auto str = [&](std::initializer_list<const char*> keys, std::string& out) -> std::string {
        for (const char* key : keys) {
            if (!j.contains(key) || j[key].is_null()) continue;
            if (!j[key].is_string()) return std::string("'") + key + "' must be a string";
            out = j[key].get<std::string>();
            return {};
        }
        return {};
    };
    auto boolean = [&](const char* snake, const char* camel, bool& out) -> std::string {
        for (const char* key : {snake, camel}) {
            if (!j.contains(key)) continue;
            if (!j[key].is_boolean()) return std::string("'") + key + "' must be a boolean";
            out = j[key].get<bool>();
            return {};
        }
        return {};
    };
    auto seconds = [&](const char* snake, const char* camel, uint32_t& out) -> std::string {
        for (const char* key : {snake, camel}) {
            if (!j.contains(key)) continue;
            if (!j[key].is_number_unsigned()) return std::string("'") + key + "' must be a positive integer";
            out = j[key].get<uint32_t>();
            return {};
        }
        return {};
    };

    std::string err;
    std::string local_root;
    if (!(err = str({"type"}, config.type)).empty()) return err;
    if (!(err = str({"endpoint"}, config.endpoint)).empty()) return err;
    if (!(err = str({"region"}, config.region)).empty()) return err;
    if (!(err = str({"access_key", "accessKeyId"}, config.access_key)).empty()) return err;
    if (!(err = str({"secret_key", "secretAccessKey"}, config.secret_key)).empty()) return err;
    if (!(err = str({"session_token", "sessionToken"}, config.session_token)).empty()) return err;
    if (!(err = str({"default_bucket", "defaultBucket", "bucket"}, config.default_bucket)).empty()) return err;
    if (!(err = str({"http_proxy", "httpProxy"}, config.http_proxy)).empty()) return err;
    if (!(err = str({"https_proxy", "httpsProxy"}, config.https_proxy)).empty()) return err;
    if (!(err = str({"local_root", "localRoot"}, local_root)).empty()) return err;
    if (!local_root.empty()) config.local_root = local_root;
    if (!(err = boolean("use_path_style", "usePathStyle", config.use_path_style)).empty()) return err;
    if (!(err = boolean("verify_ssl", "verifySsl", config.verify_ssl)).empty()) return err;
    if (!(err = boolean("unsigned_payload", "unsignedPayload", config.unsigned_payload)).empty()) return err;
    if (!(err = seconds("connect_timeout", "connectTimeout", config.connect_timeout_secs)).empty()) return err;
    if (!(err = seconds("stall_timeout", "stallTimeout", config.stall_timeout_secs)).empty()) return err;
    return {};
}

// --- RelayConfig ---

namespace {

bool parse_u64(const char* name, const char* value, uint64_t& out) {
    try {
        size_t pos = 0;
        out = std::stoull(value, &pos);
        if (value[pos] != '\0' || value[0] == '-') throw std::invalid_argument(value);
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: " << name << " expects a non-negative integer, got '" << value << "'\n";
        return false;
    }
}

// Reads the first environment variable that is set and non-empty
const char* env_first(std::initializer_list<const char*> names) {
    for (const char* name : names) {
        const char* v = std::getenv(name);
        if (v && *v) return v;
    }
    return nullptr;
}

}  // namespace

std::string RelayConfig::load_env() {
    if (auto* v = env_first({"AWS_ACCESS_KEY_ID"})) backend.access_key = v;
    if (auto* v = env_first({"AWS_SECRET_ACCESS_KEY"})) backend.secret_key = v;
    if (auto* v = env_first({"AWS_SESSION_TOKEN"})) backend.session_token = v;
    if (auto* v = env_first({"AWS_DEFAULT_REGION", "AWS_REGION"})) backend.region = v;
    if (auto* v = env_first({"AWS_S3_ENDPOINT"})) backend.endpoint = v;
    if (auto* v = env_first({"AWS_S3_BUCKET"})) backend.default_bucket = v;
    if (auto* v = env_first({"HTTP_PROXY", "http_proxy"})) backend.http_proxy = v;
    if (auto* v = env_first({"HTTPS_PROXY", "https_proxy"})) backend.https_proxy = v;
    if (auto* v = env_first({"IP"})) listen_address = v;
    if (auto* v = env_first({"LOG_DIR"})) log_dir = v;

    if (auto* v = env_first({"PORT"})) {
        uint64_t n = 0;
        if (!parse_u64("PORT", v, n) || n == 0 || n > 65535) return std::string("invalid PORT: ") + v;
        port = static_cast<uint16_t>(n);
    }
    if (auto* v = env_first({"LOCAL_STORAGE_PATHS"})) {
        // Comma separated; blanks around entries are ignored
        local_paths.clear();
        std::stringstream ss(v);
        std::string item;
        while (std::getline(ss, item, ',')) {
            auto first = item.find_first_not_of(" \t");
            if (first == std::string::npos) continue;
            auto last = item.find_last_not_of(" \t");
            local_paths.emplace_back(item.substr(first, last - first + 1));
        }
    }
    if (auto* v = env_first({"MAX_CONCURRENT_TRANSFERS"})) {
        uint64_t n = 0;
        if (!parse_u64("MAX_CONCURRENT_TRANSFERS", v, n))
            return std::string("invalid MAX_CONCURRENT_TRANSFERS: ") + v;
        max_concurrent_transfers = n;
    }
    return {};
}

std::optional<RelayConfig> RelayConfig::from_args(int argc, char* argv[]) {
    RelayConfig config;

    auto env_err = config.load_env();
    if (!env_err.empty()) {
        std::cerr << "Error: " << env_err << "\n";
        return std::nullopt;
    }

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto next_u64 = [&](int& i, const char* name, uint64_t& out) -> bool {
        auto* v = next_arg(i, name);
        return v && parse_u64(name, v, out);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        uint64_t n = 0;

        if (arg == "--listen-address") {
            auto* v = next_arg(i, "--listen-address");
            if (!v) return std::nullopt;
            config.listen_address = v;
        } else if (arg == "--port") {
            if (!next_u64(i, "--port", n)) return std::nullopt;
            if (n == 0 || n > 65535) {
                std::cerr << "Error: --port out of range\n";
                return std::nullopt;
            }
            config.port = static_cast<uint16_t>(n);
        } else if (arg == "--backend-type") {
            auto* v = next_arg(i, "--backend-type");
            if (!v) return std::nullopt;
            config.backend.type = v;
        } else if (arg == "--endpoint") {
            auto* v = next_arg(i, "--endpoint");
            if (!v) return std::nullopt;
            config.backend.endpoint = v;
        } else if (arg == "--bucket") {
            auto* v = next_arg(i, "--bucket");
            if (!v) return std::nullopt;
            config.backend.default_bucket = v;
        } else if (arg == "--region") {
            auto* v = next_arg(i, "--region");
            if (!v) return std::nullopt;
            config.backend.region = v;
        } else if (arg == "--access-key") {
            auto* v = next_arg(i, "--access-key");
            if (!v) return std::nullopt;
            config.backend.access_key = v;
        } else if (arg == "--secret-key") {
            auto* v = next_arg(i, "--secret-key");
            if (!v) return std::nullopt;
            config.backend.secret_key = v;
        } else if (arg == "--session-token") {
            auto* v = next_arg(i, "--session-token");
            if (!v) return std::nullopt;
            config.backend.session_token = v;
        } else if (arg == "--local-root") {
            auto* v = next_arg(i, "--local-root");
            if (!v) return std::nullopt;
            config.backend.local_root = v;
        } else if (arg == "--http-proxy") {
            auto* v = next_arg(i, "--http-proxy");
            if (!v) return std::nullopt;
            config.backend.http_proxy = v;
        } else if (arg == "--https-proxy") {
            auto* v = next_arg(i, "--https-proxy");
            if (!v) return std::nullopt;
            config.backend.https_proxy = v;
        } else if (arg == "--no-verify-ssl") {
            config.backend.verify_ssl = false;
        } else if (arg == "--virtual-host-style") {
            config.backend.use_path_style = false;
        } else if (arg == "--unsigned-payload") {
            config.backend.unsigned_payload = true;
        } else if (arg == "--connect-timeout") {
            if (!next_u64(i, "--connect-timeout", n)) return std::nullopt;
            config.backend.connect_timeout_secs = static_cast<uint32_t>(n);
        } else if (arg == "--stall-timeout") {
            if (!next_u64(i, "--stall-timeout", n)) return std::nullopt;
            config.backend.stall_timeout_secs = static_cast<uint32_t>(n);
        } else if (arg == "--max-concurrent-transfers") {
            if (!next_u64(i, "--max-concurrent-transfers", n)) return std::nullopt;
            config.max_concurrent_transfers = n;
        } else if (arg == "--part-size-mb") {
            if (!next_u64(i, "--part-size-mb", n)) return std::nullopt;
            config.part_size = n * 1024 * 1024;
        } else if (arg == "--progress-bytes") {
            if (!next_u64(i, "--progress-bytes", n)) return std::nullopt;
            config.progress_bytes = n;
        } else if (arg == "--progress-interval-ms") {
            if (!next_u64(i, "--progress-interval-ms", n)) return std::nullopt;
            config.progress_interval = std::chrono::milliseconds(n);
        } else if (arg == "--local-path") {
            auto* v = next_arg(i, "--local-path");
            if (!v) return std::nullopt;
            config.local_paths.emplace_back(v);
        } else if (arg == "--upload-rate-limit") {
            if (!next_u64(i, "--upload-rate-limit", n)) return std::nullopt;
            config.upload_rate_limit = n;
        } else if (arg == "--transfer-rate-limit") {
            if (!next_u64(i, "--transfer-rate-limit", n)) return std::nullopt;
            config.transfer_rate_limit = n;
        } else if (arg == "--rate-limit-window-ms") {
            if (!next_u64(i, "--rate-limit-window-ms", n)) return std::nullopt;
            config.rate_limit_window = std::chrono::milliseconds(n);
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--daemon") {
            config.daemonize = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--pid-file") {
            auto* v = next_arg(i, "--pid-file");
            if (!v) return std::nullopt;
            config.pid_file = v;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--log-dir") {
            auto* v = next_arg(i, "--log-dir");
            if (!v) return std::nullopt;
            config.log_dir = v;
        } else if (arg == "--no-access-log") {
            config.access_log_enabled = false;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            if (!next_u64(i, "--metrics-interval", n)) return std::nullopt;
            config.metrics_interval_secs = n;
        } else if (arg == "--help" || arg == "-h") {
            std::cerr <<
                "Usage: s3-relay [options]\n"
                "\n"
                "Listener:\n"
                "  --listen-address <addr>          Bind address (default: 0.0.0.0, or IP env)\n"
                "  --port <N>                       Listen port (default: 8080, or PORT env)\n"
                "\n"
                "Backend:\n"
                "  --backend-type <s3|local>        Backend type (default: s3)\n"
                "  --endpoint <url>                 S3 endpoint URL (or AWS_S3_ENDPOINT env)\n"
                "  --bucket <name>                  Default bucket (or AWS_S3_BUCKET env)\n"
                "  --region <region>                Region (default: us-east-1, or AWS_DEFAULT_REGION env)\n"
                "  --access-key <key>               Access key (or AWS_ACCESS_KEY_ID env)\n"
                "  --secret-key <key>               Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
                "  --session-token <token>          Session token (or AWS_SESSION_TOKEN env)\n"
                "  --local-root <path>              Root directory for the local backend\n"
                "  --http-proxy <url>               Proxy for http endpoints (or HTTP_PROXY env)\n"
                "  --https-proxy <url>              Proxy for https endpoints (or HTTPS_PROXY env)\n"
                "  --no-verify-ssl                  Skip SSL verification\n"
                "  --virtual-host-style             Use bucket.host addressing instead of path style\n"
                "  --unsigned-payload               Do not hash upload payloads\n"
                "  --connect-timeout <secs>         Backend connect timeout (default: 10)\n"
                "  --stall-timeout <secs>           Abort a transfer idle this long (default: 60)\n"
                "\n"
                "Transfers:\n"
                "  --max-concurrent-transfers <N>   Concurrent transfer limit (default: 2)\n"
                "  --part-size-mb <N>               Multipart part size in MB (default: 8)\n"
                "  --progress-bytes <N>             Progress event byte interval (default: 1MB)\n"
                "  --progress-interval-ms <N>       Progress event time interval (default: 500)\n"
                "  --local-path <dir>               Directory open to transfer jobs (repeatable,\n"
                "                                   or LOCAL_STORAGE_PATHS env, comma separated)\n"
                "  --upload-rate-limit <N>          Uploads per client per window (default: 0, off)\n"
                "  --transfer-rate-limit <N>        Transfer jobs per client per window (default: 10)\n"
                "  --rate-limit-window-ms <N>       Rate limit window (default: 60000)\n"
                "\n"
                "Daemon:\n"
                "  --config <path>                  JSON config file\n"
                "  --daemon                         Run as daemon\n"
                "  --verbose                        Verbose output\n"
                "  --pid-file <path>                PID file path\n"
                "  --log-file <path>                Log file path\n"
                "  --log-dir <path>                 Access log directory (or LOG_DIR env)\n"
                "  --no-access-log                  Disable access log (default: enabled)\n"
                "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
                "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
                "  --help                           Show this help\n";
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    return config;
}

bool RelayConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("listen_address")) listen_address = j["listen_address"].get<std::string>();
        if (j.contains("port")) port = j["port"].get<uint16_t>();
        if (j.contains("max_concurrent_transfers"))
            max_concurrent_transfers = j["max_concurrent_transfers"].get<size_t>();
        if (j.contains("part_size_mb")) part_size = j["part_size_mb"].get<size_t>() * 1024 * 1024;
        if (j.contains("progress_bytes")) progress_bytes = j["progress_bytes"].get<uint64_t>();
        if (j.contains("progress_interval_ms"))
            progress_interval = std::chrono::milliseconds(j["progress_interval_ms"].get<uint64_t>());
        if (j.contains("subscriber_queue_depth"))
            subscriber_queue_depth = j["subscriber_queue_depth"].get<size_t>();
        if (j.contains("local_paths")) {
            local_paths.clear();
            for (const auto& p : j["local_paths"]) local_paths.emplace_back(p.get<std::string>());
        }
        if (j.contains("upload_rate_limit")) upload_rate_limit = j["upload_rate_limit"].get<uint64_t>();
        if (j.contains("transfer_rate_limit"))
            transfer_rate_limit = j["transfer_rate_limit"].get<uint64_t>();
        if (j.contains("rate_limit_window_ms"))
            rate_limit_window = std::chrono::milliseconds(j["rate_limit_window_ms"].get<uint64_t>());
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("log_dir")) log_dir = j["log_dir"].get<std::string>();
        if (j.contains("access_log_enabled")) access_log_enabled = j["access_log_enabled"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("backend")) {
            auto err = backend_from_json(j["backend"], backend);
            if (!err.empty()) {
                std::cerr << "Error in config backend: " << err << "\n";
                return false;
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

std::string RelayConfig::validate() const {
    if (listen_address.empty()) return "listen_address is required";
    if (max_concurrent_transfers == 0) return "max_concurrent_transfers must be > 0";
    if (max_concurrent_transfers > constants::MAX_CONCURRENT_TRANSFERS_LIMIT)
        return "max_concurrent_transfers must be <= " +
               std::to_string(constants::MAX_CONCURRENT_TRANSFERS_LIMIT);
    if (part_size == 0) return "part_size must be > 0";
    if (backend.type == "s3" && part_size < constants::S3_MIN_PART_SIZE)
        return "part_size must be at least 5MB for the s3 backend";
    if (subscriber_queue_depth == 0) return "subscriber_queue_depth must be > 0";
    if (rate_limit_window.count() <= 0) return "rate_limit_window_ms must be > 0";
    for (const auto& dir : local_paths) {
        std::error_code ec;
        if (dir.empty() || !dir.is_absolute()) return "local path must be absolute: " + dir.string();
        if (!std::filesystem::is_directory(dir, ec))
            return "local path is not a directory: " + dir.string();
    }
    auto err = backend.validate();
    if (!err.empty()) return "backend: " + err;
    return {};
}

}  // namespace s3relay
