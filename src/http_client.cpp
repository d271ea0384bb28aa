#include "s3relay/net/http.hpp"

#include <curl/curl.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <exception>
#include <iomanip>
#include <map>
#include <mutex>
#include <set>
#include <sstream>

namespace s3relay::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

const char* transport_fault_name(TransportFault fault) {
    switch (fault) {
        case TransportFault::None: return "none";
        case TransportFault::Timeout: return "timeout";
        case TransportFault::ConnectionReset: return "connection_reset";
        case TransportFault::ConnectionRefused: return "connection_refused";
        case TransportFault::Resolve: return "resolve";
        case TransportFault::Tls: return "tls";
        case TransportFault::Aborted: return "aborted";
        case TransportFault::Other: return "other";
    }
    return "other";
}

static std::string percent_encode(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode(const std::string& str) {
    return percent_encode(str, false);
}

std::string url_encode_path(const std::string& path) {
    return percent_encode(path, true);
}

std::optional<std::string> url_decode(const std::string& encoded) {
    auto hex_value = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };

    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') {
            out += encoded[i];
            continue;
        }
        if (i + 2 >= encoded.size()) return std::nullopt;
        int hi = hex_value(encoded[i + 1]);
        int lo = hex_value(encoded[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

static const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::string& str) {
    std::string result;
    result.reserve((str.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i < str.size()) {
        uint32_t octet_a = i < str.size() ? static_cast<unsigned char>(str[i++]) : 0;
        uint32_t octet_b = i < str.size() ? static_cast<unsigned char>(str[i++]) : 0;
        uint32_t octet_c = i < str.size() ? static_cast<unsigned char>(str[i++]) : 0;

        uint32_t triple = (octet_a << 16) + (octet_b << 8) + octet_c;

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += (i > str.size() + 1) ? '=' : base64_chars[(triple >> 6) & 0x3F];
        result += (i > str.size()) ? '=' : base64_chars[triple & 0x3F];
    }

    return result;
}

std::optional<std::string> base64_decode(const std::string& encoded) {
    int decode_table[256];
    std::fill(std::begin(decode_table), std::end(decode_table), -1);
    for (int i = 0; i < 64; ++i) {
        decode_table[static_cast<unsigned char>(base64_chars[i])] = i;
    }

    // Padding may only appear at the end, at most twice
    size_t data_len = encoded.size();
    while (data_len > 0 && encoded[data_len - 1] == '=' && encoded.size() - data_len < 2) {
        --data_len;
    }
    if (data_len % 4 == 1) return std::nullopt;
    if (data_len != encoded.size() && encoded.size() % 4 != 0) return std::nullopt;

    std::string result;
    result.reserve(data_len * 3 / 4);

    uint32_t val = 0;
    int bits = 0;
    for (size_t i = 0; i < data_len; ++i) {
        int d = decode_table[static_cast<unsigned char>(encoded[i])];
        if (d < 0) return std::nullopt;

        val = (val << 6) | static_cast<uint32_t>(d);
        bits += 6;

        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<char>((val >> bits) & 0xFF));
        }
    }

    return result;
}

std::string sha256_hex(std::span<const uint8_t> data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

static std::string sha256_hex(const std::string& data) {
    return sha256_hex(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

// ============================================================================
// HttpHeaders
// ============================================================================

bool HttpHeaders::name_equals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    remove(name);
    headers_.emplace_back(name, value);
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_.emplace_back(name, value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                                  [&](const HeaderPair& h) { return name_equals(h.first, name); }),
                   headers_.end());
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    for (const auto& [n, v] : headers_) {
        if (name_equals(n, name)) return v;
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return get(name).has_value();
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
            // Invalid Content-Length header format
        } catch (const std::out_of_range&) {
            // Content-Length value out of range
        }
    }
    return std::nullopt;
}

// ============================================================================
// HttpRequest
// ============================================================================

HttpRequest HttpRequest::make(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}

void HttpRequest::set_body(const std::string& text) {
    body.assign(text.begin(), text.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    size_t pos = scheme_end + 3;

    // Userinfo is not used for S3 endpoints; skip it
    size_t at_pos = url.find('@', pos);
    size_t slash_pos = url.find('/', pos);
    if (at_pos != std::string::npos && (slash_pos == std::string::npos || at_pos < slash_pos)) {
        pos = at_pos + 1;
    }

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) return std::nullopt;

    if (host_port.front() == '[') {
        // IPv6 literal
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) return std::nullopt;
        result.host = host_port.substr(0, bracket_end + 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else if (size_t colon_pos = host_port.rfind(':'); colon_pos != std::string::npos) {
        result.host = host_port.substr(0, colon_pos);
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }
    if (result.host.empty() || result.port < 0 || result.port > 65535) return std::nullopt;

    pos = host_end;

    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return result;
}

int ParsedUrl::effective_port() const {
    if (port != 0) return port;
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    return 0;
}

std::string ParsedUrl::host_header() const {
    bool default_port = port == 0 ||
                        (scheme == "https" && port == 443) ||
                        (scheme == "http" && port == 80);
    if (default_port) return host;
    return host + ":" + std::to_string(port);
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

// Per-exchange state shared by the curl callbacks
struct ExchangeContext {
    const HttpRequest* request = nullptr;
    HttpResponse* response = nullptr;
    CURL* curl = nullptr;
    size_t max_response_size = 0;
    size_t max_error_body_size = 0;

    std::span<const uint8_t> payload;
    size_t read_pos = 0;

    bool headers_checked = false;
    bool streaming = false;      // 2xx response with a body sink
    bool stopped = false;        // a callback asked to abort
    bool size_exceeded = false;
    std::exception_ptr failure;  // thrown by a caller hook inside curl
};

// Exceptions must not unwind through curl's C frames. A throwing hook
// stops the exchange; execute() rethrows once curl has returned.
template <class Fn, class R>
R guarded(ExchangeContext* ctx, Fn&& fn, R on_failure) {
    try {
        return fn();
    } catch (const std::exception&) {
        ctx->failure = std::current_exception();
        ctx->stopped = true;
        return on_failure;
    }
}

// Resolve the final status once, before the first body byte (or after an
// empty body), and give the caller a chance to veto the body.
bool deliver_headers(ExchangeContext* ctx) {
    if (ctx->headers_checked) return !ctx->stopped;
    ctx->headers_checked = true;

    long code = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
    ctx->response->status_code = static_cast<int>(code);
    ctx->streaming = ctx->request->on_body && is_success_status(ctx->response->status_code);

    if (ctx->request->on_headers) {
        ctx->response->headers_delivered = true;
        if (!ctx->request->on_headers(ctx->response->status_code, ctx->response->headers)) {
            ctx->stopped = true;
            return false;
        }
    }
    return true;
}

size_t write_body(ExchangeContext* ctx, char* ptr, size_t bytes) {

    if (!deliver_headers(ctx)) return 0;

    if (ctx->streaming) {
        if (ctx->request->should_abort && ctx->request->should_abort()) {
            ctx->stopped = true;
            return 0;
        }
        std::span<const uint8_t> chunk(reinterpret_cast<const uint8_t*>(ptr), bytes);
        if (!ctx->request->on_body(chunk)) {
            ctx->stopped = true;
            return 0;
        }
        ctx->response->bytes_streamed += bytes;
        return bytes;
    }

    auto& body = ctx->response->body;
    if (ctx->request->on_body) {
        // Error document while streaming: keep the head of it, drain the rest
        size_t room = ctx->max_error_body_size > body.size()
            ? ctx->max_error_body_size - body.size() : 0;
        body.insert(body.end(), ptr, ptr + std::min(room, bytes));
        return bytes;
    }

    if (ctx->max_response_size > 0 && body.size() + bytes > ctx->max_response_size) {
        ctx->size_exceeded = true;
        return 0;  // Return 0 to signal error and abort transfer
    }
    body.insert(body.end(), ptr, ptr + bytes);
    return bytes;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<ExchangeContext*>(userdata);
    size_t bytes = size * nmemb;
    return guarded(ctx, [&] { return write_body(ctx, ptr, bytes); }, size_t{0});
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty()) return bytes;

    // A new status line starts a new header block (e.g. after 100 Continue)
    if (line.starts_with("HTTP/")) {
        headers->clear();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? std::string() : value.substr(start);

        headers->add(name, value);
    }

    return bytes;
}

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<ExchangeContext*>(userdata);
    bool abort = guarded(ctx, [&] {
        return ctx->request->should_abort && ctx->request->should_abort();
    }, true);
    if (abort) {
        ctx->stopped = true;
        return CURL_READFUNC_ABORT;
    }

    size_t max_bytes = size * nitems;
    size_t remaining = ctx->payload.size() - ctx->read_pos;
    size_t to_copy = std::min(max_bytes, remaining);

    if (to_copy > 0) {
        std::memcpy(buffer, ctx->payload.data() + ctx->read_pos, to_copy);
        ctx->read_pos += to_copy;
    }
    return to_copy;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<ExchangeContext*>(clientp);
    bool abort = guarded(ctx, [&] {
        return ctx->request->should_abort && ctx->request->should_abort();
    }, true);
    if (abort) {
        ctx->stopped = true;
        return 1;  // Non-zero aborts the transfer
    }
    return 0;
}

TransportFault fault_from_curl(CURLcode res) {
    switch (res) {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportFault::Timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportFault::Resolve;
        case CURLE_COULDNT_CONNECT:
            return TransportFault::ConnectionRefused;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return TransportFault::ConnectionReset;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return TransportFault::Tls;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportFault::Aborted;
        default:
            return TransportFault::Other;
    }
}

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    const HttpClientConfig& config() const { return config_; }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create curl handle";
            response.is_network_error = true;
            response.fault = TransportFault::Other;
            return response;
        }

        ExchangeContext ctx;
        ctx.request = &request;
        ctx.response = &response;
        ctx.curl = curl;
        ctx.max_response_size = config_.max_response_size;
        ctx.max_error_body_size = config_.max_error_body_size;
        ctx.payload = request.payload();

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Never wait for 100-continue; parts are already in memory
        headers_list = curl_slist_append(headers_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &ctx);
            // Explicit length, also for empty PUTs (MinIO rejects them with 411 otherwise)
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(ctx.payload.size()));
        } else if (request.method == HttpMethod::POST) {
            static const char empty_body[] = "";
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(ctx.payload.size()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                             ctx.payload.empty() ? empty_body
                                                 : reinterpret_cast<const char*>(ctx.payload.data()));
        }

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(config_.receive_buffer_size));

        if (request.should_abort) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        // Timeouts: connect bound, optional total bound, and a stall detector
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        if (request.total_timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                             static_cast<long>(request.total_timeout.count()));
        }
        if (request.stall_timeout_secs > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                             static_cast<long>(request.stall_timeout_secs));
        }

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 60L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 30L);
        }

        if (request.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        // An empty proxy string also stops curl from reading *_proxy env vars,
        // so the configured proxy is the only one ever used
        curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy.c_str());

        // Signed requests must not be replayed against another host
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        CURLcode res = curl_easy_perform(curl);

        if (res == CURLE_OK) {
            if (!guarded(&ctx, [&] { return deliver_headers(&ctx); }, false)) {
                response.error = "aborted by caller";
                response.is_network_error = true;
                response.fault = TransportFault::Aborted;
            }
        } else if (ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;  // Payload Too Large
        } else {
            long code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
            response.status_code = static_cast<int>(code);
            response.is_network_error = true;
            if (ctx.stopped) {
                response.fault = TransportFault::Aborted;
                response.error = "aborted by caller";
            } else {
                response.fault = fault_from_curl(res);
                response.error = curl_easy_strerror(res);
            }
        }

        curl_slist_free_all(headers_list);
        release_handle(curl);
        if (ctx.failure) std::rethrow_exception(ctx.failure);
        return response;
    }

private:
    CURL* acquire_handle() {
        {
            std::lock_guard lock(pool_mutex_);
            if (!idle_handles_.empty()) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        curl_easy_reset(handle);

        std::lock_guard lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key,
                                        const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

static std::string hmac_sha256_hex(const std::vector<uint8_t>& key, const std::string& data) {
    auto hash = hmac_sha256(key, data);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (const auto b : hash) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

static std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

// Query params are already URL-encoded in the URL, so we just need to sort them
// and ensure params without values have the format "key=" (not just "key")
static std::string build_canonical_query_string(const std::string& query) {
    if (query.empty()) {
        return "";
    }

    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        size_t eq = param.find('=');
        if (eq != std::string::npos) {
            params[param.substr(0, eq)] = param.substr(eq + 1);
        } else if (!param.empty()) {
            params[param] = "";
        }
        pos = amp + 1;
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::string AwsSigV4Signer::get_canonical_request(const HttpRequest& request,
                                                  const std::string& signed_headers,
                                                  const std::string& payload_hash) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return "";

    std::ostringstream oss;

    oss << http_method_to_string(request.method) << "\n";

    std::string path = url->path.empty() ? "/" : url->path;
    oss << path << "\n";

    oss << build_canonical_query_string(url->query) << "\n";

    std::map<std::string, std::string> sorted_headers;
    for (const auto& [name, value] : request.headers.all()) {
        sorted_headers[lower(name)] = trim(value);
    }
    for (const auto& [name, value] : sorted_headers) {
        oss << name << ":" << value << "\n";
    }
    oss << "\n";

    oss << signed_headers << "\n";
    oss << payload_hash;

    return oss.str();
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                               const std::string& date,
                                               const std::string& canonical_request) const {
    std::ostringstream oss;
    oss << "AWS4-HMAC-SHA256\n";
    oss << datetime << "\n";
    oss << date << "/" << region_ << "/" << service_ << "/aws4_request\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                const std::string& string_to_sign) const {
    auto k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");

    return hmac_sha256_hex(k_signing, string_to_sign);
}

void AwsSigV4Signer::sign(HttpRequest& request,
                          std::chrono::system_clock::time_point now) const {
    std::string datetime = format_utc(now, "%Y%m%dT%H%M%SZ");
    std::string date = format_utc(now, "%Y%m%d");

    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    request.headers.set("Host", url->host_header());
    request.headers.set("X-Amz-Date", datetime);
    if (!session_token_.empty()) {
        request.headers.set("X-Amz-Security-Token", session_token_);
    }

    // Reuse pre-set payload hash (e.g. UNSIGNED-PAYLOAD) or compute it
    std::string payload_hash;
    if (auto existing = request.headers.get("X-Amz-Content-Sha256"); existing && !existing->empty()) {
        payload_hash = *existing;
    } else {
        payload_hash = sha256_hex(request.payload());
    }
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    std::set<std::string> header_names;
    for (const auto& [name, value] : request.headers.all()) {
        header_names.insert(lower(name));
    }

    std::string signed_headers;
    for (const auto& h : header_names) {
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += h;
    }

    std::string canonical_request = get_canonical_request(request, signed_headers, payload_hash);
    std::string string_to_sign = get_string_to_sign(datetime, date, canonical_request);
    std::string signature = calculate_signature(date, string_to_sign);

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 ";
    auth << "Credential=" << access_key_id_ << "/" << date << "/" << region_ << "/"
         << service_ << "/aws4_request, ";
    auth << "SignedHeaders=" << signed_headers << ", ";
    auth << "Signature=" << signature;

    request.headers.set("Authorization", auth.str());
}

} // namespace s3relay::net
