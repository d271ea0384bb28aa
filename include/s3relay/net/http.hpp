#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace s3relay::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

// Percent-encode everything except RFC 3986 unreserved characters
std::string url_encode(const std::string& str);

// Same as url_encode but keeps '/' so object keys map onto URL paths
std::string url_encode_path(const std::string& path);

// Reverse of url_encode. '+' is kept literally; empty on a malformed escape
std::optional<std::string> url_decode(const std::string& encoded);

std::string base64_encode(const std::string& str);

// Strict decode: rejects characters outside the standard alphabet and bad padding
std::optional<std::string> base64_decode(const std::string& encoded);

std::string sha256_hex(std::span<const uint8_t> data);

// Case-insensitive header collection (insertion order preserved)
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    void clear() { headers_.clear(); }

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    const std::vector<HeaderPair>& all() const { return headers_; }

    std::optional<uint64_t> content_length() const;

private:
    static bool name_equals(const std::string& a, const std::string& b);

    std::vector<HeaderPair> headers_;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;  // 0 when the URL carries no explicit port
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);

    int effective_port() const;

    // Host header value: host, plus ":port" when the port is not the scheme default
    std::string host_header() const;
};

// Transport-level failure, set when no complete HTTP exchange took place
enum class TransportFault {
    None,
    Timeout,
    ConnectionReset,
    ConnectionRefused,
    Resolve,
    Tls,
    Aborted,  // a callback asked to stop
    Other
};

const char* transport_fault_name(TransportFault fault);

// Called once the final status line and headers have arrived, before any
// body byte is delivered. Return false to abort the exchange.
using HeadersCallback = std::function<bool(int status, const HttpHeaders& headers)>;

// Receives response body bytes as they arrive. Return false to abort.
using BodySink = std::function<bool(std::span<const uint8_t> chunk)>;

// Polled during the exchange; returning true aborts it.
using AbortCheck = std::function<bool()>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // Owned request body. When body_view is non-empty it is sent instead and
    // the caller keeps the referenced bytes alive for the whole exchange.
    std::vector<uint8_t> body;
    std::span<const uint8_t> body_view;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{0};  // 0 = unbounded (streams)
    uint32_t stall_timeout_secs = 60;            // abort when no byte moves for this long
    bool verify_ssl = true;
    std::string proxy;                           // empty = direct connection

    HeadersCallback on_headers;
    BodySink on_body;  // when set, a 2xx body is streamed here instead of accumulated
    AbortCheck should_abort;

    std::span<const uint8_t> payload() const {
        if (!body_view.empty()) return body_view;
        return std::span<const uint8_t>(body.data(), body.size());
    }

    static HttpRequest make(HttpMethod method, const std::string& url);
    void set_body(const std::string& text);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;  // accumulated body, or the error body when streaming
    std::string error;
    bool is_network_error = false;
    TransportFault fault = TransportFault::None;
    uint64_t bytes_streamed = 0;  // bytes handed to on_body
    bool headers_delivered = false;

    bool ok() const {
        return !is_network_error && is_success_status(status_code);
    }

    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

struct HttpClientConfig {
    std::string user_agent = "s3-relay/1.0";
    size_t max_response_size = 16 * 1024 * 1024;  // cap for accumulated bodies
    size_t max_error_body_size = 64 * 1024;       // cap for error bodies while streaming
    size_t receive_buffer_size = 64 * 1024;
    size_t max_idle_handles = 16;
    bool tcp_keepalive = true;
    bool verbose = false;
};

// Blocking libcurl client. One exchange per execute() call; easy handles are
// pooled and reused so keep-alive connections survive between requests.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // An exception thrown by on_headers, on_body or should_abort stops the
    // exchange and is rethrown here once curl has let go of the handle.
    HttpResponse execute(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS Signature Version 4 request signer
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service = "s3");

    // Adds Host, X-Amz-Date, X-Amz-Content-Sha256 (and X-Amz-Security-Token
    // when a session token is set) and the Authorization header.
    void sign(HttpRequest& request,
              std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    void set_session_token(const std::string& token) { session_token_ = token; }

    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;

private:
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;

    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
    std::string session_token_;
};

} // namespace s3relay::net
