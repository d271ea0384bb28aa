#include "s3relay/relay_server.hpp"
#include "s3relay/error_classifier.hpp"
#include "s3relay/log.hpp"
#include "s3relay/metrics.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <limits>
#include <sstream>
#include <string_view>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/socket.h>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace s3relay {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

constexpr const char* SERVER_NAME = "s3-relay";
constexpr uint32_t HEADER_LIMIT = 16 * 1024;
constexpr size_t MAX_JSON_BODY = 1024 * 1024;
constexpr size_t JSON_READ_CHUNK = 8192;
constexpr auto SSE_KEEPALIVE = std::chrono::seconds(15);
constexpr auto SSE_POLL = std::chrono::seconds(1);
constexpr auto JOB_EVENT_GAP = std::chrono::milliseconds(250);

// Blocking stream over a non-blocking socket: each read or write waits at
// most `timeout` for the peer, then fails with timed_out.
class TimedStream {
public:
    TimedStream(tcp::socket& socket, std::chrono::milliseconds timeout)
        : socket_(socket), timeout_(timeout) {}

    template <class MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers, beast::error_code& ec) {
        for (;;) {
            std::size_t n = socket_.read_some(buffers, ec);
            if (ec != asio::error::would_block && ec != asio::error::try_again) return n;
            if (!wait_ready(POLLIN, ec)) return 0;
        }
    }

    template <class MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers) {
        beast::error_code ec;
        std::size_t n = read_some(buffers, ec);
        if (ec) throw beast::system_error(ec);
        return n;
    }

    template <class ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence& buffers, beast::error_code& ec) {
        for (;;) {
            std::size_t n = socket_.write_some(buffers, ec);
            if (ec != asio::error::would_block && ec != asio::error::try_again) return n;
            if (!wait_ready(POLLOUT, ec)) return 0;
        }
    }

    template <class ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence& buffers) {
        beast::error_code ec;
        std::size_t n = write_some(buffers, ec);
        if (ec) throw beast::system_error(ec);
        return n;
    }

    tcp::socket& socket() { return socket_; }

private:
    bool wait_ready(short events, beast::error_code& ec) {
        pollfd pfd{};
        pfd.fd = socket_.native_handle();
        pfd.events = events;
        for (;;) {
            int rc = ::poll(&pfd, 1, static_cast<int>(timeout_.count()));
            if (rc > 0) {
                ec = {};
                return true;
            }
            if (rc == 0) {
                ec = asio::error::timed_out;
                return false;
            }
            if (errno != EINTR) {
                ec = beast::error_code(errno, boost::system::system_category());
                return false;
            }
        }
    }

    tcp::socket& socket_;
    std::chrono::milliseconds timeout_;
};

std::string strip_query(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

std::string get_query_param(const std::string& target, const std::string& key) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return "";
    }
    auto query = target.substr(pos + 1);
    std::stringstream ss(query);
    std::string item;
    while (std::getline(ss, item, '&')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (item.substr(0, eq) == key) {
            return item.substr(eq + 1);
        }
    }
    return "";
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/')) {
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// Failures caused by the request itself rather than the backend
ClassifiedError request_error(int status, const std::string& code, const std::string& message) {
    ClassifiedError err;
    err.kind = ErrorKind::Configuration;
    err.http_status = status;
    err.code = code;
    err.message = message;
    err.retriable = false;
    return err;
}

std::optional<std::string> decode_base64_segment(const std::string& segment) {
    auto unescaped = net::url_decode(segment);
    if (!unescaped) return std::nullopt;
    return net::base64_decode(*unescaped);
}

// Object data in keys may be any UTF-8; anything else is replaced rather
// than thrown from a response body
std::string dump_json(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

// --- Response headers ---

std::string content_disposition(const std::string& key, bool attachment) {
    auto pos = key.find_last_of('/');
    std::string name = pos == std::string::npos ? key : key.substr(pos + 1);

    // Quoted fallback: printable ASCII only
    std::string fallback;
    fallback.reserve(name.size());
    for (char c : name) {
        auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u >= 0x7f || c == '"' || c == '\\') {
            fallback += '_';
        } else {
            fallback += c;
        }
    }
    if (fallback.empty()) fallback = "download";

    std::string value = attachment ? "attachment" : "inline";
    value += "; filename=\"" + fallback + "\"";
    // RFC 6266 / RFC 8187 extended parameter carries the exact name
    if (!name.empty() && valid_utf8(name)) {
        value += "; filename*=UTF-8''" + net::url_encode(name);
    }
    return value;
}

// --- Validation ---

bool valid_bucket_name(const std::string& name) {
    if (name.size() < 3 || name.size() > 63) return false;
    // No dots, so IP-shaped names are rejected here too
    for (char c : name) {
        if (!(std::islower(static_cast<unsigned char>(c)) ||
              std::isdigit(static_cast<unsigned char>(c)) || c == '-')) {
            return false;
        }
    }
    if (name.front() == '-' || name.back() == '-') return false;
    // Also covers the reserved "xn--" prefix
    if (name.find("--") != std::string::npos) return false;
    return true;
}

bool valid_utf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (n - i <= extra) return false;
        for (size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, UTF-16 surrogates and values past U+10FFFF
        static constexpr uint32_t MIN_FOR_LENGTH[] = {0, 0x80, 0x800, 0x10000};
        if (cp < MIN_FOR_LENGTH[extra]) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;
        i += extra + 1;
    }
    return true;
}

std::optional<std::string> decode_prefix(const std::string& segment) {
    if (segment.size() > 2048) return std::nullopt;
    auto decoded = decode_base64_segment(segment);
    if (!decoded || decoded->size() > 1024) return std::nullopt;
    if (decoded->find("..") != std::string::npos) return std::nullopt;
    if (decoded->find('\0') != std::string::npos) return std::nullopt;
    if (!valid_utf8(*decoded)) return std::nullopt;
    return decoded;
}

std::optional<std::string> decode_key(const std::string& segment) {
    auto decoded = decode_base64_segment(segment);
    if (!decoded || decoded->empty() || decoded->size() > 1024) return std::nullopt;
    if (decoded->find('\0') != std::string::npos) return std::nullopt;
    if (!valid_utf8(*decoded)) return std::nullopt;
    return decoded;
}

bool valid_continuation_token(const std::string& token) {
    if (token.empty() || token.size() > 512) return false;
    return std::all_of(token.begin(), token.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' ||
               c == '=' || c == '-' || c == '_' || c == '.';
    });
}

std::optional<ByteRange> parse_range_header(const std::string& value) {
    const std::string prefix = "bytes=";
    if (!value.starts_with(prefix)) return std::nullopt;
    auto ranges = value.substr(prefix.size());
    if (ranges.find(',') != std::string::npos) return std::nullopt;

    auto dash = ranges.find('-');
    if (dash == std::string::npos || dash == 0) return std::nullopt;

    auto parse_number = [](const std::string& text) -> std::optional<uint64_t> {
        if (text.empty() || text.size() > 19) return std::nullopt;
        if (!std::all_of(text.begin(), text.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return std::nullopt;
        }
        return std::stoull(text);
    };

    auto start = parse_number(ranges.substr(0, dash));
    if (!start) return std::nullopt;

    ByteRange range;
    range.start = *start;
    auto end_text = ranges.substr(dash + 1);
    if (!end_text.empty()) {
        auto end = parse_number(end_text);
        if (!end || *end < *start) return std::nullopt;
        range.end = *end;
    }
    return range;
}

// --- Exchange ---

// One request/response on a connection
struct HttpExchange {
    TimedStream& stream;
    beast::flat_buffer& buffer;
    http::request_parser<http::buffer_body>& parser;
    std::string method;
    std::string target;
    std::string path;
    std::vector<std::string> segments;
    unsigned version = 11;
    int status = 0;
    bool keep_alive = true;
    bool log_access = true;
    std::string client_ip = "unknown";

    std::string header(http::field field) const {
        const auto& msg = parser.get();
        auto it = msg.find(field);
        return it == msg.end() ? std::string{} : std::string(it->value());
    }

    std::string query(const std::string& key) const {
        return get_query_param(target, key);
    }

    bool is(http::verb verb) const {
        return parser.get().method() == verb;
    }
};

namespace {

bool write_response(HttpExchange& ex, http::response<http::string_body>& res) {
    res.version(ex.version);
    res.set(http::field::server, SERVER_NAME);
    res.keep_alive(ex.keep_alive && ex.parser.is_done() && ex.parser.get().keep_alive());
    res.prepare_payload();

    beast::error_code ec;
    http::write(ex.stream, res, ec);
    ex.status = static_cast<int>(res.result_int());
    if (ec || !res.keep_alive()) ex.keep_alive = false;
    if (ec) {
        log_debug("Response write failed on %s %s: %s", ex.method.c_str(), ex.path.c_str(),
                  ec.message().c_str());
        return false;
    }
    return true;
}

void send_json(HttpExchange& ex, int status, const nlohmann::json& body,
               const std::string& transfer_id = {}) {
    http::response<http::string_body> res;
    res.result(static_cast<unsigned>(status));
    res.set(http::field::content_type, "application/json");
    if (!transfer_id.empty()) {
        res.set("X-Transfer-Id", transfer_id);
        res.set(http::field::access_control_expose_headers, "X-Transfer-Id");
    }
    res.body() = dump_json(body);
    write_response(ex, res);
}

void send_error(HttpExchange& ex, const ClassifiedError& error, const std::string& transfer_id = {}) {
    send_json(ex, error.http_status, to_json(error), transfer_id);
}

void send_message(HttpExchange& ex, const std::string& message) {
    send_json(ex, 200, {{"message", message}});
}

void send_not_found(HttpExchange& ex) {
    send_error(ex, request_error(404, "NotFound", "no route for " + ex.method + " " + ex.path));
}

void send_method_not_allowed(HttpExchange& ex) {
    send_error(ex, request_error(405, "MethodNotAllowed",
                                 ex.method + " is not supported on " + ex.path));
}

// Read a small request body into `out`. Answers the request itself (413 or
// nothing at all for a dead peer) and returns false on failure.
bool read_body(HttpExchange& ex, std::string& out) {
    char chunk[JSON_READ_CHUNK];
    auto& body = ex.parser.get().body();
    while (!ex.parser.is_done()) {
        body.data = chunk;
        body.size = sizeof(chunk);
        beast::error_code ec;
        http::read(ex.stream, ex.buffer, ex.parser, ec);
        if (ec == http::error::need_buffer) ec = {};
        if (ec) {
            log_debug("Request body read failed on %s: %s", ex.path.c_str(), ec.message().c_str());
            ex.keep_alive = false;
            ex.status = STATUS_CLIENT_CLOSED;
            return false;
        }
        out.append(chunk, sizeof(chunk) - body.size);
        if (out.size() > MAX_JSON_BODY) {
            ex.keep_alive = false;
            send_error(ex, request_error(413, "EntityTooLarge", "request body exceeds 1 MiB"));
            return false;
        }
    }
    return true;
}

bool read_json(HttpExchange& ex, nlohmann::json& out) {
    std::string text;
    if (!read_body(ex, text)) return false;
    if (text.empty()) {
        out = nlohmann::json::object();
        return true;
    }
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        send_error(ex, request_error(400, "MalformedJSON", e.what()));
        return false;
    }
    if (!out.is_object()) {
        send_error(ex, request_error(400, "MalformedJSON", "request body must be a JSON object"));
        return false;
    }
    return true;
}

// A text/event-stream response written piece by piece; the connection
// closes when it ends.
class EventStream {
public:
    explicit EventStream(HttpExchange& ex)
        : ex_(ex), res_{http::status::ok, ex.version}, sr_{res_} {}

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    void set(const char* name, const std::string& value) { res_.set(name, value); }

    bool open() {
        res_.set(http::field::server, SERVER_NAME);
        res_.set(http::field::content_type, "text/event-stream");
        res_.set(http::field::cache_control, "no-cache");
        res_.keep_alive(false);
        if (ex_.version >= 11) res_.chunked(true);
        res_.body().data = nullptr;
        res_.body().more = true;

        http::write_header(ex_.stream, sr_, ec_);
        ex_.keep_alive = false;
        ex_.status = 200;
        return !ec_;
    }

    bool send(const std::string& text) {
        res_.body().data = const_cast<char*>(text.data());
        res_.body().size = text.size();
        res_.body().more = true;
        http::write(ex_.stream, sr_, ec_);
        if (ec_ == http::error::need_buffer) ec_ = {};
        return !ec_;
    }

    bool event(const nlohmann::json& body) { return send("data: " + dump_json(body) + "\n\n"); }
    bool keepalive() { return send(": keepalive\n\n"); }

    void close() {
        res_.body().data = nullptr;
        res_.body().size = 0;
        res_.body().more = false;
        http::write(ex_.stream, sr_, ec_);
    }

private:
    HttpExchange& ex_;
    http::response<http::buffer_body> res_;
    http::response_serializer<http::buffer_body> sr_;
    beast::error_code ec_;
};

// {"type", "locationId", "path"} under `field`. Returns error message or
// empty string.
std::string location_from_json(const nlohmann::json& body, const char* field, Location& out) {
    if (!body.contains(field) || !body[field].is_object()) {
        return std::string("'") + field + "' must be an object";
    }
    const auto& j = body[field];
    auto text = [&](const char* key, std::string& value) -> bool {
        if (!j.contains(key) || j[key].is_null()) return true;
        if (!j[key].is_string()) return false;
        value = j[key].get<std::string>();
        return true;
    };

    std::string type;
    if (!text("type", type)) return std::string("'") + field + ".type' must be a string";
    auto parsed = parse_location_type(type);
    if (!parsed) return std::string("'") + field + ".type' must be \"local\" or \"s3\"";
    out.type = *parsed;
    if (!text("locationId", out.id) || out.id.empty()) {
        return std::string("'") + field + ".locationId' is required";
    }
    if (!text("path", out.path)) return std::string("'") + field + ".path' must be a string";
    if (!valid_utf8(out.path)) return std::string("'") + field + ".path' is not valid UTF-8";
    if (out.type == LocationType::S3 && !valid_bucket_name(out.id)) {
        return "invalid bucket name: " + out.id;
    }
    return {};
}

std::string files_from_json(const nlohmann::json& body, std::vector<std::string>& out) {
    if (!body.contains("files") || !body["files"].is_array()) return "'files' must be an array";
    for (const auto& item : body["files"]) {
        if (!item.is_string()) return "'files' must hold strings";
        auto name = item.get<std::string>();
        if (name.empty() || !valid_utf8(name)) return "file names must be non-empty UTF-8";
        out.push_back(std::move(name));
    }
    return {};
}

// Upload body pulled straight off the socket into the engine's window
class RequestBodySource : public ByteSource {
public:
    explicit RequestBodySource(HttpExchange& ex) : ex_(ex) {}

    size_t read(std::span<uint8_t> out, StorageError& error) override {
        auto& body = ex_.parser.get().body();
        while (!ex_.parser.is_done()) {
            body.data = out.data();
            body.size = out.size();
            beast::error_code ec;
            http::read_some(ex_.stream, ex_.buffer, ex_.parser, ec);
            if (ec == http::error::need_buffer) ec = {};
            size_t n = out.size() - body.size;
            if (ec) {
                ex_.keep_alive = false;
                if (ec == asio::error::timed_out) {
                    error = StorageError::network(net::TransportFault::Timeout,
                                                  "client stalled while sending the request body");
                } else {
                    error = StorageError::client_disconnect("request body: " + ec.message());
                }
                return 0;
            }
            if (n > 0) return n;
        }
        return 0;
    }

private:
    HttpExchange& ex_;
};

// Download response written as the backend delivers it. Headers go out in
// begin(), once the backend has accepted the read.
class ResponseSink : public ByteSink {
public:
    ResponseSink(HttpExchange& ex, std::string transfer_id, bool attachment, std::string key)
        : ex_(ex)
        , transfer_id_(std::move(transfer_id))
        , attachment_(attachment)
        , key_(std::move(key)) {}

    bool begin(const ObjectInfo& info) override {
        res_.version(ex_.version);
        res_.result(info.range_start ? http::status::partial_content : http::status::ok);
        res_.set(http::field::server, SERVER_NAME);
        res_.set(http::field::content_type,
                 attachment_ ? std::string("application/octet-stream") : info.content_type);
        res_.set(http::field::content_disposition, content_disposition(key_, attachment_));
        res_.set(http::field::access_control_expose_headers, "Content-Disposition, X-Transfer-Id");
        res_.set(http::field::accept_ranges, "bytes");
        res_.set("X-Transfer-Id", transfer_id_);
        if (!info.etag.empty()) res_.set(http::field::etag, info.etag);
        if (!info.last_modified.empty()) res_.set(http::field::last_modified, info.last_modified);
        std::optional<uint64_t> length = info.size;
        if (!length && info.range_start && info.total_size && *info.total_size > *info.range_start) {
            length = *info.total_size - *info.range_start;
        }
        if (info.range_start && length) {
            std::string total = info.total_size ? std::to_string(*info.total_size) : "*";
            uint64_t last = *length == 0 ? *info.range_start : *info.range_start + *length - 1;
            res_.set(http::field::content_range,
                     "bytes " + std::to_string(*info.range_start) + "-" + std::to_string(last) + "/" + total);
        }
        bool keep_alive = ex_.keep_alive && ex_.parser.get().keep_alive();
        if (info.size) {
            res_.content_length(*info.size);
        } else if (ex_.version >= 11) {
            // Length unknown up front: the terminating chunk marks the end
            res_.chunked(true);
        } else {
            // HTTP/1.0 has no chunking; closing the connection ends the body
            keep_alive = false;
        }
        res_.keep_alive(keep_alive);
        res_.body().data = nullptr;
        res_.body().more = true;

        beast::error_code ec;
        http::write_header(ex_.stream, sr_, ec);
        ex_.status = static_cast<int>(res_.result_int());
        if (ec) {
            ex_.keep_alive = false;
            return false;
        }
        if (!res_.keep_alive()) ex_.keep_alive = false;
        return true;
    }

    bool write(std::span<const uint8_t> chunk) override {
        res_.body().data = const_cast<uint8_t*>(chunk.data());
        res_.body().size = chunk.size();
        res_.body().more = true;
        beast::error_code ec;
        http::write(ex_.stream, sr_, ec);
        if (ec == http::error::need_buffer) ec = {};
        if (ec) {
            log_debug("Download %s: client write failed: %s", transfer_id_.c_str(), ec.message().c_str());
            ex_.keep_alive = false;
            return false;
        }
        return true;
    }

    bool finish() override {
        res_.body().data = nullptr;
        res_.body().size = 0;
        res_.body().more = false;
        beast::error_code ec;
        http::write(ex_.stream, sr_, ec);
        if (ec == http::error::need_buffer) ec = {};
        if (ec) {
            ex_.keep_alive = false;
            return false;
        }
        return true;
    }

    void abort() override {
        ex_.keep_alive = false;
        beast::error_code ec;
        ex_.stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

private:
    HttpExchange& ex_;
    std::string transfer_id_;
    bool attachment_;
    std::string key_;
    http::response<http::buffer_body> res_;
    http::response_serializer<http::buffer_body> sr_{res_};
};

nlohmann::json list_entry_json(const ListEntry& entry) {
    return {
        {"Key", entry.key},
        {"LastModified", entry.last_modified},
        {"ETag", entry.etag},
        {"Size", entry.size},
        {"StorageClass", entry.storage_class},
    };
}

}  // namespace

// --- Server ---

RelayServer::RelayServer(const RelayConfig& config,
                         BackendRegistry& registry,
                         ConcurrencyGate& gate,
                         ProgressNotifier& notifier,
                         TransferEngine& engine,
                         AccessLog& access_log)
    : config_(config)
    , registry_(registry)
    , gate_(gate)
    , notifier_(notifier)
    , engine_(engine)
    , access_log_(access_log)
    , jobs_(config.local_paths, registry, gate, engine)
    , acceptor_(io_) {}

RelayServer::~RelayServer() {
    stop();
}

std::string RelayServer::start() {
    beast::error_code ec;
    auto address = asio::ip::make_address(config_.listen_address, ec);
    if (ec) {
        return "invalid listen address '" + config_.listen_address + "': " + ec.message();
    }
    tcp::endpoint endpoint{address, config_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) return "cannot open listener: " + ec.message();
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec) {
        acceptor_.close(ec);
        return "cannot bind " + config_.listen_address + ":" + std::to_string(config_.port) + ": " +
               ec.message();
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        acceptor_.close(ec);
        return "cannot listen: " + ec.message();
    }
    bound_port_ = acceptor_.local_endpoint(ec).port();

    running_ = true;
    accept_thread_ = std::thread(&RelayServer::accept_loop, this);

    log_info("HTTP server listening on %s:%u", config_.listen_address.c_str(),
             static_cast<unsigned>(bound_port_));
    return {};
}

void RelayServer::stop() {
    if (!running_.exchange(false)) return;

    log_info("Shutting down HTTP server...");

    // Unblock accept()
    ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
    if (accept_thread_.joinable()) accept_thread_.join();
    beast::error_code ec;
    acceptor_.close(ec);

    // Running transfers fail as cancelled; their connections then close
    jobs_.stop();
    for (const auto& info : engine_.active()) {
        engine_.cancel(info.id);
    }

    std::unique_lock lock(connections_mutex_);
    for (int fd : connection_fds_) {
        ::shutdown(fd, SHUT_RDWR);
    }
    while (connection_count_ > 0) {
        if (!connections_cv_.wait_for(lock, std::chrono::seconds(5),
                                      [this] { return connection_count_ == 0; })) {
            log_info("Waiting for %zu connections to close", connection_count_);
        }
    }

    log_info("HTTP server stopped");
}

void RelayServer::accept_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        auto socket = std::make_unique<tcp::socket>(io_);
        beast::error_code ec;
        acceptor_.accept(*socket, ec);
        if (ec) {
            if (!running_.load()) break;
            if (ec == asio::error::interrupted || ec == asio::error::connection_aborted) continue;
            log_error("Accept failed: %s", ec.message().c_str());
            continue;
        }

        {
            std::lock_guard lock(connections_mutex_);
            connection_fds_.insert(socket->native_handle());
            ++connection_count_;
        }
        std::thread(&RelayServer::handle_connection, this, std::move(socket)).detach();
    }
}

void RelayServer::handle_connection(std::unique_ptr<tcp::socket> socket) {
    const int fd = socket->native_handle();
    beast::error_code ec;
    socket->non_blocking(true, ec);
    auto remote = socket->remote_endpoint(ec);
    std::string client_ip = ec ? std::string("unknown") : remote.address().to_string();

    {
        // Reads and writes carry the stall timeout
        TimedStream stream(*socket, std::chrono::seconds(config_.backend.stall_timeout_secs));
        beast::flat_buffer buffer;

        while (running_.load(std::memory_order_relaxed)) {
            http::request_parser<http::buffer_body> parser;
            parser.header_limit(HEADER_LIMIT);
            parser.body_limit(std::numeric_limits<std::uint64_t>::max());

            http::read_header(stream, buffer, parser, ec);
            if (ec) {
                if (ec != http::error::end_of_stream && ec != asio::error::eof) {
                    log_debug("Connection closed: %s", ec.message().c_str());
                }
                break;
            }

            const auto& msg = parser.get();
            HttpExchange ex{stream, buffer, parser};
            ex.method = std::string(msg.method_string());
            ex.target = std::string(msg.target());
            ex.path = strip_query(ex.target);
            ex.segments = split_path(ex.path);
            ex.version = msg.version();
            ex.client_ip = client_ip;

            auto started = std::chrono::steady_clock::now();
            try {
                dispatch(ex);
            } catch (const std::exception& e) {
                log_error("Unhandled error on %s %s: %s", ex.method.c_str(), ex.path.c_str(), e.what());
                ex.keep_alive = false;
                if (ex.status == 0) {
                    send_error(ex, classify(StorageError::internal(e.what())));
                }
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);

            if (ex.log_access) {
                try {
                    access_log_.record(ex.method, ex.path, ex.status, elapsed);
                } catch (const std::exception& e) {
                    log_warn("Access log entry for %s dropped: %s", ex.method.c_str(), e.what());
                }
            }
            log_debug("%s %s -> %d (%lld ms)", ex.method.c_str(), ex.path.c_str(), ex.status,
                      static_cast<long long>(elapsed.count()));

            if (!ex.keep_alive || !parser.is_done() || !msg.keep_alive()) break;
        }
    }

    std::lock_guard lock(connections_mutex_);
    connection_fds_.erase(fd);
    socket->shutdown(tcp::socket::shutdown_both, ec);
    socket->close(ec);
    socket.reset();
    --connection_count_;
    connections_cv_.notify_all();
}

void RelayServer::dispatch(HttpExchange& ex) {
    const auto& s = ex.segments;

    if (ex.path == "/metrics" && metrics_ && ex.is(http::verb::get)) {
        ex.log_access = false;
        http::response<http::string_body> res;
        res.result(http::status::ok);
        res.set(http::field::content_type, "text/plain; version=0.0.4");
        res.body() = metrics_->serialize();
        write_response(ex, res);
        return;
    }

    if (s.empty() || s[0] != "api") {
        send_not_found(ex);
        return;
    }

    // Health and idle-culler polls stay out of the access log so they do
    // not count as activity
    if (s.size() == 1) {
        ex.log_access = false;
        send_json(ex, 200, {{"status", "ok"}});
        return;
    }

    const std::string& area = s[1];
    if (area == "buckets") {
        handle_buckets(ex);
    } else if (area == "objects") {
        handle_objects(ex);
    } else if (area == "transfers") {
        handle_transfers(ex);
    } else if (area == "transfer") {
        handle_transfer_jobs(ex);
    } else if (area == "settings") {
        handle_settings(ex);
    } else if ((area == "kernels" || area == "terminals") && s.size() == 2) {
        ex.log_access = false;
        if (!ex.is(http::verb::get)) {
            send_method_not_allowed(ex);
            return;
        }
        send_json(ex, 200, access_log_.last_entry());
    } else {
        send_not_found(ex);
    }
}

std::shared_ptr<const ActiveClient> RelayServer::active_client(HttpExchange& ex) {
    auto client = registry_.get();
    if (!client) {
        send_error(ex, classify(StorageError::configuration("no storage backend configured")));
    }
    return client;
}

// --- Buckets ---

void RelayServer::handle_buckets(HttpExchange& ex) {
    const auto& s = ex.segments;

    if (s.size() == 2 && ex.is(http::verb::get)) {
        auto client = active_client(ex);
        if (!client) return;
        auto result = client->store->list_buckets();
        if (!result.error.ok()) {
            log_error("List buckets failed: %s", result.error.describe().c_str());
            send_error(ex, classify(result.error));
            return;
        }
        auto buckets = nlohmann::json::array();
        for (const auto& bucket : result.buckets) {
            buckets.push_back({{"Name", bucket.name}, {"CreationDate", bucket.creation_date}});
        }
        send_json(ex, 200, {{"buckets", buckets}});
        return;
    }

    if (s.size() == 2 && ex.is(http::verb::post)) {
        nlohmann::json body;
        if (!read_json(ex, body)) return;
        if (!body.contains("bucketName") || !body["bucketName"].is_string()) {
            send_error(ex, request_error(400, "InvalidBucketName", "bucketName is required"));
            return;
        }
        auto name = body["bucketName"].get<std::string>();
        if (!valid_bucket_name(name)) {
            send_error(ex, request_error(400, "InvalidBucketName", "invalid bucket name: " + name));
            return;
        }
        auto client = active_client(ex);
        if (!client) return;
        auto err = client->store->create_bucket(name);
        if (!err.ok()) {
            log_error("Create bucket %s failed: %s", name.c_str(), err.describe().c_str());
            send_error(ex, classify(err));
            return;
        }
        log_info("Bucket created: %s", name.c_str());
        send_message(ex, "Bucket created successfully");
        return;
    }

    if (s.size() == 3 && ex.is(http::verb::delete_)) {
        const auto& name = s[2];
        if (!valid_bucket_name(name)) {
            send_error(ex, request_error(400, "InvalidBucketName", "invalid bucket name: " + name));
            return;
        }
        auto client = active_client(ex);
        if (!client) return;
        auto err = client->store->delete_bucket(name);
        if (!err.ok()) {
            log_error("Delete bucket %s failed: %s", name.c_str(), err.describe().c_str());
            send_error(ex, classify(err));
            return;
        }
        log_info("Bucket deleted: %s", name.c_str());
        send_message(ex, "Bucket deleted successfully");
        return;
    }

    if (s.size() <= 3) {
        send_method_not_allowed(ex);
    } else {
        send_not_found(ex);
    }
}

// --- Objects ---

void RelayServer::handle_objects(HttpExchange& ex) {
    const auto& s = ex.segments;

    if (s.size() == 5 && (s[2] == "download" || s[2] == "view")) {
        if (!ex.is(http::verb::get)) {
            send_method_not_allowed(ex);
            return;
        }
        handle_download(ex, s[3], s[4], s[2] == "download");
        return;
    }
    if (s.size() == 5 && s[2] == "upload") {
        if (!ex.is(http::verb::post) && !ex.is(http::verb::put)) {
            send_method_not_allowed(ex);
            return;
        }
        handle_upload(ex, s[3], s[4]);
        return;
    }
    if ((s.size() == 3 || s.size() == 4) && ex.is(http::verb::get)) {
        handle_listing(ex, s[2], s.size() == 4 ? s[3] : std::string{});
        return;
    }
    if (s.size() == 4 && ex.is(http::verb::delete_)) {
        handle_delete(ex, s[2], s[3]);
        return;
    }
    send_not_found(ex);
}

void RelayServer::handle_listing(HttpExchange& ex, const std::string& bucket,
                                 const std::string& b64prefix) {
    if (!valid_bucket_name(bucket)) {
        send_error(ex, request_error(400, "InvalidBucketName", "invalid bucket name: " + bucket));
        return;
    }

    ListOptions options;
    options.delimiter = "/";
    options.max_keys = constants::DEFAULT_LIST_MAX_KEYS;
    if (!b64prefix.empty()) {
        auto prefix = decode_prefix(b64prefix);
        if (!prefix) {
            send_error(ex, request_error(400, "InvalidPrefix", "prefix is not a valid base64 key prefix"));
            return;
        }
        options.prefix = *prefix;
    }

    auto max_keys = ex.query("maxKeys");
    if (!max_keys.empty()) {
        bool numeric = max_keys.size() <= 4 &&
                       std::all_of(max_keys.begin(), max_keys.end(),
                                   [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
        uint32_t value = numeric ? static_cast<uint32_t>(std::stoul(max_keys)) : 0;
        if (value < 1 || value > constants::DEFAULT_LIST_MAX_KEYS) {
            send_error(ex, request_error(400, "InvalidArgument", "maxKeys must be between 1 and 1000"));
            return;
        }
        options.max_keys = value;
    }

    auto token = ex.query("continuationToken");
    if (!token.empty()) {
        auto decoded = net::url_decode(token);
        if (!decoded || !valid_continuation_token(*decoded)) {
            send_error(ex, request_error(400, "InvalidArgument", "continuationToken is malformed"));
            return;
        }
        options.continuation_token = *decoded;
    }

    auto client = active_client(ex);
    if (!client) return;
    auto result = client->store->list_objects(bucket, options);
    if (!result.error.ok()) {
        log_error("List %s/%s failed: %s", bucket.c_str(), options.prefix.c_str(),
                  result.error.describe().c_str());
        send_error(ex, classify(result.error));
        return;
    }

    auto objects = nlohmann::json::array();
    for (const auto& entry : result.objects) {
        objects.push_back(list_entry_json(entry));
    }
    auto prefixes = nlohmann::json::array();
    for (const auto& prefix : result.prefixes) {
        prefixes.push_back({{"Prefix", prefix}});
    }
    nlohmann::json body = {
        {"objects", objects},
        {"prefixes", prefixes},
        {"isTruncated", result.truncated},
    };
    if (result.truncated) {
        body["nextContinuationToken"] = result.next_continuation_token;
    }
    send_json(ex, 200, body);
}

void RelayServer::handle_download(HttpExchange& ex, const std::string& bucket,
                                  const std::string& b64key, bool attachment) {
    if (!valid_bucket_name(bucket)) {
        send_error(ex, request_error(400, "InvalidBucketName", "invalid bucket name: " + bucket));
        return;
    }
    auto key = decode_key(b64key);
    if (!key) {
        send_error(ex, request_error(400, "InvalidKey", "object key is not valid base64"));
        return;
    }

    DownloadRequest request;
    request.bucket = bucket;
    request.key = *key;
    auto range_header = ex.header(http::field::range);
    if (!range_header.empty()) {
        request.range = parse_range_header(range_header);
        if (!request.range) {
            send_error(ex, request_error(416, "InvalidRange", "unsupported Range: " + range_header));
            return;
        }
    }

    auto ticket = engine_.create_ticket(TransferDirection::Download, bucket, *key);
    ResponseSink sink(ex, ticket->id(), attachment, *key);
    auto outcome = engine_.download(ticket, sink, request);

    if (outcome.ok()) return;
    if (!outcome.headers_sent) {
        if (outcome.error->kind == ErrorKind::ClientDisconnect) {
            ex.keep_alive = false;
            ex.status = outcome.error->http_status;
            return;
        }
        send_error(ex, *outcome.error, ticket->id());
        return;
    }
    // The sink was aborted; the access log records the failure
    ex.status = outcome.error->http_status;
    ex.keep_alive = false;
}

void RelayServer::handle_upload(HttpExchange& ex, const std::string& bucket, const std::string& b64key) {
    if (rate_limited(ex, "upload", config_.upload_rate_limit)) return;
    if (!valid_bucket_name(bucket)) {
        send_error(ex, request_error(400, "InvalidBucketName", "invalid bucket name: " + bucket));
        return;
    }
    auto key = decode_key(b64key);
    if (!key) {
        send_error(ex, request_error(400, "InvalidKey", "object key is not valid base64"));
        return;
    }

    UploadRequest request;
    request.bucket = bucket;
    request.key = *key;
    request.content_type = ex.header(http::field::content_type);
    if (request.content_type.empty()) request.content_type = "application/octet-stream";
    if (auto length = ex.parser.content_length()) {
        request.size = *length;
    }

    if (iequals(ex.header(http::field::expect), "100-continue") && !ex.parser.is_done()) {
        http::response<http::empty_body> cont{http::status::continue_, ex.version};
        cont.set(http::field::server, SERVER_NAME);
        beast::error_code ec;
        http::write(ex.stream, cont, ec);
        if (ec) {
            ex.keep_alive = false;
            ex.status = STATUS_CLIENT_CLOSED;
            return;
        }
    }

    auto ticket = engine_.create_ticket(TransferDirection::Upload, bucket, *key, request.size);
    RequestBodySource source(ex);
    auto outcome = engine_.upload(ticket, source, request);

    if (!outcome.ok()) {
        send_error(ex, *outcome.error, ticket->id());
        return;
    }
    send_json(ex, 200, {
        {"message", "Object uploaded successfully"},
        {"transferId", ticket->id()},
        {"key", *key},
        {"etag", outcome.etag},
        {"bytes", outcome.bytes},
    }, ticket->id());
}

void RelayServer::handle_delete(HttpExchange& ex, const std::string& bucket, const std::string& b64key) {
    if (!valid_bucket_name(bucket)) {
        send_error(ex, request_error(400, "InvalidBucketName", "invalid bucket name: " + bucket));
        return;
    }
    auto key = decode_key(b64key);
    if (!key) {
        send_error(ex, request_error(400, "InvalidKey", "object key is not valid base64"));
        return;
    }
    auto client = active_client(ex);
    if (!client) return;
    auto& store = *client->store;

    if (!key->ends_with("/")) {
        auto err = store.delete_object(bucket, *key);
        if (!err.ok()) {
            log_error("Delete %s/%s failed: %s", bucket.c_str(), key->c_str(), err.describe().c_str());
            send_error(ex, classify(err));
            return;
        }
        send_message(ex, "Object deleted successfully");
        return;
    }

    // A folder: everything under the prefix, across every listing page
    std::vector<std::string> keys;
    ListOptions options;
    options.prefix = *key;
    options.delimiter.clear();
    do {
        auto page = store.list_objects(bucket, options);
        if (!page.error.ok()) {
            log_error("List %s/%s for delete failed: %s", bucket.c_str(), key->c_str(),
                      page.error.describe().c_str());
            send_error(ex, classify(page.error));
            return;
        }
        for (const auto& entry : page.objects) {
            keys.push_back(entry.key);
        }
        options.continuation_token = page.truncated ? page.next_continuation_token : std::string{};
    } while (!options.continuation_token.empty());

    if (keys.empty()) {
        auto err = store.delete_object(bucket, *key);
        if (!err.ok()) {
            send_error(ex, classify(err));
            return;
        }
        send_message(ex, "Object deleted successfully");
        return;
    }

    auto result = store.delete_objects(bucket, keys);
    if (!result.error.ok()) {
        log_error("Delete %zu objects under %s/%s failed: %s", keys.size(), bucket.c_str(),
                  key->c_str(), result.error.describe().c_str());
        send_error(ex, classify(result.error));
        return;
    }
    if (!result.failed_keys.empty()) {
        log_warn("Delete under %s/%s: %zu of %zu objects remain", bucket.c_str(), key->c_str(),
                 result.failed_keys.size(), keys.size());
        auto body = to_json(classify(StorageError::service(500, "InternalError",
            std::to_string(result.failed_keys.size()) + " objects could not be deleted")));
        body["failedKeys"] = result.failed_keys;
        send_json(ex, 500, body);
        return;
    }
    log_info("Deleted %zu objects under %s/%s", result.deleted, bucket.c_str(), key->c_str());
    send_json(ex, 200, {{"message", "Objects deleted successfully"}, {"deleted", result.deleted}});
}

// --- Transfers ---

void RelayServer::handle_transfers(HttpExchange& ex) {
    const auto& s = ex.segments;

    if (s.size() == 2) {
        if (!ex.is(http::verb::get)) {
            send_method_not_allowed(ex);
            return;
        }
        auto transfers = nlohmann::json::array();
        for (const auto& info : engine_.active()) {
            transfers.push_back(to_json(info));
        }
        send_json(ex, 200, {{"transfers", transfers}});
        return;
    }

    const std::string& id = s[2];
    auto no_such_transfer = [&] {
        send_error(ex, request_error(404, "NoSuchTransfer", "no active transfer " + id));
    };

    if (s.size() == 3 && ex.is(http::verb::get)) {
        auto info = engine_.find(id);
        if (!info) {
            no_such_transfer();
            return;
        }
        send_json(ex, 200, to_json(*info));
        return;
    }

    bool cancel_request = (s.size() == 3 && ex.is(http::verb::delete_)) ||
                          (s.size() == 4 && s[3] == "abort" && ex.is(http::verb::post));
    if (cancel_request) {
        if (!engine_.cancel(id)) {
            no_such_transfer();
            return;
        }
        send_json(ex, 200, {{"message", "Transfer cancelled"}, {"transferId", id}});
        return;
    }

    if (s.size() == 4 && s[3] == "events" && ex.is(http::verb::get)) {
        handle_events(ex, id);
        return;
    }

    send_not_found(ex);
}

void RelayServer::handle_events(HttpExchange& ex, const std::string& ticket_id) {
    auto subscription = notifier_.subscribe(ticket_id);
    if (!subscription) {
        send_error(ex, request_error(404, "NoSuchTransfer", "no active transfer " + ticket_id));
        return;
    }

    EventStream stream(ex);
    stream.set("X-Transfer-Id", ticket_id);
    if (!stream.open()) return;

    auto last_write = std::chrono::steady_clock::now();
    while (running_.load(std::memory_order_relaxed)) {
        auto event = subscription->next(SSE_POLL);
        auto now = std::chrono::steady_clock::now();
        if (event) {
            if (!stream.event(to_json(*event))) return;
            last_write = now;
            if (is_terminal(event->phase)) break;
            continue;
        }
        if (subscription->finished()) break;
        if (now - last_write >= SSE_KEEPALIVE) {
            if (!stream.keepalive()) return;
            last_write = now;
        }
    }

    if (subscription->dropped() > 0) {
        log_debug("Event stream for %s dropped %llu events", ticket_id.c_str(),
                  static_cast<unsigned long long>(subscription->dropped()));
    }
    stream.close();
}

// --- Transfer jobs ---

bool RelayServer::rate_limited(HttpExchange& ex, const std::string& operation, uint64_t max) {
    std::string key = operation + ":" + ex.client_ip;
    if (!rate_limiter_.exceeded(key, max, config_.rate_limit_window)) return false;

    uint64_t retry_after = rate_limiter_.retry_after(key);
    auto window_secs = std::chrono::duration_cast<std::chrono::seconds>(config_.rate_limit_window).count();
    log_warn("Rate limit: %s request from %s refused, retry in %llus", operation.c_str(),
             ex.client_ip.c_str(), static_cast<unsigned long long>(retry_after));

    auto body = to_json(request_error(429, "RateLimitExceeded",
        "Too many " + operation + " requests. Maximum " + std::to_string(max) + " per " +
        std::to_string(window_secs) + " seconds."));
    body["retryAfter"] = retry_after;

    http::response<http::string_body> res;
    res.result(http::status::too_many_requests);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::retry_after, std::to_string(retry_after));
    res.body() = dump_json(body);
    write_response(ex, res);
    return true;
}

void RelayServer::handle_transfer_jobs(HttpExchange& ex) {
    const auto& s = ex.segments;

    if (s.size() == 2) {
        if (!ex.is(http::verb::post)) {
            send_method_not_allowed(ex);
            return;
        }
        handle_job_create(ex);
        return;
    }
    if (s.size() == 3 && s[2] == "check-conflicts") {
        if (!ex.is(http::verb::post)) {
            send_method_not_allowed(ex);
            return;
        }
        handle_check_conflicts(ex);
        return;
    }
    if (s.size() == 4 && s[2] == "progress" && ex.is(http::verb::get)) {
        handle_job_progress(ex, s[3]);
        return;
    }

    const std::string& id = s[2];
    if (s.size() == 3 && ex.is(http::verb::get)) {
        auto info = jobs_.find(id);
        if (!info) {
            send_error(ex, request_error(404, "NoSuchJob", "no transfer job " + id));
            return;
        }
        send_json(ex, 200, to_json(*info));
        return;
    }
    if (s.size() == 3 && ex.is(http::verb::delete_)) {
        send_json(ex, 200, {{"cancelled", jobs_.cancel(id)}});
        return;
    }
    if (s.size() == 4 && s[3] == "cleanup" && ex.is(http::verb::post)) {
        handle_job_cleanup(ex, id);
        return;
    }
    send_not_found(ex);
}

void RelayServer::handle_job_create(HttpExchange& ex) {
    if (rate_limited(ex, "transfer", config_.transfer_rate_limit)) return;

    nlohmann::json body;
    if (!read_json(ex, body)) return;

    JobRequest request;
    std::string err = location_from_json(body, "source", request.source);
    if (err.empty()) err = location_from_json(body, "destination", request.destination);
    if (err.empty()) err = files_from_json(body, request.files);
    if (err.empty()) {
        if (!body.contains("conflictResolution") || !body["conflictResolution"].is_string()) {
            err = "'conflictResolution' is required";
        } else if (auto policy = parse_conflict_policy(body["conflictResolution"].get<std::string>())) {
            request.policy = *policy;
        } else {
            err = "'conflictResolution' must be overwrite, skip or rename";
        }
    }
    if (!err.empty()) {
        send_error(ex, request_error(400, "InvalidTransfer", err));
        return;
    }
    if (request.source.type == LocationType::S3 || request.destination.type == LocationType::S3) {
        if (!active_client(ex)) return;
    }

    jobs_.prune(std::chrono::seconds(constants::JOB_RETENTION_SECONDS));
    std::string job_id;
    err = jobs_.submit(request, job_id);
    if (!err.empty()) {
        send_error(ex, request_error(400, "InvalidTransfer", err));
        return;
    }
    send_json(ex, 200, {{"jobId", job_id}, {"sseUrl", "/api/transfer/progress/" + job_id}});
}

void RelayServer::handle_job_progress(HttpExchange& ex, const std::string& job_id) {
    auto info = jobs_.find(job_id);
    if (!info) {
        send_error(ex, request_error(404, "NoSuchJob", "no transfer job " + job_id));
        return;
    }

    EventStream stream(ex);
    stream.set("Access-Control-Allow-Origin", "*");
    if (!stream.open()) return;
    if (!stream.event(progress_json(*info))) return;

    uint64_t seen = info->version;
    auto last_write = std::chrono::steady_clock::now();
    auto last_event = last_write;
    while (!is_terminal(info->status) && running_.load(std::memory_order_relaxed)) {
        info = jobs_.wait_for_update(job_id, seen, SSE_POLL);
        if (!info) break;
        auto now = std::chrono::steady_clock::now();
        if (info->version > seen) {
            // Byte counts move on every chunk; coalesce them
            if (!is_terminal(info->status) && now - last_event < JOB_EVENT_GAP) {
                std::this_thread::sleep_for(JOB_EVENT_GAP - (now - last_event));
                continue;
            }
            if (!stream.event(progress_json(*info))) return;
            seen = info->version;
            last_write = last_event = now;
            continue;
        }
        if (now - last_write >= SSE_KEEPALIVE) {
            if (!stream.keepalive()) return;
            last_write = now;
        }
    }
    stream.close();
}

void RelayServer::handle_job_cleanup(HttpExchange& ex, const std::string& job_id) {
    auto result = jobs_.cleanup(job_id);
    if (!result.found) {
        send_error(ex, request_error(404, "NoSuchJob", "no transfer job " + job_id));
        return;
    }
    if (!result.cancelled) {
        send_error(ex, request_error(400, "InvalidStatus", "Job must be cancelled to cleanup files"));
        return;
    }
    if (!result.errors.empty()) {
        send_json(ex, 207, {{"message", "Cleanup completed with errors"}, {"errors", result.errors}});
        return;
    }
    send_json(ex, 200, {{"message", "All files cleaned up successfully"},
                        {"filesDeleted", result.deleted}});
}

void RelayServer::handle_check_conflicts(HttpExchange& ex) {
    nlohmann::json body;
    if (!read_json(ex, body)) return;

    Location destination;
    std::vector<std::string> files;
    std::string err = location_from_json(body, "destination", destination);
    if (err.empty()) err = files_from_json(body, files);
    if (err.empty() && destination.type == LocationType::Local) {
        std::filesystem::path resolved;
        err = resolve_local_path(config_.local_paths, destination.id, destination.path, resolved);
    }
    if (!err.empty()) {
        send_error(ex, request_error(400, "InvalidTransfer", err));
        return;
    }
    if (destination.type == LocationType::S3 && !active_client(ex)) return;

    std::vector<std::string> conflicts;
    err = jobs_.check_conflicts(destination, files, conflicts);
    if (!err.empty()) {
        log_error("Conflict check on %s failed: %s", destination.id.c_str(), err.c_str());
        send_error(ex, classify(StorageError::internal(err)));
        return;
    }
    send_json(ex, 200, {{"conflicts", conflicts}});
}

// --- Settings ---

void RelayServer::apply_backend(HttpExchange& ex, const BackendConfig& next) {
    try {
        registry_.update(next);
    } catch (const ConfigurationError& e) {
        send_error(ex, request_error(400, "InvalidConfiguration", e.what()));
        return;
    }
    send_message(ex, "Settings updated successfully");
}

void RelayServer::handle_settings(HttpExchange& ex) {
    const auto& s = ex.segments;
    if (s.size() != 3) {
        send_not_found(ex);
        return;
    }
    const std::string& name = s[2];

    auto current_backend = [this] {
        auto client = registry_.get();
        return client ? client->config : config_.backend;
    };

    if (name == "s3" || name == "test-s3") {
        if (name == "s3" && ex.is(http::verb::get)) {
            send_json(ex, 200, {{"settings", backend_to_json(current_backend(), true)}});
            return;
        }
        if (!ex.is(http::verb::post)) {
            send_method_not_allowed(ex);
            return;
        }
        nlohmann::json body;
        if (!read_json(ex, body)) return;
        BackendConfig next = current_backend();
        auto err = backend_from_json(body, next);
        if (!err.empty()) {
            send_error(ex, request_error(400, "InvalidConfiguration", err));
            return;
        }

        if (name == "s3") {
            apply_backend(ex, next);
            return;
        }

        auto result = registry_.test_connection(next);
        if (result.ok()) {
            send_message(ex, "Connection successful");
        } else if (result.origin == ErrorOrigin::Configuration) {
            send_error(ex, request_error(400, "InvalidConfiguration", result.message));
        } else {
            send_error(ex, classify(result));
        }
        return;
    }

    if (name == "proxy") {
        if (ex.is(http::verb::get)) {
            auto backend = current_backend();
            send_json(ex, 200, {{"settings", {
                {"httpProxy", backend.http_proxy},
                {"httpsProxy", backend.https_proxy},
            }}});
            return;
        }
        if (!ex.is(http::verb::post)) {
            send_method_not_allowed(ex);
            return;
        }
        nlohmann::json body;
        if (!read_json(ex, body)) return;
        nlohmann::json proxies = nlohmann::json::object();
        for (const char* field : {"httpProxy", "httpsProxy"}) {
            if (body.contains(field)) proxies[field] = body[field];
        }
        BackendConfig next = current_backend();
        auto err = backend_from_json(proxies, next);
        if (!err.empty()) {
            send_error(ex, request_error(400, "InvalidConfiguration", err));
            return;
        }
        apply_backend(ex, next);
        return;
    }

    if (name == "max-concurrent-transfers") {
        if (ex.is(http::verb::get)) {
            send_json(ex, 200, {{"maxConcurrentTransfers", gate_.limit()}});
            return;
        }
        if (!ex.is(http::verb::post)) {
            send_method_not_allowed(ex);
            return;
        }
        nlohmann::json body;
        if (!read_json(ex, body)) return;
        int64_t value = 0;
        if (body.contains("maxConcurrentTransfers")) {
            const auto& field = body["maxConcurrentTransfers"];
            if (field.is_number_integer()) {
                value = field.get<int64_t>();
            } else if (field.is_string()) {
                const auto text = field.get<std::string>();
                bool numeric = !text.empty() && text.size() <= 6 &&
                               std::all_of(text.begin(), text.end(), [](char c) {
                                   return std::isdigit(static_cast<unsigned char>(c));
                               });
                if (numeric) value = std::stoll(text);
            }
        }
        if (value < 1 || value > static_cast<int64_t>(constants::MAX_CONCURRENT_TRANSFERS_LIMIT)) {
            send_error(ex, request_error(400, "InvalidArgument",
                "maxConcurrentTransfers must be between 1 and " +
                std::to_string(constants::MAX_CONCURRENT_TRANSFERS_LIMIT)));
            return;
        }
        gate_.set_limit(static_cast<size_t>(value));
        log_info("Max concurrent transfers set to %lld", static_cast<long long>(value));
        send_message(ex, "Settings updated successfully");
        return;
    }

    send_not_found(ex);
}

}  // namespace s3relay
