#include "s3relay/storage/object_store.hpp"
#include "s3relay/storage/s3_protocol.hpp"
#include "s3relay/constants.hpp"
#include "s3relay/log.hpp"
#include "s3relay/relay_config.hpp"

#include <openssl/evp.h>

#include <algorithm>

namespace s3relay {

namespace {

std::string md5_base64(std::span<const uint8_t> data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_md5(), nullptr);
    return net::base64_encode(std::string(reinterpret_cast<const char*>(digest), digest_len));
}

// "bytes 0-99/1234" -> (0, 1234)
bool parse_content_range(const std::string& value, uint64_t& start, uint64_t& total) {
    if (!value.starts_with("bytes ")) return false;
    size_t dash = value.find('-', 6);
    size_t slash = value.find('/', 6);
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) return false;
    try {
        start = std::stoull(value.substr(6, dash - 6));
        std::string total_str = value.substr(slash + 1);
        if (total_str == "*") return false;
        total = std::stoull(total_str);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

ObjectInfo info_from_headers(const std::string& key, const net::HttpHeaders& headers) {
    ObjectInfo info;
    info.key = key;
    info.size = headers.content_length();
    info.etag = headers.get("ETag").value_or("");
    info.content_type = headers.get("Content-Type").value_or("application/octet-stream");
    info.last_modified = headers.get("Last-Modified").value_or("");

    if (auto cr = headers.get("Content-Range")) {
        uint64_t start = 0;
        uint64_t total = 0;
        if (parse_content_range(*cr, start, total)) {
            info.range_start = start;
            info.total_size = total;
        }
    }
    return info;
}

} // namespace

class S3ObjectStore : public ObjectStore {
public:
    explicit S3ObjectStore(const BackendConfig& config)
        : config_(config)
        , signer_(config.access_key, config.secret_key, config.region, "s3")
        , proxy_(config.proxy_for_endpoint()) {
        if (!config_.endpoint.empty()) {
            auto parsed = net::ParsedUrl::parse(config_.endpoint);
            if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https")) {
                throw ConfigurationError("invalid endpoint URL: " + config_.endpoint);
            }
            endpoint_ = parsed->scheme + "://" + parsed->host_header() + parsed->path;
            while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
            endpoint_host_ = parsed->host_header();
            endpoint_scheme_ = parsed->scheme;
        }
        signer_.set_session_token(config_.session_token);

        net::HttpClientConfig http_config;
        http_config.max_error_body_size = constants::MAX_ERROR_BODY_SIZE;
        http_config.receive_buffer_size = constants::DEFAULT_DOWNLOAD_BUFFER_SIZE;
        http_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    size_t min_part_size() const override { return constants::S3_MIN_PART_SIZE; }

    BucketListResult list_buckets() override {
        BucketListResult result;
        auto request = make_request(net::HttpMethod::GET, "", "", "");
        auto response = execute(request);
        if (auto err = error_from(response); !err.ok()) {
            result.error = err;
            return result;
        }
        result = s3::parse_list_buckets(response.body_string());
        return result;
    }

    StorageError create_bucket(const std::string& bucket) override {
        auto request = make_request(net::HttpMethod::PUT, bucket, "", "");
        if (config_.region != constants::DEFAULT_REGION) {
            request.set_body(
                "<CreateBucketConfiguration xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
                "<LocationConstraint>" + s3::xml::escape(config_.region) +
                "</LocationConstraint></CreateBucketConfiguration>");
            request.headers.set("Content-Type", "application/xml");
        }
        return error_from(execute(request));
    }

    StorageError delete_bucket(const std::string& bucket) override {
        auto request = make_request(net::HttpMethod::DELETE, bucket, "", "");
        return error_from(execute(request));
    }

    ListResult list_objects(const std::string& bucket, const ListOptions& options) override {
        std::string query = "list-type=2";
        if (!options.prefix.empty()) query += "&prefix=" + net::url_encode(options.prefix);
        if (!options.delimiter.empty()) query += "&delimiter=" + net::url_encode(options.delimiter);
        if (options.max_keys > 0) query += "&max-keys=" + std::to_string(options.max_keys);
        if (!options.continuation_token.empty()) {
            query += "&continuation-token=" + net::url_encode(options.continuation_token);
        }

        auto request = make_request(net::HttpMethod::GET, bucket, "", query);
        auto response = execute(request);
        if (auto err = error_from(response); !err.ok()) {
            ListResult result;
            result.error = err;
            return result;
        }
        return s3::parse_list_objects(response.body_string());
    }

    HeadResult head_object(const std::string& bucket, const std::string& key) override {
        HeadResult result;
        auto request = make_request(net::HttpMethod::HEAD, bucket, key, "");
        auto response = execute(request);
        result.error = error_from(response);
        if (result.error.ok()) {
            result.info = info_from_headers(key, response.headers);
        }
        return result;
    }

    GetStreamResult get_object(const std::string& bucket,
                               const std::string& key,
                               const std::optional<ByteRange>& range,
                               const OpenCallback& on_open,
                               const ChunkSink& sink,
                               const CancelCheck& cancelled) override {
        GetStreamResult result;
        bool sink_refused = false;

        auto request = make_request(net::HttpMethod::GET, bucket, key, "", false);
        if (range) {
            request.headers.set("Range", range->to_header());
        }

        request.on_headers = [&](int status, const net::HttpHeaders& headers) {
            if (!net::is_success_status(status)) return true;  // error body follows
            result.info = info_from_headers(key, headers);
            result.opened = true;
            if (on_open && !on_open(result.info)) {
                sink_refused = true;
                return false;
            }
            return true;
        };
        request.on_body = [&](std::span<const uint8_t> chunk) {
            if (!sink(chunk)) {
                sink_refused = true;
                return false;
            }
            result.bytes_delivered += chunk.size();
            return true;
        };
        if (cancelled) {
            request.should_abort = cancelled;
        }
        sign(request);

        auto response = http_->execute(request);

        if (response.is_network_error) {
            if (cancelled && cancelled()) {
                result.error = StorageError::cancelled("transfer cancelled");
            } else if (sink_refused) {
                result.error = StorageError::client_disconnect("destination stopped accepting data");
            } else {
                result.error = StorageError::network(response.fault, response.error);
            }
            return result;
        }
        if (!response.ok()) {
            result.error = s3::parse_error_response(response.status_code,
                                                    response.body_string(), response.headers);
            return result;
        }
        return result;
    }

    PutResult put_object(const std::string& bucket,
                         const std::string& key,
                         std::span<const uint8_t> data,
                         const std::string& content_type,
                         const CancelCheck& cancelled) override {
        PutResult result;
        auto request = make_request(net::HttpMethod::PUT, bucket, key, "", false);
        request.body_view = data;
        request.headers.set("Content-Type",
                            content_type.empty() ? "application/octet-stream" : content_type);
        if (config_.unsigned_payload) {
            request.headers.set("X-Amz-Content-Sha256", "UNSIGNED-PAYLOAD");
        }
        if (cancelled) request.should_abort = cancelled;
        sign(request);

        auto response = http_->execute(request);
        result.error = error_from(response, cancelled);
        if (result.error.ok()) {
            result.etag = response.headers.get("ETag").value_or("");
        }
        return result;
    }

    MultipartStart create_multipart_upload(const std::string& bucket,
                                           const std::string& key,
                                           const std::string& content_type) override {
        MultipartStart result;
        auto request = make_request(net::HttpMethod::POST, bucket, key, "uploads", false);
        request.headers.set("Content-Type",
                            content_type.empty() ? "application/octet-stream" : content_type);
        sign(request);

        auto response = http_->execute(request);
        result.error = error_from(response);
        if (!result.error.ok()) return result;

        result.upload_id = s3::xml::get_element(response.body_string(), "UploadId");
        if (result.upload_id.empty()) {
            result.error = StorageError::service(0, "MalformedResponse",
                                                 "CreateMultipartUpload returned no UploadId");
        }
        return result;
    }

    PartResult upload_part(const std::string& bucket,
                           const std::string& key,
                           const std::string& upload_id,
                           int part_number,
                           std::span<const uint8_t> data,
                           const CancelCheck& cancelled) override {
        PartResult result;
        std::string query = "partNumber=" + std::to_string(part_number) +
                            "&uploadId=" + net::url_encode(upload_id);
        auto request = make_request(net::HttpMethod::PUT, bucket, key, query, false);
        request.body_view = data;
        if (config_.unsigned_payload) {
            request.headers.set("X-Amz-Content-Sha256", "UNSIGNED-PAYLOAD");
        }
        if (cancelled) request.should_abort = cancelled;
        sign(request);

        auto response = http_->execute(request);
        result.error = error_from(response, cancelled);
        if (!result.error.ok()) return result;

        // ETag from header comes quoted - preserve quotes for CompleteMultipartUpload
        result.etag = s3::ensure_etag_quotes(response.headers.get("ETag").value_or(""));
        if (result.etag.empty()) {
            result.error = StorageError::service(0, "MalformedResponse",
                                                 "UploadPart returned no ETag");
        }
        return result;
    }

    PutResult complete_multipart_upload(const std::string& bucket,
                                        const std::string& key,
                                        const std::string& upload_id,
                                        const std::vector<CompletedPart>& parts) override {
        PutResult result;
        auto request = make_request(net::HttpMethod::POST, bucket, key,
                                    "uploadId=" + net::url_encode(upload_id), false);
        request.set_body(s3::build_complete_multipart_xml(parts));
        request.headers.set("Content-Type", "application/xml");
        sign(request);

        auto response = http_->execute(request);
        result.error = error_from(response);
        if (!result.error.ok()) return result;

        // CompleteMultipartUpload can fail after a 200 with an <Error> body
        std::string body = response.body_string();
        if (body.find("<Error>") != std::string::npos) {
            result.error = s3::parse_error_response(0, body, response.headers);
            return result;
        }

        std::string etag = s3::xml::get_element(body, "ETag");
        result.etag = s3::ensure_etag_quotes(s3::xml::decode_entities(etag));
        return result;
    }

    StorageError abort_multipart_upload(const std::string& bucket,
                                        const std::string& key,
                                        const std::string& upload_id) override {
        auto request = make_request(net::HttpMethod::DELETE, bucket, key,
                                    "uploadId=" + net::url_encode(upload_id));
        return error_from(execute(request));
    }

    PutResult copy_object(const std::string& source_bucket,
                          const std::string& source_key,
                          const std::string& bucket,
                          const std::string& key) override {
        PutResult result;
        auto request = make_request(net::HttpMethod::PUT, bucket, key, "", false);
        request.headers.set("x-amz-copy-source",
                            "/" + source_bucket + "/" + net::url_encode_path(source_key));
        sign(request);

        auto response = http_->execute(request);
        result.error = error_from(response);
        if (!result.error.ok()) return result;

        // Like CompleteMultipartUpload, a copy can fail after the 200
        std::string body = response.body_string();
        if (body.find("<Error>") != std::string::npos) {
            result.error = s3::parse_error_response(0, body, response.headers);
            return result;
        }
        result.etag = s3::ensure_etag_quotes(s3::xml::decode_entities(s3::xml::get_element(body, "ETag")));
        return result;
    }

    StorageError delete_object(const std::string& bucket, const std::string& key) override {
        auto request = make_request(net::HttpMethod::DELETE, bucket, key, "");
        return error_from(execute(request));
    }

    DeleteResult delete_objects(const std::string& bucket,
                                const std::vector<std::string>& keys) override {
        DeleteResult result;

        for (size_t start = 0; start < keys.size(); start += constants::S3_DELETE_BATCH_SIZE) {
            size_t end = std::min(start + constants::S3_DELETE_BATCH_SIZE, keys.size());
            std::vector<std::string> batch(keys.begin() + start, keys.begin() + end);

            auto request = make_request(net::HttpMethod::POST, bucket, "", "delete", false);
            request.set_body(s3::build_delete_objects_xml(batch));
            request.headers.set("Content-Type", "application/xml");
            request.headers.set("Content-MD5", md5_base64(request.payload()));
            sign(request);

            auto response = http_->execute(request);
            if (auto err = error_from(response); !err.ok()) {
                result.error = err;
                result.failed_keys.insert(result.failed_keys.end(), keys.begin() + start, keys.end());
                return result;
            }

            auto failed = s3::parse_delete_errors(response.body_string());
            result.deleted += batch.size() - failed.size();
            result.failed_keys.insert(result.failed_keys.end(), failed.begin(), failed.end());
        }
        return result;
    }

private:
    std::string build_url(const std::string& bucket, const std::string& key,
                          const std::string& query) const {
        std::string url;
        if (!endpoint_.empty()) {
            if (config_.use_path_style || bucket.empty()) {
                url = endpoint_;
                if (!bucket.empty()) url += "/" + bucket;
            } else {
                url = endpoint_scheme_ + "://" + bucket + "." + endpoint_host_;
            }
        } else {
            if (config_.use_path_style || bucket.empty()) {
                url = "https://s3." + config_.region + ".amazonaws.com";
                if (!bucket.empty()) url += "/" + bucket;
            } else {
                url = "https://" + bucket + ".s3." + config_.region + ".amazonaws.com";
            }
        }
        if (!key.empty()) {
            url += "/" + net::url_encode_path(key);
        } else if (url.find("://") != std::string::npos &&
                   url.find('/', url.find("://") + 3) == std::string::npos) {
            url += "/";
        }
        if (!query.empty()) {
            url += "?" + query;
        }
        return url;
    }

    // Build a request carrying the backend's transport settings; signs it
    // right away unless the caller still has headers or a body to add.
    net::HttpRequest make_request(net::HttpMethod method, const std::string& bucket,
                                  const std::string& key, const std::string& query,
                                  bool sign_now = true) const {
        auto request = net::HttpRequest::make(method, build_url(bucket, key, query));
        request.connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
        request.stall_timeout_secs = config_.stall_timeout_secs;
        request.verify_ssl = config_.verify_ssl;
        request.proxy = proxy_;
        if (sign_now) sign(request);
        return request;
    }

    void sign(net::HttpRequest& request) const {
        // Anonymous access: public buckets on S3-compatible services
        if (config_.access_key.empty()) return;
        signer_.sign(request);
    }

    net::HttpResponse execute(const net::HttpRequest& request) {
        auto response = http_->execute(request);
        if (!response.ok()) {
            log_debug("s3: %s %s -> %d %s", net::http_method_to_string(request.method),
                      request.url.c_str(), response.status_code, response.error.c_str());
        }
        return response;
    }

    StorageError error_from(const net::HttpResponse& response,
                            const CancelCheck& cancelled = {}) const {
        if (response.is_network_error) {
            if (response.fault == net::TransportFault::Aborted && cancelled && cancelled()) {
                return StorageError::cancelled("transfer cancelled");
            }
            return StorageError::network(response.fault, response.error);
        }
        if (!response.ok()) {
            if (response.status_code == 413 && !response.error.empty()) {
                return StorageError::internal(response.error);
            }
            return s3::parse_error_response(response.status_code, response.body_string(),
                                            response.headers);
        }
        return {};
    }

    BackendConfig config_;
    net::AwsSigV4Signer signer_;
    std::string proxy_;
    std::string endpoint_;         // normalized endpoint without trailing slash
    std::string endpoint_host_;
    std::string endpoint_scheme_;
    std::unique_ptr<net::HttpClient> http_;
};

std::shared_ptr<ObjectStore> ObjectStoreFactory::create_s3(const BackendConfig& config) {
    auto err = config.validate();
    if (!err.empty()) {
        throw ConfigurationError(err);
    }
    return std::make_shared<S3ObjectStore>(config);
}

} // namespace s3relay
