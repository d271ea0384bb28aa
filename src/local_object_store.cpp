#include "s3relay/storage/object_store.hpp"
#include "s3relay/constants.hpp"
#include "s3relay/log.hpp"
#include "s3relay/relay_config.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>

namespace s3relay {

namespace {

namespace fs = std::filesystem;

constexpr const char* STAGING_DIR = ".uploads";
constexpr size_t MAX_FILENAME = 255;

std::string format_time(fs::file_time_type ftime, const char* fmt) {
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
    std::time_t t = std::chrono::system_clock::to_time_t(sctp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

std::string iso8601(fs::file_time_type ftime) {
    return format_time(ftime, "%Y-%m-%dT%H:%M:%S.000Z");
}

std::string http_date(fs::file_time_type ftime) {
    return format_time(ftime, "%a, %d %b %Y %H:%M:%S GMT");
}

// Stat-derived ETag; stable for as long as the file is not rewritten
std::string etag_for(const fs::path& path, std::error_code& ec) {
    auto size = fs::file_size(path, ec);
    if (ec) return {};
    auto mtime = fs::last_write_time(path, ec);
    if (ec) return {};
    char buf[64];
    std::snprintf(buf, sizeof(buf), "\"%llx-%llx\"",
                  static_cast<unsigned long long>(size),
                  static_cast<unsigned long long>(mtime.time_since_epoch().count()));
    return buf;
}

} // namespace

// Filesystem-backed store for development and tests. Buckets are directories
// under the root; each object is one file whose name is the percent-encoded
// key, so "a", "a/" and "a/b" can all coexist. Writes land in a staging
// directory first and are renamed into place.
class LocalObjectStore : public ObjectStore {
public:
    explicit LocalObjectStore(const fs::path& root)
        : root_(fs::absolute(root)) {
        fs::create_directories(root_ / STAGING_DIR);
        log_debug("local store initialized at %s", root_.c_str());
    }

    std::string type_name() const override { return "local"; }

    BucketListResult list_buckets() override {
        BucketListResult result;
        std::error_code ec;
        std::set<std::string> names;
        for (const auto& entry : fs::directory_iterator(root_, ec)) {
            auto name = entry.path().filename().string();
            if (!entry.is_directory() || name == STAGING_DIR) continue;
            names.insert(name);
        }
        if (ec) {
            result.error = StorageError::local_io("cannot list " + root_.string() + ": " + ec.message());
            return result;
        }
        for (const auto& name : names) {
            BucketInfo info;
            info.name = name;
            std::error_code tec;
            auto mtime = fs::last_write_time(root_ / name, tec);
            if (!tec) info.creation_date = iso8601(mtime);
            result.buckets.push_back(std::move(info));
        }
        return result;
    }

    StorageError create_bucket(const std::string& bucket) override {
        if (bucket.empty() || bucket[0] == '.' || bucket.find('/') != std::string::npos) {
            return StorageError::service(400, "InvalidBucketName", "invalid bucket name: " + bucket);
        }
        std::lock_guard lock(mutex_);
        std::error_code ec;
        if (fs::exists(root_ / bucket, ec)) {
            return StorageError::service(409, "BucketAlreadyOwnedByYou",
                                         "bucket already exists: " + bucket);
        }
        fs::create_directory(root_ / bucket, ec);
        if (ec) return StorageError::local_io("cannot create bucket: " + ec.message());
        return {};
    }

    StorageError delete_bucket(const std::string& bucket) override {
        std::lock_guard lock(mutex_);
        if (auto err = check_bucket(bucket); !err.ok()) return err;
        std::error_code ec;
        if (!fs::is_empty(bucket_path(bucket), ec)) {
            return StorageError::service(409, "BucketNotEmpty", "bucket is not empty: " + bucket);
        }
        fs::remove(bucket_path(bucket), ec);
        if (ec) return StorageError::local_io("cannot delete bucket: " + ec.message());
        return {};
    }

    ListResult list_objects(const std::string& bucket, const ListOptions& options) override {
        ListResult result;
        if (auto err = check_bucket(bucket); !err.ok()) {
            result.error = err;
            return result;
        }

        // Sorted key -> entry, mirroring S3's lexicographic listing order
        std::map<std::string, ListEntry> keys;
        std::error_code ec;
        for (const auto& file : fs::directory_iterator(bucket_path(bucket), ec)) {
            if (!file.is_regular_file()) continue;
            auto key = net::url_decode(file.path().filename().string());
            if (!key || !key->starts_with(options.prefix)) continue;

            ListEntry entry;
            entry.key = *key;
            std::error_code fec;
            entry.size = file.file_size(fec);
            entry.last_modified = iso8601(file.last_write_time(fec));
            entry.etag = etag_for(file.path(), fec);
            entry.storage_class = "STANDARD";
            keys.emplace(*key, std::move(entry));
        }
        if (ec) {
            result.error = StorageError::local_io("cannot list bucket: " + ec.message());
            return result;
        }

        // Continuation token is the last key or common prefix returned
        std::string after;
        if (!options.continuation_token.empty()) {
            auto decoded = net::base64_decode(options.continuation_token);
            if (!decoded) {
                result.error = StorageError::service(400, "InvalidArgument",
                                                     "invalid continuation token");
                return result;
            }
            after = *decoded;
        }
        bool after_is_prefix = !options.delimiter.empty() && after.ends_with(options.delimiter);

        uint32_t max_keys = options.max_keys == 0 ? constants::DEFAULT_LIST_MAX_KEYS : options.max_keys;
        std::string last;
        for (const auto& [key, entry] : keys) {
            if (!after.empty()) {
                if (key <= after) continue;
                if (after_is_prefix && key.starts_with(after)) continue;
            }

            std::string item = key;
            bool is_prefix = false;
            if (!options.delimiter.empty()) {
                auto pos = key.find(options.delimiter, options.prefix.size());
                if (pos != std::string::npos) {
                    item = key.substr(0, pos + options.delimiter.size());
                    is_prefix = true;
                }
            }
            if (is_prefix && !result.prefixes.empty() && result.prefixes.back() == item) continue;

            if (result.objects.size() + result.prefixes.size() >= max_keys) {
                result.truncated = true;
                result.next_continuation_token = net::base64_encode(last);
                break;
            }
            if (is_prefix) {
                result.prefixes.push_back(item);
            } else {
                result.objects.push_back(entry);
            }
            last = item;
        }
        return result;
    }

    HeadResult head_object(const std::string& bucket, const std::string& key) override {
        HeadResult result;
        fs::path path;
        if (result.error = resolve(bucket, key, path); !result.error.ok()) return result;

        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            result.error = StorageError::service(404, "NoSuchKey", "no such key: " + key);
            return result;
        }
        result.info.key = key;
        result.info.size = fs::file_size(path, ec);
        auto mtime = fs::last_write_time(path, ec);
        result.info.last_modified = http_date(mtime);
        result.info.etag = etag_for(path, ec);
        if (ec) result.error = StorageError::local_io("cannot stat " + key + ": " + ec.message());
        return result;
    }

    GetStreamResult get_object(const std::string& bucket,
                               const std::string& key,
                               const std::optional<ByteRange>& range,
                               const OpenCallback& on_open,
                               const ChunkSink& sink,
                               const CancelCheck& cancelled) override {
        GetStreamResult result;
        auto head = head_object(bucket, key);
        if (!head.error.ok()) {
            result.error = head.error;
            return result;
        }
        fs::path path = bucket_path(bucket) / encode_key(key);

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            result.error = StorageError::local_io("cannot open " + key);
            return result;
        }

        uint64_t file_size = head.info.size.value_or(0);
        uint64_t start = 0;
        uint64_t end = file_size;  // exclusive
        result.info = head.info;
        if (range) {
            if (range->start >= file_size) {
                result.error = StorageError::service(416, "InvalidRange",
                                                     "range start beyond object size");
                return result;
            }
            start = range->start;
            if (range->end) end = std::min(*range->end + 1, file_size);
            result.info.range_start = start;
            result.info.total_size = file_size;
            result.info.size = end - start;
        }

        result.opened = true;
        if (on_open && !on_open(result.info)) {
            result.error = StorageError::client_disconnect("destination refused the stream");
            return result;
        }

        file.seekg(static_cast<std::streamoff>(start));
        std::vector<uint8_t> buffer(constants::DEFAULT_DOWNLOAD_BUFFER_SIZE);
        uint64_t remaining = end - start;
        while (remaining > 0) {
            if (cancelled && cancelled()) {
                result.error = StorageError::cancelled("transfer cancelled");
                return result;
            }
            size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
            file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
            auto got = static_cast<size_t>(file.gcount());
            if (got == 0) {
                result.error = StorageError::local_io("short read on " + key);
                return result;
            }
            if (!sink(std::span<const uint8_t>(buffer.data(), got))) {
                result.error = StorageError::client_disconnect("destination stopped accepting data");
                return result;
            }
            result.bytes_delivered += got;
            remaining -= got;
        }
        return result;
    }

    PutResult put_object(const std::string& bucket,
                         const std::string& key,
                         std::span<const uint8_t> data,
                         const std::string& /*content_type*/,
                         const CancelCheck& cancelled) override {
        PutResult result;
        fs::path path;
        if (result.error = resolve(bucket, key, path); !result.error.ok()) return result;
        if (cancelled && cancelled()) {
            result.error = StorageError::cancelled("transfer cancelled");
            return result;
        }

        auto temp_path = temp_file();
        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                result.error = StorageError::local_io("failed to create " + temp_path.string());
                return result;
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file) {
                std::error_code ec;
                fs::remove(temp_path, ec);
                result.error = StorageError::local_io("failed to write data");
                return result;
            }
        }

        result.error = commit(temp_path, path);
        if (result.error.ok()) {
            std::error_code ec;
            result.etag = etag_for(path, ec);
        }
        return result;
    }

    MultipartStart create_multipart_upload(const std::string& bucket,
                                           const std::string& key,
                                           const std::string& /*content_type*/) override {
        MultipartStart result;
        fs::path path;
        if (result.error = resolve(bucket, key, path); !result.error.ok()) return result;

        result.upload_id = "local-" +
            std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + "-" +
            std::to_string(next_id_.fetch_add(1));
        std::error_code ec;
        fs::create_directories(upload_dir(result.upload_id), ec);
        if (ec) {
            result.error = StorageError::local_io("cannot create upload staging: " + ec.message());
            result.upload_id.clear();
        }
        return result;
    }

    PartResult upload_part(const std::string& /*bucket*/,
                           const std::string& /*key*/,
                           const std::string& upload_id,
                           int part_number,
                           std::span<const uint8_t> data,
                           const CancelCheck& cancelled) override {
        PartResult result;
        if (part_number < 1 || part_number > static_cast<int>(constants::S3_MAX_PART_COUNT)) {
            result.error = StorageError::service(400, "InvalidArgument",
                                                 "part number out of range");
            return result;
        }
        if (auto err = check_upload(upload_id); !err.ok()) {
            result.error = err;
            return result;
        }
        if (cancelled && cancelled()) {
            result.error = StorageError::cancelled("transfer cancelled");
            return result;
        }

        auto part_path = upload_dir(upload_id) / std::to_string(part_number);
        std::ofstream file(part_path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        file.close();
        if (!file) {
            result.error = StorageError::local_io("failed to write part " + std::to_string(part_number));
            return result;
        }
        std::error_code ec;
        result.etag = etag_for(part_path, ec);
        return result;
    }

    PutResult complete_multipart_upload(const std::string& bucket,
                                        const std::string& key,
                                        const std::string& upload_id,
                                        const std::vector<CompletedPart>& parts) override {
        PutResult result;
        fs::path path;
        if (result.error = resolve(bucket, key, path); !result.error.ok()) return result;
        if (result.error = check_upload(upload_id); !result.error.ok()) return result;
        if (parts.empty()) {
            result.error = StorageError::service(400, "MalformedXML", "no parts to complete");
            return result;
        }

        auto temp_path = temp_file();
        {
            std::ofstream out(temp_path, std::ios::binary);
            int previous = 0;
            for (const auto& part : parts) {
                auto part_path = upload_dir(upload_id) / std::to_string(part.part_number);
                std::error_code ec;
                if (part.part_number <= previous || etag_for(part_path, ec) != part.etag) {
                    out.close();
                    fs::remove(temp_path, ec);
                    result.error = StorageError::service(400, "InvalidPart",
                        "part " + std::to_string(part.part_number) + " missing or modified");
                    return result;
                }
                previous = part.part_number;
                std::ifstream in(part_path, std::ios::binary);
                out << in.rdbuf();
            }
            if (!out) {
                std::error_code ec;
                fs::remove(temp_path, ec);
                result.error = StorageError::local_io("failed to assemble parts");
                return result;
            }
        }

        result.error = commit(temp_path, path);
        if (!result.error.ok()) return result;

        std::error_code ec;
        result.etag = etag_for(path, ec);
        fs::remove_all(upload_dir(upload_id), ec);
        return result;
    }

    StorageError abort_multipart_upload(const std::string& /*bucket*/,
                                        const std::string& /*key*/,
                                        const std::string& upload_id) override {
        if (auto err = check_upload(upload_id); !err.ok()) return err;
        std::error_code ec;
        fs::remove_all(upload_dir(upload_id), ec);
        if (ec) return StorageError::local_io("cannot remove upload staging: " + ec.message());
        return {};
    }

    PutResult copy_object(const std::string& source_bucket,
                          const std::string& source_key,
                          const std::string& bucket,
                          const std::string& key) override {
        PutResult result;
        fs::path source;
        fs::path path;
        if (result.error = resolve(source_bucket, source_key, source); !result.error.ok()) return result;
        if (result.error = resolve(bucket, key, path); !result.error.ok()) return result;

        std::error_code ec;
        if (!fs::is_regular_file(source, ec)) {
            result.error = StorageError::service(404, "NoSuchKey", "no such key: " + source_key);
            return result;
        }
        auto temp_path = temp_file();
        fs::copy_file(source, temp_path, ec);
        if (ec) {
            fs::remove(temp_path, ec);
            result.error = StorageError::local_io("cannot copy " + source_key + ": " + ec.message());
            return result;
        }
        result.error = commit(temp_path, path);
        if (result.error.ok()) result.etag = etag_for(path, ec);
        return result;
    }

    StorageError delete_object(const std::string& bucket, const std::string& key) override {
        fs::path path;
        if (auto err = resolve(bucket, key, path); !err.ok()) return err;
        // Deleting a missing key succeeds, as on S3
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) return StorageError::local_io("cannot delete " + key + ": " + ec.message());
        return {};
    }

    DeleteResult delete_objects(const std::string& bucket,
                                const std::vector<std::string>& keys) override {
        DeleteResult result;
        if (auto err = check_bucket(bucket); !err.ok()) {
            result.error = err;
            result.failed_keys = keys;
            return result;
        }
        for (const auto& key : keys) {
            if (delete_object(bucket, key).ok()) {
                ++result.deleted;
            } else {
                result.failed_keys.push_back(key);
            }
        }
        return result;
    }

private:
    fs::path bucket_path(const std::string& bucket) const { return root_ / bucket; }

    fs::path upload_dir(const std::string& upload_id) const {
        return root_ / STAGING_DIR / upload_id;
    }

    fs::path temp_file() {
        return root_ / STAGING_DIR /
            (".tmp." + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
             "." + std::to_string(next_id_.fetch_add(1)));
    }

    static std::string encode_key(const std::string& key) { return net::url_encode(key); }

    StorageError check_bucket(const std::string& bucket) const {
        std::error_code ec;
        if (bucket.empty() || bucket[0] == '.' || bucket.find('/') != std::string::npos ||
            !fs::is_directory(bucket_path(bucket), ec)) {
            return StorageError::service(404, "NoSuchBucket", "no such bucket: " + bucket);
        }
        return {};
    }

    StorageError check_upload(const std::string& upload_id) const {
        std::error_code ec;
        if (upload_id.empty() || upload_id.find('/') != std::string::npos ||
            upload_id.find("..") != std::string::npos ||
            !fs::is_directory(upload_dir(upload_id), ec)) {
            return StorageError::service(404, "NoSuchUpload", "no such upload: " + upload_id);
        }
        return {};
    }

    StorageError resolve(const std::string& bucket, const std::string& key, fs::path& out) const {
        if (auto err = check_bucket(bucket); !err.ok()) return err;
        if (key.empty()) return StorageError::service(400, "InvalidArgument", "empty object key");
        auto encoded = encode_key(key);
        if (encoded.size() > MAX_FILENAME) {
            return StorageError::service(400, "KeyTooLongError", "object key too long for local store");
        }
        out = bucket_path(bucket) / encoded;
        return {};
    }

    StorageError commit(const fs::path& temp_path, const fs::path& path) {
        std::error_code ec;
        fs::rename(temp_path, path, ec);
        if (ec) {
            fs::remove(temp_path, ec);
            return StorageError::local_io("failed to rename into place: " + ec.message());
        }
        return {};
    }

    fs::path root_;
    std::mutex mutex_;  // bucket create/delete
    std::atomic<uint64_t> next_id_{0};
};

std::shared_ptr<ObjectStore> ObjectStoreFactory::create_local(const BackendConfig& config) {
    auto err = config.validate();
    if (!err.empty()) {
        throw ConfigurationError(err);
    }
    try {
        return std::make_shared<LocalObjectStore>(config.local_root);
    } catch (const fs::filesystem_error& e) {
        throw ConfigurationError(std::string("local backend: ") + e.what());
    }
}

} // namespace s3relay
