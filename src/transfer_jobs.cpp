#include "s3relay/transfer_jobs.hpp"
#include "s3relay/constants.hpp"
#include "s3relay/log.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <functional>
#include <thread>

namespace s3relay {

namespace fs = std::filesystem;

namespace {

constexpr const char* CANCELLED_BY_USER = "Cancelled by user";
constexpr int MAX_RENAME_ATTEMPTS = 10000;
constexpr auto SLOT_POLL = std::chrono::milliseconds(100);

int64_t epoch_ms(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

nlohmann::json optional_time(const std::optional<std::chrono::system_clock::time_point>& t) {
    return t ? nlohmann::json(epoch_ms(*t)) : nlohmann::json(nullptr);
}

nlohmann::json to_json(const Location& location) {
    return {
        {"type", location_type_name(location.type)},
        {"locationId", location.id},
        {"path", location.path},
    };
}

nlohmann::json to_json(const JobProgress& progress) {
    return {
        {"totalFiles", progress.total_files},
        {"completedFiles", progress.completed_files},
        {"failedFiles", progress.failed_files},
        {"totalBytes", progress.total_bytes},
        {"loadedBytes", progress.loaded_bytes},
        {"percentage", progress.percentage},
    };
}

// Upload side of a local-to-bucket file
class FileSource : public ByteSource {
public:
    FileSource(const fs::path& path, std::function<void(uint64_t)> on_progress)
        : file_(path, std::ios::binary), path_(path), on_progress_(std::move(on_progress)) {}

    bool is_open() const { return file_.is_open(); }

    size_t read(std::span<uint8_t> buffer, StorageError& error) override {
        if (file_.eof()) return 0;
        file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<size_t>(file_.gcount());
        if (file_.bad()) {
            error = StorageError::local_io("read failed on " + path_.string());
            return 0;
        }
        loaded_ += got;
        on_progress_(loaded_);
        return got;
    }

private:
    std::ifstream file_;
    fs::path path_;
    std::function<void(uint64_t)> on_progress_;
    uint64_t loaded_ = 0;
};

// Download side of a bucket-to-local file. Bytes land in a hidden sibling
// of the target that is renamed into place only once complete.
class FileSink : public ByteSink {
public:
    FileSink(fs::path target, std::string tag,
             std::function<void(uint64_t)> on_size,
             std::function<void(uint64_t)> on_progress)
        : target_(std::move(target))
        , temp_(target_.parent_path() / ("." + target_.filename().string() + "." + tag + ".part"))
        , on_size_(std::move(on_size))
        , on_progress_(std::move(on_progress)) {}

    ~FileSink() { discard(); }

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    bool begin(const ObjectInfo& info) override {
        if (info.size) on_size_(*info.size);
        std::error_code ec;
        fs::create_directories(target_.parent_path(), ec);
        if (ec) {
            error_ = "cannot create " + target_.parent_path().string() + ": " + ec.message();
            return false;
        }
        file_.open(temp_, std::ios::binary | std::ios::trunc);
        if (!file_) {
            error_ = "cannot create " + temp_.string();
            return false;
        }
        open_ = true;
        return true;
    }

    bool write(std::span<const uint8_t> chunk) override {
        file_.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        if (!file_) {
            error_ = "write failed on " + temp_.string();
            return false;
        }
        loaded_ += chunk.size();
        on_progress_(loaded_);
        return true;
    }

    bool finish() override {
        file_.close();
        if (file_.fail()) {
            error_ = "cannot flush " + temp_.string();
            return false;
        }
        std::error_code ec;
        fs::rename(temp_, target_, ec);
        if (ec) {
            error_ = "cannot move into place " + target_.string() + ": " + ec.message();
            return false;
        }
        open_ = false;
        on_size_(loaded_);
        return true;
    }

    void abort() override { discard(); }

    const std::string& error() const { return error_; }

private:
    void discard() {
        if (!open_) return;
        open_ = false;
        if (file_.is_open()) file_.close();
        std::error_code ec;
        fs::remove(temp_, ec);
    }

    fs::path target_;
    fs::path temp_;
    std::function<void(uint64_t)> on_size_;
    std::function<void(uint64_t)> on_progress_;
    std::ofstream file_;
    bool open_ = false;
    uint64_t loaded_ = 0;
    std::string error_;
};

}  // namespace

const char* location_type_name(LocationType type) {
    switch (type) {
        case LocationType::Local: return "local";
        case LocationType::S3: return "s3";
    }
    return "unknown";
}

std::optional<LocationType> parse_location_type(const std::string& name) {
    if (name == "local") return LocationType::Local;
    if (name == "s3") return LocationType::S3;
    return std::nullopt;
}

const char* conflict_policy_name(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::Overwrite: return "overwrite";
        case ConflictPolicy::Skip: return "skip";
        case ConflictPolicy::Rename: return "rename";
    }
    return "unknown";
}

std::optional<ConflictPolicy> parse_conflict_policy(const std::string& name) {
    if (name == "overwrite") return ConflictPolicy::Overwrite;
    if (name == "skip") return ConflictPolicy::Skip;
    if (name == "rename") return ConflictPolicy::Rename;
    return std::nullopt;
}

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Active: return "active";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* file_status_name(FileStatus status) {
    switch (status) {
        case FileStatus::Queued: return "queued";
        case FileStatus::Transferring: return "transferring";
        case FileStatus::Completed: return "completed";
        case FileStatus::Error: return "error";
    }
    return "unknown";
}

JobProgress job_progress(const std::vector<JobFile>& files) {
    JobProgress p;
    p.total_files = files.size();
    for (const auto& f : files) {
        if (f.status == FileStatus::Completed) ++p.completed_files;
        if (f.status == FileStatus::Error) ++p.failed_files;
        p.total_bytes += f.size;
        p.loaded_bytes += f.loaded;
    }
    if (p.total_bytes > 0) {
        p.percentage = static_cast<int>(std::lround(
            static_cast<double>(p.loaded_bytes) * 100.0 / static_cast<double>(p.total_bytes)));
    }
    return p;
}

nlohmann::json to_json(const JobInfo& info) {
    auto files = nlohmann::json::array();
    for (const auto& f : info.files) {
        nlohmann::json j = {
            {"sourcePath", f.source_path},
            {"destinationPath", f.destination_path},
            {"size", f.size},
            {"loaded", f.loaded},
            {"status", file_status_name(f.status)},
            {"skipped", f.skipped},
        };
        if (!f.error.empty()) j["error"] = f.error;
        files.push_back(std::move(j));
    }
    return {
        {"jobId", info.id},
        {"type", "cross-storage"},
        {"status", job_status_name(info.status)},
        {"source", to_json(info.source)},
        {"destination", to_json(info.destination)},
        {"conflictResolution", conflict_policy_name(info.policy)},
        {"progress", to_json(info.progress)},
        {"files", files},
        {"createdAt", epoch_ms(info.created)},
        {"startedAt", optional_time(info.started)},
        {"completedAt", optional_time(info.completed)},
    };
}

nlohmann::json progress_json(const JobInfo& info) {
    auto files = nlohmann::json::array();
    for (const auto& f : info.files) {
        nlohmann::json j = {
            {"file", f.destination_path},
            {"loaded", f.loaded},
            {"total", f.size},
            {"status", file_status_name(f.status)},
        };
        if (!f.error.empty()) j["error"] = f.error;
        files.push_back(std::move(j));
    }
    return {
        {"jobId", info.id},
        {"status", job_status_name(info.status)},
        {"progress", to_json(info.progress)},
        {"files", files},
    };
}

std::string resolve_local_path(const std::vector<fs::path>& roots,
                               const std::string& location_id,
                               const std::string& relative,
                               fs::path& out) {
    if (!location_id.starts_with("local-") || location_id.size() == 6) {
        return "invalid location id: " + location_id;
    }
    size_t index = 0;
    for (size_t i = 6; i < location_id.size(); ++i) {
        char c = location_id[i];
        if (c < '0' || c > '9') return "invalid location id: " + location_id;
        index = index * 10 + static_cast<size_t>(c - '0');
        if (index >= roots.size()) return "unknown location: " + location_id;
    }
    if (index >= roots.size()) return "unknown location: " + location_id;

    if (relative.find('\\') != std::string::npos) return "backslash characters not allowed in paths";
    if (relative.find('\0') != std::string::npos) return "null bytes not allowed in paths";

    fs::path rel = fs::path(relative).lexically_normal();
    if (rel.is_absolute()) return "absolute paths not allowed: " + relative;
    if (!rel.empty() && *rel.begin() == "..") return "path escapes its location: " + relative;

    std::error_code ec;
    fs::path base = fs::weakly_canonical(roots[index], ec);
    if (ec) return "location " + location_id + " unavailable: " + ec.message();
    fs::path resolved = fs::weakly_canonical(rel.empty() ? base : base / rel, ec);
    if (ec) return "cannot resolve " + relative + ": " + ec.message();

    // Symlinks inside the root may point anywhere; judge the resolved path
    auto [b, r] = std::mismatch(base.begin(), base.end(), resolved.begin(), resolved.end());
    if (b != base.end() && !b->empty()) return "path escapes its location: " + relative;

    out = resolved;
    return {};
}

std::string join_location_path(const std::string& dir, const std::string& name) {
    auto trim = [](const std::string& s) {
        size_t first = s.find_first_not_of('/');
        if (first == std::string::npos) return std::string{};
        size_t last = s.find_last_not_of('/');
        return s.substr(first, last - first + 1);
    };
    std::string d = trim(dir);
    size_t first = name.find_first_not_of('/');
    std::string n = first == std::string::npos ? std::string{} : name.substr(first);
    if (d.empty()) return n;
    return d + "/" + n;
}

std::string numbered_path(const std::string& path, int n) {
    size_t slash = path.rfind('/');
    size_t name_start = slash == std::string::npos ? 0 : slash + 1;
    size_t dot = path.rfind('.');
    // A leading dot names a hidden file, not an extension
    if (dot == std::string::npos || dot <= name_start) {
        return path + "-" + std::to_string(n);
    }
    return path.substr(0, dot) + "-" + std::to_string(n) + path.substr(dot);
}

// --- JobManager ---

struct JobManager::Job {
    JobInfo info;
    size_t next_file = 0;
    std::vector<std::string> tickets;   // engine ticket per file while one is running
    std::atomic<bool> cancelled{false};
};

JobManager::JobManager(std::vector<fs::path> local_paths,
                       BackendRegistry& registry,
                       ConcurrencyGate& gate,
                       TransferEngine& engine)
    : local_paths_(std::move(local_paths))
    , registry_(registry)
    , gate_(gate)
    , engine_(engine) {}

JobManager::~JobManager() {
    stop();
}

std::string JobManager::next_job_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "job-" + std::to_string(ms) + "-" + std::to_string(next_id_.fetch_add(1));
}

std::string JobManager::local_path(const Location& location, const std::string& path,
                                   fs::path& out) const {
    return resolve_local_path(local_paths_, location.id, path, out);
}

std::string JobManager::submit(const JobRequest& request, std::string& job_id) {
    if (stopping_.load()) return "shutting down";
    if (request.files.empty()) return "no files specified";
    if (request.files.size() > constants::MAX_JOB_FILES) {
        return "too many files (at most " + std::to_string(constants::MAX_JOB_FILES) + ")";
    }
    bool needs_backend = request.source.type == LocationType::S3 ||
                         request.destination.type == LocationType::S3;
    if (needs_backend && !registry_.get()) return "no storage backend configured";

    auto job = std::make_shared<Job>();
    job->info.source = request.source;
    job->info.destination = request.destination;
    job->info.policy = request.policy;
    job->info.created = std::chrono::system_clock::now();

    for (const auto& name : request.files) {
        if (name.empty()) return "empty file name";
        JobFile file;
        file.name = name;
        file.source_path = join_location_path(request.source.path, name);
        file.destination_path = join_location_path(request.destination.path, name);

        for (const auto* side : {&request.source, &request.destination}) {
            const auto& path = side == &request.source ? file.source_path : file.destination_path;
            if (side->type == LocationType::Local) {
                fs::path resolved;
                auto err = local_path(*side, path, resolved);
                if (!err.empty()) return err;
            } else if (path.empty() || path.size() > 1024) {
                return "object key must be 1-1024 bytes: " + path;
            }
        }
        job->info.files.push_back(std::move(file));
    }
    job->tickets.resize(job->info.files.size());
    job->info.progress = job_progress(job->info.files);

    size_t worker_target = std::min(job->info.files.size(), std::max<size_t>(gate_.limit(), 1));
    {
        std::lock_guard lock(mutex_);
        job->info.id = next_job_id();
        job_id = job->info.id;
        jobs_[job_id] = job;
        workers_ += worker_target;
    }

    log_info("Transfer job %s: %zu files %s:%s/%s -> %s:%s/%s (%s)", job_id.c_str(),
             job->info.files.size(),
             location_type_name(request.source.type), request.source.id.c_str(),
             request.source.path.c_str(),
             location_type_name(request.destination.type), request.destination.id.c_str(),
             request.destination.path.c_str(), conflict_policy_name(request.policy));

    for (size_t i = 0; i < worker_target; ++i) {
        std::thread(&JobManager::run_worker, this, job).detach();
    }
    return {};
}

void JobManager::run_worker(const std::shared_ptr<Job>& job) {
    while (true) {
        size_t index = 0;
        {
            std::lock_guard lock(mutex_);
            if (job->cancelled.load() || job->next_file >= job->info.files.size()) break;
            index = job->next_file++;
        }

        std::string err;
        try {
            err = run_file(*job, index);
        } catch (const std::exception& e) {
            err = std::string("transfer aborted: ") + e.what();
        }

        std::lock_guard lock(mutex_);
        auto& file = job->info.files[index];
        job->tickets[index].clear();
        if (err.empty()) {
            file.status = FileStatus::Completed;
            file.loaded = file.size;
            file.error.clear();
        } else {
            file.status = FileStatus::Error;
            if (!job->cancelled.load()) {
                file.error = err;
                log_error("Transfer job %s: %s failed: %s", job->info.id.c_str(),
                          file.source_path.c_str(), err.c_str());
            }
        }
        refresh(*job);
    }

    std::lock_guard lock(mutex_);
    --workers_;
    changed_.notify_all();
}

std::string JobManager::run_file(Job& job, size_t index) {
    Location source;
    Location destination;
    ConflictPolicy policy;
    std::string source_path;
    std::string destination_path;
    {
        std::lock_guard lock(mutex_);
        if (job.cancelled.load()) return CANCELLED_BY_USER;
        source = job.info.source;
        destination = job.info.destination;
        policy = job.info.policy;
        source_path = job.info.files[index].source_path;
        destination_path = job.info.files[index].destination_path;
    }

    if (policy != ConflictPolicy::Overwrite) {
        bool exists = false;
        auto err = exists_at(destination, destination_path, exists);
        if (!err.empty()) return err;
        if (exists && policy == ConflictPolicy::Skip) {
            std::lock_guard lock(mutex_);
            auto& file = job.info.files[index];
            file.skipped = true;
            file.size = 0;
            log_debug("Transfer job %s: %s exists, skipped", job.info.id.c_str(),
                      destination_path.c_str());
            return {};
        }
        if (exists) {
            std::string candidate;
            bool taken = true;
            for (int n = 1; taken && n <= MAX_RENAME_ATTEMPTS; ++n) {
                candidate = numbered_path(destination_path, n);
                err = exists_at(destination, candidate, taken);
                if (!err.empty()) return err;
            }
            if (taken) return "no free name for " + destination_path;
            destination_path = candidate;
        }
    }

    {
        std::lock_guard lock(mutex_);
        if (job.cancelled.load()) return CANCELLED_BY_USER;
        auto& file = job.info.files[index];
        file.destination_path = destination_path;
        file.status = FileStatus::Transferring;
        refresh(job);
    }

    fs::path source_file;
    fs::path target_file;
    if (source.type == LocationType::Local) {
        auto err = local_path(source, source_path, source_file);
        if (!err.empty()) return err;
    }
    if (destination.type == LocationType::Local) {
        auto err = local_path(destination, destination_path, target_file);
        if (!err.empty()) return err;
    }

    if (source.type == LocationType::Local && destination.type == LocationType::S3) {
        return upload_file(job, index, source_file, destination.id, destination_path);
    }
    if (source.type == LocationType::S3 && destination.type == LocationType::Local) {
        return download_file(job, index, source.id, source_path, target_file);
    }
    if (source.type == LocationType::Local) {
        return copy_local(job, index, source_file, target_file);
    }
    return copy_remote(job, index, source.id, source_path, destination.id, destination_path);
}

std::string JobManager::upload_file(Job& job, size_t index, const fs::path& source,
                                    const std::string& bucket, const std::string& key) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) return "not a file: " + job.info.files[index].source_path;
    uint64_t size = fs::file_size(source, ec);
    if (ec) return "cannot stat " + source.string() + ": " + ec.message();
    set_size(job, index, size);

    FileSource reader(source, [&](uint64_t loaded) { set_loaded(job, index, loaded); });
    if (!reader.is_open()) return "cannot open " + source.string();

    auto ticket = engine_.create_ticket(TransferDirection::Upload, bucket, key, size);
    {
        std::lock_guard lock(mutex_);
        job.tickets[index] = ticket->id();
    }
    if (job.cancelled.load()) engine_.cancel(ticket->id());

    UploadRequest request;
    request.bucket = bucket;
    request.key = key;
    request.content_type = "application/octet-stream";
    request.size = size;
    auto outcome = engine_.upload(ticket, reader, request);
    if (!outcome.ok()) return outcome.error ? outcome.error->message : outcome.cause.describe();
    return {};
}

std::string JobManager::download_file(Job& job, size_t index, const std::string& bucket,
                                      const std::string& key, const fs::path& target) {
    FileSink writer(target, job.info.id + "-" + std::to_string(index),
                    [&](uint64_t size) { set_size(job, index, size); },
                    [&](uint64_t loaded) { set_loaded(job, index, loaded); });

    auto ticket = engine_.create_ticket(TransferDirection::Download, bucket, key);
    {
        std::lock_guard lock(mutex_);
        job.tickets[index] = ticket->id();
    }
    if (job.cancelled.load()) engine_.cancel(ticket->id());

    auto outcome = engine_.download(ticket, writer, {bucket, key, std::nullopt});
    if (outcome.ok()) return {};
    // The engine reports a failing sink as a vanished client; say what broke
    if (!writer.error().empty()) return writer.error();
    return outcome.error ? outcome.error->message : outcome.cause.describe();
}

std::string JobManager::copy_local(Job& job, size_t index, const fs::path& source,
                                   const fs::path& target) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) return "not a file: " + job.info.files[index].source_path;
    uint64_t size = fs::file_size(source, ec);
    if (ec) return "cannot stat " + source.string() + ": " + ec.message();
    set_size(job, index, size);

    auto slot = gate_.acquire_unless([&job] { return job.cancelled.load(); }, SLOT_POLL);
    if (!slot) return CANCELLED_BY_USER;

    std::ifstream in(source, std::ios::binary);
    if (!in) return "cannot open " + source.string();

    FileSink writer(target, job.info.id + "-" + std::to_string(index),
                    [&](uint64_t n) { set_size(job, index, n); },
                    [&](uint64_t loaded) { set_loaded(job, index, loaded); });
    ObjectInfo info;
    info.size = size;
    if (!writer.begin(info)) return writer.error();

    std::vector<char> buffer(constants::JOB_COPY_CHUNK);
    while (in) {
        if (job.cancelled.load()) {
            writer.abort();
            return CANCELLED_BY_USER;
        }
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<size_t>(in.gcount());
        if (got == 0) break;
        if (!writer.write(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(buffer.data()), got))) {
            writer.abort();
            return writer.error();
        }
    }
    if (in.bad()) {
        writer.abort();
        return "read failed on " + source.string();
    }
    if (!writer.finish()) {
        writer.abort();
        return writer.error();
    }
    return {};
}

std::string JobManager::copy_remote(Job& job, size_t index, const std::string& source_bucket,
                                    const std::string& source_key, const std::string& bucket,
                                    const std::string& key) {
    auto slot = gate_.acquire_unless([&job] { return job.cancelled.load(); }, SLOT_POLL);
    if (!slot) return CANCELLED_BY_USER;

    auto client = registry_.get();
    if (!client) return "no storage backend configured";

    auto head = client->store->head_object(source_bucket, source_key);
    if (!head.error.ok()) return head.error.describe();
    uint64_t size = head.info.size.value_or(0);
    set_size(job, index, size);

    // A server-side copy has no intermediate progress
    auto result = client->store->copy_object(source_bucket, source_key, bucket, key);
    if (!result.error.ok()) return result.error.describe();
    set_loaded(job, index, size);
    return {};
}

std::string JobManager::exists_at(const Location& location, const std::string& path,
                                  bool& exists) const {
    exists = false;
    if (location.type == LocationType::Local) {
        fs::path resolved;
        auto err = local_path(location, path, resolved);
        if (!err.empty()) return err;
        std::error_code ec;
        exists = fs::exists(resolved, ec);
        if (ec) return "cannot check " + path + ": " + ec.message();
        return {};
    }

    auto client = registry_.get();
    if (!client) return "no storage backend configured";
    auto head = client->store->head_object(location.id, path);
    if (head.error.ok()) {
        exists = true;
        return {};
    }
    if (head.error.http_status == 404 && head.error.code != "NoSuchBucket") return {};
    return "cannot check " + path + ": " + head.error.describe();
}

void JobManager::refresh(Job& job) {
    auto& info = job.info;
    info.progress = job_progress(info.files);
    ++info.version;

    if (!is_terminal(info.status)) {
        auto all = [&](auto pred) { return std::all_of(info.files.begin(), info.files.end(), pred); };
        auto any = [&](auto pred) { return std::any_of(info.files.begin(), info.files.end(), pred); };

        if (all([](const JobFile& f) { return f.status == FileStatus::Completed; })) {
            info.status = JobStatus::Completed;
            info.completed = std::chrono::system_clock::now();
        } else if (any([](const JobFile& f) { return f.status == FileStatus::Error; }) &&
                   all([](const JobFile& f) {
                       return f.status == FileStatus::Completed || f.status == FileStatus::Error;
                   })) {
            info.status = JobStatus::Failed;
            info.completed = std::chrono::system_clock::now();
        } else if (any([](const JobFile& f) { return f.status == FileStatus::Transferring; })) {
            info.status = JobStatus::Active;
            if (!info.started) info.started = std::chrono::system_clock::now();
        }
        if (is_terminal(info.status)) {
            log_info("Transfer job %s %s: %zu of %zu files, %llu bytes", info.id.c_str(),
                     job_status_name(info.status), info.progress.completed_files,
                     info.progress.total_files,
                     static_cast<unsigned long long>(info.progress.loaded_bytes));
        }
    }
    changed_.notify_all();
}

void JobManager::set_size(Job& job, size_t index, uint64_t size) {
    std::lock_guard lock(mutex_);
    job.info.files[index].size = size;
    refresh(job);
}

void JobManager::set_loaded(Job& job, size_t index, uint64_t loaded) {
    std::lock_guard lock(mutex_);
    job.info.files[index].loaded = loaded;
    job.info.progress = job_progress(job.info.files);
    ++job.info.version;
    changed_.notify_all();
}

std::optional<JobInfo> JobManager::find(const std::string& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second->info;
}

bool JobManager::cancel(const std::string& job_id) {
    std::vector<std::string> tickets;
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) return false;
        auto& job = *it->second;
        job.cancelled.store(true);
        job.info.status = JobStatus::Cancelled;
        job.info.completed = std::chrono::system_clock::now();
        for (auto& file : job.info.files) {
            if (file.status != FileStatus::Completed) {
                file.status = FileStatus::Error;
                file.error = CANCELLED_BY_USER;
            }
        }
        for (const auto& id : job.tickets) {
            if (!id.empty()) tickets.push_back(id);
        }
        refresh(job);
    }
    for (const auto& id : tickets) {
        engine_.cancel(id);
    }
    log_info("Transfer job %s cancelled", job_id.c_str());
    return true;
}

std::optional<JobInfo> JobManager::wait_for_update(const std::string& job_id, uint64_t seen_version,
                                                   std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    auto lookup = [&]() -> std::shared_ptr<Job> {
        auto it = jobs_.find(job_id);
        return it == jobs_.end() ? nullptr : it->second;
    };
    auto job = lookup();
    if (!job) return std::nullopt;
    changed_.wait_for(lock, timeout, [&] {
        return job->info.version > seen_version || stopping_.load();
    });
    return job->info;
}

JobManager::CleanupResult JobManager::cleanup(const std::string& job_id) {
    CleanupResult result;
    std::optional<JobInfo> info = find(job_id);
    if (!info) return result;
    result.found = true;
    if (info->status != JobStatus::Cancelled) return result;
    result.cancelled = true;

    for (const auto& file : info->files) {
        if (file.skipped) continue;
        const auto& dest = info->destination;
        std::string err;
        if (dest.type == LocationType::Local) {
            fs::path resolved;
            err = local_path(dest, file.destination_path, resolved);
            if (err.empty()) {
                std::error_code ec;
                fs::remove(resolved, ec);
                if (ec) err = ec.message();
            }
        } else if (auto client = registry_.get()) {
            auto e = client->store->delete_object(dest.id, file.destination_path);
            if (!e.ok()) err = e.describe();
        } else {
            err = "no storage backend configured";
        }
        if (err.empty()) {
            ++result.deleted;
        } else {
            log_error("Transfer job %s: cleanup of %s failed: %s", job_id.c_str(),
                      file.destination_path.c_str(), err.c_str());
            result.errors.push_back(file.destination_path + ": " + err);
        }
    }
    return result;
}

std::string JobManager::check_conflicts(const Location& destination,
                                        const std::vector<std::string>& files,
                                        std::vector<std::string>& conflicts) {
    for (const auto& name : files) {
        bool exists = false;
        auto err = exists_at(destination, join_location_path(destination.path, name), exists);
        if (!err.empty()) return err;
        if (exists) conflicts.push_back(name);
    }
    return {};
}

size_t JobManager::prune(std::chrono::seconds max_age) {
    auto cutoff = std::chrono::system_clock::now() - max_age;
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        const auto& info = it->second->info;
        if (is_terminal(info.status) && info.completed && *info.completed < cutoff) {
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void JobManager::stop() {
    if (stopping_.exchange(true)) return;

    std::vector<std::string> running;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, job] : jobs_) {
            if (!is_terminal(job->info.status)) running.push_back(id);
        }
    }
    for (const auto& id : running) {
        cancel(id);
    }

    std::unique_lock lock(mutex_);
    while (workers_ > 0) {
        if (!changed_.wait_for(lock, std::chrono::seconds(5), [this] { return workers_ == 0; })) {
            log_info("Waiting for %zu transfer job workers to exit", workers_);
        }
    }
}

size_t JobManager::worker_count() const {
    std::lock_guard lock(mutex_);
    return workers_;
}

}  // namespace s3relay
