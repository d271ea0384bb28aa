#pragma once

#include "s3relay/backend_registry.hpp"
#include "s3relay/concurrency_gate.hpp"
#include "s3relay/transfer_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace s3relay {

enum class LocationType {
    Local,
    S3
};

const char* location_type_name(LocationType type);
std::optional<LocationType> parse_location_type(const std::string& name);

/// One side of a job: a configured local directory ("local-N") or a bucket
/// of the active backend, plus a directory inside it.
struct Location {
    LocationType type = LocationType::S3;
    std::string id;
    std::string path;
};

/// What to do when a destination file already exists.
enum class ConflictPolicy {
    Overwrite,
    Skip,
    Rename     // "name-1.ext", "name-2.ext", ... until one is free
};

const char* conflict_policy_name(ConflictPolicy policy);
std::optional<ConflictPolicy> parse_conflict_policy(const std::string& name);

enum class JobStatus {
    Queued,
    Active,
    Completed,
    Failed,
    Cancelled
};

const char* job_status_name(JobStatus status);

inline bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

enum class FileStatus {
    Queued,
    Transferring,
    Completed,
    Error
};

const char* file_status_name(FileStatus status);

struct JobFile {
    std::string name;               // as requested, relative to both location paths
    std::string source_path;
    std::string destination_path;   // final path once a rename picked one
    uint64_t size = 0;
    uint64_t loaded = 0;
    FileStatus status = FileStatus::Queued;
    std::string error;
    bool skipped = false;           // existed at the destination under ConflictPolicy::Skip
};

struct JobProgress {
    size_t total_files = 0;
    size_t completed_files = 0;
    size_t failed_files = 0;
    uint64_t total_bytes = 0;
    uint64_t loaded_bytes = 0;
    int percentage = 0;
};

JobProgress job_progress(const std::vector<JobFile>& files);

/// Point-in-time copy of a job.
struct JobInfo {
    std::string id;
    JobStatus status = JobStatus::Queued;
    Location source;
    Location destination;
    ConflictPolicy policy = ConflictPolicy::Overwrite;
    std::vector<JobFile> files;
    JobProgress progress;
    uint64_t version = 0;           // bumped on every change
    std::chrono::system_clock::time_point created;
    std::optional<std::chrono::system_clock::time_point> started;
    std::optional<std::chrono::system_clock::time_point> completed;
};

/// Full job details.
nlohmann::json to_json(const JobInfo& info);

/// Progress event body: status, totals and one entry per file.
nlohmann::json progress_json(const JobInfo& info);

struct JobRequest {
    Location source;
    Location destination;
    std::vector<std::string> files;
    ConflictPolicy policy = ConflictPolicy::Overwrite;
};

/// Map `relative` inside local location `location_id` ("local-N" indexing
/// `roots`) to an absolute path. Backslashes, NUL, absolute paths and
/// anything resolving outside the root (symlinks included) are refused.
/// Returns error message or empty string.
std::string resolve_local_path(const std::vector<std::filesystem::path>& roots,
                               const std::string& location_id,
                               const std::string& relative,
                               std::filesystem::path& out);

/// "dir" + "name" with exactly one '/' between them and none in front.
std::string join_location_path(const std::string& dir, const std::string& name);

/// "a/b.txt", 2 -> "a/b-2.txt"
std::string numbered_path(const std::string& path, int n);

/// Multi-file copies between local directories and buckets.
///
/// Each job runs on its own worker threads, at most as many as the gate
/// admits. Files into or out of a bucket go through the TransferEngine and
/// show up as ordinary transfer tickets; local copies and bucket-to-bucket
/// copies take a gate slot themselves. Finished jobs stay visible for an
/// hour.
class JobManager {
public:
    JobManager(std::vector<std::filesystem::path> local_paths,
               BackendRegistry& registry,
               ConcurrencyGate& gate,
               TransferEngine& engine);
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    /// Validate and start a job. Returns error message or empty string.
    std::string submit(const JobRequest& request, std::string& job_id);

    std::optional<JobInfo> find(const std::string& job_id) const;

    /// Mark the job cancelled, fail its unfinished files and stop the ones
    /// in flight. False for unknown ids.
    bool cancel(const std::string& job_id);

    /// Block until the job changes past `seen_version` or `timeout` elapses,
    /// then return its current state. Empty for unknown ids.
    std::optional<JobInfo> wait_for_update(const std::string& job_id, uint64_t seen_version,
                                           std::chrono::milliseconds timeout) const;

    struct CleanupResult {
        bool found = false;
        bool cancelled = false;
        size_t deleted = 0;
        std::vector<std::string> errors;
    };

    /// Delete what a cancelled job wrote. Skipped files predate the job and
    /// are left alone.
    CleanupResult cleanup(const std::string& job_id);

    /// Names from `files` already present under `destination`.
    /// Returns error message or empty string.
    std::string check_conflicts(const Location& destination,
                                const std::vector<std::string>& files,
                                std::vector<std::string>& conflicts);

    /// Forget finished jobs completed more than `max_age` ago.
    size_t prune(std::chrono::seconds max_age);

    /// Cancel every job and wait for their workers to exit.
    void stop();

    size_t worker_count() const;
    const std::vector<std::filesystem::path>& local_paths() const { return local_paths_; }

private:
    struct Job;

    void run_worker(const std::shared_ptr<Job>& job);
    std::string run_file(Job& job, size_t index);
    std::string upload_file(Job& job, size_t index, const std::filesystem::path& source,
                            const std::string& bucket, const std::string& key);
    std::string download_file(Job& job, size_t index, const std::string& bucket,
                              const std::string& key, const std::filesystem::path& target);
    std::string copy_local(Job& job, size_t index, const std::filesystem::path& source,
                           const std::filesystem::path& target);
    std::string copy_remote(Job& job, size_t index, const std::string& source_bucket,
                            const std::string& source_key, const std::string& bucket,
                            const std::string& key);

    std::string exists_at(const Location& location, const std::string& path, bool& exists) const;
    std::string local_path(const Location& location, const std::string& path,
                           std::filesystem::path& out) const;

    // Recompute progress and status; caller holds mutex_
    void refresh(Job& job);
    void set_size(Job& job, size_t index, uint64_t size);
    void set_loaded(Job& job, size_t index, uint64_t loaded);

    std::string next_job_id();

    std::vector<std::filesystem::path> local_paths_;
    BackendRegistry& registry_;
    ConcurrencyGate& gate_;
    TransferEngine& engine_;

    std::atomic<uint64_t> next_id_{1};
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::unordered_map<std::string, std::shared_ptr<Job>> jobs_;
    size_t workers_ = 0;
};

}  // namespace s3relay
