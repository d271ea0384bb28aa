#pragma once

#include <cstddef>
#include <cstdint>

namespace s3relay::constants {

// Server defaults
constexpr uint16_t DEFAULT_SERVER_PORT = 8080;
constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0";
constexpr const char* DEFAULT_LOG_DIR = "/opt/app-root/src/logs";

// Backend defaults
constexpr const char* DEFAULT_REGION = "us-east-1";
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECONDS = 10;
constexpr uint32_t DEFAULT_STALL_TIMEOUT_SECONDS = 60;

// Transfer defaults
constexpr size_t DEFAULT_MAX_CONCURRENT_TRANSFERS = 2;
constexpr size_t MAX_CONCURRENT_TRANSFERS_LIMIT = 256;
constexpr size_t DEFAULT_PART_SIZE = 8 * 1024 * 1024;                  // 8MB
constexpr size_t S3_MIN_PART_SIZE = 5 * 1024 * 1024;                   // 5MB (S3 minimum part size)
constexpr size_t S3_MAX_PART_COUNT = 10000;
constexpr size_t DEFAULT_DOWNLOAD_BUFFER_SIZE = 64 * 1024;             // 64KB curl receive buffer
constexpr size_t DEFAULT_BODY_READ_SIZE = 64 * 1024;                   // 64KB socket read chunk

// Progress cadence
constexpr uint64_t DEFAULT_PROGRESS_BYTES = 1024 * 1024;               // 1MB
constexpr uint32_t DEFAULT_PROGRESS_INTERVAL_MS = 500;
constexpr size_t DEFAULT_SUBSCRIBER_QUEUE_DEPTH = 64;

// Listing
constexpr uint32_t DEFAULT_LIST_MAX_KEYS = 1000;
constexpr size_t S3_DELETE_BATCH_SIZE = 1000;                          // DeleteObjects limit

// Error bodies from the backend are small XML documents
constexpr size_t MAX_ERROR_BODY_SIZE = 64 * 1024;

// Per-client request limits (requests per window; 0 disables)
constexpr uint64_t DEFAULT_UPLOAD_RATE_LIMIT = 0;
constexpr uint64_t DEFAULT_TRANSFER_RATE_LIMIT = 10;
constexpr uint32_t DEFAULT_RATE_LIMIT_WINDOW_MS = 60000;
constexpr size_t RATE_LIMIT_SWEEP_THRESHOLD = 10000;                  // expired windows swept past this

// Multi-file transfer jobs
constexpr uint32_t JOB_RETENTION_SECONDS = 3600;                        // finished jobs kept this long
constexpr size_t MAX_JOB_FILES = 10000;
constexpr size_t JOB_COPY_CHUNK = 1024 * 1024;                          // local to local copy buffer

// Access log: a request older than this marks the service idle
constexpr int ACCESS_IDLE_SECONDS = 600;

} // namespace s3relay::constants
