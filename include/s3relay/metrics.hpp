#pragma once

#include "s3relay/error_classifier.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace s3relay {

class BackendRegistry;
class ConcurrencyGate;
class TransferEngine;
enum class TransferDirection;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports s3-relay metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Set pointers for gauge snapshots.
    void set_gate(const ConcurrencyGate* gate) { gate_ = gate; }
    void set_registry(const BackendRegistry* registry) { registry_ptr_ = registry; }
    void set_engine(const TransferEngine* engine) { engine_ = engine; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Refresh gauges and render the registry in text exposition format.
    std::string serialize();

    /// Count one finished transfer and its bytes, and observe its duration.
    void record_transfer(TransferDirection direction, bool success, uint64_t bytes, double seconds);

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& errors_total(ErrorKind kind);
    prometheus::Counter& client_swaps_total() { return *client_swaps_total_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }
    prometheus::Histogram& gate_wait_duration() { return *gate_wait_duration_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Pointers for gauge snapshots (not owned)
    const ConcurrencyGate* gate_ = nullptr;
    const BackendRegistry* registry_ptr_ = nullptr;
    const TransferEngine* engine_ = nullptr;

    // Previous registry generation for swap counting
    uint64_t prev_generation_ = 0;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    std::map<ErrorKind, prometheus::Counter*> errors_;
    prometheus::Counter* client_swaps_total_;

    // --- Gauges ---
    prometheus::Gauge* gate_in_use_;
    prometheus::Gauge* gate_waiting_;
    prometheus::Gauge* gate_limit_;
    prometheus::Gauge* client_generation_;
    prometheus::Gauge* transfers_active_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* download_duration_;
    prometheus::Histogram* gate_wait_duration_;

    // Serializes update_gauges() between the writer thread and serialize()
    std::mutex snapshot_mutex_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace s3relay
