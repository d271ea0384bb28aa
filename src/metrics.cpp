#include "s3relay/metrics.hpp"
#include "s3relay/backend_registry.hpp"
#include "s3relay/concurrency_gate.hpp"
#include "s3relay/log.hpp"
#include "s3relay/transfer_engine.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace s3relay {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& transfers_family = prometheus::BuildCounter()
        .Name("s3relay_transfers_total")
        .Help("Total transfers finished")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &transfers_family.Add({{"direction", "upload"}, {"result", "success"}});
    uploads_failure_ = &transfers_family.Add({{"direction", "upload"}, {"result", "failure"}});
    downloads_success_ = &transfers_family.Add({{"direction", "download"}, {"result", "success"}});
    downloads_failure_ = &transfers_family.Add({{"direction", "download"}, {"result", "failure"}});

    auto& bytes_family = prometheus::BuildCounter()
        .Name("s3relay_transfer_bytes_total")
        .Help("Total bytes moved through the relay")
        .Labels(labels)
        .Register(*registry_);
    upload_bytes_total_ = &bytes_family.Add({{"direction", "upload"}});
    download_bytes_total_ = &bytes_family.Add({{"direction", "download"}});

    auto& errors_family = prometheus::BuildCounter()
        .Name("s3relay_transfer_errors_total")
        .Help("Failed transfers by classified error kind")
        .Labels(labels)
        .Register(*registry_);
    for (auto kind : {ErrorKind::Configuration, ErrorKind::StorageService, ErrorKind::Transient,
                      ErrorKind::ClientDisconnect, ErrorKind::Internal}) {
        errors_[kind] = &errors_family.Add({{"kind", error_kind_name(kind)}});
    }

    client_swaps_total_ = &prometheus::BuildCounter()
        .Name("s3relay_client_swaps_total")
        .Help("Backend client replacements observed")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    gate_in_use_ = &gauge_reg("s3relay_gate_in_use", "Transfer slots currently held");
    gate_waiting_ = &gauge_reg("s3relay_gate_waiting", "Transfers queued at the gate");
    gate_limit_ = &gauge_reg("s3relay_gate_limit", "Maximum concurrent transfers");
    client_generation_ = &gauge_reg("s3relay_client_generation", "Generation of the active backend client");
    transfers_active_ = &gauge_reg("s3relay_transfers_active", "Tickets not yet finished");

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("s3relay_upload_duration_seconds")
        .Help("Upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 900});

    download_duration_ = &prometheus::BuildHistogram()
        .Name("s3relay_download_duration_seconds")
        .Help("Download duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 900});

    gate_wait_duration_ = &prometheus::BuildHistogram()
        .Name("s3relay_gate_wait_seconds")
        .Help("Time spent queued for a transfer slot")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.001, 0.01, 0.1, 0.5, 1, 5, 10, 30, 60, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        // Final snapshot
        update_gauges();
        write_file();
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

prometheus::Counter& MetricsExporter::errors_total(ErrorKind kind) {
    return *errors_.at(kind);
}

void MetricsExporter::record_transfer(TransferDirection direction, bool success,
                                      uint64_t bytes, double seconds) {
    if (direction == TransferDirection::Upload) {
        (success ? uploads_success_ : uploads_failure_)->Increment();
        upload_bytes_total_->Increment(static_cast<double>(bytes));
        upload_duration_->Observe(seconds);
    } else {
        (success ? downloads_success_ : downloads_failure_)->Increment();
        download_bytes_total_->Increment(static_cast<double>(bytes));
        download_duration_->Observe(seconds);
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(snapshot_mutex_);
    if (gate_) {
        gate_in_use_->Set(static_cast<double>(gate_->in_use()));
        gate_waiting_->Set(static_cast<double>(gate_->waiting()));
        gate_limit_->Set(static_cast<double>(gate_->limit()));
    }

    if (registry_ptr_) {
        uint64_t generation = registry_ptr_->generation();
        client_generation_->Set(static_cast<double>(generation));
        // Increment counter by delta since last snapshot; the first client
        // is the startup configuration, not a swap
        if (prev_generation_ == 0) {
            prev_generation_ = generation;
        } else if (generation > prev_generation_) {
            client_swaps_total_->Increment(static_cast<double>(generation - prev_generation_));
            prev_generation_ = generation;
        }
    }

    if (engine_) {
        transfers_active_->Set(static_cast<double>(engine_->active().size()));
    }
}

std::string MetricsExporter::serialize() {
    update_gauges();
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot rename metrics file into place: %s", ec.message().c_str());
    }
}

}  // namespace s3relay
