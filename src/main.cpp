#include "s3relay/access_log.hpp"
#include "s3relay/backend_registry.hpp"
#include "s3relay/concurrency_gate.hpp"
#include "s3relay/log.hpp"
#include "s3relay/metrics.hpp"
#include "s3relay/progress_notifier.hpp"
#include "s3relay/relay_config.hpp"
#include "s3relay/relay_server.hpp"
#include "s3relay/transfer_engine.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // Redirect stdin to /dev/null; stdout/stderr will be redirected
    // to log file after this function returns.
    close(STDIN_FILENO);
    open("/dev/null", O_RDONLY);  // stdin = fd 0

    return true;
}

void write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (ofs) {
        ofs << getpid() << "\n";
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = s3relay::RelayConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Daemonize if requested (before log redirect so we fork first)
    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    // Redirect log output if log file specified (after daemonize)
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    s3relay::set_verbose_logging(config.verbose);

    std::cout << "s3-relay starting..." << std::endl;
    std::cout << "  listen: " << config.listen_address << ":" << config.port << std::endl;
    std::cout << "  backend: " << config.backend.summary() << std::endl;
    std::cout << "  max-concurrent-transfers: " << config.max_concurrent_transfers << std::endl;
    std::cout << "  part-size: " << (config.part_size / (1024 * 1024)) << " MB" << std::endl;
    std::cout << "  progress: every " << config.progress_bytes << " bytes or "
              << config.progress_interval.count() << " ms" << std::endl;
    std::cout << "  stall-timeout: " << config.backend.stall_timeout_secs << " s" << std::endl;
    for (size_t i = 0; i < config.local_paths.size(); ++i) {
        std::cout << "  local-" << i << ": " << config.local_paths[i] << std::endl;
    }
    std::cout << "  rate-limits: " << config.transfer_rate_limit << " transfer jobs, "
              << config.upload_rate_limit << " uploads per "
              << config.rate_limit_window.count() << " ms (0 = unlimited)" << std::endl;
    std::cout << "  access-log: "
              << (config.access_log_enabled ? (config.log_dir / "access.log").string() : "disabled")
              << std::endl;
    if (!config.metrics_file.empty()) {
        std::cout << "  metrics-file: " << config.metrics_file << " (every "
                  << config.metrics_interval_secs << " s)" << std::endl;
    }

    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.pid_file).parent_path(), ec);
        write_pid_file(config.pid_file);
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A peer closing mid-write must surface as a write error, not kill us
    signal(SIGPIPE, SIG_IGN);

    s3relay::BackendRegistry registry;
    try {
        registry.update(config.backend);
    } catch (const s3relay::ConfigurationError& e) {
        std::cerr << "Failed to create storage client: " << e.what() << std::endl;
        return 1;
    }

    s3relay::ConcurrencyGate gate(config.max_concurrent_transfers);
    s3relay::ProgressNotifier notifier(config.subscriber_queue_depth);

    s3relay::EngineConfig engine_config;
    engine_config.part_size = config.part_size;
    engine_config.progress_bytes = config.progress_bytes;
    engine_config.progress_interval = config.progress_interval;
    s3relay::TransferEngine engine(registry, gate, notifier, engine_config);

    s3relay::AccessLog access_log(config.log_dir, config.access_log_enabled);

    s3relay::RelayServer server(config, registry, gate, notifier, engine, access_log);

    // Prometheus metrics
    std::unique_ptr<s3relay::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        char hostname[256] = {};
        gethostname(hostname, sizeof(hostname) - 1);
        metrics = std::make_unique<s3relay::MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"host", hostname}});
        metrics->set_gate(&gate);
        metrics->set_registry(&registry);
        metrics->set_engine(&engine);
        engine.set_metrics(metrics.get());
        server.set_metrics(metrics.get());
        metrics->start();
    }

    err = server.start();
    if (!err.empty()) {
        std::cerr << "Failed to start HTTP server: " << err << std::endl;
        if (metrics) metrics->stop();
        return 1;
    }

    std::cout << "s3-relay running (PID " << getpid() << ")" << std::endl;

    // Wait until shutdown signal, then stop outside signal context.
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server.stop();

    if (metrics) {
        engine.set_metrics(nullptr);
        metrics->stop();
    }

    // Remove PID file
    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    std::cout << "s3-relay exited cleanly" << std::endl;
    return 0;
}
