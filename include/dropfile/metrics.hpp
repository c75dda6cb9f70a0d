#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace dropfile {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports request metrics to a Prometheus textfile for node_exporter pickup.
///
/// A background writer thread periodically serializes the registry to the
/// .prom file using atomic temp+rename. stop() writes a final snapshot, so
/// short-lived CLI runs still leave their numbers behind.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels = {});
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void start();
    void stop();

    /// Count one finished request. `endpoint` is the first path segment
    /// of the API endpoint ("files", "chunked_upload", "fileops", ...).
    void observe_request(const std::string& endpoint, bool success,
                         uint64_t bytes_sent, uint64_t bytes_received);

    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Histogram& request_duration() { return *request_duration_; }

    /// Registry contents in the Prometheus text format.
    std::string serialize() const;

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* requests_family_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Histogram* request_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace dropfile
