#include "dropfile/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace dropfile {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    requests_family_ = &prometheus::BuildCounter()
        .Name("dropfile_requests_total")
        .Help("Total API requests by endpoint and result")
        .Labels(labels)
        .Register(*registry_);

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("dropfile_upload_bytes_total")
        .Help("Total request body bytes sent")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    download_bytes_total_ = &prometheus::BuildCounter()
        .Name("dropfile_download_bytes_total")
        .Help("Total response body bytes received")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    request_duration_ = &prometheus::BuildHistogram()
        .Name("dropfile_request_duration_seconds")
        .Help("API request duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
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
    }
    // Always write a final snapshot
    write_file();
}

void MetricsExporter::observe_request(const std::string& endpoint, bool success,
                                      uint64_t bytes_sent, uint64_t bytes_received) {
    requests_family_->Add({{"endpoint", endpoint},
                           {"result", success ? "success" : "failure"}}).Increment();
    if (bytes_sent > 0) {
        upload_bytes_total_->Increment(static_cast<double>(bytes_sent));
    }
    if (bytes_received > 0) {
        download_bytes_total_->Increment(static_cast<double>(bytes_received));
    }
}

std::string MetricsExporter::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace dropfile
