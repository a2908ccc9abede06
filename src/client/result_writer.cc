#include "result_writer.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace fs = std::filesystem;

namespace Replibench {

ResultWriter::ResultWriter(const RunParameters& params)
    : params_(params),
      record_result_(params.record_results) {
    if (!record_result_) {
        return;
    }

    std::string dir = params_.result_dir.empty() ? "." : params_.result_dir;
    try {
        fs::create_directories(dir);
    } catch (const fs::filesystem_error& e) {
        LOG(ERROR) << "Failed to create result directory: " << e.what();
    }
    result_path_ = (fs::path(dir) / "results.csv").string();

    // If this is the first run, create the file with headers
    std::error_code ec;
    bool headers_needed = !fs::exists(result_path_, ec) || fs::file_size(result_path_, ec) == 0;
    if (!headers_needed) {
        return;
    }

    std::ofstream header_file(result_path_);
    if (!header_file.is_open()) {
        LOG(ERROR) << "Failed to create result file: " << result_path_ << ": " << strerror(errno);
        return;
    }
    header_file << "timestamp,"
                << "client_id,"
                << "protocol,"
                << "duration_s,"
                << "request_count,"
                << "concurrency,"
                << "batch_size,"
                << "key_space,"
                << "write_ratio,"
                << "conflicts,"
                << "distribution,"
                << "ack_num,"
                << "throughput_ops,"
                << "mean_latency_ms,"
                << "p50_ms,"
                << "p99_ms,"
                << "max_latency_ms,"
                << "read_num,"
                << "slow_num,"
                << "slow_rate,"
                << "decode_failures,"
                << "outstanding_batches\n";
    header_file.close();
    LOG(INFO) << "Created new result file with headers: " << result_path_;
}

ResultWriter::~ResultWriter() {
    if (!record_result_ || !has_report_) {
        return;
    }

    std::ofstream file(result_path_, std::ios::app);
    if (!file.is_open()) {
        LOG(ERROR) << "Error: Could not open file: " << result_path_ << " : " << strerror(errno);
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now{};
    localtime_r(&time_t_now, &tm_now);

    auto formatFloat = [](double value) -> std::string {
        if (value == 0.0) return "0";
        std::stringstream ss;
        ss << std::fixed << std::setprecision(4) << value;
        return ss.str();
    };

    file << std::put_time(&tm_now, "%Y%m%d_%H%M%S") << ","
         << params_.client_id << ","
         << ProtocolName(params_.protocol) << ","
         << params_.duration_s << ","
         << params_.request_count << ","
         << params_.concurrency << ","
         << params_.batch_size << ","
         << params_.key_space << ","
         << formatFloat(params_.write_ratio) << ","
         << params_.conflicts << ","
         << params_.distribution << ","
         << report_.ack_num << ","
         << report_.throughput << ","
         << report_.mean_latency_ms << ","
         << report_.latency.p50_ms << ","
         << report_.latency.p99_ms << ","
         << report_.max_latency_ms << ","
         << report_.read_num << ","
         << report_.slow_num << ","
         << formatFloat(report_.slow_rate) << ","
         << report_.decode_failures << ","
         << report_.outstanding_batches << "\n";
    file.close();

    if (file.fail()) {
        LOG(ERROR) << "Failed to append results to " << result_path_;
        return;
    }
    LOG(INFO) << "Results written to: " << result_path_;
}

void ResultWriter::SetReport(const RunReport& report) {
    report_ = report;
    has_report_ = true;
}

} // namespace Replibench
