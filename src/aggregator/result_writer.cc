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

namespace Cadence {

namespace {

std::string FormatFloat(double value) {
    if (value == 0.0) return "0";
    std::stringstream ss;
    ss << std::fixed << std::setprecision(4) << value;
    return ss.str();
}

std::string Timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t_now, &local_tm);
    std::stringstream timestamp;
    timestamp << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
    return timestamp.str();
}

}  // namespace

ResultWriter::ResultWriter(const std::string& result_dir, bool record_results)
    : record_result_(record_results) {
    std::string dir = result_dir.empty() ? "." : result_dir;
    if (dir.back() != '/') {
        dir += "/";
    }
    result_path_ = dir + "result.csv";

    if (!record_result_) {
        return;
    }

    // Create output directory if it doesn't exist
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        LOG(ERROR) << "Failed to create result directory " << dir << ": " << ec.message();
    }

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
                << "label,"
                << "dispatch_model,"
                << "correction_mode,"
                << "target_rate,"
                << "achieved_rate,"
                << "issued,"
                << "completed,"
                << "timeout,"
                << "error,"
                << "dropped,"
                << "abandoned,"
                << "max_queue_depth,"
                << "max_drift_us,"
                << "overruns,"
                << "raw_p50_us,raw_p99_us,raw_p999_us,raw_max_us,"
                << "corrected_p50_us,corrected_p99_us,corrected_p999_us,corrected_max_us\n";
    LOG(INFO) << "Created new result file with headers: " << result_path_;
}

bool ResultWriter::Append(const RunReport& report, const std::string& label) {
    if (!record_result_) {
        return true;
    }

    std::ofstream file(result_path_, std::ios::app);
    if (!file.is_open()) {
        LOG(ERROR) << "Error: Could not open file: " << result_path_ << " : " << strerror(errno);
        return false;
    }

    const LatencyStats::Summary empty{};
    const LatencyStats::Summary& corrected = report.corrected ? *report.corrected : empty;

    file << Timestamp() << ","
         << label << ","
         << report.dispatch_model << ","
         << CorrectionModeName(report.correction_mode) << ","
         << FormatFloat(report.target_rate) << ","
         << FormatFloat(report.achieved_rate) << ","
         << report.total_issued << ","
         << report.total_completed << ","
         << report.total_timeout << ","
         << report.total_error << ","
         << report.total_dropped << ","
         << report.total_abandoned << ","
         << report.max_queue_depth_observed << ","
         << ToMicros(report.max_drift) << ","
         << report.overruns << ","
         << FormatFloat(report.raw.p50_us) << ","
         << FormatFloat(report.raw.p99_us) << ","
         << FormatFloat(report.raw.p999_us) << ","
         << FormatFloat(report.raw.max_us) << ","
         << FormatFloat(corrected.p50_us) << ","
         << FormatFloat(corrected.p99_us) << ","
         << FormatFloat(corrected.p999_us) << ","
         << FormatFloat(corrected.max_us) << "\n";
    file.close();
    if (file.fail()) {
        LOG(ERROR) << "Failed writing results to " << result_path_;
        return false;
    }

    LOG(INFO) << "Results written to: " << result_path_;
    return true;
}

}  // namespace Cadence
