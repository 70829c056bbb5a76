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

namespace SyncBench {

ResultWriter::ResultWriter(const TrialOptions& options, bool record_results, const std::string& result_dir)
    : data_count_(options.runner.data_count),
      net_fact_(options.runner.net_fact),
      warmup_trials_(options.warmup_trials),
      measured_trials_(options.measured_trials),
      fp_rate_(options.reconciler.fp_rate),
      record_result_(record_results) {

    result_path_ = result_dir;
    if (!result_path_.empty() && result_path_.back() != '/') {
        result_path_ += "/";
    }

    if (!record_result_) {
        result_path_ += "result.csv";
        return;
    }

    // Create output directory if it doesn't exist
    try {
        fs::create_directories(result_path_);
    } catch (const fs::filesystem_error& e) {
        LOG(ERROR) << "Failed to create result directory: " << e.what();
    }

    result_path_ += "result.csv";

    // If this is the first run, create the file with headers
    std::error_code ec;
    bool headers_needed = !fs::exists(result_path_, ec) || fs::file_size(result_path_, ec) == 0;

    if (headers_needed) {
        std::ofstream header_file(result_path_);
        if (!header_file.is_open()) {
            LOG(ERROR) << "Failed to create result file: " << result_path_ << ": " << strerror(errno);
            return;
        }

        header_file << "timestamp,"
                    << "strategy,"
                    << "data_count,"
                    << "net_fact,"
                    << "seed,"
                    << "warmup_trials,"
                    << "measured_trials,"
                    << "fp_rate,"
                    << "rounds_mean,"
                    << "rounds_stddev,"
                    << "mib_mean,"
                    << "mib_stddev,"
                    << "seconds_mean,"
                    << "seconds_stddev\n";

        LOG(INFO) << "Created new result file with headers: " << result_path_;
    }
}

ResultWriter::~ResultWriter() {
    if (!record_result_ || !report_) {
        return;
    }

    try {
        std::ofstream file(result_path_, std::ios::app);
        if (!file.is_open()) {
            LOG(ERROR) << "Error: Could not open file: " << result_path_ << " : " << strerror(errno);
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::stringstream timestamp;
        timestamp << std::put_time(std::localtime(&time_t_now), "%Y%m%d_%H%M%S");

        auto formatFloat = [](double value) -> std::string {
            if (value == 0.0) return "0";
            std::stringstream ss;
            ss << std::fixed << std::setprecision(4) << value;
            return ss.str();
        };

        const TrialReport& r = *report_;
        file << timestamp.str() << ","
             << StrategyName(r.strategy) << ","
             << data_count_ << ","
             << net_fact_ << ","
             << r.seed << ","
             << warmup_trials_ << ","
             << measured_trials_ << ","
             << formatFloat(fp_rate_) << ","
             << formatFloat(r.rounds.mean) << ","
             << formatFloat(r.rounds.stddev) << ","
             << formatFloat(r.mib_transferred.mean) << ","
             << formatFloat(r.mib_transferred.stddev) << ","
             << formatFloat(r.seconds.mean) << ","
             << formatFloat(r.seconds.stddev) << "\n";

        LOG(INFO) << "Results written to: " << result_path_;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Exception in ResultWriter destructor: " << e.what();
    }
}

void ResultWriter::SetReport(const TrialReport& report) {
    report_ = report;
}

} // namespace SyncBench
