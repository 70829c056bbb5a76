#pragma once

#include <optional>
#include <string>

#include "trial_aggregator.h"

namespace SyncBench {

/**
 * Appends one CSV row per strategy summary to <result_dir>/result.csv
 */
class ResultWriter {
public:
    /**
     * Constructor
     * @param options Trial parameters recorded alongside the summary
     * @param record_results Nothing is written when false
     * @param result_dir Directory of the CSV file, created if missing
     */
    ResultWriter(const TrialOptions& options, bool record_results, const std::string& result_dir);

    /**
     * Destructor - writes the report, if one was set
     */
    ~ResultWriter();

    /**
     * Sets the report to record
     * @param report Aggregated statistics of one strategy
     */
    void SetReport(const TrialReport& report);

    const std::string& result_path() const { return result_path_; }

private:
    size_t data_count_;
    size_t net_fact_;
    size_t warmup_trials_;
    size_t measured_trials_;
    double fp_rate_;
    bool record_result_;

    std::string result_path_;
    std::optional<TrialReport> report_;
};

} // namespace SyncBench
