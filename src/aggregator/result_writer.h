#pragma once

#include <string>

#include "aggregator.h"

namespace Cadence {

/**
 * Appends one CSV summary row per run to <result_dir>/result.csv
 */
class ResultWriter {
public:
    /**
     * Constructor. Creates the directory and the header row when recording
     * is enabled and the file does not exist yet.
     * @param result_dir Directory holding result.csv
     * @param record_results When false every call is a no-op
     */
    ResultWriter(const std::string& result_dir, bool record_results);

    /**
     * Appends the report as one row
     * @param label Free-form run label written in the first column
     * @return false if the row could not be written
     */
    bool Append(const RunReport& report, const std::string& label);

    const std::string& result_path() const { return result_path_; }

private:
    bool record_result_;
    std::string result_path_;
};

}  // namespace Cadence
