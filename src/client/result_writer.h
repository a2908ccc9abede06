#pragma once

#include <string>

#include "summary_aggregator.h"
#include "common/configuration.h"

namespace Replibench {

/**
 * Class for appending run results to a CSV file
 */
class ResultWriter {
public:
    /**
     * Constructor. Creates the result directory and the CSV header if needed.
     * @param params Parameters of the run being recorded
     */
    explicit ResultWriter(const RunParameters& params);

    /**
     * Destructor - writes the row if a report was set and recording is on
     */
    ~ResultWriter();

    /**
     * Sets the report to record
     */
    void SetReport(const RunReport& report);

    const std::string& result_path() const { return result_path_; }

private:
    const RunParameters params_;
    bool record_result_;
    bool has_report_ = false;
    RunReport report_;
    std::string result_path_;
};

} // namespace Replibench
