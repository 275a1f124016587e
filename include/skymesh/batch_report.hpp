/**
 * skymesh - Batch conversion report
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace skymesh {

struct BatchEntry {
    fs::path file;
    bool success = false;
    size_t vertex_count = 0;
    size_t face_count = 0;
    std::string strategy;
    std::string error;
    fs::path output;
    double elapsed_seconds = 0.0;
};

class BatchReport {
public:
    using Clock = std::chrono::system_clock;

    BatchReport() = default;
    explicit BatchReport(std::vector<BatchEntry> entries, double elapsed_seconds = 0.0);

    const std::vector<BatchEntry>& entries() const { return entries_; }
    size_t total() const { return entries_.size(); }
    size_t succeeded() const;
    size_t failed() const { return total() - succeeded(); }
    double elapsed_seconds() const { return elapsed_seconds_; }

    /**
     * Summary block: totals, then successful files, then failures.
     */
    std::string format_text() const;

    std::string format_json() const;

    /**
     * "conversion_report_YYYYmmdd_HHMMSS" + extension, local time.
     */
    static std::string file_name(Clock::time_point when, const std::string& extension);

    Result<fs::path> write_text(const fs::path& dir, Clock::time_point when = Clock::now()) const;
    Result<fs::path> write_json(const fs::path& dir, Clock::time_point when = Clock::now()) const;

private:
    std::vector<BatchEntry> entries_;
    double elapsed_seconds_ = 0.0;
};

} // namespace skymesh
