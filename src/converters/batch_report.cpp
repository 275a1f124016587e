/**
 * skymesh - Batch conversion report Implementation
 */

#include "skymesh/batch_report.hpp"
#include "skymesh/files.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace skymesh {

namespace {

const std::string RULE(70, '=');

} // namespace

BatchReport::BatchReport(std::vector<BatchEntry> entries, double elapsed_seconds)
    : entries_(std::move(entries))
    , elapsed_seconds_(elapsed_seconds)
{
}

size_t BatchReport::succeeded() const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [](const BatchEntry& e) { return e.success; }));
}

std::string BatchReport::format_text() const {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);

    out << RULE << "\n";
    out << "Batch conversion complete\n";
    out << "Total files: " << total() << ", succeeded: " << succeeded() << ", failed: " << failed() << "\n";
    if (elapsed_seconds_ > 0.0) {
        out << "Elapsed: " << elapsed_seconds_ << "s\n";
    }

    if (succeeded() > 0) {
        out << "\nSucceeded:\n";
        for (const auto& e : entries_) {
            if (!e.success) continue;
            out << "  " << e.file.string() << "\n";
            out << "    vertices: " << e.vertex_count << ", faces: " << e.face_count
                << ", strategy: " << e.strategy << ", time: " << e.elapsed_seconds << "s\n";
        }
    }

    if (failed() > 0) {
        out << "\nFailed:\n";
        for (const auto& e : entries_) {
            if (e.success) continue;
            out << "  " << e.file.string() << "\n";
            out << "    error: " << e.error << ", time: " << e.elapsed_seconds << "s\n";
        }
    }

    out << RULE << "\n";
    return out.str();
}

std::string BatchReport::format_json() const {
    nlohmann::json j;
    j["total"] = total();
    j["succeeded"] = succeeded();
    j["failed"] = failed();
    j["elapsed_seconds"] = elapsed_seconds_;

    j["files"] = nlohmann::json::array();
    for (const auto& e : entries_) {
        nlohmann::json f;
        f["file"] = e.file.string();
        f["status"] = e.success ? "success" : "failed";
        f["vertex_count"] = e.vertex_count;
        f["face_count"] = e.face_count;
        f["strategy"] = e.strategy;
        f["time"] = e.elapsed_seconds;
        if (e.success) {
            f["output"] = e.output.string();
        } else {
            f["error"] = e.error;
        }
        j["files"].push_back(std::move(f));
    }
    return j.dump(2);
}

std::string BatchReport::file_name(Clock::time_point when, const std::string& extension) {
    auto time = Clock::to_time_t(when);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    std::ostringstream name;
    name << "conversion_report_" << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << extension;
    return name.str();
}

Result<fs::path> BatchReport::write_text(const fs::path& dir, Clock::time_point when) const {
    fs::path path = dir / file_name(when, ".txt");
    auto written = write_text_file(path, format_text());
    if (!written) {
        return written.error();
    }
    return path;
}

Result<fs::path> BatchReport::write_json(const fs::path& dir, Clock::time_point when) const {
    fs::path path = dir / file_name(when, ".json");
    auto written = write_text_file(path, format_json() + "\n");
    if (!written) {
        return written.error();
    }
    return path;
}

} // namespace skymesh
