/**
 * skymesh - Batch Converter
 *
 * Converts many .mesh files to OBJ. Files are split into waves of
 * batch_size; each wave is spread over `jobs` worker threads.
 */

#pragma once

#include "types.hpp"
#include "mesh_defs.hpp"
#include "batch_report.hpp"
#include <atomic>
#include <vector>

namespace skymesh {

class BatchConverter {
public:
    explicit BatchConverter(AppSettings settings, MeshDefs defs = {});

    /**
     * Convert all files. Entries keep the order of `files`; files skipped
     * by cancel() are reported as failed. `progress` is called from worker
     * threads, one call at a time.
     */
    BatchReport run(const std::vector<fs::path>& files, ProgressCallback progress = nullptr);

    /**
     * Decode, export and time a single file.
     */
    BatchEntry convert_one(const fs::path& file) const;

    // Stops pending files and any index scan in progress.
    void cancel() { cancel_requested_ = true; }
    bool cancelled() const { return cancel_requested_; }

    const AppSettings& settings() const { return settings_; }

private:
    void run_wave(const std::vector<fs::path>& files, size_t begin, size_t end,
                  std::vector<BatchEntry>& entries, std::atomic<size_t>& done,
                  const ProgressCallback& progress);

    AppSettings settings_;
    MeshDefs defs_;
    std::atomic<bool> cancel_requested_{false};
};

} // namespace skymesh
