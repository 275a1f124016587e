/**
 * skymesh - Batch Converter Implementation
 */

#include "skymesh/batch_converter.hpp"
#include "skymesh/mesh_converter.hpp"
#include "skymesh/files.hpp"
#include "skymesh/logging.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>

namespace skymesh {

BatchConverter::BatchConverter(AppSettings settings, MeshDefs defs)
    : settings_(std::move(settings))
    , defs_(std::move(defs))
{
    if (settings_.jobs == 0) {
        settings_.jobs = 1;
    }
}

BatchEntry BatchConverter::convert_one(const fs::path& file) const {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    BatchEntry entry;
    entry.file = file;

    auto data = read_file(file);
    if (!data) {
        entry.error = data.error().full_message();
        entry.elapsed_seconds = elapsed();
        LOG_ERROR("Batch", "FAILED " << file.string() << ": " << entry.error);
        return entry;
    }

    LOG_DEBUG("Batch", "Decoding " << file.filename().string() << " (" << format_file_size(data->size()) << ")");

    DecodeOptions options = settings_.decode;
    options.locator.cancel = &cancel_requested_;

    AssetHints hints = defs_.hints_for(file);
    MeshConverter converter(*data, file.stem().string(), hints, options);

    if (!converter.mesh()) {
        entry.error = converter.error().full_message();
        entry.elapsed_seconds = elapsed();
        LOG_ERROR("Batch", "FAILED " << file.string() << ": " << entry.error);
        return entry;
    }

    ExportOptions export_options;
    export_options.export_uvs = settings_.export_uvs;

    auto saved = converter.save(settings_.output_dir, export_options);
    if (!saved) {
        entry.error = saved.error().full_message();
        entry.elapsed_seconds = elapsed();
        LOG_ERROR("Batch", "FAILED " << file.string() << ": " << entry.error);
        return entry;
    }

    entry.success = true;
    entry.vertex_count = converter.mesh()->vertices.size();
    entry.face_count = converter.mesh()->faces.size();
    entry.strategy = converter.strategy();
    entry.output = *saved;
    entry.elapsed_seconds = elapsed();

    LOG_INFO("Batch", "OK " << file.filename().string() << " -> " << saved->string()
             << " (" << entry.vertex_count << " vertices, " << entry.face_count
             << " faces, " << entry.strategy << ")");
    return entry;
}

void BatchConverter::run_wave(const std::vector<fs::path>& files, size_t begin, size_t end,
                              std::vector<BatchEntry>& entries, std::atomic<size_t>& done,
                              const ProgressCallback& progress) {
    const size_t count = end - begin;
    const size_t thread_count = std::min<size_t>(settings_.jobs, count);

    // Callers get one progress call at a time
    std::mutex progress_mutex;

    auto process = [&](size_t i) {
        if (cancel_requested_) return;
        entries[i] = convert_one(files[i]);
        size_t finished = ++done;
        if (progress) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            progress(finished, files.size(), files[i].filename().string());
        }
    };

    if (thread_count <= 1) {
        for (size_t i = begin; i < end && !cancel_requested_; i++) {
            process(i);
        }
        return;
    }

    // Each worker owns a contiguous slice of the entry slots
    const size_t chunk_size = (count + thread_count - 1) / thread_count;
    std::vector<std::future<void>> futures;

    for (size_t t = 0; t < thread_count; t++) {
        size_t start_idx = begin + t * chunk_size;
        size_t end_idx = std::min(start_idx + chunk_size, end);
        if (start_idx >= end_idx) break;

        futures.push_back(std::async(std::launch::async, [&, start_idx, end_idx]() {
            for (size_t i = start_idx; i < end_idx && !cancel_requested_; i++) {
                process(i);
            }
        }));
    }

    for (auto& f : futures) {
        f.get();
    }
}

BatchReport BatchConverter::run(const std::vector<fs::path>& files, ProgressCallback progress) {
    auto start = std::chrono::steady_clock::now();

    std::vector<BatchEntry> entries(files.size());
    for (size_t i = 0; i < files.size(); i++) {
        entries[i].file = files[i];
        entries[i].error = "cancelled";
    }

    if (files.empty()) {
        LOG_WARN("Batch", "No input files");
        return BatchReport(std::move(entries));
    }

    std::error_code ec;
    fs::create_directories(settings_.output_dir, ec);
    if (ec) {
        LOG_WARN("Batch", "Cannot create " << settings_.output_dir.string() << ": " << ec.message());
    }

    const size_t wave = settings_.batch_size > 0 ? settings_.batch_size : files.size();
    LOG_INFO("Batch", "Converting " << files.size() << " files (" << settings_.jobs
             << " jobs, waves of " << wave << ")");

    std::atomic<size_t> done{0};
    for (size_t begin = 0; begin < files.size() && !cancel_requested_; begin += wave) {
        size_t end = std::min(begin + wave, files.size());
        run_wave(files, begin, end, entries, done, progress);

        if (end < files.size() && settings_.batch_delay_ms > 0 && !cancel_requested_) {
            LOG_DEBUG("Batch", "Wave done at " << end << "/" << files.size()
                      << ", pausing " << settings_.batch_delay_ms << "ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(settings_.batch_delay_ms));
        }
    }

    if (cancel_requested_) {
        LOG_WARN("Batch", "Cancelled after " << done.load() << "/" << files.size() << " files");
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return BatchReport(std::move(entries), elapsed);
}

} // namespace skymesh
