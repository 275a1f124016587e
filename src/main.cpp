/**
 * skymesh - Entry Point
 *
 * Usage:
 *   skymesh [options] [file.mesh ...]
 *   skymesh --help
 *
 * Without file arguments every *.mesh in the working directory is converted.
 */

#include "skymesh/batch_converter.hpp"
#include "skymesh/compression.hpp"
#include "skymesh/files.hpp"
#include "skymesh/logging.hpp"
#include "skymesh/mesh_defs.hpp"
#include "skymesh/settings.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <filesystem>
#include <type_traits>

namespace fs = std::filesystem;

namespace {

constexpr const char* DEFAULT_SETTINGS = "settings.json";
constexpr const char* DEFAULT_MESH_DEFS = "MeshDefs.lua";

// CLI argument parsing. Unset optionals keep the settings.json value.
struct CliArgs {
    bool show_help = false;
    bool bad_args = false;
    std::vector<std::string> files;
    std::string settings_path = DEFAULT_SETTINGS;
    std::optional<std::string> output_dir;
    std::optional<std::string> mesh_defs;
    std::optional<std::string> log_file;
    std::optional<size_t> max_iterations;
    std::optional<size_t> step;
    std::optional<double> zero_ratio;
    std::optional<unsigned int> jobs;
    std::optional<size_t> batch_size;
    std::optional<unsigned int> batch_delay_ms;
    bool no_uv = false;
    bool json_report = false;
    bool verbose = false;
    bool debug_logging = false;
};

void print_help() {
    std::cout << R"(
skymesh - Sky .mesh to Wavefront OBJ converter

Usage:
  skymesh [options] [file.mesh ...]     Convert the given files
  skymesh [options]                     Convert every *.mesh in the working directory
  skymesh --help                        Show this help

Options:
  --help, -h               Show this help message
  --output, -o <dir>       Output directory for .obj files (default: .)
  --no-uv                  Do not write vt lines
  --defs <path>            MeshDefs.lua asset table (default: ./MeshDefs.lua if present)
  --settings <path>        Settings file (default: ./settings.json)
  --max-iter <n>           Index search budget per file
  --step <n>               Index search byte step
  --zero-ratio <r>         Maximum share of zero indices in a probed prefix
  --jobs, -j <n>           Worker threads
  --batch-size <n>         Files per wave (0: one wave)
  --batch-delay <ms>       Pause between waves
  --json-report            Also write a JSON report
  --log-file <path>        Write log lines to a file
  --verbose, -v            Per-file progress output
  --debug, -d, --trace     Debug logging with per-strategy decode trace

Exit codes:
  0  all files converted
  1  at least one file failed
  2  compression codec unavailable

Examples:
  skymesh -o ./obj scene_rock.mesh tree_01.mesh
  skymesh --jobs 4 --batch-size 50 --batch-delay 200
  skymesh --debug --log-file skymesh.log broken.mesh

)" << std::endl;
}

template<typename T>
bool parse_number(const char* text, T& out) {
    try {
        size_t used = 0;
        std::string s(text);
        if constexpr (std::is_floating_point_v<T>) {
            double v = std::stod(s, &used);
            out = static_cast<T>(v);
        } else {
            if (!s.empty() && s[0] == '-') return false;
            unsigned long long v = std::stoull(s, &used);
            out = static_cast<T>(v);
        }
        return used == s.size();
    } catch (const std::logic_error&) {
        // std::invalid_argument and std::out_of_range
        return false;
    }
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto take_value = [&](int& i, const std::string& flag) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        std::cerr << "Error: " << flag << " needs a value\n";
        args.bad_args = true;
        return nullptr;
    };

    auto take_number = [&](int& i, const std::string& flag, auto& target) {
        const char* value = take_value(i, flag);
        if (!value) return;
        typename std::remove_reference_t<decltype(target)>::value_type parsed{};
        if (!parse_number(value, parsed)) {
            std::cerr << "Error: invalid value for " << flag << ": " << value << "\n";
            args.bad_args = true;
            return;
        }
        target = parsed;
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        }
        else if (arg == "--output" || arg == "-o") {
            if (const char* v = take_value(i, arg)) args.output_dir = v;
        }
        else if (arg == "--defs") {
            if (const char* v = take_value(i, arg)) args.mesh_defs = v;
        }
        else if (arg == "--settings") {
            if (const char* v = take_value(i, arg)) args.settings_path = v;
        }
        else if (arg == "--log-file") {
            if (const char* v = take_value(i, arg)) args.log_file = v;
        }
        else if (arg == "--max-iter") {
            take_number(i, arg, args.max_iterations);
        }
        else if (arg == "--step") {
            take_number(i, arg, args.step);
        }
        else if (arg == "--zero-ratio") {
            take_number(i, arg, args.zero_ratio);
        }
        else if (arg == "--jobs" || arg == "-j") {
            take_number(i, arg, args.jobs);
        }
        else if (arg == "--batch-size") {
            take_number(i, arg, args.batch_size);
        }
        else if (arg == "--batch-delay") {
            take_number(i, arg, args.batch_delay_ms);
        }
        else if (arg == "--no-uv") {
            args.no_uv = true;
        }
        else if (arg == "--json-report") {
            args.json_report = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if (arg == "--debug" || arg == "-d" || arg == "--trace") {
            args.debug_logging = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            args.bad_args = true;
        }
        else {
            args.files.push_back(arg);
        }
    }

    return args;
}

void apply_overrides(const CliArgs& args, skymesh::AppSettings& settings) {
    auto& locator = settings.decode.locator;
    if (args.output_dir) settings.output_dir = *args.output_dir;
    if (args.mesh_defs) settings.mesh_defs_path = *args.mesh_defs;
    if (args.log_file) settings.log_file = *args.log_file;
    if (args.max_iterations) locator.max_iterations = *args.max_iterations;
    if (args.step) locator.step = *args.step;
    if (args.zero_ratio) locator.max_zero_ratio = *args.zero_ratio;
    if (args.jobs) settings.jobs = *args.jobs;
    if (args.batch_size) settings.batch_size = *args.batch_size;
    if (args.batch_delay_ms) settings.batch_delay_ms = *args.batch_delay_ms;
    if (args.no_uv) settings.export_uvs = false;
    if (args.json_report) settings.write_json_report = true;
    if (args.verbose) settings.verbose = true;
    if (args.debug_logging) {
        settings.log_level = "debug";
        settings.decode.trace = true;
    }
    if (settings.jobs == 0) settings.jobs = 1;
}

void init_logging(const skymesh::AppSettings& settings) {
    auto& logger = skymesh::Logger::instance();
    logger.set_level(skymesh::parse_log_level(settings.log_level));
    logger.set_console_output(true);

    if (!settings.log_file.empty() && !logger.set_file(settings.log_file)) {
        std::cerr << "Warning: cannot open log file " << settings.log_file.string() << "\n";
    }
}

skymesh::MeshDefs load_mesh_defs(const skymesh::AppSettings& settings) {
    fs::path path = settings.mesh_defs_path;
    bool explicit_path = !path.empty();
    if (!explicit_path) {
        path = DEFAULT_MESH_DEFS;
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (explicit_path) {
            LOG_WARN("App", "MeshDefs not found: " << path.string());
        }
        return {};
    }

    auto defs = skymesh::MeshDefs::load(path);
    if (!defs) {
        LOG_WARN("App", "Ignoring MeshDefs: " << defs.error().full_message());
        return {};
    }
    return std::move(*defs);
}

std::vector<fs::path> collect_inputs(const CliArgs& args) {
    std::vector<fs::path> files;
    if (args.files.empty()) {
        files = skymesh::list_files(".", ".mesh");
        LOG_INFO("App", "Found " << files.size() << " .mesh files in working directory");
        return files;
    }
    for (const auto& f : args.files) {
        files.emplace_back(f);
    }
    return files;
}

int run_cli(const CliArgs& args) {
    if (args.show_help) {
        print_help();
        return 0;
    }
    if (args.bad_args) {
        print_help();
        return 1;
    }

    auto loaded = skymesh::load_settings(args.settings_path);
    skymesh::AppSettings settings;
    if (loaded) {
        settings = std::move(*loaded);
    } else {
        std::cerr << "Warning: " << loaded.error().full_message() << ", using defaults\n";
    }
    apply_overrides(args, settings);
    if (settings.decode.locator.step == 0) {
        std::cerr << "Error: --step must be positive\n";
        return 1;
    }

    init_logging(settings);

    // Without a working codec every file would fail the same way
    auto codec = skymesh::verify_codec();
    if (!codec) {
        LOG_ERROR("App", "Codec check failed: " << codec.error().full_message());
        std::cerr << "Error: LZ4 codec unavailable: " << codec.error().message << "\n";
        return 2;
    }

    auto files = collect_inputs(args);
    if (files.empty()) {
        std::cerr << "Error: No .mesh files to convert\n";
        return 1;
    }

    skymesh::BatchConverter converter(settings, load_mesh_defs(settings));

    skymesh::ProgressCallback progress;
    if (settings.verbose) {
        progress = [](size_t done, size_t total, const std::string& file) {
            std::cout << "[" << done << "/" << total << "] " << file << std::endl;
        };
    }

    auto report = converter.run(files, progress);
    std::cout << "\n" << report.format_text();

    auto text_report = report.write_text(settings.output_dir);
    if (text_report) {
        std::cout << "Report: " << text_report->string() << "\n";
    } else {
        LOG_WARN("App", "Report not written: " << text_report.error().full_message());
    }

    if (settings.write_json_report) {
        auto json_report = report.write_json(settings.output_dir);
        if (json_report) {
            std::cout << "JSON report: " << json_report->string() << "\n";
        } else {
            LOG_WARN("App", "JSON report not written: " << json_report.error().full_message());
        }
    }

    return report.failed() > 0 ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    int result = run_cli(args);

    skymesh::Logger::instance().close_file();
    return result;
}
