/**
 * skymesh - Settings Implementation
 */

#include "skymesh/settings.hpp"
#include "skymesh/files.hpp"
#include "skymesh/logging.hpp"
#include <nlohmann/json.hpp>

namespace skymesh {

Result<AppSettings> parse_settings(std::string_view json_text, const AppSettings& defaults) {
    AppSettings settings = defaults;

    try {
        nlohmann::json j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return Error::invalid_format("settings root is not an object");
        }

        if (j.contains("export_uvs")) settings.export_uvs = j["export_uvs"].get<bool>();
        if (j.contains("output_dir")) settings.output_dir = j["output_dir"].get<std::string>();
        if (j.contains("mesh_defs")) settings.mesh_defs_path = j["mesh_defs"].get<std::string>();
        if (j.contains("json_report")) settings.write_json_report = j["json_report"].get<bool>();
        if (j.contains("jobs")) settings.jobs = j["jobs"].get<unsigned int>();
        if (j.contains("batch_size")) settings.batch_size = j["batch_size"].get<size_t>();
        if (j.contains("batch_delay_ms")) settings.batch_delay_ms = j["batch_delay_ms"].get<unsigned int>();
        if (j.contains("log_level")) settings.log_level = j["log_level"].get<std::string>();
        if (j.contains("log_file")) settings.log_file = j["log_file"].get<std::string>();
        if (j.contains("verbose")) settings.verbose = j["verbose"].get<bool>();

        if (j.contains("decode")) {
            const auto& d = j["decode"];
            if (d.contains("min_vertices")) settings.decode.min_vertices = d["min_vertices"].get<size_t>();
            if (d.contains("strip_name_header")) settings.decode.strip_name_header = d["strip_name_header"].get<bool>();
            if (d.contains("trace")) settings.decode.trace = d["trace"].get<bool>();
        }

        if (j.contains("locator")) {
            const auto& l = j["locator"];
            auto& loc = settings.decode.locator;
            if (l.contains("step")) loc.step = l["step"].get<size_t>();
            if (l.contains("max_zero_ratio")) loc.max_zero_ratio = l["max_zero_ratio"].get<double>();
            if (l.contains("max_iterations")) loc.max_iterations = l["max_iterations"].get<size_t>();
            if (l.contains("prefix_triples")) loc.prefix_triples = l["prefix_triples"].get<size_t>();
            if (l.contains("min_face_count")) loc.min_face_count = l["min_face_count"].get<size_t>();
        }
    } catch (const nlohmann::json::exception& e) {
        return Error::invalid_format(std::string("settings: ") + e.what());
    }

    if (settings.decode.locator.step == 0) {
        return Error(Error::Code::InvalidArgument, "locator.step must be positive");
    }
    if (settings.jobs == 0) {
        settings.jobs = 1;
    }
    return settings;
}

std::string dump_settings(const AppSettings& settings) {
    nlohmann::json j;
    j["export_uvs"] = settings.export_uvs;
    j["output_dir"] = settings.output_dir.string();
    j["mesh_defs"] = settings.mesh_defs_path.string();
    j["json_report"] = settings.write_json_report;
    j["jobs"] = settings.jobs;
    j["batch_size"] = settings.batch_size;
    j["batch_delay_ms"] = settings.batch_delay_ms;
    j["log_level"] = settings.log_level;
    j["log_file"] = settings.log_file.string();
    j["verbose"] = settings.verbose;

    j["decode"]["min_vertices"] = settings.decode.min_vertices;
    j["decode"]["strip_name_header"] = settings.decode.strip_name_header;
    j["decode"]["trace"] = settings.decode.trace;

    const auto& loc = settings.decode.locator;
    j["locator"]["step"] = loc.step;
    j["locator"]["max_zero_ratio"] = loc.max_zero_ratio;
    j["locator"]["max_iterations"] = loc.max_iterations;
    j["locator"]["prefix_triples"] = loc.prefix_triples;
    j["locator"]["min_face_count"] = loc.min_face_count;

    return j.dump(2);
}

Result<AppSettings> load_settings(const fs::path& path, const AppSettings& defaults) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        LOG_DEBUG("Settings", path.string() << " not found, using defaults");
        return defaults;
    }

    auto data = read_file(path);
    if (!data) {
        return data.error();
    }

    std::string_view text(reinterpret_cast<const char*>(data->data()), data->size());
    auto settings = parse_settings(text, defaults);
    if (!settings) {
        return Error(settings.error().code, settings.error().message, path.string());
    }
    return settings;
}

Result<void> save_settings(const fs::path& path, const AppSettings& settings) {
    return write_text_file(path, dump_settings(settings) + "\n");
}

} // namespace skymesh
