#include "synthflat/config/configuration.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/events.hpp"
#include "synthflat/core/utils.hpp"
#include "synthflat/io/raw_decoder.hpp"
#include "synthflat/metadata/analysis.hpp"
#include "synthflat/metadata/camera_db.hpp"
#include "synthflat/pipeline/flat_pipeline.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitConfig = 2;
constexpr int kExitFailure = 3;
constexpr int kExitCancelled = 130;

std::atomic<bool> g_stop{false};

void handle_sigint(int) {
    g_stop.store(true);
}

void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

void print_usage() {
    std::cout << "Usage: synthflat_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  create-flat <input_dir> <metadata_spec> <process_params> <output.dng>\n"
              << "              [--strict] [--camera-db <yaml>] [--pattern <glob>] [--workers N]\n"
              << "                                  Build a synthetic flat DNG\n"
              << "  analyze-metadata <input_dir> <report.json> [--pattern <glob>] [--workers N]\n"
              << "                                  Distinct metadata values across frames\n"
              << "  summarize-metadata <report.json>\n"
              << "                                  Print a metadata report as a table\n"
              << "  validate-config <process_params>\n"
              << "                                  Validate processing parameters\n"
              << "  get-schema                      Print JSON schema for process_params\n";
}

int cmd_get_schema() {
    std::cout << synthflat::config::get_schema_json() << std::endl;
    return kExitOk;
}

int cmd_validate_config(const std::string& path) {
    json result;
    result["path"] = path;
    result["valid"] = false;
    result["errors"] = json::array();

    int rc = kExitConfig;
    try {
        auto params = synthflat::config::ProcessingParameters::load(path);
        params.validate();
        result["valid"] = true;
        result["method"] = params.method;
        rc = kExitOk;
    } catch (const synthflat::SynthFlatError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    return rc;
}

int cmd_analyze_metadata(const std::string& input_dir, const std::string& report_path,
                         const std::string& pattern, const std::string& workers_arg) {
    synthflat::io::LibRawDecoder decoder;
    auto frames = synthflat::core::discover_frames(input_dir, pattern);
    if (frames.empty()) {
        std::cerr << "[META] no files matching " << pattern << " in " << input_dir << std::endl;
        return kExitFailure;
    }

    int workers = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    if (!workers_arg.empty()) {
        try {
            workers = std::stoi(workers_arg);
        } catch (const std::logic_error&) {
            throw synthflat::ConfigError("--workers expects an integer, got '" + workers_arg + "'");
        }
    }

    std::vector<std::string> skipped;
    auto batch = synthflat::metadata::collect_metadata(decoder, frames, workers, &skipped);
    for (const auto& s : skipped) {
        std::cerr << "[META] skipped " << s << std::endl;
    }

    auto report = synthflat::metadata::analyze_metadata(batch);
    synthflat::metadata::write_report(report_path, report);
    std::cerr << "[META] " << batch.size() << " files, " << report.size() << " fields -> "
              << report_path << std::endl;
    return kExitOk;
}

int cmd_summarize_metadata(const std::string& report_path) {
    auto report = synthflat::metadata::read_report(report_path);
    std::cout << synthflat::metadata::summarize_report(report);
    return kExitOk;
}

int cmd_create_flat(const std::string& input_dir, const std::string& spec_path,
                    const std::string& params_path, const std::string& output,
                    bool strict, const std::string& camera_db_path,
                    const std::string& pattern_override, const std::string& workers_override) {
    using namespace synthflat;

    pipeline::FlatRequest request;
    request.params = config::ProcessingParameters::load(params_path);
    if (strict) request.params.strict = true;
    if (!pattern_override.empty()) request.params.input_pattern = pattern_override;
    if (!workers_override.empty()) {
        try {
            request.params.parallel_workers = std::stoi(workers_override);
        } catch (const std::logic_error&) {
            throw ConfigError("--workers expects an integer, got '" + workers_override + "'");
        }
    }
    request.params.validate();

    request.metadata_spec = config::MetadataSpec::load(spec_path);
    const std::string db_path = !camera_db_path.empty() ? camera_db_path : request.params.camera_db;
    if (!db_path.empty()) {
        request.camera_db = metadata::CameraDatabase::load(db_path);
    }
    request.frames = core::discover_frames(input_dir, request.params.input_pattern);
    request.output = output;

    core::EventEmitter events(core::get_run_id(), std::cout);
    events.run_start({{"input_dir", input_dir},
                      {"output", output},
                      {"method", request.params.method},
                      {"frames", request.frames.size()}});

    io::LibRawDecoder decoder;
    pipeline::FlatPipeline pipeline(decoder, events, &g_stop);
    try {
        auto report = pipeline.run(request);
        events.run_end(true, "ok");
        std::cerr << "[DONE] " << report.frames_used() << " frames -> " << output;
        if (!report.warnings.empty()) {
            std::cerr << " (" << report.warnings.size() << " warnings)";
        }
        std::cerr << std::endl;
        for (const auto& w : report.warnings) std::cerr << "  - " << w << std::endl;
    } catch (const StopRequested&) {
        events.run_end(false, "cancelled");
        throw;
    } catch (const std::exception& e) {
        events.error(e.what());
        events.run_end(false, "error");
        throw;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return kExitUsage;
    }

    std::string command = argv[1];
    const std::set<std::string> value_options = {"--camera-db", "--pattern", "--workers"};

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) return argv[i + 1];
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] == '-') {
                if (value_options.count(argv[i])) ++i;
                continue;
            }
            if (count == pos) return argv[i];
            ++count;
        }
        return "";
    };

    std::signal(SIGINT, handle_sigint);

    try {
        if (command == "get-schema") {
            return cmd_get_schema();
        }

        if (command == "validate-config") {
            std::string path = get_positional(0);
            if (path.empty()) {
                std::cerr << "validate-config requires a process_params path\n";
                return kExitUsage;
            }
            return cmd_validate_config(path);
        }

        if (command == "analyze-metadata") {
            std::string input_dir = get_positional(0);
            std::string report = get_positional(1);
            if (input_dir.empty() || report.empty()) {
                std::cerr << "analyze-metadata requires <input_dir> <report.json>\n";
                return kExitUsage;
            }
            std::string pattern = get_arg("--pattern");
            return cmd_analyze_metadata(input_dir, report, pattern.empty() ? "*.nef" : pattern,
                                        get_arg("--workers"));
        }

        if (command == "summarize-metadata") {
            std::string report = get_positional(0);
            if (report.empty()) {
                std::cerr << "summarize-metadata requires <report.json>\n";
                return kExitUsage;
            }
            return cmd_summarize_metadata(report);
        }

        if (command == "create-flat") {
            std::string input_dir = get_positional(0);
            std::string spec = get_positional(1);
            std::string params = get_positional(2);
            std::string output = get_positional(3);
            if (input_dir.empty() || spec.empty() || params.empty() || output.empty()) {
                std::cerr << "create-flat requires <input_dir> <metadata_spec> <process_params> "
                             "<output.dng>\n";
                return kExitUsage;
            }
            return cmd_create_flat(input_dir, spec, params, output, has_flag("--strict"),
                                   get_arg("--camera-db"), get_arg("--pattern"),
                                   get_arg("--workers"));
        }

        if (command == "--help" || command == "-h" || command == "help") {
            print_usage();
            return kExitOk;
        }
    } catch (const synthflat::StopRequested& e) {
        std::cerr << "[CANCEL] " << e.what() << std::endl;
        return kExitCancelled;
    } catch (const synthflat::ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return kExitConfig;
    } catch (const synthflat::ValidationError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return kExitConfig;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return kExitFailure;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return kExitUsage;
}
