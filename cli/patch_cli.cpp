// FILE: cli/patch_cli.cpp
#include <getopt.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cli_config.hpp"
#include "patch_file.hpp"
#include "xml_document.hpp"
#include "kernel/patch_processor.hpp"
#include "cli/print_cli_help.hpp"

using namespace oxp;

namespace {

enum ExitCode { kAllApplied = 0, kSomeFailed = 1, kHardFailure = 2 };

void report_issues(const PatchFileResult& parsed, bool quiet) {
    for (const auto& e : parsed.errors) std::cerr << "Error: " << e.message << "\n";
    if (quiet) return;
    for (const auto& w : parsed.warnings) std::cerr << "Warning: " << w.message << "\n";
}

bool write_report(const std::string& path, const nlohmann::json& report) {
    std::ofstream out(path);
    if (!out) return false;
    out << report.dump(2) << "\n";
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return kAllApplied;
        }
    }

    CliConfig config;
    std::string custom_config_path;

    const char* const short_opts = "hi:p:o:r:s:t";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"input", required_argument, nullptr, 'i'},
        {"patches", required_argument, nullptr, 'p'}, {"output", required_argument, nullptr, 'o'},
        {"report", required_argument, nullptr, 'r'}, {"strategy", required_argument, nullptr, 's'},
        {"timing", no_argument, nullptr, 't'}, {"stats", no_argument, nullptr, 1001},
        {"validate", no_argument, nullptr, 1002}, {"config", required_argument, nullptr, 2001},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == 2001) { custom_config_path = optarg; }
    }
    optind = 1;

    std::string config_to_load = custom_config_path.empty() ? "config.yaml" : custom_config_path;
    load_or_create_config(config_to_load, config);

    std::string input_path, patches_path, output_path, report_path = config.default_report_path;
    bool timing = false, show_stats = false, validate = false;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'i': input_path = optarg; break;
            case 'p': patches_path = optarg; break;
            case 'o': output_path = optarg; break;
            case 'r': report_path = optarg; break;
            case 's': config.recovery_strategy = optarg; break;
            case 't': timing = true; break;
            case 1001: show_stats = true; break;
            case 1002: validate = true; break;
            case 2001: break;
            default: print_cli_help(); return kHardFailure;
        }
    }

    if (input_path.empty() || patches_path.empty()) {
        std::cerr << "Error: both --input and --patches are required.\n";
        print_cli_help();
        return kHardFailure;
    }
    if (!parse_recovery_strategy(config.recovery_strategy)) {
        std::cerr << "Error: unknown recovery strategy '" << config.recovery_strategy << "'.\n";
        return kHardFailure;
    }

    try {
        PatchFileParser parser(validation_level_from(config));
        PatchFileResult parsed = parser.parse_file(patches_path);
        report_issues(parsed, config.quiet);
        if (!parsed.success) {
            std::cerr << "Error: patch file '" << patches_path << "' failed validation ("
                      << to_string(parser.level()) << ").\n";
            return kHardFailure;
        }
        if (validate) {
            auto issues = parser.validate_targets(parsed);
            for (const auto& issue : issues) std::cerr << "Error: " << issue.message << "\n";
            if (!issues.empty()) return kHardFailure;
        }

        XmlDocument doc = XmlDocument::load_file(input_path);

        auto optimizer = std::make_shared<PerformanceOptimizer>(optimizer_config_from(config));
        PatchProcessor processor(processor_options_from(config), optimizer);
        ProcessingContext run;
        std::vector<PatchResult> results = processor.process(doc, parsed.operations, {}, &run);

        if (output_path.empty()) {
            std::cout << doc.to_string(config.pretty_output);
        } else {
            doc.save(output_path, config.pretty_output);
            if (!config.quiet) std::cerr << "Saved patched document to " << output_path << "\n";
        }

        size_t applied = 0;
        for (const auto& r : results) {
            if (r.success) ++applied;
        }
        const bool all_applied = applied == parsed.operations.size();

        nlohmann::json report;
        report["input"] = input_path;
        report["patches"] = patches_path;
        report["strategy"] = to_string(processor.options().recovery);
        report["operations"] = parsed.operations.size();
        report["applied"] = applied;
        report["results"] = results;
        report["run"] = run;

        if (validate) {
            IntegrityReport integrity = processor.validate_integrity(doc);
            report["integrity"] = {{"valid", integrity.valid}, {"issues", integrity.issues}};
            for (const auto& issue : integrity.issues) std::cerr << "Warning: " << issue << "\n";
        }

        if (timing) {
            auto events = processor.drain_events();
            report["events"] = events;
            std::cerr << "--- Timing ---\n";
            for (const auto& ev : events) {
                std::cerr << "  #" << ev.index << " " << std::left << std::setw(7) << ev.kind << " "
                          << std::setw(9) << ev.source << " " << std::fixed << std::setprecision(3)
                          << ev.elapsed_ms << " ms  " << ev.target << "\n";
            }
        }

        if (show_stats) {
            nlohmann::json stats = processor.stats();
            report["stats"] = stats;
            std::cerr << stats.dump(2) << "\n";
        }

        if (!report_path.empty() && !write_report(report_path, report)) {
            std::cerr << "Error: could not write report to '" << report_path << "'.\n";
            return kHardFailure;
        }

        if (!config.quiet) {
            std::cerr << "Applied " << applied << "/" << parsed.operations.size() << " operation(s).\n";
        }
        return all_applied ? kAllApplied : kSomeFailed;
    } catch (const PatchError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kHardFailure;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kHardFailure;
    }
}
