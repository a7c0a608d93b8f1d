#include "cli/cli.hpp"
#include "index/keyword_index.hpp"
#include "ingest/record_normalizer.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include "profile/page_profile.hpp"
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

using namespace kwc;

// ============== Helper Functions ==============

std::string format_duration(double seconds) {
    std::stringstream ss;
    if (seconds >= 1.0) {
        ss << std::fixed << std::setprecision(2) << seconds << "s";
    } else {
        ss << static_cast<long long>(seconds * 1000.0) << "ms";
    }
    return ss.str();
}

void ensure_parent_dir(const std::string& path) {
    fs::path p(path);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path());
    }
}

// Config file and environment first, explicit flags last
AnalysisConfig config_from_args(const Args& args) {
    AnalysisConfig config = load_config_with_fallback(args.get("config", "").value);

    if (args.has("threshold")) config.threshold = args.get("threshold").as_double();
    if (args.has("min-keywords")) {
        long long n = args.get("min-keywords").as_int();
        if (n < 0) throw std::invalid_argument("--min-keywords must not be negative");
        config.min_keywords = static_cast<size_t>(n);
    }
    if (args.has("threads")) {
        config.num_threads = to_thread_count(args.get("threads").as_int(), "--threads");
    }
    if (args.has("quiet")) config.verbose = false;

    return config;
}

// ============== kwc analyze ==============
int cmd_analyze(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_path = args.get("output", "").value;
    std::string json_path = args.get("json", "").value;
    std::string stats_path = args.get("stats", "").value;
    long long top = args.get("top", "20").as_int();

    AnalysisConfig config = config_from_args(args);

    AnalysisPipeline pipeline(config);
    if (config.verbose) {
        std::cout << "Analyzing: " << input_path << "\n";
        std::cout << "  Threshold: " << config.threshold
                  << ", minimum keywords: " << config.min_keywords << "\n";

        pipeline.set_progress_callback([](const std::string& stage, int current, int total,
                                          const std::string& message) {
            std::cout << "  [" << stage << "] " << current << "/" << total;
            if (!message.empty()) std::cout << " - " << message;
            std::cout << "\n";
        });
    }

    AnalysisResult result = pipeline.run_file(input_path);
    RunStatistics stats = pipeline.get_statistics();

    result.report.print(std::cout, top > 0 ? static_cast<size_t>(top) : 0);

    if (result.report.groups.empty()) {
        std::cerr << "Warning: no URL with similar URLs found for the given criteria.\n";
    }

    if (!output_path.empty()) {
        ensure_parent_dir(output_path);
        result.report.save_to_csv(output_path);
        std::cout << "Saved CSV report: " << output_path << "\n";
    }

    if (!json_path.empty()) {
        ensure_parent_dir(json_path);
        result.report.save_to_json(json_path);
        std::cout << "Saved JSON report: " << json_path << "\n";
    }

    if (!stats_path.empty()) {
        ensure_parent_dir(stats_path);
        std::ofstream file(stats_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot write statistics file: " + stats_path);
        }
        file << stats.to_json().dump(2);
        std::cout << "Saved statistics: " << stats_path << "\n";
    }

    if (config.verbose) {
        stats.print_summary();
    } else {
        std::cout << result.report.groups.size() << " group(s) in "
                  << format_duration(stats.total_time_seconds) << "\n";
    }

    return 0;
}

// ============== kwc profile ==============
int cmd_profile(const Args& args) {
    std::string input_path = args.require("input");
    long long top = args.get("top", "10").as_int();
    AnalysisConfig config = config_from_args(args);

    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    RecordNormalizer normalizer(config.csv_columns());
    normalizer.set_verbose(config.verbose);
    auto records = normalizer.load_csv(input_path);

    ProfileTable table = ProfileTable::build(records);
    KeywordIndex index;
    index.build(table);

    std::cout << "\n";
    normalizer.get_statistics().print_summary();
    std::cout << "\n";
    table.print_summary(config.min_keywords);
    std::cout << "\n";
    index.print_summary();

    size_t k = top > 0 ? static_cast<size_t>(top) : 0;

    std::cout << "\nTop " << k << " pages by clicks:\n";
    for (PageId id : table.top_by_clicks(k)) {
        const auto& p = table.at(id);
        std::cout << "  " << p.url << " (" << p.clicks << " clicks, "
                  << p.keyword_count() << " keywords)\n";
    }

    std::cout << "\nTop " << k << " keywords by page count:\n";
    for (const auto& [kw, pages] : index.get_top_keywords(k)) {
        std::cout << "  " << kw << " (" << pages << " pages)\n";
    }

    return 0;
}

// ============== kwc config ==============
int cmd_config(const Args& args) {
    std::string output_path = args.require("output");
    AnalysisConfig config;

    ensure_parent_dir(output_path);
    config.to_json_file(output_path);
    std::cout << "Wrote default configuration to: " << output_path << "\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("kwc", "1.0.0", "Keyword cannibalization finder for Search Console exports");

    // kwc analyze
    cli.register_command({
        "analyze",
        "Group landing pages that rank for the same queries and pick the URL to keep",
        {
            {"input", "i", "Input CSV with columns Landing Page, Query, Url Clicks", "", true, false},
            {"output", "o", "Output CSV report", "", false, false},
            {"json", "j", "Output JSON report with per-member evidence", "", false, false},
            {"stats", "s", "Output JSON run statistics", "", false, false},
            {"threshold", "t", "Share of a page's queries another page must also rank for, 0.0-1.0 (default 0.8)", "", false, false},
            {"min-keywords", "k", "Minimum queries a page needs to be compared (default 10)", "", false, false},
            {"threads", "p", "Matching threads, 0 = all cores (default 0)", "", false, false},
            {"config", "c", "JSON configuration file", "", false, false},
            {"top", "n", "Groups to print on the console", "20", false, false},
            {"quiet", "q", "Only print results", "", false, true}
        },
        cmd_analyze
    });

    // kwc profile
    cli.register_command({
        "profile",
        "Print page profile and keyword index statistics for an input CSV",
        {
            {"input", "i", "Input CSV with columns Landing Page, Query, Url Clicks", "", true, false},
            {"min-keywords", "k", "Minimum queries a page needs to be compared (default 10)", "", false, false},
            {"config", "c", "JSON configuration file", "", false, false},
            {"top", "n", "Entries to list per ranking", "10", false, false},
            {"quiet", "q", "Less output while loading", "", false, true}
        },
        cmd_profile
    });

    // kwc config
    cli.register_command({
        "config",
        "Write a configuration file with the default settings",
        {
            {"output", "o", "Path of the configuration file to write", "", true, false}
        },
        cmd_config
    });

    return cli.run(argc, argv);
}
