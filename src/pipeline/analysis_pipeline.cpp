#include "pipeline/analysis_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <limits>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace {

using Clock = std::chrono::high_resolution_clock;

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

double parse_env_double(const char* name, const char* value) {
    const std::string text(value);
    size_t consumed = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        throw std::invalid_argument(std::string(name) + " is not a number: " + text);
    }
    return v;
}

long long parse_env_int(const char* name, const char* value) {
    const std::string text(value);
    size_t consumed = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + text);
    }
    return v;
}

}  // namespace

namespace kwc {

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

// ============================================================================
// AnalysisConfig
// ============================================================================

AnalysisConfig AnalysisConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    AnalysisConfig config;
    try {
        if (j.contains("threshold")) config.threshold = j["threshold"].get<double>();
        if (j.contains("min_keywords")) {
            auto v = j["min_keywords"].get<long long>();
            if (v < 0) throw std::invalid_argument("min_keywords must not be negative");
            config.min_keywords = static_cast<size_t>(v);
        }
        if (j.contains("num_threads")) {
            config.num_threads = to_thread_count(j["num_threads"].get<long long>(), "num_threads");
        }

        if (j.contains("page_column")) config.page_column = j["page_column"].get<std::string>();
        if (j.contains("query_column")) config.query_column = j["query_column"].get<std::string>();
        if (j.contains("clicks_column")) config.clicks_column = j["clicks_column"].get<std::string>();

        if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }

    return config;
}

json AnalysisConfig::to_json() const {
    json j;
    j["threshold"] = threshold;
    j["min_keywords"] = min_keywords;
    j["num_threads"] = num_threads;
    j["page_column"] = page_column;
    j["query_column"] = query_column;
    j["clicks_column"] = clicks_column;
    j["verbose"] = verbose;
    return j;
}

void AnalysisConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << to_json().dump(2);
}

void AnalysisConfig::apply_environment() {
    if (const char* v = std::getenv("KWC_THRESHOLD")) {
        threshold = parse_env_double("KWC_THRESHOLD", v);
    }
    if (const char* v = std::getenv("KWC_MIN_KEYWORDS")) {
        long long n = parse_env_int("KWC_MIN_KEYWORDS", v);
        if (n < 0) throw std::invalid_argument("KWC_MIN_KEYWORDS must not be negative");
        min_keywords = static_cast<size_t>(n);
    }
    if (const char* v = std::getenv("KWC_THREADS")) {
        num_threads = to_thread_count(parse_env_int("KWC_THREADS", v), "KWC_THREADS");
    }
}

bool AnalysisConfig::validate(std::string& error_message) const {
    try {
        matcher_config().validate();
    } catch (const std::invalid_argument& e) {
        error_message = e.what();
        return false;
    }

    if (page_column.empty() || query_column.empty() || clicks_column.empty()) {
        error_message = "Column names must not be empty";
        return false;
    }

    if (page_column == query_column || page_column == clicks_column ||
        query_column == clicks_column) {
        error_message = "Column names must be distinct";
        return false;
    }

    return true;
}

MatcherConfig AnalysisConfig::matcher_config() const {
    MatcherConfig mc;
    mc.threshold = threshold;
    mc.min_keywords = min_keywords;
    mc.num_threads = num_threads;
    return mc;
}

CsvColumns AnalysisConfig::csv_columns() const {
    CsvColumns cols;
    cols.page = page_column;
    cols.query = query_column;
    cols.clicks = clicks_column;
    return cols;
}

// ============================================================================
// RunStatistics
// ============================================================================

void RunStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Analysis Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    input.print_summary();
    std::cout << "\n";

    std::cout << "Pages:\n";
    std::cout << "  Total: " << pages << "\n";
    std::cout << "  Eligible as source: " << eligible_pages << "\n";
    std::cout << "  Page/keyword pairs: " << keyword_pairs << "\n";
    std::cout << "  Unique keywords: " << unique_keywords << "\n\n";

    std::cout << "Matching:\n";
    std::cout << "  Threads: " << matching.threads_used << "\n";
    std::cout << "  Candidate pairs scored: " << matching.candidates_scored << "\n";
    std::cout << "  Qualifying matches: " << matching.qualifying_matches << "\n\n";

    std::cout << "Groups:\n";
    std::cout << "  Groups: " << groups << "\n";
    std::cout << "  Pages in groups: " << grouped_pages << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Total time: " << total_time_seconds << " seconds\n";
    std::cout << "  Loading: " << load_time_seconds << " seconds\n";
    std::cout << "  Profiles: " << profile_time_seconds << " seconds\n";
    std::cout << "  Index: " << index_time_seconds << " seconds\n";
    std::cout << "  Matching: " << match_time_seconds << " seconds\n";
    std::cout << "  Grouping: " << resolve_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json RunStatistics::to_json() const {
    json j;

    j["input"] = input.to_json();

    j["pages"] = pages;
    j["eligible_pages"] = eligible_pages;
    j["keyword_pairs"] = keyword_pairs;
    j["unique_keywords"] = unique_keywords;

    j["matching"] = matching.to_json();
    j["groups"] = groups;
    j["grouped_pages"] = grouped_pages;

    j["load_time_seconds"] = load_time_seconds;
    j["profile_time_seconds"] = profile_time_seconds;
    j["index_time_seconds"] = index_time_seconds;
    j["match_time_seconds"] = match_time_seconds;
    j["resolve_time_seconds"] = resolve_time_seconds;
    j["total_time_seconds"] = total_time_seconds;

    return j;
}

// ============================================================================
// AnalysisPipeline
// ============================================================================

AnalysisPipeline::AnalysisPipeline(const AnalysisConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
}

void AnalysisPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void AnalysisPipeline::reset_statistics() {
    stats_ = RunStatistics{};
}

void AnalysisPipeline::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    }
}

AnalysisResult AnalysisPipeline::run_file(const std::string& csv_path) {
    std::ifstream file(csv_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + csv_path);
    }
    return run_stream(file, csv_path);
}

AnalysisResult AnalysisPipeline::run_stream(std::istream& in, const std::string& source_name) {
    reset_statistics();
    auto start = Clock::now();

    report_progress("Loading", 0, 1, source_name);

    RecordNormalizer normalizer(config_.csv_columns());
    normalizer.set_verbose(config_.verbose);
    std::vector<Record> records = normalizer.load_csv(in);

    NormalizationStats input_stats = normalizer.get_statistics();
    double load_time = seconds_since(start);

    AnalysisResult result = run_records(records, source_name);

    stats_.input = input_stats;
    stats_.load_time_seconds = load_time;
    stats_.total_time_seconds += load_time;
    return result;
}

AnalysisResult AnalysisPipeline::run_records(const std::vector<Record>& records,
                                             const std::string& source_name) {
    reset_statistics();
    auto start = Clock::now();
    stats_.input.rows_read = records.size();
    stats_.input.rows_kept = records.size();

    AnalysisResult result;

    // Profiles
    report_progress("Profiles", 0, 1, std::to_string(records.size()) + " rows");
    auto stage_start = Clock::now();
    result.profiles = ProfileTable::build(records);
    stats_.profile_time_seconds = seconds_since(stage_start);
    stats_.pages = result.profiles.size();
    stats_.eligible_pages = result.profiles.count_eligible(config_.min_keywords);
    stats_.keyword_pairs = result.profiles.total_keyword_pairs();

    if (config_.verbose) {
        std::cout << "Built " << stats_.pages << " page profiles ("
                  << stats_.eligible_pages << " with >= " << config_.min_keywords
                  << " keywords)\n";
    }

    // Index
    report_progress("Index", 0, 1, std::to_string(stats_.pages) + " pages");
    stage_start = Clock::now();
    result.index.build(result.profiles);
    stats_.index_time_seconds = seconds_since(stage_start);
    stats_.unique_keywords = result.index.keyword_count();

    // Matching
    report_progress("Matching", 0, static_cast<int>(stats_.pages));
    stage_start = Clock::now();
    SimilarityMatcher matcher(result.profiles, result.index, config_.matcher_config());
    result.matches = matcher.match_all();
    stats_.matching = matcher.get_statistics();
    stats_.match_time_seconds = seconds_since(stage_start);
    report_progress("Matching", static_cast<int>(stats_.pages), static_cast<int>(stats_.pages));

    // Grouping
    report_progress("Grouping", 0, 1);
    stage_start = Clock::now();
    ClusterResolver resolver(result.profiles);
    result.groups = resolver.resolve(result.matches);
    stats_.resolve_time_seconds = seconds_since(stage_start);
    stats_.groups = result.groups.size();
    for (const auto& g : result.groups) stats_.grouped_pages += g.size();

    // Report
    result.report.created_utc = utc_timestamp();
    result.report.source_path = source_name;
    result.report.threshold = config_.threshold;
    result.report.min_keywords = config_.min_keywords;
    result.report.pages_analyzed = stats_.pages;
    result.report.groups = project_groups(result.groups, result.profiles);

    stats_.total_time_seconds = seconds_since(start);

    if (config_.verbose) {
        if (result.profiles.empty()) {
            std::cerr << "Warning: no pages left after filtering the input\n";
        }
        std::cout << "Found " << stats_.groups << " group(s) covering "
                  << stats_.grouped_pages << " page(s)\n";
    }

    report_progress("Done", 1, 1);
    return result;
}

// ============================================================================
// Utility Functions
// ============================================================================

int to_thread_count(long long value, const std::string& origin) {
    if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) {
        throw std::invalid_argument(origin + " is out of range: " + std::to_string(value));
    }
    return static_cast<int>(value);
}

AnalysisConfig load_config_with_fallback(const std::string& config_path) {
    AnalysisConfig config;
    if (!config_path.empty()) {
        config = AnalysisConfig::from_json_file(config_path);
    }
    config.apply_environment();
    return config;
}

} // namespace kwc
