#pragma once

#include "cluster/cluster_resolver.hpp"
#include "index/keyword_index.hpp"
#include "ingest/record_normalizer.hpp"
#include "matching/similarity_matcher.hpp"
#include "profile/page_profile.hpp"
#include "report/group_report.hpp"
#include <functional>
#include <istream>
#include <string>
#include <vector>

namespace kwc {

// ============================================================================
// Analysis Configuration
// ============================================================================

/**
 * @brief Configuration for a cannibalization run
 */
struct AnalysisConfig {
    // Matching
    double threshold = 0.8;                        ///< Shared keyword ratio [0, 1]
    size_t min_keywords = DEFAULT_MIN_KEYWORDS;    ///< Minimum keywords for a source page
    int num_threads = 0;                           ///< 0 = hardware concurrency

    // Input layout
    std::string page_column = "Landing Page";
    std::string query_column = "Query";
    std::string clicks_column = "Url Clicks";

    // Output
    bool verbose = true;                           ///< Verbose logging

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static AnalysisConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Override fields from KWC_THRESHOLD, KWC_MIN_KEYWORDS and KWC_THREADS
     * @throws std::invalid_argument if a variable does not parse
     */
    void apply_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    MatcherConfig matcher_config() const;
    CsvColumns csv_columns() const;

    nlohmann::json to_json() const;
};

// ============================================================================
// Run Statistics
// ============================================================================

/**
 * @brief Statistics from one pipeline run
 */
struct RunStatistics {
    NormalizationStats input;

    // Profiles and index
    size_t pages = 0;
    size_t eligible_pages = 0;
    size_t keyword_pairs = 0;
    size_t unique_keywords = 0;

    // Matching and grouping
    MatchStatistics matching;
    size_t groups = 0;
    size_t grouped_pages = 0;

    // Timing
    double load_time_seconds = 0.0;
    double profile_time_seconds = 0.0;
    double index_time_seconds = 0.0;
    double match_time_seconds = 0.0;
    double resolve_time_seconds = 0.0;
    double total_time_seconds = 0.0;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    /**
     * @brief Export to JSON
     */
    nlohmann::json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Analysis Pipeline
// ============================================================================

/**
 * @brief Everything a run produced, kept together because the report and
 *        the groups refer to the profile table by PageId
 */
struct AnalysisResult {
    ProfileTable profiles;
    KeywordIndex index;
    MatchTable matches;
    std::vector<Group> groups;
    AnalysisReport report;
};

/**
 * @brief End-to-end cannibalization analysis
 *
 * CSV → Records → Profiles → Keyword Index → Matches → Groups → Report
 *
 * Matching runs on worker threads; grouping is a single sequential pass.
 * An input without any page yields an empty report, not an error.
 */
class AnalysisPipeline {
public:
    /**
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit AnalysisPipeline(const AnalysisConfig& config);

    /**
     * @brief Analyze a CSV export
     */
    AnalysisResult run_file(const std::string& csv_path);

    /**
     * @brief Analyze CSV text from a stream
     */
    AnalysisResult run_stream(std::istream& in, const std::string& source_name = "<stream>");

    /**
     * @brief Analyze already normalized records
     */
    AnalysisResult run_records(const std::vector<Record>& records,
                               const std::string& source_name = "");

    /**
     * @brief Set progress callback
     */
    void set_progress_callback(ProgressCallback callback);

    RunStatistics get_statistics() const { return stats_; }
    void reset_statistics();

    AnalysisConfig get_config() const { return config_; }

private:
    AnalysisConfig config_;
    RunStatistics stats_;
    ProgressCallback progress_callback_;

    void report_progress(
        const std::string& stage,
        int current,
        int total,
        const std::string& message = ""
    );
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Defaults, then the config file (if given), then the environment
 */
AnalysisConfig load_config_with_fallback(const std::string& config_path = "");

/**
 * @brief Narrow a parsed thread count to int
 * @throws std::invalid_argument if the value is outside the range of int
 */
int to_thread_count(long long value, const std::string& origin);

/**
 * @brief Current UTC time as an ISO-8601 string
 */
std::string utc_timestamp();

} // namespace kwc
