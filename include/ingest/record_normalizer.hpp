#pragma once

#include "ingest/record.hpp"
#include <nlohmann/json.hpp>
#include <istream>
#include <string>
#include <vector>

namespace kwc {

// ============================================================================
// CSV Layout
// ============================================================================

/**
 * @brief Header names of the three required columns
 *
 * Defaults match a Search Console table exported from Looker Studio.
 */
struct CsvColumns {
    std::string page = "Landing Page";
    std::string query = "Query";
    std::string clicks = "Url Clicks";
};

// ============================================================================
// Normalization Statistics
// ============================================================================

/**
 * @brief Row accounting for one normalization pass
 */
struct NormalizationStats {
    size_t rows_read = 0;
    size_t rows_kept = 0;
    size_t dropped_missing = 0;       // Empty page, query or clicks field
    size_t dropped_fragment = 0;      // Page URL contains '#'
    size_t dropped_negative = 0;      // Url Clicks < 0
    size_t dropped_duplicate = 0;     // Exact duplicate of an earlier row

    size_t rows_dropped() const {
        return dropped_missing + dropped_fragment + dropped_negative + dropped_duplicate;
    }

    void print_summary() const;
    nlohmann::json to_json() const;
};

// ============================================================================
// Record Normalizer
// ============================================================================

/**
 * @brief Reads a Search Console CSV export into clean records
 *
 * Cleaning rules, applied per row in this order:
 * - rows with an empty page, query or clicks field are dropped
 * - pages containing '#' are dropped
 * - rows with negative clicks are dropped
 * - exact duplicates of an earlier raw row are dropped
 * - trailing '/' is stripped from the page, the query is case-folded
 *
 * Missing header columns and non-numeric click values raise SchemaError.
 */
class RecordNormalizer {
public:
    RecordNormalizer() = default;
    explicit RecordNormalizer(const CsvColumns& columns) : columns_(columns) {}

    /**
     * @brief Normalize a CSV file
     * @throws std::runtime_error if the file cannot be opened
     * @throws SchemaError on missing columns or invalid click values
     */
    std::vector<Record> load_csv(const std::string& path);

    /**
     * @brief Normalize CSV text from a stream
     */
    std::vector<Record> load_csv(std::istream& in);

    const NormalizationStats& get_statistics() const { return stats_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief Split one CSV line into fields (RFC 4180 quoting)
     */
    static std::vector<std::string> split_csv_line(const std::string& line);

    /**
     * @brief Strip every trailing '/' from a page URL
     */
    static std::string canonical_page(const std::string& url);

    /**
     * @brief ASCII case folding of a query
     */
    static std::string fold_case(const std::string& query);

private:
    CsvColumns columns_;
    NormalizationStats stats_;
    bool verbose_ = false;
};

} // namespace kwc
