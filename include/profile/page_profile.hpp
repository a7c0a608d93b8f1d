#pragma once

#include "ingest/record.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace kwc {

/// Position of a profile in its ProfileTable (ascending URL order)
using PageId = size_t;

/// Pages with fewer keywords never start a comparison
constexpr size_t DEFAULT_MIN_KEYWORDS = 10;

/**
 * @brief Aggregated keyword set and click total of one landing page
 */
struct PageProfile {
    PageId id = 0;
    std::string url;
    std::set<std::string> keywords;    // Distinct case-folded queries
    uint64_t clicks = 0;               // Sum over every row of the page

    size_t keyword_count() const { return keywords.size(); }

    nlohmann::json to_json() const;
};

/**
 * @brief Immutable table of page profiles built from normalized records
 *
 * Profiles are ordered by ascending URL and their id is their position,
 * so iterating ids in ascending order visits pages in URL order. Pages
 * below the minimum keyword count stay in the table: the minimum only
 * decides which pages may start a comparison.
 */
class ProfileTable {
public:
    ProfileTable() = default;

    /**
     * @brief Aggregate records into one profile per distinct page
     * @throws SchemaError if a record has an empty page or keyword
     * @throws std::invalid_argument if a record has negative clicks
     */
    static ProfileTable build(const std::vector<Record>& records);

    size_t size() const { return profiles_.size(); }
    bool empty() const { return profiles_.empty(); }

    const PageProfile& at(PageId id) const { return profiles_.at(id); }
    const std::vector<PageProfile>& profiles() const { return profiles_; }

    /**
     * @brief Look up a profile by canonical URL
     * @return nullptr if the page is unknown
     */
    const PageProfile* find(const std::string& url) const;

    /**
     * @brief Number of pages with at least min_keywords keywords
     */
    size_t count_eligible(size_t min_keywords) const;

    /**
     * @brief Total number of (page, keyword) pairs
     */
    size_t total_keyword_pairs() const;

    /**
     * @brief The k pages with the most clicks, ties by ascending id
     */
    std::vector<PageId> top_by_clicks(size_t k) const;

    void print_summary(size_t min_keywords = DEFAULT_MIN_KEYWORDS) const;

private:
    std::vector<PageProfile> profiles_;
    std::unordered_map<std::string, PageId> by_url_;
};

} // namespace kwc
