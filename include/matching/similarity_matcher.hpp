#pragma once

#include "index/keyword_index.hpp"
#include "profile/page_profile.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace kwc {

// ============================================================================
// Matcher Configuration
// ============================================================================

/**
 * @brief Parameters of the similarity test
 */
struct MatcherConfig {
    double threshold = 0.8;                       ///< Minimum shared / |source keywords|
    size_t min_keywords = DEFAULT_MIN_KEYWORDS;   ///< Minimum keywords to act as a source
    int num_threads = 0;                          ///< Worker threads, 0 = hardware concurrency

    /**
     * @brief Reject invalid parameters before matching starts
     * @throws std::invalid_argument on a non-finite or out-of-range threshold,
     *         or a negative thread count
     */
    void validate() const;
};

// ============================================================================
// Candidate Match
// ============================================================================

/**
 * @brief Keyword overlap of a source page with one candidate page
 *
 * The ratio is taken over the source page's keyword count only, so a
 * match from A to B says nothing about a match from B to A.
 */
struct CandidateMatch {
    PageId from = 0;
    PageId to = 0;
    std::vector<std::string> shared;   // Sorted shared keywords
    size_t shared_count = 0;
    double ratio = 0.0;                // shared_count / |keywords(from)|

    nlohmann::json to_json() const;
};

/// Qualifying matches per source page, indexed by PageId
using MatchTable = std::vector<std::vector<CandidateMatch>>;

/**
 * @brief Counters from one match_all() pass
 */
struct MatchStatistics {
    size_t sources_evaluated = 0;    // Pages meeting the keyword minimum
    size_t candidates_scored = 0;    // Candidate pairs returned by the index
    size_t qualifying_matches = 0;   // Pairs passing the threshold
    int threads_used = 0;

    nlohmann::json to_json() const;
};

// ============================================================================
// Similarity Matcher
// ============================================================================

/**
 * @brief Finds the pages whose keyword sets cover a source page's keywords
 *
 * Candidates come from the inverted index, so only pages sharing at least
 * one keyword are ever scored. A page qualifies as similar to the source
 * when |shared| / |source keywords| >= threshold.
 *
 * The matcher only reads the profile table and the index. match_all()
 * spreads the source pages over worker threads; each worker writes the
 * slot of the page it is processing and nothing else.
 */
class SimilarityMatcher {
public:
    /**
     * @throws std::invalid_argument if the config is invalid
     */
    SimilarityMatcher(const ProfileTable& table,
                      const KeywordIndex& index,
                      const MatcherConfig& config);

    /**
     * @brief Whether a page has enough keywords to start a comparison
     */
    bool is_source(PageId page) const;

    /**
     * @brief Qualifying matches of one source page, ascending target id
     *
     * Returns nothing for pages below the keyword minimum.
     */
    std::vector<CandidateMatch> find_matches(PageId source) const;

    /**
     * @brief Run find_matches() for every page
     * @return Table with one (possibly empty) entry per page
     */
    MatchTable match_all();

    const MatchStatistics& get_statistics() const { return stats_; }
    const MatcherConfig& get_config() const { return config_; }

    /**
     * @brief The directional similarity test
     */
    static bool qualifies(size_t shared_count, size_t source_keywords, double threshold);

private:
    const ProfileTable& table_;
    const KeywordIndex& index_;
    MatcherConfig config_;
    MatchStatistics stats_;

    std::vector<CandidateMatch> score_candidates(PageId source, size_t& scored) const;
    int resolve_thread_count() const;
};

} // namespace kwc
