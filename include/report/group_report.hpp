#pragma once

#include "cluster/cluster_resolver.hpp"
#include "profile/page_profile.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace kwc {

/**
 * @brief One non-representative page of a group, with its evidence
 */
struct MemberReport {
    std::string url;
    uint64_t clicks = 0;
    std::vector<std::string> shared_terms;   // Terms shared with the matching partner
    size_t shared_count = 0;
    double ratio = 0.0;
    bool is_source = false;                  // The page whose matches formed the group

    nlohmann::json to_json() const;
};

/**
 * @brief Reporting shape of a group
 */
struct GroupReport {
    std::vector<std::string> similar_urls;   // Representative first, then members
    std::string representative_url;          // URL to keep
    uint64_t representative_clicks = 0;
    std::vector<std::string> common_terms;   // Terms present on every page of the group
    std::vector<MemberReport> members;

    size_t common_term_count() const { return common_terms.size(); }

    nlohmann::json to_json() const;
};

/**
 * @brief Full result of a run, ready for export
 */
struct AnalysisReport {
    std::string created_utc;
    std::string source_path;
    double threshold = 0.0;
    size_t min_keywords = 0;
    size_t pages_analyzed = 0;
    std::vector<GroupReport> groups;

    nlohmann::json to_json() const;

    void save_to_json(const std::string& path) const;

    /**
     * @brief Write the CSV table (one row per group)
     *
     * Columns: Similar URLs, Shared Terms, # Shared Terms, URL to Keep, Clicks.
     * An empty report still gets the header row.
     */
    void write_csv(std::ostream& out) const;
    void save_to_csv(const std::string& path) const;

    /**
     * @brief Print up to max_groups groups in a readable layout
     */
    void print(std::ostream& out, size_t max_groups = 20) const;
};

/**
 * @brief Shape resolved groups into reports, in group order
 */
std::vector<GroupReport> project_groups(const std::vector<Group>& groups,
                                        const ProfileTable& table);

/**
 * @brief Quote a CSV field if it holds a comma, quote or line break
 */
std::string csv_escape(const std::string& field);

/**
 * @brief Join values with ", "
 */
std::string join_list(const std::vector<std::string>& values);

} // namespace kwc
