#pragma once

#include "matching/similarity_matcher.hpp"
#include "profile/page_profile.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <vector>

namespace kwc {

/**
 * @brief A set of pages competing for the same queries
 *
 * `source` is the page whose matches formed the group. `members` holds
 * every page of the group except the representative, ascending.
 * `evidence` maps each matched page to the source's match against it;
 * the source itself has no entry.
 */
struct Group {
    PageId source = 0;
    PageId representative = 0;
    std::vector<PageId> members;
    std::map<PageId, CandidateMatch> evidence;

    /**
     * @brief Representative followed by the members
     */
    std::vector<PageId> all_pages() const;

    size_t size() const { return members.size() + 1; }

    nlohmann::json to_json(const ProfileTable& table) const;
};

/**
 * @brief Turns per-page match lists into disjoint groups
 *
 * Pages are visited once in ascending PageId order. An unclaimed page with
 * at least one unclaimed qualifying match claims itself and those matches
 * as a new group. Pages claimed by an earlier group are skipped both as
 * sources and as matches. There is no transitive merging: pages related
 * only through a chain of matches end up in the same group only if the
 * source matched each of them directly.
 *
 * The representative is the group page with the most clicks, whatever its
 * keyword count; on equal clicks the smallest PageId wins.
 */
class ClusterResolver {
public:
    explicit ClusterResolver(const ProfileTable& table);

    /**
     * @brief Resolve groups from a match table
     * @param matches One entry per page, as returned by SimilarityMatcher::match_all()
     * @throws std::invalid_argument if the table size does not match the profiles,
     *         or an entry holds a foreign, out-of-range or repeated match
     */
    std::vector<Group> resolve(const MatchTable& matches) const;

    /**
     * @brief Pick the representative of an ascending list of group pages
     */
    PageId choose_representative(const std::vector<PageId>& pages) const;

private:
    const ProfileTable& table_;
};

} // namespace kwc
