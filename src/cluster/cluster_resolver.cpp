#include "cluster/cluster_resolver.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace kwc {

// ============================================================================
// Group
// ============================================================================

std::vector<PageId> Group::all_pages() const {
    std::vector<PageId> pages;
    pages.reserve(members.size() + 1);
    pages.push_back(representative);
    pages.insert(pages.end(), members.begin(), members.end());
    return pages;
}

json Group::to_json(const ProfileTable& table) const {
    json j;
    j["source"] = table.at(source).url;
    j["representative"] = table.at(representative).url;

    json members_arr = json::array();
    for (PageId m : members) {
        members_arr.push_back(table.at(m).url);
    }
    j["members"] = members_arr;

    json ev = json::object();
    for (const auto& [page, match] : evidence) {
        ev[table.at(page).url] = {
            {"shared", match.shared},
            {"shared_count", match.shared_count},
            {"ratio", match.ratio}
        };
    }
    j["evidence"] = ev;
    return j;
}

// ============================================================================
// ClusterResolver
// ============================================================================

ClusterResolver::ClusterResolver(const ProfileTable& table)
    : table_(table) {}

PageId ClusterResolver::choose_representative(const std::vector<PageId>& pages) const {
    if (pages.empty()) {
        throw std::invalid_argument("Cannot choose a representative of an empty group");
    }

    const PageProfile* best = &table_.at(pages.front());
    for (size_t i = 1; i < pages.size(); ++i) {
        const PageProfile& p = table_.at(pages[i]);
        // Strict comparison keeps the first page on equal clicks
        if (p.clicks > best->clicks) best = &p;
    }
    return best->id;
}

std::vector<Group> ClusterResolver::resolve(const MatchTable& matches) const {
    if (matches.size() != table_.size()) {
        throw std::invalid_argument("Match table has " + std::to_string(matches.size()) +
                                    " entries for " + std::to_string(table_.size()) + " pages");
    }

    std::vector<Group> groups;
    std::vector<bool> claimed(table_.size(), false);

    for (PageId a = 0; a < matches.size(); ++a) {
        if (claimed[a]) continue;

        std::vector<const CandidateMatch*> open;
        std::vector<PageId> targets;
        for (const auto& m : matches[a]) {
            if (m.from != a) {
                throw std::invalid_argument("Match table entry " + std::to_string(a) +
                                            " holds a match from page " + std::to_string(m.from));
            }
            if (m.to >= table_.size() || m.to == a) {
                throw std::invalid_argument("Match table entry " + std::to_string(a) +
                                            " holds a match to invalid page " + std::to_string(m.to));
            }
            targets.push_back(m.to);
            if (!claimed[m.to]) open.push_back(&m);
        }
        std::sort(targets.begin(), targets.end());
        if (std::adjacent_find(targets.begin(), targets.end()) != targets.end()) {
            throw std::invalid_argument("Match table entry " + std::to_string(a) +
                                        " holds the same target twice");
        }
        if (open.empty()) continue;

        std::vector<PageId> pages;
        pages.reserve(open.size() + 1);
        pages.push_back(a);
        for (const auto* m : open) pages.push_back(m->to);
        std::sort(pages.begin(), pages.end());

        Group g;
        g.source = a;
        g.representative = choose_representative(pages);
        for (PageId p : pages) {
            claimed[p] = true;
            if (p != g.representative) g.members.push_back(p);
        }
        for (const auto* m : open) {
            g.evidence.emplace(m->to, *m);
        }

        groups.push_back(std::move(g));
    }

    return groups;
}

} // namespace kwc
