#include "report/group_report.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kwc {

// ============================================================================
// Helpers
// ============================================================================

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += "\"\"";
        else quoted += c;
    }
    quoted += "\"";
    return quoted;
}

std::string join_list(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    return out;
}

namespace {

std::vector<std::string> common_keywords(const Group& group, const ProfileTable& table) {
    auto pages = group.all_pages();
    const auto& first = table.at(pages.front()).keywords;
    std::vector<std::string> common(first.begin(), first.end());

    for (size_t i = 1; i < pages.size() && !common.empty(); ++i) {
        const auto& kws = table.at(pages[i]).keywords;
        std::vector<std::string> next;
        std::set_intersection(common.begin(), common.end(),
                              kws.begin(), kws.end(),
                              std::back_inserter(next));
        common = std::move(next);
    }
    return common;
}

}  // namespace

// ============================================================================
// MemberReport / GroupReport
// ============================================================================

json MemberReport::to_json() const {
    json j;
    j["url"] = url;
    j["clicks"] = clicks;
    j["shared_terms"] = shared_terms;
    j["shared_count"] = shared_count;
    j["ratio"] = ratio;
    j["is_source"] = is_source;
    return j;
}

json GroupReport::to_json() const {
    json j;
    j["similar_urls"] = similar_urls;
    j["url_to_keep"] = representative_url;
    j["clicks"] = representative_clicks;
    j["common_terms"] = common_terms;
    j["common_term_count"] = common_terms.size();

    json members_arr = json::array();
    for (const auto& m : members) {
        members_arr.push_back(m.to_json());
    }
    j["members"] = members_arr;
    return j;
}

std::vector<GroupReport> project_groups(const std::vector<Group>& groups,
                                        const ProfileTable& table) {
    std::vector<GroupReport> reports;
    reports.reserve(groups.size());

    for (const auto& g : groups) {
        GroupReport r;
        const PageProfile& rep = table.at(g.representative);
        r.representative_url = rep.url;
        r.representative_clicks = rep.clicks;
        for (PageId id : g.all_pages()) {
            r.similar_urls.push_back(table.at(id).url);
        }
        r.common_terms = common_keywords(g, table);

        for (PageId id : g.members) {
            const PageProfile& p = table.at(id);
            MemberReport m;
            m.url = p.url;
            m.clicks = p.clicks;
            m.is_source = (id == g.source);

            // The source has no evidence entry of its own; its overlap with
            // the representative is the match source -> representative
            PageId key = m.is_source ? g.representative : id;
            auto it = g.evidence.find(key);
            if (it == g.evidence.end()) {
                throw std::logic_error("Group of " + table.at(g.source).url +
                                       " has no evidence for " + table.at(key).url);
            }
            m.shared_terms = it->second.shared;
            m.shared_count = it->second.shared_count;
            m.ratio = it->second.ratio;
            r.members.push_back(std::move(m));
        }

        reports.push_back(std::move(r));
    }

    return reports;
}

// ============================================================================
// AnalysisReport
// ============================================================================

json AnalysisReport::to_json() const {
    json j;
    j["meta"] = {
        {"created_utc", created_utc},
        {"source_path", source_path},
        {"threshold", threshold},
        {"min_keywords", min_keywords},
        {"pages_analyzed", pages_analyzed},
        {"total_groups", groups.size()}
    };

    json groups_arr = json::array();
    for (const auto& g : groups) {
        groups_arr.push_back(g.to_json());
    }
    j["groups"] = groups_arr;
    return j;
}

void AnalysisReport::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write report file: " + path);
    }
    file << to_json().dump(2);
}

void AnalysisReport::write_csv(std::ostream& out) const {
    out << "Similar URLs,Shared Terms,# Shared Terms,URL to Keep,Clicks\n";
    for (const auto& g : groups) {
        out << csv_escape(join_list(g.similar_urls)) << ","
            << csv_escape(join_list(g.common_terms)) << ","
            << g.common_term_count() << ","
            << csv_escape(g.representative_url) << ","
            << g.representative_clicks << "\n";
    }
}

void AnalysisReport::save_to_csv(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write report file: " + path);
    }
    write_csv(file);
}

void AnalysisReport::print(std::ostream& out, size_t max_groups) const {
    if (groups.empty()) {
        out << "No similar pages found for threshold " << threshold << ".\n";
        return;
    }

    out << "\n" << std::string(70, '=') << "\n";
    out << "Similar Page Groups (" << groups.size() << ")\n";
    out << std::string(70, '=') << "\n";

    size_t shown = std::min(max_groups, groups.size());
    for (size_t i = 0; i < shown; ++i) {
        const auto& g = groups[i];
        out << "\n[" << (i + 1) << "] Keep: " << g.representative_url
            << " (" << g.representative_clicks << " clicks)\n";
        out << "    Common terms (" << g.common_term_count() << "): "
            << join_list(g.common_terms) << "\n";
        for (const auto& m : g.members) {
            std::ostringstream pct;
            pct << std::fixed << std::setprecision(0) << (m.ratio * 100.0) << "%";
            out << "    - " << m.url << " (" << m.clicks << " clicks, "
                << m.shared_count << " shared, " << pct.str() << ")\n";
        }
    }

    if (shown < groups.size()) {
        out << "\n... and " << (groups.size() - shown) << " more group(s)\n";
    }
    out << "\n";
}

} // namespace kwc
