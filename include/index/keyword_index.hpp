#pragma once

#include "profile/page_profile.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kwc {

// Marks "no page to exclude" in candidate queries
constexpr PageId NO_PAGE = std::numeric_limits<PageId>::max();

struct KeywordIndex {
    size_t page_count = 0;
    size_t posting_count = 0;

    // Inverse index: keyword -> page IDs (ascending)
    std::unordered_map<std::string, std::vector<PageId>> keyword_to_pages;

    // Build index from a profile table
    void build(const ProfileTable& table) {
        keyword_to_pages.clear();
        page_count = table.size();
        posting_count = 0;

        // Profiles are visited in id order, so every posting list stays sorted
        for (const auto& profile : table.profiles()) {
            for (const auto& kw : profile.keywords) {
                keyword_to_pages[kw].push_back(profile.id);
                ++posting_count;
            }
        }
    }

    // Pages sharing at least one keyword with the set, ascending, without `exclude`
    std::vector<PageId> candidates(const std::set<std::string>& keywords,
                                   PageId exclude = NO_PAGE) const {
        std::vector<PageId> result;
        for (const auto& kw : keywords) {
            auto it = keyword_to_pages.find(kw);
            if (it == keyword_to_pages.end()) continue;
            result.insert(result.end(), it->second.begin(), it->second.end());
        }

        std::sort(result.begin(), result.end());
        result.erase(std::unique(result.begin(), result.end()), result.end());

        if (exclude != NO_PAGE) {
            auto pos = std::lower_bound(result.begin(), result.end(), exclude);
            if (pos != result.end() && *pos == exclude) result.erase(pos);
        }
        return result;
    }

    // Posting list for one keyword (empty if unknown)
    const std::vector<PageId>& pages_for(const std::string& keyword) const {
        static const std::vector<PageId> empty;
        auto it = keyword_to_pages.find(keyword);
        return it != keyword_to_pages.end() ? it->second : empty;
    }

    size_t keyword_count() const { return keyword_to_pages.size(); }

    // Keywords shared by the most pages
    std::vector<std::pair<std::string, size_t>> get_top_keywords(size_t k) const {
        std::vector<std::pair<std::string, size_t>> ranked;
        ranked.reserve(keyword_to_pages.size());
        for (const auto& [kw, pages] : keyword_to_pages) {
            ranked.emplace_back(kw, pages.size());
        }

        std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return a.first < b.first;
        });

        if (ranked.size() > k) ranked.resize(k);
        return ranked;
    }

    void print_summary() const {
        std::cout << "KeywordIndex Summary:\n";
        std::cout << "  Pages: " << page_count << "\n";
        std::cout << "  Unique keywords: " << keyword_to_pages.size() << "\n";
        std::cout << "  Postings: " << posting_count << "\n";

        size_t shared = 0;
        for (const auto& [kw, pages] : keyword_to_pages) {
            if (pages.size() > 1) ++shared;
        }
        std::cout << "  Keywords on more than one page: " << shared << "\n";
    }
};

} // namespace kwc
