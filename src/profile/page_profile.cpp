#include "profile/page_profile.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <numeric>

using json = nlohmann::json;

namespace kwc {

json PageProfile::to_json() const {
    json j;
    j["url"] = url;
    j["keywords"] = std::vector<std::string>(keywords.begin(), keywords.end());
    j["keyword_count"] = keywords.size();
    j["clicks"] = clicks;
    return j;
}

// ============================================================================
// ProfileTable
// ============================================================================

ProfileTable ProfileTable::build(const std::vector<Record>& records) {
    std::map<std::string, PageProfile> by_page;

    for (const auto& rec : records) {
        if (rec.page.empty() || rec.keyword.empty()) {
            throw SchemaError("record at line " + std::to_string(rec.line) +
                              " has an empty page or keyword");
        }
        if (rec.clicks < 0) {
            throw std::invalid_argument("negative clicks (" + std::to_string(rec.clicks) +
                                        ") for page " + rec.page);
        }

        PageProfile& profile = by_page[rec.page];
        profile.keywords.insert(rec.keyword);
        profile.clicks += static_cast<uint64_t>(rec.clicks);
    }

    ProfileTable table;
    table.profiles_.reserve(by_page.size());
    for (auto& [url, profile] : by_page) {
        profile.id = table.profiles_.size();
        profile.url = url;
        table.by_url_[url] = profile.id;
        table.profiles_.push_back(std::move(profile));
    }
    return table;
}

const PageProfile* ProfileTable::find(const std::string& url) const {
    auto it = by_url_.find(url);
    if (it == by_url_.end()) return nullptr;
    return &profiles_[it->second];
}

size_t ProfileTable::count_eligible(size_t min_keywords) const {
    return static_cast<size_t>(std::count_if(profiles_.begin(), profiles_.end(),
        [min_keywords](const PageProfile& p) { return p.keyword_count() >= min_keywords; }));
}

size_t ProfileTable::total_keyword_pairs() const {
    size_t total = 0;
    for (const auto& p : profiles_) total += p.keyword_count();
    return total;
}

std::vector<PageId> ProfileTable::top_by_clicks(size_t k) const {
    std::vector<PageId> ids(profiles_.size());
    std::iota(ids.begin(), ids.end(), 0);

    std::stable_sort(ids.begin(), ids.end(), [this](PageId a, PageId b) {
        return profiles_[a].clicks > profiles_[b].clicks;
    });

    if (ids.size() > k) ids.resize(k);
    return ids;
}

void ProfileTable::print_summary(size_t min_keywords) const {
    std::cout << "Page Profiles:\n";
    std::cout << "  Pages: " << profiles_.size() << "\n";
    std::cout << "  Pages with >= " << min_keywords << " keywords: "
              << count_eligible(min_keywords) << "\n";
    std::cout << "  Page/keyword pairs: " << total_keyword_pairs() << "\n";

    if (!profiles_.empty()) {
        double avg = static_cast<double>(total_keyword_pairs()) / profiles_.size();
        std::cout << "  Avg keywords per page: " << avg << "\n";
    }
}

} // namespace kwc
