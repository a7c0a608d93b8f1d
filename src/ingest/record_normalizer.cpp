#include "ingest/record_normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <unordered_set>

using json = nlohmann::json;

namespace {

const std::string UTF8_BOM = "\xEF\xBB\xBF";

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

int find_column(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (trim(header[i]) == name) return static_cast<int>(i);
    }
    return -1;
}

bool parse_clicks(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    size_t consumed = 0;
    try {
        out = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        return false;
    }
    return consumed == text.size();
}

}  // namespace

namespace kwc {

// ============================================================================
// NormalizationStats
// ============================================================================

void NormalizationStats::print_summary() const {
    std::cout << "Input rows:\n";
    std::cout << "  Read: " << rows_read << "\n";
    std::cout << "  Kept: " << rows_kept << "\n";
    std::cout << "  Dropped (missing value): " << dropped_missing << "\n";
    std::cout << "  Dropped (fragment URL): " << dropped_fragment << "\n";
    std::cout << "  Dropped (negative clicks): " << dropped_negative << "\n";
    std::cout << "  Dropped (duplicate): " << dropped_duplicate << "\n";
}

json NormalizationStats::to_json() const {
    json j;
    j["rows_read"] = rows_read;
    j["rows_kept"] = rows_kept;
    j["dropped_missing"] = dropped_missing;
    j["dropped_fragment"] = dropped_fragment;
    j["dropped_negative"] = dropped_negative;
    j["dropped_duplicate"] = dropped_duplicate;
    return j;
}

// ============================================================================
// RecordNormalizer
// ============================================================================

std::vector<Record> RecordNormalizer::load_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }

    if (verbose_) {
        std::cout << "Reading CSV: " << path << "\n";
    }
    return load_csv(file);
}

std::vector<Record> RecordNormalizer::load_csv(std::istream& in) {
    stats_ = NormalizationStats{};
    std::vector<Record> records;

    std::string line;
    size_t line_no = 0;

    // Header
    std::vector<std::string> header;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line_no == 1 && line.compare(0, UTF8_BOM.size(), UTF8_BOM) == 0) {
            line.erase(0, UTF8_BOM.size());
        }
        if (trim(line).empty()) continue;
        header = split_csv_line(line);
        break;
    }
    if (header.empty()) {
        throw SchemaError("input has no header row");
    }

    int page_col = find_column(header, columns_.page);
    int query_col = find_column(header, columns_.query);
    int clicks_col = find_column(header, columns_.clicks);

    std::string missing;
    if (page_col < 0) missing += " '" + columns_.page + "'";
    if (query_col < 0) missing += " '" + columns_.query + "'";
    if (clicks_col < 0) missing += " '" + columns_.clicks + "'";
    if (!missing.empty()) {
        throw SchemaError("missing required column(s):" + missing);
    }

    const size_t needed = static_cast<size_t>(
        std::max({page_col, query_col, clicks_col})) + 1;

    std::unordered_set<std::string> seen;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        stats_.rows_read++;
        auto fields = split_csv_line(line);
        if (fields.size() < needed) {
            stats_.dropped_missing++;
            continue;
        }

        const std::string& page = fields[page_col];
        const std::string& query = fields[query_col];
        std::string clicks_text = trim(fields[clicks_col]);

        if (page.empty() || query.empty() || clicks_text.empty()) {
            stats_.dropped_missing++;
            continue;
        }

        if (page.find('#') != std::string::npos) {
            stats_.dropped_fragment++;
            continue;
        }

        int64_t clicks = 0;
        if (!parse_clicks(clicks_text, clicks)) {
            throw SchemaError("invalid value '" + clicks_text + "' in column '" +
                              columns_.clicks + "' at line " + std::to_string(line_no));
        }
        if (clicks < 0) {
            stats_.dropped_negative++;
            continue;
        }

        std::string key = page + '\x1f' + query + '\x1f' + std::to_string(clicks);
        if (!seen.insert(std::move(key)).second) {
            stats_.dropped_duplicate++;
            continue;
        }

        Record rec;
        rec.page = canonical_page(page);
        rec.keyword = fold_case(query);
        rec.clicks = clicks;
        rec.line = line_no;

        if (rec.page.empty()) {
            stats_.dropped_missing++;
            continue;
        }

        records.push_back(std::move(rec));
    }

    stats_.rows_kept = records.size();

    if (verbose_) {
        std::cout << "  Rows read: " << stats_.rows_read
                  << ", kept: " << stats_.rows_kept
                  << ", dropped: " << stats_.rows_dropped() << "\n";
    }

    return records;
}

std::vector<std::string> RecordNormalizer::split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (c == ',' && !in_quotes) {
            fields.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(current);
    return fields;
}

std::string RecordNormalizer::canonical_page(const std::string& url) {
    size_t end = url.find_last_not_of('/');
    if (end == std::string::npos) return "";
    return url.substr(0, end + 1);
}

std::string RecordNormalizer::fold_case(const std::string& query) {
    std::string folded = query;
    std::transform(folded.begin(), folded.end(), folded.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return folded;
}

} // namespace kwc
