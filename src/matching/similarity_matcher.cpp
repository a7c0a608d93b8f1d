#include "matching/similarity_matcher.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace kwc {

// ============================================================================
// MatcherConfig
// ============================================================================

void MatcherConfig::validate() const {
    if (!std::isfinite(threshold)) {
        throw std::invalid_argument("Similarity threshold must be a finite number");
    }
    if (threshold < 0.0 || threshold > 1.0) {
        throw std::invalid_argument("Similarity threshold must be between 0.0 and 1.0, got " +
                                    std::to_string(threshold));
    }
    if (num_threads < 0) {
        throw std::invalid_argument("Thread count must not be negative");
    }
}

// ============================================================================
// CandidateMatch / MatchStatistics
// ============================================================================

json CandidateMatch::to_json() const {
    json j;
    j["from"] = from;
    j["to"] = to;
    j["shared"] = shared;
    j["shared_count"] = shared_count;
    j["ratio"] = ratio;
    return j;
}

json MatchStatistics::to_json() const {
    json j;
    j["sources_evaluated"] = sources_evaluated;
    j["candidates_scored"] = candidates_scored;
    j["qualifying_matches"] = qualifying_matches;
    j["threads_used"] = threads_used;
    return j;
}

// ============================================================================
// SimilarityMatcher
// ============================================================================

SimilarityMatcher::SimilarityMatcher(const ProfileTable& table,
                                     const KeywordIndex& index,
                                     const MatcherConfig& config)
    : table_(table), index_(index), config_(config) {
    config_.validate();
}

bool SimilarityMatcher::qualifies(size_t shared_count, size_t source_keywords, double threshold) {
    if (source_keywords == 0 || shared_count == 0) return false;
    return static_cast<double>(shared_count) / static_cast<double>(source_keywords) >= threshold;
}

bool SimilarityMatcher::is_source(PageId page) const {
    return table_.at(page).keyword_count() >= config_.min_keywords;
}

std::vector<CandidateMatch> SimilarityMatcher::find_matches(PageId source) const {
    size_t scored = 0;
    return score_candidates(source, scored);
}

std::vector<CandidateMatch> SimilarityMatcher::score_candidates(PageId source, size_t& scored) const {
    std::vector<CandidateMatch> matches;
    if (!is_source(source)) return matches;

    const PageProfile& src = table_.at(source);
    const size_t denominator = src.keyword_count();

    for (PageId cand : index_.candidates(src.keywords, source)) {
        ++scored;
        const PageProfile& other = table_.at(cand);

        std::vector<std::string> shared;
        std::set_intersection(src.keywords.begin(), src.keywords.end(),
                              other.keywords.begin(), other.keywords.end(),
                              std::back_inserter(shared));

        if (!qualifies(shared.size(), denominator, config_.threshold)) continue;

        CandidateMatch m;
        m.from = source;
        m.to = cand;
        m.shared_count = shared.size();
        m.ratio = static_cast<double>(shared.size()) / static_cast<double>(denominator);
        m.shared = std::move(shared);
        matches.push_back(std::move(m));
    }

    return matches;
}

int SimilarityMatcher::resolve_thread_count() const {
    int threads = config_.num_threads;
    if (threads <= 0) {
        unsigned hw = std::thread::hardware_concurrency();
        threads = hw > 0 ? static_cast<int>(hw) : 4;
    }
    size_t pages = table_.size();
    if (pages < static_cast<size_t>(threads)) threads = static_cast<int>(pages);
    return std::max(threads, 1);
}

MatchTable SimilarityMatcher::match_all() {
    stats_ = MatchStatistics{};
    const size_t n = table_.size();
    MatchTable results(n);

    const int T = resolve_thread_count();
    stats_.threads_used = T;

    std::atomic<size_t> next{0};
    std::vector<size_t> scored_per_thread(T, 0);
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&](int tid) {
        try {
            size_t i;
            while ((i = next.fetch_add(1, std::memory_order_relaxed)) < n) {
                results[i] = score_candidates(i, scored_per_thread[tid]);
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(failure_mutex);
            if (!failure) failure = std::current_exception();
            next.store(n);
        }
    };

    if (T == 1) {
        worker(0);
    } else {
        std::vector<std::thread> pool;
        pool.reserve(T);
        for (int t = 0; t < T; ++t) pool.emplace_back(worker, t);
        for (auto& th : pool) th.join();
    }

    if (failure) std::rethrow_exception(failure);

    for (size_t scored : scored_per_thread) stats_.candidates_scored += scored;
    for (size_t i = 0; i < n; ++i) {
        if (is_source(i)) stats_.sources_evaluated++;
        stats_.qualifying_matches += results[i].size();
    }

    return results;
}

} // namespace kwc
