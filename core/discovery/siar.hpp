#pragma once

#include "discovery/algorithm.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace geopat {

// ─── SiaR ──────────────────────────────────────────────────────
// SIA restricted to r subdiagonals [Collins 2011]. An approximation:
// shifts whose defining pairs all lie more than r positions apart are
// missed. Cost is O(n*r) differences instead of O(n^2).
//
// 1. Windowed forward differences (j - i <= r), partitioned as in SIA
//    into candidate patterns.
// 2. All intra-pattern forward differences of the candidates are counted.
// 3. For each distinct intra-pattern difference, most frequent first, the
//    exact MTP is recovered as point_set ∩ (point_set - translator).

template <typename P>
class SiaR : public MtpAlgorithm<P> {
public:
    explicit SiaR(size_t r) : r_(r) {
        if (r_ == 0) throw std::invalid_argument("SIAR window size r must be positive");
    }

    std::string name() const override { return "SIAR"; }
    size_t r() const { return r_; }

    void computeMtpsToOutput(const PointSet<P>& point_set,
                             const MtpSink<P>& on_output) const override {
        if (point_set.size() < 2) return;

        std::vector<Pattern<P>> candidates = windowedPatterns(point_set);
        std::vector<std::pair<P, size_t>> frequencies =
            diffFrequencies(intraPatternDiffs(candidates));

        logger()->debug("SIAR(r={}): {} candidate patterns, {} distinct intra-pattern differences",
                        r_, candidates.size(), frequencies.size());

        for (const auto& entry : frequencies) {
            const P& translator = entry.first;
            PointSet<P> occurrence = point_set.intersect(point_set.translate(translator * -1.0));
            on_output(Mtp<P>{translator, Pattern<P>(occurrence.points())});
        }
    }

private:
    std::vector<Pattern<P>> windowedPatterns(const PointSet<P>& point_set) const {
        const size_t n = point_set.size();
        std::vector<IndexedDiff<P>> diffs;
        diffs.reserve(n * r_);
        for (size_t i = 0; i + 1 < n; i++) {
            const P& from = point_set[i];
            const size_t end = std::min(n, i + r_ + 1);
            for (size_t j = i + 1; j < end; j++) {
                diffs.push_back({point_set[j] - from, i});
            }
        }
        sortIndexedDiffs(diffs);

        std::vector<Pattern<P>> patterns;
        forEachDiffGroup(diffs, [&](const P&, std::vector<size_t> indices) {
            patterns.push_back(point_set.getPattern(indices));
        });
        return patterns;
    }

    static std::vector<P> intraPatternDiffs(const std::vector<Pattern<P>>& patterns) {
        std::vector<P> diffs;
        for (const auto& pattern : patterns) {
            for (size_t i = 0; i + 1 < pattern.size(); i++) {
                for (size_t j = i + 1; j < pattern.size(); j++) {
                    diffs.push_back(pattern[j] - pattern[i]);
                }
            }
        }
        std::sort(diffs.begin(), diffs.end());
        return diffs;
    }

    /// (difference, count) pairs, descending by count; equal counts keep
    /// ascending difference order.
    static std::vector<std::pair<P, size_t>> diffFrequencies(const std::vector<P>& sorted_diffs) {
        std::vector<std::pair<P, size_t>> frequencies;
        for (const auto& diff : sorted_diffs) {
            if (!frequencies.empty() && frequencies.back().first == diff) {
                frequencies.back().second++;
            } else {
                frequencies.emplace_back(diff, 1);
            }
        }
        std::stable_sort(frequencies.begin(), frequencies.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        return frequencies;
    }

    size_t r_;
};

} // namespace geopat
