#pragma once

#include "discovery/algorithm.hpp"
#include "search/pattern_matcher.hpp"

#include <stdexcept>

namespace geopat {

// ─── PartialMatcher ────────────────────────────────────────────
// Every translation that maps at least min_match_size query points onto
// the point set (problem P2 of [Ukkonen et al. 2003]). Differences between
// all point-set and query points are grouped exactly as in SIA.

template <typename P>
class PartialMatcher : public PatternMatcher<P> {
public:
    explicit PartialMatcher(size_t min_match_size) : min_match_size_(min_match_size) {
        if (min_match_size_ == 0) {
            throw std::invalid_argument("PartialMatcher min_match_size must be positive");
        }
    }

    size_t minMatchSize() const { return min_match_size_; }

    void findIndicesToOutput(const Pattern<P>& query, const PointSet<P>& point_set,
                             const MatchSink& on_output) const override {
        std::vector<IndexedDiff<P>> diffs;
        diffs.reserve(query.size() * point_set.size());
        for (const auto& q : query) {
            for (size_t j = 0; j < point_set.size(); j++) {
                diffs.push_back({point_set[j] - q, j});
            }
        }
        sortIndexedDiffs(diffs);

        forEachDiffGroup(diffs, [&](const P&, std::vector<size_t> indices) {
            if (indices.size() >= min_match_size_) on_output(std::move(indices));
        });
    }

private:
    size_t min_match_size_;
};

} // namespace geopat
