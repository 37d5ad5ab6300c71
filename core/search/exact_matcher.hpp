#pragma once

#include "search/pattern_matcher.hpp"

namespace geopat {

// ─── ExactMatcher ──────────────────────────────────────────────
// All occurrences where every query point is present after translation
// (problem P1 of [Ukkonen et al. 2003]). Each point of the set is tried
// as the image of the first query point; the scan for the rest stops at
// the translated last query point.

template <typename P>
class ExactMatcher : public PatternMatcher<P> {
public:
    void findIndicesToOutput(const Pattern<P>& query, const PointSet<P>& point_set,
                             const MatchSink& on_output) const override {
        const size_t n = point_set.size();
        const size_t q = query.size();
        if (q == 0 || q > n) return;

        for (size_t i = 0; i + q <= n; i++) {
            const P translator = point_set[i] - query[0];
            const P cutoff = query.back() + translator;

            std::vector<size_t> candidate;
            candidate.reserve(q);
            size_t scan = i;
            size_t query_index = 0;
            while (scan < n && query_index < q && point_set[scan] <= cutoff) {
                const P translated = query[query_index] + translator;
                if (point_set[scan] == translated) candidate.push_back(scan);
                if (translated <= point_set[scan]) query_index++;
                scan++;
            }

            if (candidate.size() == q) on_output(std::move(candidate));
        }
    }
};

} // namespace geopat
