#pragma once

#include "point_set/pattern.hpp"
#include "point_set/point_set.hpp"

#include <functional>
#include <vector>

namespace geopat {

/// Point-set indices of one match, ascending.
using MatchSink = std::function<void(std::vector<size_t>)>;

// ─── PatternMatcher ────────────────────────────────────────────
// Finds translated occurrences of a query pattern in a point set
// [Ukkonen et al. 2003]. The query is expected in ascending order.

template <typename P>
class PatternMatcher {
public:
    virtual ~PatternMatcher() = default;

    virtual void findIndicesToOutput(const Pattern<P>& query, const PointSet<P>& point_set,
                                     const MatchSink& on_output) const = 0;

    std::vector<std::vector<size_t>> findIndices(const Pattern<P>& query,
                                                 const PointSet<P>& point_set) const {
        std::vector<std::vector<size_t>> matches;
        findIndicesToOutput(query, point_set, [&matches](std::vector<size_t> indices) {
            matches.push_back(std::move(indices));
        });
        return matches;
    }

    /// Matched points of every occurrence, as they appear in the point set.
    void findOccurrencesToOutput(const Pattern<P>& query, const PointSet<P>& point_set,
                                 const std::function<void(Pattern<P>)>& on_output) const {
        findIndicesToOutput(query, point_set, [&](std::vector<size_t> indices) {
            on_output(point_set.getPattern(indices));
        });
    }

    std::vector<Pattern<P>> findOccurrences(const Pattern<P>& query,
                                            const PointSet<P>& point_set) const {
        std::vector<Pattern<P>> occurrences;
        findOccurrencesToOutput(query, point_set, [&occurrences](Pattern<P> occurrence) {
            occurrences.push_back(std::move(occurrence));
        });
        return occurrences;
    }
};

} // namespace geopat
