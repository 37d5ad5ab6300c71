#pragma once

#include "point_set/point.hpp"
#include "point_set/tec.hpp"

#include <algorithm>
#include <limits>

namespace geopat {

// ─── TecStats ──────────────────────────────────────────────────
// Quality measures of a TEC used by the covering algorithms
// [Meredith 2013]:
//   comp_ratio   |covered set| / (|pattern| + |translators|)
//   compactness  best over occurrences of |pattern| / points of the point
//                set inside the occurrence's bounding box
//   width, area  of the pattern's bounding box (components 0 and 1)

template <typename P>
struct TecStats {
    Tec<P> tec;
    double comp_ratio = 0.0;
    double compactness = 0.0;
    PointSet<P> covered_set;
    double pattern_width = 0.0;
    double pattern_area = 0.0;

    /// True at the first criterion where this beats `other`: higher
    /// comp_ratio, compactness, covered size, pattern size, then smaller
    /// width and area. Not transitive; meant for replacing a running best.
    bool isBetterThan(const TecStats& other) const {
        if (comp_ratio > other.comp_ratio) return true;
        if (compactness > other.compactness) return true;
        if (covered_set.size() > other.covered_set.size()) return true;
        if (tec.pattern.size() > other.tec.pattern.size()) return true;
        if (pattern_width < other.pattern_width) return true;
        if (pattern_area < other.pattern_area) return true;
        return false;
    }
};

namespace detail {

struct BoundingBox {
    double lower_x = std::numeric_limits<double>::max();
    double lower_y = std::numeric_limits<double>::max();
    double upper_x = std::numeric_limits<double>::lowest();
    double upper_y = std::numeric_limits<double>::lowest();

    bool empty() const { return lower_x > upper_x; }
    double width() const { return empty() ? 0.0 : upper_x - lower_x; }
    double height() const { return empty() ? 0.0 : upper_y - lower_y; }

    template <typename P>
    bool contains(const P& p) const {
        const double x = requireComponent(p, 0, "bounding box");
        const double y = requireComponent(p, 1, "bounding box");
        return x >= lower_x && x <= upper_x && y >= lower_y && y <= upper_y;
    }
};

template <typename P>
BoundingBox boundingBox(const Pattern<P>& pattern) {
    BoundingBox bb;
    for (const auto& p : pattern) {
        const double x = requireComponent(p, 0, "bounding box");
        const double y = requireComponent(p, 1, "bounding box");
        bb.lower_x = std::min(bb.lower_x, x);
        bb.upper_x = std::max(bb.upper_x, x);
        bb.lower_y = std::min(bb.lower_y, y);
        bb.upper_y = std::max(bb.upper_y, y);
    }
    return bb;
}

template <typename P>
double compactnessOf(const Tec<P>& tec, const PointSet<P>& point_set) {
    double best = 0.0;
    const double pattern_size = static_cast<double>(tec.pattern.size());
    for (const auto& occurrence : tec.expand()) {
        const BoundingBox bb = boundingBox(occurrence);
        if (bb.empty()) continue;

        size_t contained = 0;
        for (const auto& p : point_set) {
            if (bb.contains(p)) contained++;
        }
        if (contained == 0) continue;
        best = std::max(best, pattern_size / static_cast<double>(contained));
    }
    return best;
}

} // namespace detail

/// Stats of `tec` measured against `point_set`. Throws
/// std::invalid_argument for points without two components.
template <typename P>
TecStats<P> statsOf(Tec<P> tec, const PointSet<P>& point_set) {
    TecStats<P> stats;
    stats.covered_set = tec.coveredSet();

    // No zero translator is stored, so the denominator has no -1.
    const size_t repr_size = tec.pattern.size() + tec.translators.size();
    stats.comp_ratio = repr_size == 0
        ? 0.0
        : static_cast<double>(stats.covered_set.size()) / static_cast<double>(repr_size);

    const detail::BoundingBox bb = detail::boundingBox(tec.pattern);
    stats.compactness = detail::compactnessOf(tec, point_set);
    stats.pattern_width = bb.width();
    stats.pattern_area = bb.width() * bb.height();
    stats.tec = std::move(tec);
    return stats;
}

} // namespace geopat
