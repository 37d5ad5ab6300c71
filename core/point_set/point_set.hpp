#pragma once

#include "point_set/pattern.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace geopat {

/// Result of a binary search: `found` tells whether `index` is the exact
/// position of the point or the position where it would be inserted.
struct IndexLookup {
    bool found = false;
    size_t index = 0;
};

// ─── PointSet ──────────────────────────────────────────────────
// Sorted (ascending lexicographic), duplicate-free collection of points.
// Built once from arbitrary input; every derived set (translate, set
// algebra) keeps the invariant points[i] < points[i+1] without re-sorting.

template <typename P>
class PointSet {
public:
    using value_type = P;
    using const_iterator = typename std::vector<P>::const_iterator;

    PointSet() = default;

    /// Sorts the given points and removes duplicates.
    explicit PointSet(std::vector<P> points) : points_(std::move(points)) {
        std::sort(points_.begin(), points_.end());
        points_.erase(std::unique(points_.begin(), points_.end()), points_.end());
    }

    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    const P& operator[](size_t i) const { return points_[i]; }
    const_iterator begin() const { return points_.begin(); }
    const_iterator end() const { return points_.end(); }
    const std::vector<P>& points() const { return points_; }

    /// Pattern of the points at `indices`, in the order the indices are given.
    Pattern<P> getPattern(const std::vector<size_t>& indices) const {
        std::vector<P> selected;
        selected.reserve(indices.size());
        for (size_t i : indices) {
            if (i >= points_.size()) {
                throw std::out_of_range("Point index out of range: " + std::to_string(i));
            }
            selected.push_back(points_[i]);
        }
        return Pattern<P>(std::move(selected));
    }

    /// Adding the same vector to every point preserves lexicographic order.
    PointSet translate(const P& translator) const {
        std::vector<P> translated;
        translated.reserve(points_.size());
        for (const auto& p : points_) {
            translated.push_back(p + translator);
        }
        return fromSorted(std::move(translated));
    }

    PointSet intersect(const PointSet& other) const {
        std::vector<P> common;
        size_t i = 0, j = 0;
        while (i < size() && j < other.size()) {
            const P& a = points_[i];
            const P& b = other.points_[j];
            if (a == b) {
                common.push_back(a);
                i++;
                j++;
            } else if (a > b) {
                j++;
            } else {
                i++;
            }
        }
        return fromSorted(std::move(common));
    }

    PointSet unionWith(const PointSet& other) const {
        std::vector<P> merged;
        merged.reserve(size() + other.size());
        size_t i = 0, j = 0;
        while (i < size() && j < other.size()) {
            const P& a = points_[i];
            const P& b = other.points_[j];
            if (a == b) {
                merged.push_back(a);
                i++;
                j++;
            } else if (a < b) {
                merged.push_back(a);
                i++;
            } else {
                merged.push_back(b);
                j++;
            }
        }
        for (; i < size(); i++) merged.push_back(points_[i]);
        for (; j < other.size(); j++) merged.push_back(other.points_[j]);
        return fromSorted(std::move(merged));
    }

    /// All points of this set that are not in `other`.
    PointSet difference(const PointSet& other) const {
        std::vector<P> remaining;
        size_t i = 0, j = 0;
        while (i < size() && j < other.size()) {
            const P& a = points_[i];
            const P& b = other.points_[j];
            if (a == b) {
                i++;
                j++;
            } else if (a > b) {
                j++;
            } else {
                remaining.push_back(a);
                i++;
            }
        }
        for (; i < size(); i++) remaining.push_back(points_[i]);
        return fromSorted(std::move(remaining));
    }

    IndexLookup findIndex(const P& point) const {
        auto it = std::lower_bound(points_.begin(), points_.end(), point);
        IndexLookup lookup;
        lookup.index = static_cast<size_t>(it - points_.begin());
        lookup.found = it != points_.end() && *it == point;
        return lookup;
    }

    bool contains(const P& point) const { return findIndex(point).found; }

    bool operator==(const PointSet& other) const { return points_ == other.points_; }
    bool operator!=(const PointSet& other) const { return !(*this == other); }

private:
    // Caller guarantees `points` is strictly ascending.
    static PointSet fromSorted(std::vector<P> points) {
        PointSet set;
        set.points_ = std::move(points);
        return set;
    }

    std::vector<P> points_;
};

} // namespace geopat
