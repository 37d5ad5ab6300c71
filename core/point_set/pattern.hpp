#pragma once

#include <algorithm>
#include <initializer_list>
#include <ostream>
#include <vector>

namespace geopat {

// ─── Pattern ───────────────────────────────────────────────────
// An ordered, owned sequence of points. Patterns are NOT sorted: the
// order is chosen by whoever builds the pattern and algorithms rely on it
// (e.g. source-index order of an MTP). Two patterns are translationally
// equivalent iff their vectorized forms are equal.

template <typename P>
class Pattern {
public:
    using value_type = P;
    using const_iterator = typename std::vector<P>::const_iterator;

    Pattern() = default;

    /// Copies the given points in the given order.
    explicit Pattern(std::vector<P> points) : points_(std::move(points)) {}
    Pattern(std::initializer_list<P> points) : points_(points) {}

    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    const P& operator[](size_t i) const { return points_[i]; }
    const P& front() const { return points_.front(); }
    const P& back() const { return points_.back(); }

    const_iterator begin() const { return points_.begin(); }
    const_iterator end() const { return points_.end(); }

    const std::vector<P>& points() const { return points_; }

    /// Consecutive forward differences: p[1]-p[0], p[2]-p[1], ...
    /// A pattern of fewer than two points vectorizes to an empty pattern.
    Pattern vectorize() const {
        std::vector<P> diffs;
        if (points_.size() < 2) return Pattern(std::move(diffs));
        diffs.reserve(points_.size() - 1);
        for (size_t i = 0; i + 1 < points_.size(); i++) {
            diffs.push_back(points_[i + 1] - points_[i]);
        }
        return Pattern(std::move(diffs));
    }

    /// Returns a copy of this pattern with every point shifted by `translator`.
    Pattern translate(const P& translator) const {
        std::vector<P> translated;
        translated.reserve(points_.size());
        for (const auto& p : points_) {
            translated.push_back(p + translator);
        }
        return Pattern(std::move(translated));
    }

    bool operator==(const Pattern& other) const { return points_ == other.points_; }
    bool operator!=(const Pattern& other) const { return !(*this == other); }

    /// Lexicographic over the point sequence; on an equal shared prefix the
    /// shorter pattern is smaller.
    bool operator<(const Pattern& other) const {
        return std::lexicographical_compare(points_.begin(), points_.end(),
                                            other.points_.begin(), other.points_.end());
    }
    bool operator>(const Pattern& other) const { return other < *this; }

private:
    std::vector<P> points_;
};

template <typename P>
std::ostream& operator<<(std::ostream& os, const Pattern<P>& pattern) {
    os << "[";
    for (size_t i = 0; i < pattern.size(); i++) {
        if (i > 0) os << ", ";
        os << pattern[i];
    }
    return os << "]";
}

} // namespace geopat
