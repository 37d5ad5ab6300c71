#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace geopat {

// ─── Point capability set ──────────────────────────────────────
// Every container and algorithm in geopat is a template over a point
// type P that provides:
//
//   P operator+(const P&) const, P operator-(const P&) const,
//   P operator*(double) const
//   ==, !=, <, >, <=, >=      (total lexicographic order)
//   bool isZero() const
//   std::optional<double> component(size_t index) const
//   size_t dimensionality() const
//   std::hash<P>              (consistent with ==)
//
// Three concrete types ship with the library.

inline size_t hashCombine(size_t seed, size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

/// Returns component `index` of `p`, or throws std::invalid_argument if the
/// point does not have it. Used where a missing component is a precondition
/// violation rather than a recoverable condition.
template <typename P>
double requireComponent(const P& p, size_t index, const char* what) {
    std::optional<double> value = p.component(index);
    if (!value) {
        throw std::invalid_argument(std::string(what) + ": point has no component " +
                                    std::to_string(index));
    }
    return *value;
}

// ─── Point2D ───────────────────────────────────────────────────
// Exact double coordinates. No tolerance is applied in comparisons, so
// onsets that are not exactly representable (triplets) may not match.

struct Point2D {
    double x = 0.0;
    double y = 0.0;

    Point2D() = default;
    Point2D(double x, double y) : x(x), y(y) {}

    Point2D operator+(const Point2D& o) const { return {x + o.x, y + o.y}; }
    Point2D operator-(const Point2D& o) const { return {x - o.x, y - o.y}; }
    Point2D operator*(double s) const { return {x * s, y * s}; }

    bool operator==(const Point2D& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point2D& o) const { return !(*this == o); }
    bool operator<(const Point2D& o) const {
        if (x != o.x) return x < o.x;
        return y < o.y;
    }
    bool operator>(const Point2D& o) const { return o < *this; }
    bool operator<=(const Point2D& o) const { return !(o < *this); }
    bool operator>=(const Point2D& o) const { return !(*this < o); }

    bool isZero() const { return x == 0.0 && y == 0.0; }
    std::optional<double> component(size_t index) const;
    size_t dimensionality() const { return 2; }
};

// ─── RoundedPoint2D ────────────────────────────────────────────
// Double coordinates where the first (onset) component is rounded to
// PRECISION for comparison and hashing. The raw onset is kept and used in
// arithmetic so rounding errors do not accumulate over sums of differences.

class RoundedPoint2D {
public:
    static constexpr double PRECISION = 100000.0;

    RoundedPoint2D() = default;
    RoundedPoint2D(double raw_x, double y);

    double roundedX() const { return rounded_x_; }
    double rawX() const { return raw_x_; }
    double y() const { return y_; }

    RoundedPoint2D operator+(const RoundedPoint2D& o) const {
        return RoundedPoint2D(raw_x_ + o.raw_x_, y_ + o.y_);
    }
    RoundedPoint2D operator-(const RoundedPoint2D& o) const {
        return RoundedPoint2D(raw_x_ - o.raw_x_, y_ - o.y_);
    }
    RoundedPoint2D operator*(double s) const {
        return RoundedPoint2D(raw_x_ * s, y_ * s);
    }

    bool operator==(const RoundedPoint2D& o) const {
        return rounded_x_ == o.rounded_x_ && y_ == o.y_;
    }
    bool operator!=(const RoundedPoint2D& o) const { return !(*this == o); }
    bool operator<(const RoundedPoint2D& o) const {
        if (rounded_x_ != o.rounded_x_) return rounded_x_ < o.rounded_x_;
        return y_ < o.y_;
    }
    bool operator>(const RoundedPoint2D& o) const { return o < *this; }
    bool operator<=(const RoundedPoint2D& o) const { return !(o < *this); }
    bool operator>=(const RoundedPoint2D& o) const { return !(*this < o); }

    bool isZero() const { return rounded_x_ == 0.0 && y_ == 0.0; }
    std::optional<double> component(size_t index) const;
    size_t dimensionality() const { return 2; }

    static double round(double value);

private:
    double rounded_x_ = 0.0;
    double y_ = 0.0;
    double raw_x_ = 0.0;
};

// ─── IntPoint2D ────────────────────────────────────────────────
// Integer coordinates (e.g. onsets in ticks, MIDI pitch numbers).
// Scalar multiplication truncates the factor to an integer first.

struct IntPoint2D {
    int64_t x = 0;
    int64_t y = 0;

    IntPoint2D() = default;
    IntPoint2D(int64_t x, int64_t y) : x(x), y(y) {}

    IntPoint2D operator+(const IntPoint2D& o) const { return {x + o.x, y + o.y}; }
    IntPoint2D operator-(const IntPoint2D& o) const { return {x - o.x, y - o.y}; }
    IntPoint2D operator*(double s) const {
        auto factor = static_cast<int64_t>(s);
        return {x * factor, y * factor};
    }

    bool operator==(const IntPoint2D& o) const { return x == o.x && y == o.y; }
    bool operator!=(const IntPoint2D& o) const { return !(*this == o); }
    bool operator<(const IntPoint2D& o) const {
        if (x != o.x) return x < o.x;
        return y < o.y;
    }
    bool operator>(const IntPoint2D& o) const { return o < *this; }
    bool operator<=(const IntPoint2D& o) const { return !(o < *this); }
    bool operator>=(const IntPoint2D& o) const { return !(*this < o); }

    bool isZero() const { return x == 0 && y == 0; }
    std::optional<double> component(size_t index) const;
    size_t dimensionality() const { return 2; }
};

std::ostream& operator<<(std::ostream& os, const Point2D& p);
std::ostream& operator<<(std::ostream& os, const RoundedPoint2D& p);
std::ostream& operator<<(std::ostream& os, const IntPoint2D& p);

} // namespace geopat

namespace std {

template <>
struct hash<geopat::Point2D> {
    size_t operator()(const geopat::Point2D& p) const noexcept {
        return geopat::hashCombine(std::hash<double>{}(p.x), std::hash<double>{}(p.y));
    }
};

template <>
struct hash<geopat::RoundedPoint2D> {
    size_t operator()(const geopat::RoundedPoint2D& p) const noexcept {
        return geopat::hashCombine(std::hash<double>{}(p.roundedX()),
                                   std::hash<double>{}(p.y()));
    }
};

template <>
struct hash<geopat::IntPoint2D> {
    size_t operator()(const geopat::IntPoint2D& p) const noexcept {
        return geopat::hashCombine(std::hash<int64_t>{}(p.x), std::hash<int64_t>{}(p.y));
    }
};

} // namespace std
