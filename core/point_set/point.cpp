#include "point_set/point.hpp"
#include <cmath>

namespace geopat {

std::optional<double> Point2D::component(size_t index) const {
    if (index == 0) return x;
    if (index == 1) return y;
    return std::nullopt;
}

RoundedPoint2D::RoundedPoint2D(double raw_x, double y)
    : rounded_x_(round(raw_x)), y_(y), raw_x_(raw_x) {}

double RoundedPoint2D::round(double value) {
    return std::round(value * PRECISION) / PRECISION;
}

std::optional<double> RoundedPoint2D::component(size_t index) const {
    if (index == 0) return rounded_x_;
    if (index == 1) return y_;
    return std::nullopt;
}

std::optional<double> IntPoint2D::component(size_t index) const {
    if (index == 0) return static_cast<double>(x);
    if (index == 1) return static_cast<double>(y);
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Point2D& p) {
    return os << "(" << p.x << ", " << p.y << ")";
}

std::ostream& operator<<(std::ostream& os, const RoundedPoint2D& p) {
    return os << "(" << p.roundedX() << ", " << p.y() << ")";
}

std::ostream& operator<<(std::ostream& os, const IntPoint2D& p) {
    return os << "(" << p.x << ", " << p.y << ")";
}

} // namespace geopat
