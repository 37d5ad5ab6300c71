#include <gtest/gtest.h>
#include "point_set/point.hpp"
#include "point_set/point_set.hpp"

using namespace geopat;

namespace {

PointSet<Point2D> makeSet(std::vector<Point2D> points) {
    return PointSet<Point2D>(std::move(points));
}

bool strictlyAscending(const PointSet<Point2D>& s) {
    for (size_t i = 1; i < s.size(); i++) {
        if (!(s[i - 1] < s[i])) return false;
    }
    return true;
}

} // namespace

TEST(PointSetTest, SortsAndRemovesDuplicates) {
    auto s = makeSet({Point2D(3, 1), Point2D(1, 2), Point2D(1, 1), Point2D(3, 1), Point2D(2, 0)});
    ASSERT_EQ(s.size(), 4u);
    EXPECT_TRUE(strictlyAscending(s));
    EXPECT_EQ(s[0], Point2D(1, 1));
    EXPECT_EQ(s[3], Point2D(3, 1));
}

TEST(PointSetTest, EmptySet) {
    PointSet<Point2D> s;
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.begin(), s.end());
}

TEST(PointSetTest, GetPatternUsesGivenIndexOrder) {
    auto s = makeSet({Point2D(1, 1), Point2D(2, 1), Point2D(3, 1)});
    Pattern<Point2D> p = s.getPattern({2, 0});
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[0], Point2D(3, 1));
    EXPECT_EQ(p[1], Point2D(1, 1));
    EXPECT_THROW(s.getPattern({0, 3}), std::out_of_range);
}

TEST(PointSetTest, TranslateKeepsOrder) {
    auto s = makeSet({Point2D(1, 1), Point2D(1, 3), Point2D(2, 0)});
    auto moved = s.translate(Point2D(-1, 5));
    EXPECT_TRUE(strictlyAscending(moved));
    EXPECT_EQ(moved[0], Point2D(0, 6));
    EXPECT_EQ(moved[2], Point2D(1, 5));
}

TEST(PointSetTest, IntersectIsCommutative) {
    auto a = makeSet({Point2D(0, 0), Point2D(1, 0), Point2D(2, 5), Point2D(4, 1)});
    auto b = makeSet({Point2D(1, 0), Point2D(2, 5), Point2D(3, 3)});
    auto ab = a.intersect(b);
    EXPECT_EQ(ab, b.intersect(a));
    ASSERT_EQ(ab.size(), 2u);
    EXPECT_EQ(ab[0], Point2D(1, 0));
    EXPECT_EQ(ab[1], Point2D(2, 5));
}

TEST(PointSetTest, Difference) {
    auto a = makeSet({Point2D(0, 0), Point2D(1, 0), Point2D(2, 5), Point2D(4, 1)});
    auto b = makeSet({Point2D(1, 0), Point2D(4, 1), Point2D(9, 9)});
    EXPECT_TRUE(a.difference(a).empty());

    auto d = a.difference(b);
    ASSERT_EQ(d.size(), 2u);
    for (const auto& p : d) {
        EXPECT_FALSE(b.contains(p));
    }
    EXPECT_TRUE(strictlyAscending(d));
}

TEST(PointSetTest, Union) {
    auto a = makeSet({Point2D(0, 0), Point2D(2, 0)});
    auto b = makeSet({Point2D(1, 0), Point2D(2, 0), Point2D(3, 0)});
    auto u = a.unionWith(b);
    EXPECT_EQ(u, makeSet({Point2D(0, 0), Point2D(1, 0), Point2D(2, 0), Point2D(3, 0)}));
    EXPECT_EQ(u, b.unionWith(a));
}

TEST(PointSetTest, FindIndex) {
    auto s = makeSet({Point2D(1, 1), Point2D(2, 1), Point2D(4, 1)});
    IndexLookup hit = s.findIndex(Point2D(2, 1));
    EXPECT_TRUE(hit.found);
    EXPECT_EQ(hit.index, 1u);

    IndexLookup miss = s.findIndex(Point2D(3, 0));
    EXPECT_FALSE(miss.found);
    EXPECT_EQ(miss.index, 2u);

    EXPECT_FALSE(s.findIndex(Point2D(9, 9)).found);
    EXPECT_EQ(s.findIndex(Point2D(9, 9)).index, 3u);
}
