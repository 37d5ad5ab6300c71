#include <gtest/gtest.h>
#include "point_set/point.hpp"
#include "point_set/tec.hpp"

#include <sstream>

using namespace geopat;

namespace {

Pattern<Point2D> line(std::initializer_list<double> xs) {
    std::vector<Point2D> points;
    for (double x : xs) points.emplace_back(x, 0.0);
    return Pattern<Point2D>(std::move(points));
}

} // namespace

TEST(TecTest, ExpandStartsWithPattern) {
    Tec<Point2D> tec(line({0, 1}), {Point2D(2, 0), Point2D(5, 1)});
    auto occurrences = tec.expand();
    ASSERT_EQ(occurrences.size(), 3u);
    EXPECT_EQ(occurrences[0], tec.pattern);
    EXPECT_EQ(occurrences[1], line({2, 3}));
    EXPECT_EQ(occurrences[2][0], Point2D(5, 1));
}

TEST(TecTest, CoveredSet) {
    Tec<Point2D> tec(line({0, 1}), {Point2D(1, 0), Point2D(2, 0)});
    auto covered = tec.coveredSet();
    EXPECT_EQ(covered, PointSet<Point2D>(line({0, 1, 2, 3}).points()));
}

TEST(TecTest, ConjugateCoversSameSet) {
    Tec<Point2D> tec(Pattern<Point2D>{Point2D(1, 1), Point2D(2, 1)}, {Point2D(2, 0)});
    Tec<Point2D> conj = tec.conjugate();

    Pattern<Point2D> expected_pattern{Point2D(1, 1), Point2D(3, 1)};
    EXPECT_EQ(conj.pattern, expected_pattern);
    ASSERT_EQ(conj.translators.size(), 1u);
    EXPECT_EQ(conj.translators[0], Point2D(1, 0));
    EXPECT_EQ(conj.coveredSet(), tec.coveredSet());
}

TEST(TecTest, ConjugateOfEmptyPattern) {
    Tec<Point2D> empty;
    EXPECT_EQ(empty.conjugate(), empty);
}

TEST(TecTest, RemoveRedundantTranslators) {
    Tec<Point2D> tec(line({0, 1}), {Point2D(1, 0), Point2D(2, 0)});
    Tec<Point2D> pruned = tec.removeRedundantTranslators();
    ASSERT_EQ(pruned.translators.size(), 1u);
    EXPECT_EQ(pruned.translators[0], Point2D(2, 0));
    EXPECT_EQ(pruned.coveredSet(), tec.coveredSet());
}

TEST(TecTest, RemoveRedundantKeepsNeededTranslators) {
    Tec<Point2D> tec(line({0}), {Point2D(1, 0), Point2D(2, 0), Point2D(2, 0)});
    Tec<Point2D> pruned = tec.removeRedundantTranslators();
    EXPECT_EQ(pruned.translators, (std::vector<Point2D>{Point2D(1, 0), Point2D(2, 0)}));
}

TEST(TecTest, RemoveTranslationalDuplicates) {
    std::vector<Tec<Point2D>> tecs = {
        Tec<Point2D>(line({0, 1}), {Point2D(5, 0)}),
        Tec<Point2D>(line({3}), {}),
        Tec<Point2D>(line({2, 3}), {Point2D(1, 0)}),
    };
    removeTranslationalDuplicates(tecs);

    ASSERT_EQ(tecs.size(), 2u);
    EXPECT_EQ(tecs[0].pattern, line({3}));
    EXPECT_EQ(tecs[1].pattern, line({0, 1}));
    EXPECT_EQ(tecs[1].translators[0], Point2D(5, 0));
}

TEST(TecTest, MtpEqualityAndPrinting) {
    Mtp<Point2D> a{Point2D(1, 0), line({0, 1})};
    Mtp<Point2D> b{Point2D(1, 0), line({0, 1})};
    EXPECT_EQ(a, b);
    b.translator = Point2D(2, 0);
    EXPECT_NE(a, b);

    std::ostringstream oss;
    oss << a;
    EXPECT_EQ(oss.str(), "Mtp{translator=(1, 0), pattern=[(0, 0), (1, 0)]}");
}
