#include <gtest/gtest.h>
#include "discovery/cosiatec.hpp"
#include "discovery/siatec.hpp"
#include "discovery/siatec_c.hpp"
#include "discovery/siatec_compress.hpp"
#include "point_set/point.hpp"

#include <memory>

using namespace geopat;

namespace {

PointSet<Point2D> line4() {
    return PointSet<Point2D>({Point2D(0, 0), Point2D(1, 0), Point2D(2, 0), Point2D(3, 0)});
}

PointSet<Point2D> twoMotifs() {
    return PointSet<Point2D>({
        Point2D(0, 60), Point2D(1, 62), Point2D(2, 64),
        Point2D(4, 60), Point2D(5, 62), Point2D(6, 64),
        Point2D(8, 67), Point2D(8.5, 55), Point2D(9, 67), Point2D(9.5, 55),
        Point2D(11, 70),
    });
}

std::unique_ptr<TecAlgorithm<Point2D>> siatec() {
    return std::make_unique<Siatec<Point2D>>(true);
}

PointSet<Point2D> unionOfCovers(const std::vector<Tec<Point2D>>& tecs) {
    PointSet<Point2D> all;
    for (const auto& tec : tecs) all = all.unionWith(tec.coveredSet());
    return all;
}

} // namespace

// ─── COSIATEC ──────────────────────────────────────────────────

TEST(CosiatecTest, EvenlySpacedPoints) {
    Cosiatec<Point2D> cosiatec(siatec());
    auto tecs = cosiatec.computeTecs(line4());

    ASSERT_EQ(tecs.size(), 1u);
    EXPECT_EQ(tecs[0].pattern, (Pattern<Point2D>{Point2D(0, 0), Point2D(1, 0)}));
    EXPECT_EQ(tecs[0].translators, (std::vector<Point2D>{Point2D(2, 0)}));
}

TEST(CosiatecTest, CoversEveryPointOnce) {
    PointSet<Point2D> s = twoMotifs();
    auto tecs = Cosiatec<Point2D>(siatec()).computeTecs(s);

    ASSERT_FALSE(tecs.empty());
    EXPECT_EQ(unionOfCovers(tecs), s);

    size_t total = 0;
    for (const auto& tec : tecs) total += tec.coveredSet().size();
    EXPECT_EQ(total, s.size());
}

TEST(CosiatecTest, WorksOverSiatecC) {
    PointSet<Point2D> s = twoMotifs();
    auto tecs = Cosiatec<Point2D>(std::make_unique<SiatecC<Point2D>>(4.0)).computeTecs(s);
    EXPECT_EQ(unionOfCovers(tecs), s);
}

TEST(CosiatecTest, SinglePointBecomesResidualTec) {
    PointSet<Point2D> s({Point2D(2, 5)});
    auto tecs = Cosiatec<Point2D>(siatec()).computeTecs(s);
    ASSERT_EQ(tecs.size(), 1u);
    EXPECT_EQ(tecs[0].pattern, (Pattern<Point2D>{Point2D(2, 5)}));
    EXPECT_TRUE(tecs[0].translators.empty());
}

TEST(CosiatecTest, EmptyPointSet) {
    EXPECT_TRUE(Cosiatec<Point2D>(siatec()).computeTecs(PointSet<Point2D>()).empty());
}

TEST(CosiatecTest, RequiresAlgorithm) {
    EXPECT_THROW(Cosiatec<Point2D>(nullptr), std::invalid_argument);
    EXPECT_EQ(Cosiatec<Point2D>(siatec()).name(), "COSIATEC(SIATEC)");
}

// ─── SIATECCompress ────────────────────────────────────────────

TEST(SiatecCompressTest, EvenlySpacedPoints) {
    SiatecCompress<Point2D> compress(siatec());
    auto tecs = compress.computeTecs(line4());

    ASSERT_EQ(tecs.size(), 1u);
    EXPECT_EQ(tecs[0].pattern, (Pattern<Point2D>{Point2D(0, 0), Point2D(1, 0)}));
    EXPECT_EQ(tecs[0].translators, (std::vector<Point2D>{Point2D(2, 0)}));
}

TEST(SiatecCompressTest, CoversWholePointSet) {
    PointSet<Point2D> s = twoMotifs();
    auto tecs = SiatecCompress<Point2D>(siatec()).computeTecs(s);
    EXPECT_EQ(unionOfCovers(tecs), s);
}

TEST(SiatecCompressTest, IncompressibleInputIsOneResidualTec) {
    PointSet<Point2D> s({Point2D(0, 0), Point2D(1, 5), Point2D(3, 2)});
    auto tecs = SiatecCompress<Point2D>(siatec()).computeTecs(s);

    ASSERT_EQ(tecs.size(), 1u);
    EXPECT_EQ(tecs[0], residualTec(s));
    EXPECT_EQ(tecs[0].pattern, (Pattern<Point2D>{Point2D(0, 0)}));
    EXPECT_EQ(tecs[0].translators, (std::vector<Point2D>{Point2D(1, 5), Point2D(3, 2)}));
}

TEST(SiatecCompressTest, RankPutsHighestCompressionFirst) {
    std::vector<TecStats<Point2D>> stats(3);
    stats[0].comp_ratio = 1.0;
    stats[1].comp_ratio = 3.0;
    stats[2].comp_ratio = 2.0;
    SiatecCompress<Point2D>::rank(stats);

    EXPECT_DOUBLE_EQ(stats[0].comp_ratio, 3.0);
    EXPECT_DOUBLE_EQ(stats[1].comp_ratio, 2.0);
    EXPECT_DOUBLE_EQ(stats[2].comp_ratio, 1.0);
}

TEST(SiatecCompressTest, RankToleratesCycles) {
    std::vector<TecStats<Point2D>> stats(6);
    for (size_t i = 0; i < stats.size(); i++) {
        stats[i].comp_ratio = static_cast<double>(i % 3);
        stats[i].compactness = static_cast<double>((i + 1) % 3);
    }
    SiatecCompress<Point2D>::rank(stats);
    EXPECT_EQ(stats.size(), 6u);
}

TEST(SiatecCompressTest, EmptyPointSet) {
    EXPECT_TRUE(SiatecCompress<Point2D>(siatec()).computeTecs(PointSet<Point2D>()).empty());
}
