#pragma once

#include "discovery/algorithm.hpp"
#include "util/logging.hpp"

namespace geopat {

// ─── Sia ───────────────────────────────────────────────────────
// Exhaustive MTP discovery [Meredith et al. 2002].
//
// 1. Compute all forward differences p_j - p_i (i < j), tagged with i.
// 2. Sort by difference, then by source index.
// 3. Each maximal run of equal differences is one MTP: the difference is
//    its translator, the run's source indices (ascending) its pattern.
//
// O(n^2 log n) time, O(n^2) memory for the differences.

template <typename P>
class Sia : public MtpAlgorithm<P> {
public:
    std::string name() const override { return "SIA"; }

    void computeMtpsToOutput(const PointSet<P>& point_set,
                             const MtpSink<P>& on_output) const override {
        const size_t n = point_set.size();
        if (n < 2) return;

        std::vector<IndexedDiff<P>> diffs;
        diffs.reserve(n * (n - 1) / 2);
        for (size_t i = 0; i + 1 < n; i++) {
            const P& from = point_set[i];
            for (size_t j = i + 1; j < n; j++) {
                diffs.push_back({point_set[j] - from, i});
            }
        }
        sortIndexedDiffs(diffs);
        logger()->debug("SIA: {} points, {} forward differences", n, diffs.size());

        forEachDiffGroup(diffs, [&](const P& translator, std::vector<size_t> indices) {
            on_output(Mtp<P>{translator, point_set.getPattern(indices)});
        });
    }
};

} // namespace geopat
