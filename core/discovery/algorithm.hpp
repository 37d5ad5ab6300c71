#pragma once

#include "point_set/point_set.hpp"
#include "point_set/tec.hpp"

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

namespace geopat {

/// Synchronous single-item sinks. Called inline on the discovery call
/// stack, possibly millions of times; a sink must not re-enter the
/// algorithm that calls it.
template <typename P>
using MtpSink = std::function<void(Mtp<P>)>;

template <typename P>
using TecSink = std::function<void(Tec<P>)>;

// ─── MtpAlgorithm ──────────────────────────────────────────────
// Computes maximal translatable patterns of a point set. Whether all MTPs
// are produced depends on the algorithm.

template <typename P>
class MtpAlgorithm {
public:
    virtual ~MtpAlgorithm() = default;

    virtual std::string name() const = 0;

    /// Streams every MTP to `on_output` without accumulating them.
    virtual void computeMtpsToOutput(const PointSet<P>& point_set,
                                     const MtpSink<P>& on_output) const = 0;

    std::vector<Mtp<P>> computeMtps(const PointSet<P>& point_set) const {
        std::vector<Mtp<P>> mtps;
        computeMtpsToOutput(point_set, [&mtps](Mtp<P> mtp) { mtps.push_back(std::move(mtp)); });
        return mtps;
    }
};

// ─── TecAlgorithm ──────────────────────────────────────────────
// Computes translational equivalence classes of a point set.

template <typename P>
class TecAlgorithm {
public:
    virtual ~TecAlgorithm() = default;

    virtual std::string name() const = 0;

    virtual void computeTecsToOutput(const PointSet<P>& point_set,
                                     const TecSink<P>& on_output) const = 0;

    virtual std::vector<Tec<P>> computeTecs(const PointSet<P>& point_set) const {
        std::vector<Tec<P>> tecs;
        computeTecsToOutput(point_set, [&tecs](Tec<P> tec) { tecs.push_back(std::move(tec)); });
        return tecs;
    }
};

// ─── Difference utilities ──────────────────────────────────────
// Shared by the SIA family: a difference vector tagged with the index of
// the point it was computed from.

template <typename P>
struct IndexedDiff {
    P diff;
    size_t source = 0;
};

/// Ascending by difference vector, ties broken by source index.
template <typename P>
void sortIndexedDiffs(std::vector<IndexedDiff<P>>& diffs) {
    std::sort(diffs.begin(), diffs.end(), [](const IndexedDiff<P>& a, const IndexedDiff<P>& b) {
        if (a.diff < b.diff) return true;
        if (b.diff < a.diff) return false;
        return a.source < b.source;
    });
}

/// Walks sorted differences and calls `on_group(diff, source_indices)` once
/// per maximal run of equal difference vectors.
template <typename P, typename F>
void forEachDiffGroup(const std::vector<IndexedDiff<P>>& sorted_diffs, F&& on_group) {
    const size_t m = sorted_diffs.size();
    size_t i = 0;
    while (i < m) {
        const P& translator = sorted_diffs[i].diff;
        std::vector<size_t> indices;
        size_t j = i;
        while (j < m && sorted_diffs[j].diff == translator) {
            indices.push_back(sorted_diffs[j].source);
            j++;
        }
        on_group(translator, std::move(indices));
        i = j;
    }
}

} // namespace geopat
