#pragma once

#include "point_set/point.hpp"
#include "point_set/point_set.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace geopat {

/// A forward difference p[target] - p[source], source < target.
struct IndexPair {
    size_t source = 0;
    size_t target = 0;
};

enum class DiffIndexBackend {
    Sorted,   // binary search over a sorted vector
    Hashed    // hash map keyed by the difference vector
};

// ─── DiffIndex ─────────────────────────────────────────────────
// Answers "which index pairs have forward difference exactly v?" for all
// forward differences whose onset delta (component 0) is at most max_ioi.
// The pair list of a difference is ascending by source, and therefore
// also by target.
//
// A miss is an internal inconsistency of the caller: every lookup made by
// SIATEC-C/CH is for a difference between two points of the set that are
// at most max_ioi apart. find() throws std::logic_error on a miss.

template <typename P>
class DiffIndex {
public:
    virtual ~DiffIndex() = default;

    virtual const std::vector<IndexPair>& find(const P& diff) const = 0;

    /// Number of distinct difference vectors.
    virtual size_t size() const = 0;

protected:
    [[noreturn]] static void missing(const P& diff) {
        std::ostringstream oss;
        oss << "Difference index has no entry for " << diff;
        logger()->error(oss.str());
        throw std::logic_error(oss.str());
    }

    /// Calls on_pair(diff, pair) for every forward difference with onset
    /// delta <= max_ioi, in ascending (source, target) order.
    ///
    /// The onset of a difference need not grow with the target index (a
    /// RoundedPoint2D difference is rounded from the raw onsets, which are
    /// not sorted inside one rounding step), so a target past max_ioi is
    /// skipped and the scan only stops once the sorted onsets themselves are
    /// further apart than max_ioi plus the rounding slack.
    template <typename F>
    static void forEachBoundedDiff(const PointSet<P>& point_set, double max_ioi, F&& on_pair) {
        const size_t n = point_set.size();
        const double scan_limit = max_ioi + ONSET_SLACK;
        for (size_t i = 0; i + 1 < n; i++) {
            const P& from = point_set[i];
            const double from_onset = requireComponent(from, 0, "difference index");
            for (size_t j = i + 1; j < n; j++) {
                if (requireComponent(point_set[j], 0, "difference index") - from_onset > scan_limit) break;
                P diff = point_set[j] - from;
                if (requireComponent(diff, 0, "difference index") > max_ioi) continue;
                on_pair(diff, IndexPair{i, j});
            }
        }
    }

    static constexpr double ONSET_SLACK = 2.0 / RoundedPoint2D::PRECISION;
};

// ─── SortedDiffIndex ───────────────────────────────────────────

template <typename P>
class SortedDiffIndex : public DiffIndex<P> {
public:
    SortedDiffIndex(const PointSet<P>& point_set, double max_ioi) {
        std::vector<std::pair<P, IndexPair>> diffs;
        DiffIndex<P>::forEachBoundedDiff(point_set, max_ioi, [&](const P& diff, IndexPair pair) {
            diffs.emplace_back(diff, pair);
        });

        std::sort(diffs.begin(), diffs.end(), [](const auto& a, const auto& b) {
            if (a.first < b.first) return true;
            if (b.first < a.first) return false;
            return a.second.source < b.second.source;
        });

        for (const auto& entry : diffs) {
            if (entries_.empty() || entries_.back().first != entry.first) {
                entries_.emplace_back(entry.first, std::vector<IndexPair>());
            }
            entries_.back().second.push_back(entry.second);
        }
    }

    const std::vector<IndexPair>& find(const P& diff) const override {
        auto it = std::lower_bound(entries_.begin(), entries_.end(), diff,
                                   [](const auto& entry, const P& d) { return entry.first < d; });
        if (it == entries_.end() || it->first != diff) DiffIndex<P>::missing(diff);
        return it->second;
    }

    size_t size() const override { return entries_.size(); }

private:
    std::vector<std::pair<P, std::vector<IndexPair>>> entries_;
};

// ─── HashedDiffIndex ───────────────────────────────────────────

template <typename P>
class HashedDiffIndex : public DiffIndex<P> {
public:
    HashedDiffIndex(const PointSet<P>& point_set, double max_ioi) {
        DiffIndex<P>::forEachBoundedDiff(point_set, max_ioi, [&](const P& diff, IndexPair pair) {
            entries_[diff].push_back(pair);
        });
    }

    const std::vector<IndexPair>& find(const P& diff) const override {
        auto it = entries_.find(diff);
        if (it == entries_.end()) DiffIndex<P>::missing(diff);
        return it->second;
    }

    size_t size() const override { return entries_.size(); }

private:
    std::unordered_map<P, std::vector<IndexPair>> entries_;
};

template <typename P>
std::unique_ptr<DiffIndex<P>> makeDiffIndex(DiffIndexBackend backend,
                                            const PointSet<P>& point_set, double max_ioi) {
    if (backend == DiffIndexBackend::Hashed) {
        return std::make_unique<HashedDiffIndex<P>>(point_set, max_ioi);
    }
    return std::make_unique<SortedDiffIndex<P>>(point_set, max_ioi);
}

} // namespace geopat
