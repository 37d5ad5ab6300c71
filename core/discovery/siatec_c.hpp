#pragma once

#include "discovery/algorithm.hpp"
#include "discovery/diff_index.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace geopat {

// ─── SiatecC ───────────────────────────────────────────────────
// TEC discovery restricted by a maximum inter-onset interval [Collins
// 2011, sec. 4]. Only points whose onsets (component 0) lie at most
// max_ioi apart are compared directly.
//
// Per source point i a target pointer and an onset bound
// (onset(i) + max_ioi, advanced by max_ioi each time the pointer passes
// it) define a sliding window. Every outer iteration partitions the
// differences of all open windows into MTP candidates as SIA does, splits
// each candidate where two consecutive points are more than max_ioi apart,
// and resolves the translators of each piece by chaining its vectorized
// steps through a difference index.
//
// Raw output repeats translationally equivalent patterns; apply
// removeTranslationalDuplicates() if they are unwanted.

template <typename P>
class SiatecC : public TecAlgorithm<P> {
public:
    explicit SiatecC(double max_ioi, DiffIndexBackend backend = DiffIndexBackend::Sorted)
        : SiatecC(max_ioi, backend, false) {}

    std::string name() const override { return "SIATEC-C"; }
    double maxIoi() const { return max_ioi_; }
    DiffIndexBackend backend() const { return backend_; }

    void computeTecsToOutput(const PointSet<P>& point_set,
                             const TecSink<P>& on_output) const override {
        const size_t n = point_set.size();
        if (n < 2) return;

        std::unique_ptr<DiffIndex<P>> index = makeDiffIndex(backend_, point_set, max_ioi_);
        logger()->debug("{}: {} points, {} indexed differences (max_ioi={})",
                        name(), n, index->size(), max_ioi_);

        std::vector<size_t> cover;
        if (track_cover_) cover.assign(n, 0);

        std::vector<size_t> window_start(n);
        std::vector<double> window_bound(n);
        for (size_t i = 0; i < n; i++) {
            window_start[i] = i;
            window_bound[i] = onset(point_set[i]) + max_ioi_;
        }
        window_start[n - 1] = n;

        size_t emitted = 0;
        std::vector<WindowDiff> diffs;
        while (std::any_of(window_start.begin(), window_start.end(),
                           [n](size_t s) { return s < n; })) {
            nextWindowDiffs(point_set, window_start, window_bound, diffs);
            std::sort(diffs.begin(), diffs.end(), [](const WindowDiff& a, const WindowDiff& b) {
                if (a.diff < b.diff) return true;
                if (b.diff < a.diff) return false;
                return a.source < b.source;
            });

            size_t i = 0;
            while (i < diffs.size()) {
                size_t j = i;
                while (j < diffs.size() && diffs[j].diff == diffs[i].diff) j++;

                for (const Piece& piece : splitOnGaps(point_set, diffs, i, j)) {
                    if (piece.sources.size() < 2) continue;
                    if (track_cover_ && !improvesCover(cover, piece)) continue;

                    Pattern<P> pattern = point_set.getPattern(piece.sources);
                    Pattern<P> vectorized = pattern.vectorize();
                    std::vector<size_t> targets = chainForward(*index, vectorized);

                    std::vector<P> translators;
                    for (size_t t : targets) {
                        P translator = point_set[t] - pattern.back();
                        if (!translator.isZero()) translators.push_back(translator);
                    }

                    if (track_cover_) {
                        raiseCover(cover, *index, vectorized, std::move(targets), pattern.size());
                    }

                    on_output(Tec<P>(std::move(pattern), std::move(translators)));
                    emitted++;
                }
                i = j;
            }
        }

        logger()->debug("{}: emitted {} TECs", name(), emitted);
    }

    /// Observer invoked with the cover array after every update. Only
    /// called by variants that track cover.
    void setCoverListener(std::function<void(const std::vector<size_t>&)> listener) {
        cover_listener_ = std::move(listener);
    }

protected:
    SiatecC(double max_ioi, DiffIndexBackend backend, bool track_cover)
        : max_ioi_(max_ioi), backend_(backend), track_cover_(track_cover) {
        if (!std::isfinite(max_ioi_) || max_ioi_ <= 0.0) {
            throw std::invalid_argument("max_ioi must be a positive finite number, got " +
                                        std::to_string(max_ioi_));
        }
    }

private:
    struct WindowDiff {
        P diff;
        size_t source;
        size_t target;
    };

    struct Piece {
        std::vector<size_t> sources;
        std::vector<size_t> targets;
    };

    static double onset(const P& p) { return requireComponent(p, 0, "SIATEC-C onset"); }

    /// Advances every open window by one step and collects its differences.
    void nextWindowDiffs(const PointSet<P>& point_set,
                         std::vector<size_t>& window_start,
                         std::vector<double>& window_bound,
                         std::vector<WindowDiff>& diffs) const {
        const size_t n = point_set.size();
        diffs.clear();
        for (size_t i = 0; i + 1 < n; i++) {
            if (window_start[i] >= n) continue;

            bool exhausted = true;
            for (size_t j = window_start[i]; j < n; j++) {
                if (i == j) continue;
                if (onset(point_set[j]) > window_bound[i]) {
                    window_start[i] = j;
                    window_bound[i] += max_ioi_;
                    exhausted = false;
                    break;
                }
                diffs.push_back({point_set[j] - point_set[i], i, j});
            }
            if (exhausted) window_start[i] = n;
        }
    }

    /// Splits the group diffs[begin, end) wherever two consecutive source
    /// points are more than max_ioi apart.
    std::vector<Piece> splitOnGaps(const PointSet<P>& point_set,
                                   const std::vector<WindowDiff>& diffs,
                                   size_t begin, size_t end) const {
        std::vector<Piece> pieces;
        pieces.emplace_back();
        for (size_t k = begin; k < end; k++) {
            Piece& current = pieces.back();
            if (!current.sources.empty()) {
                const P& prev = point_set[current.sources.back()];
                P step = point_set[diffs[k].source] - prev;
                if (requireComponent(step, 0, "SIATEC-C onset") > max_ioi_) {
                    pieces.emplace_back();
                }
            }
            pieces.back().sources.push_back(diffs[k].source);
            pieces.back().targets.push_back(diffs[k].target);
        }
        return pieces;
    }

    /// Indices of the last point of every occurrence of the shape
    /// `vectorized`, ascending.
    static std::vector<size_t> chainForward(const DiffIndex<P>& index, const Pattern<P>& vectorized) {
        const std::vector<IndexPair>& first = index.find(vectorized[0]);
        std::vector<size_t> targets;
        targets.reserve(first.size());
        for (const auto& pair : first) targets.push_back(pair.target);

        for (size_t k = 1; k < vectorized.size() && !targets.empty(); k++) {
            const std::vector<IndexPair>& pairs = index.find(vectorized[k]);
            std::vector<size_t> next;
            size_t a = 0, b = 0;
            while (a < targets.size() && b < pairs.size()) {
                if (targets[a] == pairs[b].source) {
                    next.push_back(pairs[b].target);
                    a++;
                    b++;
                } else if (targets[a] < pairs[b].source) {
                    a++;
                } else {
                    b++;
                }
            }
            targets = std::move(next);
        }
        return targets;
    }

    static bool improvesCover(const std::vector<size_t>& cover, const Piece& piece) {
        const size_t len = piece.sources.size();
        for (size_t s : piece.sources) {
            if (cover[s] < len) return true;
        }
        for (size_t t : piece.targets) {
            if (cover[t] < len) return true;
        }
        return false;
    }

    /// Walks the chain backward from the final targets; every index reached
    /// gets cover >= pattern_len.
    void raiseCover(std::vector<size_t>& cover, const DiffIndex<P>& index,
                    const Pattern<P>& vectorized, std::vector<size_t> chain,
                    size_t pattern_len) const {
        for (size_t k = vectorized.size(); k-- > 0 && !chain.empty();) {
            const std::vector<IndexPair>& pairs = index.find(vectorized[k]);
            std::vector<size_t> previous;
            size_t a = 0, b = 0;
            while (a < chain.size() && b < pairs.size()) {
                if (chain[a] == pairs[b].target) {
                    previous.push_back(pairs[b].source);
                    a++;
                    b++;
                } else if (chain[a] < pairs[b].target) {
                    a++;
                } else {
                    b++;
                }
            }
            for (size_t idx : previous) {
                if (cover[idx] < pattern_len) cover[idx] = pattern_len;
            }
            chain = std::move(previous);
        }
        if (cover_listener_) cover_listener_(cover);
    }

    double max_ioi_;
    DiffIndexBackend backend_;
    bool track_cover_;
    std::function<void(const std::vector<size_t>&)> cover_listener_;
};

// ─── SiatecCH ──────────────────────────────────────────────────
// SiatecC over a hashed difference index, skipping candidates that cannot
// raise the cover of any of their source or target points. Cover is the
// largest accepted pattern size known to contain a point.

template <typename P>
class SiatecCH : public SiatecC<P> {
public:
    explicit SiatecCH(double max_ioi, DiffIndexBackend backend = DiffIndexBackend::Hashed)
        : SiatecC<P>(max_ioi, backend, true) {}

    std::string name() const override { return "SIATEC-CH"; }
};

} // namespace geopat
