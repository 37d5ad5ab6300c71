#pragma once

#include "discovery/algorithm.hpp"
#include "discovery/cosiatec.hpp"
#include "discovery/heuristic.hpp"
#include "util/logging.hpp"

#include <memory>
#include <stdexcept>

namespace geopat {

// ─── SiatecCompress ────────────────────────────────────────────
// Single-pass covering [Meredith 2013]. All TECs of the wrapped algorithm
// and their conjugates are ranked best-first, then accepted in rank order
// while each one adds more new points than it costs to represent
// (|pattern| + |translators|). Uncovered points end up in one residual
// TEC, so the output always covers the whole point set.

template <typename P>
class SiatecCompress : public TecAlgorithm<P> {
public:
    explicit SiatecCompress(std::unique_ptr<TecAlgorithm<P>> tec_algorithm)
        : tec_algorithm_(std::move(tec_algorithm)) {
        if (!tec_algorithm_) throw std::invalid_argument("SIATECCompress needs a TEC algorithm");
    }

    std::string name() const override {
        return "SIATECCompress(" + tec_algorithm_->name() + ")";
    }
    const TecAlgorithm<P>& inner() const { return *tec_algorithm_; }

    void computeTecsToOutput(const PointSet<P>& point_set,
                             const TecSink<P>& on_output) const override {
        std::vector<Tec<P>> tecs = tec_algorithm_->computeTecs(point_set);
        const size_t discovered = tecs.size();
        tecs.reserve(discovered * 2);
        for (size_t i = 0; i < discovered; i++) {
            tecs.push_back(tecs[i].conjugate());
        }

        std::vector<TecStats<P>> ranked;
        ranked.reserve(tecs.size());
        for (const auto& tec : tecs) {
            ranked.push_back(statsOf(tec.removeRedundantTranslators(), point_set));
        }
        rank(ranked);

        logger()->debug("{}: ranked {} candidate TECs", name(), ranked.size());
        encode(ranked, point_set, on_output);
    }

    /// Stable merge sort putting `a` before `b` only when a.isBetterThan(b).
    /// The comparison is not a strict weak order, so std::sort cannot be
    /// used; merging never reads outside the ranges whatever it answers.
    static void rank(std::vector<TecStats<P>>& stats) {
        std::vector<TecStats<P>> buffer;
        buffer.reserve(stats.size());
        mergeSort(stats, buffer, 0, stats.size());
    }

private:
    static void mergeSort(std::vector<TecStats<P>>& v, std::vector<TecStats<P>>& buffer,
                          size_t begin, size_t end) {
        if (end - begin < 2) return;
        const size_t mid = begin + (end - begin) / 2;
        mergeSort(v, buffer, begin, mid);
        mergeSort(v, buffer, mid, end);

        buffer.clear();
        size_t i = begin, j = mid;
        while (i < mid && j < end) {
            if (v[j].isBetterThan(v[i])) {
                buffer.push_back(std::move(v[j++]));
            } else {
                buffer.push_back(std::move(v[i++]));
            }
        }
        while (i < mid) buffer.push_back(std::move(v[i++]));
        while (j < end) buffer.push_back(std::move(v[j++]));
        std::move(buffer.begin(), buffer.end(), v.begin() + static_cast<std::ptrdiff_t>(begin));
    }

    void encode(const std::vector<TecStats<P>>& ranked, const PointSet<P>& point_set,
                const TecSink<P>& on_output) const {
        PointSet<P> total_cover;
        size_t accepted = 0;
        for (const auto& stats : ranked) {
            const size_t new_points = stats.covered_set.difference(total_cover).size();
            const size_t repr_size = stats.tec.pattern.size() + stats.tec.translators.size();
            if (new_points <= repr_size) continue;

            total_cover = total_cover.unionWith(stats.covered_set);
            on_output(stats.tec);
            accepted++;
            if (total_cover.size() == point_set.size()) break;
        }

        PointSet<P> residual = point_set.difference(total_cover);
        logger()->debug("{}: accepted {} TECs, {} points left as residual",
                        name(), accepted, residual.size());
        if (!residual.empty()) on_output(residualTec(residual));
    }

    std::unique_ptr<TecAlgorithm<P>> tec_algorithm_;
};

} // namespace geopat
