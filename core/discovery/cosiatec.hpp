#pragma once

#include "discovery/algorithm.hpp"
#include "discovery/heuristic.hpp"
#include "util/logging.hpp"

#include <memory>
#include <optional>
#include <stdexcept>

namespace geopat {

/// TEC whose single-point pattern reaches every point of `residual`.
/// Empty pattern if `residual` is empty.
template <typename P>
Tec<P> residualTec(const PointSet<P>& residual) {
    if (residual.empty()) return Tec<P>();
    const P& first = residual[0];
    std::vector<P> translators;
    translators.reserve(residual.size() - 1);
    for (size_t i = 1; i < residual.size(); i++) {
        translators.push_back(residual[i] - first);
    }
    return Tec<P>(Pattern<P>{first}, std::move(translators));
}

// ─── Cosiatec ──────────────────────────────────────────────────
// Greedy covering [Meredith 2013]. Each iteration runs the wrapped
// algorithm on the points not yet covered, keeps the best of all produced
// TECs and their conjugates (redundant translators removed) by
// TecStats::isBetterThan, emits it and removes its covered set.
//
// Stops when every point is covered or after |point set| iterations.

template <typename P>
class Cosiatec : public TecAlgorithm<P> {
public:
    explicit Cosiatec(std::unique_ptr<TecAlgorithm<P>> tec_algorithm)
        : tec_algorithm_(std::move(tec_algorithm)) {
        if (!tec_algorithm_) throw std::invalid_argument("COSIATEC needs a TEC algorithm");
    }

    std::string name() const override { return "COSIATEC(" + tec_algorithm_->name() + ")"; }
    const TecAlgorithm<P>& inner() const { return *tec_algorithm_; }

    void computeTecsToOutput(const PointSet<P>& point_set,
                             const TecSink<P>& on_output) const override {
        PointSet<P> residual = point_set;
        size_t iterations = 0;

        while (!residual.empty()) {
            if (iterations >= point_set.size()) {
                logger()->warn("{}: stopped after {} iterations with {} points uncovered",
                               name(), iterations, residual.size());
                return;
            }
            iterations++;

            std::optional<TecStats<P>> best = bestTec(residual);
            if (!best) {
                logger()->debug("{}: no candidate for {} residual points, emitting them as one TEC",
                                name(), residual.size());
                on_output(residualTec(residual));
                return;
            }

            residual = residual.difference(best->covered_set);
            logger()->debug("{}: iteration {} selected a {}-point pattern with {} translators "
                            "(comp_ratio={:.3f}), {} points left",
                            name(), iterations, best->tec.pattern.size(),
                            best->tec.translators.size(), best->comp_ratio, residual.size());
            on_output(std::move(best->tec));
        }
    }

private:
    std::optional<TecStats<P>> bestTec(const PointSet<P>& residual) const {
        std::optional<TecStats<P>> best;
        auto consider = [&](Tec<P> tec) {
            TecStats<P> candidate = statsOf(std::move(tec), residual);
            if (!best || candidate.isBetterThan(*best)) best = std::move(candidate);
        };

        tec_algorithm_->computeTecsToOutput(residual, [&](Tec<P> tec) {
            consider(tec.removeRedundantTranslators());
            consider(tec.conjugate().removeRedundantTranslators());
        });
        return best;
    }

    std::unique_ptr<TecAlgorithm<P>> tec_algorithm_;
};

} // namespace geopat
