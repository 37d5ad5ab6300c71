#pragma once

#include "point_set/pattern.hpp"
#include "point_set/point_set.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace geopat {

// ─── Mtp ───────────────────────────────────────────────────────
// Maximal translatable pattern: the largest subset of a point set that,
// translated by `translator`, stays inside the point set.

template <typename P>
struct Mtp {
    P translator;
    Pattern<P> pattern;

    bool operator==(const Mtp& other) const {
        return translator == other.translator && pattern == other.pattern;
    }
    bool operator!=(const Mtp& other) const { return !(*this == other); }
};

// ─── Tec ───────────────────────────────────────────────────────
// Translational equivalence class: a pattern and the translators that map
// it onto its other occurrences. The zero vector is never stored; the
// pattern itself is the implicit zero-translator occurrence.

template <typename P>
struct Tec {
    Pattern<P> pattern;
    std::vector<P> translators;

    Tec() = default;
    Tec(Pattern<P> pattern, std::vector<P> translators)
        : pattern(std::move(pattern)), translators(std::move(translators)) {}

    /// All occurrences; the first one is the pattern itself.
    std::vector<Pattern<P>> expand() const {
        std::vector<Pattern<P>> occurrences;
        occurrences.reserve(translators.size() + 1);
        occurrences.push_back(pattern);
        for (const auto& t : translators) {
            occurrences.push_back(pattern.translate(t));
        }
        return occurrences;
    }

    /// Union of the points of all occurrences.
    PointSet<P> coveredSet() const { return coveredSetOf(translators); }

    /// Same covered set, with the roles of intra-pattern structure and
    /// inter-occurrence translation swapped.
    Tec conjugate() const {
        if (pattern.empty()) return *this;

        const P& first = pattern[0];
        std::vector<P> conj_points;
        conj_points.reserve(translators.size() + 1);
        conj_points.push_back(first);
        for (const auto& t : translators) {
            conj_points.push_back(first + t);
        }

        std::vector<P> conj_translators;
        conj_translators.reserve(pattern.size() - 1);
        for (size_t i = 1; i < pattern.size(); i++) {
            conj_translators.push_back(pattern[i] - first);
        }

        return Tec(Pattern<P>(std::move(conj_points)), std::move(conj_translators));
    }

    /// Drops translators whose occurrences are already covered by the
    /// pattern and the remaining translators. Translators are tested in
    /// order against the set kept so far, so the covered set never changes.
    Tec removeRedundantTranslators() const {
        std::vector<P> kept;
        kept.reserve(translators.size());
        for (const auto& t : translators) {
            if (std::find(kept.begin(), kept.end(), t) == kept.end()) {
                kept.push_back(t);
            }
        }

        const PointSet<P> full_cover = coveredSetOf(kept);

        size_t i = 0;
        while (i < kept.size()) {
            std::vector<P> without = kept;
            without.erase(without.begin() + static_cast<std::ptrdiff_t>(i));
            if (coveredSetOf(without) == full_cover) {
                kept = std::move(without);
            } else {
                i++;
            }
        }

        return Tec(pattern, std::move(kept));
    }

    bool operator==(const Tec& other) const {
        return pattern == other.pattern && translators == other.translators;
    }
    bool operator!=(const Tec& other) const { return !(*this == other); }

private:
    PointSet<P> coveredSetOf(const std::vector<P>& ts) const {
        std::vector<P> points(pattern.begin(), pattern.end());
        points.reserve(pattern.size() * (ts.size() + 1));
        for (const auto& t : ts) {
            for (const auto& p : pattern) {
                points.push_back(p + t);
            }
        }
        return PointSet<P>(std::move(points));
    }
};

template <typename P>
std::ostream& operator<<(std::ostream& os, const Tec<P>& tec) {
    os << "Tec{pattern=" << tec.pattern << ", translators=[";
    for (size_t i = 0; i < tec.translators.size(); i++) {
        if (i > 0) os << ", ";
        os << tec.translators[i];
    }
    return os << "]}";
}

template <typename P>
std::ostream& operator<<(std::ostream& os, const Mtp<P>& mtp) {
    return os << "Mtp{translator=" << mtp.translator << ", pattern=" << mtp.pattern << "}";
}

/// Sorts `tecs` by the size and then the value of their vectorized patterns
/// and keeps one TEC per translationally equivalent shape (the first one
/// in the incoming order).
template <typename P>
void removeTranslationalDuplicates(std::vector<Tec<P>>& tecs) {
    std::vector<std::pair<Pattern<P>, Tec<P>>> keyed;
    keyed.reserve(tecs.size());
    for (auto& tec : tecs) {
        Pattern<P> key = tec.pattern.vectorize();
        keyed.emplace_back(std::move(key), std::move(tec));
    }

    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        if (a.first.size() != b.first.size()) return a.first.size() < b.first.size();
        return a.first < b.first;
    });

    tecs.clear();
    for (size_t i = 0; i < keyed.size(); i++) {
        if (i > 0 && keyed[i].first == keyed[i - 1].first) continue;
        tecs.push_back(std::move(keyed[i].second));
    }
}

} // namespace geopat
