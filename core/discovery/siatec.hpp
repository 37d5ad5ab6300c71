#pragma once

#include "discovery/algorithm.hpp"
#include "util/logging.hpp"

#include <algorithm>

namespace geopat {

// ─── Siatec ────────────────────────────────────────────────────
// Exhaustive TEC discovery for all MTPs [Meredith et al. 2002], following
// the pseudocode of [Meredith 2016, fig. 13.7].
//
// The full difference table D[i][j] = p_j - p_i is built alongside the
// sorted forward differences. Each column of D is ascending because the
// point set is sorted, which allows the translators of an MTP to be found
// by one synchronized scan over the MTP's columns.
//
// With remove_duplicates, MTPs with equal vectorized patterns are merged
// before translators are searched (costs one extra sort).

template <typename P>
class Siatec : public TecAlgorithm<P> {
public:
    explicit Siatec(bool remove_duplicates = true) : remove_duplicates_(remove_duplicates) {}

    std::string name() const override { return "SIATEC"; }
    bool removesDuplicates() const { return remove_duplicates_; }

    void computeTecsToOutput(const PointSet<P>& point_set,
                             const TecSink<P>& on_output) const override {
        const size_t n = point_set.size();
        if (n < 2) return;

        std::vector<std::vector<P>> diff_table;
        std::vector<IndexedDiff<P>> forward_diffs;
        computeDifferences(point_set, diff_table, forward_diffs);

        std::vector<Candidate> candidates = partition(point_set, forward_diffs);
        if (remove_duplicates_) {
            keepDistinctShapes(candidates);
        }

        logger()->debug("SIATEC: {} points, {} MTPs{}", n, candidates.size(),
                        remove_duplicates_ ? " (translationally distinct)" : "");

        for (auto& candidate : candidates) {
            std::vector<P> translators = findTranslators(n, candidate.indices, diff_table);
            on_output(Tec<P>(std::move(candidate.pattern), std::move(translators)));
        }
    }

private:
    struct Candidate {
        Pattern<P> pattern;
        Pattern<P> vectorized;
        std::vector<size_t> indices;
    };

    static void computeDifferences(const PointSet<P>& point_set,
                                   std::vector<std::vector<P>>& diff_table,
                                   std::vector<IndexedDiff<P>>& forward_diffs) {
        const size_t n = point_set.size();
        diff_table.assign(n, std::vector<P>());
        forward_diffs.clear();
        forward_diffs.reserve(n * (n - 1) / 2);

        for (size_t i = 0; i < n; i++) {
            const P& from = point_set[i];
            diff_table[i].reserve(n);
            for (size_t j = 0; j < n; j++) {
                P diff = point_set[j] - from;
                diff_table[i].push_back(diff);
                if (i < j) forward_diffs.push_back({diff, i});
            }
        }
        sortIndexedDiffs(forward_diffs);
    }

    static std::vector<Candidate> partition(const PointSet<P>& point_set,
                                            const std::vector<IndexedDiff<P>>& forward_diffs) {
        std::vector<Candidate> candidates;
        forEachDiffGroup(forward_diffs, [&](const P&, std::vector<size_t> indices) {
            Candidate c;
            c.pattern = point_set.getPattern(indices);
            c.vectorized = c.pattern.vectorize();
            c.indices = std::move(indices);
            candidates.push_back(std::move(c));
        });
        return candidates;
    }

    /// Orders candidates by vectorized size, then value, and keeps the
    /// first candidate of each translationally equivalent group.
    static void keepDistinctShapes(std::vector<Candidate>& candidates) {
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const Candidate& a, const Candidate& b) {
                             if (a.vectorized.size() != b.vectorized.size()) {
                                 return a.vectorized.size() < b.vectorized.size();
                             }
                             return a.vectorized < b.vectorized;
                         });

        std::vector<Candidate> distinct;
        for (auto& c : candidates) {
            if (!distinct.empty() && distinct.back().vectorized == c.vectorized) continue;
            distinct.push_back(std::move(c));
        }
        candidates = std::move(distinct);
    }

    /// Synchronized scan over the pattern's columns of the difference table.
    /// Row pointers only move forward: column 0 is strictly ascending, so
    /// the row holding the next candidate value in any other column is never
    /// before the row that held the previous one.
    static std::vector<P> findTranslators(size_t n,
                                          const std::vector<size_t>& col_ind,
                                          const std::vector<std::vector<P>>& diff_table) {
        const size_t pat_len = col_ind.size();
        std::vector<P> translators;
        if (pat_len == 0 || pat_len > n) return translators;

        std::vector<size_t> row_ind(pat_len, 0);
        for (size_t col = 1; col < pat_len; col++) row_ind[col] = col;

        for (row_ind[0] = 0; row_ind[0] + pat_len <= n; row_ind[0]++) {
            const P& vec = diff_table[col_ind[0]][row_ind[0]];
            bool found = false;

            for (size_t col = 1; col < pat_len; col++) {
                row_ind[col] = std::max(row_ind[col], row_ind[0] + col);
                const std::vector<P>& column = diff_table[col_ind[col]];
                while (row_ind[col] < n && column[row_ind[col]] < vec) {
                    row_ind[col]++;
                }
                if (row_ind[col] >= n || column[row_ind[col]] != vec) break;
                if (col == pat_len - 1) found = true;
            }

            if ((found || pat_len == 1) && !vec.isZero()) {
                translators.push_back(vec);
            }
        }
        return translators;
    }

    bool remove_duplicates_;
};

} // namespace geopat
