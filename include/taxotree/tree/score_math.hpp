#ifndef TAXOTREE_TREE_SCORE_MATH_HPP
#define TAXOTREE_TREE_SCORE_MATH_HPP

/**
 * @file score_math.hpp
 * @brief Weighted averaging of optional scores.
 *
 * Internal nodes of an abundance tree get their score from the nodes they
 * summarize: shape() averages children weighted by accumulated counts and
 * prune() averages a parent with a collapsed child weighted by direct counts.
 */

#include "taxotree/core/types.hpp"

namespace taxotree {

/**
 * @class ScoreAccumulator
 * @brief Running weighted average that ignores missing scores.
 *
 * Entries without a score, or with zero weight, contribute nothing. If
 * nothing contributed, the result is the no-score sentinel.
 */
class ScoreAccumulator {
public:
    /**
     * @brief Add a score with its weight.
     */
    void add(const OptionalScore& score, Count weight) noexcept {
        if (!score || weight == 0) {
            return;
        }
        weighted_sum_ += *score * static_cast<double>(weight);
        total_weight_ += weight;
    }

    /**
     * @brief Weighted average of the added scores.
     */
    [[nodiscard]] OptionalScore result() const noexcept {
        if (total_weight_ == 0) {
            return kNoScore;
        }
        return weighted_sum_ / static_cast<double>(total_weight_);
    }

    /**
     * @brief Sum of the weights that carried a score.
     */
    [[nodiscard]] Count total_weight() const noexcept { return total_weight_; }

private:
    double weighted_sum_ = 0.0;
    Count total_weight_ = 0;
};

} // namespace taxotree

#endif // TAXOTREE_TREE_SCORE_MATH_HPP
