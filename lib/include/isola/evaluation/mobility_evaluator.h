#pragma once

#include "evaluator.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    /// \brief Rewards the moves left to a side and penalizes the moves left to its opponent.
    /// \details Scores own_moves - opponent_weight * opponent_moves. The score is not antisymmetric, evaluating
    /// the same state for the opponent does not negate it.
    class ISOLA_API MobilityEvaluator final : public Evaluator
    {
    public:
        explicit MobilityEvaluator(float opponent_weight = 2.0f) noexcept: opponent_weight_(opponent_weight) {}

        [[nodiscard]] float evaluate(const GameState& state, Side side) const override;
        [[nodiscard]] float opponent_weight() const noexcept { return opponent_weight_; }

    private:
        float opponent_weight_;
    };
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
