#include "isola/evaluation/mobility_evaluator.h"

namespace isl
{
    float MobilityEvaluator::evaluate(const GameState& state, const Side side) const
    {
        if (state.is_loser(side))
            return -inf;
        if (state.is_winner(side))
            return inf;
        const auto own = static_cast<float>(state.count_moves(side));
        const auto opponent = static_cast<float>(state.count_moves(opponent_of(side)));
        return own - opponent_weight_ * opponent;
    }
} // namespace isl
