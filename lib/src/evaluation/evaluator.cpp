#include "isola/evaluation/evaluator.h"

namespace isl
{
    GameEvaluation make_evaluation(const Evaluator& evaluator)
    {
        return [&evaluator](const GameState& state, const Side side) { return evaluator.evaluate(state, side); };
    }
} // namespace isl
