#pragma once

#include <clu/function.h>

#include "../core/game.h"
#include "../search/search_options.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    class ISOLA_API Evaluator
    {
    public:
        Evaluator() noexcept = default;
        virtual ~Evaluator() noexcept = default;
        Evaluator(const Evaluator&) = delete;
        Evaluator(Evaluator&&) = delete;
        Evaluator& operator=(const Evaluator&) = delete;
        Evaluator& operator=(Evaluator&&) = delete;

        /// \brief Scores a state from the point of view of the given side.
        /// \return +inf if the side has won, -inf if it has lost, a finite heuristic value otherwise.
        [[nodiscard]] virtual float evaluate(const GameState& state, Side side) const = 0;
    };

    using GameEvaluation = clu::move_only_function<float(const GameState&, Side)>;

    /// \brief Wraps an evaluator into a function value, the evaluator must outlive the result.
    [[nodiscard]] ISOLA_API GameEvaluation make_evaluation(const Evaluator& evaluator);
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
