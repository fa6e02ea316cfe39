#pragma once

#include <memory>

#include "player.h"
#include "../evaluation/evaluator.h"
#include "../search/game_searcher.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    class ISOLA_API SearchingPlayer final : public Player
    {
    public:
        SearchingPlayer(std::unique_ptr<const Evaluator> evaluator, const SearchOptions& options);
        [[nodiscard]] Coords get_move(const GameState& game, TimeOracle time_left) override;
        [[nodiscard]] const Evaluator& get_evaluator() const noexcept { return *eval_; }
        [[nodiscard]] const SearchOptions& options() const noexcept { return searcher_.options(); }

        /// The report of the most recent get_move call.
        [[nodiscard]] const GameSearcher::Report& last_report() const noexcept { return report_; }

    private:
        std::unique_ptr<const Evaluator> eval_;
        GameSearcher searcher_;
        GameSearcher::Report report_;
    };
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
