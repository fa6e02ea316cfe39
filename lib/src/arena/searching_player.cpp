#include "isola/arena/searching_player.h"

#include <stdexcept>

namespace isl
{
    namespace
    {
        const Evaluator& checked(const std::unique_ptr<const Evaluator>& evaluator)
        {
            if (evaluator == nullptr)
                throw std::runtime_error("A searching player needs an evaluator");
            return *evaluator;
        }
    } // namespace

    SearchingPlayer::SearchingPlayer(std::unique_ptr<const Evaluator> evaluator, const SearchOptions& options):
        eval_(std::move(evaluator)), searcher_(make_evaluation(checked(eval_)), options)
    {
    }

    Coords SearchingPlayer::get_move(const GameState& game, TimeOracle time_left)
    {
        report_ = searcher_.select(game, std::move(time_left));
        return report_.move;
    }
} // namespace isl
