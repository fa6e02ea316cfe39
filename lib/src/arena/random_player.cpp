#include "isola/arena/random_player.h"

#include <clu/random.h>

namespace isl
{
    Coords RandomPlayer::get_move(const GameState& game, TimeOracle)
    {
        const MoveVec moves = game.legal_moves();
        if (moves.empty())
            return Coords::none;
        const int move_idx = clu::randint(0, static_cast<int>(moves.size()) - 1);
        return moves[static_cast<std::size_t>(move_idx)];
    }
} // namespace isl
