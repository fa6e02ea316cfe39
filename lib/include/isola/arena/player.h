#pragma once

#include "../core/game.h"
#include "../search/search_options.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    class ISOLA_API Player
    {
    public:
        Player() noexcept = default;
        virtual ~Player() noexcept = default;
        Player(const Player&) = delete;
        Player(Player&&) = delete;
        Player& operator=(const Player&) = delete;
        Player& operator=(Player&&) = delete;

        /// \brief Picks a move for the side to move.
        /// \param time_left Milliseconds left for this move, the result must be ready before it runs out.
        /// \return A legal move, or Coords::none if the side to move is stuck.
        [[nodiscard]] virtual Coords get_move(const GameState& game, TimeOracle time_left) = 0;
    };
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
