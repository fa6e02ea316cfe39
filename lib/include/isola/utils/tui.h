#pragma once

#include "../core/game.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    ISOLA_API void clear_screen();

    /// \brief Prints the board with both pieces, cells in the highlight mask get a red background.
    ISOLA_API void display_board(const GameState& state, BitBoard highlight = 0);

    /// \brief Prints whose turn it is and the number of moves each side has, followed by the board.
    ISOLA_API void display_game(const GameState& state, BitBoard highlight = 0);
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
