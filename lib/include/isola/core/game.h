#pragma once

#include <array>
#include <clu/static_vector.h>

#include "board.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    using MoveVec = clu::static_vector<Coords, max_cell_count>;

    /// \brief A position of the game Isolation.
    /// \details Each side places its piece on any open cell on its first move and moves like a chess knight
    /// afterwards. Every cell a piece has visited stays blocked. The side to move loses when it has no legal move.
    struct ISOLA_API GameState final
    {
        using Move = Coords;
        using Side = isl::Side;
        static constexpr Move no_move = Coords::none;

        Board board = Board::standard;
        std::array<Coords, 2> positions{Coords::none, Coords::none};
        Side current = Side::first;
        int moves_played = 0;

        /// \brief Parses a position from text.
        /// \details The text lists the cells row by row, row 1 first, using '-' for an open cell, '#' for a
        /// blocked one and '1' / '2' for the pieces of the two sides. Whitespace is ignored. Each row holds
        /// width cells. The final character, '1' or '2', names the side to move.
        [[nodiscard]] static GameState read(std::string_view repr, int width = 7, int height = 7);
        [[nodiscard]] static GameState empty(int width, int height) { return {.board = Board::make(width, height)}; }

        [[nodiscard]] BitBoard legal_move_mask(Side side) const noexcept;
        [[nodiscard]] MoveVec legal_moves(Side side) const noexcept;
        [[nodiscard]] MoveVec legal_moves() const noexcept { return legal_moves(current); }
        [[nodiscard]] int count_moves(const Side side) const noexcept { return std::popcount(legal_move_mask(side)); }

        [[nodiscard]] constexpr Side active_player() const noexcept { return current; }
        [[nodiscard]] constexpr Side inactive_player() const noexcept { return opponent_of(current); }
        [[nodiscard]] constexpr Coords position_of(const Side side) const noexcept { return positions[index_of(side)]; }

        /// The side to move loses once it is stuck.
        [[nodiscard]] bool is_loser(const Side side) const noexcept
        {
            return side == current && legal_move_mask(side) == 0;
        }
        [[nodiscard]] bool is_winner(const Side side) const noexcept
        {
            return side != current && legal_move_mask(current) == 0;
        }
        [[nodiscard]] bool is_over() const noexcept { return legal_move_mask(current) == 0; }

        [[nodiscard]] constexpr int move_count() const noexcept { return moves_played; }
        [[nodiscard]] constexpr Coords opening_move() const noexcept { return board.center(); }

        /// \brief Returns the state after the side to move plays the given move, this state is left untouched.
        [[nodiscard]] GameState forecast(const Coords move) const noexcept
        {
            GameState res = *this;
            res.play(move);
            return res;
        }

        /// \param move A legal move of the side to move.
        void play(Coords move) noexcept;

        [[nodiscard]] constexpr friend bool operator==(const GameState&, const GameState&) noexcept = default;
    };
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
