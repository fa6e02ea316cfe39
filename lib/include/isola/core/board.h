#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <bit>
#include <string>
#include <string_view>

#include "macros.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    /// A 64-bit mask over an 8x8 grid, bit index is row * 8 + col.
    /// Boards narrower or shorter than 8 cells only use a sub-rectangle of it.
    using BitBoard = std::uint64_t;

    inline constexpr int max_board_length = 8;
    inline constexpr std::size_t max_cell_count = max_board_length * max_board_length;

    enum class Coords : std::uint8_t // NOLINT(readability-enum-initial-value)
    {
        // clang-format off
        a1, b1, c1, d1, e1, f1, g1, h1,
        a2, b2, c2, d2, e2, f2, g2, h2,
        a3, b3, c3, d3, e3, f3, g3, h3,
        a4, b4, c4, d4, e4, f4, g4, h4,
        a5, b5, c5, d5, e5, f5, g5, h5,
        a6, b6, c6, d6, e6, f6, g6, h6,
        a7, b7, c7, d7, e7, f7, g7, h7,
        a8, b8, c8, d8, e8, f8, g8, h8,
        none = std::numeric_limits<std::uint8_t>::max()
        // clang-format on
    };

    /// Row of the cell, -1 for Coords::none.
    [[nodiscard]] constexpr int row_of(const Coords coords) noexcept
    {
        return coords == Coords::none ? -1 : static_cast<int>(coords) / max_board_length;
    }

    /// Column of the cell, -1 for Coords::none.
    [[nodiscard]] constexpr int col_of(const Coords coords) noexcept
    {
        return coords == Coords::none ? -1 : static_cast<int>(coords) % max_board_length;
    }

    [[nodiscard]] constexpr Coords coords_of(const int row, const int col) noexcept
    {
        if (row < 0 || row >= max_board_length || col < 0 || col >= max_board_length)
            return Coords::none;
        return static_cast<Coords>(row * max_board_length + col);
    }

    [[nodiscard]] ISOLA_API std::string to_string(Coords coords);

    /// \brief Parses a cell name such as "c4" or "C4".
    /// \return The parsed coordinates, or Coords::none if the text is not a cell name.
    [[nodiscard]] ISOLA_API Coords parse_coords(std::string_view str) noexcept;

    enum class Side : bool
    {
        first,
        second
    };

    [[nodiscard]] constexpr Side opponent_of(const Side side) noexcept
    {
        return side == Side::first ? Side::second : Side::first;
    }

    [[nodiscard]] constexpr std::size_t index_of(const Side side) noexcept { return static_cast<std::size_t>(side); }

    /// \brief Converts a Coords to a BitBoard.
    /// \param coords The Coords to convert. It must not be Coords::none.
    [[nodiscard]] constexpr BitBoard bit_of(const Coords coords) noexcept
    {
        assert(coords != Coords::none);
        return 1ull << static_cast<int>(coords);
    }

    struct ISOLA_API Board final
    {
        int width = 7;
        int height = 7;
        BitBoard blocked = 0;

        static const Board standard;

        /// \brief Creates an empty board, throws std::runtime_error unless both dimensions are in [1, 8].
        [[nodiscard]] static Board make(int width, int height);

        [[nodiscard]] constexpr friend bool operator==(Board, Board) noexcept = default;

        [[nodiscard]] constexpr bool contains(const Coords coords) const noexcept
        {
            return coords != Coords::none && row_of(coords) < height && col_of(coords) < width;
        }

        [[nodiscard]] constexpr bool is_blocked(const Coords coords) const noexcept { return blocked & bit_of(coords); }
        [[nodiscard]] constexpr bool is_open(const Coords coords) const noexcept
        {
            return contains(coords) && !is_blocked(coords);
        }

        /// Mask of all the cells that lie on this board.
        [[nodiscard]] BitBoard cells() const noexcept;
        [[nodiscard]] BitBoard open_cells() const noexcept { return cells() & ~blocked; }
        [[nodiscard]] int count_cells() const noexcept { return width * height; }
        [[nodiscard]] int count_open() const noexcept { return std::popcount(open_cells()); }

        /// The geometric centre cell, rounding towards the higher index on even dimensions.
        [[nodiscard]] constexpr Coords center() const noexcept { return coords_of(height / 2, width / 2); }

        constexpr void block(const Coords coords) noexcept { blocked |= bit_of(coords); }
    };

    // ReSharper disable once CppRedundantInlineSpecifier
    inline constexpr Board Board::standard{.width = 7, .height = 7, .blocked = 0};

    /// \brief All open cells reachable with a knight's move from the given cell.
    [[nodiscard]] ISOLA_API BitBoard knight_moves(const Board& board, Coords from) noexcept;
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
