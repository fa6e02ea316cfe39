#include "isola/core/board.h"

#include <format>
#include <stdexcept>

#include "../utils/bit.h"

namespace isl
{
    std::string to_string(const Coords coords)
    {
        if (coords == Coords::none)
            return "None";
        char res[3]{};
        res[0] = static_cast<char>('A' + col_of(coords));
        res[1] = static_cast<char>('1' + row_of(coords));
        return std::string(res);
    }

    Coords parse_coords(const std::string_view str) noexcept
    {
        if (str.size() != 2)
            return Coords::none;
        if (str[1] < '1' || str[1] > '8')
            return Coords::none;
        if ((str[0] < 'A' || str[0] > 'H') && (str[0] < 'a' || str[0] > 'h'))
            return Coords::none;
        const int r = str[1] - '1', c = str[0] >= 'a' ? str[0] - 'a' : str[0] - 'A';
        return coords_of(r, c);
    }

    Board Board::make(const int width, const int height)
    {
        if (width < 1 || width > max_board_length || height < 1 || height > max_board_length)
            throw std::runtime_error(std::format(
                "Invalid board size {}x{}, both dimensions must be in [1, {}]", width, height, max_board_length));
        return {.width = width, .height = height, .blocked = 0};
    }

    BitBoard Board::cells() const noexcept { return rectangle_mask(width, height); }

    BitBoard knight_moves(const Board& board, const Coords from) noexcept
    {
        assert(board.contains(from));
        return knight_spread(bit_of(from)) & board.open_cells();
    }
} // namespace isl
