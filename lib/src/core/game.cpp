#include "isola/core/game.h"

#include <cctype>
#include <stdexcept>

#include "../utils/bit.h"

namespace isl
{
    GameState GameState::read(const std::string_view repr, const int width, const int height)
    {
        const auto error = [] { throw std::runtime_error("Invalid game state representation"); };
        GameState res = empty(width, height);
        std::string_view cells = repr;
        while (!cells.empty() && std::isspace(static_cast<unsigned char>(cells.back())))
            cells.remove_suffix(1);
        if (cells.empty())
            error();
        const char side_c = cells.back();
        if (side_c != '1' && side_c != '2')
            error();
        res.current = side_c == '1' ? Side::first : Side::second;
        cells.remove_suffix(1);

        int index = 0;
        for (const char c : cells)
        {
            if (std::isspace(static_cast<unsigned char>(c)))
                continue;
            if (index >= res.board.count_cells())
                error();
            const Coords coords = coords_of(index / width, index % width);
            index++;
            switch (c)
            {
                case '-': break;
                case '#': res.board.block(coords); break;
                case '1':
                case '2':
                {
                    Coords& pos = res.positions[c == '1' ? 0 : 1];
                    if (pos != Coords::none)
                        error();
                    pos = coords;
                    res.board.block(coords);
                    break;
                }
                default: error();
            }
        }
        if (index != res.board.count_cells())
            error();
        res.moves_played = std::popcount(res.board.blocked);
        return res;
    }

    BitBoard GameState::legal_move_mask(const Side side) const noexcept
    {
        const Coords pos = position_of(side);
        if (pos == Coords::none)
            return board.open_cells();
        return knight_moves(board, pos);
    }

    MoveVec GameState::legal_moves(const Side side) const noexcept
    {
        MoveVec res;
        for (const int move : SetBits{legal_move_mask(side)})
            res.push_back(static_cast<Coords>(move));
        return res;
    }

    void GameState::play(const Coords move) noexcept
    {
        assert(legal_move_mask(current) & bit_of(move));
        board.block(move);
        positions[index_of(current)] = move;
        current = opponent_of(current);
        moves_played++;
    }
} // namespace isl
