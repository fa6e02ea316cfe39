#include "isola/utils/tui.h"

#include <clu/text/print.h>

namespace isl
{
    void clear_screen() { clu::print_nonformatted("\033[H\033[J"); }

    void display_board(const GameState& state, const BitBoard highlight)
    {
        static constexpr std::string_view numbers[]{"１", "２", "３", "４", "５", "６", "７", "８"};
        static constexpr std::string_view letters[]{"Ａ", "Ｂ", "Ｃ", "Ｄ", "Ｅ", "Ｆ", "Ｇ", "Ｈ"};
        static constexpr std::string_view open = "　";
        static constexpr std::string_view blocked = "▒▒";
        static constexpr std::string_view pieces[]{"①", "②"};
        const Board& board = state.board;
        clu::print_nonformatted("　");
        for (int j = 0; j < board.width; j++)
            clu::print_nonformatted(letters[j]);
        clu::print_nonformatted("\n");
        for (int i = 0; i < board.height; i++)
        {
            clu::print("{}\x1b[42m", numbers[i]);
            for (int j = 0; j < board.width; j++)
            {
                const Coords coords = coords_of(i, j);
                const bool marked = (bit_of(coords) & highlight) != 0;
                if (marked)
                    clu::print_nonformatted("\x1b[41m");
                if (coords == state.position_of(Side::first))
                    clu::print_nonformatted(pieces[0]);
                else if (coords == state.position_of(Side::second))
                    clu::print_nonformatted(pieces[1]);
                else if (board.is_blocked(coords))
                    clu::print_nonformatted(blocked);
                else
                    clu::print_nonformatted(open);
                if (marked)
                    clu::print_nonformatted("\x1b[42m");
            }
            clu::print_nonformatted("\x1b[0m\n");
        }
    }

    void display_game(const GameState& state, const BitBoard highlight)
    {
        const int first = state.count_moves(Side::first), second = state.count_moves(Side::second);
        if (state.current == Side::first)
            clu::println("\x1b[7mPLAYER 1 {:2}\x1b[m  {:2} PLAYER 2   (move {})", first, second, state.move_count() + 1);
        else
            clu::println("PLAYER 1 {:2}  \x1b[7m{:2} PLAYER 2\x1b[m   (move {})", first, second, state.move_count() + 1);
        display_board(state, highlight);
    }
} // namespace isl
