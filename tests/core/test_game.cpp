#include <algorithm>

#include <isola/core/game.h>
#include <isola/evaluation/mobility_evaluator.h>
#include <isola/utils/perft.h>

#include "../support/check.h"

using namespace isl;
using namespace isl::test;

namespace
{
    bool contains(const MoveVec& moves, const Coords move)
    {
        return std::ranges::find(moves, move) != moves.end();
    }

    void test_coords()
    {
        check_eq(row_of(Coords::c4), 3, "row of C4");
        check_eq(col_of(Coords::c4), 2, "column of C4");
        check_eq(row_of(Coords::none), -1, "row of the no-move sentinel");
        check_eq(col_of(Coords::none), -1, "column of the no-move sentinel");
        check(coords_of(6, 6) == Coords::g7, "coords of row 6 column 6");
        check(coords_of(8, 0) == Coords::none, "rows past the grid");
        check_eq(to_string(Coords::d4), std::string("D4"), "cell name");
        check_eq(to_string(Coords::none), std::string("None"), "sentinel name");
        check(parse_coords("e5") == Coords::e5, "parse lower case");
        check(parse_coords("E5") == Coords::e5, "parse upper case");
        check(parse_coords("i1") == Coords::none, "reject column past H");
        check(parse_coords("a9") == Coords::none, "reject row past 8");
        check(parse_coords("a10") == Coords::none, "reject long names");
    }

    void test_board()
    {
        const Board board = Board::make(5, 4);
        check_eq(board.count_cells(), 20, "cell count of a 5x4 board");
        check_eq(board.count_open(), 20, "all cells open on a fresh board");
        check(board.contains(Coords::e4), "E4 lies on a 5x4 board");
        check(!board.contains(Coords::f1), "F1 is past the width");
        check(!board.contains(Coords::a5), "A5 is past the height");
        check(Board::standard.center() == Coords::d4, "centre of the 7x7 board");
        check(Board::make(8, 8).center() == Coords::e5, "centre of the 8x8 board");
        check_throws([] { (void)Board::make(0, 7); }, "zero width");
        check_throws([] { (void)Board::make(7, 9); }, "height past 8");
    }

    void test_knight_moves()
    {
        const Board board = Board::standard;
        check_eq(std::popcount(knight_moves(board, Coords::d4)), 8, "knight in the centre");
        check_eq(std::popcount(knight_moves(board, Coords::a1)), 2, "knight in the corner");
        check_eq(std::popcount(knight_moves(board, Coords::g7)), 2, "knight in the far corner");
        check_eq(std::popcount(knight_moves(board, Coords::b1)), 3, "knight next to the corner");
        // On the 8-wide grid F1 would reach H2, which lies off a 7-wide board
        check(!(knight_moves(board, Coords::f1) & bit_of(Coords::h2)), "no moves past the board width");
        Board blocked = board;
        blocked.block(Coords::b3);
        check_eq(std::popcount(knight_moves(blocked, Coords::a1)), 1, "blocked cells are not reachable");
    }

    void test_rules()
    {
        GameState state;
        check_eq(state.legal_moves().size(), std::size_t{49}, "first placement can use any cell");
        check(state.active_player() == Side::first, "first side moves first");
        check_eq(state.move_count(), 0, "no moves played");
        check(state.opening_move() == Coords::d4, "opening move is the centre");

        const GameState before = state;
        const GameState after = state.forecast(Coords::d4);
        check(state == before, "forecast leaves the state untouched");
        check(after.active_player() == Side::second, "sides alternate");
        check(after.inactive_player() == Side::first, "the side that moved becomes inactive");
        check(after.position_of(Side::first) == Coords::d4, "piece placed");
        check_eq(after.legal_moves().size(), std::size_t{48}, "second placement avoids the first piece");
        check_eq(after.move_count(), 1, "one move played");

        const GameState third = after.forecast(Coords::a1);
        const MoveVec moves = third.legal_moves();
        check_eq(moves.size(), std::size_t{8}, "the first piece now moves like a knight");
        check(contains(moves, Coords::c2), "knight jump from D4 to C2");
        check(!contains(moves, Coords::d5), "no sliding moves");

        const GameState fourth = third.forecast(Coords::c2);
        check(fourth.board.is_blocked(Coords::d4), "vacated cells stay blocked");
        check(!contains(fourth.legal_moves(), Coords::c2), "the second piece cannot land on the first");
        check_eq(fourth.legal_moves().size(), std::size_t{1}, "A1 can only reach B3 once C2 is taken");
    }

    void test_read()
    {
        const GameState state = GameState::read(
            "1 - - - - - -"
            "- - # - - - -"
            "- - - - - - -"
            "- - - 2 - - -"
            "- - - - - - -"
            "- - - - - - -"
            "- - - - - - -"
            "1");
        check(state.position_of(Side::first) == Coords::a1, "first piece read");
        check(state.position_of(Side::second) == Coords::d4, "second piece read");
        check(state.board.is_blocked(Coords::c2), "blocked cell read");
        check(state.current == Side::first, "side to move read");
        check_eq(state.legal_moves().size(), std::size_t{1}, "A1 keeps only B3");
        check_eq(state.move_count(), 3, "occupied cells count as played moves");

        check_throws([] { (void)GameState::read("1 - - 2", 7, 7); }, "too few cells");
        check_throws([] { (void)GameState::read("- - - - 3", 2, 2); }, "missing side to move");
        check_throws([] { (void)GameState::read("1 1 - - 2", 2, 2); }, "two pieces of one side");
        check_throws([] { (void)GameState::read("x - - - 1", 2, 2); }, "unknown cell");
    }

    void test_terminal_predicates()
    {
        // The first side is cornered: A1 reaches B3 and C2, both blocked
        const GameState stuck = GameState::read(
            "1 - - - - - -"
            "- - # - - - -"
            "- # - - - - -"
            "- - - 2 - - -"
            "- - - - - - -"
            "- - - - - - -"
            "- - - - - - -"
            "1");
        check(stuck.is_over(), "no moves left");
        check(stuck.is_loser(Side::first), "the stuck side to move loses");
        check(stuck.is_winner(Side::second), "its opponent wins");
        check(!stuck.is_winner(Side::first), "the stuck side does not win");
        check(!stuck.is_loser(Side::second), "the opponent does not lose");
        check(stuck.legal_moves().empty(), "no legal moves");

        const GameState open;
        check(!open.is_over(), "fresh game is not over");
        check(!open.is_winner(Side::first) && !open.is_loser(Side::first), "fresh game is undecided");
    }

    void test_mobility_evaluator()
    {
        const MobilityEvaluator eval;
        const GameState state = GameState::read(
            "- - - - - - -"
            "- - - - - - -"
            "- - - - - - -"
            "- - - 1 - - -"
            "- - - - - - -"
            "- - - - - - -"
            "2 - - - - - -"
            "1");
        // D4 has 8 knight moves, A7 has 2
        check_eq(eval.evaluate(state, Side::first), 8.0f - 2.0f * 2.0f, "own minus twice the opponent's");
        check_eq(eval.evaluate(state, Side::second), 2.0f - 2.0f * 8.0f, "scored for the second side");
        check(eval.evaluate(state, Side::first) != -eval.evaluate(state, Side::second),
            "the heuristic is not antisymmetric");
        check_eq(MobilityEvaluator(0.0f).evaluate(state, Side::first), 8.0f, "weight 0 counts own moves");

        const GameState stuck = GameState::read(
            "1 - - - - - -"
            "- - # - - - -"
            "- # - - - - -"
            "- - - 2 - - -"
            "- - - - - - -"
            "- - - - - - -"
            "- - - - - - -"
            "1");
        check_eq(eval.evaluate(stuck, Side::first), -inf, "a lost game scores -inf");
        check_eq(eval.evaluate(stuck, Side::second), inf, "a won game scores +inf");
    }

    void test_perft()
    {
        const GameState initial;
        check_eq(perft(initial, 1), std::uint64_t{49}, "perft 1");
        check_eq(perft(initial, 2), std::uint64_t{2352}, "perft 2");
        check_eq(perft(initial, 3), std::uint64_t{11280}, "perft 3");
        check_eq(perft(initial, 4), std::uint64_t{52672}, "perft 4");
    }
} // namespace

int main()
{
    test_coords();
    test_board();
    test_knight_moves();
    test_rules();
    test_read();
    test_terminal_predicates();
    test_mobility_evaluator();
    test_perft();
    return report("game");
}
