#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include <clu/text/print.h>

#include <isola/utils/deadline.h>
#include <isola/utils/tui.h>

#include "agents.h"

namespace
{
    using namespace std::literals;

    struct MatchOptions
    {
        std::unique_ptr<isl::Player> p1;
        std::unique_ptr<isl::Player> p2;
        std::chrono::milliseconds time_limit = 150ms;
        int width = 7;
        int height = 7;
        bool pause = true;
    };

    const std::string help = //
        "Usage: match <p1> <p2> [time_ms] [width] [height]\n"
        "    <p1> <p2>   agents for the first and the second player\n"
        "    [time_ms]   time limit per move in milliseconds, 150 by default\n"
        "    [width]     board width, 7 by default, at most 8\n"
        "    [height]    board height, same as the width by default\n" +
        isl::agents::agent_help;

    constexpr double timeout_threshold_ms = 10.0;

    isl::Coords get_user_move(const isl::GameState& state)
    {
        const isl::BitBoard legal_moves = state.legal_move_mask(state.current);
        while (true)
        {
            clu::print("Your move: ");
            std::string input;
            if (!std::getline(std::cin, input))
                throw std::runtime_error("Input closed");
            const isl::Coords move = isl::parse_coords(input);
            if (!state.board.contains(move))
            {
                clu::println("Please enter a valid position on the board");
                continue;
            }
            if ((bit_of(move) & legal_moves) == 0)
            {
                clu::println("That move is illegal");
                continue;
            }
            return move;
        }
    }

    MatchOptions process_args(const int argc, const char* argv[])
    {
        if (argc < 3 || argc > 6)
            throw std::runtime_error(help);
        std::vector<std::string> args(argv, argv + argc);
        MatchOptions options{
            .p1 = isl::agents::make_agent(args[1], timeout_threshold_ms),
            .p2 = isl::agents::make_agent(args[2], timeout_threshold_ms) //
        };
        if (argc >= 4)
        {
            const auto time_ms = clu::parse<int>(args[3]);
            if (!time_ms || *time_ms <= 0)
                throw std::runtime_error(help);
            options.time_limit = std::chrono::milliseconds(*time_ms);
        }
        if (argc >= 5)
        {
            const auto width = clu::parse<int>(args[4]);
            if (!width)
                throw std::runtime_error(help);
            options.width = options.height = *width;
        }
        if (argc == 6)
        {
            const auto height = clu::parse<int>(args[5]);
            if (!height)
                throw std::runtime_error(help);
            options.height = *height;
        }
        options.pause = options.p1 && options.p2;
        return options;
    }

    void report_search(const isl::Player& player, const std::chrono::nanoseconds elapsed)
    {
        const auto* searching = dynamic_cast<const isl::SearchingPlayer*>(&player);
        if (!searching)
            return;
        const auto& report = searching->last_report();
        clu::println("depth {}{}, score {}, {} nodes, {:.1f}ms", report.completed_depth,
            report.exhausted ? " (exhausted)" : report.timed_out ? " (timed out)" : "", report.score,
            report.traversed_nodes, elapsed / 1.0ms);
    }

    void run_match(const MatchOptions& options)
    {
        isl::GameState state = isl::GameState::empty(options.width, options.height);
        isl::Coords last_move = isl::Coords::none;
        while (true)
        {
            isl::clear_screen();
            display_game(state, last_move == isl::Coords::none ? 0 : bit_of(last_move));
            if (state.is_over())
                break;
            const auto& player = state.current == isl::Side::first ? options.p1 : options.p2;
            isl::Coords move;
            if (player)
            {
                const isl::Deadline deadline(options.time_limit);
                const auto start = std::chrono::steady_clock::now();
                move = player->get_move(state, deadline.oracle());
                report_search(*player, std::chrono::steady_clock::now() - start);
                if (deadline.expired())
                {
                    clu::println("Player {} ran out of time", state.current == isl::Side::first ? 1 : 2);
                    return;
                }
            }
            else
                move = get_user_move(state);
            if (move == isl::Coords::none || (bit_of(move) & state.legal_move_mask(state.current)) == 0)
            {
                clu::println("Player {} forfeits with move {}", state.current == isl::Side::first ? 1 : 2,
                    to_string(move));
                return;
            }
            clu::println("Player {} plays {}", state.current == isl::Side::first ? 1 : 2, to_string(move));
            state.play(move);
            last_move = move;
            if (options.pause)
                (void)std::getchar();
        }
        clu::println("Player {} wins after {} moves", state.is_winner(isl::Side::first) ? 1 : 2, state.move_count());
    }
} // namespace

int main(const int argc, const char* argv[])
try
{
    const auto options = process_args(argc, argv);
    run_match(options);
    return 0;
}
catch (const std::exception& e)
{
    clu::println("Error due to exception:\n{}", e.what());
    return 1;
}
