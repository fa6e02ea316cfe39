#include <array>
#include <chrono>
#include <string>
#include <vector>

#include <clu/parse.h>
#include <clu/random.h>
#include <clu/text/print.h>

#include <isola/utils/deadline.h>

#include "agents.h"

namespace
{
    using namespace std::literals;

    struct TournamentOptions
    {
        std::array<std::string, 2> agents;
        std::size_t games = 20;
        std::chrono::milliseconds time_limit = 150ms;
    };

    struct Tally
    {
        std::size_t wins = 0;
        std::size_t timeouts = 0;
        std::size_t forfeits = 0;
    };

    const std::string help = //
        "Usage: tournament <a> <b> [games] [time_ms]\n"
        "    <a> <b>     the two agents, each plays first in half of the games\n"
        "    [games]     number of games, 20 by default\n"
        "    [time_ms]   time limit per move in milliseconds, 150 by default\n" +
        isl::agents::agent_help;

    constexpr double timeout_threshold_ms = 10.0;

    TournamentOptions process_args(const int argc, const char* argv[])
    {
        if (argc < 3 || argc > 5)
            throw std::runtime_error(help);
        TournamentOptions options{.agents = {argv[1], argv[2]}};
        if (argc >= 4)
        {
            const auto games = clu::parse<std::size_t>(argv[3]);
            if (!games || *games == 0)
                throw std::runtime_error(help);
            options.games = *games;
        }
        if (argc == 5)
        {
            const auto time_ms = clu::parse<int>(argv[4]);
            if (!time_ms || *time_ms <= 0)
                throw std::runtime_error(help);
            options.time_limit = std::chrono::milliseconds(*time_ms);
        }
        return options;
    }

    /// Both pieces start on random open cells so that the games differ.
    isl::GameState random_opening()
    {
        isl::GameState state;
        for (int i = 0; i < 2; i++)
        {
            const isl::MoveVec moves = state.legal_moves();
            state.play(moves[static_cast<std::size_t>(clu::randint(0, static_cast<int>(moves.size()) - 1))]);
        }
        return state;
    }

    /// \brief Plays one game, players[0] moves first.
    /// \return Index into players of the winner.
    std::size_t play_game(const std::array<isl::Player*, 2>& players, const std::chrono::milliseconds time_limit,
        std::array<Tally, 2>& tallies, const std::array<std::size_t, 2>& owners)
    {
        isl::GameState state = random_opening();
        while (!state.is_over())
        {
            const std::size_t mover = isl::index_of(state.current);
            const isl::Deadline deadline(time_limit);
            const isl::Coords move = players[mover]->get_move(state, deadline.oracle());
            if (deadline.expired())
            {
                tallies[owners[mover]].timeouts++;
                return 1 - mover;
            }
            if (move == isl::Coords::none || (bit_of(move) & state.legal_move_mask(state.current)) == 0)
            {
                tallies[owners[mover]].forfeits++;
                return 1 - mover;
            }
            state.play(move);
        }
        return state.is_winner(isl::Side::first) ? 0 : 1;
    }

    void run_tournament(const TournamentOptions& options)
    {
        const std::array<std::unique_ptr<isl::Player>, 2> agents{
            isl::agents::make_agent(options.agents[0], timeout_threshold_ms),
            isl::agents::make_agent(options.agents[1], timeout_threshold_ms) //
        };
        if (!agents[0] || !agents[1])
            throw std::runtime_error("Human players cannot take part in a tournament");
        std::array<Tally, 2> tallies{};
        for (std::size_t game = 0; game < options.games; game++)
        {
            // Swap seats every other game
            const std::array<std::size_t, 2> owners = game % 2 == 0 ? std::array<std::size_t, 2>{0, 1}
                                                                    : std::array<std::size_t, 2>{1, 0};
            const std::array players{agents[owners[0]].get(), agents[owners[1]].get()};
            const std::size_t winner = owners[play_game(players, options.time_limit, tallies, owners)];
            tallies[winner].wins++;
            clu::println("Game {:3}: {} wins", game + 1, options.agents[winner]);
        }
        for (std::size_t i = 0; i < 2; i++)
            clu::println("{:>20}: {:3} wins ({:5.1f}%), {} timeouts, {} forfeits", options.agents[i],
                tallies[i].wins, 100.0 * static_cast<double>(tallies[i].wins) / static_cast<double>(options.games),
                tallies[i].timeouts, tallies[i].forfeits);
    }
} // namespace

int main(const int argc, const char* argv[])
try
{
    const auto options = process_args(argc, argv);
    run_tournament(options);
    return 0;
}
catch (const std::exception& e)
{
    clu::println("Error due to exception:\n{}", e.what());
    return 1;
}
