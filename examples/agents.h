#pragma once

#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <clu/parse.h>

#include <isola/arena/random_player.h>
#include <isola/arena/searching_player.h>
#include <isola/evaluation/mobility_evaluator.h>

namespace isl::agents
{
    inline const std::string agent_help = //
        R"(    Agents are written as one of
        human               moves are read from the terminal
        random              a uniformly random legal move
        <method>:<depth>    fixed depth search, <method> is minimax or alphabeta
        <method>:id         iterative deepening until the time runs out)";

    /// \brief Builds the agent described by a command line argument, returns nullptr for "human".
    inline std::unique_ptr<Player> make_agent(const std::string_view name, const double timeout_threshold_ms)
    {
        if (name == "human")
            return nullptr;
        if (name == "random")
            return std::make_unique<RandomPlayer>();
        const auto error = [&] { throw std::runtime_error(std::format("Invalid agent \"{}\"", name)); };
        const auto colon = name.find(':');
        if (colon == std::string_view::npos)
            error();
        const auto method = parse_search_method(name.substr(0, colon));
        if (!method)
            error();
        const std::string_view rest = name.substr(colon + 1);
        SearchOptions options{.method = *method, .timeout_threshold_ms = timeout_threshold_ms};
        if (rest == "id")
            options.iterative = true;
        else
        {
            const auto depth = clu::parse<int>(rest);
            if (!depth || *depth <= 0)
                error();
            options.depth = *depth;
            options.iterative = false;
        }
        return std::make_unique<SearchingPlayer>(std::make_unique<MobilityEvaluator>(), options);
    }
} // namespace isl::agents
