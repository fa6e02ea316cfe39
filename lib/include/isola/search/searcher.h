#pragma once

#include <algorithm>
#include <ranges>
#include <stdexcept>
#include <clu/function.h>

#include "search_options.h"
#include "search_state.h"

namespace isl
{
    /// \brief Depth-limited minimax and alpha-beta search with an iterative deepening driver.
    /// \details The searcher is reusable across turns, only the options and the evaluation function persist
    /// between calls. The time oracle is polled on entry of every node, once it reports less time than the
    /// configured threshold a SearchTimeout unwinds the running search. Only select() recovers from it.
    template <SearchState State>
    class Searcher final
    {
    public:
        using Move = typename State::Move;
        using Side = typename State::Side;

        /// Scores a state from the point of view of a side, +inf if that side has won, -inf if it has lost.
        using Evaluation = clu::move_only_function<float(const State&, Side)>;

        struct SolveResult final
        {
            std::size_t traversed_nodes = 0;
            float score = 0;
            Move move = State::no_move;
        };

        struct Report final
        {
            Move move = State::no_move;
            float score = 0;
            int completed_depth = 0;
            std::size_t traversed_nodes = 0;
            bool timed_out = false;
            bool exhausted = false; //< The last completed depth reached the end of every line
        };

        Searcher(Evaluation evaluation, const SearchOptions& options): eval_(std::move(evaluation)), options_(options)
        {
            if (!eval_)
                throw std::runtime_error("The evaluation function must not be empty");
            validate(options_);
        }

        /// \brief Chooses a move for the side to move, returns State::no_move if there is none.
        /// \details Never throws SearchTimeout. With iterative deepening the move of the deepest completed
        /// iteration is reported, a search cut short by the time budget does not affect the result.
        [[nodiscard]] Report select(const State& state, TimeOracle time_left)
        {
            reset(std::move(time_left));
            Report report;
            const auto moves = state.legal_moves();
            if (std::ranges::empty(moves))
                return report;
            if constexpr (HasOpeningMove<State>)
            {
                if (options_.center_opening && state.move_count() == 0)
                {
                    const Move opening = state.opening_move();
                    if (std::ranges::find(moves, opening) != std::ranges::end(moves))
                    {
                        report.move = opening;
                        return report;
                    }
                }
            }
            if (!options_.iterative)
            {
                try
                {
                    const SolveResult res = search_root(state, options_.depth);
                    report.move = res.move;
                    report.score = res.score;
                    report.completed_depth = options_.depth;
                    report.exhausted = !depth_limited_;
                }
                catch (const SearchTimeout&)
                {
                    report.timed_out = true;
                }
                report.traversed_nodes = nodes_;
                return report;
            }
            try
            {
                for (int depth = 1; options_.max_depth == 0 || depth <= options_.max_depth; depth++)
                {
                    depth_limited_ = false;
                    const SolveResult res = search_root(state, depth);
                    if (res.move != State::no_move)
                    {
                        report.move = res.move;
                        report.score = res.score;
                    }
                    report.completed_depth = depth;
                    if (!depth_limited_) // Deeper searches would see the same tree
                    {
                        report.exhausted = true;
                        break;
                    }
                    check_time();
                }
            }
            catch (const SearchTimeout&)
            {
                report.timed_out = true;
            }
            report.traversed_nodes = nodes_;
            return report;
        }

        /// \brief Searches to a fixed depth with the configured method, throws SearchTimeout on timeout.
        [[nodiscard]] SolveResult search(const State& state, const int depth, TimeOracle time_left = unlimited_time())
        {
            check_depth(depth);
            reset(std::move(time_left));
            return search_root(state, depth);
        }

        [[nodiscard]] SolveResult minimax(const State& state, const int depth, TimeOracle time_left = unlimited_time())
        {
            check_depth(depth);
            reset(std::move(time_left));
            return minimax_root(state, depth);
        }

        [[nodiscard]] SolveResult alpha_beta(
            const State& state, const int depth, TimeOracle time_left = unlimited_time())
        {
            check_depth(depth);
            reset(std::move(time_left));
            return alpha_beta_root(state, depth);
        }

        [[nodiscard]] const SearchOptions& options() const noexcept { return options_; }

    private:
        Evaluation eval_;
        SearchOptions options_;
        TimeOracle time_left_;
        std::size_t nodes_ = 0;
        bool depth_limited_ = false;

        static void check_depth(const int depth)
        {
            if (depth <= 0)
                throw std::runtime_error("Search depth must be positive");
        }

        void reset(TimeOracle time_left)
        {
            time_left_ = std::move(time_left);
            nodes_ = 0;
            depth_limited_ = false;
        }

        void check_time()
        {
            if (time_left_() < options_.timeout_threshold_ms)
                throw SearchTimeout();
        }

        float evaluate_leaf(const State& state, const Side side)
        {
            if (!depth_limited_ && !state.is_winner(side) && !state.is_loser(side))
                depth_limited_ = true;
            return eval_(state, side);
        }

        SolveResult search_root(const State& state, const int depth)
        {
            return options_.method == SearchMethod::alpha_beta ? alpha_beta_root(state, depth)
                                                               : minimax_root(state, depth);
        }

        SolveResult minimax_root(const State& state, const int depth)
        {
            check_time();
            nodes_++;
            const auto moves = state.legal_moves();
            if (std::ranges::empty(moves))
                return {.traversed_nodes = nodes_, .score = 0, .move = State::no_move};
            SolveResult res{.score = -inf, .move = *std::ranges::begin(moves)};
            for (const Move& move : moves)
            {
                if (const float score = min_value(state.forecast(move), depth - 1); score > res.score)
                {
                    res.score = score;
                    res.move = move;
                }
            }
            res.traversed_nodes = nodes_;
            return res;
        }

        float max_value(const State& state, const int depth)
        {
            check_time();
            nodes_++;
            if (depth <= 0)
                return evaluate_leaf(state, state.active_player());
            const auto moves = state.legal_moves();
            if (std::ranges::empty(moves))
                return eval_(state, state.active_player());
            float utility = -inf;
            for (const Move& move : moves)
                utility = std::max(utility, min_value(state.forecast(move), depth - 1));
            return utility;
        }

        // Leaves of min nodes are scored for the side that moved into them
        float min_value(const State& state, const int depth)
        {
            check_time();
            nodes_++;
            if (depth <= 0)
                return evaluate_leaf(state, state.inactive_player());
            const auto moves = state.legal_moves();
            if (std::ranges::empty(moves))
                return eval_(state, state.inactive_player());
            float utility = inf;
            for (const Move& move : moves)
                utility = std::min(utility, max_value(state.forecast(move), depth - 1));
            return utility;
        }

        SolveResult alpha_beta_root(const State& state, const int depth)
        {
            check_time();
            nodes_++;
            const auto moves = state.legal_moves();
            if (std::ranges::empty(moves))
                return {.traversed_nodes = nodes_, .score = 0, .move = State::no_move};
            SolveResult res{.score = -inf, .move = *std::ranges::begin(moves)};
            float alpha = -inf;
            for (const Move& move : moves)
            {
                if (const float score = alpha_beta_min(state.forecast(move), depth - 1, alpha, inf);
                    score > res.score)
                {
                    res.score = score;
                    res.move = move;
                    if (res.score >= inf) // Nothing beats a won game
                        break;
                }
                alpha = std::max(alpha, res.score);
            }
            res.traversed_nodes = nodes_;
            return res;
        }

        float alpha_beta_max(const State& state, const int depth, float alpha, const float beta)
        {
            check_time();
            nodes_++;
            if (depth <= 0)
                return evaluate_leaf(state, state.active_player());
            const auto moves = state.legal_moves();
            if (std::ranges::empty(moves))
                return eval_(state, state.active_player());
            float utility = -inf;
            for (const Move& move : moves)
            {
                utility = std::max(utility, alpha_beta_min(state.forecast(move), depth - 1, alpha, beta));
                if (utility >= beta) // beta-cut
                    return utility;
                alpha = std::max(alpha, utility);
            }
            return utility;
        }

        float alpha_beta_min(const State& state, const int depth, const float alpha, float beta)
        {
            check_time();
            nodes_++;
            if (depth <= 0)
                return evaluate_leaf(state, state.inactive_player());
            const auto moves = state.legal_moves();
            if (std::ranges::empty(moves))
                return eval_(state, state.inactive_player());
            float utility = inf;
            for (const Move& move : moves)
            {
                utility = std::min(utility, alpha_beta_max(state.forecast(move), depth - 1, alpha, beta));
                if (utility <= alpha) // alpha-cut
                    return utility;
                beta = std::min(beta, utility);
            }
            return utility;
        }
    };
} // namespace isl
