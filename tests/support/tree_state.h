#pragma once

#include <array>
#include <cstddef>
#include <random>
#include <vector>

#include <isola/search/search_state.h>

namespace isl::test
{
    /// \brief An explicit game tree, node 0 is the root and side 0 moves first.
    /// \details Every node carries one heuristic score per side, so tests can tell apart which side a leaf is
    /// evaluated for. A node may be marked as won by one of the sides.
    struct Tree
    {
        struct Node
        {
            std::vector<int> children;
            std::array<float, 2> scores{};
            int winner = -1;
        };

        std::vector<Node> nodes{Node{}};

        /// Adds a child to a node and returns its index.
        int add(const int parent, const float score_for_0, const float score_for_1)
        {
            nodes.push_back({.children = {}, .scores = {score_for_0, score_for_1}});
            const int index = static_cast<int>(nodes.size()) - 1;
            nodes[static_cast<std::size_t>(parent)].children.push_back(index);
            return index;
        }

        int add(const int parent, const float score) { return add(parent, score, score); }

        const Node& operator[](const int index) const { return nodes[static_cast<std::size_t>(index)]; }
        Node& operator[](const int index) { return nodes[static_cast<std::size_t>(index)]; }

        /// \brief A complete tree with the given branching factor and height, leaf scores drawn uniformly.
        static Tree random(std::mt19937& rng, const int branching, const int height, const int max_score)
        {
            Tree tree;
            std::uniform_int_distribution<int> dist(-max_score, max_score);
            std::vector<int> frontier{0};
            for (int level = 0; level < height; level++)
            {
                std::vector<int> next;
                for (const int parent : frontier)
                    for (int i = 0; i < branching; i++)
                        next.push_back(tree.add(parent, static_cast<float>(dist(rng)), static_cast<float>(dist(rng))));
                frontier = std::move(next);
            }
            return tree;
        }
    };

    struct TreeState
    {
        using Move = int;
        using Side = int;
        static constexpr Move no_move = -1;

        const Tree* tree = nullptr;
        int node = 0;
        Side side = 0;

        [[nodiscard]] std::vector<Move> legal_moves() const
        {
            std::vector<Move> res;
            for (std::size_t i = 0; i < (*tree)[node].children.size(); i++)
                res.push_back(static_cast<Move>(i));
            return res;
        }

        [[nodiscard]] TreeState forecast(const Move move) const
        {
            return {.tree = tree, .node = (*tree)[node].children[static_cast<std::size_t>(move)], .side = 1 - side};
        }

        [[nodiscard]] Side active_player() const noexcept { return side; }
        [[nodiscard]] Side inactive_player() const noexcept { return 1 - side; }
        [[nodiscard]] bool is_winner(const Side s) const { return (*tree)[node].winner == s; }
        [[nodiscard]] bool is_loser(const Side s) const { return (*tree)[node].winner == 1 - s; }
    };

    static_assert(SearchState<TreeState>);
    static_assert(!HasOpeningMove<TreeState>);

    /// Scores a tree node with the score stored for the requested side, counting the calls and recording the
    /// evaluated nodes.
    struct TreeEvaluation
    {
        std::size_t* calls = nullptr;
        std::vector<int>* evaluated = nullptr;

        float operator()(const TreeState& state, const int side) const
        {
            if (calls)
                ++*calls;
            if (evaluated)
                evaluated->push_back(state.node);
            return (*state.tree)[state.node].scores[static_cast<std::size_t>(side)];
        }
    };
} // namespace isl::test
