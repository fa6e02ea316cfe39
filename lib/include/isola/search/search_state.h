#pragma once

#include <concepts>
#include <ranges>

namespace isl
{
    /// \brief An immutable two-player game position the searcher can explore.
    /// \details legal_moves() enumerates the moves of the side to move, forecast() returns the position after
    /// one of them without modifying the state it is called on.
    template <typename S>
    concept SearchState = std::copyable<S> && std::equality_comparable<typename S::Move> &&
        requires(const S& state, const typename S::Move& move, const typename S::Side side) {
            { S::no_move } -> std::convertible_to<typename S::Move>;
            { state.legal_moves() } -> std::ranges::input_range;
            { state.forecast(move) } -> std::convertible_to<S>;
            { state.active_player() } -> std::same_as<typename S::Side>;
            { state.inactive_player() } -> std::same_as<typename S::Side>;
            { state.is_winner(side) } -> std::convertible_to<bool>;
            { state.is_loser(side) } -> std::convertible_to<bool>;
        };

    /// A state that knows how many moves were played and which move opens the game.
    template <typename S>
    concept HasOpeningMove = SearchState<S> && requires(const S& state) {
        { state.move_count() } -> std::convertible_to<int>;
        { state.opening_move() } -> std::convertible_to<typename S::Move>;
    };
} // namespace isl
