#pragma once

#include <cstdint>

#include "../core/game.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    /// \brief Counts the leaves of the game tree rooted at the given state, stuck positions count as one leaf.
    ISOLA_API std::uint64_t perft(const GameState& state, int depth) noexcept;
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
