#pragma once

#include "player.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    class ISOLA_API RandomPlayer final : public Player
    {
    public:
        [[nodiscard]] Coords get_move(const GameState& game, TimeOracle time_left) override;
    };
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
