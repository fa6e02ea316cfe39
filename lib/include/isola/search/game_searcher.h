#pragma once

#include "searcher.h"
#include "../core/game.h"

namespace isl
{
    extern template class Searcher<GameState>;

    using GameSearcher = Searcher<GameState>;
} // namespace isl
