#include "isola/search/game_searcher.h"

namespace isl
{
    static_assert(HasOpeningMove<GameState>);

    template class Searcher<GameState>;
} // namespace isl
