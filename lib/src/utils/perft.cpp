#include "isola/utils/perft.h"
#include "bit.h"

namespace isl
{
    std::uint64_t perft(const GameState& state, const int depth) noexcept
    {
        if (depth == 0)
            return 1;
        const BitBoard moves = state.legal_move_mask(state.current);
        if (moves == 0)
            return 1;
        std::uint64_t result = 0;
        for (const int move : SetBits{moves})
            result += perft(state.forecast(static_cast<Coords>(move)), depth - 1);
        return result;
    }
} // namespace isl
