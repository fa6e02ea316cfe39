#include <chrono>
#include <cstdint>
#include <iterator>

#include <clu/text/print.h>
#include <clu/chrono_utils.h>
#include <isola/utils/perft.h>

namespace
{
    // Leaf counts of the 7x7 knight's move Isolation tree, stuck positions count as leaves
    constexpr std::uint64_t expected_values[]{1, 49, 2352, 11280, 52672};
} // namespace

int main()
{
    using namespace std::literals;
    clu::println("[Perft]");
    const isl::GameState initial;
    for (int i = 1; i <= 6; i++)
    {
        std::uint64_t res;
        const auto elapsed = clu::timeit([&] { res = isl::perft(initial, i); });
        clu::println("Depth {}: {:12} nodes (elapsed {:.3f}ms)", i, res, elapsed / 1.0ms);
        if (i < static_cast<int>(std::size(expected_values)) && res != expected_values[i])
        {
            clu::println("ERROR! Expected: {} nodes", expected_values[i]);
            return 1;
        }
    }
}
