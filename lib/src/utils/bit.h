#pragma once

#include <bit>

#include "isola/core/board.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    struct ISOLA_API SetBits
    {
        BitBoard bits;

        struct ISOLA_API Iterator
        {
            BitBoard bits;

            [[nodiscard]] constexpr friend bool operator==(Iterator, Iterator) noexcept = default;
            [[nodiscard]] constexpr int operator*() const noexcept { return std::countr_zero(bits); }

            constexpr Iterator& operator++() noexcept
            {
                bits &= bits - 1;
                return *this;
            }
        };

        [[nodiscard]] constexpr Iterator begin() const noexcept { return Iterator{bits}; }
        [[nodiscard]] constexpr Iterator end() const noexcept { return Iterator{}; }
    };

    inline constexpr BitBoard no_a_file = 0xfefefefe'fefefefeull;
    inline constexpr BitBoard no_h_file = 0x7f7f7f7f'7f7f7f7full;
    inline constexpr BitBoard no_ab_files = 0xfcfcfcfc'fcfcfcfcull;
    inline constexpr BitBoard no_gh_files = 0x3f3f3f3f'3f3f3f3full;

    /// \brief Cells a knight reaches from any set bit, ignoring the board boundary beyond the 8x8 grid.
    /// \details Shifting by a full row moves one row up, shifting by one bit moves one column to the right.
    /// The file masks discard the bits that wrapped around to the other edge of the grid.
    [[nodiscard]] constexpr BitBoard knight_spread(const BitBoard bits) noexcept
    {
        // clang-format off
        return ((bits << 17) & no_a_file)   | ((bits << 15) & no_h_file)
             | ((bits << 10) & no_ab_files) | ((bits << 6)  & no_gh_files)
             | ((bits >> 17) & no_h_file)   | ((bits >> 15) & no_a_file)
             | ((bits >> 10) & no_gh_files) | ((bits >> 6)  & no_ab_files);
        // clang-format on
    }

    /// Mask of the first width columns of the first height rows.
    [[nodiscard]] constexpr BitBoard rectangle_mask(const int width, const int height) noexcept
    {
        const BitBoard row = (1ull << width) - 1;
        BitBoard res = 0;
        for (int i = 0; i < height; i++)
            res |= row << (i * max_board_length);
        return res;
    }
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
