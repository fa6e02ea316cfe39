#pragma once

#include <chrono>

#include "../search/search_options.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    /// \brief A point in time on the steady clock at which the current turn runs out.
    class ISOLA_API Deadline final
    {
    public:
        using Clock = std::chrono::steady_clock;

        explicit Deadline(std::chrono::milliseconds budget) noexcept: end_(Clock::now() + budget) {}

        /// Milliseconds until the deadline, negative once it has passed.
        [[nodiscard]] double remaining_ms() const noexcept;
        [[nodiscard]] bool expired() const noexcept { return Clock::now() >= end_; }

        /// A time oracle that reads this deadline.
        [[nodiscard]] TimeOracle oracle() const;

    private:
        Clock::time_point end_;
    };
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
