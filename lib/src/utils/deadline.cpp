#include "isola/utils/deadline.h"

namespace isl
{
    using namespace std::literals;

    double Deadline::remaining_ms() const noexcept { return (end_ - Clock::now()) / 1.0ms; }

    TimeOracle Deadline::oracle() const
    {
        return [deadline = *this] { return deadline.remaining_ms(); };
    }
} // namespace isl
