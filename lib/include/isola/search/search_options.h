#pragma once

#include <cstdint>
#include <exception>
#include <limits>
#include <optional>
#include <string_view>
#include <clu/function.h>

#include "../core/macros.h"

ISOLA_SUPPRESS_EXPORT_WARNING

namespace isl
{
    inline constexpr float inf = std::numeric_limits<float>::infinity();

    enum class SearchMethod : std::uint8_t
    {
        minimax,
        alpha_beta
    };

    [[nodiscard]] ISOLA_API std::string_view to_string(SearchMethod method) noexcept;

    /// \brief Parses "minimax", "alphabeta" or "alpha_beta".
    [[nodiscard]] ISOLA_API std::optional<SearchMethod> parse_search_method(std::string_view name) noexcept;

    struct SearchOptions
    {
        int depth = 3; //< Search depth when iterative deepening is disabled
        SearchMethod method = SearchMethod::minimax;
        bool iterative = true;
        double timeout_threshold_ms = 10.0; //< The search is aborted once less time than this remains
        bool center_opening = true; //< Play the center cell without searching on an untouched board
        int max_depth = 0; //< Deepest iteration of iterative deepening, 0 for no limit
    };

    /// \brief Throws std::runtime_error if the options cannot configure a search.
    ISOLA_API void validate(const SearchOptions& options);

    /// \brief Raised from inside a search when the time budget runs out, unwinding the whole search.
    class ISOLA_API SearchTimeout final : public std::exception
    {
    public:
        [[nodiscard]] const char* what() const noexcept override { return "Search timed out"; }
    };

    /// Returns the time left for the current move in milliseconds.
    using TimeOracle = clu::move_only_function<double()>;

    [[nodiscard]] ISOLA_API TimeOracle unlimited_time();
} // namespace isl

ISOLA_RESTORE_EXPORT_WARNING
