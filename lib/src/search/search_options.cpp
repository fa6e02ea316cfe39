#include "isola/search/search_options.h"

#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace isl
{
    std::string_view to_string(const SearchMethod method) noexcept
    {
        switch (method)
        {
            case SearchMethod::minimax: return "minimax";
            case SearchMethod::alpha_beta: return "alphabeta";
        }
        return "unknown";
    }

    std::optional<SearchMethod> parse_search_method(const std::string_view name) noexcept
    {
        if (name == "minimax")
            return SearchMethod::minimax;
        if (name == "alphabeta" || name == "alpha_beta")
            return SearchMethod::alpha_beta;
        return std::nullopt;
    }

    void validate(const SearchOptions& options)
    {
        if (options.depth <= 0)
            throw std::runtime_error(std::format("Search depth must be positive, got {}", options.depth));
        if (options.method != SearchMethod::minimax && options.method != SearchMethod::alpha_beta)
            throw std::runtime_error(
                std::format("Unknown search method {}", static_cast<int>(options.method)));
        if (std::isnan(options.timeout_threshold_ms) || options.timeout_threshold_ms < 0)
            throw std::runtime_error(
                std::format("Timeout threshold must be non-negative, got {}ms", options.timeout_threshold_ms));
        if (options.max_depth < 0)
            throw std::runtime_error(std::format("Maximum depth must not be negative, got {}", options.max_depth));
    }

    TimeOracle unlimited_time()
    {
        return [] { return std::numeric_limits<double>::infinity(); };
    }
} // namespace isl
