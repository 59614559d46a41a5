/**
 * @file types.cpp
 * @brief Parsers for the textual forms of shared enums.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

namespace exec_engine {

std::optional<Priority> parse_priority(std::string_view text) noexcept {
    if (text == "low")    return Priority::Low;
    if (text == "normal") return Priority::Normal;
    if (text == "high")   return Priority::High;
    return std::nullopt;
}

std::optional<ComparisonMode> parse_comparison_mode(std::string_view text) noexcept {
    if (text == "exact")                        return ComparisonMode::Exact;
    if (text == "whitespace" || text == "ws")   return ComparisonMode::Whitespace;
    if (text == "numeric")                      return ComparisonMode::Numeric;
    return std::nullopt;
}

}  // namespace exec_engine
