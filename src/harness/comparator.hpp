/**
 * @file comparator.hpp
 * @brief Expected-vs-actual output comparison modes.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace exec_engine {

/// Collapse whitespace runs to one space and trim both ends.
[[nodiscard]] std::string normalize_whitespace(std::string_view text);

[[nodiscard]] std::vector<std::string_view> split_tokens(std::string_view text);

/// The token as a finite double, when all of it parses as one.
[[nodiscard]] std::optional<double> parse_number(std::string_view token);

/// |a - b| within epsilon, absolutely or relative to the larger magnitude.
[[nodiscard]] bool numbers_close(double a, double b, double epsilon) noexcept;

/**
 * @brief Compare program output against the expected output.
 *
 *   Exact       byte-for-byte
 *   Whitespace  equal after normalize_whitespace()
 *   Numeric     same token count; numeric tokens within epsilon,
 *               other tokens equal
 */
[[nodiscard]] bool outputs_match(std::string_view expected, std::string_view actual,
                                 ComparisonMode mode, double epsilon = 1e-6);

}  // namespace exec_engine
