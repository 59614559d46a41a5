/**
 * @file json.hpp
 * @brief Minimal JSON string helpers for the NDJSON writers.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace exec_engine {

/**
 * @brief Escape a byte string for inclusion inside a JSON string literal.
 *
 * Control characters become \\uXXXX; bytes >= 0x80 pass through unchanged,
 * so well-formed UTF-8 stays well-formed.
 */
[[nodiscard]] std::string json_escape(std::string_view text);

/// Quote and escape: `abc` → `"abc"`.
[[nodiscard]] std::string json_quote(std::string_view text);

/// UTC ISO-8601 with milliseconds, e.g. `2024-05-01T12:00:00.250Z`.
[[nodiscard]] std::string format_timestamp(Timestamp ts);

}  // namespace exec_engine
