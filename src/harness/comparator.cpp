/**
 * @file comparator.cpp
 * @brief Output comparison implementation.
 * @author Dimitris Kafetzis
 */

#include "harness/comparator.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace exec_engine {

namespace {

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // anonymous namespace

std::string normalize_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

std::vector<std::string_view> split_tokens(std::string_view text) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) ++i;
        size_t start = i;
        while (i < text.size() && !is_space(text[i])) ++i;
        if (i > start) tokens.push_back(text.substr(start, i - start));
    }
    return tokens;
}

std::optional<double> parse_number(std::string_view token) {
    if (token.empty()) return std::nullopt;
    std::string owned(token);
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(owned.c_str(), &end);
    if (end != owned.c_str() + owned.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool numbers_close(double a, double b, double epsilon) noexcept {
    double diff = std::fabs(a - b);
    if (diff <= epsilon) return true;
    return diff <= epsilon * std::max(std::fabs(a), std::fabs(b));
}

bool outputs_match(std::string_view expected, std::string_view actual,
                   ComparisonMode mode, double epsilon) {
    switch (mode) {
        case ComparisonMode::Exact:
            return expected == actual;

        case ComparisonMode::Whitespace:
            return normalize_whitespace(expected) == normalize_whitespace(actual);

        case ComparisonMode::Numeric: {
            auto want = split_tokens(expected);
            auto got = split_tokens(actual);
            if (want.size() != got.size()) return false;
            for (size_t i = 0; i < want.size(); ++i) {
                auto a = parse_number(want[i]);
                auto b = parse_number(got[i]);
                if (a && b) {
                    if (!numbers_close(*a, *b, epsilon)) return false;
                } else if (want[i] != got[i]) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

}  // namespace exec_engine
