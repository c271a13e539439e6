//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Purpose: Declares lexical helpers shared by the graph text parser.
// Key invariants: None.
// Ownership/Lifetime: Stateless utility routines operate on caller-provided data.
// Links: docs/graph-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kelp::io
{

/// @brief Remove leading and trailing whitespace from @p text.
[[nodiscard]] std::string trim(std::string_view text);

/// @brief Split comma-separated text into trimmed tokens.
/// @details An empty or all-whitespace input yields an empty vector.
[[nodiscard]] std::vector<std::string> splitCommaSeparated(std::string_view text);

/// @brief Prefix @p message with `line N: `.
[[nodiscard]] std::string formatLineDiag(unsigned lineNo, std::string_view message);

/// @brief Parse a whole token as a signed decimal integer.
bool parseIntegerLiteral(std::string_view token, int64_t &value);

/// @brief True when @p token is a `%label` reference with a non-empty name.
[[nodiscard]] bool isLabelToken(std::string_view token);

} // namespace kelp::io
