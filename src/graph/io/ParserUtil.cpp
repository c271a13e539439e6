//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Purpose: Implements lexical helpers shared by the graph text parser.
// Key invariants: Operates on ASCII-compatible strings.
// Ownership/Lifetime: Functions allocate new std::string instances as needed.
// Links: docs/graph-format.md
//
//===----------------------------------------------------------------------===//

#include "graph/io/ParserUtil.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

namespace kelp::io
{

std::string trim(std::string_view text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return std::string{text.substr(begin, end - begin)};
}

std::vector<std::string> splitCommaSeparated(std::string_view text)
{
    std::vector<std::string> tokens;
    if (trim(text).empty())
        return tokens;
    std::stringstream ss(std::string{text});
    std::string piece;
    while (std::getline(ss, piece, ','))
        tokens.push_back(trim(piece));
    // getline drops a trailing empty field; keep it so `%a,` is rejected.
    if (!text.empty() && text.back() == ',')
        tokens.emplace_back();
    return tokens;
}

std::string formatLineDiag(unsigned lineNo, std::string_view message)
{
    std::ostringstream oss;
    oss << "line " << lineNo << ": " << message;
    return oss.str();
}

bool parseIntegerLiteral(std::string_view token, int64_t &value)
{
    if (token.empty())
        return false;
    const char *first = token.data();
    const char *last = token.data() + token.size();
    if (*first == '+')
        ++first;
    int64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc() || ptr != last || first == last)
        return false;
    value = parsed;
    return true;
}

bool isLabelToken(std::string_view token)
{
    return token.size() > 1 && token.front() == '%';
}

} // namespace kelp::io
