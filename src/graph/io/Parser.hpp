//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Parser class, which reads the line-oriented graph
// text format and populates a Graph.  The Parser is the inverse of the
// Serializer; together they let tools and tests keep graphs as files.
//
// Format summary (one node per line, `#` starts a comment):
//
//   graph @name
//   %0 = start -> %1
//   %1 = invoke @callee(%9) -> %2
//   %2 = if -> %3, %4
//   %3 = begin -> %5
//   %5 = end
//   %7 = merge [%5, %6] -> %8
//   %10 = loopbegin [%x] -> %11, %12
//   %13 = loopend %10
//   %12 = loopexit %10 -> %14
//   %9 = const 42
//   entry %0
//
// Labels are arbitrary `%name` tokens and may be referenced before they are
// declared.  Nodes are allocated in declaration order.  When no `entry`
// directive is present the unique `start` node becomes the entry.  A trailing
// `!dead` marks a node that was killed.
//
// Parse errors are returned as Expected<void> diagnostics prefixed with
// `line N:`.  The parser checks syntax and reference kinds only; structural
// rules (successor arity, merge shape) belong to GraphVerifier.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <istream>

namespace kelp::graph
{
class Graph;
}

namespace kelp::io
{

/// @brief Hand-rolled parser for the textual graph format.
class Parser
{
  public:
    /// @brief Parse graph text from @p is into @p g.
    /// @return Expected success or diagnostic on failure.
    [[nodiscard]] static support::Expected<void> parse(std::istream &is, graph::Graph &g);
};

} // namespace kelp::io
