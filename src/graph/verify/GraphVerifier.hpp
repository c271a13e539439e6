//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/graph/verify/GraphVerifier.hpp
// Purpose: Structural verification for graphs that arrive from outside the
//          process (parsed text) before analyses run on them.
// Key invariants: Verification never mutates the graph.  A graph that passes
//                 satisfies every structural precondition CallSiteWalker
//                 relies on.
// Links: docs/graph-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

namespace kelp::graph
{
class Graph;
}

namespace kelp::verify
{

class GraphVerifier
{
  public:
    /// @brief Verify @p g and return the first problem found.
    [[nodiscard]] static support::Expected<void> verify(const graph::Graph &g);

    /// @brief Verify @p g, reporting every problem to @p diags.
    /// @return True when no errors were reported.
    static bool verify(const graph::Graph &g, support::DiagnosticEngine &diags);
};

} // namespace kelp::verify
