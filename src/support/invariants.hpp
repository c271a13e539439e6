//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/invariants.hpp
//
// Purpose:
//   Fatal internal-consistency checks for graph analyses.  A violated
//   invariant means either the analysis is wrong or the graph handed to it
//   breaks the structural contract it assumes; neither is recoverable by the
//   caller, so the process stops with a diagnostic on stderr.
//
// ============================================================================
// ANALYSIS INVARIANTS
// ============================================================================
//
// 1. Walk preconditions
// ---------------------
// - The graph has a start node and the start node is alive.
// - Every node reached through a successor edge has a walk class the walker
//   knows how to dispatch.
//
// 2. Walk bookkeeping
// -------------------
// - A node leaving the work deque has been marked visited.
// - A walker instance runs apply() once.
//
// 3. Completeness
// ---------------
// - When enabled, the discovered call count equals the graph's resolved
//   invoke count.
//
// Unlike assert(), KELP_INVARIANT stays active under NDEBUG.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdio>
#include <cstdlib>

namespace kelp::support
{
/// @brief Report a violated invariant and terminate the process.
[[noreturn]] inline void invariantFailure(const char *message, const char *file, int line)
{
    std::fprintf(stderr, "kelp: invariant violated: %s (%s:%d)\n", message, file, line);
    std::fflush(stderr);
    std::abort();
}
} // namespace kelp::support

/// @brief Check @p condition and abort with @p message when it does not hold.
#define KELP_INVARIANT(condition, message)                                                         \
    do                                                                                             \
    {                                                                                              \
        if (!(condition))                                                                          \
        {                                                                                          \
            ::kelp::support::invariantFailure((message), __FILE__, __LINE__);                      \
        }                                                                                          \
    } while (0)
