//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares CallSiteWalker, which visits every fixed node reachable
// from a graph's start node in dominator-respecting order and collects the
// call sites that are still inlining candidates (invokes with a resolved
// method target).
//
// Ordering:
// - Successors of ordinary fixed nodes are pushed to the FRONT of the work
//   deque, so straight-line code and branch arms are explored depth-first.
// - A merge is pushed to the BACK of the deque, and only once every forward
//   End feeding it has been visited.  By the time it is dequeued all paths
//   into it have been processed, which approximates a reverse post-order
//   without computing a dominator tree.
// - LoopBegin queues all of its successors immediately; waiting for its
//   LoopEnds would deadlock on the back edge.
//
// Every node is marked visited when it is queued and is therefore dequeued
// at most once.  Violations of the structural contract (a node outside the
// traversal taxonomy, an End with no merge, a count mismatch when checking is
// enabled) terminate through KELP_INVARIANT.  Unknown nodes are never
// skipped.
//
// The walker owns its visited set and deque, never mutates the graph, and is
// single-use: apply() runs once per instance.
//
// Tracing: set KELP_WALK_TRACE in the environment (or CallSiteWalkOptions::
// trace) to print one `[walk]` line per queue decision to stderr.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "graph/Graph.hpp"

#include <deque>
#include <functional>
#include <vector>

namespace kelp::analysis
{

using graph::Graph;
using graph::NodeId;

#ifdef NDEBUG
inline constexpr bool kCheckCallCountByDefault = false;
#else
inline constexpr bool kCheckCallCountByDefault = true;
#endif

/// @brief Configuration for CallSiteWalker.
struct CallSiteWalkOptions
{
    /// Verify after the walk that every resolved invoke in the graph (except
    /// the start node) was discovered.  On in debug builds; tests force it on.
    bool checkCallCount = kCheckCallCountByDefault;

    /// Print queue decisions to stderr.  KELP_WALK_TRACE enables it as well.
    bool trace = false;

    /// Invoked with every node as it leaves the work deque.
    std::function<void(NodeId)> onVisit;
};

class CallSiteWalker
{
  public:
    /// @brief Prepare a walk over @p graph.
    /// @pre @p graph has a live start node (checked; fatal otherwise).
    explicit CallSiteWalker(const Graph &graph);

    CallSiteWalker(const Graph &graph, CallSiteWalkOptions options);

    /// @brief Run the traversal to completion.
    /// @return Resolved invokes in discovery order, excluding the start node.
    std::vector<NodeId> apply();

  private:
    void queueSuccessors(NodeId node);
    void queue(NodeId node);
    void forcedQueue(NodeId node);
    NodeId nextQueuedNode();
    void queueMerge(NodeId end);
    [[nodiscard]] bool visitedAllEnds(NodeId merge) const;

    [[nodiscard]] bool isQueued(NodeId node) const
    {
        return queued_[node.index];
    }

    const Graph &graph_;
    CallSiteWalkOptions options_;
    NodeId start_;
    std::deque<NodeId> nodeQueue_;
    std::vector<bool> queued_;
    bool trace_ = false;
    bool applied_ = false;
};

/// @brief Convenience wrapper: construct a walker over @p graph and apply it.
std::vector<NodeId> discoverCallSites(const Graph &graph, CallSiteWalkOptions options = {});

} // namespace kelp::analysis
