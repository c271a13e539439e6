//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares Graph, the arena that holds the control skeleton of one
// method body.  Fixed nodes carry ordered successor edges; floating nodes only
// carry data and are reachable solely through inputs.
//
// Structural relations that point "backwards" in control flow are kept as
// handles on both sides:
// - An End knows the Merge or LoopBegin it feeds (its owner), and the merge
//   lists its forward Ends in binding order.
// - A LoopEnd knows its LoopBegin, which lists its loop ends.
//
// Graph exposes a small mutation API used by GraphBuilder and the text parser,
// and a read-only query API used by analyses.  Analyses receive a const Graph
// and never mutate it.  Passing a handle that does not name a node of this
// graph to any query is a programming error and terminates via
// KELP_INVARIANT.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "graph/Node.hpp"
#include "support/string_interner.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kelp::graph
{

class Graph
{
  public:
    explicit Graph(std::string name = {});

    const std::string &name() const
    {
        return name_;
    }

    void setName(std::string name)
    {
        name_ = std::move(name);
    }

    // Mutation -----------------------------------------------------------

    /// @brief Append a node of @p kind to the arena.
    NodeId addNode(NodeKind kind);

    /// @brief Append control edge @p from -> @p to.
    void addSuccessor(NodeId from, NodeId to);

    /// @brief Append data input @p input to @p node.
    void addInput(NodeId node, NodeId input);

    /// @brief Record @p end as the next forward End of merge-like node @p merge.
    /// @pre @p end is an End without an owner; @p merge is a Merge or LoopBegin.
    void bindEnd(NodeId end, NodeId merge);

    /// @brief Record @p loopEnd as a back edge of @p loopBegin.
    void bindLoopEnd(NodeId loopEnd, NodeId loopBegin);

    /// @brief Attach @p loopExit to the loop it leaves.
    void bindLoopExit(NodeId loopExit, NodeId loopBegin);

    /// @brief Attach a call target to Invoke @p invoke.
    /// @param callee Method or intrinsic name; ignored for indirect targets.
    void setCallTarget(NodeId invoke, CallTargetKind kind, std::string_view callee = {});

    /// @brief Store a constant value or parameter index on a floating node.
    void setValue(NodeId node, int64_t value);

    /// @brief Designate @p id as the graph entry.
    void setStart(NodeId id);

    /// @brief Mark @p id dead; its slot and edges are retained.
    void kill(NodeId id);

    // Queries ------------------------------------------------------------

    [[nodiscard]] bool hasStart() const
    {
        return start_.isValid();
    }

    NodeId start() const
    {
        return start_;
    }

    size_t size() const
    {
        return nodes_.size();
    }

    [[nodiscard]] bool contains(NodeId id) const
    {
        return id.isValid() && id.index < nodes_.size();
    }

    [[nodiscard]] bool isAlive(NodeId id) const;

    const Node &node(NodeId id) const;

    NodeKind kind(NodeId id) const;

    const std::vector<NodeId> &successors(NodeId id) const;

    const std::vector<NodeId> &inputs(NodeId id) const;

    /// @brief Merge or LoopBegin fed by End @p end; invalid when unbound.
    NodeId ownerMerge(NodeId end) const;

    /// @brief LoopBegin named by LoopEnd or LoopExit @p id; invalid when unbound.
    NodeId ownerLoop(NodeId id) const;

    const std::vector<NodeId> &forwardEnds(NodeId merge) const;

    size_t forwardEndCount(NodeId merge) const;

    NodeId forwardEndAt(NodeId merge, size_t index) const;

    const std::vector<NodeId> &loopEnds(NodeId loopBegin) const;

    const CallTarget &callTarget(NodeId invoke) const;

    /// @brief Callee spelling for an invoke; empty for indirect targets.
    std::string_view calleeName(NodeId invoke) const;

    /// @brief True for live Invoke nodes whose target is a method descriptor.
    [[nodiscard]] bool isResolvedInvoke(NodeId id) const;

    /// @brief Number of live resolved invokes anywhere in the graph.
    size_t resolvedInvokeCount() const;

    /// @brief Handles of every node in arena order.
    std::vector<NodeId> nodeIds() const;

  private:
    Node &mutableNode(NodeId id);

    std::string name_;
    std::vector<Node> nodes_;
    NodeId start_;
    support::StringInterner callees_;
};

/// @brief Classify @p id for fixed-node traversals.
/// @details Invokes without a method target classify as FixedWithNext: they
///          are walked like straight-line code but are not call-site
///          candidates.
WalkClass walkClassOf(const Graph &graph, NodeId id);

} // namespace kelp::graph
