//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares GraphBuilder, the programmatic way to assemble control
// skeletons for tests, examples and the text parser.
//
// The builder keeps an insertion point: the fixed node that receives the next
// appended node as a successor.  Appending moves the insertion point to the new
// node unless that node cannot have successors (End, LoopEnd, control sinks),
// in which case the insertion point is cleared and the caller selects the next
// one explicitly.
//
// Typical usage (diamond):
//   Graph g("diamond");
//   GraphBuilder b(g);
//   b.startGraph();
//   auto arms = b.ifSplit();
//   b.setInsertPoint(arms[0]);
//   NodeId e0 = b.end();
//   b.setInsertPoint(arms[1]);
//   NodeId e1 = b.end();
//   b.merge({e0, e1});
//   b.invoke("callee");
//   b.ret();
//
// The builder does NOT own the Graph it operates on.  Misuse (appending without
// an insertion point, overfilling a node's successor list, binding a non-End
// into a merge) is a programming error reported with std::logic_error.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "graph/Graph.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace kelp::build
{

using graph::Graph;
using graph::NodeId;
using graph::NodeKind;

/// @brief Helper to assemble graphs edge by edge.
class GraphBuilder
{
  public:
    explicit GraphBuilder(Graph &g);

    /// @brief Create the Start node, designate it as entry and insert after it.
    NodeId startGraph();

    void setInsertPoint(NodeId id);

    NodeId insertPoint() const
    {
        return cursor_;
    }

    [[nodiscard]] bool hasInsertPoint() const
    {
        return cursor_.isValid();
    }

    void clearInsertPoint()
    {
        cursor_ = NodeId::invalid();
    }

    /// @brief Create a fixed node of @p kind as the next successor of the insertion point.
    /// @throws std::logic_error without an insertion point or when it is full.
    NodeId append(NodeKind kind);

    /// @brief Append a call with a resolved method target.
    NodeId invoke(std::string_view callee, const std::vector<NodeId> &args = {});

    /// @brief Append a call through a computed target.
    NodeId indirectInvoke(const std::vector<NodeId> &args = {});

    /// @brief Append a call to compiler intrinsic @p name.
    NodeId intrinsicInvoke(std::string_view name, const std::vector<NodeId> &args = {});

    /// @brief Append an If with two Begin arms; clears the insertion point.
    /// @return Begin nodes for the true and false arms.
    std::vector<NodeId> ifSplit();

    /// @brief Append a Switch with @p arms Begin arms; clears the insertion point.
    std::vector<NodeId> switchSplit(size_t arms);

    /// @brief Add a Begin successor to @p from without moving the insertion point.
    NodeId begin(NodeId from);

    /// @brief Append an End; it stays unbound until passed to merge().
    NodeId end();

    /// @brief Create a Merge fed by @p ends and insert after it.
    NodeId merge(const std::vector<NodeId> &ends);

    /// @brief Append a LoopBegin directly after the insertion point and insert after it.
    NodeId loopBegin();

    /// @brief Create a LoopBegin entered through @p forwardEnds and insert after it.
    NodeId loopBegin(const std::vector<NodeId> &forwardEnds);

    /// @brief Add a LoopExit successor to @p loopBegin without moving the insertion point.
    NodeId loopExit(NodeId loopBegin);

    /// @brief Append a back edge to @p loopBegin; clears the insertion point.
    NodeId loopEnd(NodeId loopBegin);

    NodeId ret();

    NodeId unwind();

    NodeId deoptimize();

    NodeId guard();

    /// @brief Append a fixed node outside the traversal taxonomy.
    NodeId placeholder();

    /// @brief Create a floating constant.
    NodeId constant(int64_t value);

    /// @brief Create a floating parameter reference.
    NodeId parameter(int64_t index);

  private:
    NodeId appendInvoke(graph::CallTargetKind target,
                        std::string_view callee,
                        const std::vector<NodeId> &args);
    NodeId createMergeLike(NodeKind kind, const std::vector<NodeId> &ends);
    void link(NodeId from, NodeId to);

    Graph &g_;
    NodeId cursor_;
};

} // namespace kelp::build
