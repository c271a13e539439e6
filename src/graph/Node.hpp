//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/graph/Node.hpp
// Purpose: Declares graph node handles and the node record stored in a Graph.
// Key invariants: NodeId indexes the owning Graph's arena; structural
//                 back-references (End -> merge, merge -> ends) are handles,
//                 never ownership edges.
// Ownership/Lifetime: Nodes are owned by their Graph; NodeIds are plain values.
// Links: docs/graph-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "graph/NodeKind.hpp"
#include "support/symbol.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

namespace kelp::graph
{

/// @brief Stable handle naming a node inside one Graph.
struct NodeId
{
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    uint32_t index = kInvalidIndex;

    [[nodiscard]] bool isValid() const
    {
        return index != kInvalidIndex;
    }

    static NodeId invalid()
    {
        return NodeId{};
    }
};

inline bool operator==(NodeId a, NodeId b)
{
    return a.index == b.index;
}

inline bool operator!=(NodeId a, NodeId b)
{
    return a.index != b.index;
}

/// @brief How an invoke names its callee.
enum class CallTargetKind : uint8_t
{
    None,      ///< Not an invoke, or target not yet attached.
    Method,    ///< Statically resolved method descriptor.
    Indirect,  ///< Computed target; callee unknown at compile time.
    Intrinsic  ///< Compiler intrinsic marker; never inlined as a call.
};

/// @brief Call target descriptor attached to Invoke nodes.
struct CallTarget
{
    CallTargetKind kind = CallTargetKind::None;
    support::Symbol callee; ///< Method or intrinsic name; invalid for indirect calls.
};

/// @brief Node record stored in the Graph arena.
struct Node
{
    NodeKind kind = NodeKind::Placeholder;

    /// Cleared by Graph::kill; dead nodes keep their slot and edges.
    bool alive = true;

    /// Outgoing control edges in order.
    std::vector<NodeId> successors;

    /// Data inputs (call arguments and the like); never traversed by control walks.
    std::vector<NodeId> inputs;

    /// End: owning Merge/LoopBegin. LoopEnd and LoopExit: owning LoopBegin.
    NodeId owner;

    /// Merge/LoopBegin: forward End predecessors in binding order.
    std::vector<NodeId> forwardEnds;

    /// LoopBegin: back-edge LoopEnd predecessors.
    std::vector<NodeId> loopEnds;

    /// Invoke only.
    CallTarget target;

    /// Constant value or parameter index for floating nodes.
    int64_t value = 0;
};

} // namespace kelp::graph

namespace std
{
template <> struct hash<kelp::graph::NodeId>
{
    size_t operator()(kelp::graph::NodeId id) const noexcept
    {
        return id.index;
    }
};
} // namespace std
