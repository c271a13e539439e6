//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/graph/NodeKind.hpp
// Purpose: Enumerates graph node kinds and the walk classes they map onto.
// Key invariants: NodeKind values mirror NodeKind.def; the kind table covers
//                 every enumerator exactly once.
// Ownership/Lifetime: Metadata is static storage duration and read-only.
// Links: docs/graph-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace kelp::graph
{

/// @brief Sentinel successor bound for kinds with an open-ended successor list.
inline constexpr uint8_t kVariadicSuccessorCount = std::numeric_limits<uint8_t>::max();

/// @brief Control-flow role of a node as seen by fixed-node traversals.
enum class WalkClass : uint8_t
{
    Start,         ///< Unique graph entry.
    FixedWithNext, ///< Straight-line fixed node with a single successor.
    Invoke,        ///< Call site with a resolved method target.
    LoopBegin,     ///< Loop header; body entry plus loop exits.
    LoopEnd,       ///< Back edge into a loop header.
    Merge,         ///< Join of two or more forward Ends.
    End,           ///< Forward edge into a merge.
    ControlSink,   ///< Return, unwind or deoptimize.
    ControlSplit,  ///< If or switch.
    Floating,      ///< Data-only node, never part of the control skeleton.
    Unclassified   ///< Fixed node outside the traversal taxonomy.
};

/// @brief All node kinds that may appear in a graph.
enum class NodeKind : uint8_t
{
#define KELP_NODE_KIND(NAME, ...) NAME,
#include "graph/NodeKind.def"
#undef KELP_NODE_KIND
    Count
};

inline constexpr size_t kNumNodeKinds = static_cast<size_t>(NodeKind::Count);

/// @brief Static description of a node kind.
struct NodeKindInfo
{
    const char *mnemonic;  ///< Text-format spelling.
    WalkClass walkClass;   ///< Role in fixed-node traversals.
    bool fixed;            ///< Participates in the control skeleton.
    uint8_t minSuccessors; ///< Minimum successor count.
    uint8_t maxSuccessors; ///< Maximum successor count or kVariadicSuccessorCount.
};

/// @brief Metadata table indexed by NodeKind enumerators.
extern const std::array<NodeKindInfo, kNumNodeKinds> kNodeKindTable;

const NodeKindInfo &getNodeKindInfo(NodeKind kind);

/// @brief Text-format mnemonic for @p kind.
std::string_view toString(NodeKind kind);

/// @brief Debug name for @p cls.
std::string_view toString(WalkClass cls);

/// @brief Resolve a text-format mnemonic back to its kind.
std::optional<NodeKind> nodeKindFromMnemonic(std::string_view mnemonic);

[[nodiscard]] inline bool isFixed(NodeKind kind)
{
    return getNodeKindInfo(kind).fixed;
}

/// @brief Kinds that can own forward Ends.
[[nodiscard]] inline bool isMergeLike(NodeKind kind)
{
    return kind == NodeKind::Merge || kind == NodeKind::LoopBegin;
}

} // namespace kelp::graph
