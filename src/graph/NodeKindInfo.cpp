//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Materialises the node kind metadata table from NodeKind.def and provides
// mnemonic lookups for the text format.
//
//===----------------------------------------------------------------------===//

#include "graph/NodeKind.hpp"

namespace kelp::graph
{

const std::array<NodeKindInfo, kNumNodeKinds> kNodeKindTable = {{
#define KELP_NODE_KIND(NAME, MNEMONIC, WALK_CLASS, FIXED, MIN_SUCC, MAX_SUCC)                      \
    {MNEMONIC, WALK_CLASS, FIXED, MIN_SUCC, MAX_SUCC},
#include "graph/NodeKind.def"
#undef KELP_NODE_KIND
}};

static_assert(kNodeKindTable.size() == kNumNodeKinds, "Node kind table must match enum count");

const NodeKindInfo &getNodeKindInfo(NodeKind kind)
{
    return kNodeKindTable[static_cast<size_t>(kind)];
}

std::string_view toString(NodeKind kind)
{
    const auto index = static_cast<size_t>(kind);
    if (index < kNodeKindTable.size())
        return kNodeKindTable[index].mnemonic;
    return "<invalid>";
}

std::string_view toString(WalkClass cls)
{
    switch (cls)
    {
        case WalkClass::Start:
            return "start";
        case WalkClass::FixedWithNext:
            return "fixed-with-next";
        case WalkClass::Invoke:
            return "invoke";
        case WalkClass::LoopBegin:
            return "loop-begin";
        case WalkClass::LoopEnd:
            return "loop-end";
        case WalkClass::Merge:
            return "merge";
        case WalkClass::End:
            return "end";
        case WalkClass::ControlSink:
            return "control-sink";
        case WalkClass::ControlSplit:
            return "control-split";
        case WalkClass::Floating:
            return "floating";
        case WalkClass::Unclassified:
            return "unclassified";
    }
    return "<invalid>";
}

/// @brief Linear scan over the kind table; the table is small and lookups
///        happen once per parsed line.
std::optional<NodeKind> nodeKindFromMnemonic(std::string_view mnemonic)
{
    for (size_t index = 0; index < kNodeKindTable.size(); ++index)
    {
        if (mnemonic == kNodeKindTable[index].mnemonic)
            return static_cast<NodeKind>(index);
    }
    return std::nullopt;
}

} // namespace kelp::graph
