//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the textual serializer for graphs.  Every node is printed on its
// own line using the mnemonic from the node kind table followed by its
// kind-specific operands and successor list.
//
//===----------------------------------------------------------------------===//

#include "graph/io/Serializer.hpp"

#include "graph/Graph.hpp"

#include <sstream>
#include <vector>

namespace kelp::io
{
namespace
{
using graph::CallTargetKind;
using graph::Graph;
using graph::NodeId;
using graph::NodeKind;

void writeLabel(std::ostream &os, NodeId id)
{
    os << '%' << id.index;
}

void writeLabelList(std::ostream &os, const std::vector<NodeId> &ids)
{
    for (size_t i = 0; i < ids.size(); ++i)
    {
        if (i)
            os << ", ";
        writeLabel(os, ids[i]);
    }
}

void writeInvokeOperands(const Graph &g, NodeId id, std::ostream &os)
{
    const graph::CallTarget &target = g.callTarget(id);
    switch (target.kind)
    {
        case CallTargetKind::Method:
            os << " @" << g.calleeName(id);
            break;
        case CallTargetKind::Intrinsic:
            os << " intrinsic @" << g.calleeName(id);
            break;
        case CallTargetKind::Indirect:
            os << " indirect";
            break;
        case CallTargetKind::None:
            break;
    }
    const auto &args = g.inputs(id);
    if (!args.empty())
    {
        os << '(';
        writeLabelList(os, args);
        os << ')';
    }
}

void writeOperands(const Graph &g, NodeId id, std::ostream &os)
{
    const graph::Node &n = g.node(id);
    switch (n.kind)
    {
        case NodeKind::Invoke:
            writeInvokeOperands(g, id, os);
            break;
        case NodeKind::Merge:
        case NodeKind::LoopBegin:
            if (n.kind == NodeKind::Merge || !n.forwardEnds.empty())
            {
                os << " [";
                writeLabelList(os, n.forwardEnds);
                os << ']';
            }
            break;
        case NodeKind::LoopEnd:
        case NodeKind::LoopExit:
            if (n.owner.isValid())
            {
                os << ' ';
                writeLabel(os, n.owner);
            }
            break;
        case NodeKind::Constant:
        case NodeKind::Parameter:
            os << ' ' << n.value;
            break;
        default:
            break;
    }
}

} // namespace

void Serializer::write(const Graph &g, std::ostream &os)
{
    os << "graph @" << (g.name().empty() ? "anon" : g.name()) << '\n';
    for (NodeId id : g.nodeIds())
    {
        const graph::Node &n = g.node(id);
        writeLabel(os, id);
        os << " = " << graph::toString(n.kind);
        writeOperands(g, id, os);
        if (!n.successors.empty())
        {
            os << " -> ";
            writeLabelList(os, n.successors);
        }
        if (!n.alive)
            os << " !dead";
        os << '\n';
    }
    if (g.hasStart())
    {
        os << "entry ";
        writeLabel(os, g.start());
        os << '\n';
    }
}

std::string Serializer::toString(const Graph &g)
{
    std::ostringstream oss;
    write(g, oss);
    return oss.str();
}

} // namespace kelp::io
