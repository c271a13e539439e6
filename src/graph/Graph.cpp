//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Graph node arena: node allocation, edge wiring, merge/loop
// back-reference bookkeeping, and the read-only queries analyses rely on.
//
//===----------------------------------------------------------------------===//

#include "graph/Graph.hpp"

#include "support/invariants.hpp"

#include <utility>

namespace kelp::graph
{

Graph::Graph(std::string name) : name_(std::move(name)) {}

NodeId Graph::addNode(NodeKind kind)
{
    KELP_INVARIANT(nodes_.size() < NodeId::kInvalidIndex, "graph node arena exhausted");
    Node n;
    n.kind = kind;
    nodes_.push_back(std::move(n));
    return NodeId{static_cast<uint32_t>(nodes_.size() - 1)};
}

void Graph::addSuccessor(NodeId from, NodeId to)
{
    KELP_INVARIANT(contains(to), "successor does not belong to this graph");
    mutableNode(from).successors.push_back(to);
}

void Graph::addInput(NodeId node, NodeId input)
{
    KELP_INVARIANT(contains(input), "input does not belong to this graph");
    mutableNode(node).inputs.push_back(input);
}

void Graph::bindEnd(NodeId end, NodeId merge)
{
    Node &e = mutableNode(end);
    Node &m = mutableNode(merge);
    KELP_INVARIANT(e.kind == NodeKind::End, "bindEnd expects an End node");
    KELP_INVARIANT(isMergeLike(m.kind), "bindEnd expects a Merge or LoopBegin owner");
    KELP_INVARIANT(!e.owner.isValid(), "End is already bound to a merge");
    e.owner = merge;
    m.forwardEnds.push_back(end);
}

void Graph::bindLoopEnd(NodeId loopEnd, NodeId loopBegin)
{
    Node &e = mutableNode(loopEnd);
    Node &lb = mutableNode(loopBegin);
    KELP_INVARIANT(e.kind == NodeKind::LoopEnd, "bindLoopEnd expects a LoopEnd node");
    KELP_INVARIANT(lb.kind == NodeKind::LoopBegin, "bindLoopEnd expects a LoopBegin owner");
    KELP_INVARIANT(!e.owner.isValid(), "LoopEnd is already bound to a loop");
    e.owner = loopBegin;
    lb.loopEnds.push_back(loopEnd);
}

void Graph::bindLoopExit(NodeId loopExit, NodeId loopBegin)
{
    Node &x = mutableNode(loopExit);
    KELP_INVARIANT(x.kind == NodeKind::LoopExit, "bindLoopExit expects a LoopExit node");
    KELP_INVARIANT(kind(loopBegin) == NodeKind::LoopBegin, "bindLoopExit expects a LoopBegin");
    x.owner = loopBegin;
}

void Graph::setCallTarget(NodeId invoke, CallTargetKind kind, std::string_view callee)
{
    Node &n = mutableNode(invoke);
    KELP_INVARIANT(n.kind == NodeKind::Invoke, "call targets attach to Invoke nodes only");
    n.target.kind = kind;
    n.target.callee = kind == CallTargetKind::Indirect || callee.empty() ? support::Symbol{}
                                                                         : callees_.intern(callee);
}

void Graph::setValue(NodeId node, int64_t value)
{
    mutableNode(node).value = value;
}

void Graph::setStart(NodeId id)
{
    KELP_INVARIANT(contains(id), "start node does not belong to this graph");
    start_ = id;
}

void Graph::kill(NodeId id)
{
    mutableNode(id).alive = false;
}

bool Graph::isAlive(NodeId id) const
{
    return contains(id) && nodes_[id.index].alive;
}

const Node &Graph::node(NodeId id) const
{
    KELP_INVARIANT(contains(id), "node handle does not belong to this graph");
    return nodes_[id.index];
}

Node &Graph::mutableNode(NodeId id)
{
    KELP_INVARIANT(contains(id), "node handle does not belong to this graph");
    return nodes_[id.index];
}

NodeKind Graph::kind(NodeId id) const
{
    return node(id).kind;
}

const std::vector<NodeId> &Graph::successors(NodeId id) const
{
    return node(id).successors;
}

const std::vector<NodeId> &Graph::inputs(NodeId id) const
{
    return node(id).inputs;
}

NodeId Graph::ownerMerge(NodeId end) const
{
    const Node &n = node(end);
    KELP_INVARIANT(n.kind == NodeKind::End, "ownerMerge queried on a non-End node");
    return n.owner;
}

NodeId Graph::ownerLoop(NodeId id) const
{
    const Node &n = node(id);
    KELP_INVARIANT(n.kind == NodeKind::LoopEnd || n.kind == NodeKind::LoopExit,
                   "ownerLoop queried on a node that does not belong to a loop");
    return n.owner;
}

const std::vector<NodeId> &Graph::forwardEnds(NodeId merge) const
{
    const Node &n = node(merge);
    KELP_INVARIANT(isMergeLike(n.kind), "forwardEnds queried on a non-merge node");
    return n.forwardEnds;
}

size_t Graph::forwardEndCount(NodeId merge) const
{
    return forwardEnds(merge).size();
}

NodeId Graph::forwardEndAt(NodeId merge, size_t index) const
{
    const auto &ends = forwardEnds(merge);
    KELP_INVARIANT(index < ends.size(), "forward end index out of range");
    return ends[index];
}

const std::vector<NodeId> &Graph::loopEnds(NodeId loopBegin) const
{
    const Node &n = node(loopBegin);
    KELP_INVARIANT(n.kind == NodeKind::LoopBegin, "loopEnds queried on a non-LoopBegin node");
    return n.loopEnds;
}

const CallTarget &Graph::callTarget(NodeId invoke) const
{
    const Node &n = node(invoke);
    KELP_INVARIANT(n.kind == NodeKind::Invoke, "callTarget queried on a non-Invoke node");
    return n.target;
}

std::string_view Graph::calleeName(NodeId invoke) const
{
    return callees_.lookup(callTarget(invoke).callee);
}

bool Graph::isResolvedInvoke(NodeId id) const
{
    if (!isAlive(id))
        return false;
    const Node &n = nodes_[id.index];
    return n.kind == NodeKind::Invoke && n.target.kind == CallTargetKind::Method;
}

size_t Graph::resolvedInvokeCount() const
{
    size_t count = 0;
    for (uint32_t i = 0; i < nodes_.size(); ++i)
    {
        if (isResolvedInvoke(NodeId{i}))
            ++count;
    }
    return count;
}

std::vector<NodeId> Graph::nodeIds() const
{
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (uint32_t i = 0; i < nodes_.size(); ++i)
        ids.push_back(NodeId{i});
    return ids;
}

WalkClass walkClassOf(const Graph &graph, NodeId id)
{
    const WalkClass cls = getNodeKindInfo(graph.kind(id)).walkClass;
    if (cls == WalkClass::Invoke && !graph.isResolvedInvoke(id))
        return WalkClass::FixedWithNext;
    return cls;
}

} // namespace kelp::graph
