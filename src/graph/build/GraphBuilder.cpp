//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements GraphBuilder.  Successor capacity comes from the node kind table
// so the builder and the verifier agree on what a well-formed node looks like.
//
//===----------------------------------------------------------------------===//

#include "graph/build/GraphBuilder.hpp"

#include <stdexcept>
#include <string>

namespace kelp::build
{

using graph::CallTargetKind;
using graph::getNodeKindInfo;
using graph::kVariadicSuccessorCount;

GraphBuilder::GraphBuilder(Graph &g) : g_(g) {}

NodeId GraphBuilder::startGraph()
{
    if (g_.hasStart())
        throw std::logic_error("startGraph: graph already has a start node");
    NodeId start = g_.addNode(NodeKind::Start);
    g_.setStart(start);
    cursor_ = start;
    return start;
}

void GraphBuilder::setInsertPoint(NodeId id)
{
    if (!g_.contains(id))
        throw std::logic_error("setInsertPoint: node does not belong to the graph");
    cursor_ = id;
}

/// @brief Wire @p from -> @p to after checking @p from's successor capacity.
void GraphBuilder::link(NodeId from, NodeId to)
{
    const auto &info = getNodeKindInfo(g_.kind(from));
    const size_t current = g_.successors(from).size();
    if (info.maxSuccessors != kVariadicSuccessorCount && current >= info.maxSuccessors)
    {
        throw std::logic_error("link: '" + std::string(info.mnemonic) + "' node %" +
                               std::to_string(from.index) + " has no free successor slot");
    }
    g_.addSuccessor(from, to);
}

NodeId GraphBuilder::append(NodeKind kind)
{
    if (!cursor_.isValid())
        throw std::logic_error("append: no insertion point");
    if (!graph::isFixed(kind))
        throw std::logic_error("append: floating nodes are not part of the control skeleton");
    NodeId id = g_.addNode(kind);
    link(cursor_, id);
    if (getNodeKindInfo(kind).maxSuccessors == 0)
        cursor_ = NodeId::invalid();
    else
        cursor_ = id;
    return id;
}

NodeId GraphBuilder::appendInvoke(CallTargetKind target,
                                  std::string_view callee,
                                  const std::vector<NodeId> &args)
{
    NodeId id = append(NodeKind::Invoke);
    g_.setCallTarget(id, target, callee);
    for (NodeId arg : args)
        g_.addInput(id, arg);
    return id;
}

NodeId GraphBuilder::invoke(std::string_view callee, const std::vector<NodeId> &args)
{
    if (callee.empty())
        throw std::logic_error("invoke: resolved call targets need a callee name");
    return appendInvoke(CallTargetKind::Method, callee, args);
}

NodeId GraphBuilder::indirectInvoke(const std::vector<NodeId> &args)
{
    return appendInvoke(CallTargetKind::Indirect, {}, args);
}

NodeId GraphBuilder::intrinsicInvoke(std::string_view name, const std::vector<NodeId> &args)
{
    return appendInvoke(CallTargetKind::Intrinsic, name, args);
}

std::vector<NodeId> GraphBuilder::ifSplit()
{
    NodeId split = append(NodeKind::If);
    std::vector<NodeId> arms{begin(split), begin(split)};
    cursor_ = NodeId::invalid();
    return arms;
}

std::vector<NodeId> GraphBuilder::switchSplit(size_t arms)
{
    if (arms < 2)
        throw std::logic_error("switchSplit: a switch needs at least two arms");
    NodeId split = append(NodeKind::Switch);
    std::vector<NodeId> begins;
    begins.reserve(arms);
    for (size_t i = 0; i < arms; ++i)
        begins.push_back(begin(split));
    cursor_ = NodeId::invalid();
    return begins;
}

NodeId GraphBuilder::begin(NodeId from)
{
    NodeId id = g_.addNode(NodeKind::Begin);
    link(from, id);
    return id;
}

NodeId GraphBuilder::end()
{
    return append(NodeKind::End);
}

NodeId GraphBuilder::createMergeLike(NodeKind kind, const std::vector<NodeId> &ends)
{
    for (NodeId e : ends)
    {
        if (!g_.contains(e) || g_.kind(e) != NodeKind::End)
            throw std::logic_error("merge: forward predecessors must be End nodes");
        if (g_.node(e).owner.isValid())
            throw std::logic_error("merge: End %" + std::to_string(e.index) +
                                   " already feeds another merge");
    }
    NodeId id = g_.addNode(kind);
    for (NodeId e : ends)
        g_.bindEnd(e, id);
    cursor_ = id;
    return id;
}

NodeId GraphBuilder::merge(const std::vector<NodeId> &ends)
{
    return createMergeLike(NodeKind::Merge, ends);
}

NodeId GraphBuilder::loopBegin()
{
    return append(NodeKind::LoopBegin);
}

NodeId GraphBuilder::loopBegin(const std::vector<NodeId> &forwardEnds)
{
    return createMergeLike(NodeKind::LoopBegin, forwardEnds);
}

NodeId GraphBuilder::loopExit(NodeId loopBegin)
{
    if (!g_.contains(loopBegin) || g_.kind(loopBegin) != NodeKind::LoopBegin)
        throw std::logic_error("loopExit: owner must be a LoopBegin");
    NodeId id = g_.addNode(NodeKind::LoopExit);
    link(loopBegin, id);
    g_.bindLoopExit(id, loopBegin);
    return id;
}

NodeId GraphBuilder::loopEnd(NodeId loopBegin)
{
    if (!g_.contains(loopBegin) || g_.kind(loopBegin) != NodeKind::LoopBegin)
        throw std::logic_error("loopEnd: owner must be a LoopBegin");
    NodeId id = append(NodeKind::LoopEnd);
    g_.bindLoopEnd(id, loopBegin);
    return id;
}

NodeId GraphBuilder::ret()
{
    return append(NodeKind::Return);
}

NodeId GraphBuilder::unwind()
{
    return append(NodeKind::Unwind);
}

NodeId GraphBuilder::deoptimize()
{
    return append(NodeKind::Deoptimize);
}

NodeId GraphBuilder::guard()
{
    return append(NodeKind::Guard);
}

NodeId GraphBuilder::placeholder()
{
    NodeId id = append(NodeKind::Placeholder);
    cursor_ = NodeId::invalid();
    return id;
}

NodeId GraphBuilder::constant(int64_t value)
{
    NodeId id = g_.addNode(NodeKind::Constant);
    g_.setValue(id, value);
    return id;
}

NodeId GraphBuilder::parameter(int64_t index)
{
    NodeId id = g_.addNode(NodeKind::Parameter);
    g_.setValue(id, index);
    return id;
}

} // namespace kelp::build
