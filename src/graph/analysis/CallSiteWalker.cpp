//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the dominator-ordered call-site discovery walk.  Classification
// is a single switch over WalkClass; the Floating and Unclassified cases are
// the explicit fatal fallback.
//
//===----------------------------------------------------------------------===//

#include "graph/analysis/CallSiteWalker.hpp"

#include "support/invariants.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace kelp::analysis
{

using graph::WalkClass;
using graph::walkClassOf;

namespace
{

bool traceEnabled()
{
    static const bool enabled = std::getenv("KELP_WALK_TRACE") != nullptr;
    return enabled;
}

} // namespace

CallSiteWalker::CallSiteWalker(const Graph &graph) : CallSiteWalker(graph, CallSiteWalkOptions{})
{
}

CallSiteWalker::CallSiteWalker(const Graph &graph, CallSiteWalkOptions options)
    : graph_(graph), options_(std::move(options)), start_(graph.start()),
      queued_(graph.size(), false)
{
    KELP_INVARIANT(graph_.hasStart(), "graph has no start node");
    KELP_INVARIANT(graph_.isAlive(start_), "start node is not alive");
    trace_ = options_.trace || traceEnabled();
}

std::vector<NodeId> CallSiteWalker::apply()
{
    KELP_INVARIANT(!applied_, "CallSiteWalker::apply called twice on one walker");
    applied_ = true;

    std::vector<NodeId> invokes;
    forcedQueue(start_);

    while (!nodeQueue_.empty())
    {
        NodeId current = nextQueuedNode();
        KELP_INVARIANT(graph_.isAlive(current), "walk reached a dead node");
        if (options_.onVisit)
            options_.onVisit(current);

        const WalkClass cls = walkClassOf(graph_, current);
        if (trace_)
        {
            std::cerr << "[walk] visit %" << current.index << ' ' << graph::toString(cls) << '\n';
        }

        switch (cls)
        {
            case WalkClass::Invoke:
                if (current != start_)
                {
                    invokes.push_back(current);
                    if (trace_)
                    {
                        std::cerr << "[walk] collect %" << current.index << " @"
                                  << graph_.calleeName(current) << '\n';
                    }
                }
                queueSuccessors(current);
                break;
            case WalkClass::Start:
            case WalkClass::LoopBegin:
            case WalkClass::Merge:
            case WalkClass::FixedWithNext:
            case WalkClass::ControlSplit:
                queueSuccessors(current);
                break;
            case WalkClass::LoopEnd:
            case WalkClass::ControlSink:
                break;
            case WalkClass::End:
                queueMerge(current);
                break;
            case WalkClass::Floating:
                KELP_INVARIANT(false, "walk reached a floating node through a control edge");
                break;
            case WalkClass::Unclassified:
                KELP_INVARIANT(false, "walk reached a fixed node outside the traversal taxonomy");
                break;
        }
    }

    if (options_.checkCallCount)
    {
        size_t expected = graph_.resolvedInvokeCount();
        if (graph_.isResolvedInvoke(start_))
            --expected;
        KELP_INVARIANT(invokes.size() == expected,
                       "discovered call sites do not match the graph's resolved invoke count");
    }
    return invokes;
}

void CallSiteWalker::queueSuccessors(NodeId node)
{
    for (NodeId succ : graph_.successors(node))
        queue(succ);
}

void CallSiteWalker::queue(NodeId node)
{
    if (node.isValid() && !isQueued(node))
        forcedQueue(node);
}

void CallSiteWalker::forcedQueue(NodeId node)
{
    queued_[node.index] = true;
    nodeQueue_.push_front(node);
    if (trace_)
        std::cerr << "[walk] queue %" << node.index << '\n';
}

NodeId CallSiteWalker::nextQueuedNode()
{
    NodeId result = nodeQueue_.front();
    nodeQueue_.pop_front();
    KELP_INVARIANT(isQueued(result), "dequeued a node that was never marked visited");
    return result;
}

/// @brief Queue the merge fed by @p end once all of its forward ends are visited.
/// @details Ready merges go to the back of the deque so that any work still
///          pending on other paths runs first.
void CallSiteWalker::queueMerge(NodeId end)
{
    NodeId merge = graph_.ownerMerge(end);
    KELP_INVARIANT(merge.isValid(), "End node is not bound to a merge");
    if (isQueued(merge))
        return;
    if (!visitedAllEnds(merge))
    {
        if (trace_)
            std::cerr << "[walk] defer merge %" << merge.index << '\n';
        return;
    }
    queued_[merge.index] = true;
    nodeQueue_.push_back(merge);
    if (trace_)
        std::cerr << "[walk] queue merge %" << merge.index << '\n';
}

bool CallSiteWalker::visitedAllEnds(NodeId merge) const
{
    for (size_t i = 0; i < graph_.forwardEndCount(merge); ++i)
    {
        if (!isQueued(graph_.forwardEndAt(merge, i)))
            return false;
    }
    return true;
}

std::vector<NodeId> discoverCallSites(const Graph &graph, CallSiteWalkOptions options)
{
    CallSiteWalker walker(graph, std::move(options));
    return walker.apply();
}

} // namespace kelp::analysis
