//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/graph/verify/GraphVerifier.cpp
// Purpose: Check entry, successor arity, merge/End pairing, loop bookkeeping,
//          call targets and call-site reachability for every live node.
// Links: docs/graph-format.md
//
//===----------------------------------------------------------------------===//

#include "graph/verify/GraphVerifier.hpp"

#include "graph/Graph.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace kelp::verify
{
namespace
{
using graph::CallTargetKind;
using graph::getNodeKindInfo;
using graph::Graph;
using graph::kVariadicSuccessorCount;
using graph::NodeId;
using graph::NodeKind;
using support::DiagnosticEngine;
using support::makeError;

class GraphChecker
{
  public:
    GraphChecker(const Graph &g, DiagnosticEngine &diags) : g_(g), diags_(diags) {}

    void run()
    {
        if (checkEntry())
            checkReachableCalls();
        for (NodeId id : g_.nodeIds())
        {
            if (!g_.isAlive(id))
                continue;
            checkSuccessors(id);
            switch (g_.kind(id))
            {
                case NodeKind::End:
                    checkEnd(id);
                    break;
                case NodeKind::Merge:
                    checkMerge(id);
                    break;
                case NodeKind::LoopBegin:
                    checkLoopBegin(id);
                    break;
                case NodeKind::LoopEnd:
                case NodeKind::LoopExit:
                    checkLoopMember(id);
                    break;
                case NodeKind::Invoke:
                    checkInvoke(id);
                    break;
                case NodeKind::Placeholder:
                    error(id, "placeholder nodes must be lowered before analysis");
                    break;
                default:
                    break;
            }
        }
    }

  private:
    void error(NodeId id, const std::string &message)
    {
        std::ostringstream oss;
        oss << "graph @" << g_.name() << ": %" << id.index << " ("
            << graph::toString(g_.kind(id)) << "): " << message;
        diags_.report(makeError({}, oss.str()));
    }

    void graphError(const std::string &message)
    {
        diags_.report(makeError({}, "graph @" + g_.name() + ": " + message));
    }

    /// @return True when the graph has a live entry node.
    bool checkEntry()
    {
        if (!g_.hasStart())
        {
            graphError("missing start node");
            return false;
        }
        NodeId start = g_.start();
        if (!g_.isAlive(start))
        {
            graphError("start node %" + std::to_string(start.index) + " is not alive");
            return false;
        }
        const NodeKind k = g_.kind(start);
        if (k != NodeKind::Start && k != NodeKind::Invoke)
            error(start, "entry must be a start node");

        for (NodeId id : g_.nodeIds())
        {
            if (g_.isAlive(id) && g_.kind(id) == NodeKind::Start && id != start)
                error(id, "second start node; the entry is %" + std::to_string(start.index));
        }
        return true;
    }

    /// Every resolved invoke must be reachable from the entry through
    /// successor and End-to-merge edges, otherwise call discovery misses it.
    void checkReachableCalls()
    {
        std::vector<bool> reached(g_.size(), false);
        std::vector<NodeId> work{g_.start()};
        reached[g_.start().index] = true;
        auto push = [&](NodeId id)
        {
            if (g_.isAlive(id) && !reached[id.index])
            {
                reached[id.index] = true;
                work.push_back(id);
            }
        };
        while (!work.empty())
        {
            NodeId id = work.back();
            work.pop_back();
            for (NodeId succ : g_.successors(id))
                push(succ);
            if (g_.kind(id) == NodeKind::End && g_.ownerMerge(id).isValid())
                push(g_.ownerMerge(id));
        }

        for (NodeId id : g_.nodeIds())
        {
            if (g_.isResolvedInvoke(id) && !reached[id.index])
                error(id, "call site is unreachable from the entry");
        }
    }

    void checkSuccessors(NodeId id)
    {
        const auto &info = getNodeKindInfo(g_.kind(id));
        const auto &succs = g_.successors(id);
        if (!info.fixed)
        {
            if (!succs.empty())
                error(id, "floating nodes cannot have control successors");
            return;
        }

        const size_t count = succs.size();
        if (count < info.minSuccessors ||
            (info.maxSuccessors != kVariadicSuccessorCount && count > info.maxSuccessors))
        {
            std::ostringstream oss;
            oss << "expected ";
            if (info.maxSuccessors == kVariadicSuccessorCount)
                oss << "at least " << unsigned(info.minSuccessors);
            else if (info.minSuccessors == info.maxSuccessors)
                oss << unsigned(info.minSuccessors);
            else
                oss << unsigned(info.minSuccessors) << ".." << unsigned(info.maxSuccessors);
            oss << " successor(s), found " << count;
            error(id, oss.str());
        }

        for (NodeId succ : succs)
        {
            if (!g_.isAlive(succ))
            {
                error(id, "successor %" + std::to_string(succ.index) + " is not alive");
                continue;
            }
            const NodeKind sk = g_.kind(succ);
            if (!graph::isFixed(sk))
                error(id, "successor %" + std::to_string(succ.index) + " is a floating node");
            else if (sk == NodeKind::Start)
                error(id, "start node cannot be a successor");
            else if (sk == NodeKind::Merge ||
                     (sk == NodeKind::LoopBegin && !g_.forwardEnds(succ).empty()))
                error(id,
                      "successor %" + std::to_string(succ.index) +
                          " must be entered through its End nodes");
        }
    }

    void checkEnd(NodeId id)
    {
        NodeId merge = g_.ownerMerge(id);
        if (!merge.isValid())
            error(id, "End is not bound to a merge");
        else if (!g_.isAlive(merge))
            error(id, "End feeds dead merge %" + std::to_string(merge.index));
    }

    void checkForwardEnds(NodeId id)
    {
        for (NodeId e : g_.forwardEnds(id))
        {
            if (!g_.isAlive(e))
                error(id, "forward end %" + std::to_string(e.index) + " is not alive");
        }
    }

    void checkMerge(NodeId id)
    {
        if (g_.forwardEndCount(id) < 2)
            error(id, "merge needs at least two forward ends");
        checkForwardEnds(id);
    }

    void checkLoopBegin(NodeId id)
    {
        checkForwardEnds(id);
        if (g_.loopEnds(id).empty())
            error(id, "loop has no loop end");
    }

    void checkLoopMember(NodeId id)
    {
        NodeId loop = g_.ownerLoop(id);
        if (!loop.isValid())
            error(id, "not bound to a loop begin");
        else if (!g_.isAlive(loop))
            error(id, "bound to dead loop begin %" + std::to_string(loop.index));
    }

    void checkInvoke(NodeId id)
    {
        const auto &target = g_.callTarget(id);
        switch (target.kind)
        {
            case CallTargetKind::None:
                error(id, "missing call target");
                break;
            case CallTargetKind::Method:
            case CallTargetKind::Intrinsic:
                if (g_.calleeName(id).empty())
                    error(id, "call target has no callee name");
                break;
            case CallTargetKind::Indirect:
                break;
        }
    }

    const Graph &g_;
    DiagnosticEngine &diags_;
};

} // namespace

support::Expected<void> GraphVerifier::verify(const Graph &g)
{
    DiagnosticEngine diags;
    GraphChecker(g, diags).run();
    for (const auto &d : diags.diagnostics())
    {
        if (d.severity == support::Severity::Error)
            return support::Expected<void>{d};
    }
    return {};
}

bool GraphVerifier::verify(const Graph &g, DiagnosticEngine &diags)
{
    const size_t before = diags.errorCount();
    GraphChecker(g, diags).run();
    return diags.errorCount() == before;
}

} // namespace kelp::verify
