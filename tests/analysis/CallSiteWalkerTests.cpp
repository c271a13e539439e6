// File: tests/analysis/CallSiteWalkerTests.cpp
// Purpose: Verify discovery order, completeness and merge gating of CallSiteWalker.
// Key invariants: Every reachable fixed node is visited once; merges are
//                 dequeued only after all of their forward ends.
// Ownership/Lifetime: Each test builds a local graph via GraphBuilder.
// Links: docs/graph-format.md

#include <gtest/gtest.h>

#include "graph/analysis/CallSiteWalker.hpp"
#include "graph/build/GraphBuilder.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

using kelp::analysis::CallSiteWalker;
using kelp::analysis::CallSiteWalkOptions;
using kelp::analysis::discoverCallSites;
using kelp::build::GraphBuilder;
using kelp::graph::CallTargetKind;
using kelp::graph::Graph;
using kelp::graph::NodeId;
using kelp::graph::NodeKind;

namespace
{

CallSiteWalkOptions checked()
{
    CallSiteWalkOptions opts;
    opts.checkCallCount = true;
    return opts;
}

std::vector<std::string> calleeNames(const Graph &g, const std::vector<NodeId> &calls)
{
    std::vector<std::string> names;
    for (NodeId id : calls)
        names.emplace_back(g.calleeName(id));
    return names;
}

/// Records dequeue order and per-node visit counts.
struct VisitLog
{
    std::vector<NodeId> order;
    std::unordered_map<NodeId, int> counts;

    CallSiteWalkOptions options()
    {
        CallSiteWalkOptions opts = checked();
        opts.onVisit = [this](NodeId id)
        {
            order.push_back(id);
            ++counts[id];
        };
        return opts;
    }

    size_t position(NodeId id) const
    {
        return static_cast<size_t>(std::find(order.begin(), order.end(), id) - order.begin());
    }
};

/// start -> if -> {invoke a -> end, invoke b -> end} -> merge -> invoke c -> return
struct Diamond
{
    Graph g{"diamond"};
    NodeId start, split, endTrue, endFalse, merge, a, b, c, ret;

    Diamond()
    {
        GraphBuilder bld(g);
        start = bld.startGraph();
        auto arms = bld.ifSplit();
        split = g.successors(start)[0];
        bld.setInsertPoint(arms[0]);
        a = bld.invoke("a");
        endTrue = bld.end();
        bld.setInsertPoint(arms[1]);
        b = bld.invoke("b");
        endFalse = bld.end();
        merge = bld.merge({endTrue, endFalse});
        c = bld.invoke("c");
        ret = bld.ret();
    }
};

} // namespace

TEST(CallSiteWalker, LinearGraphCollectsSingleInvoke)
{
    Graph g("linear");
    GraphBuilder b(g);
    b.startGraph();
    NodeId call = b.invoke("foo");
    b.ret();

    auto calls = discoverCallSites(g, checked());
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], call);
}

TEST(CallSiteWalker, BranchThenMergeGatesOnBothEnds)
{
    Graph g("branch");
    GraphBuilder b(g);
    b.startGraph();
    auto arms = b.ifSplit();
    b.setInsertPoint(arms[0]);
    NodeId e0 = b.end();
    b.setInsertPoint(arms[1]);
    NodeId e1 = b.end();
    NodeId merge = b.merge({e0, e1});
    NodeId call = b.invoke("after");
    b.ret();

    VisitLog log;
    auto calls = discoverCallSites(g, log.options());
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], call);
    EXPECT_GT(log.position(merge), log.position(e0));
    EXPECT_GT(log.position(merge), log.position(e1));
    EXPECT_EQ(log.counts[merge], 1);
}

TEST(CallSiteWalker, LoopBeginQueuesBodyAndExitWithoutWaiting)
{
    Graph g("loop");
    GraphBuilder b(g);
    b.startGraph();
    NodeId header = b.loopBegin();
    NodeId body = b.invoke("body");
    NodeId backEdge = b.loopEnd(header);
    NodeId exit = b.loopExit(header);
    b.setInsertPoint(exit);
    NodeId sink = b.ret();

    VisitLog log;
    auto calls = discoverCallSites(g, log.options());
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], body);
    for (NodeId id : {header, body, backEdge, exit, sink})
        EXPECT_EQ(log.counts[id], 1) << "node %" << id.index;
    // The exit path ran before the back edge was ever reached.
    EXPECT_LT(log.position(sink), log.position(backEdge));
}

TEST(CallSiteWalker, UnresolvedInvokesAreWalkedButNotCollected)
{
    Graph g("unresolved");
    GraphBuilder b(g);
    b.startGraph();
    NodeId indirect = b.indirectInvoke();
    NodeId intrinsic = b.intrinsicInvoke("sqrt");
    b.ret();

    VisitLog log;
    auto calls = discoverCallSites(g, log.options());
    EXPECT_TRUE(calls.empty());
    EXPECT_EQ(log.counts[indirect], 1);
    EXPECT_EQ(log.counts[intrinsic], 1);
}

TEST(CallSiteWalker, ExploresMostRecentBranchFirst)
{
    Diamond d;
    auto calls = discoverCallSites(d.g, checked());
    EXPECT_EQ(calleeNames(d.g, calls), (std::vector<std::string>{"b", "a", "c"}));
}

TEST(CallSiteWalker, ReadyMergeWaitsBehindPendingWork)
{
    Graph g("switch");
    GraphBuilder b(g);
    b.startGraph();
    auto arms = b.switchSplit(3);
    b.setInsertPoint(arms[0]);
    b.invoke("z");
    b.ret();
    b.setInsertPoint(arms[1]);
    NodeId e1 = b.end();
    b.setInsertPoint(arms[2]);
    NodeId e2 = b.end();
    b.merge({e1, e2});
    b.invoke("m");
    b.ret();

    auto calls = discoverCallSites(g, checked());
    EXPECT_EQ(calleeNames(g, calls), (std::vector<std::string>{"z", "m"}));
}

TEST(CallSiteWalker, NestedDiamondsRespectMergeReadiness)
{
    Graph g("nested");
    GraphBuilder b(g);
    b.startGraph();
    auto outer = b.ifSplit();

    b.setInsertPoint(outer[0]);
    auto inner = b.ifSplit();
    b.setInsertPoint(inner[0]);
    b.invoke("inner_true");
    NodeId ie0 = b.end();
    b.setInsertPoint(inner[1]);
    NodeId ie1 = b.end();
    NodeId innerMerge = b.merge({ie0, ie1});
    b.invoke("inner_join");
    NodeId oe0 = b.end();

    b.setInsertPoint(outer[1]);
    b.invoke("outer_false");
    NodeId oe1 = b.end();

    NodeId outerMerge = b.merge({oe0, oe1});
    b.invoke("join");
    b.ret();

    VisitLog log;
    auto calls = discoverCallSites(g, log.options());
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calleeNames(g, calls).back(), "join");
    EXPECT_GT(log.position(innerMerge), log.position(ie0));
    EXPECT_GT(log.position(innerMerge), log.position(ie1));
    EXPECT_GT(log.position(outerMerge), log.position(oe0));
    EXPECT_GT(log.position(outerMerge), log.position(oe1));
    EXPECT_GT(log.position(outerMerge), log.position(innerMerge));
}

TEST(CallSiteWalker, LoopEnteredThroughForwardEnd)
{
    Graph g("loop_ends");
    GraphBuilder b(g);
    b.startGraph();
    b.invoke("pre");
    NodeId entry = b.end();
    NodeId header = b.loopBegin({entry});
    b.invoke("body");
    b.loopEnd(header);
    b.setInsertPoint(b.loopExit(header));
    b.invoke("post");
    b.ret();

    auto calls = discoverCallSites(g, checked());
    EXPECT_EQ(calleeNames(g, calls), (std::vector<std::string>{"pre", "post", "body"}));
}

TEST(CallSiteWalker, StartInvokeIsNeverCollected)
{
    Graph g("start_invoke");
    NodeId entry = g.addNode(NodeKind::Invoke);
    g.setCallTarget(entry, CallTargetKind::Method, "osr_entry");
    g.setStart(entry);
    GraphBuilder b(g);
    b.setInsertPoint(entry);
    NodeId call = b.invoke("callee");
    b.ret();

    auto calls = discoverCallSites(g, checked());
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], call);
}

TEST(CallSiteWalker, EveryReachableFixedNodeVisitedOnce)
{
    Diamond d;
    NodeId arg = GraphBuilder(d.g).constant(7);
    d.g.addInput(d.c, arg);

    VisitLog log;
    discoverCallSites(d.g, log.options());

    for (NodeId id : d.g.nodeIds())
    {
        if (kelp::graph::isFixed(d.g.kind(id)))
            EXPECT_EQ(log.counts[id], 1) << "node %" << id.index;
        else
            EXPECT_EQ(log.counts.count(id), 0u) << "floating node %" << id.index;
    }
    EXPECT_EQ(log.order.front(), d.start);
    EXPECT_EQ(log.order.size(), d.g.size() - 1);
}

TEST(CallSiteWalker, StructurallyIdenticalGraphsYieldSameOrder)
{
    Diamond first;
    Diamond second;
    auto a = discoverCallSites(first.g, checked());
    auto b = discoverCallSites(second.g, checked());
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i)
        EXPECT_EQ(a[i], b[i]);
}

TEST(CallSiteWalker, IndependentWalkersShareOneGraph)
{
    Diamond d;
    CallSiteWalker w1(d.g, checked());
    CallSiteWalker w2(d.g, checked());
    EXPECT_EQ(w1.apply(), w2.apply());
}

TEST(CallSiteWalker, DeadUnreachableInvokeDoesNotCount)
{
    Graph g("dead_call");
    GraphBuilder b(g);
    b.startGraph();
    b.invoke("live");
    b.ret();
    NodeId orphan = g.addNode(NodeKind::Invoke);
    g.setCallTarget(orphan, CallTargetKind::Method, "gone");
    g.kill(orphan);

    auto calls = discoverCallSites(g, checked());
    EXPECT_EQ(calleeNames(g, calls), (std::vector<std::string>{"live"}));
}

TEST(CallSiteWalker, GuardsAndSinksTerminate)
{
    Graph g("sinks");
    GraphBuilder b(g);
    b.startGraph();
    b.guard();
    auto arms = b.ifSplit();
    b.setInsertPoint(arms[0]);
    b.invoke("slow");
    b.deoptimize();
    b.setInsertPoint(arms[1]);
    b.invoke("throw");
    b.unwind();

    auto calls = discoverCallSites(g, checked());
    EXPECT_EQ(calleeNames(g, calls), (std::vector<std::string>{"throw", "slow"}));
}

TEST(CallSiteWalker, TraceReportsQueueDecisions)
{
    Diamond d;
    CallSiteWalkOptions opts = checked();
    opts.trace = true;

    testing::internal::CaptureStderr();
    discoverCallSites(d.g, opts);
    const std::string trace = testing::internal::GetCapturedStderr();

    EXPECT_NE(trace.find("[walk] visit %0 start"), std::string::npos);
    EXPECT_NE(trace.find("[walk] collect %" + std::to_string(d.c.index) + " @c"),
              std::string::npos);
    EXPECT_NE(trace.find("[walk] defer merge %" + std::to_string(d.merge.index)),
              std::string::npos);
    EXPECT_NE(trace.find("[walk] queue merge %" + std::to_string(d.merge.index)),
              std::string::npos);
}
