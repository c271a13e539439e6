// File: tests/verify/GraphVerifierTests.cpp
// Purpose: Ensure the structural verifier accepts well-formed graphs and
//          reports each class of malformed graph with a node-tagged message.
// Key invariants: Diagnostics name the graph, node id and mnemonic.
// Ownership/Lifetime: Graphs and diagnostic engines are test-local.
// Links: src/graph/verify/GraphVerifier.hpp

#include <gtest/gtest.h>

#include "graph/build/GraphBuilder.hpp"
#include "graph/verify/GraphVerifier.hpp"
#include "support/diagnostics.hpp"

#include <string>

using kelp::build::GraphBuilder;
using kelp::support::DiagnosticEngine;
using kelp::verify::GraphVerifier;
using namespace kelp::graph;

namespace
{

std::string firstError(const Graph &g)
{
    auto result = GraphVerifier::verify(g);
    if (result)
        return {};
    return result.error().message;
}

bool contains(const std::string &haystack, const std::string &needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(GraphVerifier, AcceptsDiamondAndLoop)
{
    Graph g("ok");
    GraphBuilder b(g);
    b.startGraph();
    auto arms = b.ifSplit();
    b.setInsertPoint(arms[0]);
    NodeId e0 = b.end();
    b.setInsertPoint(arms[1]);
    NodeId e1 = b.end();
    b.merge({e0, e1});
    NodeId entry = b.end();
    NodeId lb = b.loopBegin({entry});
    b.invoke("body", {b.parameter(0)});
    b.loopEnd(lb);
    b.setInsertPoint(b.loopExit(lb));
    b.intrinsicInvoke("sqrt");
    b.indirectInvoke();
    b.ret();

    EXPECT_TRUE(GraphVerifier::verify(g));
}

TEST(GraphVerifier, RejectsMissingStart)
{
    Graph g("nostart");
    g.addNode(NodeKind::Return);
    EXPECT_EQ(firstError(g), "graph @nostart: missing start node");
}

TEST(GraphVerifier, RejectsWrongSuccessorCount)
{
    Graph g("arity");
    GraphBuilder b(g);
    b.startGraph();
    NodeId split = b.append(NodeKind::If);
    b.begin(split);
    EXPECT_TRUE(contains(firstError(g), "(if): expected 2 successor(s), found 1"));
}

TEST(GraphVerifier, RejectsUnboundEndAndThinMerge)
{
    Graph g("ends");
    GraphBuilder b(g);
    b.startGraph();
    auto arms = b.ifSplit();
    b.setInsertPoint(arms[0]);
    NodeId e0 = b.end();
    b.setInsertPoint(arms[1]);
    b.end();
    b.merge({e0});
    b.ret();

    DiagnosticEngine diags;
    EXPECT_FALSE(GraphVerifier::verify(g, diags));
    bool sawUnbound = false;
    bool sawThin = false;
    for (const auto &d : diags.diagnostics())
    {
        sawUnbound |= contains(d.message, "End is not bound to a merge");
        sawThin |= contains(d.message, "merge needs at least two forward ends");
    }
    EXPECT_TRUE(sawUnbound);
    EXPECT_TRUE(sawThin);
    EXPECT_EQ(diags.errorCount(), 2u);
}

TEST(GraphVerifier, RejectsMergeEnteredDirectly)
{
    Graph g("direct");
    NodeId start = g.addNode(NodeKind::Start);
    NodeId m = g.addNode(NodeKind::Merge);
    g.addSuccessor(start, m);
    g.setStart(start);
    EXPECT_TRUE(contains(firstError(g), "must be entered through its End nodes"));
}

TEST(GraphVerifier, RejectsFloatingSuccessor)
{
    Graph g("floating");
    NodeId start = g.addNode(NodeKind::Start);
    NodeId c = g.addNode(NodeKind::Constant);
    g.addSuccessor(start, c);
    g.setStart(start);
    EXPECT_EQ(firstError(g), "graph @floating: %0 (start): successor %1 is a floating node");
}

TEST(GraphVerifier, RejectsPlaceholder)
{
    Graph g("lower");
    GraphBuilder b(g);
    b.startGraph();
    b.placeholder();
    EXPECT_TRUE(contains(firstError(g), "placeholder nodes must be lowered before analysis"));
}

TEST(GraphVerifier, RejectsInvokeWithoutTarget)
{
    Graph g("target");
    GraphBuilder b(g);
    b.startGraph();
    b.append(NodeKind::Invoke);
    b.ret();
    EXPECT_TRUE(contains(firstError(g), "(invoke): missing call target"));
}

TEST(GraphVerifier, RejectsLoopWithoutBackEdge)
{
    Graph g("loop");
    GraphBuilder b(g);
    b.startGraph();
    b.loopBegin();
    b.ret();
    EXPECT_TRUE(contains(firstError(g), "(loopbegin): loop has no loop end"));
}

TEST(GraphVerifier, RejectsUnreachableCallSite)
{
    Graph g("orphan");
    GraphBuilder b(g);
    b.startGraph();
    b.ret();
    NodeId orphan = g.addNode(NodeKind::Invoke);
    g.setCallTarget(orphan, CallTargetKind::Method, "lost");
    EXPECT_EQ(firstError(g), "graph @orphan: %2 (invoke): call site is unreachable from the entry");
}

TEST(GraphVerifier, IgnoresDeadNodes)
{
    Graph g("dead");
    GraphBuilder b(g);
    b.startGraph();
    b.ret();
    NodeId orphan = g.addNode(NodeKind::Invoke);
    g.setCallTarget(orphan, CallTargetKind::Method, "lost");
    g.kill(orphan);
    EXPECT_TRUE(GraphVerifier::verify(g));
}

TEST(GraphVerifier, RejectsSecondStart)
{
    Graph g("two");
    GraphBuilder b(g);
    b.startGraph();
    b.ret();
    g.addNode(NodeKind::Start);
    EXPECT_TRUE(contains(firstError(g), "second start node; the entry is %0"));
}
