// File: tests/graph/NodeKindTests.cpp
// Purpose: Check the node kind table against the traversal taxonomy.
// Key invariants: Mnemonics are unique and round-trip; floating kinds are not fixed.
// Ownership/Lifetime: Stateless.
// Links: src/graph/NodeKind.def

#include <gtest/gtest.h>

#include "graph/NodeKind.hpp"

#include <set>
#include <string>

using namespace kelp::graph;

TEST(NodeKind, MnemonicsAreUniqueAndRoundTrip)
{
    std::set<std::string> seen;
    for (size_t i = 0; i < kNumNodeKinds; ++i)
    {
        const auto kind = static_cast<NodeKind>(i);
        const std::string mnemonic(toString(kind));
        EXPECT_TRUE(seen.insert(mnemonic).second) << "duplicate mnemonic " << mnemonic;
        auto parsed = nodeKindFromMnemonic(mnemonic);
        ASSERT_TRUE(parsed.has_value()) << mnemonic;
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(nodeKindFromMnemonic("phi").has_value());
}

TEST(NodeKind, WalkClassesMatchTaxonomy)
{
    EXPECT_EQ(getNodeKindInfo(NodeKind::Start).walkClass, WalkClass::Start);
    EXPECT_EQ(getNodeKindInfo(NodeKind::Invoke).walkClass, WalkClass::Invoke);
    EXPECT_EQ(getNodeKindInfo(NodeKind::LoopBegin).walkClass, WalkClass::LoopBegin);
    EXPECT_EQ(getNodeKindInfo(NodeKind::LoopEnd).walkClass, WalkClass::LoopEnd);
    EXPECT_EQ(getNodeKindInfo(NodeKind::Merge).walkClass, WalkClass::Merge);
    EXPECT_EQ(getNodeKindInfo(NodeKind::End).walkClass, WalkClass::End);
    EXPECT_EQ(getNodeKindInfo(NodeKind::Return).walkClass, WalkClass::ControlSink);
    EXPECT_EQ(getNodeKindInfo(NodeKind::Unwind).walkClass, WalkClass::ControlSink);
    EXPECT_EQ(getNodeKindInfo(NodeKind::Deoptimize).walkClass, WalkClass::ControlSink);
    EXPECT_EQ(getNodeKindInfo(NodeKind::If).walkClass, WalkClass::ControlSplit);
    EXPECT_EQ(getNodeKindInfo(NodeKind::Switch).walkClass, WalkClass::ControlSplit);
    EXPECT_EQ(getNodeKindInfo(NodeKind::Begin).walkClass, WalkClass::FixedWithNext);
    EXPECT_EQ(getNodeKindInfo(NodeKind::Guard).walkClass, WalkClass::FixedWithNext);
    EXPECT_EQ(getNodeKindInfo(NodeKind::Placeholder).walkClass, WalkClass::Unclassified);
}

TEST(NodeKind, FloatingKindsAreNotFixed)
{
    EXPECT_FALSE(isFixed(NodeKind::Constant));
    EXPECT_FALSE(isFixed(NodeKind::Parameter));
    EXPECT_TRUE(isFixed(NodeKind::Placeholder));
    EXPECT_TRUE(isMergeLike(NodeKind::LoopBegin));
    EXPECT_FALSE(isMergeLike(NodeKind::End));
}
