#include <gtest/gtest.h>
#include "errors/errors.hpp"
#include "graph/topology.hpp"
#include "graph/workflow_builder.hpp"

using namespace tickflow;

// ─── Structure ─────────────────────────────────────────────────

TEST(TopologyTest, AddAndGetNode) {
    Topology t;
    t.addNode(Node("A", NodeKind::Task));
    ASSERT_EQ(t.nodeCount(), 1);
    const Node* n = t.getNode("A");
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->kind, NodeKind::Task);
    EXPECT_EQ(n->status, Status::Pending);
    EXPECT_EQ(t.getNode("missing"), nullptr);
}

TEST(TopologyTest, DuplicateNodeRejected) {
    Topology t;
    t.addNode(Node("A", NodeKind::Task));
    EXPECT_THROW(t.addNode(Node("A", NodeKind::Condition)), StructuralError);
    EXPECT_THROW(t.addNode(Node("", NodeKind::Task)), StructuralError);
}

TEST(TopologyTest, FlowEndpointsMustExist) {
    Topology t;
    t.addNode(Node("A", NodeKind::Task));
    EXPECT_THROW(t.addFlow(Flow("A", "B")), StructuralError);
    EXPECT_THROW(t.addFlow(Flow("B", "A")), StructuralError);
}

TEST(TopologyTest, DuplicateFlowRejected) {
    Topology t;
    t.addNode(Node("A", NodeKind::Task));
    t.addNode(Node("B", NodeKind::Task));
    t.addFlow(Flow("A", "B"));
    EXPECT_THROW(t.addFlow(Flow("A", "B", 3)), StructuralError);
    EXPECT_EQ(t.flowCount(), 1);
}

TEST(TopologyTest, FlowsOrderedByPriorityThenTarget) {
    Topology t;
    for (const char* id : {"S", "X", "Y", "Z"}) t.addNode(Node(id, NodeKind::Task));
    t.addFlow(Flow("S", "Z", 0));
    t.addFlow(Flow("S", "Y", 1));
    t.addFlow(Flow("S", "X", 1));

    auto out = t.flowsOut("S");
    ASSERT_EQ(out.size(), 3);
    EXPECT_EQ(out[0]->target, "Z");
    EXPECT_EQ(out[1]->target, "X");
    EXPECT_EQ(out[2]->target, "Y");

    EXPECT_EQ(t.predecessors("X"), std::vector<NodeId>{"S"});
    EXPECT_EQ(t.successors("S"), (std::vector<NodeId>{"Z", "X", "Y"}));
}

// ─── Marking ───────────────────────────────────────────────────

TEST(TopologyTest, MarkingQueries) {
    Topology t = WorkflowBuilder()
        .task("A").completed()
        .task("B").join(ControlType::And)
        .task("C")
        .flow("A", "B")
        .flow("C", "B")
        .variable("x", "7")
        .signal("go", true)
        .topology();

    EXPECT_TRUE(t.hasToken("A"));
    EXPECT_TRUE(t.hasSingletonToken("A"));
    EXPECT_FALSE(t.hasToken("B"));
    EXPECT_EQ(t.status("A"), Status::Completed);
    EXPECT_THROW(t.status("nope"), StructuralError);
    EXPECT_EQ(t.variable("x"), std::optional<std::string>("7"));
    ASSERT_TRUE(t.signal("go").has_value());
    EXPECT_TRUE(t.signal("go")->persistent());
    EXPECT_EQ(t.tokenCount(), 1);
}

// ─── Delta application ─────────────────────────────────────────

TEST(TopologyTest, ApplyMovesToken) {
    Topology t = WorkflowBuilder()
        .task("A").completed()
        .task("B")
        .flow("A", "B")
        .topology();

    Delta d;
    d.remove(Fact::token("A"));
    d.add(Fact::token("B"));
    d.setStatus("B", Status::Pending, Status::Active);

    uint64_t gen = t.apply(d);
    EXPECT_EQ(gen, 1);
    EXPECT_FALSE(t.hasToken("A"));
    EXPECT_TRUE(t.hasToken("B"));
    EXPECT_EQ(t.status("B"), Status::Active);
}

TEST(TopologyTest, IllegalTransitionLeavesStateUntouched) {
    Topology t = WorkflowBuilder()
        .task("A").completed()
        .task("B").voided()
        .topology();

    Delta d;
    d.remove(Fact::token("A"));
    d.setStatus("B", Status::Voided, Status::Active);
    EXPECT_THROW(t.apply(d), StructuralError);

    EXPECT_TRUE(t.hasToken("A"));
    EXPECT_EQ(t.status("B"), Status::Voided);
    EXPECT_EQ(t.generation(), 0);
}

TEST(TopologyTest, CompletedCannotBeVoided) {
    Topology t = WorkflowBuilder().task("A").completed(false).topology();
    Delta d;
    d.setStatus("A", Status::Completed, Status::Voided);
    EXPECT_THROW(t.validate(d), StructuralError);
}

TEST(TopologyTest, StaleStatusRejected) {
    Topology t = WorkflowBuilder().task("A").active().topology();
    Delta d;
    d.setStatus("A", Status::Pending, Status::Active);
    EXPECT_THROW(t.validate(d), StructuralError);
}

TEST(TopologyTest, RemovingMissingFactRejected) {
    Topology t = WorkflowBuilder().task("A").topology();
    Delta d;
    d.remove(Fact::token("A"));
    EXPECT_THROW(t.apply(d), StructuralError);
}

TEST(TopologyTest, TokenOnVoidedNodeRejected) {
    Topology t = WorkflowBuilder().task("A").voided().topology();
    Delta d;
    d.add(Fact::token("A"));
    EXPECT_THROW(t.validate(d), StructuralError);
}

TEST(TopologyTest, NormalizeDropsFactsAlreadyTrue) {
    Topology t = WorkflowBuilder().task("A").active().topology();
    Delta d;
    d.add(Fact::token("A"));
    d.add(Fact::status("A", Status::Active));
    d.add(Fact::marker("A", "k", "v"));
    t.normalize(d);
    EXPECT_EQ(d.additions.size(), 1);
    EXPECT_EQ(d.additions.begin()->kind, FactKind::Marker);
}

TEST(TopologyTest, SnapshotIsIndependent) {
    Topology t = WorkflowBuilder()
        .task("A").completed()
        .task("B")
        .flow("A", "B")
        .topology();
    TopologyView view = t.snapshot();

    Delta d;
    d.remove(Fact::token("A"));
    t.apply(d);

    EXPECT_TRUE(view->hasToken("A"));
    EXPECT_FALSE(t.hasToken("A"));
}

// ─── Bulk exchange ─────────────────────────────────────────────

TEST(TopologyTest, ExportLoadRoundTrip) {
    Topology t = WorkflowBuilder()
        .task("A").completed()
        .task("B").join(ControlType::And).cancels({"C"})
        .task("C").active()
        .flow("A", "B")
        .guarded("C", "B", "x >= 2")
        .variable("x", "3")
        .topology();

    Delta d;
    d.add(Fact::marker("B", "join.seen", "A"));
    d.add(Fact::arrival("C", "B"));
    t.apply(d);

    Topology copy = Topology::load(t.exportFacts());
    EXPECT_EQ(copy, t);
    EXPECT_TRUE(copy.hasArrival("C", "B"));
}

TEST(TopologyTest, LoadRejectsFactsOnUnknownNodes) {
    GraphFacts facts;
    facts.nodes.emplace_back("A", NodeKind::Task);
    facts.facts.push_back(Fact::token("ghost"));
    EXPECT_THROW(Topology::load(facts), StructuralError);
}

// ─── Reachability ──────────────────────────────────────────────

TEST(TopologyTest, LiveReachableStopsAtBarrier) {
    Topology t = WorkflowBuilder()
        .task("S").active()
        .task("X")
        .task("J")
        .task("After")
        .task("Idle")
        .flow("S", "X")
        .flow("X", "J")
        .flow("J", "After")
        .flow("Idle", "J")
        .topology();

    auto live = liveReachable(t, "J");
    EXPECT_TRUE(live.count("S"));
    EXPECT_TRUE(live.count("X"));
    EXPECT_FALSE(live.count("J"));
    EXPECT_FALSE(live.count("After"));
    EXPECT_FALSE(live.count("Idle"));
}
