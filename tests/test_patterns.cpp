#include <gtest/gtest.h>
#include "engine/workflow_engine.hpp"
#include "graph/workflow_builder.hpp"
#include "kernel/routing.hpp"
#include <memory>

using namespace tickflow;

// End-to-end runs of the standard catalog, one workflow control pattern
// (or family) per test.

namespace {

class PatternRun : public ::testing::Test {
protected:
    void load(const WorkflowBuilder& builder) {
        provenance_ = std::make_shared<ProvenanceObserver>();
        engine_.addObserver(provenance_);
        engine_.loadTopology(builder.build());
    }

    RunReport run() { return engine_.runToCompletion(); }

    Status status(const NodeId& id) const { return engine_.statusOf(id); }
    bool token(const NodeId& id) const { return engine_.topology().hasToken(id); }
    size_t fires(const std::string& pattern) const { return provenance_->firesOf(pattern); }

    bool clean() const {
        for (const auto& t : provenance_->history()) {
            if (!t.diagnostics.empty()) return false;
        }
        return true;
    }

    WorkflowEngine engine_;
    std::shared_ptr<ProvenanceObserver> provenance_;
};

InstanceOptions staticInstances(uint32_t count, uint32_t threshold = 0) {
    InstanceOptions o;
    o.mode = InstanceMode::Static;
    o.count = count;
    o.threshold = threshold;
    return o;
}

WorkflowBuilder instanceNet(const InstanceOptions& options) {
    WorkflowBuilder b;
    b.task("S").completed()
     .task("M").instances(options)
     .task("E")
     .flow("S", "M")
     .flow("M", "E");
    return b;
}

} // namespace

// ─── Multiple instances ────────────────────────────────────────

TEST_F(PatternRun, StaticInstancesSynchronize) {
    load(instanceNet(staticInstances(3)));

    RunReport spawned = run();
    EXPECT_EQ(spawned.tickCount(), 3);
    EXPECT_EQ(status("M@0#0"), Status::Active);
    EXPECT_EQ(status("M@0#2"), Status::Active);
    EXPECT_EQ(fires("SpawnStatic"), 1);

    engine_.complete("M@0#0");
    engine_.complete("M@0#1");
    run();
    EXPECT_EQ(status("M"), Status::Active);
    EXPECT_EQ(status("E"), Status::Pending);

    engine_.complete("M@0#2");
    run();
    EXPECT_EQ(status("M"), Status::Completed);
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_EQ(engine_.topology().instances().groupOf("M"), nullptr);
    EXPECT_FALSE(token("M@0#1"));
    EXPECT_EQ(fires("InstancesAll"), 1);
    EXPECT_TRUE(clean());
}

TEST_F(PatternRun, DynamicInstancesCountFromVariable) {
    InstanceOptions o;
    o.mode = InstanceMode::Dynamic;
    o.count_variable = "items";
    load(instanceNet(o));
    engine_.setVariable("items", "a,b");

    run();
    const MultiInstanceGroup* group = engine_.topology().instances().groupOf("M");
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->instances.size(), 2);

    engine_.complete("M@0#0");
    engine_.complete("M@0#1");
    run();
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_EQ(fires("SpawnDynamic"), 1);
}

TEST_F(PatternRun, IncrementalInstancesWaitForSeal) {
    InstanceOptions o;
    o.mode = InstanceMode::Incremental;
    load(instanceNet(o));

    run();
    engine_.requestInstance("M", 2);
    run();
    const MultiInstanceGroup* group = engine_.topology().instances().groupOf("M");
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->instances.size(), 3);
    EXPECT_EQ(fires("ExtendIncremental"), 1);

    for (const char* child : {"M@0#0", "M@0#1", "M@0#2"}) engine_.complete(child);
    run();
    EXPECT_EQ(status("M"), Status::Active);

    engine_.sealGroup("M");
    EXPECT_THROW(engine_.requestInstance("M"), StructuralError);
    run();
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_EQ(engine_.topology().instances().groupOf("M"), nullptr);
}

TEST_F(PatternRun, DetachedInstancesDoNotBlock) {
    InstanceOptions o = staticInstances(2);
    o.synchronize = false;
    load(instanceNet(o));

    run();
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_EQ(status("M@0#0"), Status::Active);
    ASSERT_NE(engine_.topology().instances().groupOf("M"), nullptr);

    engine_.complete("M@0#0");
    engine_.complete("M@0#1");
    run();
    EXPECT_EQ(engine_.topology().instances().groupOf("M"), nullptr);
    EXPECT_TRUE(clean());
}

TEST_F(PatternRun, StaticPartialJoinFiresOnce) {
    load(instanceNet(staticInstances(3, 2)));
    run();

    engine_.complete("M@0#0");
    engine_.complete("M@0#2");
    run();
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_EQ(status("M@0#1"), Status::Active);
    EXPECT_NE(engine_.topology().instances().groupOf("M"), nullptr);

    engine_.complete("M@0#1");
    run();
    EXPECT_EQ(engine_.topology().instances().groupOf("M"), nullptr);
    EXPECT_FALSE(engine_.topology().marker("M", markers::kInstancesFired).has_value());
    EXPECT_EQ(fires("Sequence"), 2);
}

TEST_F(PatternRun, CancellingPartialJoinVoidsStragglers) {
    InstanceOptions o = staticInstances(3, 2);
    o.cancel_remaining = true;
    load(instanceNet(o));
    run();

    engine_.complete("M@0#0");
    engine_.complete("M@0#1");
    run();
    EXPECT_EQ(status("M@0#2"), Status::Voided);
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_EQ(engine_.topology().instances().groupOf("M"), nullptr);
    EXPECT_EQ(fires("CancellingMIJoin"), 1);
}

TEST_F(PatternRun, DynamicPartialJoinReadsThreshold) {
    InstanceOptions o = staticInstances(3);
    o.threshold_variable = "needed";
    load(instanceNet(o));
    engine_.setVariable("needed", "1");
    run();

    engine_.complete("M@0#1");
    run();
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_EQ(fires("InstancesDynamicQuorum"), 1);
}

TEST_F(PatternRun, CancelInstancesResolvesGroup) {
    load(instanceNet(staticInstances(2)));
    run();

    engine_.complete("M@0#0");
    engine_.requestCancel("M", CancellationScope::Instances);
    run();
    EXPECT_EQ(status("M@0#0"), Status::Completed);
    EXPECT_EQ(status("M@0#1"), Status::Voided);
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_EQ(fires("CancelInstances"), 1);
}

// ─── Joins ─────────────────────────────────────────────────────

TEST_F(PatternRun, DiscriminatorAbsorbsLateBranches) {
    load(WorkflowBuilder()
        .task("S").completed().split(ControlType::And)
        .task("A")
        .task("B")
        .task("D").quorum(1)
        .task("E")
        .flow("S", "A")
        .flow("S", "B")
        .flow("A", "D")
        .flow("B", "D")
        .flow("D", "E"));
    run();

    engine_.complete("A");
    run();
    EXPECT_EQ(status("D"), Status::Active);

    engine_.complete("B");
    run();
    EXPECT_TRUE(token("B"));

    engine_.complete("D");
    run();
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_FALSE(token("B"));
    EXPECT_FALSE(engine_.topology().marker("D", markers::kJoinSpent).has_value());
    EXPECT_EQ(provenance_->activationsOf("E").size(), 0);
    EXPECT_TRUE(clean());
}

TEST_F(PatternRun, BlockingDiscriminatorNeedsReset) {
    load(WorkflowBuilder()
        .task("A").completed()
        .task("B").completed()
        .task("D").quorum(1, true)
        .flow("A", "D")
        .flow("B", "D"));
    run();

    EXPECT_EQ(status("D"), Status::Active);
    EXPECT_EQ(fires("BlockingDiscriminator"), 1);

    engine_.complete("D");
    run();
    EXPECT_FALSE(token("B"));
    auto seen = engine_.topology().markers("D", markers::kJoinSeen);
    EXPECT_EQ(seen.size(), 2);
    EXPECT_TRUE(engine_.topology().marker("D", markers::kJoinSpent).has_value());

    engine_.resetJoin("D");
    EXPECT_FALSE(engine_.topology().marker("D", markers::kJoinSpent).has_value());
    EXPECT_TRUE(engine_.topology().markers("D", markers::kJoinSeen).empty());
}

TEST_F(PatternRun, BlockingDiscriminatorFiresOnceForSimultaneousBranches) {
    load(WorkflowBuilder()
        .task("A").completed()
        .task("B").completed()
        .task("C").completed()
        .task("D").quorum(1, true)
        .flow("A", "D")
        .flow("B", "D")
        .flow("C", "D"));

    TickResult first = engine_.step();
    ASSERT_EQ(first.activations.size(), 1);
    EXPECT_EQ(first.activations[0].node, "D");
    EXPECT_EQ(status("D"), Status::Active);

    run();
    engine_.step();
    EXPECT_EQ(provenance_->activationsOf("D").size(), 1);
    EXPECT_EQ(fires("BlockingDiscriminator"), 1);
    EXPECT_FALSE(token("A"));
    EXPECT_FALSE(token("B"));
    EXPECT_FALSE(token("C"));

    engine_.complete("D");
    run();
    EXPECT_EQ(fires("BlockingDiscriminator"), 1);
    EXPECT_EQ(engine_.topology().markers("D", markers::kJoinSeen).size(), 3);
    EXPECT_TRUE(engine_.topology().marker("D", markers::kJoinSpent).has_value());
    EXPECT_TRUE(clean());
}

TEST_F(PatternRun, CancellingDiscriminatorVoidsOtherBranches) {
    load(WorkflowBuilder()
        .task("A").completed()
        .task("B").active()
        .task("D").quorum(1, false, true)
        .flow("A", "D")
        .flow("B", "D"));
    run();

    EXPECT_EQ(status("D"), Status::Active);
    EXPECT_EQ(status("B"), Status::Voided);
    EXPECT_FALSE(token("B"));
    EXPECT_EQ(fires("CancellingJoin"), 1);
}

TEST_F(PatternRun, PartialJoinWaitsForQuorum) {
    load(WorkflowBuilder()
        .task("A").completed()
        .task("B").active()
        .task("C").active()
        .task("J").quorum(2)
        .flow("A", "J")
        .flow("B", "J")
        .flow("C", "J"));
    run();
    EXPECT_EQ(status("J"), Status::Pending);

    engine_.complete("B");
    run();
    EXPECT_EQ(status("J"), Status::Active);
    EXPECT_EQ(status("C"), Status::Active);
    EXPECT_EQ(fires("PartialJoin"), 1);
}

TEST_F(PatternRun, CancellingPartialJoin) {
    load(WorkflowBuilder()
        .task("A").completed()
        .task("B").completed()
        .task("C").active()
        .task("J").quorum(2, false, true)
        .flow("A", "J")
        .flow("B", "J")
        .flow("C", "J"));
    run();
    EXPECT_EQ(status("J"), Status::Active);
    EXPECT_EQ(status("C"), Status::Voided);
    EXPECT_EQ(fires("BlockingPartialJoin"), 1);
}

namespace {

WorkflowBuilder mergeNet(bool reachability) {
    WorkflowBuilder b;
    b.task("S").completed().split(ControlType::And)
     .task("B")
     .task("X")
     .task("D")
     .task("J").join(ControlType::Or);
    if (reachability) b.reachability();
    b.flow("S", "B")
     .flow("S", "X")
     .flow("X", "D")
     .flow("B", "J")
     .flow("D", "J");
    return b;
}

} // namespace

TEST_F(PatternRun, OrJoinFiresOnActiveBranches) {
    load(mergeNet(false));
    run();
    engine_.complete("B");
    run();
    EXPECT_EQ(status("J"), Status::Active);
    EXPECT_EQ(fires("OrJoin"), 1);
}

TEST_F(PatternRun, ReachabilityMergeWaitsForLiveBranches) {
    load(mergeNet(true));
    run();
    engine_.complete("B");
    run();
    EXPECT_EQ(status("J"), Status::Pending);
    EXPECT_TRUE(token("B"));

    engine_.complete("X");
    run();
    EXPECT_EQ(status("D"), Status::Active);
    EXPECT_EQ(status("J"), Status::Pending);

    engine_.complete("D");
    run();
    EXPECT_EQ(status("J"), Status::Active);
    EXPECT_FALSE(token("B"));
    EXPECT_FALSE(token("D"));
    EXPECT_EQ(fires("ReachabilityMerge"), 1);
}

// ─── Gates ─────────────────────────────────────────────────────

TEST_F(PatternRun, MutexSerializesContenders) {
    load(WorkflowBuilder()
        .task("S").completed().split(ControlType::And)
        .task("A").mutex("m")
        .task("B").mutex("m")
        .flow("S", "A")
        .flow("S", "B"));
    run();
    EXPECT_EQ(status("A"), Status::Active);
    EXPECT_EQ(status("B"), Status::Pending);
    EXPECT_TRUE(engine_.topology().hasArrival("S", "B"));

    engine_.complete("A");
    run();
    EXPECT_EQ(status("B"), Status::Active);
    EXPECT_EQ(fires("MutexGate"), 2);
    EXPECT_TRUE(clean());
}

TEST_F(PatternRun, MilestoneEnablesWhileHeld) {
    load(WorkflowBuilder()
        .task("P").completed()
        .task("Ms")
        .task("S").completed()
        .task("W").milestone("Ms")
        .flow("P", "Ms")
        .flow("S", "W"));
    run();
    EXPECT_EQ(status("W"), Status::Active);
    EXPECT_FALSE(token("S"));
}

TEST_F(PatternRun, MilestoneNeverReached) {
    load(WorkflowBuilder()
        .task("Ms")
        .task("S").completed()
        .task("W").milestone("Ms")
        .flow("S", "W"));
    RunReport r = run();
    EXPECT_EQ(status("W"), Status::Pending);
    EXPECT_TRUE(token("S"));
    EXPECT_TRUE(clean());
    EXPECT_EQ(r.tickCount(), 1);
}

TEST_F(PatternRun, TransientTriggerIsLostWhenNobodyWaits) {
    load(WorkflowBuilder()
        .task("S").active()
        .task("T").trigger("go")
        .flow("S", "T"));

    engine_.signal("go");
    run();
    EXPECT_FALSE(engine_.topology().signal("go").has_value());

    engine_.complete("S");
    run();
    EXPECT_EQ(status("T"), Status::Pending);

    engine_.signal("go");
    run();
    EXPECT_EQ(status("T"), Status::Active);
    EXPECT_EQ(fires("TransientTrigger"), 1);
}

TEST_F(PatternRun, PersistentTriggerWaitsForWork) {
    load(WorkflowBuilder()
        .task("S").active()
        .task("T").trigger("go", true)
        .flow("S", "T"));

    engine_.signal("go", true);
    run();
    EXPECT_TRUE(engine_.topology().signal("go").has_value());

    engine_.complete("S");
    run();
    EXPECT_EQ(status("T"), Status::Active);
    EXPECT_FALSE(engine_.topology().signal("go").has_value());
    EXPECT_EQ(fires("PersistentTrigger"), 1);
}

// ─── Routing ───────────────────────────────────────────────────

TEST_F(PatternRun, DeferredChoiceTakesFirstEvent) {
    load(WorkflowBuilder()
        .task("S").completed().deferred()
        .task("A")
        .task("B")
        .onEvent("S", "A", "email")
        .onEvent("S", "B", "phone"));
    run();
    EXPECT_TRUE(token("S"));
    EXPECT_TRUE(clean());

    engine_.signal("phone");
    run();
    EXPECT_EQ(status("B"), Status::Active);
    EXPECT_EQ(status("A"), Status::Pending);
    EXPECT_EQ(engine_.topology().marker("S", markers::kChoice), std::optional<std::string>("B"));
}

TEST_F(PatternRun, StructuredLoopHonorsBound) {
    load(WorkflowBuilder()
        .condition("S").completed()
        .condition("L").maxIterations(2)
        .task("E")
        .flow("S", "L")
        .backEdge("L", "S")
        .flow("L", "E"));

    RunReport r = run();
    EXPECT_EQ(r.tickCount(), 7);
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_EQ(fires("StructuredLoop"), 3);
    EXPECT_FALSE(engine_.topology().marker("L", markers::kIterations).has_value());
}

TEST_F(PatternRun, ArbitraryCycleReentersTask) {
    load(WorkflowBuilder()
        .task("B").active()
        .condition("C")
        .task("E")
        .flow("B", "C")
        .backEdge("C", "B", "again")
        .flow("C", "E")
        .variable("again", "true"));

    engine_.complete("B");
    run();
    EXPECT_EQ(status("B"), Status::Active);
    EXPECT_EQ(status("E"), Status::Pending);

    engine_.setVariable("again", "false");
    engine_.complete("B");
    run();
    EXPECT_EQ(status("E"), Status::Active);
    EXPECT_EQ(fires("ArbitraryCycle"), 2);
}

TEST_F(PatternRun, MultiChoiceAndMerge) {
    load(WorkflowBuilder()
        .task("S").completed().split(ControlType::Or)
        .task("A")
        .task("B")
        .task("C")
        .guarded("S", "A", "a")
        .guarded("S", "B", "b")
        .guarded("S", "C", "c")
        .variable("a", "true")
        .variable("c", "true"));
    run();
    EXPECT_EQ(status("A"), Status::Active);
    EXPECT_EQ(status("B"), Status::Pending);
    EXPECT_EQ(status("C"), Status::Active);
    EXPECT_EQ(fires("OrSplit"), 1);
}

// ─── Cancellation and termination ──────────────────────────────

TEST_F(PatternRun, ExplicitTerminationVoidsRemainingWork) {
    load(WorkflowBuilder()
        .task("S").completed().split(ControlType::And)
        .task("A")
        .output("o", true)
        .flow("S", "A")
        .flow("S", "o"));

    RunReport r = run();
    EXPECT_EQ(status("A"), Status::Voided);
    EXPECT_EQ(status("o"), Status::Completed);
    EXPECT_EQ(engine_.topology().tokenCount(), 0);
    EXPECT_FALSE(r.deadlock.has_value());
    EXPECT_EQ(fires("ExplicitTermination"), 1);
}

TEST_F(PatternRun, CancellationRegionThenRoute) {
    load(WorkflowBuilder()
        .task("K").completed().cancels({"X", "Y"})
        .task("X").active()
        .task("Y")
        .task("Z")
        .flow("K", "Z"));

    run();
    EXPECT_EQ(status("X"), Status::Voided);
    EXPECT_EQ(status("Y"), Status::Voided);
    EXPECT_EQ(status("Z"), Status::Active);
    EXPECT_EQ(fires("CancellationRegion"), 1);
}

TEST_F(PatternRun, CancelTaskWithNestedWork) {
    load(WorkflowBuilder()
        .task("P").active().nests({"C"})
        .task("C").active()
        .task("Other").active());

    engine_.requestCancel("P", CancellationScope::Task);
    run();
    EXPECT_EQ(status("P"), Status::Voided);
    EXPECT_EQ(status("C"), Status::Voided);
    EXPECT_EQ(status("Other"), Status::Active);
    EXPECT_FALSE(engine_.topology().marker("P", markers::kCancelRequest).has_value());
}

TEST_F(PatternRun, CancelSelf) {
    load(WorkflowBuilder().task("A").active().task("B").active());
    engine_.requestCancel("A", CancellationScope::Self);
    run();
    EXPECT_EQ(status("A"), Status::Voided);
    EXPECT_EQ(status("B"), Status::Active);
    EXPECT_THROW(engine_.complete("A"), StructuralError);
}
