#include <gtest/gtest.h>
#include "graph/workflow_builder.hpp"
#include "verification/topology_validator.hpp"
#include <algorithm>

using namespace tickflow;

namespace {

bool failed(const std::vector<VerificationResult>& results, const std::string& check) {
    return std::any_of(results.begin(), results.end(), [&](const VerificationResult& r) {
        return !r.passed && r.check_name == check;
    });
}

} // namespace

TEST(ValidatorTest, WellFormedNetPasses) {
    Topology t = WorkflowBuilder()
        .input("i").completed()
        .task("A").split(ControlType::And)
        .task("B")
        .task("C")
        .task("J").join(ControlType::And)
        .output("o")
        .flow("i", "A")
        .flow("A", "B")
        .flow("A", "C")
        .flow("B", "J")
        .flow("C", "J")
        .flow("J", "o")
        .topology();

    TopologyValidator validator;
    auto results = validator.check(t);
    ASSERT_EQ(results.size(), 1);
    EXPECT_TRUE(results[0].passed);
    EXPECT_EQ(results[0].check_name, "structure_check");
    EXPECT_TRUE(TopologyValidator::failures(results).empty());
}

TEST(ValidatorTest, JoinShapes) {
    Topology t = WorkflowBuilder()
        .task("Lonely").join(ControlType::And)
        .task("A")
        .task("Q").quorum(3)
        .task("S").split(ControlType::Xor)
        .flow("A", "Q")
        .topology();

    auto results = TopologyValidator().check(t);
    EXPECT_TRUE(failed(results, "join_has_predecessors"));
    EXPECT_TRUE(failed(results, "quorum_fits_predecessors"));
    EXPECT_TRUE(failed(results, "split_has_branches"));
}

TEST(ValidatorTest, DanglingReferences) {
    Topology t = WorkflowBuilder()
        .task("K").cancels({"ghost"})
        .task("P").nests({"phantom"})
        .task("G").milestone("nowhere")
        .topology();

    auto results = TopologyValidator().check(t);
    EXPECT_TRUE(failed(results, "cancellation_target_exists"));
    EXPECT_TRUE(failed(results, "nested_node_exists"));
    EXPECT_TRUE(failed(results, "milestone_exists"));
}

TEST(ValidatorTest, RoutingShapes) {
    Topology t = WorkflowBuilder()
        .task("D").deferred()
        .task("L").maxIterations(2)
        .task("X")
        .flow("D", "X")
        .flow("L", "X")
        .topology();

    auto results = TopologyValidator().check(t);
    EXPECT_TRUE(failed(results, "deferred_flow_has_event"));
    EXPECT_TRUE(failed(results, "loop_has_back_edge"));
}

TEST(ValidatorTest, InstanceSettings) {
    InstanceOptions over;
    over.mode = InstanceMode::Static;
    over.count = 5;
    over.max = 3;
    over.threshold = 6;

    InstanceOptions dynamic;
    dynamic.mode = InstanceMode::Dynamic;

    InstanceOptions modeless;
    modeless.threshold = 2;

    InstanceOptions gated;
    gated.mode = InstanceMode::Static;
    gated.count = 1;

    Topology t = WorkflowBuilder()
        .task("Over").instances(over)
        .task("Dyn").instances(dynamic)
        .task("Plain").instances(modeless)
        .task("Gated").instances(gated).mutex("lock")
        .topology();

    auto results = TopologyValidator().check(t);
    EXPECT_TRUE(failed(results, "instance_bounds"));
    EXPECT_TRUE(failed(results, "instance_threshold"));
    EXPECT_TRUE(failed(results, "instance_count_source"));
    EXPECT_TRUE(failed(results, "instance_mode_set"));
    EXPECT_TRUE(failed(results, "instance_not_gated"));
}

TEST(ValidatorTest, TriggerAndTermination) {
    GraphFacts facts = WorkflowBuilder().task("T").build();
    facts.nodes[0].persistent_trigger = true;
    facts.nodes[0].terminates_case = true;

    auto results = TopologyValidator().check(Topology::load(facts));
    EXPECT_TRUE(failed(results, "trigger_named"));
    EXPECT_TRUE(failed(results, "termination_on_output"));
}

TEST(ValidatorTest, CustomConstraint) {
    TopologyValidator validator;
    validator.addConstraint("no_tasks_named_x", [](const Topology& t) {
        std::vector<VerificationResult> r;
        if (t.hasNode("x")) r.push_back({false, "", "Task x is forbidden", "x"});
        return r;
    });
    EXPECT_EQ(validator.constraintCount(), 1);

    auto ok = validator.check(WorkflowBuilder().task("y").topology());
    EXPECT_TRUE(TopologyValidator::failures(ok).empty());

    auto bad = validator.check(WorkflowBuilder().task("x").topology());
    auto failures = TopologyValidator::failures(bad);
    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures[0].check_name, "no_tasks_named_x");
    EXPECT_EQ(failures[0].node_id, "x");
}
