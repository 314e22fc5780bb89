#include <gtest/gtest.h>
#include "errors/errors.hpp"
#include "graph/delta.hpp"

using namespace tickflow;

namespace {

bool hasKind(const std::vector<Diagnostic>& diags, DiagnosticKind kind) {
    for (const auto& d : diags) {
        if (d.kind == kind) return true;
    }
    return false;
}

} // namespace

TEST(DeltaTest, SetStatusSameValueIsEmpty) {
    Delta d;
    d.setStatus("A", Status::Active, Status::Active);
    EXPECT_TRUE(d.empty());
    d.setStatus("A", Status::Pending, Status::Active);
    EXPECT_EQ(d.size(), 2);
}

TEST(DeltaTest, WorkBalanceCountsTokensAndArrivals) {
    Delta d;
    d.remove(Fact::token("S"));
    d.add(Fact::token("A"));
    d.add(Fact::token("B"));
    d.add(Fact::arrival("S", "J"));
    d.add(Fact::marker("S", "k", "v"));
    EXPECT_EQ(d.workBalance(), 2);
}

TEST(DeltaTest, DescribeListsFacts) {
    Delta d;
    d.add(Fact::token("B"));
    d.remove(Fact::token("A"));
    std::string text = d.describe();
    EXPECT_NE(text.find("token(B)"), std::string::npos);
    EXPECT_NE(text.find("token(A)"), std::string::npos);
}

// ─── Merge ─────────────────────────────────────────────────────

TEST(DeltaMergeTest, UnionOfIndependentContributions) {
    Delta a, b;
    a.remove(Fact::token("A"));
    a.add(Fact::token("X"));
    b.remove(Fact::token("B"));
    b.add(Fact::token("Y"));

    std::vector<Diagnostic> conflicts;
    Delta merged = DeltaMerger::merge({{"A", a}, {"B", b}}, conflicts);
    EXPECT_TRUE(conflicts.empty());
    EXPECT_EQ(merged.additions.size(), 2);
    EXPECT_EQ(merged.removals.size(), 2);
}

TEST(DeltaMergeTest, MergeIsOrderIndependent) {
    Delta a, b;
    a.add(Fact::token("X"));
    a.setStatus("X", Status::Pending, Status::Active);
    b.setStatus("X", Status::Pending, Status::Voided);

    std::vector<Diagnostic> c1, c2;
    Delta m1 = DeltaMerger::merge({{"A", a}, {"B", b}}, c1);
    Delta m2 = DeltaMerger::merge({{"B", b}, {"A", a}}, c2);
    EXPECT_EQ(m1, m2);
    EXPECT_EQ(c1.size(), c2.size());
}

TEST(DeltaMergeTest, RemovalWins) {
    Delta a, b;
    a.add(Fact::token("X"));
    b.remove(Fact::token("X"));

    std::vector<Diagnostic> conflicts;
    Delta merged = DeltaMerger::merge({{"A", a}, {"B", b}}, conflicts);
    EXPECT_EQ(merged.additions.count(Fact::token("X")), 0);
    EXPECT_EQ(merged.removals.count(Fact::token("X")), 1);
    EXPECT_TRUE(hasKind(conflicts, DiagnosticKind::CancellationConflict));
}

TEST(DeltaMergeTest, VoidBeatsActivation) {
    Delta activate, cancel;
    activate.add(Fact::token("X"));
    activate.setStatus("X", Status::Pending, Status::Active);
    cancel.setStatus("X", Status::Pending, Status::Voided);

    std::vector<Diagnostic> conflicts;
    Delta merged = DeltaMerger::merge({{"A", activate}, {"C", cancel}}, conflicts);

    EXPECT_EQ(merged.additions.count(Fact::status("X", Status::Voided)), 1);
    EXPECT_EQ(merged.additions.count(Fact::status("X", Status::Active)), 0);
    EXPECT_EQ(merged.additions.count(Fact::token("X")), 0);
    EXPECT_EQ(conflicts.size(), 2);
    for (const auto& c : conflicts) {
        EXPECT_EQ(c.kind, DiagnosticKind::CancellationConflict);
        EXPECT_EQ(c.node_id, "X");
    }
}

TEST(DeltaMergeTest, CompletedBeatsActive) {
    Delta a, b;
    a.setStatus("X", Status::Pending, Status::Active);
    b.setStatus("X", Status::Pending, Status::Completed);

    std::vector<Diagnostic> conflicts;
    Delta merged = DeltaMerger::merge({{"A", a}, {"B", b}}, conflicts);
    EXPECT_EQ(merged.additions.count(Fact::status("X", Status::Completed)), 1);
    EXPECT_EQ(merged.additions.count(Fact::status("X", Status::Active)), 0);
}

TEST(DeltaMergeTest, IdenticalContributionsCollapse) {
    Delta a;
    a.add(Fact::token("X"));
    a.setStatus("X", Status::Pending, Status::Active);

    std::vector<Diagnostic> conflicts;
    Delta merged = DeltaMerger::merge({{"P1", a}, {"P2", a}}, conflicts);
    EXPECT_TRUE(conflicts.empty());
    EXPECT_EQ(merged, a);
}

TEST(DeltaMergeTest, VoidedOriginLosesWholeActivation) {
    // P spawns a child while K voids P in the same tick.
    Delta spawn, cancel;
    spawn.remove(Fact::token("P"));
    spawn.add(Fact::group("P", "P@0", InstanceMode::Static, 1));
    spawn.add(Fact::instance("P@0#0", "P@0", "P", 0));
    spawn.add(Fact::status("P@0#0", Status::Active));
    spawn.add(Fact::token("P@0#0"));
    spawn.add(Fact::token("Next"));
    cancel.remove(Fact::token("P"));
    cancel.setStatus("P", Status::Active, Status::Voided);

    std::vector<Diagnostic> conflicts;
    Delta merged = DeltaMerger::merge({{"P", spawn}, {"K", cancel}}, conflicts);
    EXPECT_EQ(merged, cancel);
    ASSERT_EQ(conflicts.size(), 1);
    EXPECT_EQ(conflicts[0].kind, DiagnosticKind::CancellationConflict);
    EXPECT_EQ(conflicts[0].node_id, "P");
}

TEST(DeltaMergeTest, SelfVoidIsKept) {
    Delta self;
    self.remove(Fact::token("C"));
    self.setStatus("C", Status::Active, Status::Voided);

    std::vector<Diagnostic> conflicts;
    Delta merged = DeltaMerger::merge({{"C", self}}, conflicts);
    EXPECT_EQ(merged, self);
    EXPECT_TRUE(conflicts.empty());
}
