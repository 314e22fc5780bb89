#pragma once

#include "graph/flow.hpp"
#include "graph/graph_facts.hpp"
#include "graph/node.hpp"
#include "graph/topology.hpp"
#include <map>
#include <string>
#include <vector>

namespace tickflow {

/// Fluent construction of GraphFacts.
/// Node modifiers apply to the most recently declared node. Flows out of
/// one source get increasing priorities in declaration order unless a
/// priority is given explicitly.
///
///   auto facts = WorkflowBuilder()
///       .task("A").completed()
///       .task("B")
///       .flow("A", "B")
///       .build();
class WorkflowBuilder {
public:
    // ─── Nodes ─────────────────────────────────────────────

    WorkflowBuilder& task(const NodeId& id);
    WorkflowBuilder& condition(const NodeId& id);
    WorkflowBuilder& input(const NodeId& id);
    WorkflowBuilder& output(const NodeId& id, bool terminates_case = false);

    WorkflowBuilder& split(ControlType type);
    WorkflowBuilder& join(ControlType type);

    /// Completed (or Active) nodes carry a token unless told otherwise.
    WorkflowBuilder& completed(bool with_token = true);
    WorkflowBuilder& active(bool with_token = true);
    WorkflowBuilder& voided();

    WorkflowBuilder& cancels(const std::vector<NodeId>& targets);
    WorkflowBuilder& nests(const std::vector<NodeId>& children);
    WorkflowBuilder& quorum(uint32_t n, bool blocking = false, bool cancel_remaining = false);
    WorkflowBuilder& reachability();
    WorkflowBuilder& instances(const InstanceOptions& options);
    WorkflowBuilder& mutex(const std::string& lock);
    WorkflowBuilder& milestone(const NodeId& id);
    WorkflowBuilder& trigger(const std::string& name, bool persistent = false);
    WorkflowBuilder& deferred();
    WorkflowBuilder& maxIterations(uint32_t n);
    WorkflowBuilder& attribute(const std::string& key, const std::string& value);

    // ─── Flows ─────────────────────────────────────────────

    WorkflowBuilder& flow(const NodeId& source, const NodeId& target);
    WorkflowBuilder& flow(Flow f);
    WorkflowBuilder& guarded(const NodeId& source, const NodeId& target, const std::string& expression);
    WorkflowBuilder& fallback(const NodeId& source, const NodeId& target);
    WorkflowBuilder& backEdge(const NodeId& source, const NodeId& target,
                              const std::string& expression = "");
    WorkflowBuilder& onEvent(const NodeId& source, const NodeId& target, const std::string& event);

    // ─── Marking ───────────────────────────────────────────

    WorkflowBuilder& variable(const std::string& name, const std::string& value);
    WorkflowBuilder& signal(const std::string& name, bool persistent = false);

    /// Throws std::invalid_argument for duplicate nodes.
    GraphFacts build() const;

    /// Shorthand for Topology::load(build()).
    Topology topology() const { return Topology::load(build()); }

private:
    WorkflowBuilder& addNode(const NodeId& id, NodeKind kind);
    Node& current();
    void setStatus(Status status, bool with_token);
    int32_t nextPriority(const NodeId& source);

    GraphFacts facts_;
    std::map<NodeId, size_t> index_;
    std::map<NodeId, int32_t> priorities_;
    NodeId last_;
    bool duplicate_ = false;
    NodeId duplicate_id_;
};

} // namespace tickflow
