#pragma once

#include "graph/delta.hpp"
#include "graph/fact.hpp"
#include "graph/flow.hpp"
#include "graph/graph_facts.hpp"
#include "graph/node.hpp"
#include "instances/multi_instance_manager.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tickflow {

class Topology;

/// Read-consistent view of one generation. Shared by every verb of a tick.
using TopologyView = std::shared_ptr<const Topology>;

/// The workflow graph plus its current marking.
/// Structure (nodes, flows) is loaded up front; the marking changes only
/// through apply(), which validates the whole delta before touching state.
class Topology {
public:
    Topology() = default;

    // ─── Structure ─────────────────────────────────────────────

    void addNode(Node node);
    const Node* getNode(const NodeId& id) const;
    bool hasNode(const NodeId& id) const { return nodes_.count(id) > 0; }
    std::vector<NodeId> getNodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }

    void addFlow(Flow flow);
    const std::vector<Flow>& flows() const { return flows_; }
    size_t flowCount() const { return flows_.size(); }

    /// Outgoing flows ordered by (priority, target).
    std::vector<const Flow*> flowsOut(const NodeId& id) const;
    std::vector<const Flow*> flowsIn(const NodeId& id) const;
    const Flow* getFlow(const NodeId& source, const NodeId& target) const;

    std::vector<NodeId> predecessors(const NodeId& id) const;
    std::vector<NodeId> successors(const NodeId& id) const;

    void forEachNode(const std::function<void(const Node&)>& fn) const;

    // ─── Marking ───────────────────────────────────────────────

    /// Throws StructuralError for unknown nodes.
    Status status(const NodeId& id) const;

    std::vector<Token> tokensOn(const NodeId& id) const;
    bool hasToken(const NodeId& id) const;
    bool hasSingletonToken(const NodeId& id) const;

    /// Sources of the units parked on arcs into `target`.
    std::vector<NodeId> arrivalsAt(const NodeId& target) const;
    bool hasArrival(const NodeId& source, const NodeId& target) const;

    std::optional<std::string> marker(const NodeId& id, const std::string& key) const;
    std::vector<std::string> markers(const NodeId& id, const std::string& key) const;

    std::optional<Fact> signal(const std::string& name) const;
    std::optional<std::string> variable(const std::string& name) const;
    Variables variables() const;

    std::vector<Fact> factsOfKind(FactKind kind) const;
    bool hasFact(const Fact& fact) const;

    /// Tokens plus arrivals.
    size_t tokenCount() const;

    const MultiInstanceManager& instances() const { return instances_; }

    // ─── Delta application ─────────────────────────────────────

    /// Throws StructuralError describing the first illegal fact.
    void validate(const Delta& delta) const;

    /// Drop additions that are already true of this generation.
    void normalize(Delta& delta) const;

    /// Validate, then commit. Returns the new generation.
    uint64_t apply(const Delta& delta);

    uint64_t generation() const { return generation_; }

    /// Immutable copy for one tick.
    TopologyView snapshot() const;

    // ─── Bulk exchange ─────────────────────────────────────────

    static Topology load(const GraphFacts& facts);
    GraphFacts exportFacts() const;

    /// Structure and marking equality; the generation counter is ignored.
    bool operator==(const Topology& other) const;
    bool operator!=(const Topology& other) const { return !(*this == other); }

private:
    Node& nodeRef(const NodeId& id);
    void insertMarkingFact(const Fact& fact);

    std::map<NodeId, Node> nodes_;
    std::vector<Flow> flows_;
    std::unordered_map<NodeId, std::vector<size_t>> outgoing_;
    std::unordered_map<NodeId, std::vector<size_t>> incoming_;
    std::set<Fact> facts_;
    MultiInstanceManager instances_;
    uint64_t generation_ = 0;
};

/// Nodes reachable along flows from any node holding work.
/// Traversal does not continue past `barrier`.
std::unordered_set<NodeId> liveReachable(const Topology& topology, const NodeId& barrier);

} // namespace tickflow
