#pragma once

#include "catalog/pattern_catalog.hpp"
#include "engine/convergence_runner.hpp"
#include "engine/engine_config.hpp"
#include "engine/tick_executor.hpp"
#include "graph/graph_facts.hpp"
#include "graph/topology.hpp"
#include "kernel/verb.hpp"
#include "verification/topology_validator.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tickflow {

/// Receives every tick the engine runs.
class TickObserver {
public:
    virtual ~TickObserver() = default;
    virtual void onTick(const TickResult& result) = 0;
};

/// Keeps the tick history and how often each catalog entry fired.
class ProvenanceObserver : public TickObserver {
public:
    void onTick(const TickResult& result) override;

    const std::vector<TickResult>& history() const { return history_; }
    const std::map<std::string, size_t>& fireCounts() const { return fire_counts_; }

    /// Number of activations of one catalog entry.
    size_t firesOf(const std::string& pattern) const;

    /// Activations of one node, oldest first.
    std::vector<Activation> activationsOf(const NodeId& node) const;

    size_t totalActivations() const;
    void clear();

private:
    std::vector<TickResult> history_;
    std::map<std::string, size_t> fire_counts_;
};

/// Facade over the topology store, tick executor and convergence runner.
/// Ingress calls are applied between ticks, each as one atomic delta, and
/// throw StructuralError when they do not fit the current state.
class WorkflowEngine {
public:
    explicit WorkflowEngine(EngineConfig config = EngineConfig{},
                            PatternCatalog catalog = PatternCatalog::standard());

    WorkflowEngine(const WorkflowEngine&) = delete;
    WorkflowEngine& operator=(const WorkflowEngine&) = delete;

    // ─── Ingress ───────────────────────────────────────────

    /// Replace the topology. Runs the validator when configured to: nodes that
    /// fail are quarantined, graph-level failures throw StructuralError.
    void loadTopology(const GraphFacts& facts);

    /// External work finished: Active -> Completed.
    void complete(const NodeId& node);

    /// Ask for a Void of the given scope on the next tick.
    void requestCancel(const NodeId& node, CancellationScope scope);

    void signal(const std::string& name, bool persistent = false);
    void setVariable(const std::string& name, const std::string& value);

    /// Ask an incremental group for `count` more instances.
    void requestInstance(const NodeId& parent, uint32_t count = 1);

    /// No more instances for the parent's open group.
    void sealGroup(const NodeId& parent);

    /// Rearm a spent (blocking) join.
    void resetJoin(const NodeId& node);

    // ─── Tick control ──────────────────────────────────────

    TickResult step();

    /// Throws DivergenceError when no fixpoint is reached within the budget,
    /// std::invalid_argument when the budget is zero.
    RunReport runToCompletion();
    RunReport runToCompletion(uint64_t max_ticks);

    // ─── Inspection ────────────────────────────────────────

    Status statusOf(const NodeId& node) const { return topology_.status(node); }
    GraphFacts snapshotExport() const { return topology_.exportFacts(); }
    TopologyView view() const { return topology_.snapshot(); }
    const Topology& topology() const { return topology_; }

    const PatternCatalog& catalog() const { return catalog_; }
    const EngineConfig& config() const { return config_; }
    TopologyValidator& validator() { return validator_; }
    uint64_t tickCount() const { return executor_.tickCount(); }

    void addObserver(std::shared_ptr<TickObserver> observer);

private:
    const Node& requireNode(const NodeId& node) const;
    void ingest(Delta delta, const std::string& what);
    void notify(const TickResult& result);

    EngineConfig config_;
    PatternCatalog catalog_;
    Topology topology_;
    TickExecutor executor_;
    TopologyValidator validator_;
    std::vector<std::shared_ptr<TickObserver>> observers_;
};

} // namespace tickflow
