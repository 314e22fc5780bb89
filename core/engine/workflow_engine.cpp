#include "engine/workflow_engine.hpp"
#include "kernel/routing.hpp"
#include "log/log.hpp"
#include <cstdlib>
#include <map>

namespace tickflow {

// ─── Provenance ────────────────────────────────────────────────

void ProvenanceObserver::onTick(const TickResult& result) {
    for (const auto& a : result.activations) {
        fire_counts_[a.pattern]++;
    }
    history_.push_back(result);
}

size_t ProvenanceObserver::firesOf(const std::string& pattern) const {
    auto it = fire_counts_.find(pattern);
    return it != fire_counts_.end() ? it->second : 0;
}

std::vector<Activation> ProvenanceObserver::activationsOf(const NodeId& node) const {
    std::vector<Activation> result;
    for (const auto& tick : history_) {
        for (const auto& a : tick.activations) {
            if (a.node == node) result.push_back(a);
        }
    }
    return result;
}

size_t ProvenanceObserver::totalActivations() const {
    size_t total = 0;
    for (const auto& [_, count] : fire_counts_) total += count;
    return total;
}

void ProvenanceObserver::clear() {
    history_.clear();
    fire_counts_.clear();
}

// ─── Engine ────────────────────────────────────────────────────

WorkflowEngine::WorkflowEngine(EngineConfig config, PatternCatalog catalog)
    : config_(std::move(config)),
      catalog_(std::move(catalog)),
      executor_(catalog_, config_) {
    log::setLevel(config_.log_level);
}

void WorkflowEngine::loadTopology(const GraphFacts& facts) {
    Topology loaded = Topology::load(facts);

    // Node-level failures quarantine that node; graph-level ones reject the load.
    std::map<NodeId, std::string> quarantined;
    if (config_.validate_on_load) {
        std::string rejected;
        for (const auto& f : TopologyValidator::failures(validator_.check(loaded))) {
            TICKFLOW_LOG_WARN("{}: {}", f.check_name, f.message);
            if (f.node_id.empty()) {
                rejected += " [" + f.check_name + "] " + f.message + ";";
                continue;
            }
            std::string& message = quarantined[f.node_id];
            message += (message.empty() ? "" : "; ") + ("[" + f.check_name + "] " + f.message);
        }
        if (!rejected.empty()) {
            throw StructuralError("Topology rejected:" + rejected);
        }
    }

    topology_ = std::move(loaded);
    executor_.quarantine(std::move(quarantined));
    TICKFLOW_LOG_INFO("Loaded topology: {} nodes, {} flows", topology_.nodeCount(),
                      topology_.flowCount());
}

const Node& WorkflowEngine::requireNode(const NodeId& node) const {
    const Node* n = topology_.getNode(node);
    if (!n) throw StructuralError("Unknown node " + node, node);
    return *n;
}

void WorkflowEngine::ingest(Delta delta, const std::string& what) {
    topology_.normalize(delta);
    if (delta.empty()) return;
    topology_.apply(delta);
    TICKFLOW_LOG_DEBUG("{}: {}", what, delta.describe());
}

void WorkflowEngine::complete(const NodeId& node) {
    const Node& n = requireNode(node);
    if (n.status != Status::Active) {
        throw StructuralError("Cannot complete " + node + " in status " + toString(n.status), node);
    }
    Delta delta;
    delta.setStatus(node, Status::Active, Status::Completed);
    ingest(std::move(delta), "complete " + node);
}

void WorkflowEngine::requestCancel(const NodeId& node, CancellationScope scope) {
    requireNode(node);
    Delta delta;
    delta.add(Fact::marker(node, markers::kCancelRequest, toString(scope)));
    ingest(std::move(delta), "cancel " + node);
}

void WorkflowEngine::signal(const std::string& name, bool persistent) {
    Delta delta;
    if (auto existing = topology_.signal(name)) {
        if (existing->persistent() == persistent) return;
        delta.remove(*existing);
    }
    delta.add(Fact::signal(name, persistent));
    ingest(std::move(delta), "signal " + name);
}

void WorkflowEngine::setVariable(const std::string& name, const std::string& value) {
    Delta delta;
    if (auto current = topology_.variable(name)) {
        if (*current == value) return;
        delta.remove(Fact::variable(name, *current));
    }
    delta.add(Fact::variable(name, value));
    ingest(std::move(delta), "set " + name);
}

void WorkflowEngine::requestInstance(const NodeId& parent, uint32_t count) {
    requireNode(parent);
    const MultiInstanceGroup* group = topology_.instances().groupOf(parent);
    if (!group || !group->accepting()) {
        throw StructuralError("No incremental group of " + parent + " accepts instances", parent);
    }
    if (count == 0) return;

    Delta delta;
    uint32_t pending = count;
    if (auto current = topology_.marker(parent, markers::kInstanceRequest)) {
        pending += static_cast<uint32_t>(std::strtoul(current->c_str(), nullptr, 10));
    }
    setMarker(topology_, parent, markers::kInstanceRequest, std::to_string(pending), delta);
    ingest(std::move(delta), "request instance of " + parent);
}

void WorkflowEngine::sealGroup(const NodeId& parent) {
    requireNode(parent);
    const MultiInstanceGroup* group = topology_.instances().groupOf(parent);
    if (!group) throw StructuralError("Node " + parent + " has no open instance group", parent);
    if (group->sealed) return;

    Delta delta;
    delta.add(Fact::seal(parent, group->id));
    ingest(std::move(delta), "seal " + group->id);
}

void WorkflowEngine::resetJoin(const NodeId& node) {
    requireNode(node);
    Delta delta;
    clearMarker(topology_, node, markers::kJoinSpent, delta);
    clearMarker(topology_, node, markers::kJoinSeen, delta);
    ingest(std::move(delta), "reset " + node);
}

// ─── Tick control ──────────────────────────────────────────────

TickResult WorkflowEngine::step() {
    TickResult result = executor_.tick(topology_);
    notify(result);
    return result;
}

RunReport WorkflowEngine::runToCompletion() {
    return runToCompletion(config_.max_ticks);
}

RunReport WorkflowEngine::runToCompletion(uint64_t max_ticks) {
    ConvergenceRunner runner(executor_);
    return runner.run(topology_, max_ticks, [this](const TickResult& r) { notify(r); });
}

void WorkflowEngine::addObserver(std::shared_ptr<TickObserver> observer) {
    if (observer) observers_.push_back(std::move(observer));
}

void WorkflowEngine::notify(const TickResult& result) {
    for (const auto& o : observers_) {
        o->onTick(result);
    }
}

} // namespace tickflow
