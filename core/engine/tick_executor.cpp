#include "engine/tick_executor.hpp"
#include "kernel/kernel.hpp"
#include "log/log.hpp"

namespace tickflow {

namespace {

bool isJoin(const Node& node) {
    return node.join == ControlType::And || node.join == ControlType::Or ||
           node.join_options.quorum > 0;
}

} // namespace

TickResult TickExecutor::tick(Topology& topology) {
    TickResult result;
    result.tick_number = ++tick_count_;

    // ─── Collect + Evaluate ────────────────────────────────
    TopologyView view = topology.snapshot();
    std::vector<Contribution> contributions;

    auto record = [&](DiagnosticKind kind, const NodeId& id, const std::string& message) {
        TICKFLOW_LOG_WARN("tick {}: {} at {}: {}", result.tick_number, toString(kind), id, message);
        result.diagnostics.push_back({kind, id, message});
    };

    view->forEachNode([&](const Node& node) {
        auto q = quarantined_.find(node.id);
        if (q != quarantined_.end()) {
            record(DiagnosticKind::StructuralError, node.id, q->second);
            return;
        }

        try {
            auto resolution = resolver_.resolve(*view, node);
            if (!resolution) {
                if (isJoin(node) && node.status == Status::Pending &&
                    view->predecessors(node.id).empty()) {
                    record(DiagnosticKind::StructuralError, node.id,
                           "Join " + node.id + " has no incoming flows");
                    return;
                }
                if (config_.report_ambiguous && PatternResolver::hasPendingActivation(*view, node)) {
                    record(DiagnosticKind::AmbiguousPattern, node.id,
                           "No catalog entry matches node " + node.id);
                }
                return;
            }

            Delta delta = Kernel::execute(*view, node, resolution->call);
            if (delta.empty()) return;
            view->validate(delta);

            TICKFLOW_LOG_DEBUG("tick {}: {} fires {} ({})", result.tick_number, node.id,
                               resolution->mapping->name, toString(resolution->call.verb));
            result.activations.push_back({node.id, resolution->mapping->name, resolution->call.verb});
            contributions.push_back({node.id, std::move(delta)});
        } catch (const StructuralError& e) {
            record(DiagnosticKind::StructuralError, node.id, e.what());
        } catch (const AmbiguousPatternError& e) {
            record(DiagnosticKind::AmbiguousPattern, node.id, e.what());
        }
    });

    // ─── Merge ─────────────────────────────────────────────
    std::vector<Diagnostic> conflicts;
    Delta merged = DeltaMerger::merge(contributions, conflicts);
    for (auto& c : conflicts) {
        record(c.kind, c.node_id, c.message);
    }

    if (config_.drop_transient_signals) {
        for (const auto& s : view->factsOfKind(FactKind::Signal)) {
            if (!s.persistent()) merged.remove(s);
        }
    }

    // ─── Apply + Measure ───────────────────────────────────
    topology.normalize(merged);
    if (!merged.empty()) {
        topology.apply(merged);
    }

    result.delta_size = merged.size();
    result.converged = result.delta_size == 0;
    result.delta = std::move(merged);
    return result;
}

} // namespace tickflow
