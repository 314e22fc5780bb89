#include "verification/topology_validator.hpp"
#include "kernel/routing.hpp"

namespace tickflow {

// ─── Built-in checks ───────────────────────────────────────────

std::vector<VerificationResult> TopologyValidator::check(const Topology& topology) const {
    std::vector<VerificationResult> results;
    auto fail = [&](const char* check, const NodeId& id, const std::string& message) {
        results.push_back({false, check, message, id});
    };

    topology.forEachNode([&](const Node& node) {
        if (node.isInstanceChild()) return;

        auto preds = topology.predecessors(node.id);
        auto out = topology.flowsOut(node.id);

        // Check: synchronizing joins need something to wait for
        bool joins = node.join == ControlType::And || node.join == ControlType::Or ||
                     node.join_options.quorum > 0;
        if (joins && preds.empty()) {
            fail("join_has_predecessors", node.id,
                 "Join " + node.id + " has no incoming flows");
        }
        if (node.join_options.quorum > preds.size() && !preds.empty()) {
            fail("quorum_fits_predecessors", node.id,
                 "Quorum " + std::to_string(node.join_options.quorum) + " of " + node.id +
                 " exceeds its " + std::to_string(preds.size()) + " predecessors");
        }

        // Check: splits must have branches
        if (node.split != ControlType::None && out.empty()) {
            fail("split_has_branches", node.id, "Split " + node.id + " has no outgoing flows");
        }

        // Check: referenced nodes exist
        for (const auto& id : node.cancellation_targets) {
            if (!topology.hasNode(id)) {
                fail("cancellation_target_exists", node.id,
                     "Node " + node.id + " cancels unknown node " + id);
            }
        }
        for (const auto& id : node.nested) {
            if (!topology.hasNode(id)) {
                fail("nested_node_exists", node.id,
                     "Node " + node.id + " nests unknown node " + id);
            }
        }
        if (!node.milestone.empty() && !topology.hasNode(node.milestone)) {
            fail("milestone_exists", node.id,
                 "Node " + node.id + " waits on unknown milestone " + node.milestone);
        }

        // Check: deferred choices race on events
        if (node.deferred) {
            for (const Flow* f : out) {
                if (f->event.empty()) {
                    fail("deferred_flow_has_event", node.id,
                         "Deferred choice " + node.id + " has flow to " + f->target +
                         " without an event");
                }
            }
        }

        // Check: loop bounds need a back edge to bound
        if (node.max_iterations > 0) {
            bool back = false;
            for (const Flow* f : out) back = back || f->back_edge;
            if (!back) {
                fail("loop_has_back_edge", node.id,
                     "Node " + node.id + " bounds iterations but has no back edge");
            }
        }

        // Check: multi-instance settings are coherent
        const InstanceOptions& io = node.instances;
        if (io.enabled()) {
            if (io.max > 0 && io.min > io.max) {
                fail("instance_bounds", node.id,
                     "Node " + node.id + " has instance minimum above maximum");
            }
            if (io.mode == InstanceMode::Static &&
                ((io.max > 0 && io.count > io.max) || io.count < io.min)) {
                fail("instance_bounds", node.id,
                     "Static count of " + node.id + " lies outside its bounds");
            }
            if (io.mode == InstanceMode::Dynamic && io.count_variable.empty()) {
                fail("instance_count_source", node.id,
                     "Dynamic instances of " + node.id + " need a count variable");
            }
            if (io.mode == InstanceMode::Static && io.threshold > io.count) {
                fail("instance_threshold", node.id,
                     "Threshold of " + node.id + " exceeds its instance count");
            }
            if (isSynchronizing(node)) {
                fail("instance_not_gated", node.id,
                     "Multi-instance task " + node.id + " cannot also be a join or gate");
            }
        } else if (io.threshold > 0 || !io.threshold_variable.empty() || io.cancel_remaining) {
            fail("instance_mode_set", node.id,
                 "Node " + node.id + " has instance options but no instance mode");
        }

        if (node.persistent_trigger && node.trigger.empty()) {
            fail("trigger_named", node.id, "Node " + node.id + " is persistent but has no trigger");
        }
        if (node.terminates_case && node.kind != NodeKind::OutputCondition) {
            fail("termination_on_output", node.id,
                 "Only output conditions terminate the case: " + node.id);
        }
    });

    for (const auto& [name, fn] : constraints_) {
        for (auto& r : fn(topology)) {
            if (r.check_name.empty()) r.check_name = name;
            results.push_back(std::move(r));
        }
    }

    if (failures(results).empty()) {
        results.clear();
        results.push_back({true, "structure_check", "All structural checks passed", ""});
    }
    return results;
}

// ─── Custom constraints ────────────────────────────────────────

void TopologyValidator::addConstraint(const std::string& name, ConstraintFn fn) {
    constraints_.push_back({name, std::move(fn)});
}

std::vector<VerificationResult> TopologyValidator::failures(const std::vector<VerificationResult>& results) {
    std::vector<VerificationResult> failed;
    for (const auto& r : results) {
        if (!r.passed) failed.push_back(r);
    }
    return failed;
}

} // namespace tickflow
