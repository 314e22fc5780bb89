#include "kernel/kernel.hpp"
#include "errors/errors.hpp"
#include "kernel/routing.hpp"
#include <algorithm>
#include <cstdlib>
#include <deque>
#include <optional>
#include <set>
#include <utility>

namespace tickflow {

namespace {

void requireToken(const Topology& view, const Node& node, const char* verb) {
    if (!view.hasSingletonToken(node.id)) {
        throw StructuralError(std::string(verb) + " on " + node.id + " without a token", node.id);
    }
}

uint32_t parseCounter(const std::optional<std::string>& value) {
    if (!value) return 0;
    char* end = nullptr;
    unsigned long n = std::strtoul(value->c_str(), &end, 10);
    return (end && *end == '\0') ? static_cast<uint32_t>(n) : 0;
}

void spawnInstance(const NodeId& parent, const GroupId& group, int64_t index, Delta& delta) {
    NodeId child = MultiInstanceManager::childId(group, index);
    delta.add(Fact::instance(child, group, parent, index));
    delta.add(Fact::status(child, Status::Active));
    delta.add(Fact::token(child, index));
}

InstanceMode modeOf(Cardinality c) {
    switch (c) {
        case Cardinality::Static:      return InstanceMode::Static;
        case Cardinality::Dynamic:     return InstanceMode::Dynamic;
        case Cardinality::Incremental: return InstanceMode::Incremental;
        default:                       return InstanceMode::None;
    }
}

} // namespace

// ─── Dispatch ──────────────────────────────────────────────────

Delta Kernel::execute(const Topology& view, const Node& node, const VerbCall& call) {
    if (!call.consistent()) {
        throw AmbiguousPatternError(std::string("Parameters do not match verb ") +
                                    toString(call.verb), node.id);
    }
    switch (call.verb) {
        case Verb::Transmute: return transmute(view, node, std::get<TransmuteParams>(call.params));
        case Verb::Copy:      return copy(view, node, std::get<CopyParams>(call.params));
        case Verb::Filter:    return filter(view, node, std::get<FilterParams>(call.params));
        case Verb::Await:     return await(view, node, std::get<AwaitParams>(call.params));
        case Verb::Void:      return cancel(view, node, std::get<VoidParams>(call.params));
    }
    throw AmbiguousPatternError("Unknown verb", node.id);
}

// ─── Transmute ─────────────────────────────────────────────────

Delta Kernel::transmute(const Topology& view, const Node& node, const TransmuteParams&) {
    auto out = view.flowsOut(node.id);
    if (out.empty()) {
        throw StructuralError("Transmute on " + node.id + " without an outgoing flow", node.id);
    }
    if (out.size() > 1) {
        throw AmbiguousPatternError("Transmute on " + node.id + " with " +
                                    std::to_string(out.size()) + " successors", node.id);
    }
    requireToken(view, node, "Transmute");

    Delta delta;
    delta.remove(Fact::token(node.id));
    deliver(view, *out[0], delta);
    return delta;
}

// ─── Copy ──────────────────────────────────────────────────────

Delta Kernel::copy(const Topology& view, const Node& node, const CopyParams& params) {
    if (params.cardinality != Cardinality::Topology) {
        return spawnInstances(view, node, params);
    }

    auto out = view.flowsOut(node.id);
    if (out.empty()) {
        throw StructuralError("Parallel split " + node.id + " has no outgoing flows", node.id);
    }
    requireToken(view, node, "Copy");

    Delta delta;
    delta.remove(Fact::token(node.id));
    for (const Flow* f : out) {
        deliver(view, *f, delta);
    }
    return delta;
}

Delta Kernel::spawnInstances(const Topology& view, const Node& node, const CopyParams& params) {
    Delta delta;
    const MultiInstanceManager& mi = view.instances();

    if (const MultiInstanceGroup* open = mi.groupOf(node.id)) {
        // Extend an incremental group by the requested number of instances.
        if (!open->accepting()) {
            throw StructuralError("Group " + open->id + " no longer accepts instances", node.id);
        }
        auto request = view.marker(node.id, markers::kInstanceRequest);
        if (!request) return delta;
        uint32_t extra = std::max<uint32_t>(parseCounter(request), 1);
        int64_t next = static_cast<int64_t>(open->instances.size());
        if (open->max_threshold > 0 && next + extra > open->max_threshold) {
            throw StructuralError("Group " + open->id + " would exceed its instance limit", node.id);
        }
        for (uint32_t i = 0; i < extra; i++) {
            spawnInstance(node.id, open->id, next + i, delta);
        }
        delta.remove(Fact::marker(node.id, markers::kInstanceRequest, *request));
        return delta;
    }

    requireToken(view, node, "Copy");

    uint32_t count = 0;
    switch (params.cardinality) {
        case Cardinality::Static:
            count = params.count;
            break;
        case Cardinality::Dynamic:
            count = variableCount(view, node.instances.count_variable, node.id);
            break;
        case Cardinality::Incremental:
            count = 1;
            break;
        default:
            break;
    }

    if (node.instances.max > 0 && count > node.instances.max) {
        throw StructuralError("Instance count " + std::to_string(count) + " of " + node.id +
                              " exceeds maximum " + std::to_string(node.instances.max), node.id);
    }
    if (params.cardinality != Cardinality::Incremental && count < node.instances.min) {
        throw StructuralError("Instance count " + std::to_string(count) + " of " + node.id +
                              " below minimum " + std::to_string(node.instances.min), node.id);
    }

    GroupId group = mi.nextGroupId(node.id);
    delta.remove(Fact::token(node.id));
    delta.add(Fact::group(node.id, group, modeOf(params.cardinality), count));
    for (uint32_t i = 0; i < count; i++) {
        spawnInstance(node.id, group, i, delta);
    }
    return delta;
}

// ─── Filter ────────────────────────────────────────────────────

Delta Kernel::filter(const Topology& view, const Node& node, const FilterParams& params) {
    if (params.selection_mode == SelectionMode::Mutex) {
        return selectMutex(view, node);
    }

    requireToken(view, node, "Filter");
    auto out = view.flowsOut(node.id);
    if (out.empty()) {
        throw StructuralError("Choice " + node.id + " has no outgoing flows", node.id);
    }

    Delta delta;
    Variables vars = view.variables();
    std::vector<const Flow*> chosen;

    auto firstDefault = [&](const std::vector<const Flow*>& flows) -> const Flow* {
        for (const Flow* f : flows) {
            if (f->is_default) return f;
        }
        return nullptr;
    };

    switch (params.selection_mode) {
        case SelectionMode::ExactlyOne:
            for (const Flow* f : out) {
                if (!f->is_default && f->admits(vars)) {
                    chosen.push_back(f);
                    break;
                }
            }
            if (chosen.empty()) {
                if (const Flow* d = firstDefault(out)) chosen.push_back(d);
            }
            break;

        case SelectionMode::OneOrMore:
            for (const Flow* f : out) {
                if (!f->is_default && f->admits(vars)) chosen.push_back(f);
            }
            if (chosen.empty()) {
                if (const Flow* d = firstDefault(out)) chosen.push_back(d);
            }
            break;

        case SelectionMode::Deferred: {
            for (const Flow* f : out) {
                if (!f->event.empty() && view.signal(f->event)) {
                    chosen.push_back(f);
                    break;
                }
            }
            // Nothing has happened yet: keep waiting.
            if (chosen.empty()) return delta;

            // Consume the winning event and retract the racing ones.
            for (const Flow* f : out) {
                if (f->event.empty()) continue;
                if (auto s = view.signal(f->event)) delta.remove(*s);
            }
            setMarker(view, node.id, markers::kChoice, chosen.front()->target, delta);
            break;
        }

        case SelectionMode::LoopCondition: {
            std::vector<const Flow*> back, exits;
            for (const Flow* f : out) {
                (f->back_edge ? back : exits).push_back(f);
            }
            uint32_t iterations = parseCounter(view.marker(node.id, markers::kIterations));
            bool exhausted = params.max_iterations > 0 && iterations >= params.max_iterations;

            const Flow* again = nullptr;
            for (const Flow* f : back) {
                if (f->admits(vars)) {
                    again = f;
                    break;
                }
            }

            if (again && !exhausted) {
                chosen.push_back(again);
                setMarker(view, node.id, markers::kIterations, std::to_string(iterations + 1), delta);
            } else {
                for (const Flow* f : exits) {
                    if (!f->is_default && f->admits(vars)) {
                        chosen.push_back(f);
                        break;
                    }
                }
                if (chosen.empty()) {
                    if (const Flow* d = firstDefault(exits)) chosen.push_back(d);
                }
                clearMarker(view, node.id, markers::kIterations, delta);
            }
            break;
        }

        case SelectionMode::Mutex:
            break;
    }

    if (chosen.empty()) {
        throw StructuralError("No admissible flow out of " + node.id, node.id);
    }

    delta.remove(Fact::token(node.id));
    for (const Flow* f : chosen) {
        deliver(view, *f, delta);
    }
    return delta;
}

Delta Kernel::selectMutex(const Topology& view, const Node& node) {
    Delta delta;
    if (view.hasToken(node.id) || node.status == Status::Voided) return delta;

    auto satisfied = satisfiedPredecessors(view, node.id);
    if (satisfied.empty()) return delta;

    // Lowest (priority, id) among ready contenders wins the lock.
    bool held = false;
    std::optional<std::pair<int32_t, NodeId>> best;
    view.forEachNode([&](const Node& n) {
        if (n.mutex != node.mutex || n.status == Status::Voided) return;
        if (view.hasToken(n.id)) {
            if (n.status == Status::Active) held = true;
            return;
        }
        auto ready = satisfiedPredecessors(view, n.id);
        if (ready.empty()) return;
        const Flow* f = view.getFlow(ready.front(), n.id);
        std::pair<int32_t, NodeId> key{f ? f->priority : 0, n.id};
        if (!best || key < *best) best = key;
    });

    if (held || !best || best->second != node.id) return delta;

    consumeFrom(view, satisfied.front(), node.id, delta);
    enable(view, node.id, delta);
    return delta;
}

// ─── Await ─────────────────────────────────────────────────────

Delta Kernel::await(const Topology& view, const Node& node, const AwaitParams& params) {
    if (node.instances.enabled()) {
        return awaitInstances(view, node, params);
    }
    return awaitJoin(view, node, params);
}

Delta Kernel::awaitJoin(const Topology& view, const Node& node, const AwaitParams& params) {
    Delta delta;
    auto preds = view.predecessors(node.id);
    if (preds.empty()) {
        throw StructuralError("Join " + node.id + " has no predecessors", node.id);
    }

    auto satisfied = satisfiedPredecessors(view, node.id);
    if (satisfied.empty()) return delta;

    // Work arriving at a cancelled join is dropped with it.
    if (node.status == Status::Voided) {
        for (const auto& p : satisfied) consumeFrom(view, p, node.id, delta);
        return delta;
    }

    auto seen_list = view.markers(node.id, markers::kJoinSeen);
    std::set<NodeId> seen(seen_list.begin(), seen_list.end());

    if (view.marker(node.id, markers::kJoinSpent)) {
        // Spent: record late completions without activating again.
        std::set<NodeId> wave = seen;
        wave.insert(satisfied.begin(), satisfied.end());
        for (const auto& p : satisfied) consumeFrom(view, p, node.id, delta);

        bool complete = true;
        for (const auto& p : preds) {
            if (!wave.count(p)) complete = false;
        }
        if (params.reset_on_fire && complete) {
            clearMarker(view, node.id, markers::kJoinSpent, delta);
            clearMarker(view, node.id, markers::kJoinSeen, delta);
        } else {
            for (const auto& p : satisfied) {
                if (!seen.count(p)) delta.add(Fact::marker(node.id, markers::kJoinSeen, p));
            }
        }
        return delta;
    }

    // The previous activation has not moved on yet.
    if (view.hasToken(node.id)) return delta;

    std::optional<Fact> signal;
    if (params.gate == Gate::Milestone) {
        const Node* m = view.getNode(node.milestone);
        if (!m) throw StructuralError("Unknown milestone " + node.milestone, node.id);
        if (m->status == Status::Voided || !view.hasToken(m->id)) return delta;
    } else if (params.gate == Gate::Signal) {
        signal = view.signal(node.trigger);
        if (!signal) return delta;
    }

    bool fire = false;
    switch (params.threshold) {
        case Threshold::All:
            fire = satisfied.size() == preds.size();
            break;
        case Threshold::One:
            fire = true;
            break;
        case Threshold::Count:
            if (params.count == 0 || params.count > preds.size()) {
                throw StructuralError("Quorum " + std::to_string(params.count) + " of " + node.id +
                                      " does not fit " + std::to_string(preds.size()) +
                                      " predecessors", node.id);
            }
            fire = satisfied.size() >= params.count;
            break;
        case Threshold::Active: {
            fire = true;
            std::set<NodeId> done(satisfied.begin(), satisfied.end());
            for (const auto& p : preds) {
                if (done.count(p)) continue;
                if (view.status(p) == Status::Active || view.hasToken(p)) fire = false;
            }
            break;
        }
        case Threshold::Topology: {
            fire = true;
            std::set<NodeId> done(satisfied.begin(), satisfied.end());
            auto live = liveReachable(view, node.id);
            for (const auto& p : preds) {
                if (done.count(p)) continue;
                Status s = view.status(p);
                bool exhausted = s == Status::Completed || s == Status::Voided || !live.count(p);
                if (!exhausted) fire = false;
            }
            break;
        }
    }
    if (!fire) return delta;

    std::vector<NodeId> consumed = satisfied;
    if (params.gate != Gate::None) consumed.resize(1);

    for (const auto& p : consumed) consumeFrom(view, p, node.id, delta);
    if (signal) delta.remove(*signal);
    enable(view, node.id, delta);

    if (params.gate == Gate::None) {
        // Active/topology joins close the wave at firing: the rest never arrive.
        bool full_wave = consumed.size() == preds.size() ||
                         params.threshold == Threshold::Active ||
                         params.threshold == Threshold::Topology;
        if (!params.reset_on_fire || !full_wave) {
            delta.add(Fact::marker(node.id, markers::kJoinSpent, "1"));
            for (const auto& p : consumed) {
                delta.add(Fact::marker(node.id, markers::kJoinSeen, p));
            }
        }
    }

    if (node.join_options.cancel_remaining) {
        delta.add(Fact::marker(node.id, markers::kJoinCancel, "pending"));
    }
    return delta;
}

Delta Kernel::awaitInstances(const Topology& view, const Node& node, const AwaitParams& params) {
    Delta delta;
    const MultiInstanceManager& mi = view.instances();
    const MultiInstanceGroup* group = mi.groupOf(node.id);
    if (!group) return delta;

    auto fired = view.marker(node.id, markers::kInstancesFired);
    Fact group_fact = Fact::group(node.id, group->id, group->creation_mode,
                                  static_cast<int64_t>(group->instances.size()));

    auto consumeCompleted = [&]() {
        for (int64_t i : group->completed) {
            Fact t = Fact::token(group->instances[i], i);
            if (view.hasFact(t)) delta.remove(t);
        }
    };

    if (node.status == Status::Voided) {
        // The whole activity was cancelled; drain and close once settled.
        consumeCompleted();
        if (group->allResolved()) {
            delta.remove(group_fact);
            clearMarker(view, node.id, markers::kInstancesFired, delta);
        }
        return delta;
    }

    if (fired) {
        consumeCompleted();
        if (group->allResolved()) {
            delta.remove(group_fact);
            clearMarker(view, node.id, markers::kInstancesFired, delta);
        }
        return delta;
    }

    if (!mi.isThresholdMet(group->id, params.completion_strategy, params.count)) return delta;

    consumeCompleted();
    if (node.status == Status::Active) {
        delta.setStatus(node.id, Status::Active, Status::Completed);
    }
    if (!view.hasSingletonToken(node.id)) {
        delta.add(Fact::token(node.id));
    }
    if (group->allResolved()) {
        delta.remove(group_fact);
    } else {
        delta.add(Fact::marker(node.id, markers::kInstancesFired, group->id));
    }
    return delta;
}

// ─── Void ──────────────────────────────────────────────────────

Delta Kernel::cancel(const Topology& view, const Node& node, const VoidParams& params) {
    Delta delta;
    std::set<NodeId> targets;
    const MultiInstanceManager& mi = view.instances();

    switch (params.cancellation_scope) {
        case CancellationScope::Self:
            targets.insert(node.id);
            break;

        case CancellationScope::Task: {
            std::deque<NodeId> queue{node.id};
            while (!queue.empty()) {
                NodeId id = queue.front();
                queue.pop_front();
                if (!targets.insert(id).second) continue;
                const Node* n = view.getNode(id);
                if (!n) throw StructuralError("Unknown nested node " + id, node.id);
                for (const auto& child : n->nested) queue.push_back(child);
                if (const MultiInstanceGroup* g = mi.groupOf(id)) {
                    for (const auto& child : g->instances) queue.push_back(child);
                }
            }
            break;
        }

        case CancellationScope::Instances: {
            const MultiInstanceGroup* g = node.isInstanceChild() ? mi.getGroup(node.group)
                                                                 : mi.groupOf(node.id);
            if (g) {
                for (size_t i = 0; i < g->instances.size(); i++) {
                    if (!g->completed.count(static_cast<int64_t>(i))) targets.insert(g->instances[i]);
                }
            }
            break;
        }

        case CancellationScope::Region: {
            if (!node.cancellation_targets.empty()) {
                for (const auto& id : node.cancellation_targets) {
                    if (!view.hasNode(id)) {
                        throw StructuralError("Unknown cancellation target " + id, node.id);
                    }
                    targets.insert(id);
                }
            } else if (node.join_options.cancel_remaining) {
                // Cancelling join without a declared region: the branches not yet seen.
                auto seen_list = view.markers(node.id, markers::kJoinSeen);
                std::set<NodeId> seen(seen_list.begin(), seen_list.end());
                for (const auto& p : view.predecessors(node.id)) {
                    if (!seen.count(p)) targets.insert(p);
                }
            }
            break;
        }

        case CancellationScope::Case:
            for (const auto& id : view.getNodeIds()) targets.insert(id);
            break;
    }

    for (const auto& id : targets) {
        for (const auto& t : view.tokensOn(id)) {
            delta.remove(Fact::token(id, t.instance));
        }
        for (const auto& src : view.arrivalsAt(id)) {
            delta.remove(Fact::arrival(src, id));
        }
        Status s = view.status(id);
        if (s != Status::Completed && s != Status::Voided) {
            delta.setStatus(id, s, Status::Voided);
        }
    }

    if (!view.markers(node.id, markers::kCancelRequest).empty()) {
        clearMarker(view, node.id, markers::kCancelRequest, delta);
    } else if (view.marker(node.id, markers::kJoinCancel)) {
        clearMarker(view, node.id, markers::kJoinCancel, delta);
    } else if (params.cancellation_scope == CancellationScope::Region && !targets.count(node.id)) {
        setMarker(view, node.id, markers::kCancelFired, "1", delta);
    }
    return delta;
}

} // namespace tickflow
