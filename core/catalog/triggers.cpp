#include "catalog/pattern_catalog.hpp"
#include "kernel/routing.hpp"
#include <algorithm>

namespace tickflow {

namespace {

bool hasRequest(const Topology& view, const Node& node, CancellationScope scope) {
    auto requests = view.markers(node.id, markers::kCancelRequest);
    return std::find(requests.begin(), requests.end(), toString(scope)) != requests.end();
}

bool parked(const Topology& view, const Node& node) {
    auto out = view.flowsOut(node.id);
    return out.size() == 1 && isParkedOn(view, node.id, out[0]->target);
}

/// Completed, holding its own token, and free to route it onward.
bool routable(const Topology& view, const Node& node) {
    return !node.isInstanceChild() && node.status == Status::Completed &&
           view.hasSingletonToken(node.id) && !parked(view, node);
}

bool hasBackEdge(const Topology& view, const Node& node) {
    for (const Flow* f : view.flowsOut(node.id)) {
        if (f->back_edge) return true;
    }
    return false;
}

/// Work is waiting on the incoming arcs and the previous activation has left.
bool joinReady(const Topology& view, const Node& node) {
    if (node.instances.enabled() || view.hasToken(node.id)) return false;
    return !satisfiedPredecessors(view, node.id).empty();
}

bool canSpawn(const Topology& view, const Node& node, InstanceMode mode) {
    return node.instances.mode == mode && node.status == Status::Active &&
           view.hasSingletonToken(node.id) && !view.instances().groupOf(node.id);
}

/// Open group still to be synchronized or drained. After firing, routing
/// the parent's token takes precedence over draining late completions.
bool groupAwaiting(const Topology& view, const Node& node) {
    if (!node.instances.enabled()) return false;
    if (!view.instances().groupOf(node.id)) return false;
    bool fired = view.marker(node.id, markers::kInstancesFired).has_value();
    return !(fired && view.hasSingletonToken(node.id));
}

bool outstandingInstances(const Topology& view, const Node& node) {
    const MultiInstanceGroup* g = view.instances().groupOf(node.id);
    return g && g->resolvedCount() < g->instances.size();
}

} // namespace

const char* toString(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::CaseCancelRequested:      return "CaseCancelRequested";
        case TriggerKind::TaskCancelRequested:      return "TaskCancelRequested";
        case TriggerKind::RegionCancelRequested:    return "RegionCancelRequested";
        case TriggerKind::InstancesCancelRequested: return "InstancesCancelRequested";
        case TriggerKind::SelfCancelRequested:      return "SelfCancelRequested";
        case TriggerKind::JoinCancelPending:        return "JoinCancelPending";
        case TriggerKind::InstancesCancelPending:   return "InstancesCancelPending";
        case TriggerKind::ExplicitTermination:      return "ExplicitTermination";
        case TriggerKind::CancellationRegion:       return "CancellationRegion";
        case TriggerKind::StaticInstances:          return "StaticInstances";
        case TriggerKind::DynamicInstances:         return "DynamicInstances";
        case TriggerKind::IncrementalInstances:     return "IncrementalInstances";
        case TriggerKind::InstanceRequested:        return "InstanceRequested";
        case TriggerKind::DetachedInstances:        return "DetachedInstances";
        case TriggerKind::InstanceQuorum:           return "InstanceQuorum";
        case TriggerKind::DynamicInstanceQuorum:    return "DynamicInstanceQuorum";
        case TriggerKind::InstanceGroup:            return "InstanceGroup";
        case TriggerKind::MutexGate:                return "MutexGate";
        case TriggerKind::MilestoneGate:            return "MilestoneGate";
        case TriggerKind::PersistentTriggerGate:    return "PersistentTriggerGate";
        case TriggerKind::TransientTriggerGate:     return "TransientTriggerGate";
        case TriggerKind::BlockingDiscriminator:    return "BlockingDiscriminator";
        case TriggerKind::Discriminator:            return "Discriminator";
        case TriggerKind::BlockingPartialJoin:      return "BlockingPartialJoin";
        case TriggerKind::PartialJoin:              return "PartialJoin";
        case TriggerKind::AndJoin:                  return "AndJoin";
        case TriggerKind::ReachabilityMerge:        return "ReachabilityMerge";
        case TriggerKind::OrJoin:                   return "OrJoin";
        case TriggerKind::DeferredChoice:           return "DeferredChoice";
        case TriggerKind::BoundedLoop:              return "BoundedLoop";
        case TriggerKind::BackEdge:                 return "BackEdge";
        case TriggerKind::AndSplit:                 return "AndSplit";
        case TriggerKind::XorSplit:                 return "XorSplit";
        case TriggerKind::OrSplit:                  return "OrSplit";
        case TriggerKind::SingleFlow:               return "SingleFlow";
        case TriggerKind::Sink:                     return "Sink";
    }
    return "Unknown";
}

bool triggerMatches(TriggerKind kind, const Topology& view, const Node& node) {
    const JoinOptions& jo = node.join_options;
    const InstanceOptions& io = node.instances;

    switch (kind) {
        // ─── Cancellation ───────────────────────────────────
        case TriggerKind::CaseCancelRequested:
            return hasRequest(view, node, CancellationScope::Case);
        case TriggerKind::TaskCancelRequested:
            return hasRequest(view, node, CancellationScope::Task);
        case TriggerKind::RegionCancelRequested:
            return hasRequest(view, node, CancellationScope::Region);
        case TriggerKind::InstancesCancelRequested:
            return hasRequest(view, node, CancellationScope::Instances);
        case TriggerKind::SelfCancelRequested:
            return hasRequest(view, node, CancellationScope::Self);
        case TriggerKind::JoinCancelPending:
            return view.marker(node.id, markers::kJoinCancel).has_value();
        case TriggerKind::InstancesCancelPending:
            return io.cancel_remaining && outstandingInstances(view, node) &&
                   view.marker(node.id, markers::kInstancesFired).has_value();
        case TriggerKind::ExplicitTermination:
            return node.kind == NodeKind::OutputCondition && node.terminates_case &&
                   node.status == Status::Completed && view.hasSingletonToken(node.id);
        case TriggerKind::CancellationRegion:
            return !node.cancellation_targets.empty() && !jo.cancel_remaining &&
                   !node.isInstanceChild() && node.status == Status::Completed &&
                   view.hasSingletonToken(node.id) &&
                   !view.marker(node.id, markers::kCancelFired);

        // ─── Multiple instances ─────────────────────────────
        case TriggerKind::StaticInstances:
            return canSpawn(view, node, InstanceMode::Static);
        case TriggerKind::DynamicInstances:
            return canSpawn(view, node, InstanceMode::Dynamic);
        case TriggerKind::IncrementalInstances:
            return canSpawn(view, node, InstanceMode::Incremental);
        case TriggerKind::InstanceRequested: {
            const MultiInstanceGroup* g = view.instances().groupOf(node.id);
            return g && g->accepting() && view.marker(node.id, markers::kInstanceRequest);
        }
        case TriggerKind::DetachedInstances:
            return !io.synchronize && groupAwaiting(view, node);
        case TriggerKind::InstanceQuorum:
            return io.synchronize && io.threshold > 0 && io.threshold_variable.empty() &&
                   groupAwaiting(view, node);
        case TriggerKind::DynamicInstanceQuorum:
            return io.synchronize && !io.threshold_variable.empty() && groupAwaiting(view, node);
        case TriggerKind::InstanceGroup:
            return io.synchronize && groupAwaiting(view, node);

        // ─── Gates ──────────────────────────────────────────
        case TriggerKind::MutexGate:
            return !node.mutex.empty() && joinReady(view, node);
        case TriggerKind::MilestoneGate:
            return !node.milestone.empty() && joinReady(view, node);
        case TriggerKind::PersistentTriggerGate:
            return !node.trigger.empty() && node.persistent_trigger && joinReady(view, node);
        case TriggerKind::TransientTriggerGate:
            return !node.trigger.empty() && !node.persistent_trigger && joinReady(view, node);

        // ─── Joins ──────────────────────────────────────────
        case TriggerKind::BlockingDiscriminator:
            return jo.quorum == 1 && (jo.blocking || jo.cancel_remaining) && joinReady(view, node);
        case TriggerKind::Discriminator:
            return jo.quorum == 1 && joinReady(view, node);
        case TriggerKind::BlockingPartialJoin:
            return jo.quorum > 1 && (jo.blocking || jo.cancel_remaining) && joinReady(view, node);
        case TriggerKind::PartialJoin:
            return jo.quorum > 1 && joinReady(view, node);
        case TriggerKind::AndJoin:
            return node.join == ControlType::And && joinReady(view, node);
        case TriggerKind::ReachabilityMerge:
            return node.join == ControlType::Or && jo.reachability && joinReady(view, node);
        case TriggerKind::OrJoin:
            return node.join == ControlType::Or && joinReady(view, node);

        // ─── Routing ────────────────────────────────────────
        case TriggerKind::DeferredChoice:
            return node.split == ControlType::Xor && node.deferred && routable(view, node);
        case TriggerKind::BoundedLoop:
            return node.max_iterations > 0 && hasBackEdge(view, node) && routable(view, node);
        case TriggerKind::BackEdge:
            return hasBackEdge(view, node) && routable(view, node);
        case TriggerKind::AndSplit:
            return node.split == ControlType::And && routable(view, node);
        case TriggerKind::XorSplit:
            return node.split == ControlType::Xor && routable(view, node);
        case TriggerKind::OrSplit:
            return node.split == ControlType::Or && routable(view, node);
        case TriggerKind::SingleFlow:
            return view.flowsOut(node.id).size() == 1 && routable(view, node);
        case TriggerKind::Sink:
            return view.flowsOut(node.id).empty() && routable(view, node);
    }
    return false;
}

} // namespace tickflow
