#include "resolver/pattern_resolver.hpp"
#include "kernel/routing.hpp"

namespace tickflow {

std::optional<Resolution> PatternResolver::resolve(const Topology& view, const Node& node) const {
    for (const auto& mapping : catalog_.mappings()) {
        if (triggerMatches(mapping.trigger, view, node)) {
            return Resolution{&mapping, bind(mapping, view, node)};
        }
    }
    return std::nullopt;
}

bool PatternResolver::hasPendingActivation(const Topology& view, const Node& node) {
    if (!view.markers(node.id, markers::kCancelRequest).empty()) return true;
    if (view.marker(node.id, markers::kJoinCancel)) return true;
    if (node.isInstanceChild()) return false;
    if (node.status != Status::Completed || !view.hasSingletonToken(node.id)) return false;

    // A parked token belongs to the downstream join, not to this node.
    auto out = view.flowsOut(node.id);
    return !(out.size() == 1 && isParkedOn(view, node.id, out[0]->target));
}

VerbCall PatternResolver::bind(const PatternMapping& mapping, const Topology& view,
                               const Node& node) const {
    VerbCall call = mapping.call;
    switch (mapping.binding) {
        case Binding::None:
            break;
        case Binding::InstanceCount:
            std::get<CopyParams>(call.params).count = node.instances.count;
            break;
        case Binding::JoinQuorum:
            std::get<AwaitParams>(call.params).count = node.join_options.quorum;
            break;
        case Binding::InstanceThreshold:
            std::get<AwaitParams>(call.params).count = node.instances.threshold;
            break;
        case Binding::InstanceThresholdVariable:
            std::get<AwaitParams>(call.params).count =
                variableCount(view, node.instances.threshold_variable, node.id);
            break;
        case Binding::LoopBound:
            std::get<FilterParams>(call.params).max_iterations = node.max_iterations;
            break;
    }
    return call;
}

} // namespace tickflow
