#include "kernel/routing.hpp"
#include "errors/errors.hpp"
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace tickflow {

bool isSynchronizing(const Node& node) {
    return node.join == ControlType::And || node.join == ControlType::Or ||
           node.join_options.quorum > 0 || !node.mutex.empty() ||
           !node.milestone.empty() || !node.trigger.empty();
}

bool isParkedOn(const Topology& view, const NodeId& pred, const NodeId& target) {
    const Node* p = view.getNode(pred);
    const Node* t = view.getNode(target);
    if (!p || !t || !isSynchronizing(*t)) return false;
    if (p->status != Status::Completed || !view.hasSingletonToken(pred)) return false;
    auto out = view.flowsOut(pred);
    return out.size() == 1 && out[0]->target == target;
}

std::vector<NodeId> satisfiedPredecessors(const Topology& view, const NodeId& target) {
    std::vector<NodeId> result;
    for (const Flow* f : view.flowsIn(target)) {
        if (view.hasArrival(f->source, target) || isParkedOn(view, f->source, target)) {
            result.push_back(f->source);
        }
    }
    return result;
}

void consumeFrom(const Topology& view, const NodeId& pred, const NodeId& target, Delta& delta) {
    if (view.hasArrival(pred, target)) {
        delta.remove(Fact::arrival(pred, target));
    } else if (view.hasSingletonToken(pred)) {
        delta.remove(Fact::token(pred));
    }
}

void enable(const Topology& view, const NodeId& id, Delta& delta) {
    const Node* n = view.getNode(id);
    if (!n) throw StructuralError("Cannot enable unknown node " + id, id);
    if (n->status == Status::Voided) return;

    if (!view.hasSingletonToken(id)) {
        delta.add(Fact::token(id));
    }
    Status next = n->isCondition() ? Status::Completed : Status::Active;
    if (n->status == Status::Completed && !n->isCondition()) {
        // Re-entry starts a fresh activation.
        if (auto fired = view.marker(id, markers::kCancelFired)) {
            delta.remove(Fact::marker(id, markers::kCancelFired, *fired));
        }
    }
    delta.setStatus(id, n->status, next);
}

void deliver(const Topology& view, const Flow& flow, Delta& delta) {
    const Node* target = view.getNode(flow.target);
    if (!target) throw StructuralError("Dangling flow target " + flow.target, flow.source);

    // Work sent into a cancelled node is dropped with it.
    if (target->status == Status::Voided) return;

    if (isSynchronizing(*target)) {
        delta.add(Fact::arrival(flow.source, flow.target));
    } else {
        enable(view, flow.target, delta);
    }
}

void setMarker(const Topology& view, const NodeId& id, const std::string& key,
               const std::string& value, Delta& delta) {
    auto current = view.marker(id, key);
    if (current && *current == value) return;
    if (current) delta.remove(Fact::marker(id, key, *current));
    delta.add(Fact::marker(id, key, value));
}

void clearMarker(const Topology& view, const NodeId& id, const std::string& key, Delta& delta) {
    for (const auto& value : view.markers(id, key)) {
        delta.remove(Fact::marker(id, key, value));
    }
}

uint32_t variableCount(const Topology& view, const std::string& name, const NodeId& node) {
    auto value = view.variable(name);
    if (!value) {
        throw StructuralError("Variable '" + name + "' needed by " + node + " is not set", node);
    }
    char* end = nullptr;
    errno = 0;
    long long n = std::strtoll(value->c_str(), &end, 10);
    if (!value->empty() && end && *end == '\0') {
        if (n < 0) throw StructuralError("Negative count in '" + name + "'", node);
        if (errno == ERANGE || n > static_cast<long long>(std::numeric_limits<uint32_t>::max())) {
            throw StructuralError("Count in '" + name + "' is out of range: " + *value, node);
        }
        return static_cast<uint32_t>(n);
    }
    if (value->empty()) return 0;
    uint32_t items = 1;
    for (char c : *value) {
        if (c == ',') items++;
    }
    return items;
}

} // namespace tickflow
