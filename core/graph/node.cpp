#include "graph/node.hpp"
#include "graph/fact.hpp"
#include <stdexcept>

namespace tickflow {

const char* toString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Task:            return "Task";
        case NodeKind::Condition:       return "Condition";
        case NodeKind::InputCondition:  return "InputCondition";
        case NodeKind::OutputCondition: return "OutputCondition";
    }
    return "Unknown";
}

const char* toString(ControlType type) {
    switch (type) {
        case ControlType::None: return "None";
        case ControlType::And:  return "AND";
        case ControlType::Xor:  return "XOR";
        case ControlType::Or:   return "OR";
    }
    return "Unknown";
}

const char* toString(Status status) {
    switch (status) {
        case Status::Pending:   return "Pending";
        case Status::Active:    return "Active";
        case Status::Completed: return "Completed";
        case Status::Voided:    return "Voided";
    }
    return "Unknown";
}

const char* toString(InstanceMode mode) {
    switch (mode) {
        case InstanceMode::None:        return "none";
        case InstanceMode::Static:      return "static";
        case InstanceMode::Dynamic:     return "dynamic";
        case InstanceMode::Incremental: return "incremental";
    }
    return "unknown";
}

InstanceMode parseInstanceMode(const std::string& name) {
    if (name == "none")        return InstanceMode::None;
    if (name == "static")      return InstanceMode::Static;
    if (name == "dynamic")     return InstanceMode::Dynamic;
    if (name == "incremental") return InstanceMode::Incremental;
    throw std::invalid_argument("Unknown instance mode: " + name);
}

const char* toString(FactKind kind) {
    switch (kind) {
        case FactKind::Status:   return "status";
        case FactKind::Token:    return "token";
        case FactKind::Arrival:  return "arrival";
        case FactKind::Marker:   return "marker";
        case FactKind::Signal:   return "signal";
        case FactKind::Variable: return "variable";
        case FactKind::Group:    return "group";
        case FactKind::Instance: return "instance";
        case FactKind::Seal:     return "seal";
    }
    return "unknown";
}

bool Node::operator==(const Node& o) const {
    return id == o.id && kind == o.kind && split == o.split && join == o.join &&
           status == o.status && cancellation_targets == o.cancellation_targets &&
           nested == o.nested && join_options == o.join_options &&
           instances == o.instances && mutex == o.mutex && milestone == o.milestone &&
           trigger == o.trigger && persistent_trigger == o.persistent_trigger &&
           deferred == o.deferred && max_iterations == o.max_iterations &&
           terminates_case == o.terminates_case && parent == o.parent &&
           instance == o.instance && group == o.group && attributes == o.attributes;
}

} // namespace tickflow
