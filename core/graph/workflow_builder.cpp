#include "graph/workflow_builder.hpp"
#include <algorithm>
#include <stdexcept>

namespace tickflow {

// ─── Nodes ─────────────────────────────────────────────────────

WorkflowBuilder& WorkflowBuilder::addNode(const NodeId& id, NodeKind kind) {
    if (index_.count(id)) {
        if (!duplicate_) duplicate_id_ = id;
        duplicate_ = true;
        last_ = id;
        return *this;
    }
    index_[id] = facts_.nodes.size();
    facts_.nodes.emplace_back(id, kind);
    last_ = id;
    return *this;
}

Node& WorkflowBuilder::current() {
    if (last_.empty()) {
        throw std::invalid_argument("Node modifier used before any node was declared");
    }
    return facts_.nodes[index_.at(last_)];
}

WorkflowBuilder& WorkflowBuilder::task(const NodeId& id) { return addNode(id, NodeKind::Task); }
WorkflowBuilder& WorkflowBuilder::condition(const NodeId& id) { return addNode(id, NodeKind::Condition); }
WorkflowBuilder& WorkflowBuilder::input(const NodeId& id) { return addNode(id, NodeKind::InputCondition); }

WorkflowBuilder& WorkflowBuilder::output(const NodeId& id, bool terminates_case) {
    addNode(id, NodeKind::OutputCondition);
    current().terminates_case = terminates_case;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::split(ControlType type) {
    current().split = type;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::join(ControlType type) {
    current().join = type;
    return *this;
}

void WorkflowBuilder::setStatus(Status status, bool with_token) {
    Node& n = current();
    n.status = status;
    Fact token = Fact::token(n.id);
    auto it = std::find(facts_.facts.begin(), facts_.facts.end(), token);
    if (with_token && it == facts_.facts.end()) {
        facts_.facts.push_back(token);
    } else if (!with_token && it != facts_.facts.end()) {
        facts_.facts.erase(it);
    }
}

WorkflowBuilder& WorkflowBuilder::completed(bool with_token) {
    setStatus(Status::Completed, with_token);
    return *this;
}

WorkflowBuilder& WorkflowBuilder::active(bool with_token) {
    setStatus(Status::Active, with_token);
    return *this;
}

WorkflowBuilder& WorkflowBuilder::voided() {
    setStatus(Status::Voided, false);
    return *this;
}

WorkflowBuilder& WorkflowBuilder::cancels(const std::vector<NodeId>& targets) {
    current().cancellation_targets = targets;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::nests(const std::vector<NodeId>& children) {
    current().nested = children;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::quorum(uint32_t n, bool blocking, bool cancel_remaining) {
    JoinOptions& jo = current().join_options;
    jo.quorum = n;
    jo.blocking = blocking;
    jo.cancel_remaining = cancel_remaining;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::reachability() {
    current().join_options.reachability = true;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::instances(const InstanceOptions& options) {
    current().instances = options;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::mutex(const std::string& lock) {
    current().mutex = lock;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::milestone(const NodeId& id) {
    current().milestone = id;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::trigger(const std::string& name, bool persistent) {
    Node& n = current();
    n.trigger = name;
    n.persistent_trigger = persistent;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::deferred() {
    Node& n = current();
    n.deferred = true;
    n.split = ControlType::Xor;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::maxIterations(uint32_t n) {
    current().max_iterations = n;
    return *this;
}

WorkflowBuilder& WorkflowBuilder::attribute(const std::string& key, const std::string& value) {
    current().setAttribute(key, value);
    return *this;
}

// ─── Flows ─────────────────────────────────────────────────────

int32_t WorkflowBuilder::nextPriority(const NodeId& source) {
    return priorities_[source]++;
}

WorkflowBuilder& WorkflowBuilder::flow(const NodeId& source, const NodeId& target) {
    facts_.flows.emplace_back(source, target, nextPriority(source));
    return *this;
}

WorkflowBuilder& WorkflowBuilder::flow(Flow f) {
    priorities_[f.source] = std::max(priorities_[f.source], f.priority + 1);
    facts_.flows.push_back(std::move(f));
    return *this;
}

WorkflowBuilder& WorkflowBuilder::guarded(const NodeId& source, const NodeId& target,
                                          const std::string& expression) {
    Flow f(source, target, nextPriority(source));
    f.predicate = Guard::parse(expression);
    facts_.flows.push_back(std::move(f));
    return *this;
}

WorkflowBuilder& WorkflowBuilder::fallback(const NodeId& source, const NodeId& target) {
    Flow f(source, target, nextPriority(source));
    f.is_default = true;
    facts_.flows.push_back(std::move(f));
    return *this;
}

WorkflowBuilder& WorkflowBuilder::backEdge(const NodeId& source, const NodeId& target,
                                           const std::string& expression) {
    Flow f(source, target, nextPriority(source));
    f.back_edge = true;
    if (!expression.empty()) f.predicate = Guard::parse(expression);
    facts_.flows.push_back(std::move(f));
    return *this;
}

WorkflowBuilder& WorkflowBuilder::onEvent(const NodeId& source, const NodeId& target,
                                          const std::string& event) {
    Flow f(source, target, nextPriority(source));
    f.event = event;
    facts_.flows.push_back(std::move(f));
    return *this;
}

// ─── Marking ───────────────────────────────────────────────────

WorkflowBuilder& WorkflowBuilder::variable(const std::string& name, const std::string& value) {
    auto& facts = facts_.facts;
    facts.erase(std::remove_if(facts.begin(), facts.end(), [&](const Fact& f) {
                    return f.kind == FactKind::Variable && f.node == name;
                }),
                facts.end());
    facts.push_back(Fact::variable(name, value));
    return *this;
}

WorkflowBuilder& WorkflowBuilder::signal(const std::string& name, bool persistent) {
    facts_.facts.push_back(Fact::signal(name, persistent));
    return *this;
}

GraphFacts WorkflowBuilder::build() const {
    if (duplicate_) {
        throw std::invalid_argument("Duplicate node: " + duplicate_id_);
    }
    return facts_;
}

} // namespace tickflow
