#include "graph/topology.hpp"
#include "errors/errors.hpp"
#include <algorithm>
#include <deque>
#include <limits>

namespace tickflow {

namespace {

bool legalTransition(Status from, Status to) {
    if (from == to) return true;
    if (from == Status::Voided) return false;
    if (to == Status::Voided) return from != Status::Completed;
    switch (from) {
        case Status::Pending:   return to == Status::Active || to == Status::Completed;
        case Status::Active:    return to == Status::Completed;
        case Status::Completed: return to == Status::Active;  // loop re-entry
        default:                return false;
    }
}

bool isMarkingKind(FactKind kind) {
    switch (kind) {
        case FactKind::Token:
        case FactKind::Arrival:
        case FactKind::Marker:
        case FactKind::Signal:
        case FactKind::Variable:
            return true;
        default:
            return false;
    }
}

Fact lowerBound(FactKind kind, const std::string& node) {
    return {kind, node, "", "", std::numeric_limits<int64_t>::min()};
}

} // namespace

// ─── Structure ─────────────────────────────────────────────────

void Topology::addNode(Node node) {
    if (node.id.empty()) {
        throw StructuralError("Node id must not be empty");
    }
    if (nodes_.count(node.id)) {
        throw StructuralError("Node ID already exists: " + node.id, node.id);
    }
    NodeId id = node.id;
    nodes_.emplace(id, std::move(node));
    outgoing_[id];
    incoming_[id];
}

const Node* Topology::getNode(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

Node& Topology::nodeRef(const NodeId& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw StructuralError("Node not found: " + id, id);
    }
    return it->second;
}

std::vector<NodeId> Topology::getNodeIds() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

void Topology::addFlow(Flow flow) {
    if (!nodes_.count(flow.source))
        throw StructuralError("Flow source not found: " + flow.source, flow.source);
    if (!nodes_.count(flow.target))
        throw StructuralError("Flow target not found: " + flow.target + " (from " +
                              flow.source + ")", flow.source);
    if (getFlow(flow.source, flow.target))
        throw StructuralError("Duplicate flow " + flow.source + " -> " + flow.target,
                              flow.source);

    size_t index = flows_.size();
    outgoing_[flow.source].push_back(index);
    incoming_[flow.target].push_back(index);
    flows_.push_back(std::move(flow));
}

std::vector<const Flow*> Topology::flowsOut(const NodeId& id) const {
    std::vector<const Flow*> result;
    auto it = outgoing_.find(id);
    if (it == outgoing_.end()) return result;
    for (size_t idx : it->second) {
        result.push_back(&flows_[idx]);
    }
    std::stable_sort(result.begin(), result.end(), [](const Flow* a, const Flow* b) {
        if (a->priority != b->priority) return a->priority < b->priority;
        return a->target < b->target;
    });
    return result;
}

std::vector<const Flow*> Topology::flowsIn(const NodeId& id) const {
    std::vector<const Flow*> result;
    auto it = incoming_.find(id);
    if (it == incoming_.end()) return result;
    for (size_t idx : it->second) {
        result.push_back(&flows_[idx]);
    }
    std::stable_sort(result.begin(), result.end(), [](const Flow* a, const Flow* b) {
        if (a->priority != b->priority) return a->priority < b->priority;
        return a->source < b->source;
    });
    return result;
}

const Flow* Topology::getFlow(const NodeId& source, const NodeId& target) const {
    auto it = outgoing_.find(source);
    if (it == outgoing_.end()) return nullptr;
    for (size_t idx : it->second) {
        if (flows_[idx].target == target) return &flows_[idx];
    }
    return nullptr;
}

std::vector<NodeId> Topology::predecessors(const NodeId& id) const {
    std::vector<NodeId> result;
    for (const Flow* f : flowsIn(id)) {
        result.push_back(f->source);
    }
    return result;
}

std::vector<NodeId> Topology::successors(const NodeId& id) const {
    std::vector<NodeId> result;
    for (const Flow* f : flowsOut(id)) {
        result.push_back(f->target);
    }
    return result;
}

void Topology::forEachNode(const std::function<void(const Node&)>& fn) const {
    for (const auto& [_, node] : nodes_) {
        fn(node);
    }
}

// ─── Marking queries ───────────────────────────────────────────

Status Topology::status(const NodeId& id) const {
    const Node* n = getNode(id);
    if (!n) throw StructuralError("Node not found: " + id, id);
    return n->status;
}

std::vector<Token> Topology::tokensOn(const NodeId& id) const {
    std::vector<Token> result;
    for (auto it = facts_.lower_bound(lowerBound(FactKind::Token, id));
         it != facts_.end() && it->kind == FactKind::Token && it->node == id; ++it) {
        result.push_back({it->node, it->number});
    }
    return result;
}

bool Topology::hasToken(const NodeId& id) const {
    auto it = facts_.lower_bound(lowerBound(FactKind::Token, id));
    return it != facts_.end() && it->kind == FactKind::Token && it->node == id;
}

bool Topology::hasSingletonToken(const NodeId& id) const {
    return facts_.count(Fact::token(id)) > 0;
}

std::vector<NodeId> Topology::arrivalsAt(const NodeId& target) const {
    std::vector<NodeId> sources;
    for (auto it = facts_.lower_bound(lowerBound(FactKind::Arrival, target));
         it != facts_.end() && it->kind == FactKind::Arrival && it->node == target; ++it) {
        sources.push_back(it->key);
    }
    return sources;
}

bool Topology::hasArrival(const NodeId& source, const NodeId& target) const {
    return facts_.count(Fact::arrival(source, target)) > 0;
}

std::optional<std::string> Topology::marker(const NodeId& id, const std::string& key) const {
    Fact probe{FactKind::Marker, id, key, "", std::numeric_limits<int64_t>::min()};
    auto it = facts_.lower_bound(probe);
    if (it != facts_.end() && it->kind == FactKind::Marker && it->node == id && it->key == key) {
        return it->value;
    }
    return std::nullopt;
}

std::vector<std::string> Topology::markers(const NodeId& id, const std::string& key) const {
    std::vector<std::string> values;
    Fact probe{FactKind::Marker, id, key, "", std::numeric_limits<int64_t>::min()};
    for (auto it = facts_.lower_bound(probe);
         it != facts_.end() && it->kind == FactKind::Marker && it->node == id && it->key == key;
         ++it) {
        values.push_back(it->value);
    }
    return values;
}

std::optional<Fact> Topology::signal(const std::string& name) const {
    auto it = facts_.lower_bound(lowerBound(FactKind::Signal, name));
    if (it != facts_.end() && it->kind == FactKind::Signal && it->node == name) {
        return *it;
    }
    return std::nullopt;
}

std::optional<std::string> Topology::variable(const std::string& name) const {
    auto it = facts_.lower_bound(lowerBound(FactKind::Variable, name));
    if (it != facts_.end() && it->kind == FactKind::Variable && it->node == name) {
        return it->value;
    }
    return std::nullopt;
}

Variables Topology::variables() const {
    Variables vars;
    for (const auto& f : factsOfKind(FactKind::Variable)) {
        vars[f.node] = f.value;
    }
    return vars;
}

std::vector<Fact> Topology::factsOfKind(FactKind kind) const {
    std::vector<Fact> result;
    for (auto it = facts_.lower_bound(lowerBound(kind, ""));
         it != facts_.end() && it->kind == kind; ++it) {
        result.push_back(*it);
    }
    return result;
}

bool Topology::hasFact(const Fact& fact) const {
    if (fact.kind == FactKind::Status) {
        const Node* n = getNode(fact.node);
        return n && n->status == fact.statusValue();
    }
    return facts_.count(fact) > 0;
}

size_t Topology::tokenCount() const {
    size_t count = 0;
    for (const auto& f : facts_) {
        if (f.isWork()) count++;
    }
    return count;
}

// ─── Delta validation ──────────────────────────────────────────

void Topology::validate(const Delta& delta) const {
    std::set<GroupId> opened;
    std::set<GroupId> sealed;
    std::set<NodeId> created;
    std::map<GroupId, std::vector<int64_t>> spawned;

    for (const auto& f : delta.additions) {
        if (f.kind == FactKind::Group) {
            if (!hasNode(f.node))
                throw StructuralError("Instance group parent not found: " + f.node, f.node);
            if (instances_.groupOf(f.node))
                throw StructuralError("Node already has an open instance group: " + f.node, f.node);
            if (f.key != instances_.nextGroupId(f.node))
                throw StructuralError("Unexpected group id " + f.key + " for " + f.node, f.node);
            opened.insert(f.key);
        } else if (f.kind == FactKind::Seal) {
            if (!opened.count(f.key) && !instances_.getGroup(f.key))
                throw StructuralError("Cannot seal unknown group " + f.key, f.node);
            sealed.insert(f.key);
        }
    }

    for (const auto& f : delta.additions) {
        if (f.kind != FactKind::Instance) continue;
        if (hasNode(f.node))
            throw StructuralError("Instance node already exists: " + f.node, f.node);
        const MultiInstanceGroup* group = instances_.getGroup(f.key);
        if (!group && !opened.count(f.key))
            throw StructuralError("Instance " + f.node + " refers to unknown group " + f.key, f.node);
        if (group && group->parent_node != f.value)
            throw StructuralError("Instance " + f.node + " parent mismatch", f.node);
        spawned[f.key].push_back(f.number);
        created.insert(f.node);
    }

    for (auto& [gid, indices] : spawned) {
        std::sort(indices.begin(), indices.end());
        const MultiInstanceGroup* group = instances_.getGroup(gid);
        int64_t next = group ? static_cast<int64_t>(group->instances.size()) : 0;
        for (int64_t idx : indices) {
            if (idx != next++)
                throw StructuralError("Instance indices of group " + gid + " are not contiguous");
        }
        if (group && group->creation_mode == InstanceMode::Incremental && group->sealed)
            throw StructuralError("Group " + gid + " is sealed", group->parent_node);
        uint32_t max = 0;
        if (group) {
            max = group->max_threshold;
        } else {
            for (const auto& f : delta.additions) {
                if (f.kind == FactKind::Group && f.key == gid) max = getNode(f.node)->instances.max;
            }
        }
        if (max > 0 && next > static_cast<int64_t>(max))
            throw StructuralError("Group " + gid + " exceeds its instance limit");
    }

    auto exists = [&](const NodeId& id) { return hasNode(id) || created.count(id) > 0; };

    for (const auto& f : delta.removals) {
        switch (f.kind) {
            case FactKind::Status:
                if (!hasNode(f.node))
                    throw StructuralError("Status change on unknown node " + f.node, f.node);
                if (status(f.node) != f.statusValue())
                    throw StructuralError("Stale status for " + f.node + ": expected " +
                                          toString(f.statusValue()) + ", found " +
                                          toString(status(f.node)), f.node);
                break;
            case FactKind::Group: {
                const MultiInstanceGroup* group = instances_.getGroup(f.key);
                if (!group)
                    throw StructuralError("Cannot close unknown group " + f.key, f.node);
                if (group->accepting() && !sealed.count(f.key))
                    throw StructuralError("Group " + f.key + " still accepts instances", f.node);
                break;
            }
            case FactKind::Instance:
            case FactKind::Seal:
                throw StructuralError("Fact cannot be removed: " + f.describe(), f.node);
            default:
                if (!facts_.count(f))
                    throw StructuralError("Removal of non-existent " + f.describe(), f.node);
                break;
        }
    }

    std::map<NodeId, Status> next_status;
    for (const auto& f : delta.additions) {
        if (f.kind != FactKind::Status) continue;
        if (!exists(f.node))
            throw StructuralError("Status change on unknown node " + f.node, f.node);
        if (next_status.count(f.node))
            throw StructuralError("Conflicting status changes for " + f.node, f.node);
        Status from = hasNode(f.node) ? status(f.node) : Status::Pending;
        if (!legalTransition(from, f.statusValue()))
            throw StructuralError(std::string("Illegal transition ") + toString(from) + " -> " +
                                  toString(f.statusValue()) + " for " + f.node, f.node);
        next_status[f.node] = f.statusValue();
    }

    for (const auto& f : delta.additions) {
        switch (f.kind) {
            case FactKind::Token: {
                if (!exists(f.node))
                    throw StructuralError("Token on unknown node " + f.node, f.node);
                auto ns = next_status.find(f.node);
                Status s = ns != next_status.end() ? ns->second
                                                   : (hasNode(f.node) ? status(f.node) : Status::Pending);
                if (s == Status::Voided)
                    throw StructuralError("Token on voided node " + f.node, f.node);
                break;
            }
            case FactKind::Arrival:
                if (!getFlow(f.key, f.node))
                    throw StructuralError("Arrival on missing flow " + f.key + " -> " + f.node, f.node);
                break;
            case FactKind::Marker:
                if (!exists(f.node))
                    throw StructuralError("Marker on unknown node " + f.node, f.node);
                break;
            default:
                break;
        }
    }
}

void Topology::normalize(Delta& delta) const {
    for (auto it = delta.additions.begin(); it != delta.additions.end();) {
        bool present = false;
        if (it->kind == FactKind::Status) {
            const Node* n = getNode(it->node);
            present = n && n->status == it->statusValue() && !delta.removals.count(*it);
        } else if (isMarkingKind(it->kind)) {
            present = facts_.count(*it) > 0 && !delta.removals.count(*it);
        }
        it = present ? delta.additions.erase(it) : std::next(it);
    }
}

// ─── Delta application ─────────────────────────────────────────

uint64_t Topology::apply(const Delta& delta) {
    validate(delta);

    for (const auto& f : delta.additions) {
        if (f.kind != FactKind::Group) continue;
        const Node& parent = nodeRef(f.node);
        instances_.openGroup(f.node, parseInstanceMode(f.value),
                             static_cast<uint32_t>(std::max<int64_t>(f.number, 0)),
                             parent.instances.min, parent.instances.max);
    }

    std::vector<const Fact*> spawns;
    for (const auto& f : delta.additions) {
        if (f.kind == FactKind::Instance) spawns.push_back(&f);
    }
    std::sort(spawns.begin(), spawns.end(), [](const Fact* a, const Fact* b) {
        return std::tie(a->key, a->number) < std::tie(b->key, b->number);
    });
    for (const Fact* f : spawns) {
        Node child(f->node, NodeKind::Task);
        child.parent = f->value;
        child.instance = f->number;
        child.group = f->key;
        addNode(std::move(child));
        instances_.addInstance(f->key, f->node, f->number);
    }

    for (const auto& f : delta.additions) {
        if (f.kind == FactKind::Seal) instances_.seal(f.key);
    }

    for (const auto& f : delta.removals) {
        if (isMarkingKind(f.kind)) facts_.erase(f);
    }

    for (const auto& f : delta.additions) {
        if (f.kind == FactKind::Status) {
            Node& n = nodeRef(f.node);
            n.status = f.statusValue();
            if (n.isInstanceChild() && instances_.getGroup(n.group)) {
                if (n.status == Status::Completed) {
                    instances_.recordCompletion(n.group, n.instance);
                } else if (n.status == Status::Voided) {
                    instances_.recordCancellation(n.group, n.instance);
                }
            }
        } else if (isMarkingKind(f.kind)) {
            facts_.insert(f);
        }
    }

    for (const auto& f : delta.removals) {
        if (f.kind == FactKind::Group) instances_.closeGroup(f.key);
    }

    return ++generation_;
}

TopologyView Topology::snapshot() const {
    return std::make_shared<const Topology>(*this);
}

// ─── Bulk exchange ─────────────────────────────────────────────

void Topology::insertMarkingFact(const Fact& fact) {
    switch (fact.kind) {
        case FactKind::Token:
        case FactKind::Marker:
            if (!hasNode(fact.node))
                throw StructuralError("Fact refers to unknown node: " + fact.describe(), fact.node);
            break;
        case FactKind::Arrival:
            if (!getFlow(fact.key, fact.node))
                throw StructuralError("Arrival on missing flow: " + fact.describe(), fact.node);
            break;
        case FactKind::Signal:
        case FactKind::Variable:
            break;
        default:
            throw StructuralError("Fact cannot be loaded directly: " + fact.describe(), fact.node);
    }
    facts_.insert(fact);
}

Topology Topology::load(const GraphFacts& facts) {
    Topology t;
    for (const auto& n : facts.nodes) {
        t.addNode(n);
    }
    for (const auto& f : facts.flows) {
        t.addFlow(f);
    }
    for (const auto& g : facts.groups) {
        if (!t.hasNode(g.parent_node))
            throw StructuralError("Group " + g.id + " refers to unknown parent", g.parent_node);
        for (const auto& child : g.instances) {
            if (!t.hasNode(child))
                throw StructuralError("Group " + g.id + " refers to unknown instance " + child, child);
        }
    }
    t.instances_.restore(facts.groups, facts.group_generations);
    for (const auto& f : facts.facts) {
        t.insertMarkingFact(f);
    }
    return t;
}

GraphFacts Topology::exportFacts() const {
    GraphFacts out;
    out.nodes.reserve(nodes_.size());
    for (const auto& [_, node] : nodes_) {
        out.nodes.push_back(node);
    }
    out.flows = flows_;
    out.facts.assign(facts_.begin(), facts_.end());
    out.groups = instances_.groups();
    out.group_generations = instances_.generations();
    return out;
}

bool Topology::operator==(const Topology& other) const {
    return nodes_ == other.nodes_ && flows_ == other.flows_ &&
           facts_ == other.facts_ && instances_ == other.instances_;
}

// ─── Reachability ──────────────────────────────────────────────

std::unordered_set<NodeId> liveReachable(const Topology& topology, const NodeId& barrier) {
    std::unordered_set<NodeId> seen;
    std::deque<NodeId> frontier;

    auto seed = [&](const NodeId& id) {
        if (id == barrier || !topology.hasNode(id)) return;
        if (seen.insert(id).second) frontier.push_back(id);
    };

    for (const auto& f : topology.factsOfKind(FactKind::Token)) {
        const Node* n = topology.getNode(f.node);
        seed(n && n->isInstanceChild() ? n->parent : f.node);
    }
    for (const auto& f : topology.factsOfKind(FactKind::Arrival)) {
        seed(f.node);
    }

    while (!frontier.empty()) {
        NodeId current = frontier.front();
        frontier.pop_front();
        for (const auto& next : topology.successors(current)) {
            if (next == barrier) continue;
            if (seen.insert(next).second) frontier.push_back(next);
        }
    }
    return seen;
}

} // namespace tickflow
