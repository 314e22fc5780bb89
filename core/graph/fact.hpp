#pragma once

#include "graph/node.hpp"
#include <cstdint>
#include <string>
#include <tuple>

namespace tickflow {

enum class FactKind : uint8_t {
    Status,     // node has status `number`
    Token,      // unit of work on node, `number` = instance (-1 singleton)
    Arrival,    // unit of work parked on arc key -> node
    Marker,     // per-node state `key` = `value`
    Signal,     // external event `node`, value "persistent" or "transient"
    Variable,   // case variable `node` = `value`
    Group,      // MI group `key` of parent `node`, value = mode, number = count hint
    Instance,   // MI child `node` of group `key`, parent `value`, index `number`
    Seal        // MI group `key` of parent `node` accepts no more instances
};

const char* toString(FactKind kind);

/// A single graph fact. Deltas are sets of facts to add and remove.
struct Fact {
    FactKind kind = FactKind::Token;
    NodeId node;
    std::string key;
    std::string value;
    int64_t number = -1;

    static Fact status(const NodeId& node, Status s) {
        return {FactKind::Status, node, "", "", static_cast<int64_t>(s)};
    }
    static Fact token(const NodeId& node, int64_t instance = -1) {
        return {FactKind::Token, node, "", "", instance};
    }
    static Fact arrival(const NodeId& source, const NodeId& target) {
        return {FactKind::Arrival, target, source, "", -1};
    }
    static Fact marker(const NodeId& node, const std::string& key, const std::string& value) {
        return {FactKind::Marker, node, key, value, -1};
    }
    static Fact signal(const std::string& name, bool persistent) {
        return {FactKind::Signal, name, "", persistent ? "persistent" : "transient", -1};
    }
    static Fact variable(const std::string& name, const std::string& value) {
        return {FactKind::Variable, name, "", value, -1};
    }
    static Fact group(const NodeId& parent, const std::string& group_id,
                      InstanceMode mode, int64_t count_hint) {
        return {FactKind::Group, parent, group_id, toString(mode), count_hint};
    }
    static Fact instance(const NodeId& child, const std::string& group_id,
                         const NodeId& parent, int64_t index) {
        return {FactKind::Instance, child, group_id, parent, index};
    }
    static Fact seal(const NodeId& parent, const std::string& group_id) {
        return {FactKind::Seal, parent, group_id, "", -1};
    }

    Status statusValue() const { return static_cast<Status>(number); }
    bool persistent() const { return value == "persistent"; }

    /// Units of work carried by this fact.
    bool isWork() const { return kind == FactKind::Token || kind == FactKind::Arrival; }

    std::string describe() const;

    bool operator<(const Fact& o) const {
        return std::tie(kind, node, key, value, number) <
               std::tie(o.kind, o.node, o.key, o.value, o.number);
    }
    bool operator==(const Fact& o) const {
        return kind == o.kind && node == o.node && key == o.key &&
               value == o.value && number == o.number;
    }
    bool operator!=(const Fact& o) const { return !(*this == o); }
};

/// A token as seen by queries.
struct Token {
    NodeId node;
    int64_t instance = -1;

    bool singleton() const { return instance < 0; }
    bool operator==(const Token& o) const { return node == o.node && instance == o.instance; }
};

} // namespace tickflow
