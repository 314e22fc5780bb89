#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tickflow {

using NodeId = std::string;

enum class NodeKind : uint8_t { Task, Condition, InputCondition, OutputCondition };
enum class ControlType : uint8_t { None, And, Xor, Or };
enum class Status : uint8_t { Pending, Active, Completed, Voided };
enum class InstanceMode : uint8_t { None, Static, Dynamic, Incremental };

const char* toString(NodeKind kind);
const char* toString(ControlType type);
const char* toString(Status status);
const char* toString(InstanceMode mode);

/// Inverse of toString(InstanceMode). Throws std::invalid_argument.
InstanceMode parseInstanceMode(const std::string& name);

/// Join behavior beyond the plain split/join attribute.
struct JoinOptions {
    uint32_t quorum = 0;            // 0 = none, 1 = discriminator, N = partial join
    bool blocking = false;          // stay spent until an explicit reset
    bool cancel_remaining = false;  // void unfinished branches after firing
    bool reachability = false;      // OR-join waits on live reachability

    bool operator==(const JoinOptions& o) const {
        return quorum == o.quorum && blocking == o.blocking &&
               cancel_remaining == o.cancel_remaining && reachability == o.reachability;
    }
};

/// Multi-instance task settings.
struct InstanceOptions {
    InstanceMode mode = InstanceMode::None;
    uint32_t count = 0;             // static instance count
    uint32_t min = 0;
    uint32_t max = 0;               // 0 = unbounded
    uint32_t threshold = 0;         // completions needed, 0 = all
    std::string count_variable;     // dynamic cardinality source
    std::string threshold_variable; // dynamic partial join threshold
    bool synchronize = true;
    bool cancel_remaining = false;

    bool enabled() const { return mode != InstanceMode::None; }

    bool operator==(const InstanceOptions& o) const {
        return mode == o.mode && count == o.count && min == o.min && max == o.max &&
               threshold == o.threshold && count_variable == o.count_variable &&
               threshold_variable == o.threshold_variable &&
               synchronize == o.synchronize && cancel_remaining == o.cancel_remaining;
    }
};

/// A task or condition of the workflow net.
/// Structure is fixed at load time; only `status` changes during a run.
struct Node {
    NodeId id;
    NodeKind kind = NodeKind::Task;
    ControlType split = ControlType::None;
    ControlType join = ControlType::None;
    Status status = Status::Pending;
    std::vector<NodeId> cancellation_targets;
    std::vector<NodeId> nested;

    JoinOptions join_options;
    InstanceOptions instances;
    std::string mutex;              // lock shared with other nodes
    NodeId milestone;               // enabled only while this node holds a token
    std::string trigger;            // signal that must be present to start
    bool persistent_trigger = false;
    bool deferred = false;          // XOR split decided by external events
    uint32_t max_iterations = 0;    // structured loop bound, 0 = unbounded
    bool terminates_case = false;

    // Set on multi-instance children only.
    NodeId parent;
    int64_t instance = -1;
    std::string group;

    std::unordered_map<std::string, std::string> attributes;

    Node() = default;
    Node(NodeId id, NodeKind kind)
        : id(std::move(id)), kind(kind) {}

    bool isCondition() const {
        return kind != NodeKind::Task;
    }

    bool isInstanceChild() const { return instance >= 0; }

    void setAttribute(const std::string& key, const std::string& value) {
        attributes[key] = value;
    }

    std::string getAttribute(const std::string& key, const std::string& default_val = "") const {
        auto it = attributes.find(key);
        return it != attributes.end() ? it->second : default_val;
    }

    bool hasAttribute(const std::string& key) const {
        return attributes.count(key) > 0;
    }

    bool operator==(const Node& o) const;
    bool operator!=(const Node& o) const { return !(*this == o); }
};

} // namespace tickflow
