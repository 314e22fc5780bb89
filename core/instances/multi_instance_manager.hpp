#pragma once

#include "graph/node.hpp"
#include "kernel/verb.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace tickflow {

using GroupId = std::string;

/// Child instances spawned by one multi-instance activation.
/// `instances[i]` is the child node id of instance number i.
struct MultiInstanceGroup {
    GroupId id;
    NodeId parent_node;
    std::vector<NodeId> instances;
    uint32_t min_threshold = 0;
    uint32_t max_threshold = 0;     // 0 = unbounded
    InstanceMode creation_mode = InstanceMode::Static;
    bool sealed = false;
    std::set<int64_t> completed;
    std::set<int64_t> cancelled;

    /// Incremental groups grow until sealed.
    bool accepting() const {
        return creation_mode == InstanceMode::Incremental && !sealed;
    }

    size_t resolvedCount() const { return completed.size() + cancelled.size(); }

    bool allResolved() const {
        return !accepting() && resolvedCount() == instances.size();
    }

    bool operator==(const MultiInstanceGroup& o) const {
        return id == o.id && parent_node == o.parent_node && instances == o.instances &&
               min_threshold == o.min_threshold && max_threshold == o.max_threshold &&
               creation_mode == o.creation_mode && sealed == o.sealed &&
               completed == o.completed && cancelled == o.cancelled;
    }
};

/// Tracks multi-instance groups, completion counts and thresholds.
/// Owned by the topology store and mutated only while a delta is applied.
class MultiInstanceManager {
public:
    /// The id openGroup will assign for this parent next.
    GroupId nextGroupId(const NodeId& parent) const;

    GroupId openGroup(const NodeId& parent, InstanceMode mode, uint32_t count_hint,
                      uint32_t min_threshold = 0, uint32_t max_threshold = 0);

    void addInstance(const GroupId& id, const NodeId& child, int64_t index);
    void recordCompletion(const GroupId& id, int64_t instance);
    void recordCancellation(const GroupId& id, int64_t instance);

    /// Evaluate a completion rule over the group.
    /// WaitQuorum uses `count`; a count of zero is met immediately.
    bool isThresholdMet(const GroupId& id, CompletionStrategy strategy, uint32_t count = 0) const;

    void seal(const GroupId& id);

    /// Destroy a group. Throws StructuralError while it still accepts instances.
    void closeGroup(const GroupId& id);

    const MultiInstanceGroup* getGroup(const GroupId& id) const;

    /// The open group of a parent node, if any.
    const MultiInstanceGroup* groupOf(const NodeId& parent) const;

    std::vector<MultiInstanceGroup> groups() const;
    const std::map<NodeId, uint32_t>& generations() const { return generations_; }
    size_t groupCount() const { return groups_.size(); }

    void restore(const std::vector<MultiInstanceGroup>& groups,
                 const std::map<NodeId, uint32_t>& generations);

    /// Child node id for instance `index` of a group.
    static NodeId childId(const GroupId& group, int64_t index);

    bool operator==(const MultiInstanceManager& o) const {
        return groups_ == o.groups_ && generations_ == o.generations_;
    }

private:
    MultiInstanceGroup& require(const GroupId& id);

    std::map<GroupId, MultiInstanceGroup> groups_;
    std::map<NodeId, uint32_t> generations_;
};

} // namespace tickflow
