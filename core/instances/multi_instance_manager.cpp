#include "instances/multi_instance_manager.hpp"
#include "errors/errors.hpp"

namespace tickflow {

GroupId MultiInstanceManager::nextGroupId(const NodeId& parent) const {
    auto it = generations_.find(parent);
    uint32_t gen = it != generations_.end() ? it->second : 0;
    return parent + "@" + std::to_string(gen);
}

NodeId MultiInstanceManager::childId(const GroupId& group, int64_t index) {
    return group + "#" + std::to_string(index);
}

GroupId MultiInstanceManager::openGroup(const NodeId& parent, InstanceMode mode,
                                        uint32_t count_hint, uint32_t min_threshold,
                                        uint32_t max_threshold) {
    if (mode == InstanceMode::None) {
        throw StructuralError("Cannot open an instance group without a creation mode", parent);
    }
    if (groupOf(parent)) {
        throw StructuralError("Node already has an open instance group: " + parent, parent);
    }

    GroupId id = nextGroupId(parent);
    generations_[parent]++;

    MultiInstanceGroup group;
    group.id = id;
    group.parent_node = parent;
    group.creation_mode = mode;
    group.min_threshold = min_threshold;
    group.max_threshold = max_threshold;
    group.instances.reserve(count_hint);
    groups_.emplace(id, std::move(group));
    return id;
}

MultiInstanceGroup& MultiInstanceManager::require(const GroupId& id) {
    auto it = groups_.find(id);
    if (it == groups_.end()) {
        throw StructuralError("Instance group not found: " + id);
    }
    return it->second;
}

void MultiInstanceManager::addInstance(const GroupId& id, const NodeId& child, int64_t index) {
    MultiInstanceGroup& group = require(id);
    if (index != static_cast<int64_t>(group.instances.size())) {
        throw StructuralError("Instance index " + std::to_string(index) +
                              " out of sequence in group " + id, child);
    }
    if (group.creation_mode == InstanceMode::Incremental && group.sealed) {
        throw StructuralError("Group " + id + " is sealed", child);
    }
    if (group.max_threshold > 0 && group.instances.size() >= group.max_threshold) {
        throw StructuralError("Group " + id + " reached its instance limit", child);
    }
    group.instances.push_back(child);
}

void MultiInstanceManager::recordCompletion(const GroupId& id, int64_t instance) {
    MultiInstanceGroup& group = require(id);
    if (instance < 0 || instance >= static_cast<int64_t>(group.instances.size())) {
        throw StructuralError("Unknown instance " + std::to_string(instance) + " in group " + id);
    }
    group.cancelled.erase(instance);
    group.completed.insert(instance);
}

void MultiInstanceManager::recordCancellation(const GroupId& id, int64_t instance) {
    MultiInstanceGroup& group = require(id);
    if (instance < 0 || instance >= static_cast<int64_t>(group.instances.size())) {
        throw StructuralError("Unknown instance " + std::to_string(instance) + " in group " + id);
    }
    if (!group.completed.count(instance)) {
        group.cancelled.insert(instance);
    }
}

bool MultiInstanceManager::isThresholdMet(const GroupId& id, CompletionStrategy strategy,
                                          uint32_t count) const {
    const MultiInstanceGroup* group = getGroup(id);
    if (!group) return false;

    switch (strategy) {
        case CompletionStrategy::WaitAll:
            return group->allResolved();
        case CompletionStrategy::WaitActive:
            // Cancelled instances leave the active set.
            return !group->accepting() &&
                   group->completed.size() == group->instances.size() - group->cancelled.size();
        case CompletionStrategy::WaitFirst:
            return !group->completed.empty();
        case CompletionStrategy::WaitQuorum:
            return group->completed.size() >= count;
    }
    return false;
}

void MultiInstanceManager::seal(const GroupId& id) {
    require(id).sealed = true;
}

void MultiInstanceManager::closeGroup(const GroupId& id) {
    MultiInstanceGroup& group = require(id);
    if (group.accepting()) {
        throw StructuralError("Group " + id + " still accepts instances and cannot close",
                              group.parent_node);
    }
    groups_.erase(id);
}

const MultiInstanceGroup* MultiInstanceManager::getGroup(const GroupId& id) const {
    auto it = groups_.find(id);
    return it != groups_.end() ? &it->second : nullptr;
}

const MultiInstanceGroup* MultiInstanceManager::groupOf(const NodeId& parent) const {
    for (const auto& [_, group] : groups_) {
        if (group.parent_node == parent) return &group;
    }
    return nullptr;
}

std::vector<MultiInstanceGroup> MultiInstanceManager::groups() const {
    std::vector<MultiInstanceGroup> result;
    result.reserve(groups_.size());
    for (const auto& [_, group] : groups_) {
        result.push_back(group);
    }
    return result;
}

void MultiInstanceManager::restore(const std::vector<MultiInstanceGroup>& groups,
                                   const std::map<NodeId, uint32_t>& generations) {
    groups_.clear();
    for (const auto& g : groups) {
        groups_.emplace(g.id, g);
    }
    generations_ = generations;
}

} // namespace tickflow
