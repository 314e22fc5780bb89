#pragma once

#include "graph/fact.hpp"
#include "graph/flow.hpp"
#include "graph/node.hpp"
#include "instances/multi_instance_manager.hpp"
#include <cstdint>
#include <map>
#include <vector>

namespace tickflow {

/// Bulk exchange format for loading and exporting a topology.
/// Node statuses travel inside `nodes`; every other piece of marking
/// (tokens, arrivals, markers, signals, variables) travels in `facts`.
struct GraphFacts {
    std::vector<Node> nodes;
    std::vector<Flow> flows;
    std::vector<Fact> facts;
    std::vector<MultiInstanceGroup> groups;
    std::map<NodeId, uint32_t> group_generations;
};

} // namespace tickflow
