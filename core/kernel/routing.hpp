#pragma once

#include "graph/delta.hpp"
#include "graph/flow.hpp"
#include "graph/node.hpp"
#include "graph/topology.hpp"
#include <string>
#include <vector>

namespace tickflow {

// ─── Marker keys ───────────────────────────────────────────────

namespace markers {
inline constexpr const char* kJoinSpent = "join.spent";
inline constexpr const char* kJoinSeen = "join.seen";
inline constexpr const char* kJoinCancel = "join.cancel";
inline constexpr const char* kCancelRequest = "cancel.request";
inline constexpr const char* kCancelFired = "cancel.fired";
inline constexpr const char* kIterations = "iterations";
inline constexpr const char* kChoice = "choice";
inline constexpr const char* kInstancesFired = "mi.fired";
inline constexpr const char* kInstanceRequest = "mi.request";
} // namespace markers

// ─── Routing helpers shared by the verbs ───────────────────────

/// A target that collects work on its incoming arcs instead of taking
/// tokens directly: synchronizing joins and gated tasks.
bool isSynchronizing(const Node& node);

/// A completed predecessor whose only flow leads to the synchronizing
/// `target`; its token waits there for the target's Await.
bool isParkedOn(const Topology& view, const NodeId& pred, const NodeId& target);

/// Predecessors of `target` that have delivered work, in flow order.
std::vector<NodeId> satisfiedPredecessors(const Topology& view, const NodeId& target);

/// Withdraw the unit `pred` left for `target` (arrival or parked token).
void consumeFrom(const Topology& view, const NodeId& pred, const NodeId& target, Delta& delta);

/// Put a token on `id` and start it (conditions complete immediately).
void enable(const Topology& view, const NodeId& id, Delta& delta);

/// Send one unit of work along `flow`.
void deliver(const Topology& view, const Flow& flow, Delta& delta);

/// Replace a single-valued marker.
void setMarker(const Topology& view, const NodeId& id, const std::string& key,
               const std::string& value, Delta& delta);

/// Remove every value stored under a marker key.
void clearMarker(const Topology& view, const NodeId& id, const std::string& key, Delta& delta);

/// Integer value of a variable: a number, or the item count of a
/// comma-separated collection. Throws StructuralError when unset.
uint32_t variableCount(const Topology& view, const std::string& name, const NodeId& node);

} // namespace tickflow
