#pragma once

#include "graph/delta.hpp"
#include "graph/node.hpp"
#include "graph/topology.hpp"
#include "kernel/verb.hpp"

namespace tickflow {

/// The five elemental rewrite verbs.
/// Every verb is a pure function of (snapshot, subject, parameters): it reads
/// the view and returns the delta, and never touches the store itself.
/// Verbs throw StructuralError or AmbiguousPatternError for shapes they
/// cannot handle; the tick executor recovers per node.
class Kernel {
public:
    /// Dispatch on the verb tag.
    static Delta execute(const Topology& view, const Node& node, const VerbCall& call);

    /// Move the token along the single outgoing flow.
    static Delta transmute(const Topology& view, const Node& node, const TransmuteParams& params);

    /// Clone work onto every successor, or spawn multi-instance children.
    static Delta copy(const Topology& view, const Node& node, const CopyParams& params);

    /// Route work along a selected subset of outgoing flows.
    static Delta filter(const Topology& view, const Node& node, const FilterParams& params);

    /// Synchronize predecessors (or a multi-instance group) into one activation.
    static Delta await(const Topology& view, const Node& node, const AwaitParams& params);

    /// Withdraw work and mark nodes Voided according to the scope.
    static Delta cancel(const Topology& view, const Node& node, const VoidParams& params);

private:
    static Delta awaitJoin(const Topology& view, const Node& node, const AwaitParams& params);
    static Delta awaitInstances(const Topology& view, const Node& node, const AwaitParams& params);
    static Delta spawnInstances(const Topology& view, const Node& node, const CopyParams& params);
    static Delta selectMutex(const Topology& view, const Node& node);
};

} // namespace tickflow
