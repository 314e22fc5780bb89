#pragma once

#include "catalog/pattern_catalog.hpp"
#include "graph/node.hpp"
#include "graph/topology.hpp"
#include "kernel/verb.hpp"
#include <optional>

namespace tickflow {

/// The catalog entry chosen for a node, with parameters bound to node data.
struct Resolution {
    const PatternMapping* mapping = nullptr;
    VerbCall call;
};

/// Maps a node of a snapshot to the first matching catalog entry.
/// Resolution is a pure function of the snapshot and the node.
class PatternResolver {
public:
    explicit PatternResolver(const PatternCatalog& catalog)
        : catalog_(catalog) {}

    /// First matching entry, or nullopt when the node has nothing to do
    /// (or nothing matches). Throws StructuralError when parameters
    /// cannot be bound, e.g. an unset threshold variable.
    std::optional<Resolution> resolve(const Topology& view, const Node& node) const;

    /// True when the node holds work that some entry ought to handle.
    /// A node with pending work and no matching entry is ambiguous.
    static bool hasPendingActivation(const Topology& view, const Node& node);

    const PatternCatalog& catalog() const { return catalog_; }

private:
    VerbCall bind(const PatternMapping& mapping, const Topology& view, const Node& node) const;

    const PatternCatalog& catalog_;
};

} // namespace tickflow
