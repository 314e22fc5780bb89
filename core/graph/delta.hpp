#pragma once

#include "graph/fact.hpp"
#include <set>
#include <string>
#include <vector>

namespace tickflow {

struct Diagnostic;

/// Represents a change between two generations of the topology.
/// Produced by one verb call, or by merging every call of a tick.
struct Delta {
    std::set<Fact> additions;
    std::set<Fact> removals;

    void add(const Fact& f) { additions.insert(f); }
    void remove(const Fact& f) { removals.insert(f); }

    /// Record a status change; no facts when from == to.
    void setStatus(const NodeId& node, Status from, Status to) {
        if (from == to) return;
        removals.insert(Fact::status(node, from));
        additions.insert(Fact::status(node, to));
    }

    size_t size() const { return additions.size() + removals.size(); }
    bool empty() const { return additions.empty() && removals.empty(); }

    /// Net change in units of work (tokens plus arrivals).
    int64_t workBalance() const;

    std::string describe() const;

    bool operator==(const Delta& o) const {
        return additions == o.additions && removals == o.removals;
    }
};

/// A delta tagged with the node whose activation produced it.
struct Contribution {
    NodeId origin;
    Delta delta;
};

/// Merges the deltas of one tick.
/// Set union with removal-wins. Conflicts are reported, never thrown.
class DeltaMerger {
public:
    static Delta merge(const std::vector<Contribution>& contributions,
                       std::vector<Diagnostic>& conflicts);
};

} // namespace tickflow
