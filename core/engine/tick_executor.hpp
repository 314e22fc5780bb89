#pragma once

#include "catalog/pattern_catalog.hpp"
#include "engine/engine_config.hpp"
#include "errors/errors.hpp"
#include "graph/delta.hpp"
#include "graph/topology.hpp"
#include "resolver/pattern_resolver.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tickflow {

/// One node that produced a non-empty delta in a tick.
struct Activation {
    NodeId node;
    std::string pattern;            // catalog entry name
    Verb verb = Verb::Transmute;
};

/// Outcome of a single tick.
struct TickResult {
    uint64_t tick_number = 0;
    size_t delta_size = 0;          // |additions| + |removals| actually applied
    bool converged = false;         // delta_size == 0
    std::vector<Activation> activations;
    Delta delta;
    std::vector<Diagnostic> diagnostics;
};

/// Runs one synchronous round: every verb of the tick reads the same
/// snapshot, and all resulting deltas land in one atomic commit.
class TickExecutor {
public:
    TickExecutor(const PatternCatalog& catalog, const EngineConfig& config)
        : resolver_(catalog), config_(config) {}

    /// Collect, evaluate, merge, apply, measure.
    /// Per-node errors become diagnostics; the topology is never left half-applied.
    TickResult tick(Topology& topology);

    uint64_t tickCount() const { return tick_count_; }

    /// Nodes that failed load-time validation. Each tick reports them as
    /// structural errors and skips their activation; the rest of the net runs.
    void quarantine(std::map<NodeId, std::string> failures) { quarantined_ = std::move(failures); }
    const std::map<NodeId, std::string>& quarantined() const { return quarantined_; }

private:
    PatternResolver resolver_;
    EngineConfig config_;
    uint64_t tick_count_ = 0;
    std::map<NodeId, std::string> quarantined_;
};

} // namespace tickflow
