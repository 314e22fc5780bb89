#pragma once

#include "engine/tick_executor.hpp"
#include "errors/errors.hpp"
#include "graph/topology.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace tickflow {

/// Result of a run that reached a fixpoint.
struct RunReport {
    std::vector<TickResult> ticks;  // the final, empty tick included
    bool converged = false;
    std::optional<DeadlockWarning> deadlock;

    size_t tickCount() const { return ticks.size(); }
};

/// Repeats ticks until the delta is empty or the budget runs out.
class ConvergenceRunner {
public:
    using TickCallback = std::function<void(const TickResult&)>;

    explicit ConvergenceRunner(TickExecutor& executor)
        : executor_(executor) {}

    /// Throws DivergenceError when `max_ticks` ticks all changed the topology,
    /// std::invalid_argument for a zero budget.
    RunReport run(Topology& topology, uint64_t max_ticks, const TickCallback& on_tick = {});

    /// Output conditions that never completed, or nullopt when all did.
    static std::optional<DeadlockWarning> checkOutputs(const Topology& topology);

private:
    TickExecutor& executor_;
};

} // namespace tickflow
