#include "engine/convergence_runner.hpp"
#include "log/log.hpp"
#include <stdexcept>

namespace tickflow {

RunReport ConvergenceRunner::run(Topology& topology, uint64_t max_ticks, const TickCallback& on_tick) {
    if (max_ticks == 0) {
        throw std::invalid_argument("Tick budget must be at least 1");
    }
    RunReport report;
    TICKFLOW_LOG_INFO("Run started: {} nodes, {} flows, budget {} ticks",
                      topology.nodeCount(), topology.flowCount(), max_ticks);

    for (uint64_t i = 0; i < max_ticks; i++) {
        TickResult tick = executor_.tick(topology);
        if (on_tick) on_tick(tick);
        bool done = tick.converged;
        report.ticks.push_back(std::move(tick));

        if (done) {
            report.converged = true;
            report.deadlock = checkOutputs(topology);
            if (report.deadlock) {
                TICKFLOW_LOG_WARN("{}", report.deadlock->message);
            }
            TICKFLOW_LOG_INFO("Run converged after {} ticks", report.ticks.size());
            return report;
        }
    }

    Delta last = report.ticks.empty() ? Delta{} : report.ticks.back().delta;
    TICKFLOW_LOG_ERROR("No fixpoint after {} ticks; last delta {}", max_ticks, last.describe());
    throw DivergenceError(max_ticks, std::move(last));
}

std::optional<DeadlockWarning> ConvergenceRunner::checkOutputs(const Topology& topology) {
    DeadlockWarning warning;
    topology.forEachNode([&](const Node& n) {
        if (n.kind == NodeKind::OutputCondition && n.status != Status::Completed) {
            warning.incomplete_outputs.push_back(n.id);
        }
    });
    if (warning.incomplete_outputs.empty()) return std::nullopt;

    warning.message = "Converged with incomplete output conditions:";
    for (const auto& id : warning.incomplete_outputs) {
        warning.message += " " + id;
    }
    return warning;
}

} // namespace tickflow
