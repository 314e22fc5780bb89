#include "errors/errors.hpp"

namespace tickflow {

const char* toString(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::StructuralError:      return "StructuralError";
        case DiagnosticKind::AmbiguousPattern:     return "AmbiguousPattern";
        case DiagnosticKind::CancellationConflict: return "CancellationConflict";
        case DiagnosticKind::Deadlock:             return "Deadlock";
    }
    return "Unknown";
}

namespace {

std::vector<NodeId> nodesOf(const Delta& delta) {
    std::vector<NodeId> ids;
    for (const auto& f : delta.additions) {
        if (f.kind == FactKind::Status || f.kind == FactKind::Token) ids.push_back(f.node);
    }
    return ids;
}

} // namespace

DivergenceError::DivergenceError(uint64_t tick_count, Delta last_delta)
    : EngineError("No convergence after " + std::to_string(tick_count) +
                  " ticks; last delta: " + last_delta.describe(),
                  nodesOf(last_delta)),
      tick_count_(tick_count),
      last_delta_(std::move(last_delta)) {}

} // namespace tickflow
