#pragma once

#include "graph/delta.hpp"
#include "graph/node.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace tickflow {

// ─── Diagnostics ───────────────────────────────────────────────
// Recoverable problems collected per tick. Only divergence and invalid
// ingress escape the engine as exceptions.

enum class DiagnosticKind : uint8_t {
    StructuralError,
    AmbiguousPattern,
    CancellationConflict,
    Deadlock
};

const char* toString(DiagnosticKind kind);

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::StructuralError;
    NodeId node_id;             // empty = graph-level
    std::string message;
};

// ─── Exceptions ────────────────────────────────────────────────

class EngineError : public std::runtime_error {
public:
    EngineError(const std::string& message, std::vector<NodeId> nodes)
        : std::runtime_error(message), nodes_(std::move(nodes)) {}

    /// Offending node identifiers.
    const std::vector<NodeId>& nodes() const { return nodes_; }

private:
    std::vector<NodeId> nodes_;
};

/// Malformed topology or an illegal delta.
class StructuralError : public EngineError {
public:
    explicit StructuralError(const std::string& message, const NodeId& node = "")
        : EngineError(message, node.empty() ? std::vector<NodeId>{} : std::vector<NodeId>{node}) {}
};

/// A node shape that no catalog entry covers, or a verb invariant broken.
class AmbiguousPatternError : public EngineError {
public:
    explicit AmbiguousPatternError(const std::string& message, const NodeId& node = "")
        : EngineError(message, node.empty() ? std::vector<NodeId>{} : std::vector<NodeId>{node}) {}
};

/// No fixpoint within the tick budget.
class DivergenceError : public EngineError {
public:
    DivergenceError(uint64_t tick_count, Delta last_delta);

    uint64_t tickCount() const { return tick_count_; }
    const Delta& lastDelta() const { return last_delta_; }

private:
    uint64_t tick_count_;
    Delta last_delta_;
};

/// Converged, but some output conditions never completed.
struct DeadlockWarning {
    std::vector<NodeId> incomplete_outputs;
    std::string message;
};

} // namespace tickflow
