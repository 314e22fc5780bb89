#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace tickflow {

enum class Verb : uint8_t { Transmute, Copy, Filter, Await, Void };

enum class Cardinality : uint8_t { Topology, Static, Dynamic, Incremental };
enum class SelectionMode : uint8_t { ExactlyOne, OneOrMore, Deferred, Mutex, LoopCondition };
enum class Threshold : uint8_t { All, Active, One, Count, Topology };
enum class CompletionStrategy : uint8_t { WaitAll, WaitActive, WaitFirst, WaitQuorum };
enum class Gate : uint8_t { None, Milestone, Signal };
enum class CancellationScope : uint8_t { Self, Task, Instances, Region, Case };

const char* toString(Verb verb);
const char* toString(Cardinality c);
const char* toString(SelectionMode m);
const char* toString(Threshold t);
const char* toString(CompletionStrategy s);
const char* toString(CancellationScope s);

/// Parse a scope name ("self", "task", ...). Throws std::invalid_argument.
CancellationScope parseScope(const std::string& name);

// ─── Per-verb parameters ───────────────────────────────────────

struct TransmuteParams {
    bool operator==(const TransmuteParams&) const { return true; }
};

struct CopyParams {
    Cardinality cardinality = Cardinality::Topology;
    uint32_t count = 0;             // static(N)

    bool operator==(const CopyParams& o) const {
        return cardinality == o.cardinality && count == o.count;
    }
};

struct FilterParams {
    SelectionMode selection_mode = SelectionMode::ExactlyOne;
    uint32_t max_iterations = 0;    // loopCondition bound, 0 = unbounded

    bool operator==(const FilterParams& o) const {
        return selection_mode == o.selection_mode && max_iterations == o.max_iterations;
    }
};

struct AwaitParams {
    Threshold threshold = Threshold::All;
    uint32_t count = 0;             // N for Threshold::Count
    CompletionStrategy completion_strategy = CompletionStrategy::WaitAll;
    bool reset_on_fire = true;
    Gate gate = Gate::None;

    bool operator==(const AwaitParams& o) const {
        return threshold == o.threshold && count == o.count &&
               completion_strategy == o.completion_strategy &&
               reset_on_fire == o.reset_on_fire && gate == o.gate;
    }
};

struct VoidParams {
    CancellationScope cancellation_scope = CancellationScope::Self;

    bool operator==(const VoidParams& o) const {
        return cancellation_scope == o.cancellation_scope;
    }
};

using Parameters = std::variant<TransmuteParams, CopyParams, FilterParams, AwaitParams, VoidParams>;

/// A verb tag with its parameters, ready for the kernel.
struct VerbCall {
    Verb verb = Verb::Transmute;
    Parameters params;

    /// True when the parameter alternative matches the verb tag.
    bool consistent() const {
        return static_cast<size_t>(verb) == params.index();
    }

    bool operator==(const VerbCall& o) const { return verb == o.verb && params == o.params; }
};

} // namespace tickflow
