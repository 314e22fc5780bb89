#pragma once

#include "graph/node.hpp"
#include "graph/topology.hpp"
#include "kernel/verb.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tickflow {

/// Closed set of local shapes a catalog entry can match.
enum class TriggerKind : uint8_t {
    // Pending cancellation work
    CaseCancelRequested,
    TaskCancelRequested,
    RegionCancelRequested,
    InstancesCancelRequested,
    SelfCancelRequested,
    JoinCancelPending,
    InstancesCancelPending,
    ExplicitTermination,
    CancellationRegion,
    // Multi-instance activity
    StaticInstances,
    DynamicInstances,
    IncrementalInstances,
    InstanceRequested,
    DetachedInstances,
    InstanceQuorum,
    DynamicInstanceQuorum,
    InstanceGroup,
    // Gated tasks
    MutexGate,
    MilestoneGate,
    PersistentTriggerGate,
    TransientTriggerGate,
    // Joins
    BlockingDiscriminator,
    Discriminator,
    BlockingPartialJoin,
    PartialJoin,
    AndJoin,
    ReachabilityMerge,
    OrJoin,
    // Routing from a completed node
    DeferredChoice,
    BoundedLoop,
    BackEdge,
    AndSplit,
    XorSplit,
    OrSplit,
    SingleFlow,
    Sink
};

const char* toString(TriggerKind kind);

/// Evaluate one trigger against a node of the snapshot.
bool triggerMatches(TriggerKind kind, const Topology& view, const Node& node);

/// Node data copied into the parameters at resolution time.
enum class Binding : uint8_t {
    None,
    InstanceCount,              // CopyParams::count <- instances.count
    JoinQuorum,                 // AwaitParams::count <- join_options.quorum
    InstanceThreshold,          // AwaitParams::count <- instances.threshold
    InstanceThresholdVariable,  // AwaitParams::count <- variable instances.threshold_variable
    LoopBound                   // FilterParams::max_iterations <- max_iterations
};

/// One immutable catalog entry.
struct PatternMapping {
    std::string name;
    std::vector<int> patterns;      // WCP numbers realized by this entry
    TriggerKind trigger = TriggerKind::Sink;
    VerbCall call;
    Binding binding = Binding::None;
};

/// Reference data for one of the 43 workflow control patterns.
struct PatternInfo {
    int number = 0;
    std::string name;
    std::string category;
    std::vector<Verb> verbs;
};

/// Ordered, immutable table of pattern mappings.
/// Entries are evaluated in declaration order; earlier entries are more specific.
class PatternCatalog {
public:
    /// Throws std::invalid_argument for malformed entries.
    explicit PatternCatalog(std::vector<PatternMapping> mappings);

    /// The built-in table covering all 43 patterns.
    static PatternCatalog standard();

    /// Reference table of the 43 patterns, ordered by number.
    static const std::vector<PatternInfo>& describe();
    static const PatternInfo* info(int number);

    const std::vector<PatternMapping>& mappings() const { return mappings_; }
    size_t size() const { return mappings_.size(); }

    /// Lookup for reporting; resolution never goes through names.
    const PatternMapping* find(const std::string& name) const;

    /// WCP numbers no entry claims.
    std::vector<int> uncoveredPatterns() const;

private:
    std::vector<PatternMapping> mappings_;
};

} // namespace tickflow
