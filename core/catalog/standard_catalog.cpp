#include "catalog/pattern_catalog.hpp"

namespace tickflow {

namespace {

VerbCall transmute() { return {Verb::Transmute, TransmuteParams{}}; }

VerbCall copy(Cardinality cardinality, uint32_t count = 0) {
    return {Verb::Copy, CopyParams{cardinality, count}};
}

VerbCall filter(SelectionMode mode, uint32_t max_iterations = 0) {
    return {Verb::Filter, FilterParams{mode, max_iterations}};
}

VerbCall await(Threshold threshold, CompletionStrategy strategy, bool reset_on_fire = true,
               Gate gate = Gate::None, uint32_t count = 0) {
    AwaitParams p;
    p.threshold = threshold;
    p.count = count;
    p.completion_strategy = strategy;
    p.reset_on_fire = reset_on_fire;
    p.gate = gate;
    return {Verb::Await, p};
}

VerbCall cancel(CancellationScope scope) { return {Verb::Void, VoidParams{scope}}; }

} // namespace

PatternCatalog PatternCatalog::standard() {
    using T = TriggerKind;
    using CS = CompletionStrategy;

    std::vector<PatternMapping> m = {
        // Pending cancellation outranks everything else on the node.
        {"CancelCase",          {20},     T::CaseCancelRequested,      cancel(CancellationScope::Case)},
        {"CancelTask",          {19, 26}, T::TaskCancelRequested,      cancel(CancellationScope::Task)},
        {"CancelRegion",        {25},     T::RegionCancelRequested,    cancel(CancellationScope::Region)},
        {"CancelInstances",     {27},     T::InstancesCancelRequested, cancel(CancellationScope::Instances)},
        {"CancelSelf",          {19},     T::SelfCancelRequested,      cancel(CancellationScope::Self)},
        {"CancellingJoin",      {29, 32}, T::JoinCancelPending,        cancel(CancellationScope::Region)},
        {"CancellingMIJoin",    {35},     T::InstancesCancelPending,   cancel(CancellationScope::Instances)},
        {"ExplicitTermination", {43},     T::ExplicitTermination,      cancel(CancellationScope::Case)},
        {"CancellationRegion",  {25},     T::CancellationRegion,       cancel(CancellationScope::Region)},

        // Multiple instances
        {"SpawnStatic",       {12, 13, 22, 42}, T::StaticInstances,      copy(Cardinality::Static),
         Binding::InstanceCount},
        {"SpawnDynamic",      {14},             T::DynamicInstances,     copy(Cardinality::Dynamic)},
        {"SpawnIncremental",  {15},             T::IncrementalInstances, copy(Cardinality::Incremental)},
        {"ExtendIncremental", {15},             T::InstanceRequested,    copy(Cardinality::Incremental)},
        {"InstancesDetached", {},               T::DetachedInstances,
         await(Threshold::Count, CS::WaitQuorum, false)},
        {"InstancesQuorum",   {34, 41},         T::InstanceQuorum,
         await(Threshold::Count, CS::WaitQuorum, false), Binding::InstanceThreshold},
        {"InstancesDynamicQuorum", {36},        T::DynamicInstanceQuorum,
         await(Threshold::Count, CS::WaitQuorum, false), Binding::InstanceThresholdVariable},
        {"InstancesAll",      {13, 14, 15},     T::InstanceGroup,        await(Threshold::All, CS::WaitAll)},

        // Gated tasks
        {"MutexGate",         {17, 39, 40}, T::MutexGate,             filter(SelectionMode::Mutex)},
        {"MilestoneGate",     {18},         T::MilestoneGate,
         await(Threshold::One, CS::WaitFirst, true, Gate::Milestone)},
        {"PersistentTrigger", {24},         T::PersistentTriggerGate,
         await(Threshold::One, CS::WaitFirst, true, Gate::Signal)},
        {"TransientTrigger",  {23},         T::TransientTriggerGate,
         await(Threshold::One, CS::WaitFirst, true, Gate::Signal)},

        // Joins, most specific first
        {"BlockingDiscriminator", {28, 29}, T::BlockingDiscriminator,
         await(Threshold::One, CS::WaitFirst, false)},
        {"Discriminator",         {9},      T::Discriminator,     await(Threshold::One, CS::WaitFirst)},
        {"BlockingPartialJoin",   {31, 32}, T::BlockingPartialJoin,
         await(Threshold::Count, CS::WaitQuorum, false), Binding::JoinQuorum},
        {"PartialJoin",           {30},     T::PartialJoin,
         await(Threshold::Count, CS::WaitQuorum), Binding::JoinQuorum},
        {"AndJoin",               {3, 33},  T::AndJoin,           await(Threshold::All, CS::WaitAll)},
        {"ReachabilityMerge",     {37, 38}, T::ReachabilityMerge,
         await(Threshold::Topology, CS::WaitActive)},
        {"OrJoin",                {7},      T::OrJoin,            await(Threshold::Active, CS::WaitActive)},

        // Routing out of a completed node
        {"DeferredChoice",  {16},        T::DeferredChoice, filter(SelectionMode::Deferred)},
        {"StructuredLoop",  {21},        T::BoundedLoop,    filter(SelectionMode::LoopCondition),
         Binding::LoopBound},
        {"ArbitraryCycle",  {10},        T::BackEdge,       filter(SelectionMode::LoopCondition)},
        {"AndSplit",        {2},         T::AndSplit,       copy(Cardinality::Topology)},
        {"XorSplit",        {4},         T::XorSplit,       filter(SelectionMode::ExactlyOne)},
        {"OrSplit",         {6},         T::OrSplit,        filter(SelectionMode::OneOrMore)},
        {"Sequence",        {1, 5, 8},   T::SingleFlow,     transmute()},
        {"ImplicitTermination", {11},    T::Sink,           cancel(CancellationScope::Self)},
    };
    return PatternCatalog(std::move(m));
}

} // namespace tickflow
