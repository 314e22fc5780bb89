#include "catalog/pattern_catalog.hpp"
#include <set>
#include <stdexcept>

namespace tickflow {

namespace {

bool strategyFits(const AwaitParams& p) {
    switch (p.threshold) {
        case Threshold::All:      return p.completion_strategy == CompletionStrategy::WaitAll;
        case Threshold::Active:
        case Threshold::Topology: return p.completion_strategy == CompletionStrategy::WaitActive;
        case Threshold::One:      return p.completion_strategy == CompletionStrategy::WaitFirst;
        case Threshold::Count:    return p.completion_strategy == CompletionStrategy::WaitQuorum;
    }
    return false;
}

bool bindingFits(const PatternMapping& m) {
    switch (m.binding) {
        case Binding::None:
            return true;
        case Binding::InstanceCount:
            return m.call.verb == Verb::Copy;
        case Binding::JoinQuorum:
        case Binding::InstanceThreshold:
        case Binding::InstanceThresholdVariable:
            return m.call.verb == Verb::Await;
        case Binding::LoopBound:
            return m.call.verb == Verb::Filter;
    }
    return false;
}

} // namespace

PatternCatalog::PatternCatalog(std::vector<PatternMapping> mappings)
    : mappings_(std::move(mappings)) {
    if (mappings_.empty()) {
        throw std::invalid_argument("Pattern catalog is empty");
    }

    std::set<std::string> names;
    for (const auto& m : mappings_) {
        if (m.name.empty()) {
            throw std::invalid_argument("Pattern mapping without a name");
        }
        if (!names.insert(m.name).second) {
            throw std::invalid_argument("Duplicate pattern mapping: " + m.name);
        }
        if (!m.call.consistent()) {
            throw std::invalid_argument("Mapping " + m.name + ": parameters do not match verb " +
                                        toString(m.call.verb));
        }
        if (auto* await = std::get_if<AwaitParams>(&m.call.params)) {
            if (!strategyFits(*await)) {
                throw std::invalid_argument("Mapping " + m.name + ": completion strategy " +
                                            toString(await->completion_strategy) +
                                            " does not fit threshold " + toString(await->threshold));
            }
        }
        if (!bindingFits(m)) {
            throw std::invalid_argument("Mapping " + m.name + ": binding does not fit verb");
        }
        for (int wcp : m.patterns) {
            const PatternInfo* pi = info(wcp);
            if (!pi) {
                throw std::invalid_argument("Mapping " + m.name + ": unknown pattern " +
                                            std::to_string(wcp));
            }
            bool allowed = false;
            for (Verb v : pi->verbs) {
                if (v == m.call.verb) allowed = true;
            }
            if (!allowed) {
                throw std::invalid_argument("Mapping " + m.name + ": verb " + toString(m.call.verb) +
                                            " does not realize WCP-" + std::to_string(wcp));
            }
        }
    }
}

const PatternMapping* PatternCatalog::find(const std::string& name) const {
    for (const auto& m : mappings_) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

std::vector<int> PatternCatalog::uncoveredPatterns() const {
    std::set<int> covered;
    for (const auto& m : mappings_) {
        covered.insert(m.patterns.begin(), m.patterns.end());
    }
    std::vector<int> missing;
    for (const auto& pi : describe()) {
        if (!covered.count(pi.number)) missing.push_back(pi.number);
    }
    return missing;
}

// ─── Reference table ───────────────────────────────────────────

const std::vector<PatternInfo>& PatternCatalog::describe() {
    using V = Verb;
    static const std::vector<PatternInfo> table = {
        {1,  "Sequence",                         "Basic Control Flow", {V::Transmute}},
        {2,  "Parallel Split",                   "Basic Control Flow", {V::Copy}},
        {3,  "Synchronization",                  "Basic Control Flow", {V::Await}},
        {4,  "Exclusive Choice",                 "Basic Control Flow", {V::Filter}},
        {5,  "Simple Merge",                     "Basic Control Flow", {V::Transmute}},
        {6,  "Multi-Choice",                     "Advanced Branching", {V::Filter}},
        {7,  "Structured Synchronizing Merge",   "Advanced Branching", {V::Await}},
        {8,  "Multi-Merge",                      "Advanced Branching", {V::Transmute}},
        {9,  "Structured Discriminator",         "Advanced Branching", {V::Await}},
        {10, "Arbitrary Cycles",                 "Structural",         {V::Filter}},
        {11, "Implicit Termination",             "Structural",         {V::Void}},
        {12, "MI without Synchronization",       "Multiple Instances", {V::Copy}},
        {13, "MI with Design-Time Knowledge",    "Multiple Instances", {V::Copy, V::Await}},
        {14, "MI with Runtime Knowledge",        "Multiple Instances", {V::Copy, V::Await}},
        {15, "MI without a priori Knowledge",    "Multiple Instances", {V::Copy, V::Await}},
        {16, "Deferred Choice",                  "State-Based",        {V::Filter}},
        {17, "Interleaved Parallel Routing",     "State-Based",        {V::Filter, V::Await}},
        {18, "Milestone",                        "State-Based",        {V::Await}},
        {19, "Cancel Task",                      "Cancellation",       {V::Void}},
        {20, "Cancel Case",                      "Cancellation",       {V::Void}},
        {21, "Structured Loop",                  "Iteration",          {V::Filter}},
        {22, "Recursion",                        "Iteration",          {V::Copy}},
        {23, "Transient Trigger",                "Trigger",            {V::Await}},
        {24, "Persistent Trigger",               "Trigger",            {V::Await}},
        {25, "Cancel Region",                    "Cancellation",       {V::Void}},
        {26, "Cancel MI Activity",               "Cancellation",       {V::Void}},
        {27, "Complete MI Activity",             "Cancellation",       {V::Void, V::Await}},
        {28, "Blocking Discriminator",           "Discriminator",      {V::Await}},
        {29, "Cancelling Discriminator",         "Discriminator",      {V::Await, V::Void}},
        {30, "Structured Partial Join",          "Partial Join",       {V::Await}},
        {31, "Blocking Partial Join",            "Partial Join",       {V::Await}},
        {32, "Cancelling Partial Join",          "Partial Join",       {V::Await, V::Void}},
        {33, "Generalized AND-Join",             "Partial Join",       {V::Await}},
        {34, "Static Partial Join for MI",       "MI Partial Join",    {V::Await}},
        {35, "Cancelling Partial Join for MI",   "MI Partial Join",    {V::Await, V::Void}},
        {36, "Dynamic Partial Join for MI",      "MI Partial Join",    {V::Await}},
        {37, "Local Synchronizing Merge",        "Advanced Sync",      {V::Await}},
        {38, "General Synchronizing Merge",      "Advanced Sync",      {V::Await}},
        {39, "Critical Section",                 "Advanced Sync",      {V::Filter, V::Await}},
        {40, "Interleaved Routing",              "Advanced Sync",      {V::Filter}},
        {41, "Thread Merge",                     "Advanced Sync",      {V::Await}},
        {42, "Thread Split",                     "Advanced Sync",      {V::Copy}},
        {43, "Explicit Termination",             "Termination",        {V::Void}},
    };
    return table;
}

const PatternInfo* PatternCatalog::info(int number) {
    const auto& table = describe();
    if (number < 1 || number > static_cast<int>(table.size())) return nullptr;
    return &table[number - 1];
}

} // namespace tickflow
