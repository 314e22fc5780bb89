#include "kernel/verb.hpp"
#include <stdexcept>

namespace tickflow {

const char* toString(Verb verb) {
    switch (verb) {
        case Verb::Transmute: return "Transmute";
        case Verb::Copy:      return "Copy";
        case Verb::Filter:    return "Filter";
        case Verb::Await:     return "Await";
        case Verb::Void:      return "Void";
    }
    return "Unknown";
}

const char* toString(Cardinality c) {
    switch (c) {
        case Cardinality::Topology:    return "topology";
        case Cardinality::Static:      return "static";
        case Cardinality::Dynamic:     return "dynamic";
        case Cardinality::Incremental: return "incremental";
    }
    return "unknown";
}

const char* toString(SelectionMode m) {
    switch (m) {
        case SelectionMode::ExactlyOne:    return "exactlyOne";
        case SelectionMode::OneOrMore:     return "oneOrMore";
        case SelectionMode::Deferred:      return "deferred";
        case SelectionMode::Mutex:         return "mutex";
        case SelectionMode::LoopCondition: return "loopCondition";
    }
    return "unknown";
}

const char* toString(Threshold t) {
    switch (t) {
        case Threshold::All:      return "all";
        case Threshold::Active:   return "active";
        case Threshold::One:      return "1";
        case Threshold::Count:    return "N";
        case Threshold::Topology: return "topology";
    }
    return "unknown";
}

const char* toString(CompletionStrategy s) {
    switch (s) {
        case CompletionStrategy::WaitAll:    return "waitAll";
        case CompletionStrategy::WaitActive: return "waitActive";
        case CompletionStrategy::WaitFirst:  return "waitFirst";
        case CompletionStrategy::WaitQuorum: return "waitQuorum";
    }
    return "unknown";
}

const char* toString(CancellationScope s) {
    switch (s) {
        case CancellationScope::Self:      return "self";
        case CancellationScope::Task:      return "task";
        case CancellationScope::Instances: return "instances";
        case CancellationScope::Region:    return "region";
        case CancellationScope::Case:      return "case";
    }
    return "unknown";
}

CancellationScope parseScope(const std::string& name) {
    if (name == "self")      return CancellationScope::Self;
    if (name == "task")      return CancellationScope::Task;
    if (name == "instances") return CancellationScope::Instances;
    if (name == "region")    return CancellationScope::Region;
    if (name == "case")      return CancellationScope::Case;
    throw std::invalid_argument("Unknown cancellation scope: " + name);
}

} // namespace tickflow
