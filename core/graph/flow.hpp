#pragma once

#include "graph/node.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace tickflow {

using Variables = std::unordered_map<std::string, std::string>;

/// Boolean guard over case variables.
/// Grammar: `true | false | name | !name | name OP literal`, OP in == != < <= > >=.
/// Numeric comparison is used when both sides parse as numbers.
class Guard {
public:
    enum class Op : uint8_t { True, False, Truthy, Falsy, Eq, Ne, Lt, Le, Gt, Ge };

    Guard() = default;

    /// Parse a guard expression. Throws std::invalid_argument on bad syntax.
    static Guard parse(const std::string& expression);

    bool evaluate(const Variables& vars) const;

    const std::string& expression() const { return expression_; }
    Op op() const { return op_; }

    bool operator==(const Guard& o) const { return expression_ == o.expression_; }

private:
    Op op_ = Op::True;
    std::string variable_;
    std::string literal_;
    std::string expression_ = "true";
};

/// A directed arc source -> target.
struct Flow {
    NodeId source;
    NodeId target;
    std::optional<Guard> predicate;
    int32_t priority = 0;           // lower fires first
    bool is_default = false;        // taken when no guarded flow is true
    bool back_edge = false;         // loop-back arc
    std::string event;              // external event for deferred choice

    Flow() = default;
    Flow(NodeId source, NodeId target, int32_t priority = 0)
        : source(std::move(source)), target(std::move(target)), priority(priority) {}

    bool admits(const Variables& vars) const {
        return !predicate || predicate->evaluate(vars);
    }

    bool operator==(const Flow& o) const {
        return source == o.source && target == o.target && predicate == o.predicate &&
               priority == o.priority && is_default == o.is_default &&
               back_edge == o.back_edge && event == o.event;
    }
};

} // namespace tickflow
