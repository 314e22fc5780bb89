#include "graph/flow.hpp"
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace tickflow {

namespace {

bool parseNumber(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end != nullptr && *end == '\0';
}

bool isTruthy(const std::string& value) {
    return !(value.empty() || value == "0" || value == "false" || value == "False");
}

std::string stripQuotes(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

} // namespace

Guard Guard::parse(const std::string& expression) {
    std::istringstream in(expression);
    std::vector<std::string> parts;
    std::string tok;
    while (in >> tok) parts.push_back(tok);

    Guard g;
    g.expression_ = expression;

    if (parts.size() == 1) {
        const std::string& p = parts[0];
        if (p == "true") {
            g.op_ = Op::True;
        } else if (p == "false") {
            g.op_ = Op::False;
        } else if (p[0] == '!' && p.size() > 1) {
            g.op_ = Op::Falsy;
            g.variable_ = p.substr(1);
        } else {
            g.op_ = Op::Truthy;
            g.variable_ = p;
        }
        return g;
    }

    if (parts.size() != 3) {
        throw std::invalid_argument("Malformed guard: '" + expression + "'");
    }

    const std::string& op = parts[1];
    if (op == "==")      g.op_ = Op::Eq;
    else if (op == "!=") g.op_ = Op::Ne;
    else if (op == "<")  g.op_ = Op::Lt;
    else if (op == "<=") g.op_ = Op::Le;
    else if (op == ">")  g.op_ = Op::Gt;
    else if (op == ">=") g.op_ = Op::Ge;
    else throw std::invalid_argument("Unknown guard operator '" + op + "' in '" + expression + "'");

    g.variable_ = parts[0];
    g.literal_ = stripQuotes(parts[2]);
    return g;
}

bool Guard::evaluate(const Variables& vars) const {
    switch (op_) {
        case Op::True:  return true;
        case Op::False: return false;
        default: break;
    }

    auto it = vars.find(variable_);
    if (op_ == Op::Truthy) return it != vars.end() && isTruthy(it->second);
    if (op_ == Op::Falsy) return it == vars.end() || !isTruthy(it->second);

    // An unset variable fails every comparison.
    if (it == vars.end()) return false;
    const std::string& value = it->second;

    double lhs = 0.0, rhs = 0.0;
    if (parseNumber(value, lhs) && parseNumber(literal_, rhs)) {
        switch (op_) {
            case Op::Eq: return lhs == rhs;
            case Op::Ne: return lhs != rhs;
            case Op::Lt: return lhs < rhs;
            case Op::Le: return lhs <= rhs;
            case Op::Gt: return lhs > rhs;
            case Op::Ge: return lhs >= rhs;
            default: return false;
        }
    }

    switch (op_) {
        case Op::Eq: return value == literal_;
        case Op::Ne: return value != literal_;
        case Op::Lt: return value < literal_;
        case Op::Le: return value <= literal_;
        case Op::Gt: return value > literal_;
        case Op::Ge: return value >= literal_;
        default: return false;
    }
}

} // namespace tickflow
