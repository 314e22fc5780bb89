#pragma once

#include "graph/topology.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace tickflow {

/// Verification result for a single check.
struct VerificationResult {
    bool passed = false;
    std::string check_name;
    std::string message;
    NodeId node_id;                 // empty = graph-level
};

/// Load-time structural checks over a workflow net.
/// The built-in checks cover shapes the kernel would reject at run time;
/// callers may add their own constraints on top.
class TopologyValidator {
public:
    using ConstraintFn = std::function<std::vector<VerificationResult>(const Topology&)>;

    /// Built-in checks, then custom constraints. A single passing result
    /// is returned when nothing failed.
    std::vector<VerificationResult> check(const Topology& topology) const;

    void addConstraint(const std::string& name, ConstraintFn fn);
    size_t constraintCount() const { return constraints_.size(); }

    /// Only the failed results.
    static std::vector<VerificationResult> failures(const std::vector<VerificationResult>& results);

private:
    std::vector<std::pair<std::string, ConstraintFn>> constraints_;
};

} // namespace tickflow
