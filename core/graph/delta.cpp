#include "graph/delta.hpp"
#include "errors/errors.hpp"
#include <map>
#include <sstream>

namespace tickflow {

// ─── Fact / Delta formatting ───────────────────────────────────

std::string Fact::describe() const {
    std::ostringstream out;
    out << toString(kind) << "(";
    switch (kind) {
        case FactKind::Status:
            out << node << "=" << toString(statusValue());
            break;
        case FactKind::Token:
            out << node;
            if (number >= 0) out << "#" << number;
            break;
        case FactKind::Arrival:
            out << key << "->" << node;
            break;
        case FactKind::Marker:
            out << node << "." << key << "=" << value;
            break;
        case FactKind::Signal:
            out << node << "," << value;
            break;
        case FactKind::Variable:
            out << node << "=" << value;
            break;
        case FactKind::Group:
        case FactKind::Seal:
            out << key << " of " << node;
            break;
        case FactKind::Instance:
            out << node << " in " << key;
            break;
    }
    out << ")";
    return out.str();
}

int64_t Delta::workBalance() const {
    int64_t balance = 0;
    for (const auto& f : additions) {
        if (f.isWork()) balance++;
    }
    for (const auto& f : removals) {
        if (f.isWork()) balance--;
    }
    return balance;
}

std::string Delta::describe() const {
    std::ostringstream out;
    out << "+{";
    bool first = true;
    for (const auto& f : additions) {
        out << (first ? "" : ", ") << f.describe();
        first = false;
    }
    out << "} -{";
    first = true;
    for (const auto& f : removals) {
        out << (first ? "" : ", ") << f.describe();
        first = false;
    }
    out << "}";
    return out.str();
}

// ─── Merge ─────────────────────────────────────────────────────

Delta DeltaMerger::merge(const std::vector<Contribution>& contributions,
                         std::vector<Diagnostic>& conflicts) {
    // A node voided this tick loses its own activation whole, including
    // any instances it spawned. A contribution that voids its own origin stays.
    std::set<NodeId> voided;
    for (const auto& c : contributions) {
        for (const auto& f : c.delta.additions) {
            if (f.kind == FactKind::Status && f.statusValue() == Status::Voided) {
                voided.insert(f.node);
            }
        }
    }

    Delta merged;
    for (const auto& c : contributions) {
        if (voided.count(c.origin) &&
            !c.delta.additions.count(Fact::status(c.origin, Status::Voided))) {
            conflicts.push_back({DiagnosticKind::CancellationConflict, c.origin,
                                 "Activation of " + c.origin + " overridden by " +
                                 toString(Status::Voided)});
            continue;
        }
        merged.additions.insert(c.delta.additions.begin(), c.delta.additions.end());
        merged.removals.insert(c.delta.removals.begin(), c.delta.removals.end());
    }

    // Same fact added and removed: the removal wins.
    for (auto it = merged.additions.begin(); it != merged.additions.end();) {
        if (merged.removals.count(*it)) {
            conflicts.push_back({DiagnosticKind::CancellationConflict, it->node,
                                 "Addition of " + it->describe() + " overridden by removal"});
            it = merged.additions.erase(it);
        } else {
            ++it;
        }
    }

    // Competing status changes on one node: the terminal-most status wins.
    std::map<NodeId, Status> winner;
    for (const auto& f : merged.additions) {
        if (f.kind != FactKind::Status) continue;
        auto w = winner.find(f.node);
        if (w == winner.end() || f.statusValue() > w->second) {
            winner[f.node] = f.statusValue();
        }
    }

    for (auto it = merged.additions.begin(); it != merged.additions.end();) {
        bool drop = false;
        auto w = winner.find(it->node);
        if (w != winner.end()) {
            if (it->kind == FactKind::Status && it->statusValue() != w->second) {
                drop = true;
            } else if (it->isWork() && w->second == Status::Voided) {
                drop = true;
            }
        }
        if (drop) {
            conflicts.push_back({DiagnosticKind::CancellationConflict, it->node,
                                 "Addition of " + it->describe() + " overridden by " +
                                 toString(w->second)});
            it = merged.additions.erase(it);
        } else {
            ++it;
        }
    }

    return merged;
}

} // namespace tickflow
