// PyBind11 bindings for the tickflow core.
// Exposes the builder, engine facade, catalog and tick reports to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "catalog/pattern_catalog.hpp"
#include "engine/convergence_runner.hpp"
#include "engine/engine_config.hpp"
#include "engine/tick_executor.hpp"
#include "engine/workflow_engine.hpp"
#include "errors/errors.hpp"
#include "graph/graph_facts.hpp"
#include "graph/node.hpp"
#include "graph/workflow_builder.hpp"
#include "kernel/verb.hpp"
#include "verification/topology_validator.hpp"

namespace py = pybind11;

PYBIND11_MODULE(tickflow_bindings, m) {
    m.doc() = "tickflow C++ Core Bindings";

    // ── Exceptions ──
    auto engine_error = py::register_exception<tickflow::EngineError>(m, "EngineError");
    py::register_exception<tickflow::StructuralError>(m, "StructuralError", engine_error.ptr());
    py::register_exception<tickflow::AmbiguousPatternError>(m, "AmbiguousPatternError", engine_error.ptr());
    py::register_exception<tickflow::DivergenceError>(m, "DivergenceError", engine_error.ptr());

    // ── Enums ──
    py::enum_<tickflow::NodeKind>(m, "NodeKind")
        .value("Task", tickflow::NodeKind::Task)
        .value("Condition", tickflow::NodeKind::Condition)
        .value("InputCondition", tickflow::NodeKind::InputCondition)
        .value("OutputCondition", tickflow::NodeKind::OutputCondition);

    py::enum_<tickflow::ControlType>(m, "ControlType")
        .value("None_", tickflow::ControlType::None)
        .value("And", tickflow::ControlType::And)
        .value("Xor", tickflow::ControlType::Xor)
        .value("Or", tickflow::ControlType::Or);

    py::enum_<tickflow::Status>(m, "Status")
        .value("Pending", tickflow::Status::Pending)
        .value("Active", tickflow::Status::Active)
        .value("Completed", tickflow::Status::Completed)
        .value("Voided", tickflow::Status::Voided);

    py::enum_<tickflow::InstanceMode>(m, "InstanceMode")
        .value("None_", tickflow::InstanceMode::None)
        .value("Static", tickflow::InstanceMode::Static)
        .value("Dynamic", tickflow::InstanceMode::Dynamic)
        .value("Incremental", tickflow::InstanceMode::Incremental);

    py::enum_<tickflow::Verb>(m, "Verb")
        .value("Transmute", tickflow::Verb::Transmute)
        .value("Copy", tickflow::Verb::Copy)
        .value("Filter", tickflow::Verb::Filter)
        .value("Await", tickflow::Verb::Await)
        .value("Void", tickflow::Verb::Void);

    py::enum_<tickflow::CancellationScope>(m, "CancellationScope")
        .value("Self", tickflow::CancellationScope::Self)
        .value("Task", tickflow::CancellationScope::Task)
        .value("Instances", tickflow::CancellationScope::Instances)
        .value("Region", tickflow::CancellationScope::Region)
        .value("Case", tickflow::CancellationScope::Case);

    py::enum_<tickflow::DiagnosticKind>(m, "DiagnosticKind")
        .value("StructuralError", tickflow::DiagnosticKind::StructuralError)
        .value("AmbiguousPattern", tickflow::DiagnosticKind::AmbiguousPattern)
        .value("CancellationConflict", tickflow::DiagnosticKind::CancellationConflict)
        .value("Deadlock", tickflow::DiagnosticKind::Deadlock);

    // ── InstanceOptions ──
    py::class_<tickflow::InstanceOptions>(m, "InstanceOptions")
        .def(py::init<>())
        .def_readwrite("mode", &tickflow::InstanceOptions::mode)
        .def_readwrite("count", &tickflow::InstanceOptions::count)
        .def_readwrite("min", &tickflow::InstanceOptions::min)
        .def_readwrite("max", &tickflow::InstanceOptions::max)
        .def_readwrite("threshold", &tickflow::InstanceOptions::threshold)
        .def_readwrite("count_variable", &tickflow::InstanceOptions::count_variable)
        .def_readwrite("threshold_variable", &tickflow::InstanceOptions::threshold_variable)
        .def_readwrite("synchronize", &tickflow::InstanceOptions::synchronize)
        .def_readwrite("cancel_remaining", &tickflow::InstanceOptions::cancel_remaining);

    // ── Node ──
    py::class_<tickflow::Node>(m, "Node")
        .def(py::init<>())
        .def(py::init<std::string, tickflow::NodeKind>())
        .def_readwrite("id", &tickflow::Node::id)
        .def_readwrite("kind", &tickflow::Node::kind)
        .def_readwrite("split", &tickflow::Node::split)
        .def_readwrite("join", &tickflow::Node::join)
        .def_readwrite("status", &tickflow::Node::status)
        .def_readwrite("cancellation_targets", &tickflow::Node::cancellation_targets)
        .def_readwrite("instances", &tickflow::Node::instances)
        .def("set_attribute", &tickflow::Node::setAttribute)
        .def("get_attribute", &tickflow::Node::getAttribute,
             py::arg("key"), py::arg("default_val") = "")
        .def("has_attribute", &tickflow::Node::hasAttribute);

    // ── GraphFacts ──
    py::class_<tickflow::GraphFacts>(m, "GraphFacts")
        .def(py::init<>())
        .def_readwrite("nodes", &tickflow::GraphFacts::nodes)
        .def_property_readonly("flow_count", [](const tickflow::GraphFacts& g) { return g.flows.size(); })
        .def_property_readonly("fact_count", [](const tickflow::GraphFacts& g) { return g.facts.size(); });

    // ── WorkflowBuilder ──
    using B = tickflow::WorkflowBuilder;
    py::class_<B>(m, "WorkflowBuilder")
        .def(py::init<>())
        .def("task", &B::task, py::return_value_policy::reference_internal)
        .def("condition", &B::condition, py::return_value_policy::reference_internal)
        .def("input", &B::input, py::return_value_policy::reference_internal)
        .def("output", &B::output, py::arg("id"), py::arg("terminates_case") = false,
             py::return_value_policy::reference_internal)
        .def("split", &B::split, py::return_value_policy::reference_internal)
        .def("join", &B::join, py::return_value_policy::reference_internal)
        .def("completed", &B::completed, py::arg("with_token") = true,
             py::return_value_policy::reference_internal)
        .def("active", &B::active, py::arg("with_token") = true,
             py::return_value_policy::reference_internal)
        .def("cancels", &B::cancels, py::return_value_policy::reference_internal)
        .def("nests", &B::nests, py::return_value_policy::reference_internal)
        .def("quorum", &B::quorum, py::arg("n"), py::arg("blocking") = false,
             py::arg("cancel_remaining") = false, py::return_value_policy::reference_internal)
        .def("instances", &B::instances, py::return_value_policy::reference_internal)
        .def("flow", py::overload_cast<const std::string&, const std::string&>(&B::flow),
             py::return_value_policy::reference_internal)
        .def("guarded", &B::guarded, py::return_value_policy::reference_internal)
        .def("fallback", &B::fallback, py::return_value_policy::reference_internal)
        .def("variable", &B::variable, py::return_value_policy::reference_internal)
        .def("build", &B::build);

    // ── EngineConfig ──
    py::class_<tickflow::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("max_ticks", &tickflow::EngineConfig::max_ticks)
        .def_readwrite("log_level", &tickflow::EngineConfig::log_level)
        .def_readwrite("report_ambiguous", &tickflow::EngineConfig::report_ambiguous)
        .def_readwrite("drop_transient_signals", &tickflow::EngineConfig::drop_transient_signals)
        .def_readwrite("validate_on_load", &tickflow::EngineConfig::validate_on_load);

    // ── Reports ──
    py::class_<tickflow::Diagnostic>(m, "Diagnostic")
        .def_readonly("kind", &tickflow::Diagnostic::kind)
        .def_readonly("node_id", &tickflow::Diagnostic::node_id)
        .def_readonly("message", &tickflow::Diagnostic::message);

    py::class_<tickflow::Activation>(m, "Activation")
        .def_readonly("node", &tickflow::Activation::node)
        .def_readonly("pattern", &tickflow::Activation::pattern)
        .def_readonly("verb", &tickflow::Activation::verb);

    py::class_<tickflow::TickResult>(m, "TickResult")
        .def_readonly("tick_number", &tickflow::TickResult::tick_number)
        .def_readonly("delta_size", &tickflow::TickResult::delta_size)
        .def_readonly("converged", &tickflow::TickResult::converged)
        .def_readonly("activations", &tickflow::TickResult::activations)
        .def_readonly("diagnostics", &tickflow::TickResult::diagnostics)
        .def_property_readonly("delta", [](const tickflow::TickResult& r) { return r.delta.describe(); });

    py::class_<tickflow::DeadlockWarning>(m, "DeadlockWarning")
        .def_readonly("incomplete_outputs", &tickflow::DeadlockWarning::incomplete_outputs)
        .def_readonly("message", &tickflow::DeadlockWarning::message);

    py::class_<tickflow::RunReport>(m, "RunReport")
        .def_readonly("ticks", &tickflow::RunReport::ticks)
        .def_readonly("converged", &tickflow::RunReport::converged)
        .def_readonly("deadlock", &tickflow::RunReport::deadlock)
        .def("tick_count", &tickflow::RunReport::tickCount);

    // ── VerificationResult ──
    py::class_<tickflow::VerificationResult>(m, "VerificationResult")
        .def(py::init<>())
        .def_readwrite("passed", &tickflow::VerificationResult::passed)
        .def_readwrite("check_name", &tickflow::VerificationResult::check_name)
        .def_readwrite("message", &tickflow::VerificationResult::message)
        .def_readwrite("node_id", &tickflow::VerificationResult::node_id);

    // ── PatternInfo ──
    py::class_<tickflow::PatternInfo>(m, "PatternInfo")
        .def_readonly("number", &tickflow::PatternInfo::number)
        .def_readonly("name", &tickflow::PatternInfo::name)
        .def_readonly("category", &tickflow::PatternInfo::category)
        .def_readonly("verbs", &tickflow::PatternInfo::verbs);

    // ── ProvenanceObserver ──
    py::class_<tickflow::TickObserver, std::shared_ptr<tickflow::TickObserver>>(m, "TickObserver");
    py::class_<tickflow::ProvenanceObserver, tickflow::TickObserver,
               std::shared_ptr<tickflow::ProvenanceObserver>>(m, "ProvenanceObserver")
        .def(py::init<>())
        .def("fire_counts", &tickflow::ProvenanceObserver::fireCounts)
        .def("fires_of", &tickflow::ProvenanceObserver::firesOf)
        .def("total_activations", &tickflow::ProvenanceObserver::totalActivations)
        .def("clear", &tickflow::ProvenanceObserver::clear);

    // ── WorkflowEngine ──
    py::class_<tickflow::WorkflowEngine>(m, "WorkflowEngine")
        .def(py::init([](const tickflow::EngineConfig& config) {
            return std::make_unique<tickflow::WorkflowEngine>(config);
        }), py::arg("config") = tickflow::EngineConfig{})
        .def("load_topology", &tickflow::WorkflowEngine::loadTopology)
        .def("complete", &tickflow::WorkflowEngine::complete)
        .def("request_cancel", &tickflow::WorkflowEngine::requestCancel)
        .def("signal", &tickflow::WorkflowEngine::signal,
             py::arg("name"), py::arg("persistent") = false)
        .def("set_variable", &tickflow::WorkflowEngine::setVariable)
        .def("request_instance", &tickflow::WorkflowEngine::requestInstance,
             py::arg("parent"), py::arg("count") = 1)
        .def("seal_group", &tickflow::WorkflowEngine::sealGroup)
        .def("reset_join", &tickflow::WorkflowEngine::resetJoin)
        .def("step", &tickflow::WorkflowEngine::step)
        .def("run_to_completion",
             py::overload_cast<uint64_t>(&tickflow::WorkflowEngine::runToCompletion),
             py::arg("max_ticks"))
        .def("status_of", &tickflow::WorkflowEngine::statusOf)
        .def("snapshot_export", &tickflow::WorkflowEngine::snapshotExport)
        .def("tick_count", &tickflow::WorkflowEngine::tickCount)
        .def("add_observer", &tickflow::WorkflowEngine::addObserver);

    m.def("describe_patterns", []() {
        return tickflow::PatternCatalog::describe();
    });

    m.def("standard_mapping_names", []() {
        std::vector<std::string> names;
        for (const auto& mapping : tickflow::PatternCatalog::standard().mappings()) {
            names.push_back(mapping.name);
        }
        return names;
    });
}
