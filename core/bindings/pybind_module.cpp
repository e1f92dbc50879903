// PyBind11 bindings for the landscape core.
// Exposes the entity stores, both graphs, the distance cache and the
// double-ended connection driver to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "landscape/types.hpp"
#include "diagnostics/diagnostics.hpp"
#include "storage/entity_store.hpp"
#include "storage/memory_store.hpp"
#include "storage/sqlite_store.hpp"
#include "graph/connectivity_graph.hpp"
#include "distance/distance_config.hpp"
#include "distance/distance_function.hpp"
#include "distance/distance_cache.hpp"
#include "distance/distance_graph.hpp"
#include "connect/connect_config.hpp"
#include "connect/local_connector.hpp"
#include "connect/double_ended_connect.hpp"

namespace py = pybind11;

namespace {

// Lets Python classes implement the local connector.
class PyLocalConnector : public landscape::LocalConnector {
public:
    using landscape::LocalConnector::LocalConnector;

    landscape::LocalConnectResult connect(const landscape::Minimum& min1,
                                          const landscape::Minimum& min2) override {
        PYBIND11_OVERRIDE_PURE(landscape::LocalConnectResult, landscape::LocalConnector,
                               connect, min1, min2);
    }
};

} // namespace

PYBIND11_MODULE(landscape_bindings, m) {
    m.doc() = "Landscape C++ Core Bindings";

    // ── Minimum ──
    py::class_<landscape::Minimum>(m, "Minimum")
        .def(py::init<>())
        .def(py::init<landscape::MinimumId, double, std::vector<double>>(),
             py::arg("id"), py::arg("energy"), py::arg("coords") = std::vector<double>{})
        .def_readwrite("id", &landscape::Minimum::id)
        .def_readwrite("energy", &landscape::Minimum::energy)
        .def_readwrite("coords", &landscape::Minimum::coords);

    // ── TransitionState ──
    py::class_<landscape::TransitionState>(m, "TransitionState")
        .def(py::init<>())
        .def_readwrite("id", &landscape::TransitionState::id)
        .def_readwrite("energy", &landscape::TransitionState::energy)
        .def_readwrite("coords", &landscape::TransitionState::coords)
        .def_readwrite("minimum1", &landscape::TransitionState::minimum1)
        .def_readwrite("minimum2", &landscape::TransitionState::minimum2)
        .def("degenerate", &landscape::TransitionState::degenerate);

    // ── MinimumPair ──
    py::class_<landscape::MinimumPair>(m, "MinimumPair")
        .def(py::init<landscape::MinimumId, landscape::MinimumId>())
        .def_readonly("first", &landscape::MinimumPair::first)
        .def_readonly("second", &landscape::MinimumPair::second);

    // ── DistanceEntry ──
    py::class_<landscape::DistanceEntry>(m, "DistanceEntry")
        .def(py::init<landscape::MinimumPair, double>())
        .def_readwrite("pair", &landscape::DistanceEntry::pair)
        .def_readwrite("distance", &landscape::DistanceEntry::distance);

    // ── Diagnostics ──
    py::enum_<landscape::DiagnosticKind>(m, "DiagnosticKind")
        .value("DISTANCE_COMPUTED", landscape::DiagnosticKind::DISTANCE_COMPUTED)
        .value("MINIMUM_ADMITTED", landscape::DiagnosticKind::MINIMUM_ADMITTED)
        .value("ADMISSION_ROLLED_BACK", landscape::DiagnosticKind::ADMISSION_ROLLED_BACK)
        .value("INCONSISTENCY_REPAIRED", landscape::DiagnosticKind::INCONSISTENCY_REPAIRED)
        .value("DISTANCES_FLUSHED", landscape::DiagnosticKind::DISTANCES_FLUSHED)
        .value("MINIMA_MERGED", landscape::DiagnosticKind::MINIMA_MERGED);

    py::class_<landscape::DiagnosticEvent>(m, "DiagnosticEvent")
        .def(py::init<>())
        .def_readwrite("kind", &landscape::DiagnosticEvent::kind)
        .def_readwrite("minimum1", &landscape::DiagnosticEvent::minimum1)
        .def_readwrite("minimum2", &landscape::DiagnosticEvent::minimum2)
        .def_readwrite("value", &landscape::DiagnosticEvent::value);

    py::class_<landscape::Diagnostics>(m, "Diagnostics")
        .def(py::init([](bool console) {
                 return std::make_unique<landscape::Diagnostics>(
                     console ? landscape::Diagnostics::makeConsoleLogger()
                             : landscape::Diagnostics::makeNullLogger());
             }),
             py::arg("console") = false)
        .def("set_event_callback", &landscape::Diagnostics::setEventCallback)
        .def("count", &landscape::Diagnostics::count)
        .def("inconsistent_pass_streak", &landscape::Diagnostics::inconsistentPassStreak)
        .def("reset", &landscape::Diagnostics::reset);

    // ── Entity stores ──
    py::register_exception<landscape::StoreError>(m, "StoreError");
    py::register_exception<landscape::AdmissionError>(m, "AdmissionError");

    py::class_<landscape::EntityStore>(m, "EntityStore")
        .def("add_minimum", &landscape::EntityStore::addMinimum)
        .def("get_minimum", &landscape::EntityStore::getMinimum)
        .def("minima", &landscape::EntityStore::minima)
        .def("minimum_count", &landscape::EntityStore::minimumCount)
        .def("add_transition_state", &landscape::EntityStore::addTransitionState)
        .def("transition_states", &landscape::EntityStore::transitionStates)
        .def("merge_minima", &landscape::EntityStore::mergeMinima)
        .def("set_distance_bulk", &landscape::EntityStore::setDistanceBulk)
        .def("get_distance", &landscape::EntityStore::getDistance)
        .def("distances", &landscape::EntityStore::distances)
        .def("begin", &landscape::EntityStore::begin)
        .def("commit", &landscape::EntityStore::commit)
        .def("rollback", &landscape::EntityStore::rollback)
        .def("transaction_depth", &landscape::EntityStore::transactionDepth);

    py::class_<landscape::MemoryStore, landscape::EntityStore>(m, "MemoryStore")
        .def(py::init<double>(), py::arg("energy_accuracy") = 1e-3)
        .def("export_to_file", &landscape::MemoryStore::exportToFile)
        .def("import_from_file", &landscape::MemoryStore::importFromFile)
        .def("clear", &landscape::MemoryStore::clear);

    py::class_<landscape::SqliteStore, landscape::EntityStore>(m, "SqliteStore")
        .def(py::init<std::string, double>(),
             py::arg("path"), py::arg("energy_accuracy") = 1e-3);

    // ── ConnectivityGraph ──
    py::class_<landscape::ConnectivityGraph>(m, "ConnectivityGraph")
        .def(py::init<>())
        .def_static("from_store", &landscape::ConnectivityGraph::fromStore)
        .def("add_minimum", &landscape::ConnectivityGraph::addMinimum)
        .def("has_minimum", &landscape::ConnectivityGraph::hasMinimum)
        .def("get_minimum_ids", &landscape::ConnectivityGraph::getMinimumIds)
        .def("add_transition_state", &landscape::ConnectivityGraph::addTransitionState)
        .def("neighbors", &landscape::ConnectivityGraph::neighbors)
        .def("are_connected", &landscape::ConnectivityGraph::areConnected)
        .def("component_count", &landscape::ConnectivityGraph::componentCount)
        .def("path", &landscape::ConnectivityGraph::path);

    // ── Distance functions ──
    py::class_<landscape::Alignment>(m, "Alignment")
        .def(py::init<>())
        .def_readwrite("distance", &landscape::Alignment::distance)
        .def_readwrite("coords1", &landscape::Alignment::coords1)
        .def_readwrite("coords2", &landscape::Alignment::coords2);

    py::class_<landscape::DistanceFunction>(m, "DistanceFunction")
        .def("compute", &landscape::DistanceFunction::compute)
        .def("name", &landscape::DistanceFunction::name);

    py::class_<landscape::CartesianDistance, landscape::DistanceFunction>(m, "CartesianDistance")
        .def(py::init<>());

    py::class_<landscape::CallbackDistance, landscape::DistanceFunction>(m, "CallbackDistance")
        .def(py::init<landscape::CallbackDistance::Fn, std::string>(),
             py::arg("fn"), py::arg("name") = "callback");

    // ── Configuration ──
    py::enum_<landscape::AdmissionMode>(m, "AdmissionMode")
        .value("START_END_ONLY", landscape::AdmissionMode::START_END_ONLY)
        .value("RELEVANT", landscape::AdmissionMode::RELEVANT)
        .value("ALL", landscape::AdmissionMode::ALL);

    py::class_<landscape::InitOptions>(m, "InitOptions")
        .def(py::init<>())
        .def_readwrite("mode", &landscape::InitOptions::mode)
        .def_readwrite("load_no_distances", &landscape::InitOptions::load_no_distances);

    py::class_<landscape::DistanceGraphConfig>(m, "DistanceGraphConfig")
        .def(py::init<>())
        .def_readwrite("infinite_weight", &landscape::DistanceGraphConfig::infinite_weight)
        .def_readwrite("zero_weight_tolerance", &landscape::DistanceGraphConfig::zero_weight_tolerance)
        .def_readwrite("path_zero_tolerance", &landscape::DistanceGraphConfig::path_zero_tolerance)
        .def_readwrite("defer_database_update", &landscape::DistanceGraphConfig::defer_database_update)
        .def_readwrite("db_update_min", &landscape::DistanceGraphConfig::db_update_min)
        .def_readwrite("verbosity", &landscape::DistanceGraphConfig::verbosity);

    py::class_<landscape::ConnectConfig>(m, "ConnectConfig")
        .def(py::init<>())
        .def_readwrite("graph", &landscape::ConnectConfig::graph)
        .def_readwrite("init", &landscape::ConnectConfig::init)
        .def_readwrite("max_attempts", &landscape::ConnectConfig::max_attempts)
        .def_readwrite("budget_seconds", &landscape::ConnectConfig::budget_seconds)
        .def_readwrite("merge_minima", &landscape::ConnectConfig::merge_minima)
        .def_readwrite("max_dist_merge", &landscape::ConnectConfig::max_dist_merge)
        .def_readwrite("consistency_check_interval",
                       &landscape::ConnectConfig::consistency_check_interval);

    // ── DistanceCache ──
    py::class_<landscape::DistanceCache>(m, "DistanceCache")
        .def(py::init<landscape::EntityStore&, const landscape::DistanceFunction&,
                      landscape::Diagnostics&, landscape::DistanceGraphConfig>(),
             py::arg("store"), py::arg("distance_fn"), py::arg("diagnostics"),
             py::arg("config") = landscape::DistanceGraphConfig{},
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>(), py::keep_alive<1, 4>())
        .def("get", &landscape::DistanceCache::get)
        .def("get_or_compute", &landscape::DistanceCache::getOrCompute)
        .def("flush", &landscape::DistanceCache::flush, py::arg("force") = false)
        .def("warm", &landscape::DistanceCache::warm)
        .def("size", &landscape::DistanceCache::size)
        .def("pending_count", &landscape::DistanceCache::pendingCount)
        .def("compute_count", &landscape::DistanceCache::computeCount);

    // ── DistanceGraph ──
    py::class_<landscape::WeightedPath>(m, "WeightedPath")
        .def(py::init<>())
        .def_readwrite("nodes", &landscape::WeightedPath::nodes)
        .def_readwrite("weights", &landscape::WeightedPath::weights)
        .def("total_weight", &landscape::WeightedPath::totalWeight)
        .def("weakest_link", &landscape::WeightedPath::weakestLink)
        .def("weakest_link_weight", &landscape::WeightedPath::weakestLinkWeight);

    py::class_<landscape::ConsistencyReport>(m, "ConsistencyReport")
        .def(py::init<>())
        .def_readwrite("edges_checked", &landscape::ConsistencyReport::edges_checked)
        .def_readwrite("redundant_zeroed", &landscape::ConsistencyReport::redundant_zeroed)
        .def_readwrite("connected_repaired", &landscape::ConsistencyReport::connected_repaired)
        .def_readwrite("disconnected_repaired", &landscape::ConsistencyReport::disconnected_repaired)
        .def("consistent", &landscape::ConsistencyReport::consistent);

    py::class_<landscape::DistanceGraph>(m, "DistanceGraph")
        .def(py::init<landscape::EntityStore&, const landscape::ConnectivityGraph&,
                      landscape::DistanceCache&, landscape::Diagnostics&>(),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>(),
             py::keep_alive<1, 4>(), py::keep_alive<1, 5>())
        .def("initialize", &landscape::DistanceGraph::initialize,
             py::arg("start"), py::arg("end"), py::arg("options") = landscape::InitOptions{})
        .def("set_connectivity_graph", &landscape::DistanceGraph::setConnectivityGraph,
             py::keep_alive<1, 2>())
        .def("admit", &landscape::DistanceGraph::admit)
        .def("shortest_path", &landscape::DistanceGraph::shortestPath)
        .def("mark_connected", &landscape::DistanceGraph::markConnected)
        .def("mark_unproductive", &landscape::DistanceGraph::markUnproductive)
        .def("merge", &landscape::DistanceGraph::merge)
        .def("check_consistency", &landscape::DistanceGraph::checkConsistency)
        .def("flush_pending", &landscape::DistanceGraph::flushPending, py::arg("force") = false)
        .def("has_node", &landscape::DistanceGraph::hasNode)
        .def("get_node_ids", &landscape::DistanceGraph::getNodeIds)
        .def("node_count", &landscape::DistanceGraph::nodeCount)
        .def("edge_count", &landscape::DistanceGraph::edgeCount)
        .def("weight", &landscape::DistanceGraph::weight);

    // ── Double-ended connect ──
    py::class_<landscape::FoundMinimum>(m, "FoundMinimum")
        .def(py::init<>())
        .def_readwrite("energy", &landscape::FoundMinimum::energy)
        .def_readwrite("coords", &landscape::FoundMinimum::coords);

    py::class_<landscape::FoundTransitionState>(m, "FoundTransitionState")
        .def(py::init<>())
        .def_readwrite("energy", &landscape::FoundTransitionState::energy)
        .def_readwrite("coords", &landscape::FoundTransitionState::coords)
        .def_readwrite("minimum1", &landscape::FoundTransitionState::minimum1)
        .def_readwrite("minimum2", &landscape::FoundTransitionState::minimum2);

    py::class_<landscape::LocalConnectResult>(m, "LocalConnectResult")
        .def(py::init<>())
        .def_readwrite("success", &landscape::LocalConnectResult::success)
        .def_readwrite("transition_states", &landscape::LocalConnectResult::transition_states);

    py::class_<landscape::LocalConnector, PyLocalConnector>(m, "LocalConnector")
        .def(py::init<>())
        .def("connect", &landscape::LocalConnector::connect);

    py::class_<landscape::ConnectResult>(m, "ConnectResult")
        .def(py::init<>())
        .def_readwrite("success", &landscape::ConnectResult::success)
        .def_readwrite("attempts", &landscape::ConnectResult::attempts)
        .def_readwrite("merges", &landscape::ConnectResult::merges)
        .def_readwrite("transition_states_added", &landscape::ConnectResult::transition_states_added)
        .def_readwrite("minima_added", &landscape::ConnectResult::minima_added)
        .def_readwrite("path", &landscape::ConnectResult::path)
        .def_readwrite("elapsed_seconds", &landscape::ConnectResult::elapsed_seconds)
        .def_readwrite("budget_exhausted", &landscape::ConnectResult::budget_exhausted);

    py::class_<landscape::DoubleEndedConnect>(m, "DoubleEndedConnect")
        .def(py::init<landscape::EntityStore&, const landscape::DistanceFunction&,
                      landscape::LocalConnector&, landscape::DuplicatePredicate,
                      landscape::ConnectConfig, landscape::Diagnostics&>(),
             py::arg("store"), py::arg("distance_fn"), py::arg("connector"),
             py::arg("is_duplicate"), py::arg("config"), py::arg("diagnostics"),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>(),
             py::keep_alive<1, 4>(), py::keep_alive<1, 7>())
        .def("run", &landscape::DoubleEndedConnect::run)
        .def("connectivity_graph", &landscape::DoubleEndedConnect::connectivityGraph,
             py::return_value_policy::reference_internal)
        .def("distance_graph", &landscape::DoubleEndedConnect::distanceGraph,
             py::return_value_policy::reference_internal);
}
