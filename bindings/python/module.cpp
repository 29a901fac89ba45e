/*
  Pybind11 module exposing Mycelium-Core to Python.

  Notes:
    - Node id lists for apply_damage may be given as a Python sequence or an
      int32 NumPy array (C-contiguous).
    - Snapshot views are zero-copy float64/int32 arrays tied to the owning
      CompactGraph object.
    - Core exceptions map to Python classes deriving from GraphError, itself
      a RuntimeError.
    - Long-running entry points release the GIL. Only the built-in stderr log
      sink is reachable from Python, so nothing calls back into the
      interpreter while it is released.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <limits>
#include <span>
#include <string>

#include "mycelium/core/compact_graph.hpp"
#include "mycelium/core/engine.hpp"
#include "mycelium/core/error.hpp"
#include "mycelium/core/graph.hpp"
#include "mycelium/core/log.hpp"
#include "mycelium/core/metrics.hpp"
#include "mycelium/core/network_builder.hpp"
#include "mycelium/core/storage.hpp"
#include "mycelium/core/types.hpp"

namespace py = pybind11;
using namespace mycelium::core;

// Zero-copy 1-D view over data owned by `owner`.
template <typename T>
static py::array view_of(py::object owner, std::span<const T> s) {
  return py::array(
      py::buffer_info(
          const_cast<T*>(s.data()),
          sizeof(T),
          py::format_descriptor<T>::format(),
          1,
          { s.size() },
          { sizeof(T) }),
      owner);
}

static std::vector<NodeId> node_list(const py::object& obj) {
  if (py::isinstance<py::array>(obj)) {
    auto arr = py::cast<py::array>(obj);
    if (!py::isinstance<py::array_t<std::int32_t>>(arr)) throw py::type_error("node_ids: expected int32 array");
    if (!(arr.flags() & py::array::c_style)) {
      throw py::type_error("node_ids: array must be C-contiguous (use np.ascontiguousarray)");
    }
    auto buf = arr.request();
    if (buf.ndim != 1) throw py::type_error("node_ids must be a 1-D array");
    auto* ptr = static_cast<const std::int32_t*>(buf.ptr);
    return std::vector<NodeId>(ptr, ptr + buf.shape[0]);
  }
  return py::cast<std::vector<NodeId>>(obj);
}

PYBIND11_MODULE(_mycelium_core, m) {
  m.doc() = "Mycelium-Core C++ bindings";

  // Exceptions
  static py::exception<GraphError> graph_error(m, "GraphError", PyExc_RuntimeError);
  static py::exception<UnknownNode> unknown_node(m, "UnknownNode", graph_error.ptr());
  static py::exception<UnknownEndpoint> unknown_endpoint(m, "UnknownEndpoint", graph_error.ptr());
  static py::exception<DuplicateIdentifier> duplicate(m, "DuplicateIdentifier", graph_error.ptr());
  static py::exception<NotFound> not_found(m, "NotFound", graph_error.ptr());
  static py::exception<InvalidArgument> invalid(m, "InvalidArgument", graph_error.ptr());
  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const UnknownNode& e) {
      unknown_node(e.what());
    } catch (const UnknownEndpoint& e) {
      unknown_endpoint(e.what());
    } catch (const DuplicateIdentifier& e) {
      duplicate(e.what());
    } catch (const NotFound& e) {
      not_found(e.what());
    } catch (const InvalidArgument& e) {
      invalid(e.what());
    } catch (const GraphError& e) {
      graph_error(e.what());
    }
  });

  // Enums
  py::enum_<Health>(m, "Health")
      .value("HEALTHY", Health::Healthy)
      .value("DAMAGED", Health::Damaged);

  py::enum_<NodeKind>(m, "NodeKind")
      .value("SOURCE", NodeKind::Source)
      .value("INTERMEDIATE", NodeKind::Intermediate)
      .value("SINK", NodeKind::Sink);

  py::enum_<LogLevel>(m, "LogLevel")
      .value("DEBUG", LogLevel::Debug)
      .value("INFO", LogLevel::Info)
      .value("WARNING", LogLevel::Warning)
      .value("ERROR", LogLevel::Error)
      .value("OFF", LogLevel::Off);
  m.def("set_log_level", &set_log_level, py::arg("level"));
  m.def("log_level", &log_level);

  // Options
  py::class_<DiscoveryOptions>(m, "DiscoveryOptions")
      .def(py::init([](double penalty_multiplier, int max_attempts_per_path) {
        DiscoveryOptions o; o.penalty_multiplier = penalty_multiplier;
        o.max_attempts_per_path = max_attempts_per_path; o.validate(); return o;
      }),
        py::kw_only(),
        py::arg("penalty_multiplier") = 2.0,
        py::arg("max_attempts_per_path") = 3)
      .def_readwrite("penalty_multiplier", &DiscoveryOptions::penalty_multiplier)
      .def_readwrite("max_attempts_per_path", &DiscoveryOptions::max_attempts_per_path);

  py::class_<FlowOptions>(m, "FlowOptions")
      .def(py::init([](int round_limit, double reinforcement_rate, double min_reinforcement, double decay_rate) {
        FlowOptions o; o.round_limit = round_limit; o.reinforcement_rate = reinforcement_rate;
        o.min_reinforcement = min_reinforcement; o.decay_rate = decay_rate; o.validate(); return o;
      }),
        py::kw_only(),
        py::arg("round_limit") = 64,
        py::arg("reinforcement_rate") = 0.1,
        py::arg("min_reinforcement") = 0.5,
        py::arg("decay_rate") = 0.05)
      .def_readwrite("round_limit", &FlowOptions::round_limit)
      .def_readwrite("reinforcement_rate", &FlowOptions::reinforcement_rate)
      .def_readwrite("min_reinforcement", &FlowOptions::min_reinforcement)
      .def_readwrite("decay_rate", &FlowOptions::decay_rate);

  py::class_<RepairOptions>(m, "RepairOptions")
      .def(py::init([](int growth_budget, double growth_cost_penalty, double growth_capacity, bool redistribute) {
        RepairOptions o; o.growth_budget = growth_budget; o.growth_cost_penalty = growth_cost_penalty;
        o.growth_capacity = growth_capacity; o.redistribute_resources = redistribute; o.validate(); return o;
      }),
        py::kw_only(),
        py::arg("growth_budget") = 8,
        py::arg("growth_cost_penalty") = 1.0,
        py::arg("growth_capacity") = 5.0,
        py::arg("redistribute_resources") = true)
      .def_readwrite("growth_budget", &RepairOptions::growth_budget)
      .def_readwrite("growth_cost_penalty", &RepairOptions::growth_cost_penalty)
      .def_readwrite("growth_capacity", &RepairOptions::growth_capacity)
      .def_readwrite("redistribute_resources", &RepairOptions::redistribute_resources);

  py::class_<EngineOptions>(m, "EngineOptions")
      .def(py::init([](const DiscoveryOptions& d, const FlowOptions& f, const RepairOptions& r) {
        EngineOptions o; o.discovery = d; o.flow = f; o.repair = r; return o;
      }),
        py::kw_only(),
        py::arg("discovery") = DiscoveryOptions{},
        py::arg("flow") = FlowOptions{},
        py::arg("repair") = RepairOptions{})
      .def_readwrite("discovery", &EngineOptions::discovery)
      .def_readwrite("flow", &EngineOptions::flow)
      .def_readwrite("repair", &EngineOptions::repair);

  // Storage
  py::class_<StorageBackend, std::shared_ptr<StorageBackend>>(m, "StorageBackend");
  py::class_<MemoryStorage, StorageBackend, std::shared_ptr<MemoryStorage>>(m, "MemoryStorage")
      .def(py::init(&make_memory_storage))
      .def("node_count", &MemoryStorage::node_count)
      .def("edge_count", &MemoryStorage::edge_count)
      .def("call_count", &MemoryStorage::call_count)
      .def("has_node", [](const MemoryStorage& s, NodeId id){ return s.node(id).has_value(); }, py::arg("id"))
      .def("node_resource", [](const MemoryStorage& s, NodeId id) -> py::object {
        auto n = s.node(id);
        if (!n) return py::none();
        return py::float_(n->resource_level);
      }, py::arg("id"))
      .def("has_edge", [](const MemoryStorage& s, NodeId a, NodeId b){
        return s.edge(EdgeEndpoints{a, b}).has_value();
      }, py::arg("a"), py::arg("b"));

  // Graph model
  py::class_<Node>(m, "Node")
      .def_readonly("id", &Node::id)
      .def_readonly("resource_level", &Node::resource_level)
      .def_readonly("capacity", &Node::capacity)
      .def_readonly("health", &Node::health)
      .def_readonly("kind", &Node::kind)
      .def_property_readonly("degree", &Node::degree);

  py::class_<Edge>(m, "Edge")
      .def_readonly("id", &Edge::id)
      .def_property_readonly("endpoints", [](const Edge& e){ return py::make_tuple(e.endpoints.a, e.endpoints.b); })
      .def_readonly("base_cost", &Edge::base_cost)
      .def_readonly("reinforcement", &Edge::reinforcement)
      .def_property_readonly("effective_cost", &Edge::effective_cost)
      .def_readonly("capacity", &Edge::capacity)
      .def_readonly("usage_count", &Edge::usage_count)
      .def_readonly("health", &Edge::health)
      .def_readonly("grown", &Edge::grown);

  py::class_<Graph>(m, "Graph")
      .def(py::init<bool>(), py::kw_only(), py::arg("directed") = false)
      .def_property_readonly("directed", &Graph::directed)
      .def("attach_storage", &Graph::attach_storage, py::arg("storage"))
      .def("add_node", [](Graph& g, NodeId id, double resource_level, double capacity, NodeKind kind){
        NodeSpec s; s.resource_level = resource_level; s.capacity = capacity; s.kind = kind;
        g.add_node(id, s);
      }, py::arg("id"), py::kw_only(),
         py::arg("resource_level") = 0.0,
         py::arg("capacity") = std::numeric_limits<double>::infinity(),
         py::arg("kind") = NodeKind::Intermediate)
      .def("remove_node", &Graph::remove_node, py::arg("id"))
      .def("has_node", &Graph::has_node, py::arg("id"))
      .def("node", &Graph::node, py::arg("id"), py::return_value_policy::copy)
      .def("num_nodes", &Graph::num_nodes)
      .def("node_ids", &Graph::node_ids)
      .def("add_edge", [](Graph& g, NodeId a, NodeId b, double base_cost, double capacity){
        EdgeSpec s; s.base_cost = base_cost; s.capacity = capacity;
        return g.add_edge(a, b, s);
      }, py::arg("a"), py::arg("b"), py::kw_only(), py::arg("base_cost") = 1.0, py::arg("capacity") = 10.0)
      .def("remove_edge", py::overload_cast<EdgeId>(&Graph::remove_edge), py::arg("id"))
      .def("remove_edge_between", py::overload_cast<NodeId, NodeId>(&Graph::remove_edge), py::arg("a"), py::arg("b"))
      .def("has_edge", &Graph::has_edge, py::arg("a"), py::arg("b"))
      .def("find_edge", &Graph::find_edge, py::arg("a"), py::arg("b"))
      .def("edge", &Graph::edge, py::arg("id"), py::return_value_policy::copy)
      .def("num_edges", &Graph::num_edges)
      .def("edge_ids", &Graph::edge_ids)
      .def("neighbors", &Graph::neighbors, py::arg("id"))
      .def("set_node_resource", &Graph::set_node_resource, py::arg("id"), py::arg("level"))
      .def("adjust_node_resource", &Graph::adjust_node_resource, py::arg("id"), py::arg("delta"))
      .def("set_node_health", &Graph::set_node_health, py::arg("id"), py::arg("health"))
      .def("set_edge_health", &Graph::set_edge_health, py::arg("id"), py::arg("health"))
      .def("compact", [](const Graph& g, bool add_reverse){
        return CompactGraph::from_graph(g, add_reverse);
      }, py::kw_only(), py::arg("add_reverse") = false);

  py::class_<CompactGraph>(m, "CompactGraph")
      .def("num_nodes", &CompactGraph::num_nodes)
      .def("num_edges", &CompactGraph::num_edges)
      .def("num_arcs", &CompactGraph::num_arcs)
      .def("node_id_view", [](py::object self, const CompactGraph& g){ return view_of(self, g.node_id_view()); })
      .def("edge_id_view", [](py::object self, const CompactGraph& g){ return view_of(self, g.edge_id_view()); })
      .def("cost_view", [](py::object self, const CompactGraph& g){ return view_of(self, g.cost_view()); })
      .def("capacity_view", [](py::object self, const CompactGraph& g){ return view_of(self, g.capacity_view()); })
      .def("arc_src_view", [](py::object self, const CompactGraph& g){ return view_of(self, g.arc_src_view()); })
      .def("arc_dst_view", [](py::object self, const CompactGraph& g){ return view_of(self, g.arc_dst_view()); })
      .def("arc_edge_view", [](py::object self, const CompactGraph& g){ return view_of(self, g.arc_edge_view()); });

  // Results
  py::class_<Path>(m, "Path")
      .def_readonly("nodes", &Path::nodes)
      .def_readonly("edges", &Path::edges)
      .def_readonly("cost", &Path::cost)
      .def_property_readonly("hops", &Path::hops);

  py::class_<FlowReport>(m, "FlowReport")
      .def_readonly("total_supply", &FlowReport::total_supply)
      .def_readonly("total_demand", &FlowReport::total_demand)
      .def_readonly("delivered", &FlowReport::delivered)
      .def_readonly("remaining_supply", &FlowReport::remaining_supply)
      .def_readonly("unmet_demand", &FlowReport::unmet_demand)
      .def_readonly("edge_flows", &FlowReport::edge_flows)
      .def_readonly("shipped", &FlowReport::shipped)
      .def_readonly("received", &FlowReport::received)
      .def_readonly("rounds", &FlowReport::rounds)
      .def_readonly("placements", &FlowReport::placements)
      .def_readonly("converged", &FlowReport::converged);

  py::class_<RepairReport>(m, "RepairReport")
      .def_readonly("damaged_nodes", &RepairReport::damaged_nodes)
      .def_readonly("edges_added", &RepairReport::edges_added)
      .def_readonly("pairs_lost", &RepairReport::pairs_lost)
      .def_readonly("pairs_reconnected", &RepairReport::pairs_reconnected)
      .def_readonly("unreconnected_pairs", &RepairReport::unreconnected_pairs)
      .def_readonly("components_before", &RepairReport::components_before)
      .def_readonly("components_after_damage", &RepairReport::components_after_damage)
      .def_readonly("components_after_repair", &RepairReport::components_after_repair)
      .def_readonly("largest_ratio_after_damage", &RepairReport::largest_ratio_after_damage)
      .def_readonly("largest_ratio_after_repair", &RepairReport::largest_ratio_after_repair)
      .def_readonly("resources_redistributed", &RepairReport::resources_redistributed)
      .def_readonly("budget_exhausted", &RepairReport::budget_exhausted)
      .def_readonly("elapsed_seconds", &RepairReport::elapsed_seconds);

  py::class_<MetricsSnapshot>(m, "MetricsSnapshot")
      .def_readonly("component_count", &MetricsSnapshot::component_count)
      .def_readonly("largest_component_size", &MetricsSnapshot::largest_component_size)
      .def_readonly("largest_component_ratio", &MetricsSnapshot::largest_component_ratio)
      .def_readonly("average_path_length", &MetricsSnapshot::average_path_length)
      .def_readonly("node_count", &MetricsSnapshot::node_count)
      .def_readonly("healthy_node_count", &MetricsSnapshot::healthy_node_count)
      .def_readonly("damaged_node_count", &MetricsSnapshot::damaged_node_count)
      .def_readonly("edge_count", &MetricsSnapshot::edge_count)
      .def_readonly("healthy_edge_count", &MetricsSnapshot::healthy_edge_count)
      .def_readonly("total_resources", &MetricsSnapshot::total_resources)
      .def_readonly("last_repair_seconds", &MetricsSnapshot::last_repair_seconds);

  // Engine
  py::class_<ResilienceEngine>(m, "ResilienceEngine")
      .def(py::init<EngineOptions, bool>(),
           py::arg("options") = EngineOptions{}, py::kw_only(), py::arg("directed") = false)
      .def_property_readonly("graph", [](ResilienceEngine& e) -> Graph& { return e.graph(); },
                             py::return_value_policy::reference_internal)
      .def_property("options", &ResilienceEngine::options, &ResilienceEngine::set_options)
      .def("attach_storage", &ResilienceEngine::attach_storage, py::arg("storage"))
      .def("discover_paths", [](ResilienceEngine& e, NodeId src, NodeId dst, int k){
        py::gil_scoped_release rel;
        return e.discover_paths(src, dst, k);
      }, py::arg("source"), py::arg("target"), py::arg("k") = 3)
      .def("distribute_flow", [](ResilienceEngine& e, const FlowAmounts& sources, const FlowAmounts& sinks){
        py::gil_scoped_release rel;
        return e.distribute_flow(sources, sinks);
      }, py::arg("sources"), py::arg("sinks"))
      .def("apply_damage", [](ResilienceEngine& e, py::object node_ids){
        auto ids = node_list(node_ids);
        py::gil_scoped_release rel;
        return e.apply_damage(ids);
      }, py::arg("node_ids"))
      .def("metrics_snapshot", &ResilienceEngine::metrics_snapshot)
      .def_property_readonly("last_repair", &ResilienceEngine::last_repair);

  // Builder
  py::class_<NetworkSpec>(m, "NetworkSpec")
      .def(py::init<>())
      .def_readwrite("num_nodes", &NetworkSpec::num_nodes)
      .def_readwrite("connection_prob", &NetworkSpec::connection_prob)
      .def_readwrite("seed", &NetworkSpec::seed)
      .def_readwrite("min_resource", &NetworkSpec::min_resource)
      .def_readwrite("max_resource", &NetworkSpec::max_resource)
      .def_readwrite("min_cost", &NetworkSpec::min_cost)
      .def_readwrite("max_cost", &NetworkSpec::max_cost)
      .def_readwrite("min_capacity", &NetworkSpec::min_capacity)
      .def_readwrite("max_capacity", &NetworkSpec::max_capacity)
      .def_readwrite("num_sources", &NetworkSpec::num_sources)
      .def_readwrite("num_sinks", &NetworkSpec::num_sinks)
      .def_readwrite("first_id", &NetworkSpec::first_id);

  m.def("build_mycelium_network",
        [](Graph& g, std::int32_t num_nodes, double connection_prob, std::uint32_t seed) {
          NetworkSpec s; s.num_nodes = num_nodes; s.connection_prob = connection_prob; s.seed = seed;
          build_mycelium_network(g, s);
        }, py::arg("graph"), py::kw_only(), py::arg("num_nodes") = 20,
           py::arg("connection_prob") = 0.15, py::arg("seed") = 42);
  m.def("build_mycelium_network_from_spec",
        [](Graph& g, const NetworkSpec& s){ build_mycelium_network(g, s); },
        py::arg("graph"), py::arg("spec"));
}
