#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "maskalloc/pruning/allocator.hpp"
#include "maskalloc/pruning/config_list.hpp"
#include "maskalloc/pruning/metrics.hpp"
#include "maskalloc/pruning/pruner.hpp"

namespace py = pybind11;
using namespace maskalloc;
using namespace maskalloc::pruning;

void bind_pruning(py::module_& m) {
    auto pruning = m.def_submodule("pruning",
        "Sparsity mask allocation");

    // ========================================================================
    // Layer configuration
    // ========================================================================

    py::class_<SparsityConfig>(pruning, "SparsityConfig",
        "Resolved sparsity parameters of one layer")
        .def(py::init<>())
        .def_readwrite("total_sparsity", &SparsityConfig::total_sparsity)
        .def_readwrite("max_sparsity_per_layer", &SparsityConfig::max_sparsity_per_layer)
        .def_readwrite("dim", &SparsityConfig::dim)
        .def_readwrite("block_sparse_size", &SparsityConfig::block_sparse_size)
        .def("validate", &SparsityConfig::validate);

    py::class_<LayerSpec>(pruning, "LayerSpec",
        "Prunable layer geometry and budget")
        .def(py::init<>())
        .def_readwrite("name", &LayerSpec::name)
        .def_readwrite("op_type", &LayerSpec::op_type)
        .def_readwrite("weight_shape", &LayerSpec::weight_shape)
        .def_readwrite("bias_shape", &LayerSpec::bias_shape)
        .def_readwrite("group_id", &LayerSpec::group_id)
        .def_readwrite("config", &LayerSpec::config)
        .def("weight_numel", &LayerSpec::weight_numel)
        .def("__repr__", [](const LayerSpec& l) {
            return "LayerSpec(name='" + l.name + "', weight_shape=" +
                   shape_to_string(l.weight_shape) + ", group_id=" +
                   std::to_string(l.group_id) + ")";
        });

    py::class_<ModelSpec>(pruning, "ModelSpec",
        "Ordered set of prunable layers")
        .def(py::init<>())
        .def(py::init<std::vector<LayerSpec>>(), py::arg("layers"))
        .def("add_layer", &ModelSpec::add_layer, py::arg("layer"))
        .def_property_readonly("layers", &ModelSpec::layers)
        .def("at", &ModelSpec::at, py::arg("name"), py::return_value_policy::reference_internal)
        .def("groups", &ModelSpec::groups)
        .def("validate", &ModelSpec::validate)
        .def("__len__", &ModelSpec::size)
        .def("__contains__", &ModelSpec::contains);

    py::class_<ConfigEntry>(pruning, "ConfigEntry",
        "One entry of a pruning config list")
        .def(py::init<>())
        .def_readwrite("sparsity", &ConfigEntry::sparsity)
        .def_readwrite("sparsity_per_layer", &ConfigEntry::sparsity_per_layer)
        .def_readwrite("total_sparsity", &ConfigEntry::total_sparsity)
        .def_readwrite("max_sparsity_per_layer", &ConfigEntry::max_sparsity_per_layer)
        .def_readwrite("op_types", &ConfigEntry::op_types)
        .def_readwrite("op_names", &ConfigEntry::op_names)
        .def_readwrite("op_partial_names", &ConfigEntry::op_partial_names)
        .def_readwrite("exclude", &ConfigEntry::exclude)
        .def("validate", &ConfigEntry::validate);

    pruning.def("resolve_config_list", &resolve_config_list,
        py::arg("candidates"), py::arg("config_list"),
        "Resolve a config list into a ModelSpec");

    // ========================================================================
    // Masks
    // ========================================================================

    py::class_<LayerMask>(pruning, "LayerMask",
        "Binary weight (and bias) masks of one layer")
        .def(py::init<>())
        .def_readwrite("weight", &LayerMask::weight)
        .def_readwrite("bias", &LayerMask::bias)
        .def("apply", &LayerMask::apply, py::arg("tensor"))
        .def("count_nonzero", &LayerMask::count_nonzero)
        .def("count_zeros", &LayerMask::count_zeros)
        .def("sparsity", &LayerMask::sparsity);

    py::class_<AllocationState>(pruning, "AllocationState",
        "Masks carried over from the previous round")
        .def(py::init<>())
        .def_readwrite("previous_masks", &AllocationState::previous_masks);

    // ========================================================================
    // Dependency resolvers
    // ========================================================================

    py::class_<DependencyResolver, std::shared_ptr<DependencyResolver>>(pruning,
        "DependencyResolver", "Source of structural pruning constraints")
        .def("channel_dependency_sets", &DependencyResolver::channel_dependency_sets)
        .def("group_dependency_factors", &DependencyResolver::group_dependency_factors);

    py::class_<StaticDependencyResolver, DependencyResolver,
               std::shared_ptr<StaticDependencyResolver>>(pruning,
        "StaticDependencyResolver", "Constraints supplied by the caller")
        .def(py::init<DependencySets, GroupFactors>(),
             py::arg("channel_sets"), py::arg("group_factors") = GroupFactors{});

    // ========================================================================
    // Allocators
    // ========================================================================

    py::class_<SparsityAllocator>(pruning, "SparsityAllocator",
        "Turns importance metrics into masks")
        .def("generate_sparsity",
             py::overload_cast<const MetricMap&, const AllocationState&>(
                 &SparsityAllocator::generate_sparsity, py::const_),
             py::arg("metrics"), py::arg("state"))
        .def("generate_sparsity",
             py::overload_cast<const MetricMap&>(
                 &SparsityAllocator::generate_sparsity, py::const_),
             py::arg("metrics"))
        .def_property_readonly("name", &SparsityAllocator::name);

    pruning.def("create_allocator", &create_allocator,
        py::arg("model"), py::arg("options"), py::arg("resolver") = nullptr,
        "Build the allocator for options.mode");

    py::class_<NormMetricsCalculator>(pruning, "NormMetricsCalculator",
        "p-norm importance metric")
        .def(py::init<double, std::optional<std::vector<int64_t>>,
                      std::optional<std::vector<int64_t>>>(),
             py::arg("p") = 1.0, py::arg("dim") = py::none(),
             py::arg("block_sparse_size") = py::none())
        .def("calculate_metrics", &NormMetricsCalculator::calculate_metrics, py::arg("data"));

    // ========================================================================
    // Pruner
    // ========================================================================

    py::class_<PruningStats>(pruning, "PruningStats", "Statistics of the current masks")
        .def_readonly("total_params", &PruningStats::total_params)
        .def_readonly("nonzero_params", &PruningStats::nonzero_params)
        .def_readonly("overall_sparsity", &PruningStats::overall_sparsity)
        .def_readonly("layer_sparsity", &PruningStats::layer_sparsity)
        .def_readonly("group_sparsity", &PruningStats::group_sparsity)
        .def_property_readonly("compression_ratio", &PruningStats::compression_ratio);

    py::class_<SparsityPruner>(pruning, "SparsityPruner",
        "Runs compress rounds and keeps the mask history")
        .def(py::init<ModelSpec, AllocatorOptions, std::shared_ptr<DependencyResolver>>(),
             py::arg("model"), py::arg("options"), py::arg("resolver") = nullptr)
        .def("compress",
             py::overload_cast<const MetricMap&>(&SparsityPruner::compress),
             py::arg("metrics"))
        .def_property_readonly("masks", &SparsityPruner::masks)
        .def_property_readonly("rounds", &SparsityPruner::rounds)
        .def("reset", &SparsityPruner::reset)
        .def("apply", &SparsityPruner::apply, py::arg("layer"), py::arg("weight"))
        .def("get_stats", &SparsityPruner::get_stats)
        .def("export_report", &SparsityPruner::export_report);
}
