#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "maskalloc/types.hpp"
#include "maskalloc/options.hpp"
#include "maskalloc/errors.hpp"

namespace py = pybind11;
using namespace maskalloc;

void bind_types(py::module_& m) {
    // DType enum
    py::enum_<DType>(m, "DType", "Tensor data types")
        .value("Float32", DType::Float32, "32-bit floating point")
        .value("Float64", DType::Float64, "64-bit floating point")
        .value("Int64", DType::Int64, "64-bit signed integer")
        .value("Int32", DType::Int32, "32-bit signed integer")
        .value("UInt8", DType::UInt8, "8-bit unsigned integer")
        .value("Bool", DType::Bool, "Boolean")
        .export_values();

    // AllocatorMode enum
    py::enum_<AllocatorMode>(m, "AllocatorMode", "Sparsity allocation policies")
        .value("NORMAL", AllocatorMode::Normal, "Layer-local threshold")
        .value("BLOCK", AllocatorMode::Block, "Layer-local threshold over block scores")
        .value("GLOBAL", AllocatorMode::Global, "Shared budget per sparsity group")
        .value("DEPENDENCY_AWARE", AllocatorMode::DependencyAware,
               "Channel masks shared across coupled layers")
        .value("BALANCE", AllocatorMode::Balance, "Equal sparsity inside every bank")
        .export_values();

    m.def("mode_from_name", &mode_from_name, py::arg("name"),
          "Parse allocator mode from its config name");

    // TensorInfo
    py::class_<TensorInfo>(m, "TensorInfo", "Tensor metadata")
        .def(py::init<>())
        .def(py::init<std::string, Shape, DType>(),
             py::arg("name"), py::arg("shape"), py::arg("dtype") = DType::Float32)
        .def_readwrite("name", &TensorInfo::name)
        .def_readwrite("shape", &TensorInfo::shape)
        .def_readwrite("dtype", &TensorInfo::dtype)
        .def("is_dynamic", &TensorInfo::is_dynamic, "Check if tensor has dynamic dimensions")
        .def("__repr__", [](const TensorInfo& info) {
            return "TensorInfo(name='" + info.name + "', shape=" +
                   shape_to_string(info.shape) + ", dtype=" +
                   dtype_name(info.dtype) + ")";
        });

    // AllocatorOptions
    py::class_<AllocatorOptions>(m, "AllocatorOptions", "Sparsity allocator options")
        .def(py::init<>())
        .def_readwrite("mode", &AllocatorOptions::mode)
        .def_readwrite("continuous_mask", &AllocatorOptions::continuous_mask,
                       "Never re-grow weights pruned in an earlier round")
        .def_readwrite("dim", &AllocatorOptions::dim,
                       "Default pruning axes (None = element-wise)")
        .def_readwrite("block_sparse_size", &AllocatorOptions::block_sparse_size)
        .def_readwrite("balance_gran", &AllocatorOptions::balance_gran)
        .def_readwrite("mask_bias_with_output", &AllocatorOptions::mask_bias_with_output)
        .def_readwrite("verbose", &AllocatorOptions::verbose,
                       "Print allocation details to stdout")
        .def("validate", &AllocatorOptions::validate, "Validate options");

    // Exceptions
    py::register_exception<MaskAllocError>(m, "MaskAllocError",
        PyExc_RuntimeError);
    py::register_exception<ConfigError>(m, "ConfigError",
        m.attr("MaskAllocError").ptr());
    py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError",
        m.attr("MaskAllocError").ptr());
    py::register_exception<ValidationError>(m, "ValidationError",
        m.attr("MaskAllocError").ptr());
}
