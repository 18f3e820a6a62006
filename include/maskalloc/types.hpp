#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>
#include <limits>

namespace maskalloc {

// ============================================================================
// Size Arithmetic
// ============================================================================

/// Overflow-safe multiplication for size calculations
/// Throws std::overflow_error if overflow would occur
inline int64_t checked_multiply(int64_t a, int64_t b) {
    if (a == 0 || b == 0) return 0;
    if (a < 0 || b < 0) {
        throw std::invalid_argument("Negative dimensions not allowed in size calculation");
    }
    if (a > std::numeric_limits<int64_t>::max() / b) {
        throw std::overflow_error("Integer overflow in size calculation");
    }
    return a * b;
}

/// Overflow-safe product of multiple values
inline int64_t checked_product(const std::vector<int64_t>& values) {
    int64_t result = 1;
    for (int64_t v : values) {
        result = checked_multiply(result, v);
    }
    return result;
}

/// Supported tensor data types
enum class DType : uint8_t {
    Float32 = 0,
    Float64 = 1,
    Int64 = 2,
    Int32 = 3,
    UInt8 = 4,
    Bool = 5
};

/// Get size in bytes for a data type
inline size_t dtype_size(DType dtype) {
    switch (dtype) {
        case DType::Float32: return 4;
        case DType::Float64: return 8;
        case DType::Int64: return 8;
        case DType::Int32: return 4;
        case DType::UInt8: return 1;
        case DType::Bool: return 1;
        default: throw std::invalid_argument("Unknown dtype");
    }
}

/// Convert dtype to string name
inline std::string dtype_name(DType dtype) {
    switch (dtype) {
        case DType::Float32: return "float32";
        case DType::Float64: return "float64";
        case DType::Int64: return "int64";
        case DType::Int32: return "int32";
        case DType::UInt8: return "uint8";
        case DType::Bool: return "bool";
        default: throw std::invalid_argument("Unknown dtype");
    }
}

/// Parse dtype from string name
inline DType dtype_from_name(const std::string& name) {
    if (name == "float32") return DType::Float32;
    if (name == "float64") return DType::Float64;
    if (name == "int64") return DType::Int64;
    if (name == "int32") return DType::Int32;
    if (name == "uint8") return DType::UInt8;
    if (name == "bool") return DType::Bool;
    throw std::invalid_argument("Unknown dtype name: " + name);
}

/// Tensor shape with optional dynamic dimensions
/// nullopt indicates a dynamic dimension
using Shape = std::vector<std::optional<int64_t>>;

/// Convert shape to string for debugging
inline std::string shape_to_string(const Shape& shape) {
    std::string result = "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) result += ", ";
        if (shape[i].has_value()) {
            result += std::to_string(shape[i].value());
        } else {
            result += "?";
        }
    }
    result += "]";
    return result;
}

/// Concrete shape overload
inline std::string shape_to_string(const std::vector<int64_t>& dims) {
    std::string result = "[";
    for (size_t i = 0; i < dims.size(); ++i) {
        if (i > 0) result += ", ";
        result += std::to_string(dims[i]);
    }
    result += "]";
    return result;
}

/// Check if shape has any dynamic dimensions
inline bool is_dynamic_shape(const Shape& shape) {
    for (const auto& dim : shape) {
        if (!dim.has_value()) return true;
    }
    return false;
}

/// Convert concrete shape vector to Shape type
inline Shape to_shape(const std::vector<int64_t>& dims) {
    Shape result;
    result.reserve(dims.size());
    for (auto d : dims) {
        result.push_back(d);
    }
    return result;
}

/// Convert Shape to concrete dimensions (throws if dynamic)
inline std::vector<int64_t> to_dims(const Shape& shape) {
    std::vector<int64_t> result;
    result.reserve(shape.size());
    for (const auto& dim : shape) {
        if (!dim.has_value()) {
            throw std::runtime_error("Cannot convert dynamic shape to concrete dimensions");
        }
        result.push_back(dim.value());
    }
    return result;
}

/// Graph input/output metadata
struct TensorInfo {
    std::string name;
    Shape shape;
    DType dtype = DType::Float32;

    TensorInfo() = default;
    TensorInfo(std::string n, Shape s, DType d = DType::Float32)
        : name(std::move(n)), shape(std::move(s)), dtype(d) {}

    bool is_dynamic() const { return is_dynamic_shape(shape); }
};

} // namespace maskalloc
