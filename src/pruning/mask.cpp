#include "maskalloc/pruning/mask.hpp"
#include "maskalloc/errors.hpp"

namespace maskalloc {
namespace pruning {

Tensor LayerMask::apply(const Tensor& tensor) const {
    if (tensor.shape() != weight.shape()) {
        throw ShapeMismatchError("weight", shape_to_string(weight.shape()),
                                 shape_to_string(tensor.shape()));
    }
    if (tensor.dtype() != DType::Float32) {
        throw std::invalid_argument("Mask can only be applied to float32 tensors");
    }

    Tensor result = tensor.clone();
    multiply_inplace(result, weight, "weight");
    return result;
}

int64_t LayerMask::count_nonzero() const {
    return pruning::count_nonzero(weight);
}

int64_t LayerMask::count_zeros() const {
    return weight.num_elements() - count_nonzero();
}

double LayerMask::sparsity() const {
    int64_t total = weight.num_elements();
    return total > 0 ? static_cast<double>(count_zeros()) / static_cast<double>(total) : 0.0;
}

const LayerMask* AllocationState::previous(const std::string& name) const {
    auto it = previous_masks.find(name);
    return it != previous_masks.end() ? &it->second : nullptr;
}

int64_t count_nonzero(const Tensor& tensor) {
    if (tensor.dtype() != DType::Float32) {
        throw std::invalid_argument("count_nonzero expects a float32 mask, got " +
                                    dtype_name(tensor.dtype()));
    }
    const float* data = tensor.data_ptr<float>();
    int64_t n = tensor.num_elements();
    if (n > 0 && data == nullptr) {
        throw std::runtime_error("Null data pointer in mask");
    }
    int64_t count = 0;
    for (int64_t i = 0; i < n; ++i) {
        if (data[i] != 0.0f) {
            count++;
        }
    }
    return count;
}

void multiply_inplace(Tensor& target, const Tensor& factor, const std::string& name) {
    if (target.shape() != factor.shape()) {
        throw ShapeMismatchError(name, shape_to_string(target.shape()),
                                 shape_to_string(factor.shape()));
    }
    if (target.dtype() != DType::Float32 || factor.dtype() != DType::Float32) {
        throw ConfigError("Mask arithmetic expects float32 operands, got " +
                          dtype_name(target.dtype()) + " and " + dtype_name(factor.dtype()),
                          name);
    }
    float* dst = target.data_ptr<float>();
    const float* src = factor.data_ptr<float>();
    int64_t n = target.num_elements();
    for (int64_t i = 0; i < n; ++i) {
        dst[i] *= src[i];
    }
}

Tensor to_float_mask(const Tensor& mask, const std::string& name) {
    switch (mask.dtype()) {
        case DType::Float32:
            return mask.clone();
        case DType::Bool:
        case DType::UInt8: {
            Tensor result(mask.shape(), DType::Float32);
            const uint8_t* src = mask.data_ptr<uint8_t>();
            float* dst = result.data_ptr<float>();
            int64_t n = mask.num_elements();
            for (int64_t i = 0; i < n; ++i) {
                dst[i] = src[i] != 0 ? 1.0f : 0.0f;
            }
            return result;
        }
        default:
            throw ConfigError("Mask must be float32, bool or uint8, got " +
                              dtype_name(mask.dtype()), name);
    }
}

} // namespace pruning
} // namespace maskalloc
