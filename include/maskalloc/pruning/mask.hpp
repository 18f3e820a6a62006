#pragma once

#include "maskalloc/tensor.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace maskalloc {
namespace pruning {

/// Importance metric per layer name
using MetricMap = std::unordered_map<std::string, Tensor>;

/// Binary masks of one layer (1 = keep, 0 = prune), shaped like weight and bias
struct LayerMask {
    Tensor weight;
    std::optional<Tensor> bias;

    /// Element-wise product of the weight mask with a weight tensor
    Tensor apply(const Tensor& tensor) const;

    /// Kept weight elements
    int64_t count_nonzero() const;

    /// Pruned weight elements
    int64_t count_zeros() const;

    /// Pruned fraction of the weight
    double sparsity() const;
};

/// Masks of one compress round, keyed by layer name
using MaskSet = std::unordered_map<std::string, LayerMask>;

/// State carried from one round to the next (continuous-mask mode)
struct AllocationState {
    MaskSet previous_masks;

    /// Previous mask of a layer, nullptr on its first round
    const LayerMask* previous(const std::string& name) const;
};

/// Number of non-zero entries of a float32 tensor
int64_t count_nonzero(const Tensor& tensor);

/// target *= factor element-wise (shapes must match, both float32)
void multiply_inplace(Tensor& target, const Tensor& factor, const std::string& name);

/// Float32 {0,1} copy of a mask held as float32, bool or uint8
Tensor to_float_mask(const Tensor& mask, const std::string& name);

} // namespace pruning
} // namespace maskalloc
