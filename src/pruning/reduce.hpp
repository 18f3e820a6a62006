#pragma once

#include "maskalloc/tensor.hpp"
#include <cstdint>
#include <vector>

namespace maskalloc {
namespace pruning {
namespace detail {

/// Row-major strides of a shape
std::vector<int64_t> row_major_strides(const std::vector<int64_t>& shape);

/// Flat index -> coordinates
void unravel(int64_t flat, const std::vector<int64_t>& strides, std::vector<int64_t>& coords);

/// Sum over every axis not listed in keep_dims (sorted); output axes follow keep_dims.
/// `transform` is applied to each element before accumulation.
template<typename Fn>
Tensor reduce_to_dims(const Tensor& input, const std::vector<int64_t>& keep_dims, Fn transform);

/// Average over non-overlapping blocks of the trailing block.size() axes.
/// Edge blocks average over their in-range elements only.
Tensor block_average(const Tensor& input, const std::vector<int64_t>& block);

/// Shape after block pooling of the trailing axes (ceil division)
std::vector<int64_t> block_pooled_shape(const std::vector<int64_t>& shape,
                                        const std::vector<int64_t>& block);

// Template implementation
template<typename Fn>
Tensor reduce_to_dims(const Tensor& input, const std::vector<int64_t>& keep_dims, Fn transform) {
    const auto& in_shape = input.shape();
    std::vector<int64_t> out_shape;
    out_shape.reserve(keep_dims.size());
    for (int64_t d : keep_dims) {
        out_shape.push_back(in_shape[static_cast<size_t>(d)]);
    }

    Tensor result(out_shape, DType::Float32);
    const float* in = input.data_ptr<float>();
    float* out = result.data_ptr<float>();

    auto in_strides = row_major_strides(in_shape);
    auto out_strides = row_major_strides(out_shape);
    std::vector<int64_t> coords(in_shape.size(), 0);

    int64_t n = input.num_elements();
    for (int64_t i = 0; i < n; ++i) {
        unravel(i, in_strides, coords);
        int64_t out_idx = 0;
        for (size_t k = 0; k < keep_dims.size(); ++k) {
            out_idx += coords[static_cast<size_t>(keep_dims[k])] * out_strides[k];
        }
        out[out_idx] += transform(in[i]);
    }

    return result;
}

} // namespace detail
} // namespace pruning
} // namespace maskalloc
