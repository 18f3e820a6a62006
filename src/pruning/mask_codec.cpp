#include "maskalloc/pruning/mask_codec.hpp"
#include "maskalloc/errors.hpp"
#include "reduce.hpp"
#include <algorithm>

namespace maskalloc {
namespace pruning {

namespace {

/// Binarize by "non-zero"
Tensor nonzero_mask(const Tensor& values) {
    Tensor result(values.shape(), DType::Float32);
    const float* src = values.data_ptr<float>();
    float* dst = result.data_ptr<float>();
    int64_t n = values.num_elements();
    for (int64_t i = 0; i < n; ++i) {
        dst[i] = src[i] != 0.0f ? 1.0f : 0.0f;
    }
    return result;
}

/// Metric shape before block pooling
std::vector<int64_t> unblocked_shape(const std::vector<int64_t>& weight_shape,
                                     const MaskGranularity& granularity) {
    if (!granularity.reduces(weight_shape.size())) {
        return weight_shape;
    }
    std::vector<int64_t> shape;
    for (int64_t d : *granularity.dim) {
        shape.push_back(weight_shape[static_cast<size_t>(d)]);
    }
    return shape;
}

/// Repeat each block cell over its tile, cropped to target_shape
Tensor repeat_blocks(const Tensor& decision, const std::vector<int64_t>& target_shape,
                     const std::vector<int64_t>& block) {
    Tensor result(target_shape, DType::Float32);
    size_t offset = target_shape.size() - block.size();

    const float* src = decision.data_ptr<float>();
    float* dst = result.data_ptr<float>();
    auto dst_strides = detail::row_major_strides(target_shape);
    auto src_strides = detail::row_major_strides(decision.shape());
    std::vector<int64_t> coords(target_shape.size(), 0);

    int64_t n = result.num_elements();
    for (int64_t i = 0; i < n; ++i) {
        detail::unravel(i, dst_strides, coords);
        int64_t src_idx = 0;
        for (size_t d = 0; d < coords.size(); ++d) {
            int64_t c = d >= offset ? coords[d] / block[d - offset] : coords[d];
            src_idx += c * src_strides[d];
        }
        dst[i] = src[src_idx];
    }
    return result;
}

/// Insert singleton axes for every weight axis outside dim, then broadcast
Tensor broadcast_to_weight(const Tensor& reduced, const std::vector<int64_t>& weight_shape,
                           const std::vector<int64_t>& dim) {
    Tensor result(weight_shape, DType::Float32);

    const float* src = reduced.data_ptr<float>();
    float* dst = result.data_ptr<float>();
    auto dst_strides = detail::row_major_strides(weight_shape);
    auto src_strides = detail::row_major_strides(reduced.shape());
    std::vector<int64_t> coords(weight_shape.size(), 0);

    int64_t n = result.num_elements();
    for (int64_t i = 0; i < n; ++i) {
        detail::unravel(i, dst_strides, coords);
        int64_t src_idx = 0;
        for (size_t k = 0; k < dim.size(); ++k) {
            src_idx += coords[static_cast<size_t>(dim[k])] * src_strides[k];
        }
        dst[i] = src[src_idx];
    }
    return result;
}

} // anonymous namespace

bool MaskGranularity::reduces(size_t weight_rank) const {
    return dim.has_value() && weight_rank > 1 && dim->size() != weight_rank;
}

MaskGranularity resolve_granularity(const LayerSpec& layer, const AllocatorOptions& options) {
    MaskGranularity granularity;
    granularity.dim = layer.config.dim.has_value() ? layer.config.dim : options.dim;
    granularity.block_sparse_size = layer.config.block_sparse_size.has_value()
        ? layer.config.block_sparse_size : options.block_sparse_size;
    granularity.mask_bias_with_output = options.mask_bias_with_output;

    size_t rank = layer.weight_shape.size();
    if (granularity.dim.has_value()) {
        auto& dim = *granularity.dim;
        std::sort(dim.begin(), dim.end());
        dim.erase(std::unique(dim.begin(), dim.end()), dim.end());
        for (int64_t axis : dim) {
            if (axis < 0 || static_cast<size_t>(axis) >= rank) {
                throw ConfigError("Pruning dim " + std::to_string(axis) +
                                  " is out of range for weight " +
                                  shape_to_string(layer.weight_shape), layer.name);
            }
        }
    }

    if (granularity.block_sparse_size.has_value()) {
        size_t metric_rank = unblocked_shape(layer.weight_shape, granularity).size();
        if (granularity.block_sparse_size->size() > metric_rank) {
            throw ConfigError("block_sparse_size " +
                              shape_to_string(*granularity.block_sparse_size) +
                              " has more axes than the metric (" +
                              std::to_string(metric_rank) + ")", layer.name);
        }
    }

    return granularity;
}

std::vector<int64_t> metric_shape(const LayerSpec& layer, const MaskGranularity& granularity) {
    auto shape = unblocked_shape(layer.weight_shape, granularity);
    if (granularity.block_sparse_size.has_value()) {
        shape = detail::block_pooled_shape(shape, *granularity.block_sparse_size);
    }
    return shape;
}

Tensor compress_mask(const Tensor& mask, const MaskGranularity& granularity) {
    if (mask.dtype() != DType::Float32) {
        throw std::invalid_argument("compress_mask expects a float32 mask, got " +
                                    dtype_name(mask.dtype()));
    }
    Tensor reduced;
    if (granularity.reduces(mask.ndim())) {
        reduced = detail::reduce_to_dims(mask, *granularity.dim,
                                         [](float v) { return v; });
    } else {
        reduced = mask.clone();
    }

    if (granularity.block_sparse_size.has_value()) {
        reduced = detail::block_average(reduced, *granularity.block_sparse_size);
    }

    return nonzero_mask(reduced);
}

LayerMask expand_mask(const Tensor& decision, const LayerSpec& layer,
                      const MaskGranularity& granularity) {
    auto expected = metric_shape(layer, granularity);
    if (decision.shape() != expected) {
        throw ShapeMismatchError(layer.name, shape_to_string(expected),
                                 shape_to_string(decision.shape()));
    }

    auto target = unblocked_shape(layer.weight_shape, granularity);
    Tensor reduced = granularity.block_sparse_size.has_value()
        ? repeat_blocks(decision, target, *granularity.block_sparse_size)
        : decision.clone();

    LayerMask result;
    if (!granularity.reduces(layer.weight_shape.size())) {
        result.weight = std::move(reduced);
        return result;
    }

    const auto& dim = *granularity.dim;
    result.weight = broadcast_to_weight(reduced, layer.weight_shape, dim);

    // Only an output-axis decision lines up 1:1 with the bias entries
    if (granularity.mask_bias_with_output && layer.bias_shape.has_value() &&
        dim.size() == 1 && dim[0] == 0 &&
        checked_product(*layer.bias_shape) == layer.weight_shape[0]) {
        result.bias = reduced.reshape(*layer.bias_shape);
    }

    return result;
}

} // namespace pruning
} // namespace maskalloc
