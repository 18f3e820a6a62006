#pragma once

#include "maskalloc/options.hpp"
#include "maskalloc/pruning/layer.hpp"
#include "maskalloc/pruning/mask.hpp"
#include <optional>
#include <vector>

namespace maskalloc {
namespace pruning {

/// How coarse a layer's metric is relative to its weight.
///
/// `dim` lists the weight axes the metric keeps (sorted); every other axis is
/// collapsed, so one metric value decides a whole slice. `block_sparse_size`
/// further groups the trailing metric axes into rectangular blocks.
struct MaskGranularity {
    std::optional<std::vector<int64_t>> dim;
    std::optional<std::vector<int64_t>> block_sparse_size;

    /// Derive the bias mask from the output-channel decision (dim == {0} only)
    bool mask_bias_with_output = true;

    /// True when the metric is collapsed along at least one weight axis
    bool reduces(size_t weight_rank) const;
};

/// Layer config overrides on top of the option defaults, checked against the weight rank.
/// Throws ConfigError on out-of-range axes or oversized blocks.
MaskGranularity resolve_granularity(const LayerSpec& layer, const AllocatorOptions& options);

/// Shape the layer's importance metric must have
std::vector<int64_t> metric_shape(const LayerSpec& layer, const MaskGranularity& granularity);

/// Reduce a full-resolution mask to metric granularity; a cell is 1 when any
/// element it stands for is still kept.
Tensor compress_mask(const Tensor& mask, const MaskGranularity& granularity);

/// Expand a metric-granularity decision back to weight (and bias) masks.
///
/// Block cells are repeated over their tile, partial trailing tiles are
/// cropped, and the pruned-axis decision is broadcast over every other axis.
LayerMask expand_mask(const Tensor& decision, const LayerSpec& layer,
                      const MaskGranularity& granularity);

} // namespace pruning
} // namespace maskalloc
