#pragma once

#include "maskalloc/tensor.hpp"
#include <cstdint>
#include <vector>

namespace maskalloc {
namespace pruning {

/// Number of elements to prune: floor(sparsity * numel)
int64_t prune_count(double sparsity, int64_t numel);

/// A value strictly below every element (keeps everything under `> threshold`)
float below_minimum(const std::vector<float>& values);

/// Exact prune/keep boundary: the largest of the `prune_num` smallest values.
///
/// prune_num == 0 yields below_minimum(values); prune_num larger than the
/// number of values is clamped, pruning every value. Elements equal to the
/// returned threshold are pruned too, so ties at the boundary remove at least
/// `prune_num` elements.
float select_threshold(std::vector<float> values, int64_t prune_num);

/// select_threshold over a float32 tensor
float select_threshold(const Tensor& metric, int64_t prune_num);

/// 1 where metric > threshold, 0 elsewhere (same shape as metric)
Tensor keep_above(const Tensor& metric, float threshold);

} // namespace pruning
} // namespace maskalloc
