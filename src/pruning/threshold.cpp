#include "maskalloc/pruning/threshold.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace maskalloc {
namespace pruning {

int64_t prune_count(double sparsity, int64_t numel) {
    if (numel <= 0 || sparsity <= 0.0) {
        return 0;
    }
    return static_cast<int64_t>(std::floor(sparsity * static_cast<double>(numel)));
}

float below_minimum(const std::vector<float>& values) {
    if (values.empty()) {
        return std::numeric_limits<float>::lowest();
    }
    float min_value = *std::min_element(values.begin(), values.end());
    // min - 1 collapses onto min for large magnitudes
    return std::min(min_value - 1.0f,
                    std::nextafter(min_value, -std::numeric_limits<float>::infinity()));
}

float select_threshold(std::vector<float> values, int64_t prune_num) {
    if (prune_num <= 0 || values.empty()) {
        return below_minimum(values);
    }

    size_t k = std::min(static_cast<size_t>(prune_num), values.size());
    auto kth = values.begin() + static_cast<std::ptrdiff_t>(k - 1);
    std::nth_element(values.begin(), kth, values.end());
    return *kth;
}

float select_threshold(const Tensor& metric, int64_t prune_num) {
    return select_threshold(metric.to_vector(), prune_num);
}

Tensor keep_above(const Tensor& metric, float threshold) {
    if (metric.dtype() != DType::Float32) {
        throw std::invalid_argument("keep_above() requires a float32 metric");
    }
    Tensor mask(metric.shape(), DType::Float32);
    const float* src = metric.data_ptr<float>();
    float* dst = mask.data_ptr<float>();
    int64_t n = metric.num_elements();
    for (int64_t i = 0; i < n; ++i) {
        dst[i] = (src[i] > threshold) ? 1.0f : 0.0f;
    }
    return mask;
}

} // namespace pruning
} // namespace maskalloc
