#include "reduce.hpp"
#include <stdexcept>

namespace maskalloc {
namespace pruning {
namespace detail {

std::vector<int64_t> row_major_strides(const std::vector<int64_t>& shape) {
    std::vector<int64_t> strides(shape.size(), 1);
    for (int d = static_cast<int>(shape.size()) - 2; d >= 0; --d) {
        strides[d] = strides[d + 1] * shape[d + 1];
    }
    return strides;
}

void unravel(int64_t flat, const std::vector<int64_t>& strides, std::vector<int64_t>& coords) {
    for (size_t d = 0; d < strides.size(); ++d) {
        coords[d] = flat / strides[d];
        flat %= strides[d];
    }
}

std::vector<int64_t> block_pooled_shape(const std::vector<int64_t>& shape,
                                        const std::vector<int64_t>& block) {
    if (block.size() > shape.size()) {
        throw std::invalid_argument(
            "Block has " + std::to_string(block.size()) + " axes but tensor has " +
            std::to_string(shape.size()));
    }
    std::vector<int64_t> pooled = shape;
    size_t offset = shape.size() - block.size();
    for (size_t i = 0; i < block.size(); ++i) {
        pooled[offset + i] = (shape[offset + i] + block[i] - 1) / block[i];
    }
    return pooled;
}

Tensor block_average(const Tensor& input, const std::vector<int64_t>& block) {
    const auto& in_shape = input.shape();
    auto out_shape = block_pooled_shape(in_shape, block);
    size_t offset = in_shape.size() - block.size();

    Tensor sums(out_shape, DType::Float32);
    std::vector<int64_t> counts(static_cast<size_t>(sums.num_elements()), 0);

    const float* in = input.data_ptr<float>();
    float* out = sums.data_ptr<float>();
    auto in_strides = row_major_strides(in_shape);
    auto out_strides = row_major_strides(out_shape);
    std::vector<int64_t> coords(in_shape.size(), 0);

    int64_t n = input.num_elements();
    for (int64_t i = 0; i < n; ++i) {
        unravel(i, in_strides, coords);
        int64_t out_idx = 0;
        for (size_t d = 0; d < coords.size(); ++d) {
            int64_t c = d >= offset ? coords[d] / block[d - offset] : coords[d];
            out_idx += c * out_strides[d];
        }
        out[out_idx] += in[i];
        counts[static_cast<size_t>(out_idx)]++;
    }

    for (size_t i = 0; i < counts.size(); ++i) {
        if (counts[i] > 0) {
            out[i] /= static_cast<float>(counts[i]);
        }
    }
    return sums;
}

} // namespace detail
} // namespace pruning
} // namespace maskalloc
