#include "maskalloc/pruning/allocator.hpp"
#include "maskalloc/pruning/threshold.hpp"
#include "maskalloc/errors.hpp"
#include "reduce.hpp"

namespace maskalloc {
namespace pruning {

BankSparsityAllocator::BankSparsityAllocator(ModelSpec model, AllocatorOptions options)
    : SparsityAllocator(std::move(model), std::move(options))
{
    if (options_.balance_gran.empty()) {
        throw ConfigError("Balance allocator requires balance_gran");
    }
}

MaskSet BankSparsityAllocator::generate_sparsity(const MetricMap& metrics,
                                                 const AllocationState& state) const {
    MaskSet masks;
    for (const auto& layer : model_.layers()) {
        Tensor metric = prepare_metric(layer, metrics, state);
        masks[layer.name] = finalize_mask(layer, bank_decision(layer, metric), state);
    }
    return masks;
}

Tensor BankSparsityAllocator::bank_decision(const LayerSpec& layer, const Tensor& metric) const {
    const auto& shape = metric.shape();
    const auto& gran = options_.balance_gran;
    if (gran.size() > shape.size()) {
        throw ConfigError("balance_gran " + shape_to_string(gran) +
                          " has more axes than metric " + shape_to_string(shape), layer.name);
    }

    // Left-pad the bank shape with 1s up to the metric rank
    std::vector<int64_t> bank(shape.size() - gran.size(), 1);
    bank.insert(bank.end(), gran.begin(), gran.end());

    std::vector<int64_t> grid(shape.size());
    for (size_t d = 0; d < shape.size(); ++d) {
        if (shape[d] % bank[d] != 0) {
            throw ConfigError("Metric " + shape_to_string(shape) +
                              " is not aligned with balance granularity " +
                              shape_to_string(bank), layer.name);
        }
        grid[d] = shape[d] / bank[d];
    }

    auto strides = detail::row_major_strides(shape);
    auto grid_strides = detail::row_major_strides(grid);
    std::vector<int64_t> coords(shape.size(), 0);

    int64_t n = metric.num_elements();
    std::vector<int64_t> bank_of(static_cast<size_t>(n));
    std::vector<std::vector<float>> bank_values(static_cast<size_t>(checked_product(grid)));

    const float* values = metric.data_ptr<float>();
    for (int64_t i = 0; i < n; ++i) {
        detail::unravel(i, strides, coords);
        int64_t b = 0;
        for (size_t d = 0; d < coords.size(); ++d) {
            b += (coords[d] / bank[d]) * grid_strides[d];
        }
        bank_of[static_cast<size_t>(i)] = b;
        bank_values[static_cast<size_t>(b)].push_back(values[i]);
    }

    std::vector<float> thresholds;
    thresholds.reserve(bank_values.size());
    for (auto& v : bank_values) {
        int64_t prune_num = prune_count(layer.config.total_sparsity, static_cast<int64_t>(v.size()));
        thresholds.push_back(select_threshold(std::move(v), prune_num));
    }

    Tensor decision(shape, DType::Float32);
    float* out = decision.data_ptr<float>();
    for (int64_t i = 0; i < n; ++i) {
        out[i] = values[i] > thresholds[static_cast<size_t>(bank_of[static_cast<size_t>(i)])]
            ? 1.0f : 0.0f;
    }
    return decision;
}

} // namespace pruning
} // namespace maskalloc
