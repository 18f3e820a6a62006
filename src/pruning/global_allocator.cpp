#include "maskalloc/pruning/allocator.hpp"
#include "maskalloc/pruning/threshold.hpp"
#include "maskalloc/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace maskalloc {
namespace pruning {

GlobalSparsityAllocator::GlobalSparsityAllocator(ModelSpec model, AllocatorOptions options)
    : SparsityAllocator(std::move(model), std::move(options))
{
    for (const auto& [group_id, members] : model_.groups()) {
        double total = model_.at(members.front()).config.total_sparsity;
        for (const auto& name : members) {
            if (model_.at(name).config.total_sparsity != total) {
                throw ConfigError("All layers of sparsity group " + std::to_string(group_id) +
                                  " must share one total_sparsity", name);
            }
        }
    }
}

MaskSet GlobalSparsityAllocator::generate_sparsity(const MetricMap& metrics,
                                                   const AllocationState& state) const {
    MaskSet masks;

    for (const auto& [group_id, members] : model_.groups()) {
        MetricMap prepared;
        for (const auto& name : members) {
            prepared.emplace(name, prepare_metric(model_.at(name), metrics, state));
        }

        GroupThresholds thresholds = calculate_threshold(members, prepared);
        if (options_.verbose) {
            std::cout << "[alloc] global group " << group_id
                      << ": threshold " << thresholds.threshold
                      << " over " << members.size() << " layers" << std::endl;
        }

        for (const auto& name : members) {
            const Tensor& metric = prepared.at(name);
            // The cap threshold wins whenever it is the stricter one
            float threshold = std::min(thresholds.threshold, thresholds.layer_thresholds.at(name));
            masks[name] = finalize_mask(model_.at(name), keep_above(metric, threshold), state);
        }
    }

    return masks;
}

GlobalSparsityAllocator::GroupThresholds GlobalSparsityAllocator::calculate_threshold(
    const std::vector<std::string>& members,
    const MetricMap& prepared_metrics) const
{
    GroupThresholds result;
    std::vector<float> pool;
    int64_t total_weight_num = 0;

    double total_sparsity = model_.at(members.front()).config.total_sparsity;

    for (const auto& name : members) {
        const LayerSpec& layer = model_.at(name);
        const Tensor& metric = prepared_metrics.at(name);

        int64_t layer_weight_num = layer.weight_numel();
        int64_t metric_num = metric.num_elements();
        total_weight_num += layer_weight_num;

        std::vector<float> values = metric.to_vector();
        if (metric_num == 0) {
            result.layer_thresholds[name] = below_minimum(values);
            continue;
        }

        // Weight elements each metric cell stands for
        double expand_ratio = static_cast<double>(layer_weight_num) / static_cast<double>(metric_num);
        int64_t expand_times = static_cast<int64_t>(expand_ratio);

        // Cells the cap protects unconditionally
        double retention_ratio = 1.0 - layer.config.max_sparsity_per_layer.value_or(1.0);
        auto retention_numel = static_cast<int64_t>(
            std::ceil(retention_ratio * static_cast<double>(layer_weight_num)));
        auto retained_metric_num = static_cast<int64_t>(
            std::ceil(static_cast<double>(retention_numel) / expand_ratio));
        int64_t stay_metric_num = metric_num - retained_metric_num;

        if (stay_metric_num <= 0) {
            result.layer_thresholds[name] = below_minimum(values);
            continue;
        }

        // The stay_metric_num smallest cells compete in the shared pool
        std::nth_element(values.begin(), values.begin() + (stay_metric_num - 1), values.end());
        values.resize(static_cast<size_t>(stay_metric_num));
        result.layer_thresholds[name] = *std::max_element(values.begin(), values.end());

        // Pool values count in weight elements
        int64_t copies = std::max<int64_t>(expand_times, 1);
        for (int64_t c = 0; c < copies; ++c) {
            pool.insert(pool.end(), values.begin(), values.end());
        }
    }

    int64_t total_prune_num = prune_count(total_sparsity, total_weight_num);
    result.threshold = pool.empty()
        ? std::numeric_limits<float>::lowest()
        : select_threshold(std::move(pool), total_prune_num);
    return result;
}

} // namespace pruning
} // namespace maskalloc
