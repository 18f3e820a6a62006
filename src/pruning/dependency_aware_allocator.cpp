#include "maskalloc/pruning/allocator.hpp"
#include "maskalloc/pruning/threshold.hpp"
#include "maskalloc/errors.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <unordered_set>

namespace maskalloc {
namespace pruning {

DependencyAwareAllocator::DependencyAwareAllocator(ModelSpec model, AllocatorOptions options,
                                                   std::shared_ptr<DependencyResolver> resolver)
    : SparsityAllocator(std::move(model), std::move(options))
    , resolver_(std::move(resolver))
{
    if (!resolver_) {
        throw ConfigError("dependency_aware mode requires a dependency resolver "
                          "traced from a reference input");
    }
    if (!options_.dim.has_value() || options_.dim->size() != 1) {
        throw ConfigError("dependency_aware mode supports exactly one pruning dim");
    }
    for (const auto& layer : model_.layers()) {
        if (layer.config.dim.has_value() && layer.config.dim->size() != 1) {
            throw ConfigError("dependency_aware mode supports exactly one pruning dim", layer.name);
        }
    }
}

DependencySets DependencyAwareAllocator::resolve_sets(const DependencySets& raw) const {
    DependencySets sets;
    std::unordered_set<std::string> covered;

    for (const auto& raw_set : raw) {
        std::vector<std::string> members;
        std::unordered_set<std::string> in_set;
        for (const auto& name : raw_set) {
            if (!model_.contains(name) || !in_set.insert(name).second) {
                continue;
            }
            if (!covered.insert(name).second) {
                throw ConfigError("Layer appears in more than one channel dependency set", name);
            }
            members.push_back(name);
        }
        if (!members.empty()) {
            sets.push_back(std::move(members));
        }
    }

    for (const auto& layer : model_.layers()) {
        if (covered.count(layer.name) == 0) {
            sets.push_back({layer.name});
        }
    }
    return sets;
}

Tensor DependencyAwareAllocator::structural_mask(const Tensor& group_metric, double sparsity,
                                                 int64_t segments) {
    int64_t n = group_metric.num_elements();
    if (segments <= 0 || n % segments != 0) {
        throw ConfigError("Channel count " + std::to_string(n) +
                          " is not divisible by the group factor " + std::to_string(segments));
    }

    int64_t step = n / segments;
    int64_t pruned_per_segment = prune_count(sparsity, step);

    Tensor mask = Tensor::full(group_metric.shape(), 1.0f);
    if (pruned_per_segment == 0) {
        return mask;
    }

    const float* values = group_metric.data_ptr<float>();
    float* out = mask.data_ptr<float>();
    for (int64_t s = 0; s < segments; ++s) {
        const float* begin = values + s * step;
        float threshold = select_threshold(std::vector<float>(begin, begin + step),
                                           pruned_per_segment);
        for (int64_t i = 0; i < step; ++i) {
            out[s * step + i] = begin[i] > threshold ? 1.0f : 0.0f;
        }
    }
    return mask;
}

MaskSet DependencyAwareAllocator::generate_sparsity(const MetricMap& metrics,
                                                    const AllocationState& state) const {
    // Topology is re-traced every round
    DependencySets sets = resolve_sets(resolver_->channel_dependency_sets());
    GroupFactors factors = resolver_->group_dependency_factors();

    MaskSet masks;
    for (const auto& members : sets) {
        std::vector<Tensor> member_metrics;
        member_metrics.reserve(members.size());
        for (const auto& name : members) {
            member_metrics.push_back(prepare_metric(model_.at(name), metrics, state));
        }

        // Combined importance of every channel across the set
        Tensor group_metric = member_metrics.front().clone();
        for (size_t m = 1; m < members.size(); ++m) {
            if (member_metrics[m].shape() != group_metric.shape()) {
                throw ConfigError("Metric shape " + shape_to_string(member_metrics[m].shape()) +
                                  " does not match dependency set shape " +
                                  shape_to_string(group_metric.shape()), members[m]);
            }
            float* dst = group_metric.data_ptr<float>();
            const float* src = member_metrics[m].data_ptr<float>();
            for (int64_t i = 0; i < group_metric.num_elements(); ++i) {
                dst[i] += src[i];
            }
        }

        double min_sparsity = 1.0;
        int64_t max_group = 1;
        for (const auto& name : members) {
            min_sparsity = std::min(min_sparsity, model_.at(name).config.total_sparsity);
            auto it = factors.find(name);
            int64_t factor = it != factors.end() ? it->second : 1;
            if (factor <= 0) {
                throw ConfigError("Group dependency factor must be positive, got " +
                                  std::to_string(factor), name);
            }
            max_group = std::lcm(max_group, factor);
        }

        Tensor group_mask = structural_mask(group_metric, min_sparsity, max_group);
        if (options_.verbose) {
            std::cout << "[alloc] dependency set of " << members.size()
                      << " layers: " << count_nonzero(group_mask) << "/"
                      << group_mask.num_elements() << " channels kept by the shared mask"
                      << " (group factor " << max_group << ")" << std::endl;
        }

        // Members may prune further at their own sparsity, never re-admitting a channel
        for (size_t m = 0; m < members.size(); ++m) {
            const LayerSpec& layer = model_.at(members[m]);
            Tensor metric = std::move(member_metrics[m]);
            multiply_inplace(metric, group_mask, layer.name);

            int64_t prune_num = prune_count(layer.config.total_sparsity, metric.num_elements());
            Tensor decision = keep_above(metric, select_threshold(metric, prune_num));
            multiply_inplace(decision, group_mask, layer.name);
            masks[layer.name] = finalize_mask(layer, decision, state);
        }
    }
    return masks;
}

} // namespace pruning
} // namespace maskalloc
