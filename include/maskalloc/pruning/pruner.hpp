#pragma once

#include "maskalloc/options.hpp"
#include "maskalloc/pruning/allocator.hpp"
#include "maskalloc/pruning/metrics.hpp"
#include <map>
#include <memory>
#include <string>

namespace maskalloc {
namespace pruning {

/// Pruning statistics of the current mask set
struct PruningStats {
    /// Weight parameters of every layer in the model
    int64_t total_params = 0;

    /// Weight parameters kept by the current masks
    int64_t nonzero_params = 0;

    /// Pruned fraction over the whole model
    double overall_sparsity = 0.0;

    /// Per-layer sparsity, ordered by layer name
    std::map<std::string, double> layer_sparsity;

    /// Per-group sparsity (pruned weights / weights of the group)
    std::map<int, double> group_sparsity;

    /// total_params / nonzero_params (0 when everything is pruned)
    double compression_ratio() const;
};

/// Drives compress rounds over a model: runs the allocator, keeps the mask
/// history needed for continuous-mask mode and reports the result.
class SparsityPruner {
public:
    /// Throws ConfigError for invalid options or layer configs
    SparsityPruner(ModelSpec model, AllocatorOptions options,
                   std::shared_ptr<DependencyResolver> resolver = nullptr);

    /// One round from precomputed metrics. On error the previous masks stay in place.
    const MaskSet& compress(const MetricMap& metrics);

    /// One round: collect data, score it, allocate
    const MaskSet& compress(DataCollector& collector, MetricsCalculator& calculator);

    /// Masks of the latest round (empty before the first one)
    const MaskSet& masks() const { return masks_; }

    /// Completed rounds since construction or the last reset()
    int rounds() const { return rounds_; }

    /// Forget every mask, next round starts from dense weights
    void reset();

    /// Weight multiplied by the layer's current mask (unchanged before the first round)
    Tensor apply(const std::string& layer, const Tensor& weight) const;

    PruningStats get_stats() const;

    /// Human-readable summary of the configuration and current masks
    std::string export_report() const;

    const ModelSpec& model() const { return allocator_->model(); }
    const AllocatorOptions& options() const { return allocator_->options(); }
    const SparsityAllocator& allocator() const { return *allocator_; }

private:
    std::unique_ptr<SparsityAllocator> allocator_;
    MaskSet masks_;
    int rounds_ = 0;
};

} // namespace pruning
} // namespace maskalloc
