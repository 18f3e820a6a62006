#pragma once

#include "maskalloc/options.hpp"
#include "maskalloc/pruning/dependency.hpp"
#include "maskalloc/pruning/layer.hpp"
#include "maskalloc/pruning/mask.hpp"
#include "maskalloc/pruning/mask_codec.hpp"
#include <memory>
#include <string>
#include <unordered_map>

namespace maskalloc {
namespace pruning {

/// Turns per-layer importance metrics into binary keep/prune masks.
///
/// Allocators hold no round state: everything carried between rounds travels
/// in AllocationState, so repeated calls with the same inputs give the same masks.
class SparsityAllocator {
public:
    /// Throws ConfigError when options or layer configs are invalid
    SparsityAllocator(ModelSpec model, AllocatorOptions options);
    virtual ~SparsityAllocator() = default;

    /// Masks for every layer of the model. Throws ConfigError when a layer has
    /// no metric, ShapeMismatchError when a metric has the wrong granularity.
    virtual MaskSet generate_sparsity(const MetricMap& metrics,
                                      const AllocationState& state) const = 0;

    /// First-round allocation (no previous masks)
    MaskSet generate_sparsity(const MetricMap& metrics) const;

    /// Allocator name ("normal", "global", ...)
    virtual std::string name() const = 0;

    const ModelSpec& model() const { return model_; }
    const AllocatorOptions& options() const { return options_; }

protected:
    MaskGranularity granularity_for(const LayerSpec& layer) const;

    /// Copy of the layer's metric; in continuous-mask mode positions pruned
    /// last round are forced to zero, the minimum of any valid metric
    Tensor prepare_metric(const LayerSpec& layer, const MetricMap& metrics,
                          const AllocationState& state) const;

    /// Expand a decision to full masks and AND it with last round's masks
    LayerMask finalize_mask(const LayerSpec& layer, const Tensor& decision,
                            const AllocationState& state) const;

    void log_layer(const LayerSpec& layer, const LayerMask& mask) const;

    ModelSpec model_;
    AllocatorOptions options_;
};

/// Prunes the smallest metrics of each layer independently
class NormalSparsityAllocator : public SparsityAllocator {
public:
    NormalSparsityAllocator(ModelSpec model, AllocatorOptions options);

    MaskSet generate_sparsity(const MetricMap& metrics,
                              const AllocationState& state) const override;
    using SparsityAllocator::generate_sparsity;

    std::string name() const override { return "normal"; }
};

/// Layer-local pruning where each metric value scores a block of weights
class BlockSparsityAllocator : public NormalSparsityAllocator {
public:
    /// Throws ConfigError when no block_sparse_size is configured
    BlockSparsityAllocator(ModelSpec model, AllocatorOptions options);

    std::string name() const override { return "block"; }
};

/// Prunes the same fraction inside every bank of balance_gran elements
class BankSparsityAllocator : public SparsityAllocator {
public:
    BankSparsityAllocator(ModelSpec model, AllocatorOptions options);

    MaskSet generate_sparsity(const MetricMap& metrics,
                              const AllocationState& state) const override;
    using SparsityAllocator::generate_sparsity;

    std::string name() const override { return "balance"; }

private:
    Tensor bank_decision(const LayerSpec& layer, const Tensor& metric) const;
};

/// Shares one sparsity budget across every layer of a group, honoring per-layer caps
class GlobalSparsityAllocator : public SparsityAllocator {
public:
    /// Throws ConfigError when members of a group disagree on total_sparsity
    GlobalSparsityAllocator(ModelSpec model, AllocatorOptions options);

    MaskSet generate_sparsity(const MetricMap& metrics,
                              const AllocationState& state) const override;
    using SparsityAllocator::generate_sparsity;

    std::string name() const override { return "global"; }

    /// Shared threshold of a group plus each member's cap threshold
    struct GroupThresholds {
        float threshold = 0.0f;
        std::unordered_map<std::string, float> layer_thresholds;
    };

    GroupThresholds calculate_threshold(const std::vector<std::string>& members,
                                        const MetricMap& prepared_metrics) const;
};

/// Forces structurally coupled layers onto one channel mask
class DependencyAwareAllocator : public SparsityAllocator {
public:
    /// Throws ConfigError without a resolver or without exactly one pruning dim
    DependencyAwareAllocator(ModelSpec model, AllocatorOptions options,
                             std::shared_ptr<DependencyResolver> resolver);

    MaskSet generate_sparsity(const MetricMap& metrics,
                              const AllocationState& state) const override;
    using SparsityAllocator::generate_sparsity;

    std::string name() const override { return "dependency_aware"; }

    /// Per-segment structural mask shared by a dependency set
    static Tensor structural_mask(const Tensor& group_metric, double sparsity,
                                  int64_t segments);

private:
    std::shared_ptr<DependencyResolver> resolver_;

    /// Resolver sets restricted to the model, plus singletons for uncovered layers
    DependencySets resolve_sets(const DependencySets& raw) const;
};

/// Allocator for options.mode; resolver is required for dependency_aware mode
std::unique_ptr<SparsityAllocator> create_allocator(
    ModelSpec model,
    const AllocatorOptions& options,
    std::shared_ptr<DependencyResolver> resolver = nullptr);

} // namespace pruning
} // namespace maskalloc
