#include "maskalloc/pruning/allocator.hpp"
#include "maskalloc/pruning/threshold.hpp"
#include "maskalloc/errors.hpp"
#include <iostream>

namespace maskalloc {
namespace pruning {

namespace {

std::string join_errors(const std::string& title, const std::vector<std::string>& errors) {
    std::string msg = title;
    for (const auto& e : errors) {
        msg += "\n  - " + e;
    }
    return msg;
}

} // anonymous namespace

// ============================================================================
// SparsityAllocator
// ============================================================================

SparsityAllocator::SparsityAllocator(ModelSpec model, AllocatorOptions options)
    : model_(std::move(model))
    , options_(std::move(options))
{
    auto option_errors = options_.validate();
    if (!option_errors.empty()) {
        throw ConfigError(join_errors("Invalid allocator options:", option_errors));
    }

    auto model_errors = model_.validate();
    if (!model_errors.empty()) {
        throw ConfigError(join_errors("Invalid layer configuration:", model_errors));
    }

    // Surface granularity problems at configuration time, not mid-round
    for (const auto& layer : model_.layers()) {
        granularity_for(layer);
    }
}

MaskSet SparsityAllocator::generate_sparsity(const MetricMap& metrics) const {
    return generate_sparsity(metrics, AllocationState{});
}

MaskGranularity SparsityAllocator::granularity_for(const LayerSpec& layer) const {
    return resolve_granularity(layer, options_);
}

Tensor SparsityAllocator::prepare_metric(const LayerSpec& layer, const MetricMap& metrics,
                                         const AllocationState& state) const {
    auto it = metrics.find(layer.name);
    if (it == metrics.end()) {
        throw ConfigError("Metric of layer is not calculated", layer.name);
    }

    const Tensor& metric = it->second;
    if (metric.dtype() != DType::Float32) {
        throw ConfigError("Metric must be float32, got " + dtype_name(metric.dtype()), layer.name);
    }

    auto granularity = granularity_for(layer);
    auto expected = metric_shape(layer, granularity);
    if (metric.shape() != expected) {
        throw ShapeMismatchError(layer.name, shape_to_string(expected),
                                 shape_to_string(metric.shape()));
    }

    Tensor prepared = metric.clone();
    if (options_.continuous_mask) {
        if (const LayerMask* previous = state.previous(layer.name)) {
            if (previous->weight.shape() != layer.weight_shape) {
                throw ShapeMismatchError(layer.name + " (previous mask)",
                                         shape_to_string(layer.weight_shape),
                                         shape_to_string(previous->weight.shape()));
            }
            Tensor previous_weight = to_float_mask(previous->weight, layer.name);
            multiply_inplace(prepared, compress_mask(previous_weight, granularity), layer.name);
        }
    }
    return prepared;
}

LayerMask SparsityAllocator::finalize_mask(const LayerSpec& layer, const Tensor& decision,
                                           const AllocationState& state) const {
    LayerMask mask = expand_mask(decision, layer, granularity_for(layer));

    if (options_.continuous_mask) {
        if (const LayerMask* previous = state.previous(layer.name)) {
            multiply_inplace(mask.weight, to_float_mask(previous->weight, layer.name), layer.name);
            if (mask.bias.has_value() && previous->bias.has_value()) {
                multiply_inplace(*mask.bias, to_float_mask(*previous->bias, layer.name + ".bias"),
                                 layer.name + ".bias");
            }
        }
    }

    log_layer(layer, mask);
    return mask;
}

void SparsityAllocator::log_layer(const LayerSpec& layer, const LayerMask& mask) const {
    if (!options_.verbose) {
        return;
    }
    std::cout << "[alloc] " << name() << " " << layer.name
              << ": pruned " << mask.count_zeros() << "/" << mask.weight.num_elements()
              << " (target " << layer.config.total_sparsity * 100 << "%)" << std::endl;
}

// ============================================================================
// NormalSparsityAllocator
// ============================================================================

NormalSparsityAllocator::NormalSparsityAllocator(ModelSpec model, AllocatorOptions options)
    : SparsityAllocator(std::move(model), std::move(options))
{
}

MaskSet NormalSparsityAllocator::generate_sparsity(const MetricMap& metrics,
                                                   const AllocationState& state) const {
    MaskSet masks;
    for (const auto& layer : model_.layers()) {
        Tensor metric = prepare_metric(layer, metrics, state);
        int64_t prune_num = prune_count(layer.config.total_sparsity, metric.num_elements());
        float threshold = select_threshold(metric, prune_num);
        masks[layer.name] = finalize_mask(layer, keep_above(metric, threshold), state);
    }
    return masks;
}

// ============================================================================
// BlockSparsityAllocator
// ============================================================================

BlockSparsityAllocator::BlockSparsityAllocator(ModelSpec model, AllocatorOptions options)
    : NormalSparsityAllocator(std::move(model), std::move(options))
{
    for (const auto& layer : model_.layers()) {
        if (!granularity_for(layer).block_sparse_size.has_value()) {
            throw ConfigError("Block allocator requires block_sparse_size", layer.name);
        }
    }
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<SparsityAllocator> create_allocator(
    ModelSpec model,
    const AllocatorOptions& options,
    std::shared_ptr<DependencyResolver> resolver)
{
    switch (options.mode) {
        case AllocatorMode::Normal:
            return std::make_unique<NormalSparsityAllocator>(std::move(model), options);
        case AllocatorMode::Block:
            return std::make_unique<BlockSparsityAllocator>(std::move(model), options);
        case AllocatorMode::Global:
            return std::make_unique<GlobalSparsityAllocator>(std::move(model), options);
        case AllocatorMode::DependencyAware:
            return std::make_unique<DependencyAwareAllocator>(
                std::move(model), options, std::move(resolver));
        case AllocatorMode::Balance:
            return std::make_unique<BankSparsityAllocator>(std::move(model), options);
        default:
            throw ConfigError("Unknown allocator mode");
    }
}

} // namespace pruning
} // namespace maskalloc
