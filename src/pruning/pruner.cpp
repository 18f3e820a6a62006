#include "maskalloc/pruning/pruner.hpp"
#include "maskalloc/errors.hpp"
#include <iostream>
#include <sstream>

namespace maskalloc {
namespace pruning {

double PruningStats::compression_ratio() const {
    if (nonzero_params == 0) {
        return 0.0;
    }
    return static_cast<double>(total_params) / static_cast<double>(nonzero_params);
}

SparsityPruner::SparsityPruner(ModelSpec model, AllocatorOptions options,
                               std::shared_ptr<DependencyResolver> resolver)
    : allocator_(create_allocator(std::move(model), options, std::move(resolver)))
{}

const MaskSet& SparsityPruner::compress(const MetricMap& metrics) {
    AllocationState state;
    if (options().continuous_mask) {
        state.previous_masks = masks_;
    }

    // Assigned only once the whole round succeeded
    MaskSet next = allocator_->generate_sparsity(metrics, state);
    masks_ = std::move(next);
    ++rounds_;

    if (options().verbose) {
        auto stats = get_stats();
        std::cout << "[pruner] round " << rounds_ << " (" << allocator_->name() << "): "
                  << stats.nonzero_params << "/" << stats.total_params
                  << " weights kept, sparsity " << stats.overall_sparsity * 100 << "%"
                  << std::endl;
    }
    return masks_;
}

const MaskSet& SparsityPruner::compress(DataCollector& collector, MetricsCalculator& calculator) {
    CollectedData data = collector.collect();
    MetricMap metrics = calculator.calculate_metrics(data);
    return compress(metrics);
}

void SparsityPruner::reset() {
    masks_.clear();
    rounds_ = 0;
    if (options().verbose) {
        std::cout << "[pruner] mask history cleared" << std::endl;
    }
}

Tensor SparsityPruner::apply(const std::string& layer, const Tensor& weight) const {
    const LayerSpec& spec = model().at(layer);
    if (weight.shape() != spec.weight_shape) {
        throw ShapeMismatchError(layer, shape_to_string(spec.weight_shape),
                                 shape_to_string(weight.shape()));
    }
    auto it = masks_.find(layer);
    if (it == masks_.end()) {
        return weight.clone();
    }
    return it->second.apply(weight);
}

PruningStats SparsityPruner::get_stats() const {
    PruningStats stats;
    std::map<int, std::pair<int64_t, int64_t>> groups;  // group -> (pruned, total)

    for (const auto& layer : model().layers()) {
        int64_t total = layer.weight_numel();
        auto it = masks_.find(layer.name);
        int64_t kept = it != masks_.end() ? it->second.count_nonzero() : total;

        stats.total_params += total;
        stats.nonzero_params += kept;
        stats.layer_sparsity[layer.name] =
            total > 0 ? static_cast<double>(total - kept) / static_cast<double>(total) : 0.0;

        auto& group = groups[layer.group_id];
        group.first += total - kept;
        group.second += total;
    }

    for (const auto& [id, counts] : groups) {
        stats.group_sparsity[id] = counts.second > 0
            ? static_cast<double>(counts.first) / static_cast<double>(counts.second)
            : 0.0;
    }

    if (stats.total_params > 0) {
        stats.overall_sparsity = static_cast<double>(stats.total_params - stats.nonzero_params) /
                                 static_cast<double>(stats.total_params);
    }
    return stats;
}

std::string SparsityPruner::export_report() const {
    const auto& opts = options();
    auto stats = get_stats();

    std::ostringstream oss;
    oss << "Pruning Report\n";
    oss << "==============\n\n";
    oss << "Configuration:\n";
    oss << "  Mode: " << mode_name(opts.mode) << "\n";
    oss << "  Continuous mask: " << (opts.continuous_mask ? "yes" : "no") << "\n";
    if (opts.dim.has_value()) {
        oss << "  Dim: " << shape_to_string(*opts.dim) << "\n";
    }
    if (opts.block_sparse_size.has_value()) {
        oss << "  Block size: " << shape_to_string(*opts.block_sparse_size) << "\n";
    }
    if (!opts.balance_gran.empty()) {
        oss << "  Balance granularity: " << shape_to_string(opts.balance_gran) << "\n";
    }
    oss << "  Rounds: " << rounds_ << "\n";
    oss << "\nResults:\n";
    oss << "  Total parameters: " << stats.total_params << "\n";
    oss << "  Non-zero parameters: " << stats.nonzero_params << "\n";
    oss << "  Overall sparsity: " << stats.overall_sparsity * 100 << "%\n";
    oss << "  Compression ratio: " << stats.compression_ratio() << "x\n";
    oss << "\nPer-layer sparsity:\n";
    for (const auto& layer : model().layers()) {
        oss << "  " << layer.name << " " << shape_to_string(layer.weight_shape) << ": "
            << stats.layer_sparsity.at(layer.name) * 100 << "% (target "
            << layer.config.total_sparsity * 100 << "%)\n";
    }
    if (stats.group_sparsity.size() < model().size()) {
        oss << "\nPer-group sparsity:\n";
        for (const auto& [id, sparsity] : stats.group_sparsity) {
            oss << "  group " << id << ": " << sparsity * 100 << "%\n";
        }
    }
    return oss.str();
}

} // namespace pruning
} // namespace maskalloc
