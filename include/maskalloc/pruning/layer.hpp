#pragma once

#include "maskalloc/graph.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace maskalloc {
namespace pruning {

/// Resolved sparsity parameters of one layer for one compress round
struct SparsityConfig {
    /// Fraction of the layer (or of its group, in global mode) to prune, in [0, 1)
    double total_sparsity = 0.0;

    /// Upper bound on the fraction of this layer that may be pruned, in (0, 1]
    std::optional<double> max_sparsity_per_layer;

    /// Per-layer override of AllocatorOptions::dim
    std::optional<std::vector<int64_t>> dim;

    /// Per-layer override of AllocatorOptions::block_sparse_size
    std::optional<std::vector<int64_t>> block_sparse_size;

    /// Validate ranges, returns list of errors
    std::vector<std::string> validate() const;
};

/// A prunable layer: its weight (and optional bias) geometry plus its budget
struct LayerSpec {
    std::string name;
    std::string op_type;

    std::vector<int64_t> weight_shape;
    std::optional<std::vector<int64_t>> bias_shape;

    /// Initializer names in the traced graph (empty when not graph-backed)
    std::string weight_name;
    std::string bias_name;

    /// Layers sharing a group id share one sparsity budget
    int group_id = 0;

    SparsityConfig config;

    int64_t weight_numel() const { return checked_product(weight_shape); }
};

/// Ordered set of prunable layers with name lookup
class ModelSpec {
public:
    ModelSpec() = default;
    explicit ModelSpec(std::vector<LayerSpec> layers);

    /// Append a layer (throws ConfigError on duplicate name)
    void add_layer(LayerSpec layer);

    const std::vector<LayerSpec>& layers() const { return layers_; }
    size_t size() const { return layers_.size(); }
    bool empty() const { return layers_.empty(); }

    bool contains(const std::string& name) const { return index_.count(name) > 0; }
    const LayerSpec* find(const std::string& name) const;

    /// Layer by name (throws ConfigError when unknown)
    const LayerSpec& at(const std::string& name) const;

    /// Group id -> member layer names in model order
    std::map<int, std::vector<std::string>> groups() const;

    /// Validate every layer, returns list of errors
    std::vector<std::string> validate() const;

private:
    std::vector<LayerSpec> layers_;
    std::unordered_map<std::string, size_t> index_;
};

/// Conv/ConvTranspose/Gemm/MatMul/Linear nodes whose weight initializer exists,
/// in topological order, each in a group of its own with zero sparsity
std::vector<LayerSpec> collect_prunable_layers(const Graph& graph);

} // namespace pruning
} // namespace maskalloc
