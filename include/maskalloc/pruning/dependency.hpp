#pragma once

#include "maskalloc/graph.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace maskalloc {
namespace pruning {

/// Layers whose output channels must be pruned identically, in a stable order
using DependencySets = std::vector<std::vector<std::string>>;

/// Layer name -> channel-count divisor its mask must respect
using GroupFactors = std::unordered_map<std::string, int64_t>;

/// Source of structural pruning constraints (traced model topology)
class DependencyResolver {
public:
    virtual ~DependencyResolver() = default;

    /// Disjoint sets of layers that must share one channel mask
    virtual DependencySets channel_dependency_sets() const = 0;

    /// Per-layer "must stay divisible by" factor (missing layers mean 1)
    virtual GroupFactors group_dependency_factors() const = 0;
};

/// Constraints supplied directly by the caller
class StaticDependencyResolver : public DependencyResolver {
public:
    StaticDependencyResolver(DependencySets channel_sets, GroupFactors group_factors = {});

    DependencySets channel_dependency_sets() const override { return channel_sets_; }
    GroupFactors group_dependency_factors() const override { return group_factors_; }

private:
    DependencySets channel_sets_;
    GroupFactors group_factors_;
};

/// Constraints traced from a Graph.
///
/// Operands of element-wise Add/Sub/Mul/Sum (and non-channel Concat) must keep
/// identical channels, so their nearest prunable producers share one set.
/// Grouped convolutions require their own output channels and those of their
/// nearest prunable parents to stay divisible by the group count.
class GraphDependencyResolver : public DependencyResolver {
public:
    /// Throws ConfigError when the graph has no input with a concrete shape
    explicit GraphDependencyResolver(std::shared_ptr<const Graph> graph);

    DependencySets channel_dependency_sets() const override;
    GroupFactors group_dependency_factors() const override;

    const Graph& graph() const { return *graph_; }

private:
    std::shared_ptr<const Graph> graph_;

    /// Prunable nodes reached by walking back from a tensor through non-prunable ops
    std::vector<std::string> nearest_prunable_producers(const std::string& tensor_name) const;

    /// Output rank of a prunable layer, taken from its weight
    std::optional<size_t> producer_output_rank(const std::string& layer) const;
};

} // namespace pruning
} // namespace maskalloc
