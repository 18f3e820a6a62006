#pragma once

#include "maskalloc/graph.hpp"
#include "maskalloc/pruning/layer.hpp"
#include "maskalloc/pruning/mask.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace maskalloc {
namespace pruning {

/// Raw per-layer data (weights, activations, gradients) keyed by layer name
using CollectedData = std::unordered_map<std::string, Tensor>;

/// Gathers the data a metrics calculator scores
class DataCollector {
public:
    virtual ~DataCollector() = default;
    virtual CollectedData collect() = 0;
};

/// Scores collected data at the granularity the allocator expects
class MetricsCalculator {
public:
    virtual ~MetricsCalculator() = default;
    virtual MetricMap calculate_metrics(const CollectedData& data) = 0;
};

/// Reads each layer's weight initializer out of a graph
class WeightDataCollector : public DataCollector {
public:
    /// Throws ConfigError when a layer's weight initializer is missing
    WeightDataCollector(std::shared_ptr<const Graph> graph, ModelSpec model);

    CollectedData collect() override;

private:
    std::shared_ptr<const Graph> graph_;
    ModelSpec model_;
};

/// p-norm over every axis outside `dim`, then block averaging.
/// Without dim the metric is |x| element-wise.
class NormMetricsCalculator : public MetricsCalculator {
public:
    explicit NormMetricsCalculator(double p = 1.0,
                                   std::optional<std::vector<int64_t>> dim = std::nullopt,
                                   std::optional<std::vector<int64_t>> block_sparse_size = std::nullopt);

    MetricMap calculate_metrics(const CollectedData& data) override;

    double p() const { return p_; }

private:
    Tensor layer_metric(const std::string& name, const Tensor& data) const;

    double p_;
    std::optional<std::vector<int64_t>> dim_;
    std::optional<std::vector<int64_t>> block_sparse_size_;
};

} // namespace pruning
} // namespace maskalloc
