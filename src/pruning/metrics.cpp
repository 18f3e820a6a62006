#include "maskalloc/pruning/metrics.hpp"
#include "maskalloc/errors.hpp"
#include "reduce.hpp"
#include <algorithm>
#include <cmath>

namespace maskalloc {
namespace pruning {

WeightDataCollector::WeightDataCollector(std::shared_ptr<const Graph> graph, ModelSpec model)
    : graph_(std::move(graph))
    , model_(std::move(model))
{
    if (!graph_) {
        throw ConfigError("Weight collection requires a graph");
    }
    for (const auto& layer : model_.layers()) {
        const std::string& weight = layer.weight_name.empty() ? layer.name : layer.weight_name;
        if (!graph_->has_initializer(weight)) {
            throw ConfigError("Weight initializer '" + weight + "' not found", layer.name);
        }
    }
}

CollectedData WeightDataCollector::collect() {
    CollectedData data;
    for (const auto& layer : model_.layers()) {
        const std::string& weight = layer.weight_name.empty() ? layer.name : layer.weight_name;
        auto tensor = graph_->get_initializer(weight);
        if (!tensor.has_value()) {
            throw ConfigError("Weight initializer '" + weight + "' not found", layer.name);
        }
        data.emplace(layer.name, tensor->get().clone());
    }
    return data;
}

NormMetricsCalculator::NormMetricsCalculator(double p,
                                             std::optional<std::vector<int64_t>> dim,
                                             std::optional<std::vector<int64_t>> block_sparse_size)
    : p_(p)
    , dim_(std::move(dim))
    , block_sparse_size_(std::move(block_sparse_size))
{
    if (!(p_ > 0.0)) {
        throw ConfigError("Norm order p must be positive, got " + std::to_string(p_));
    }
    if (dim_.has_value()) {
        std::sort(dim_->begin(), dim_->end());
        dim_->erase(std::unique(dim_->begin(), dim_->end()), dim_->end());
        if (dim_->empty() || dim_->front() < 0) {
            throw ConfigError("dim must list non-negative axes");
        }
    }
    if (block_sparse_size_.has_value()) {
        for (int64_t b : *block_sparse_size_) {
            if (b <= 0) {
                throw ConfigError("block_sparse_size entries must be positive");
            }
        }
    }
}

MetricMap NormMetricsCalculator::calculate_metrics(const CollectedData& data) {
    MetricMap metrics;
    for (const auto& [name, tensor] : data) {
        metrics.emplace(name, layer_metric(name, tensor));
    }
    return metrics;
}

Tensor NormMetricsCalculator::layer_metric(const std::string& name, const Tensor& data) const {
    if (data.dtype() != DType::Float32) {
        throw ConfigError("Metric input must be float32, got " + dtype_name(data.dtype()), name);
    }

    if (dim_.has_value() && dim_->back() >= static_cast<int64_t>(data.ndim())) {
        throw ConfigError("dim " + shape_to_string(*dim_) + " out of range for weight " +
                          shape_to_string(data.shape()), name);
    }

    const double p = p_;
    Tensor metric;
    bool reduces = dim_.has_value() && data.ndim() > 1 && dim_->size() != data.ndim();
    if (reduces) {
        metric = detail::reduce_to_dims(data, *dim_, [p](float x) {
            return static_cast<float>(std::pow(std::fabs(static_cast<double>(x)), p));
        });
        float* values = metric.data_ptr<float>();
        for (int64_t i = 0; i < metric.num_elements(); ++i) {
            values[i] = static_cast<float>(std::pow(static_cast<double>(values[i]), 1.0 / p));
        }
    } else {
        metric = Tensor(data.shape(), DType::Float32);
        const float* src = data.data_ptr<float>();
        float* dst = metric.data_ptr<float>();
        for (int64_t i = 0; i < data.num_elements(); ++i) {
            dst[i] = std::fabs(src[i]);
        }
    }

    if (block_sparse_size_.has_value()) {
        if (block_sparse_size_->size() > metric.ndim()) {
            throw ConfigError("block_sparse_size " + shape_to_string(*block_sparse_size_) +
                              " has more axes than metric " + shape_to_string(metric.shape()),
                              name);
        }
        metric = detail::block_average(metric, *block_sparse_size_);
    }
    return metric;
}

} // namespace pruning
} // namespace maskalloc
