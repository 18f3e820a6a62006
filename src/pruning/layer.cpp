#include "maskalloc/pruning/layer.hpp"
#include "maskalloc/errors.hpp"
#include <sstream>

namespace maskalloc {
namespace pruning {

std::vector<std::string> SparsityConfig::validate() const {
    std::vector<std::string> errors;

    if (!(total_sparsity >= 0.0 && total_sparsity < 1.0)) {
        std::ostringstream oss;
        oss << "total_sparsity must be in [0, 1), got " << total_sparsity;
        errors.push_back(oss.str());
    }

    if (max_sparsity_per_layer.has_value()) {
        double cap = max_sparsity_per_layer.value();
        if (!(cap > 0.0 && cap <= 1.0)) {
            std::ostringstream oss;
            oss << "max_sparsity_per_layer must be in (0, 1], got " << cap;
            errors.push_back(oss.str());
        }
    }

    if (block_sparse_size.has_value()) {
        for (int64_t b : *block_sparse_size) {
            if (b <= 0) {
                errors.push_back("block_sparse_size entries must be > 0");
                break;
            }
        }
    }

    if (dim.has_value() && dim->empty()) {
        errors.push_back("dim must name at least one axis when set");
    }

    return errors;
}

ModelSpec::ModelSpec(std::vector<LayerSpec> layers) {
    layers_.reserve(layers.size());
    for (auto& layer : layers) {
        add_layer(std::move(layer));
    }
}

void ModelSpec::add_layer(LayerSpec layer) {
    if (layer.name.empty()) {
        throw ConfigError("Layer name must not be empty");
    }
    if (index_.count(layer.name) > 0) {
        throw ConfigError("Duplicate layer name", layer.name);
    }
    index_[layer.name] = layers_.size();
    layers_.push_back(std::move(layer));
}

const LayerSpec* ModelSpec::find(const std::string& name) const {
    auto it = index_.find(name);
    return it != index_.end() ? &layers_[it->second] : nullptr;
}

const LayerSpec& ModelSpec::at(const std::string& name) const {
    const LayerSpec* layer = find(name);
    if (!layer) {
        throw ConfigError("Unknown layer", name);
    }
    return *layer;
}

std::map<int, std::vector<std::string>> ModelSpec::groups() const {
    std::map<int, std::vector<std::string>> result;
    for (const auto& layer : layers_) {
        result[layer.group_id].push_back(layer.name);
    }
    return result;
}

std::vector<std::string> ModelSpec::validate() const {
    std::vector<std::string> errors;
    for (const auto& layer : layers_) {
        if (layer.weight_shape.empty()) {
            errors.push_back(layer.name + ": weight shape is empty");
        }
        for (int64_t d : layer.weight_shape) {
            if (d <= 0) {
                errors.push_back(layer.name + ": weight shape " +
                                 shape_to_string(layer.weight_shape) + " has a non-positive axis");
                break;
            }
        }
        for (const auto& e : layer.config.validate()) {
            errors.push_back(layer.name + ": " + e);
        }
    }
    return errors;
}

std::vector<LayerSpec> collect_prunable_layers(const Graph& graph) {
    std::vector<LayerSpec> layers;

    for (const auto& node : graph.topological_sort()) {
        if (!node->is_prunable() || node->inputs().size() < 2) {
            continue;
        }

        auto weight = graph.get_initializer(node->inputs()[1]);
        if (!weight.has_value()) {
            continue;
        }

        LayerSpec layer;
        layer.name = node->name();
        layer.op_type = node->op_type();
        layer.weight_name = node->inputs()[1];
        layer.weight_shape = weight->get().shape();

        if (node->inputs().size() > 2) {
            auto bias = graph.get_initializer(node->inputs()[2]);
            if (bias.has_value()) {
                layer.bias_name = node->inputs()[2];
                layer.bias_shape = bias->get().shape();
            }
        }

        layer.group_id = static_cast<int>(layers.size());
        layers.push_back(std::move(layer));
    }

    return layers;
}

} // namespace pruning
} // namespace maskalloc
