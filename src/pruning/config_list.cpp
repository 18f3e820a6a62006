#include "maskalloc/pruning/config_list.hpp"
#include "maskalloc/errors.hpp"
#include <algorithm>
#include <map>

namespace maskalloc {
namespace pruning {

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::string msg;
    for (const auto& e : errors) {
        if (!msg.empty()) msg += "; ";
        msg += e;
    }
    return msg;
}

} // anonymous namespace

bool ConfigEntry::matches(const LayerSpec& layer) const {
    bool type_ok = op_types.empty() || contains(op_types, "default") ||
                   contains(op_types, layer.op_type);
    if (!type_ok) {
        return false;
    }

    if (op_names.empty() && op_partial_names.empty()) {
        return true;
    }
    if (contains(op_names, layer.name)) {
        return true;
    }
    return std::any_of(op_partial_names.begin(), op_partial_names.end(),
        [&layer](const std::string& part) {
            return layer.name.find(part) != std::string::npos;
        });
}

std::vector<std::string> ConfigEntry::validate() const {
    std::vector<std::string> errors;

    if (op_types.empty() && op_names.empty() && op_partial_names.empty()) {
        errors.push_back("Config entry needs op_types, op_names or op_partial_names");
    }

    int keys = (sparsity ? 1 : 0) + (sparsity_per_layer ? 1 : 0) + (total_sparsity ? 1 : 0);
    if (exclude) {
        if (keys > 0 || max_sparsity_per_layer) {
            errors.push_back("Exclude entry cannot set a sparsity");
        }
        return errors;
    }

    if (keys != 1) {
        errors.push_back("Config entry needs exactly one of sparsity, "
                         "sparsity_per_layer or total_sparsity");
    }

    auto check_sparsity = [&errors](const char* key, const std::optional<double>& value) {
        if (value && (*value < 0.0 || *value >= 1.0)) {
            errors.push_back(std::string(key) + " must be in [0, 1), got " +
                             std::to_string(*value));
        }
    };
    check_sparsity("sparsity", sparsity);
    check_sparsity("sparsity_per_layer", sparsity_per_layer);
    check_sparsity("total_sparsity", total_sparsity);

    if (max_sparsity_per_layer) {
        if (!total_sparsity) {
            errors.push_back("max_sparsity_per_layer is only valid with total_sparsity");
        }
        if (*max_sparsity_per_layer <= 0.0 || *max_sparsity_per_layer > 1.0) {
            errors.push_back("max_sparsity_per_layer must be in (0, 1], got " +
                             std::to_string(*max_sparsity_per_layer));
        }
    }
    return errors;
}

ModelSpec resolve_config_list(const std::vector<LayerSpec>& candidates,
                              const std::vector<ConfigEntry>& config_list) {
    for (size_t i = 0; i < config_list.size(); ++i) {
        auto errors = config_list[i].validate();
        if (!errors.empty()) {
            throw ConfigError("Invalid config entry " + std::to_string(i) + ": " +
                              join_errors(errors));
        }
    }

    ModelSpec model;
    // Shared-budget entries map to one group, per-layer entries to a fresh one
    std::map<size_t, int> entry_groups;
    int next_group = 0;

    for (const auto& candidate : candidates) {
        const ConfigEntry* winner = nullptr;
        size_t winner_index = 0;
        for (size_t i = 0; i < config_list.size(); ++i) {
            if (config_list[i].matches(candidate)) {
                winner = &config_list[i];
                winner_index = i;
            }
        }
        if (winner == nullptr || winner->exclude) {
            continue;
        }

        LayerSpec layer = candidate;
        layer.config.max_sparsity_per_layer.reset();
        if (winner->total_sparsity) {
            layer.config.total_sparsity = *winner->total_sparsity;
            layer.config.max_sparsity_per_layer = winner->max_sparsity_per_layer;
            auto it = entry_groups.find(winner_index);
            if (it == entry_groups.end()) {
                it = entry_groups.emplace(winner_index, next_group++).first;
            }
            layer.group_id = it->second;
        } else {
            layer.config.total_sparsity = winner->sparsity ? *winner->sparsity
                                                           : *winner->sparsity_per_layer;
            layer.group_id = next_group++;
        }
        model.add_layer(std::move(layer));
    }

    return model;
}

} // namespace pruning
} // namespace maskalloc
