#pragma once

#include "maskalloc/pruning/layer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace maskalloc {
namespace pruning {

/// One user-facing pruning config entry.
///
/// A layer matches when its op type is listed in op_types (or op_types holds
/// "default" or is empty) and its name is listed in op_names or contains one
/// of op_partial_names (or both name lists are empty).
struct ConfigEntry {
    std::optional<double> sparsity;
    std::optional<double> sparsity_per_layer;
    std::optional<double> total_sparsity;
    std::optional<double> max_sparsity_per_layer;

    std::vector<std::string> op_types;
    std::vector<std::string> op_names;
    std::vector<std::string> op_partial_names;

    /// Matched layers are not pruned at all
    bool exclude = false;

    bool matches(const LayerSpec& layer) const;

    /// Validate keys and ranges, returns list of errors
    std::vector<std::string> validate() const;
};

/// Resolve a config list against the prunable layers of a model.
///
/// Later entries override earlier ones for the same layer. Layers matched by
/// a total_sparsity entry share one group; every other layer gets a group of
/// its own. Unmatched and excluded layers are dropped. Throws ConfigError.
ModelSpec resolve_config_list(const std::vector<LayerSpec>& candidates,
                              const std::vector<ConfigEntry>& config_list);

} // namespace pruning
} // namespace maskalloc
