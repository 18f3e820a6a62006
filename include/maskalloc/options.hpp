#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace maskalloc {

/// Allocation policy, resolved once when the allocator is built
enum class AllocatorMode : uint8_t {
    Normal = 0,           // Layer-local threshold
    Block = 1,            // Layer-local threshold over block scores
    Global = 2,           // Shared budget per sparsity group
    DependencyAware = 3,  // Channel masks shared across coupled layers
    Balance = 4           // Equal sparsity inside every bank of a layer
};

/// Convert mode to its config name ("normal", "global", ...)
std::string mode_name(AllocatorMode mode);

/// Parse mode from config name (throws std::invalid_argument)
AllocatorMode mode_from_name(const std::string& name);

/// Options shared by every allocator of one pruning run
struct AllocatorOptions {
    AllocatorMode mode = AllocatorMode::Normal;

    /// Carry pruned positions forward so sparsity never decreases across rounds
    bool continuous_mask = true;

    /// Default pruning axes; unset means element-wise metrics
    std::optional<std::vector<int64_t>> dim;

    /// Default block shape one metric value stands for (trailing metric axes)
    std::optional<std::vector<int64_t>> block_sparse_size;

    /// Bank shape for balance mode (left-padded with 1s to the metric rank)
    std::vector<int64_t> balance_gran;

    /// Give the bias the per-channel decision when pruning the output axis (dim 0)
    bool mask_bias_with_output = true;

    /// Print per-layer allocation details to stdout
    bool verbose = false;

    /// Validate options, returns list of errors
    std::vector<std::string> validate() const;
};

} // namespace maskalloc
