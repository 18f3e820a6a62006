#include "maskalloc/options.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace maskalloc {

namespace {

void validate_positive(const std::vector<int64_t>& values, const std::string& what,
                       std::vector<std::string>& errors) {
    for (int64_t v : values) {
        if (v <= 0) {
            errors.push_back(what + " entries must be > 0 (got " + std::to_string(v) + ")");
            return;
        }
    }
}

} // anonymous namespace

std::string mode_name(AllocatorMode mode) {
    switch (mode) {
        case AllocatorMode::Normal: return "normal";
        case AllocatorMode::Block: return "block";
        case AllocatorMode::Global: return "global";
        case AllocatorMode::DependencyAware: return "dependency_aware";
        case AllocatorMode::Balance: return "balance";
        default: throw std::invalid_argument("Unknown allocator mode");
    }
}

AllocatorMode mode_from_name(const std::string& name) {
    if (name == "normal") return AllocatorMode::Normal;
    if (name == "block") return AllocatorMode::Block;
    if (name == "global") return AllocatorMode::Global;
    if (name == "dependency_aware") return AllocatorMode::DependencyAware;
    if (name == "balance") return AllocatorMode::Balance;
    throw std::invalid_argument("Unknown allocator mode: " + name);
}

std::vector<std::string> AllocatorOptions::validate() const {
    std::vector<std::string> errors;

    if (dim.has_value()) {
        if (dim->empty()) {
            errors.push_back("dim must name at least one axis when set");
        }
        std::unordered_set<int64_t> seen;
        for (int64_t axis : *dim) {
            if (axis < 0) {
                errors.push_back("dim entries must be >= 0 (got " + std::to_string(axis) + ")");
            } else if (!seen.insert(axis).second) {
                errors.push_back("dim lists axis " + std::to_string(axis) + " twice");
            }
        }
    }

    if (block_sparse_size.has_value()) {
        if (block_sparse_size->empty()) {
            errors.push_back("block_sparse_size must not be empty when set");
        }
        validate_positive(*block_sparse_size, "block_sparse_size", errors);
        if (dim.has_value() && block_sparse_size->size() > dim->size()) {
            errors.push_back("block_sparse_size has more axes than dim");
        }
    }

    switch (mode) {
        case AllocatorMode::DependencyAware:
            if (!dim.has_value() || dim->size() != 1) {
                errors.push_back("dependency_aware mode requires exactly one pruning dim");
            }
            break;
        case AllocatorMode::Balance:
            if (balance_gran.empty()) {
                errors.push_back("balance mode requires balance_gran");
            }
            validate_positive(balance_gran, "balance_gran", errors);
            break;
        case AllocatorMode::Normal:
        case AllocatorMode::Block:
        case AllocatorMode::Global:
            break;
    }

    return errors;
}

} // namespace maskalloc
