#pragma once

/// @file maskalloc.hpp
/// @brief Main include file for the maskalloc library

// Core types
#include "maskalloc/types.hpp"
#include "maskalloc/errors.hpp"
#include "maskalloc/tensor.hpp"
#include "maskalloc/node.hpp"
#include "maskalloc/graph.hpp"
#include "maskalloc/options.hpp"

// Mask allocation
#include "maskalloc/pruning/layer.hpp"
#include "maskalloc/pruning/config_list.hpp"
#include "maskalloc/pruning/mask.hpp"
#include "maskalloc/pruning/mask_codec.hpp"
#include "maskalloc/pruning/threshold.hpp"
#include "maskalloc/pruning/dependency.hpp"
#include "maskalloc/pruning/allocator.hpp"
#include "maskalloc/pruning/metrics.hpp"
#include "maskalloc/pruning/pruner.hpp"

namespace maskalloc {

/// Library version
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace maskalloc
