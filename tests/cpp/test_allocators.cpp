#include <gtest/gtest.h>
#include "maskalloc/pruning/allocator.hpp"
#include "maskalloc/errors.hpp"
#include <cmath>

using namespace maskalloc;
using namespace maskalloc::pruning;

namespace {

LayerSpec make_layer(const std::string& name, std::vector<int64_t> weight_shape,
                     double sparsity, int group_id = 0) {
    LayerSpec layer;
    layer.name = name;
    layer.op_type = "Linear";
    layer.weight_shape = std::move(weight_shape);
    layer.group_id = group_id;
    layer.config.total_sparsity = sparsity;
    return layer;
}

/// 0, 1, 2, ... in row-major order
Tensor index_metric(const std::vector<int64_t>& shape) {
    Tensor t(shape, DType::Float32);
    float* data = t.data_ptr<float>();
    for (int64_t i = 0; i < t.num_elements(); ++i) {
        data[i] = static_cast<float>(i);
    }
    return t;
}

} // anonymous namespace

// ============================================================================
// Normal
// ============================================================================

TEST(NormalAllocatorTest, HalfOfIndexMetric) {
    ModelSpec model({make_layer("fc", {4, 4}, 0.5)});
    NormalSparsityAllocator allocator(model, AllocatorOptions{});

    MetricMap metrics;
    metrics.emplace("fc", index_metric({4, 4}));

    MaskSet masks = allocator.generate_sparsity(metrics);
    const LayerMask& mask = masks.at("fc");

    EXPECT_EQ(mask.count_nonzero(), 8);
    EXPECT_EQ(mask.count_zeros(), 8);
    auto values = mask.weight.to_vector();
    for (int i = 0; i < 16; ++i) {
        EXPECT_FLOAT_EQ(values[i], i < 8 ? 0.0f : 1.0f) << "element " << i;
    }
}

TEST(NormalAllocatorTest, ZeroPruneNumKeepsEverything) {
    // floor(0.05 * 16) == 0
    ModelSpec model({make_layer("fc", {4, 4}, 0.05)});
    NormalSparsityAllocator allocator(model, AllocatorOptions{});

    MetricMap metrics;
    metrics.emplace("fc", Tensor({4, 4}));  // all-zero metric

    MaskSet masks = allocator.generate_sparsity(metrics);
    EXPECT_EQ(masks.at("fc").count_nonzero(), 16);
}

TEST(NormalAllocatorTest, PrunedFractionWithinOneElement) {
    ModelSpec model({
        make_layer("a", {7, 3}, 0.3),
        make_layer("b", {10}, 0.75),
        make_layer("c", {5, 5}, 0.6),
    });
    NormalSparsityAllocator allocator(model, AllocatorOptions{});

    MetricMap metrics;
    for (const auto& layer : model.layers()) {
        metrics.emplace(layer.name, index_metric(layer.weight_shape));
    }

    MaskSet masks = allocator.generate_sparsity(metrics);
    for (const auto& layer : model.layers()) {
        double target = layer.config.total_sparsity * layer.weight_numel();
        int64_t pruned = masks.at(layer.name).count_zeros();
        EXPECT_LE(std::abs(static_cast<double>(pruned) - target), 1.0) << layer.name;
    }
}

TEST(NormalAllocatorTest, ChannelPruningWithBias) {
    LayerSpec layer = make_layer("conv", {4, 2, 3, 3}, 0.5);
    layer.bias_shape = std::vector<int64_t>{4};
    ModelSpec model({layer});

    AllocatorOptions opts;
    opts.dim = std::vector<int64_t>{0};
    NormalSparsityAllocator allocator(model, opts);

    MetricMap metrics;
    metrics.emplace("conv", Tensor::from_values({4}, {3.0f, 0.5f, 2.0f, 0.1f}));

    MaskSet masks = allocator.generate_sparsity(metrics);
    const LayerMask& mask = masks.at("conv");
    EXPECT_EQ(mask.count_nonzero(), 2 * 18);

    ASSERT_TRUE(mask.bias.has_value());
    EXPECT_EQ(mask.bias->to_vector(), (std::vector<float>{1, 0, 1, 0}));
}

TEST(NormalAllocatorTest, MissingMetric) {
    ModelSpec model({make_layer("fc", {4, 4}, 0.5)});
    NormalSparsityAllocator allocator(model, AllocatorOptions{});

    try {
        allocator.generate_sparsity(MetricMap{});
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        ASSERT_TRUE(e.layer().has_value());
        EXPECT_EQ(*e.layer(), "fc");
    }
}

TEST(NormalAllocatorTest, MetricShapeMismatch) {
    ModelSpec model({make_layer("fc", {4, 4}, 0.5)});
    AllocatorOptions opts;
    opts.dim = std::vector<int64_t>{0};
    NormalSparsityAllocator allocator(model, opts);

    MetricMap metrics;
    metrics.emplace("fc", index_metric({4, 4}));
    EXPECT_THROW(allocator.generate_sparsity(metrics), ShapeMismatchError);
}

TEST(NormalAllocatorTest, InvalidSparsityRejected) {
    EXPECT_THROW(NormalSparsityAllocator(ModelSpec({make_layer("fc", {4}, 1.0)}),
                                         AllocatorOptions{}),
                 ConfigError);
    EXPECT_THROW(NormalSparsityAllocator(ModelSpec({make_layer("fc", {4}, -0.1)}),
                                         AllocatorOptions{}),
                 ConfigError);
}

TEST(NormalAllocatorTest, ContinuousMaskIsMonotonic) {
    ModelSpec round1({make_layer("fc", {8, 8}, 0.25)});
    ModelSpec round2({make_layer("fc", {8, 8}, 0.5)});
    AllocatorOptions opts;

    // Importance order flips between rounds
    MetricMap first;
    first.emplace("fc", index_metric({8, 8}));
    MetricMap second;
    Tensor reversed({8, 8});
    for (int64_t i = 0; i < 64; ++i) {
        reversed.data_ptr<float>()[i] = static_cast<float>(64 - i);
    }
    second.emplace("fc", std::move(reversed));

    AllocationState state;
    state.previous_masks = NormalSparsityAllocator(round1, opts).generate_sparsity(first);
    MaskSet next = NormalSparsityAllocator(round2, opts).generate_sparsity(second, state);

    const float* before = state.previous_masks.at("fc").weight.data_ptr<float>();
    const float* after = next.at("fc").weight.data_ptr<float>();
    for (int64_t i = 0; i < 64; ++i) {
        if (before[i] == 0.0f) {
            EXPECT_FLOAT_EQ(after[i], 0.0f) << "element " << i << " regrew";
        }
    }
    EXPECT_GE(next.at("fc").count_zeros(), 32);
}

TEST(NormalAllocatorTest, WithoutContinuousMaskWeightsMayRegrow) {
    ModelSpec model({make_layer("fc", {4}, 0.5)});
    AllocatorOptions opts;
    opts.continuous_mask = false;
    NormalSparsityAllocator allocator(model, opts);

    AllocationState state;
    LayerMask previous;
    previous.weight = Tensor::from_values({4}, {0, 0, 1, 1});
    state.previous_masks.emplace("fc", std::move(previous));

    MetricMap metrics;
    metrics.emplace("fc", Tensor::from_values({4}, {4, 3, 2, 1}));

    MaskSet masks = allocator.generate_sparsity(metrics, state);
    EXPECT_EQ(masks.at("fc").weight.to_vector(), (std::vector<float>{1, 1, 0, 0}));
}

TEST(NormalAllocatorTest, DeterministicAcrossCalls) {
    ModelSpec model({make_layer("fc", {4, 4}, 0.5)});
    NormalSparsityAllocator allocator(model, AllocatorOptions{});

    MetricMap metrics;
    metrics.emplace("fc", index_metric({4, 4}));

    auto first = allocator.generate_sparsity(metrics);
    auto second = allocator.generate_sparsity(metrics);
    EXPECT_EQ(first.at("fc").weight.to_vector(), second.at("fc").weight.to_vector());
}

TEST(NormalAllocatorTest, BoolPreviousMaskIsHonoured) {
    ModelSpec model({make_layer("fc", {4}, 0.5)});
    NormalSparsityAllocator allocator(model, AllocatorOptions{});

    AllocationState state;
    LayerMask previous;
    previous.weight = Tensor({4}, DType::Bool);
    uint8_t* flags = previous.weight.data_ptr<uint8_t>();
    flags[0] = 1;
    flags[1] = 0;
    flags[2] = 1;
    flags[3] = 1;
    state.previous_masks.emplace("fc", std::move(previous));

    MetricMap metrics;
    metrics.emplace("fc", Tensor::from_values({4}, {4, 3, 2, 1}));

    // Element 1 stays pruned and element 3 has the lowest remaining score
    MaskSet masks = allocator.generate_sparsity(metrics, state);
    EXPECT_EQ(masks.at("fc").weight.dtype(), DType::Float32);
    EXPECT_EQ(masks.at("fc").weight.to_vector(), (std::vector<float>{1, 0, 1, 0}));
}

TEST(NormalAllocatorTest, LargeBoolPreviousMask) {
    ModelSpec model({make_layer("fc", {64, 64}, 0.5)});
    NormalSparsityAllocator allocator(model, AllocatorOptions{});

    AllocationState state;
    LayerMask previous;
    previous.weight = Tensor({64, 64}, DType::Bool);
    previous.weight.fill<uint8_t>(1);
    state.previous_masks.emplace("fc", std::move(previous));

    MetricMap metrics;
    metrics.emplace("fc", index_metric({64, 64}));

    MaskSet masks = allocator.generate_sparsity(metrics, state);
    EXPECT_EQ(masks.at("fc").count_zeros(), 2048);
}

TEST(NormalAllocatorTest, UnsupportedPreviousMaskDtype) {
    ModelSpec model({make_layer("fc", {4}, 0.5)});
    NormalSparsityAllocator allocator(model, AllocatorOptions{});

    AllocationState state;
    LayerMask previous;
    previous.weight = Tensor({4}, DType::Int64);
    state.previous_masks.emplace("fc", std::move(previous));

    MetricMap metrics;
    metrics.emplace("fc", Tensor::from_values({4}, {4, 3, 2, 1}));
    EXPECT_THROW(allocator.generate_sparsity(metrics, state), ConfigError);
}

TEST(NormalAllocatorTest, ContinuousMaskAndsPreviousBias) {
    LayerSpec layer = make_layer("conv", {4, 2, 3, 3}, 0.5);
    layer.bias_shape = std::vector<int64_t>{4};
    ModelSpec model({layer});

    AllocatorOptions opts;
    opts.dim = std::vector<int64_t>{0};
    NormalSparsityAllocator allocator(model, opts);

    AllocationState state;
    LayerMask previous;
    previous.weight = Tensor::full({4, 2, 3, 3}, 1.0f);
    float* weight = previous.weight.data_ptr<float>();
    for (int64_t i = 3 * 18; i < 4 * 18; ++i) {
        weight[i] = 0.0f;
    }
    Tensor bias({4}, DType::Bool);
    uint8_t* bias_flags = bias.data_ptr<uint8_t>();
    bias_flags[0] = 0;
    bias_flags[1] = 1;
    bias_flags[2] = 1;
    bias_flags[3] = 1;
    previous.bias = std::move(bias);
    state.previous_masks.emplace("conv", std::move(previous));

    MetricMap metrics;
    metrics.emplace("conv", Tensor::from_values({4}, {3.0f, 0.5f, 2.0f, 9.0f}));

    MaskSet masks = allocator.generate_sparsity(metrics, state);
    const LayerMask& mask = masks.at("conv");
    EXPECT_EQ(mask.count_nonzero(), 2 * 18);
    ASSERT_TRUE(mask.bias.has_value());
    EXPECT_EQ(mask.bias->to_vector(), (std::vector<float>{0, 0, 1, 0}));
}

TEST(MaskHelpersTest, RejectNonFloatOperands) {
    Tensor target = Tensor::full({4}, 1.0f);
    EXPECT_THROW(multiply_inplace(target, Tensor({4}, DType::Bool), "fc"), ConfigError);
    EXPECT_THROW(count_nonzero(Tensor({4}, DType::Int64)), std::invalid_argument);
    EXPECT_THROW(to_float_mask(Tensor({4}, DType::Float64), "fc"), ConfigError);

    Tensor flags({3}, DType::UInt8);
    flags.data_ptr<uint8_t>()[0] = 0;
    flags.data_ptr<uint8_t>()[1] = 7;
    flags.data_ptr<uint8_t>()[2] = 1;
    EXPECT_EQ(to_float_mask(flags, "fc").to_vector(), (std::vector<float>{0, 1, 1}));
}

// ============================================================================
// Block
// ============================================================================

TEST(BlockAllocatorTest, PrunesWholeBlocks) {
    ModelSpec model({make_layer("fc", {4, 4}, 0.5)});
    AllocatorOptions opts;
    opts.mode = AllocatorMode::Block;
    opts.block_sparse_size = std::vector<int64_t>{2, 2};
    BlockSparsityAllocator allocator(model, opts);

    MetricMap metrics;
    metrics.emplace("fc", Tensor::from_values({2, 2}, {0.1f, 0.9f, 0.8f, 0.2f}));

    MaskSet masks = allocator.generate_sparsity(metrics);
    EXPECT_EQ(masks.at("fc").weight.to_vector(), (std::vector<float>{
        0, 0, 1, 1,
        0, 0, 1, 1,
        1, 1, 0, 0,
        1, 1, 0, 0,
    }));
}

TEST(BlockAllocatorTest, SliceOfBlocks) {
    // Output channels pruned in pairs
    ModelSpec model({make_layer("conv", {6, 2, 3, 3}, 0.5)});
    AllocatorOptions opts;
    opts.mode = AllocatorMode::Block;
    opts.dim = std::vector<int64_t>{0};
    opts.block_sparse_size = std::vector<int64_t>{2};
    BlockSparsityAllocator allocator(model, opts);

    MetricMap metrics;
    metrics.emplace("conv", Tensor::from_values({3}, {5.0f, 1.0f, 3.0f}));

    MaskSet masks = allocator.generate_sparsity(metrics);
    // floor(0.5 * 3) = 1 block -> channels 2 and 3
    const float* w = masks.at("conv").weight.data_ptr<float>();
    for (int64_t c = 0; c < 6; ++c) {
        float expected = (c == 2 || c == 3) ? 0.0f : 1.0f;
        EXPECT_FLOAT_EQ(w[c * 18], expected) << "channel " << c;
    }
}

TEST(BlockAllocatorTest, RequiresBlockSize) {
    ModelSpec model({make_layer("fc", {4, 4}, 0.5)});
    AllocatorOptions opts;
    opts.mode = AllocatorMode::Block;
    EXPECT_THROW(BlockSparsityAllocator(model, opts), ConfigError);

    // A per-layer block is enough
    LayerSpec layer = make_layer("fc", {4, 4}, 0.5);
    layer.config.block_sparse_size = std::vector<int64_t>{2, 2};
    EXPECT_NO_THROW(BlockSparsityAllocator(ModelSpec({layer}), opts));
}

// ============================================================================
// Balance
// ============================================================================

TEST(BankAllocatorTest, EqualSparsityPerBank) {
    ModelSpec model({make_layer("fc", {2, 8}, 0.5)});
    AllocatorOptions opts;
    opts.mode = AllocatorMode::Balance;
    opts.balance_gran = {4};
    BankSparsityAllocator allocator(model, opts);

    // Each row has two banks of 4; bank values are deliberately skewed
    MetricMap metrics;
    metrics.emplace("fc", Tensor::from_values({2, 8}, {
        10, 11, 12, 13,   1, 2, 3, 4,
        5, 1, 7, 3,       100, 200, 50, 60,
    }));

    MaskSet masks = allocator.generate_sparsity(metrics);
    EXPECT_EQ(masks.at("fc").weight.to_vector(), (std::vector<float>{
        0, 0, 1, 1,   0, 0, 1, 1,
        1, 0, 1, 0,   1, 1, 0, 0,
    }));
}

TEST(BankAllocatorTest, MisalignedGranularity) {
    ModelSpec model({make_layer("fc", {2, 6}, 0.5)});
    AllocatorOptions opts;
    opts.mode = AllocatorMode::Balance;
    opts.balance_gran = {4};
    BankSparsityAllocator allocator(model, opts);

    MetricMap metrics;
    metrics.emplace("fc", index_metric({2, 6}));
    EXPECT_THROW(allocator.generate_sparsity(metrics), ConfigError);
}

// ============================================================================
// Factory
// ============================================================================

TEST(CreateAllocatorTest, ModeSelectsImplementation) {
    ModelSpec model({make_layer("fc", {4, 4}, 0.5)});

    AllocatorOptions opts;
    EXPECT_EQ(create_allocator(model, opts)->name(), "normal");

    opts.mode = AllocatorMode::Global;
    EXPECT_EQ(create_allocator(model, opts)->name(), "global");

    opts.mode = AllocatorMode::Balance;
    opts.balance_gran = {2};
    EXPECT_EQ(create_allocator(model, opts)->name(), "balance");

    opts.mode = AllocatorMode::Block;
    opts.block_sparse_size = std::vector<int64_t>{2, 2};
    EXPECT_EQ(create_allocator(model, opts)->name(), "block");
}

TEST(CreateAllocatorTest, InvalidOptions) {
    ModelSpec model({make_layer("fc", {4, 4}, 0.5)});
    AllocatorOptions opts;
    opts.mode = AllocatorMode::Balance;
    EXPECT_THROW(create_allocator(model, opts), ConfigError);
}
