#include <gtest/gtest.h>
#include "maskalloc/pruning/pruner.hpp"
#include "maskalloc/errors.hpp"

using namespace maskalloc;
using namespace maskalloc::pruning;

namespace {

LayerSpec make_layer(const std::string& name, std::vector<int64_t> weight_shape,
                     double sparsity, int group_id) {
    LayerSpec layer;
    layer.name = name;
    layer.op_type = "Linear";
    layer.weight_shape = std::move(weight_shape);
    layer.weight_name = name + ".weight";
    layer.group_id = group_id;
    layer.config.total_sparsity = sparsity;
    return layer;
}

ModelSpec two_layer_model() {
    return ModelSpec({
        make_layer("fc1", {4, 4}, 0.5, 0),
        make_layer("fc2", {2, 5}, 0.2, 1),
    });
}

Tensor ramp(const std::vector<int64_t>& shape, float start, float step) {
    Tensor t(shape, DType::Float32);
    float* data = t.data_ptr<float>();
    for (int64_t i = 0; i < t.num_elements(); ++i) {
        data[i] = start + step * static_cast<float>(i);
    }
    return t;
}

MetricMap ramp_metrics(float step) {
    MetricMap metrics;
    float start = step > 0 ? 1.0f : 100.0f;
    metrics.emplace("fc1", ramp({4, 4}, start, step));
    metrics.emplace("fc2", ramp({2, 5}, start, step));
    return metrics;
}

} // anonymous namespace

TEST(SparsityPrunerTest, InitialState) {
    SparsityPruner pruner(two_layer_model(), AllocatorOptions{});

    EXPECT_TRUE(pruner.masks().empty());
    EXPECT_EQ(pruner.rounds(), 0);
    EXPECT_EQ(pruner.allocator().name(), "normal");

    auto stats = pruner.get_stats();
    EXPECT_EQ(stats.total_params, 26);
    EXPECT_EQ(stats.nonzero_params, 26);
    EXPECT_DOUBLE_EQ(stats.overall_sparsity, 0.0);
    EXPECT_DOUBLE_EQ(stats.compression_ratio(), 1.0);
}

TEST(SparsityPrunerTest, CompressProducesMasks) {
    SparsityPruner pruner(two_layer_model(), AllocatorOptions{});

    const MaskSet& masks = pruner.compress(ramp_metrics(1.0f));
    EXPECT_EQ(masks.size(), 2);
    EXPECT_EQ(pruner.rounds(), 1);
    EXPECT_EQ(masks.at("fc1").count_zeros(), 8);
    EXPECT_EQ(masks.at("fc2").count_zeros(), 2);

    auto stats = pruner.get_stats();
    EXPECT_EQ(stats.nonzero_params, 16);
    EXPECT_DOUBLE_EQ(stats.layer_sparsity.at("fc1"), 0.5);
    EXPECT_DOUBLE_EQ(stats.layer_sparsity.at("fc2"), 0.2);
    EXPECT_DOUBLE_EQ(stats.group_sparsity.at(0), 0.5);
    EXPECT_NEAR(stats.overall_sparsity, 10.0 / 26.0, 1e-12);
    EXPECT_NEAR(stats.compression_ratio(), 26.0 / 16.0, 1e-12);
}

TEST(SparsityPrunerTest, ContinuousRoundsNeverRegrow) {
    SparsityPruner pruner(two_layer_model(), AllocatorOptions{});

    MaskSet first = pruner.compress(ramp_metrics(1.0f));
    // Importance order reversed in the second round
    const MaskSet& second = pruner.compress(ramp_metrics(-1.0f));
    EXPECT_EQ(pruner.rounds(), 2);

    for (const auto& [name, mask] : first) {
        const float* before = mask.weight.data_ptr<float>();
        const float* after = second.at(name).weight.data_ptr<float>();
        for (int64_t i = 0; i < mask.weight.num_elements(); ++i) {
            if (before[i] == 0.0f) {
                EXPECT_FLOAT_EQ(after[i], 0.0f) << name << " element " << i;
            }
        }
    }
}

TEST(SparsityPrunerTest, ContinuousRoundsKeepPrunedBias) {
    LayerSpec conv = make_layer("conv", {4, 2, 3, 3}, 0.5, 0);
    conv.op_type = "Conv";
    conv.bias_shape = std::vector<int64_t>{4};
    AllocatorOptions opts;
    opts.dim = std::vector<int64_t>{0};
    SparsityPruner pruner(ModelSpec({conv}), opts);

    MetricMap first;
    first.emplace("conv", Tensor::from_values({4}, {4, 3, 2, 1}));
    pruner.compress(first);
    ASSERT_TRUE(pruner.masks().at("conv").bias.has_value());
    EXPECT_EQ(pruner.masks().at("conv").bias->to_vector(), (std::vector<float>{1, 1, 0, 0}));

    MetricMap second;
    second.emplace("conv", Tensor::from_values({4}, {1, 2, 3, 4}));
    const MaskSet& masks = pruner.compress(second);
    EXPECT_EQ(masks.at("conv").bias->to_vector(), (std::vector<float>{1, 1, 0, 0}));
    EXPECT_EQ(masks.at("conv").count_nonzero(), 2 * 18);
}

TEST(SparsityPrunerTest, FailedRoundKeepsPreviousMasks) {
    SparsityPruner pruner(two_layer_model(), AllocatorOptions{});
    pruner.compress(ramp_metrics(1.0f));

    MetricMap incomplete;
    incomplete.emplace("fc1", ramp({4, 4}, 1.0f, 1.0f));
    EXPECT_THROW(pruner.compress(incomplete), ConfigError);

    EXPECT_EQ(pruner.rounds(), 1);
    EXPECT_EQ(pruner.masks().size(), 2);
    EXPECT_EQ(pruner.masks().at("fc1").count_zeros(), 8);
}

TEST(SparsityPrunerTest, ResetForgetsHistory) {
    SparsityPruner pruner(two_layer_model(), AllocatorOptions{});
    pruner.compress(ramp_metrics(1.0f));
    pruner.reset();

    EXPECT_TRUE(pruner.masks().empty());
    EXPECT_EQ(pruner.rounds(), 0);

    // Fresh round follows the new metric alone
    const MaskSet& masks = pruner.compress(ramp_metrics(-1.0f));
    EXPECT_FLOAT_EQ(masks.at("fc1").weight.data_ptr<float>()[0], 1.0f);
}

TEST(SparsityPrunerTest, ApplyMasksWeight) {
    SparsityPruner pruner(two_layer_model(), AllocatorOptions{});
    Tensor weight = Tensor::full({4, 4}, 2.0f);

    // Before the first round the weight is untouched
    EXPECT_EQ(pruner.apply("fc1", weight).to_vector(), weight.to_vector());

    pruner.compress(ramp_metrics(1.0f));
    Tensor pruned = pruner.apply("fc1", weight);
    auto values = pruned.to_vector();
    for (int i = 0; i < 16; ++i) {
        EXPECT_FLOAT_EQ(values[i], i < 8 ? 0.0f : 2.0f);
    }

    EXPECT_THROW(pruner.apply("fc1", Tensor({2, 2})), ShapeMismatchError);
    EXPECT_THROW(pruner.apply("unknown", weight), ConfigError);
}

TEST(SparsityPrunerTest, CompressFromCollector) {
    auto graph = std::make_shared<Graph>();
    graph->add_initializer("fc1.weight", Tensor::from_values({4, 4}, {
        -8, 1, 2, 3,
        4, -5, 6, 7,
        0.1f, 9, -10, 11,
        12, 13, 14, -15,
    }));
    graph->add_initializer("fc2.weight", ramp({2, 5}, 1.0f, 1.0f));

    ModelSpec model = two_layer_model();
    SparsityPruner pruner(model, AllocatorOptions{});
    WeightDataCollector collector(graph, model);
    NormMetricsCalculator calculator;

    const MaskSet& masks = pruner.compress(collector, calculator);
    // Eight smallest magnitudes of fc1: 0.1, 1, 2, 3, 4, 5, 6, 7
    const float* m = masks.at("fc1").weight.data_ptr<float>();
    EXPECT_FLOAT_EQ(m[0], 1.0f);
    EXPECT_FLOAT_EQ(m[8], 0.0f);
    EXPECT_FLOAT_EQ(m[15], 1.0f);
    EXPECT_EQ(masks.at("fc1").count_zeros(), 8);
}

TEST(SparsityPrunerTest, ExportReport) {
    SparsityPruner pruner(two_layer_model(), AllocatorOptions{});
    pruner.compress(ramp_metrics(1.0f));

    std::string report = pruner.export_report();
    EXPECT_NE(report.find("Pruning Report"), std::string::npos);
    EXPECT_NE(report.find("Mode: normal"), std::string::npos);
    EXPECT_NE(report.find("fc1"), std::string::npos);
    EXPECT_NE(report.find("fc2"), std::string::npos);
}

TEST(SparsityPrunerTest, InvalidConfiguration) {
    AllocatorOptions opts;
    opts.mode = AllocatorMode::DependencyAware;
    opts.dim = std::vector<int64_t>{0};
    EXPECT_THROW(SparsityPruner(two_layer_model(), opts), ConfigError);
}
