#include <gtest/gtest.h>
#include "maskalloc/pruning/metrics.hpp"
#include "maskalloc/errors.hpp"

using namespace maskalloc;
using namespace maskalloc::pruning;

TEST(NormMetricsCalculatorTest, ElementwiseMagnitude) {
    NormMetricsCalculator calculator;

    CollectedData data;
    data.emplace("fc", Tensor::from_values({2, 2}, {-1.0f, 2.0f, -3.0f, 0.5f}));

    MetricMap metrics = calculator.calculate_metrics(data);
    EXPECT_EQ(metrics.at("fc").to_vector(), (std::vector<float>{1.0f, 2.0f, 3.0f, 0.5f}));
}

TEST(NormMetricsCalculatorTest, L2PerOutputChannel) {
    NormMetricsCalculator calculator(2.0, std::vector<int64_t>{0});

    CollectedData data;
    data.emplace("fc", Tensor::from_values({2, 2}, {3.0f, -4.0f, 0.0f, 1.0f}));

    Tensor metric = calculator.calculate_metrics(data).at("fc");
    ASSERT_EQ(metric.shape(), (std::vector<int64_t>{2}));
    EXPECT_NEAR(metric.data_ptr<float>()[0], 5.0f, 1e-5f);
    EXPECT_NEAR(metric.data_ptr<float>()[1], 1.0f, 1e-5f);
}

TEST(NormMetricsCalculatorTest, BlockAverageWithEdges) {
    NormMetricsCalculator calculator(1.0, std::nullopt, std::vector<int64_t>{2});

    CollectedData data;
    data.emplace("fc", Tensor::from_values({5}, {1, 3, -2, 2, 10}));

    Tensor metric = calculator.calculate_metrics(data).at("fc");
    // Edge block holds a single element
    EXPECT_EQ(metric.to_vector(), (std::vector<float>{2, 2, 10}));
}

TEST(NormMetricsCalculatorTest, InvalidParameters) {
    EXPECT_THROW(NormMetricsCalculator(0.0), ConfigError);
    EXPECT_THROW(NormMetricsCalculator(1.0, std::vector<int64_t>{-1}), ConfigError);
    EXPECT_THROW(NormMetricsCalculator(1.0, std::nullopt, std::vector<int64_t>{0}), ConfigError);

    NormMetricsCalculator out_of_range(1.0, std::vector<int64_t>{0, 3});
    CollectedData data;
    data.emplace("fc", Tensor({2, 2}));
    EXPECT_THROW(out_of_range.calculate_metrics(data), ConfigError);
}

TEST(WeightDataCollectorTest, ReadsInitializers) {
    auto graph = std::make_shared<Graph>();
    graph->add_initializer("fc.weight", Tensor::full({2, 3}, 0.5f));

    LayerSpec layer;
    layer.name = "fc";
    layer.op_type = "Linear";
    layer.weight_shape = {2, 3};
    layer.weight_name = "fc.weight";

    WeightDataCollector collector(graph, ModelSpec({layer}));
    CollectedData data = collector.collect();
    ASSERT_EQ(data.count("fc"), 1);
    EXPECT_EQ(data.at("fc").num_elements(), 6);

    layer.weight_name = "missing";
    EXPECT_THROW(WeightDataCollector(graph, ModelSpec({layer})), ConfigError);
}
