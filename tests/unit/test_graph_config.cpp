#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>
#include "reactdag/graph_config.h"

using namespace reactdag;

class GraphConfigTest : public ::testing::Test {
protected:
    std::optional<GraphConfig> Load(const std::string& text) {
        return load_graph_config(YAML::Load(text));
    }
};

// Test a complete description
TEST_F(GraphConfigTest, ParsesAllSections) {
    auto config = Load(R"(
runtime:
  max_drain_steps: 500
signals:
  - name: speed
    initial: 12.5
  - name: factor
computeds:
  - name: scaled
    op: product
    inputs: [speed, factor]
    scale: 3.6
    offset: 1
effects:
  - name: dashboard
    watch: [scaled]
  - name: logger
    watch: speed
    manual: true
steps:
  - write: { speed: 20 }
  - batch: { speed: 21, factor: 2 }
  - stop: dashboard
  - run: logger
)");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->runtime.max_drain_steps, 500u);

    ASSERT_EQ(config->signals.size(), 2u);
    EXPECT_EQ(config->signals[0].name, "speed");
    EXPECT_DOUBLE_EQ(config->signals[0].initial, 12.5);
    EXPECT_DOUBLE_EQ(config->signals[1].initial, 0.0);

    ASSERT_EQ(config->computeds.size(), 1u);
    const auto& scaled = config->computeds[0];
    EXPECT_EQ(scaled.op, CombineOp::PRODUCT);
    EXPECT_EQ(scaled.inputs, (std::vector<std::string>{"speed", "factor"}));
    EXPECT_DOUBLE_EQ(scaled.scale, 3.6);
    EXPECT_DOUBLE_EQ(scaled.offset, 1.0);

    ASSERT_EQ(config->effects.size(), 2u);
    EXPECT_FALSE(config->effects[0].manual);
    EXPECT_EQ(config->effects[1].watch, std::vector<std::string>{"speed"});
    EXPECT_TRUE(config->effects[1].manual);

    ASSERT_EQ(config->steps.size(), 4u);
    ASSERT_TRUE(std::holds_alternative<WriteStep>(config->steps[0]));
    const auto& batch = std::get<BatchStep>(config->steps[1]);
    ASSERT_EQ(batch.values.size(), 2u);
    EXPECT_EQ(batch.values[0].first, "speed");
    EXPECT_DOUBLE_EQ(batch.values[1].second, 2.0);
    EXPECT_EQ(std::get<StopStep>(config->steps[2]).effect, "dashboard");
    EXPECT_EQ(std::get<RunStep>(config->steps[3]).effect, "logger");
}

TEST_F(GraphConfigTest, DefaultsWhenSectionsMissing) {
    auto config = Load("signals:\n  - name: only\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->runtime.max_drain_steps, 0u);
    EXPECT_TRUE(config->computeds.empty());
    EXPECT_TRUE(config->steps.empty());
}

TEST_F(GraphConfigTest, CombineOpNames) {
    EXPECT_EQ(parse_combine_op("mean"), CombineOp::MEAN);
    EXPECT_EQ(parse_combine_op("ratio"), CombineOp::RATIO);
    EXPECT_FALSE(parse_combine_op("median").has_value());
    EXPECT_STREQ(to_string(CombineOp::DIFFERENCE), "difference");
}

TEST_F(GraphConfigTest, RejectsNonMapRoot) {
    EXPECT_FALSE(Load("- a\n- b\n").has_value());
}

TEST_F(GraphConfigTest, RejectsUnknownOp) {
    EXPECT_FALSE(Load(R"(
signals: [{name: a}]
computeds: [{name: b, op: median, inputs: [a]}]
)").has_value());
}

TEST_F(GraphConfigTest, RejectsDuplicateNames) {
    EXPECT_FALSE(Load(R"(
signals: [{name: a}]
effects: [{name: a, watch: [a]}]
)").has_value());
}

TEST_F(GraphConfigTest, RejectsMissingName) {
    EXPECT_FALSE(Load("signals: [{initial: 1}]\n").has_value());
}

TEST_F(GraphConfigTest, RejectsComputedWithoutInputs) {
    EXPECT_FALSE(Load(R"(
computeds: [{name: lonely, op: sum}]
)").has_value());
}

TEST_F(GraphConfigTest, RejectsWrongArityForBinaryOps) {
    EXPECT_FALSE(Load(R"(
signals: [{name: a}, {name: b}, {name: c}]
computeds: [{name: d, op: difference, inputs: [a, b, c]}]
)").has_value());
}

TEST_F(GraphConfigTest, RejectsStepsOnUnknownNodes) {
    EXPECT_FALSE(Load(R"(
signals: [{name: a}]
steps:
  - write: { b: 1 }
)").has_value());

    EXPECT_FALSE(Load(R"(
signals: [{name: a}]
steps:
  - stop: a
)").has_value());
}

TEST_F(GraphConfigTest, RejectsMalformedSteps) {
    EXPECT_FALSE(Load(R"(
signals: [{name: a}]
steps:
  - explode: a
)").has_value());

    EXPECT_FALSE(Load(R"(
signals: [{name: a}]
steps:
  - write: 3
)").has_value());

    EXPECT_FALSE(Load(R"(
signals: [{name: a}]
steps:
  - write: { a: not-a-number }
)").has_value());
}

TEST_F(GraphConfigTest, MissingFile) {
    EXPECT_FALSE(load_graph_config_file("/nonexistent/graph.yaml").has_value());
}
