#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "reactdag/runtime.h"

namespace reactdag {

// How a configured computed combines its inputs
enum class CombineOp {
    SUM,
    PRODUCT,
    MIN,
    MAX,
    MEAN,
    DIFFERENCE,  // first - second
    RATIO        // first / second
};

std::optional<CombineOp> parse_combine_op(const std::string& text);
const char* to_string(CombineOp op);

struct SignalDefinition {
    std::string name;
    double initial = 0.0;
};

struct ComputedDefinition {
    std::string name;
    CombineOp op = CombineOp::SUM;
    std::vector<std::string> inputs;  // Signal or computed names
    // result = op(inputs) * scale + offset
    double scale = 1.0;
    double offset = 0.0;
};

struct EffectDefinition {
    std::string name;
    std::vector<std::string> watch;
    bool manual = false;
};

using NamedValues = std::vector<std::pair<std::string, double>>;

// Scripted actions applied after the graph is built
struct WriteStep {
    NamedValues values;  // One propagation per value
};

struct BatchStep {
    NamedValues values;  // One propagation for all values
};

struct StopStep {
    std::string effect;
};

struct RunStep {
    std::string effect;
};

using GraphStep = std::variant<WriteStep, BatchStep, StopStep, RunStep>;

struct GraphConfig {
    RuntimeOptions runtime;
    std::vector<SignalDefinition> signals;
    std::vector<ComputedDefinition> computeds;
    std::vector<EffectDefinition> effects;
    std::vector<GraphStep> steps;
};

// Parse a graph description. Problems are logged and yield std::nullopt.
std::optional<GraphConfig> load_graph_config(const YAML::Node& root);
std::optional<GraphConfig> load_graph_config_file(const std::string& path);

} // namespace reactdag
