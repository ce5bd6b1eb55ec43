#include "reactdag/graph_config.h"
#include <unordered_map>
#include <unordered_set>
#include <glog/logging.h>

namespace reactdag {

namespace {

std::vector<std::string> parse_names(const YAML::Node& node) {
    std::vector<std::string> names;
    if (!node) {
        return names;
    }
    if (node.IsScalar()) {
        names.push_back(node.as<std::string>());
        return names;
    }
    for (const auto& item : node) {
        names.push_back(item.as<std::string>());
    }
    return names;
}

bool parse_named_values(const YAML::Node& node, const char* step_kind, NamedValues& values) {
    if (!node.IsMap()) {
        LOG(ERROR) << "'" << step_kind << "' step needs a map of signal names to values";
        return false;
    }
    for (const auto& entry : node) {
        values.emplace_back(entry.first.as<std::string>(), entry.second.as<double>());
    }
    return true;
}

bool parse_step(const YAML::Node& node, GraphStep& step) {
    if (!node.IsMap() || node.size() != 1) {
        LOG(ERROR) << "Each step needs exactly one of write, batch, stop or run";
        return false;
    }

    if (node["write"]) {
        WriteStep write;
        if (!parse_named_values(node["write"], "write", write.values)) {
            return false;
        }
        step = std::move(write);
    } else if (node["batch"]) {
        BatchStep batch;
        if (!parse_named_values(node["batch"], "batch", batch.values)) {
            return false;
        }
        step = std::move(batch);
    } else if (node["stop"]) {
        step = StopStep{node["stop"].as<std::string>()};
    } else if (node["run"]) {
        step = RunStep{node["run"].as<std::string>()};
    } else {
        LOG(ERROR) << "Unknown step type: " << node.begin()->first.as<std::string>();
        return false;
    }
    return true;
}

bool validate(const GraphConfig& config) {
    std::unordered_set<std::string> names;
    std::unordered_set<std::string> signal_names;
    std::unordered_set<std::string> effect_names;

    auto claim = [&names](const std::string& name, const char* kind) {
        if (name.empty()) {
            LOG(ERROR) << "A " << kind << " has no name";
            return false;
        }
        if (!names.insert(name).second) {
            LOG(ERROR) << "Duplicate node name '" << name << "'";
            return false;
        }
        return true;
    };

    for (const auto& signal : config.signals) {
        if (!claim(signal.name, "signal")) {
            return false;
        }
        signal_names.insert(signal.name);
    }

    for (const auto& computed : config.computeds) {
        if (!claim(computed.name, "computed")) {
            return false;
        }
        if (computed.inputs.empty()) {
            LOG(ERROR) << "Computed '" << computed.name << "' has no inputs";
            return false;
        }
        bool binary = computed.op == CombineOp::DIFFERENCE || computed.op == CombineOp::RATIO;
        if (binary && computed.inputs.size() != 2) {
            LOG(ERROR) << "Computed '" << computed.name << "' uses " << to_string(computed.op)
                       << " which needs exactly 2 inputs, got " << computed.inputs.size();
            return false;
        }
    }

    for (const auto& effect : config.effects) {
        if (!claim(effect.name, "effect")) {
            return false;
        }
        effect_names.insert(effect.name);
    }

    auto check_signals = [&signal_names](const NamedValues& values) {
        for (const auto& [name, value] : values) {
            if (!signal_names.count(name)) {
                LOG(ERROR) << "Step writes to '" << name << "' which is not a signal";
                return false;
            }
        }
        return true;
    };

    for (const auto& step : config.steps) {
        if (const auto* write = std::get_if<WriteStep>(&step)) {
            if (!check_signals(write->values)) {
                return false;
            }
        } else if (const auto* batch = std::get_if<BatchStep>(&step)) {
            if (!check_signals(batch->values)) {
                return false;
            }
        } else {
            const std::string& effect = std::holds_alternative<StopStep>(step)
                ? std::get<StopStep>(step).effect
                : std::get<RunStep>(step).effect;
            if (!effect_names.count(effect)) {
                LOG(ERROR) << "Step refers to unknown effect '" << effect << "'";
                return false;
            }
        }
    }

    return true;
}

} // namespace

std::optional<CombineOp> parse_combine_op(const std::string& text) {
    static const std::unordered_map<std::string, CombineOp> ops = {
        {"sum", CombineOp::SUM},
        {"product", CombineOp::PRODUCT},
        {"min", CombineOp::MIN},
        {"max", CombineOp::MAX},
        {"mean", CombineOp::MEAN},
        {"difference", CombineOp::DIFFERENCE},
        {"ratio", CombineOp::RATIO},
    };
    auto it = ops.find(text);
    if (it == ops.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* to_string(CombineOp op) {
    switch (op) {
        case CombineOp::SUM: return "sum";
        case CombineOp::PRODUCT: return "product";
        case CombineOp::MIN: return "min";
        case CombineOp::MAX: return "max";
        case CombineOp::MEAN: return "mean";
        case CombineOp::DIFFERENCE: return "difference";
        case CombineOp::RATIO: return "ratio";
    }
    return "unknown";
}

std::optional<GraphConfig> load_graph_config(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        LOG(ERROR) << "Graph config must be a YAML map";
        return std::nullopt;
    }

    GraphConfig config;
    try {
        if (root["runtime"]) {
            config.runtime.max_drain_steps =
                root["runtime"]["max_drain_steps"].as<std::size_t>(0);
        }

        const YAML::Node signals_node = root["signals"];
        for (const auto& node : signals_node) {
            SignalDefinition signal;
            signal.name = node["name"].as<std::string>("");
            signal.initial = node["initial"].as<double>(0.0);
            config.signals.push_back(std::move(signal));
        }

        const YAML::Node computeds_node = root["computeds"];
        for (const auto& node : computeds_node) {
            ComputedDefinition computed;
            computed.name = node["name"].as<std::string>("");
            const std::string op = node["op"].as<std::string>("sum");
            auto parsed = parse_combine_op(op);
            if (!parsed) {
                LOG(ERROR) << "Computed '" << computed.name << "' has unknown op '" << op << "'";
                return std::nullopt;
            }
            computed.op = *parsed;
            computed.inputs = parse_names(node["inputs"]);
            computed.scale = node["scale"].as<double>(1.0);
            computed.offset = node["offset"].as<double>(0.0);
            config.computeds.push_back(std::move(computed));
        }

        const YAML::Node effects_node = root["effects"];
        for (const auto& node : effects_node) {
            EffectDefinition effect;
            effect.name = node["name"].as<std::string>("");
            effect.watch = parse_names(node["watch"]);
            effect.manual = node["manual"].as<bool>(false);
            config.effects.push_back(std::move(effect));
        }

        const YAML::Node steps_node = root["steps"];
        for (const auto& node : steps_node) {
            GraphStep step;
            if (!parse_step(node, step)) {
                return std::nullopt;
            }
            config.steps.push_back(std::move(step));
        }
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Invalid graph config: " << e.what();
        return std::nullopt;
    }

    if (!validate(config)) {
        return std::nullopt;
    }

    LOG(INFO) << "Loaded graph config: " << config.signals.size() << " signals, "
              << config.computeds.size() << " computeds, "
              << config.effects.size() << " effects, "
              << config.steps.size() << " steps";
    return config;
}

std::optional<GraphConfig> load_graph_config_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to load graph config " << path << ": " << e.what();
        return std::nullopt;
    }
    return load_graph_config(root);
}

} // namespace reactdag
