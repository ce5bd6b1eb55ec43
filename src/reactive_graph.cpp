#include "reactdag/reactive_graph.h"
#include <algorithm>
#include <queue>
#include <glog/logging.h>

namespace reactdag {

double combine(CombineOp op, const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    switch (op) {
        case CombineOp::SUM: {
            double total = 0.0;
            for (double v : values) total += v;
            return total;
        }
        case CombineOp::PRODUCT: {
            double total = 1.0;
            for (double v : values) total *= v;
            return total;
        }
        case CombineOp::MIN:
            return *std::min_element(values.begin(), values.end());
        case CombineOp::MAX:
            return *std::max_element(values.begin(), values.end());
        case CombineOp::MEAN: {
            double total = 0.0;
            for (double v : values) total += v;
            return total / static_cast<double>(values.size());
        }
        case CombineOp::DIFFERENCE:
            return values.size() < 2 ? values[0] : values[0] - values[1];
        case CombineOp::RATIO:
            return values.size() < 2 ? values[0] : values[0] / values[1];
    }
    return 0.0;
}

ReactiveGraph::ReactiveGraph()
    : runtime_(std::make_unique<Runtime>()) {
}

ReactiveGraph::~ReactiveGraph() = default;

void ReactiveGraph::clear() {
    effects_.clear();
    computeds_.clear();
    signals_.clear();
    readers_.clear();
    creation_order_.clear();
    steps_.clear();
}

bool ReactiveGraph::build(const GraphConfig& config, EffectObserver observer) {
    clear();
    runtime_ = std::make_unique<Runtime>(config.runtime);
    observer_ = std::move(observer);

    // Nodes bind to the current runtime when constructed
    RuntimeScope scope(*runtime_);

    // First pass: signals
    for (const auto& definition : config.signals) {
        if (readers_.count(definition.name)) {
            LOG(ERROR) << "Duplicate node name '" << definition.name << "'";
            return false;
        }
        auto signal = std::make_unique<Signal<double>>(definition.initial, definition.name);
        Signal<double>* raw = signal.get();
        readers_[definition.name] = [raw]() { return raw->read(); };
        signals_[definition.name] = std::move(signal);
        creation_order_.push_back(definition.name);
    }

    // Second pass: computeds, inputs before the nodes reading them
    std::vector<const ComputedDefinition*> order;
    if (!order_computeds(config.computeds, order)) {
        return false;
    }

    for (const auto* definition : order) {
        std::vector<Reader> inputs;
        if (!resolve_readers(definition->name, definition->inputs, inputs)) {
            return false;
        }

        CombineOp op = definition->op;
        double scale = definition->scale;
        double offset = definition->offset;
        auto computed = std::make_unique<Computed<double>>(
            [inputs, op, scale, offset]() {
                std::vector<double> values;
                values.reserve(inputs.size());
                for (const auto& input : inputs) {
                    values.push_back(input());
                }
                return combine(op, values) * scale + offset;
            },
            definition->name);

        Computed<double>* raw = computed.get();
        readers_[definition->name] = [raw]() { return raw->read(); };
        computeds_[definition->name] = std::move(computed);
        creation_order_.push_back(definition->name);
    }

    // Third pass: effects, which run as soon as they are created
    for (const auto& definition : config.effects) {
        if (readers_.count(definition.name) || effects_.count(definition.name)) {
            LOG(ERROR) << "Duplicate node name '" << definition.name << "'";
            return false;
        }

        std::vector<Reader> watched;
        if (!resolve_readers(definition.name, definition.watch, watched)) {
            return false;
        }

        std::string name = definition.name;
        std::vector<std::string> watch = definition.watch;
        const EffectObserver* observer = &observer_;
        Effect::Body body = [name, watch, watched, observer]() -> Cleanup {
            NamedValues values;
            values.reserve(watched.size());
            for (std::size_t i = 0; i < watched.size(); ++i) {
                values.emplace_back(watch[i], watched[i]());
            }
            if (*observer) {
                (*observer)(name, values);
            }
            return Cleanup{};
        };

        effects_[definition.name] =
            std::make_unique<Effect>(std::move(body), definition.manual, definition.name);
        creation_order_.push_back(definition.name);
    }

    steps_ = config.steps;

    LOG(INFO) << "Built reactive graph with " << creation_order_.size() << " nodes";
    LOG(INFO) << "Creation order:";
    for (const auto& name : creation_order_) {
        LOG(INFO) << "  " << name;
    }
    return true;
}

bool ReactiveGraph::order_computeds(const std::vector<ComputedDefinition>& computeds,
                                    std::vector<const ComputedDefinition*>& order) {
    order.clear();

    std::unordered_map<std::string, const ComputedDefinition*> by_name;
    for (const auto& computed : computeds) {
        if (readers_.count(computed.name) || !by_name.emplace(computed.name, &computed).second) {
            LOG(ERROR) << "Duplicate node name '" << computed.name << "'";
            return false;
        }
    }

    // Edges from computed inputs to the computeds reading them
    std::unordered_map<const ComputedDefinition*, int> in_degrees;
    std::unordered_map<const ComputedDefinition*, std::vector<const ComputedDefinition*>> dependents;
    for (const auto& computed : computeds) {
        in_degrees.emplace(&computed, 0);
        for (const auto& input : computed.inputs) {
            auto it = by_name.find(input);
            if (it != by_name.end()) {
                dependents[it->second].push_back(&computed);
                in_degrees[&computed]++;
            } else if (!readers_.count(input)) {
                LOG(ERROR) << "Computed '" << computed.name
                           << "' depends on '" << input
                           << "' which doesn't exist";
                return false;
            }
        }
    }

    std::queue<const ComputedDefinition*> queue;
    for (const auto& computed : computeds) {
        if (in_degrees[&computed] == 0) {
            queue.push(&computed);
        }
    }

    while (!queue.empty()) {
        const auto* computed = queue.front();
        queue.pop();
        order.push_back(computed);

        for (const auto* dependent : dependents[computed]) {
            if (--in_degrees[dependent] == 0) {
                queue.push(dependent);
            }
        }
    }

    if (order.size() != computeds.size()) {
        LOG(ERROR) << "Dependency cycle detected between computeds";
        return false;
    }
    return true;
}

bool ReactiveGraph::resolve_readers(const std::string& owner,
                                    const std::vector<std::string>& names,
                                    std::vector<Reader>& readers) const {
    readers.clear();
    for (const auto& name : names) {
        auto it = readers_.find(name);
        if (it == readers_.end()) {
            LOG(ERROR) << "'" << owner << "' depends on '" << name << "' which doesn't exist";
            return false;
        }
        readers.push_back(it->second);
    }
    return true;
}

bool ReactiveGraph::apply(const GraphStep& step) {
    if (const auto* write_step = std::get_if<WriteStep>(&step)) {
        for (const auto& [name, value] : write_step->values) {
            if (!write(name, value)) {
                return false;
            }
        }
        return true;
    }
    if (const auto* batch_step = std::get_if<BatchStep>(&step)) {
        return batch_write(batch_step->values);
    }
    if (const auto* stop_step = std::get_if<StopStep>(&step)) {
        return stop_effect(stop_step->effect);
    }
    return run_effect(std::get<RunStep>(step).effect);
}

bool ReactiveGraph::apply_all() {
    for (std::size_t i = 0; i < steps_.size(); ++i) {
        VLOG(1) << "Applying step " << (i + 1) << " of " << steps_.size();
        if (!apply(steps_[i])) {
            LOG(ERROR) << "Step " << (i + 1) << " failed";
            return false;
        }
    }
    return true;
}

bool ReactiveGraph::write(const std::string& name, double value) {
    auto* signal = get_signal(name);
    if (!signal) {
        LOG(ERROR) << "Cannot write to unknown signal '" << name << "'";
        return false;
    }
    signal->write(value);
    return true;
}

bool ReactiveGraph::batch_write(const NamedValues& values) {
    std::vector<std::pair<Signal<double>*, double>> writes;
    writes.reserve(values.size());
    for (const auto& [name, value] : values) {
        auto* signal = get_signal(name);
        if (!signal) {
            LOG(ERROR) << "Cannot write to unknown signal '" << name << "'";
            return false;
        }
        writes.emplace_back(signal, value);
    }

    runtime_->batch().run([&writes]() {
        for (auto& [signal, value] : writes) {
            signal->write(value);
        }
    });
    return true;
}

bool ReactiveGraph::stop_effect(const std::string& name) {
    auto* effect = get_effect(name);
    if (!effect) {
        LOG(ERROR) << "Unknown effect '" << name << "'";
        return false;
    }
    effect->stop();
    return true;
}

bool ReactiveGraph::run_effect(const std::string& name) {
    auto* effect = get_effect(name);
    if (!effect) {
        LOG(ERROR) << "Unknown effect '" << name << "'";
        return false;
    }
    effect->run();
    return true;
}

std::optional<double> ReactiveGraph::value(const std::string& name) {
    if (auto* signal = get_signal(name)) {
        return signal->peek();
    }
    if (auto* computed = get_computed(name)) {
        // Refresh without tracking
        if (runtime_->evaluation_stack().empty()) {
            return computed->read();
        }
        return computed->peek();
    }
    return std::nullopt;
}

Signal<double>* ReactiveGraph::get_signal(const std::string& name) {
    auto it = signals_.find(name);
    return it != signals_.end() ? it->second.get() : nullptr;
}

Computed<double>* ReactiveGraph::get_computed(const std::string& name) {
    auto it = computeds_.find(name);
    return it != computeds_.end() ? it->second.get() : nullptr;
}

Effect* ReactiveGraph::get_effect(const std::string& name) {
    auto it = effects_.find(name);
    return it != effects_.end() ? it->second.get() : nullptr;
}

} // namespace reactdag
