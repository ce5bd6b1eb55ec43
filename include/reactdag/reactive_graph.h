#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "reactdag/computed.h"
#include "reactdag/effect.h"
#include "reactdag/graph_config.h"
#include "reactdag/runtime.h"
#include "reactdag/signal.h"

namespace reactdag {

// Called by a configured effect every time it runs, with the current value
// of each watched node in watch order
using EffectObserver = std::function<void(const std::string& effect, const NamedValues& values)>;

// Apply a combine op to already-read input values
double combine(CombineOp op, const std::vector<double>& values);

// Numeric reactive graph built from a GraphConfig, with nodes addressed by
// name. Owns its own Runtime so several graphs never share a scheduler.
class ReactiveGraph {
public:
    ReactiveGraph();
    ~ReactiveGraph();

    // Create every node. Fails on duplicate names, unknown inputs and
    // dependency cycles between computeds.
    bool build(const GraphConfig& config, EffectObserver observer = {});

    bool apply(const GraphStep& step);
    // Apply the steps from the config passed to build()
    bool apply_all();

    bool write(const std::string& name, double value);
    bool batch_write(const NamedValues& values);
    bool stop_effect(const std::string& name);
    bool run_effect(const std::string& name);

    // Current value of a signal or computed, read without tracking
    std::optional<double> value(const std::string& name);

    Signal<double>* get_signal(const std::string& name);
    Computed<double>* get_computed(const std::string& name);
    Effect* get_effect(const std::string& name);

    // Node names in the order they were created
    const std::vector<std::string>& creation_order() const {
        return creation_order_;
    }

    std::size_t size() const { return creation_order_.size(); }

    Runtime& runtime() { return *runtime_; }

private:
    using Reader = std::function<double()>;

    void clear();
    bool order_computeds(const std::vector<ComputedDefinition>& computeds,
                         std::vector<const ComputedDefinition*>& order);
    bool resolve_readers(const std::string& owner,
                         const std::vector<std::string>& names,
                         std::vector<Reader>& readers) const;

    // Declared first so every node below is destroyed before it
    std::unique_ptr<Runtime> runtime_;

    std::unordered_map<std::string, std::unique_ptr<Signal<double>>> signals_;
    std::unordered_map<std::string, std::unique_ptr<Computed<double>>> computeds_;
    std::unordered_map<std::string, std::unique_ptr<Effect>> effects_;
    std::unordered_map<std::string, Reader> readers_;  // Tracked read by name
    std::vector<std::string> creation_order_;
    std::vector<GraphStep> steps_;
    EffectObserver observer_;
};

} // namespace reactdag
