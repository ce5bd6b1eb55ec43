#pragma once

#include <string>
#include <utility>
#include <glog/logging.h>
#include "reactdag/dependency_node.h"
#include "reactdag/runtime.h"

namespace reactdag {

// Writable source value. Reading it during an evaluation makes the
// evaluating node depend on it.
template <typename T>
class Signal : public DependencyNode {
public:
    explicit Signal(T initial, std::string name = {})
        : DependencyNode(NodeKind::SIGNAL, std::move(name)),
          value_(std::move(initial)) {
    }

    const T& read() {
        register_as_dependency();
        return value_;
    }

    // Untracked read
    const T& peek() const {
        return value_;
    }

    // Always propagates, even when the value is unchanged. Inside a batch the
    // propagation waits for the outermost batch exit.
    void write(T value) {
        value_ = std::move(value);

        Batch& batch = runtime().batch();
        if (batch.active()) {
            VLOG(3) << "Deferred write to " << name() << " until batch exit";
            batch.defer(this);
            return;
        }

        VLOG(2) << "Write to " << name() << ", " << downstream().size() << " dependents";
        mark_downstream_dirty_and_schedule();
        runtime().scheduler().drain();
    }

    void run() override {
        DependencyNode::run();
    }

private:
    T value_;
};

} // namespace reactdag
