#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <glog/logging.h>
#include "reactdag/dependency_node.h"
#include "reactdag/errors.h"
#include "reactdag/evaluation_stack.h"
#include "reactdag/runtime.h"

namespace reactdag {

// Lazily memoized value derived from other signals and computeds.
//
// The derivation runs only when the value is read while dirty, or when the
// scheduler reaches the node after an upstream change. Dependencies are
// captured fresh on every evaluation.
template <typename T>
class Computed : public DependencyNode {
public:
    using DeriveFn = std::function<T()>;

    explicit Computed(DeriveFn derive, std::string name = {})
        : DependencyNode(NodeKind::COMPUTED, std::move(name)),
          derive_(std::move(derive)) {
        set_dirty(true);
    }

    // Registers the reader before refreshing, so the edge exists even when
    // the cached value is reused
    const T& read() {
        register_as_dependency();
        ensure_fresh();
        return *value_;
    }

    // Cached value without tracking or refreshing. May be stale, and is
    // empty until the first evaluation.
    const std::optional<T>& peek() const {
        return value_;
    }

    void run() override {
        ensure_fresh();
        DependencyNode::run();
        mark_downstream_dirty_and_schedule();
        runtime().scheduler().drain();
    }

    std::uint64_t evaluations() const { return evaluations_; }

private:
    void ensure_fresh() {
        if (!is_dirty()) {
            return;
        }

        EvaluationStack& stack = runtime().evaluation_stack();
        if (stack.contains(this)) {
            throw CycleError(name());
        }

        release_upstream();
        {
            EvaluationScope scope(stack, this);
            value_.emplace(derive_());
        }
        ++evaluations_;
        recompute_priority();
        set_dirty(false);

        VLOG(3) << "Evaluated " << name() << " with " << upstream().size()
                << " inputs, priority " << priority();
    }

    DeriveFn derive_;
    std::optional<T> value_;
    std::uint64_t evaluations_ = 0;
};

} // namespace reactdag
