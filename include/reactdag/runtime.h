#pragma once

#include <cstddef>
#include "reactdag/batch.h"
#include "reactdag/dependency_node.h"
#include "reactdag/evaluation_stack.h"
#include "reactdag/scheduler.h"

namespace reactdag {

struct RuntimeOptions {
    // Upper bound on nodes run by one drain, 0 for no bound
    std::size_t max_drain_steps = 0;
};

// Owns the evaluation stack, scheduler and batch state shared by a group of
// nodes. Nodes bind to Runtime::current() when constructed, and the runtime
// must outlive them.
class Runtime {
public:
    explicit Runtime(RuntimeOptions options = {});
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Runtime installed on this thread by a RuntimeScope, or the thread's
    // default runtime
    static Runtime& current();

    EvaluationStack& evaluation_stack() { return evaluation_stack_; }
    Scheduler& scheduler() { return scheduler_; }
    Batch& batch() { return batch_; }

    const RuntimeOptions& options() const { return options_; }

    NodeId next_node_id() { return ++last_node_id_; }

    // Drop every reference the runtime holds to a node being destroyed
    void forget(DependencyNode* node);

private:
    RuntimeOptions options_;
    EvaluationStack evaluation_stack_;
    Scheduler scheduler_;
    Batch batch_;
    NodeId last_node_id_ = 0;
};

// Installs a runtime as current for this thread until the scope ends
class RuntimeScope {
public:
    explicit RuntimeScope(Runtime& runtime);
    ~RuntimeScope();

    RuntimeScope(const RuntimeScope&) = delete;
    RuntimeScope& operator=(const RuntimeScope&) = delete;

private:
    Runtime* previous_;
};

} // namespace reactdag
