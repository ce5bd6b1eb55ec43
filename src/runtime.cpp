#include "reactdag/runtime.h"
#include <glog/logging.h>

namespace reactdag {

namespace {
thread_local Runtime* installed_runtime = nullptr;
}

Runtime::Runtime(RuntimeOptions options)
    : options_(options),
      scheduler_(options.max_drain_steps),
      batch_(scheduler_) {
    VLOG(1) << "Created runtime (max drain steps " << options_.max_drain_steps << ")";
}

Runtime::~Runtime() {
    if (scheduler_.pending_count() > 0) {
        LOG(WARNING) << "Runtime destroyed with " << scheduler_.pending_count()
                     << " nodes still scheduled";
    }
}

Runtime& Runtime::current() {
    if (installed_runtime) {
        return *installed_runtime;
    }
    // Never destroyed: nodes with static storage duration may still be bound
    // to it when thread-local objects are torn down at exit
    thread_local Runtime* default_runtime = new Runtime();
    return *default_runtime;
}

void Runtime::forget(DependencyNode* node) {
    scheduler_.cancel(node);
    batch_.forget(node);
}

RuntimeScope::RuntimeScope(Runtime& runtime)
    : previous_(installed_runtime) {
    installed_runtime = &runtime;
}

RuntimeScope::~RuntimeScope() {
    installed_runtime = previous_;
}

} // namespace reactdag
