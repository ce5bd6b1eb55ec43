#include "reactdag/effect.h"
#include <utility>
#include <glog/logging.h>
#include "reactdag/evaluation_stack.h"
#include "reactdag/runtime.h"

namespace reactdag {

Effect::Effect(Body body, bool manual, std::string name)
    : DependencyNode(NodeKind::EFFECT, std::move(name)),
      body_(std::move(body)),
      manual_(manual) {
    if (!manual_) {
        run();
    }
}

void Effect::run() {
    running_ = true;
    Cleanup cleanup;
    {
        EvaluationScope scope(runtime().evaluation_stack(), this);
        release_upstream();
        cleanup = body_();
    }
    ++runs_;

    // The body stopped its own effect: stay inert and release right away
    if (!running_) {
        release_upstream();
        DependencyNode::run();
        VLOG(2) << name() << " stopped itself during its run";
        if (cleanup) {
            cleanup();
        }
        return;
    }

    cleanup_ = std::move(cleanup);
    recompute_priority();
    DependencyNode::run();

    VLOG(2) << "Ran " << name() << " (" << upstream().size() << " dependencies)";
}

void Effect::stop() {
    if (!running_) {
        return;
    }

    // Settle state first so a cleanup that writes signals cannot restart us
    Cleanup cleanup = std::move(cleanup_);
    cleanup_ = nullptr;
    release_upstream();
    runtime().scheduler().cancel(this);
    running_ = false;

    VLOG(2) << "Stopped " << name();
    if (cleanup) {
        cleanup();
    }
}

} // namespace reactdag
