#include "reactdag/batch.h"
#include <algorithm>
#include <glog/logging.h>
#include "reactdag/scheduler.h"

namespace reactdag {

Batch::Batch(Scheduler& scheduler)
    : scheduler_(scheduler) {
}

void Batch::enter() {
    ++depth_;
}

void Batch::exit() {
    if (depth_ == 0) {
        LOG(WARNING) << "Batch exit without a matching enter";
        return;
    }
    if (--depth_ > 0) {
        return;
    }
    flush();
}

void Batch::run(const std::function<void()>& fn) {
    enter();
    try {
        fn();
    } catch (...) {
        // Values are already stored, so dependents still have to hear about them
        exit();
        throw;
    }
    exit();
}

void Batch::defer(DependencyNode* signal) {
    if (pending_.count(signal->id())) {
        return;
    }
    pending_[signal->id()] = signal;
    order_.push_back(signal);
}

void Batch::forget(DependencyNode* node) {
    if (pending_.erase(node->id()) == 0) {
        return;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), node), order_.end());
}

void Batch::flush() {
    std::vector<DependencyNode*> signals;
    signals.swap(order_);
    pending_.clear();
    ++flushes_;

    VLOG(2) << "Flushing batch of " << signals.size() << " signals";
    for (auto* signal : signals) {
        signal->mark_downstream_dirty_and_schedule();
    }
    scheduler_.drain();
}

} // namespace reactdag
