#include "reactdag/scheduler.h"
#include <algorithm>
#include <glog/logging.h>
#include "reactdag/errors.h"

namespace reactdag {

namespace {

// Clears the draining flag on every exit path out of drain()
class DrainingFlag {
public:
    explicit DrainingFlag(bool& flag) : flag_(flag) { flag_ = true; }
    ~DrainingFlag() { flag_ = false; }

private:
    bool& flag_;
};

} // namespace

Scheduler::Scheduler(std::size_t max_drain_steps)
    : max_drain_steps_(max_drain_steps) {
}

void Scheduler::submit(DependencyNode* node) {
    if (pending_.count(node->id())) {
        return;
    }
    pending_[node->id()] = node;
    queue_.push_back(node);
    VLOG(3) << "Scheduled " << node->name() << " (priority " << node->priority() << ")";
}

void Scheduler::drain() {
    if (draining_) {
        return;
    }

    DrainingFlag flag(draining_);
    ++stats_.drains;

    std::size_t steps = 0;
    while (!queue_.empty()) {
        if (max_drain_steps_ != 0 && steps >= max_drain_steps_) {
            LOG(ERROR) << "Drain stopped after " << steps << " steps with "
                       << queue_.size() << " nodes still pending";
            clear();
            throw DrainLimitExceeded(max_drain_steps_);
        }

        DependencyNode* node = take_next();
        ++steps;
        ++stats_.runs;

        VLOG(2) << "Running " << node->name() << " (priority " << node->priority() << ")";
        node->run();
    }

    VLOG(2) << "Drain finished after " << steps << " steps";
}

void Scheduler::cancel(DependencyNode* node) {
    if (pending_.erase(node->id()) == 0) {
        return;
    }
    queue_.erase(std::remove(queue_.begin(), queue_.end(), node), queue_.end());
}

DependencyNode* Scheduler::take_next() {
    // Lowest priority first, earliest submission on ties
    auto it = std::min_element(queue_.begin(), queue_.end(),
        [](const DependencyNode* a, const DependencyNode* b) {
            return a->priority() < b->priority();
        });
    DependencyNode* node = *it;
    queue_.erase(it);
    pending_.erase(node->id());
    return node;
}

void Scheduler::clear() {
    pending_.clear();
    queue_.clear();
}

} // namespace reactdag
