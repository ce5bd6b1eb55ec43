#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>
#include "reactdag/dependency_node.h"

namespace reactdag {

class Scheduler;

// Defers propagation of signal writes so that several writes cost a single
// scheduler drain. Batches nest; only the outermost exit flushes.
class Batch {
public:
    explicit Batch(Scheduler& scheduler);

    void enter();
    void exit();

    // enter(), fn(), exit(). exit() also runs when fn throws, then the
    // exception is rethrown.
    void run(const std::function<void()>& fn);

    bool active() const { return depth_ > 0; }
    std::size_t depth() const { return depth_; }

    // Buffer a written signal until the outermost exit
    void defer(DependencyNode* signal);
    void forget(DependencyNode* node);

    std::size_t pending_count() const { return order_.size(); }
    std::uint64_t flushes() const { return flushes_; }

private:
    void flush();

    Scheduler& scheduler_;
    std::size_t depth_ = 0;
    std::unordered_map<NodeId, DependencyNode*> pending_;
    std::vector<DependencyNode*> order_;
    std::uint64_t flushes_ = 0;
};

} // namespace reactdag
