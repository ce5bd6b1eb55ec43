#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>
#include "reactdag/dependency_node.h"

namespace reactdag {

struct SchedulerStats {
    std::uint64_t drains = 0;  // outermost drain() calls
    std::uint64_t runs = 0;    // node runs across all drains
};

// Deduplicated queue of dirty nodes, drained lowest priority first.
class Scheduler {
public:
    // max_drain_steps == 0 means a drain may run any number of nodes
    explicit Scheduler(std::size_t max_drain_steps = 0);

    // Queue a node unless it is already pending
    void submit(DependencyNode* node);

    // Run pending nodes until none are left. Re-entrant calls made from a
    // running node return immediately; the active drain picks up their work.
    void drain();

    // Forget a pending node without running it
    void cancel(DependencyNode* node);

    bool is_pending(NodeId id) const { return pending_.count(id) != 0; }
    std::size_t pending_count() const { return queue_.size(); }
    bool is_draining() const { return draining_; }

    const SchedulerStats& stats() const { return stats_; }
    void reset_stats() { stats_ = SchedulerStats{}; }

    void set_max_drain_steps(std::size_t steps) { max_drain_steps_ = steps; }
    std::size_t max_drain_steps() const { return max_drain_steps_; }

private:
    DependencyNode* take_next();
    void clear();

    std::unordered_map<NodeId, DependencyNode*> pending_;
    std::vector<DependencyNode*> queue_;  // insertion order
    std::size_t max_drain_steps_;
    bool draining_ = false;
    SchedulerStats stats_;
};

} // namespace reactdag
