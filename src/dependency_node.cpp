#include "reactdag/dependency_node.h"
#include <limits>
#include <utility>
#include <glog/logging.h>
#include "reactdag/runtime.h"

namespace reactdag {

namespace {

// Priorities grow with fan-in; clamp instead of wrapping negative
std::int64_t saturating_add(std::int64_t a, std::int64_t b) {
    constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
    if (b > 0 && a > max - b) {
        return max;
    }
    return a + b;
}

} // namespace

const char* to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::SIGNAL:
            return "signal";
        case NodeKind::COMPUTED:
            return "computed";
        case NodeKind::EFFECT:
            return "effect";
    }
    return "unknown";
}

DependencyNode::DependencyNode(NodeKind kind, std::string name)
    : runtime_(Runtime::current()),
      id_(runtime_.next_node_id()),
      kind_(kind),
      name_(std::move(name)) {
    if (name_.empty()) {
        name_ = std::string(to_string(kind_)) + "#" + std::to_string(id_);
    }
}

DependencyNode::~DependencyNode() {
    release_upstream();
    unlink_downstream();
    runtime_.forget(this);
}

void DependencyNode::register_as_dependency() {
    DependencyNode* consumer = runtime_.evaluation_stack().top();
    if (!consumer || consumer == this) {
        return;
    }

    // First read in an evaluation wins
    if (downstream_.count(consumer->id_)) {
        return;
    }

    downstream_[consumer->id_] = consumer;
    consumer->upstream_[id_] = this;
    consumer->priority_ = saturating_add(consumer->priority_, priority_);

    VLOG(3) << "Edge " << name_ << " -> " << consumer->name_
            << " (consumer priority " << consumer->priority_ << ")";
}

void DependencyNode::release_upstream() {
    for (auto& [upstream_id, node] : upstream_) {
        node->downstream_.erase(id_);
    }
    upstream_.clear();
    priority_ = 1;
}

void DependencyNode::recompute_priority() {
    std::int64_t total = 0;
    for (const auto& [upstream_id, node] : upstream_) {
        total = saturating_add(total, node->priority_);
    }
    priority_ = total;
}

void DependencyNode::mark_downstream_dirty_and_schedule() {
    Scheduler& scheduler = runtime_.scheduler();
    for (auto& [downstream_id, node] : downstream_) {
        node->dirty_ = true;
        scheduler.submit(node);
    }
}

void DependencyNode::run() {
    dirty_ = false;
}

void DependencyNode::unlink_downstream() {
    for (auto& [downstream_id, node] : downstream_) {
        node->upstream_.erase(id_);
    }
    downstream_.clear();
}

} // namespace reactdag
