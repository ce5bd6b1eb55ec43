#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace reactdag {

class Runtime;

using NodeId = std::uint64_t;

enum class NodeKind {
    SIGNAL,
    COMPUTED,
    EFFECT
};

const char* to_string(NodeKind kind);

// Base of every node in the reactive graph.
//
// Edges are kept in both directions: if A is in B's upstream then B is in A's
// downstream. Edges are non-owning; a node unlinks itself from its neighbours
// when destroyed.
class DependencyNode {
public:
    using EdgeMap = std::unordered_map<NodeId, DependencyNode*>;

    DependencyNode(NodeKind kind, std::string name);
    virtual ~DependencyNode();

    DependencyNode(const DependencyNode&) = delete;
    DependencyNode& operator=(const DependencyNode&) = delete;

    NodeId id() const { return id_; }
    NodeKind kind() const { return kind_; }
    const std::string& name() const { return name_; }
    std::int64_t priority() const { return priority_; }
    bool is_dirty() const { return dirty_; }

    // Nodes this node read during its last evaluation
    const EdgeMap& upstream() const { return upstream_; }
    // Nodes that read this node during their last evaluation
    const EdgeMap& downstream() const { return downstream_; }

    Runtime& runtime() const { return runtime_; }

    // Mark every downstream node dirty and submit it to the scheduler.
    // Does not drain.
    void mark_downstream_dirty_and_schedule();

    // Evaluate the node. The base version only clears the dirty flag;
    // overrides must end with the flag cleared as well.
    virtual void run();

protected:
    // Record an edge from this node to the node currently being evaluated.
    // No-op outside an evaluation or when the edge already exists.
    void register_as_dependency();

    // Drop every upstream edge and reset priority to 1
    void release_upstream();

    // priority = sum of upstream priorities
    void recompute_priority();

    void set_dirty(bool dirty) { dirty_ = dirty; }

private:
    void unlink_downstream();

    Runtime& runtime_;
    NodeId id_;
    NodeKind kind_;
    std::string name_;
    std::int64_t priority_ = 1;
    bool dirty_ = false;
    EdgeMap upstream_;
    EdgeMap downstream_;
};

} // namespace reactdag
