#pragma once

#include <cstddef>
#include <vector>

namespace reactdag {

class DependencyNode;

// Nodes currently being evaluated, innermost last. Only the top entry
// captures new dependency edges.
class EvaluationStack {
public:
    void push(DependencyNode* node);

    // Pops only when node is the top entry; returns whether it did
    bool pop(DependencyNode* node);

    DependencyNode* top() const {
        return nodes_.empty() ? nullptr : nodes_.back();
    }

    bool empty() const { return nodes_.empty(); }
    std::size_t depth() const { return nodes_.size(); }
    bool contains(const DependencyNode* node) const;

private:
    std::vector<DependencyNode*> nodes_;
};

// Keeps a node on the evaluation stack for the lifetime of the scope,
// popping it again even when the evaluation throws.
class EvaluationScope {
public:
    EvaluationScope(EvaluationStack& stack, DependencyNode* node);
    ~EvaluationScope();

    EvaluationScope(const EvaluationScope&) = delete;
    EvaluationScope& operator=(const EvaluationScope&) = delete;

private:
    EvaluationStack& stack_;
    DependencyNode* node_;
};

} // namespace reactdag
