#include "reactdag/evaluation_stack.h"
#include <algorithm>
#include <glog/logging.h>
#include "reactdag/dependency_node.h"

namespace reactdag {

void EvaluationStack::push(DependencyNode* node) {
    nodes_.push_back(node);
}

bool EvaluationStack::pop(DependencyNode* node) {
    if (nodes_.empty() || nodes_.back() != node) {
        return false;
    }
    nodes_.pop_back();
    return true;
}

bool EvaluationStack::contains(const DependencyNode* node) const {
    return std::find(nodes_.begin(), nodes_.end(), node) != nodes_.end();
}

EvaluationScope::EvaluationScope(EvaluationStack& stack, DependencyNode* node)
    : stack_(stack), node_(node) {
    stack_.push(node_);
}

EvaluationScope::~EvaluationScope() {
    if (!stack_.pop(node_)) {
        LOG(WARNING) << "Evaluation stack out of order when leaving " << node_->name();
    }
}

} // namespace reactdag
