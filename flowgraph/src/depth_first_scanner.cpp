#include <flowgraph/depth_first_scanner.hpp>

namespace flowgraph {

void DepthFirstScanner::reset() {
    pending_.clear();
    visited_.clear();
}

FlowNode* DepthFirstScanner::set_heads(const std::vector<FlowNode*>& heads) {
    // Later heads wait on the stack, pushed so the second head pops first
    for (auto it = heads.rbegin(); it != heads.rend() - 1; ++it) {
        pending_.push_back(*it);
    }
    FlowNode* first = heads.front();
    visit(first);
    return first;
}

FlowNode* DepthFirstScanner::next_node(FlowNode* current) {
    FlowNode* follow = nullptr;
    std::vector<FlowNode*> siblings;

    for (FlowNode* parent : current->get_parents()) {
        if (visited_.count(parent) || is_stop_node(parent)) {
            continue;
        }
        if (!follow) {
            follow = parent;
        } else {
            siblings.push_back(parent);
        }
    }

    for (auto it = siblings.rbegin(); it != siblings.rend(); ++it) {
        pending_.push_back(*it);
    }

    if (follow) {
        visit(follow);
        return follow;
    }

    while (!pending_.empty()) {
        FlowNode* candidate = pending_.back();
        pending_.pop_back();
        if (visit(candidate)) {
            return candidate;
        }
    }
    return nullptr;
}

} // namespace flowgraph
