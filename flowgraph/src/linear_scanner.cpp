#include <flowgraph/linear_scanner.hpp>
#include <flowgraph/debug_log.hpp>

namespace flowgraph {

FlowNode* LinearScanner::set_heads(const std::vector<FlowNode*>& heads) {
    if (heads.size() > 1) {
        FLOWGRAPH_DEBUG_LOG("LinearScanner ignoring %zu extra heads", heads.size() - 1);
    }
    return heads.front();
}

FlowNode* LinearScanner::next_node(FlowNode* current) {
    auto parents = current->get_parents();
    if (parents.empty()) {
        return nullptr;
    }
    FlowNode* parent = parents.front();
    if (parent->id() != current->parent_ids().front()) {
        // First parent failed to load; never substitute a sibling branch
        return nullptr;
    }
    if (is_stop_node(parent)) {
        return nullptr;
    }
    return parent;
}

} // namespace flowgraph
