#include <flowgraph/linear_block_hopping_scanner.hpp>
#include <flowgraph/errors.hpp>
#include <flowgraph/debug_log.hpp>

#include <string>
#include <unordered_set>

namespace flowgraph {

FlowNode* LinearBlockHoppingScanner::set_heads(const std::vector<FlowNode*>& heads) {
    if (heads.size() > 1) {
        FLOWGRAPH_LOG_WARN("Block hopping scan only supports one head, ignoring %zu others",
                           heads.size() - 1);
    }
    return jump_block_scan(heads.front());
}

FlowNode* LinearBlockHoppingScanner::first_parent(FlowNode* node) {
    if (node->parent_ids().empty()) {
        return nullptr;
    }
    auto parents = node->get_parents();
    if (parents.empty() || parents.front()->id() != node->parent_ids().front()) {
        return nullptr;
    }
    return parents.front();
}

FlowNode* LinearBlockHoppingScanner::jump_block_scan(FlowNode* node) {
    FlowNode* candidate = node;
    std::unordered_set<std::string> hopped;

    while (candidate && candidate->is_block_end()) {
        if (!hopped.insert(candidate->id()).second) {
            throw GraphCorruptionError("Cycle detected while hopping over block end " + candidate->id());
        }

        BlockStartNode* start = static_cast<BlockEndNode*>(candidate)->get_start_node();
        if (is_stop_node(start)) {
            return nullptr;
        }

        FLOWGRAPH_DEBUG_LOG("Hopping from %s to block start %s", candidate->id().c_str(), start->id().c_str());

        candidate = first_parent(start);
        if (candidate && is_stop_node(candidate)) {
            return nullptr;
        }
    }
    return candidate;
}

FlowNode* LinearBlockHoppingScanner::next_node(FlowNode* current) {
    FlowNode* parent = first_parent(current);
    if (!parent || is_stop_node(parent)) {
        return nullptr;
    }
    return jump_block_scan(parent);
}

} // namespace flowgraph
