#include <flowgraph/graph_lookup_view.hpp>

namespace flowgraph {

EnclosingBlocksRange::iterator& EnclosingBlocksRange::iterator::operator++() {
    if (current_) {
        current_ = view_->find_enclosing_block_start(current_);
    }
    return *this;
}

EnclosingBlocksRange::iterator EnclosingBlocksRange::begin() const {
    if (!node_) {
        return end();
    }
    return iterator(view_, view_->find_enclosing_block_start(node_));
}

std::vector<BlockStartNode*> GraphLookupView::find_all_enclosing_block_starts(const FlowNode* node) {
    std::vector<BlockStartNode*> result;
    for (BlockStartNode* start : iterate_enclosing_blocks(node)) {
        result.push_back(start);
    }
    return result;
}

} // namespace flowgraph
