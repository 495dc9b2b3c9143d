#include <flowgraph/chunk_finder.hpp>

namespace flowgraph {

bool BlockChunkFinder::is_chunk_start(const FlowNode* current, const FlowNode* /*previous*/) const {
    return current->is_block_start();
}

bool BlockChunkFinder::is_chunk_end(const FlowNode* current, const FlowNode* /*previous*/) const {
    return current->is_block_end();
}

bool LabelledChunkFinder::is_chunk_start(const FlowNode* current, const FlowNode* /*previous*/) const {
    return current->has_action<LabelAction>();
}

bool LabelledChunkFinder::is_chunk_end(const FlowNode* current, const FlowNode* previous) const {
    if (!previous) {
        return false;
    }
    if (current->is_block_end()) {
        const FlowNode* start = static_cast<const BlockEndNode*>(current)->get_start_node();
        if (is_chunk_start(start, nullptr)) {
            return true;
        }
    }
    // Node right before a chunk start closes the preceding chunk
    return is_chunk_start(previous, nullptr);
}

bool StageChunkFinder::is_chunk_start(const FlowNode* current, const FlowNode* /*previous*/) const {
    auto label = current->get_action<LabelAction>();
    return label && !std::dynamic_pointer_cast<ThreadNameAction>(label);
}

} // namespace flowgraph
