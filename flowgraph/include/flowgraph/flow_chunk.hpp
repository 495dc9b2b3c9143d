#ifndef FLOWGRAPH_FLOW_CHUNK_HPP
#define FLOWGRAPH_FLOW_CHUNK_HPP

#include <flowgraph/flow_node.hpp>

namespace flowgraph {

/**
 * A run of nodes delimited by a first and last node, plus the nodes just
 * outside it on either side (nullptr at the edges of the flow).
 */
struct MemoryFlowChunk {
    FlowNode* first_node = nullptr;
    FlowNode* last_node = nullptr;
    FlowNode* node_before = nullptr;
    FlowNode* node_after = nullptr;

    bool is_complete() const { return first_node != nullptr && last_node != nullptr; }

    void reset() {
        first_node = nullptr;
        last_node = nullptr;
        node_before = nullptr;
        node_after = nullptr;
    }
};

} // namespace flowgraph

#endif // FLOWGRAPH_FLOW_CHUNK_HPP
