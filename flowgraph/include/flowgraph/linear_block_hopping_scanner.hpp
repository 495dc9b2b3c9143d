#ifndef FLOWGRAPH_LINEAR_BLOCK_HOPPING_SCANNER_HPP
#define FLOWGRAPH_LINEAR_BLOCK_HOPPING_SCANNER_HPP

#include <flowgraph/flow_scanner.hpp>

namespace flowgraph {

/**
 * Linear walk that jumps over closed blocks: a block end is replaced by
 * the first parent of its start, so the interior of finished blocks is
 * never visited. The walk therefore yields the node's own predecessors
 * and its enclosing block starts.
 *
 * Starting on the end of a just-finished block skips that whole block.
 */
class LinearBlockHoppingScanner : public AbstractFlowScanner {
protected:
    void reset() override {}
    FlowNode* set_heads(const std::vector<FlowNode*>& heads) override;
    FlowNode* next_node(FlowNode* current) override;

    /**
     * Resolve a candidate to the first node that is not a block end,
     * hopping over each closed block. Returns nullptr if a stop node or the
     * root is reached first. Throws GraphCorruptionError on a cycle.
     */
    FlowNode* jump_block_scan(FlowNode* node);

private:
    FlowNode* first_parent(FlowNode* node);
};

} // namespace flowgraph

#endif // FLOWGRAPH_LINEAR_BLOCK_HOPPING_SCANNER_HPP
