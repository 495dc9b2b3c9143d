#ifndef FLOWGRAPH_DEPTH_FIRST_SCANNER_HPP
#define FLOWGRAPH_DEPTH_FIRST_SCANNER_HPP

#include <flowgraph/flow_scanner.hpp>

#include <unordered_set>
#include <vector>

namespace flowgraph {

/**
 * Visits every reachable node exactly once. The first unvisited parent is
 * followed immediately; the remaining parents of a join wait on a stack
 * until the current chain is exhausted. Multiple heads are walked in order.
 */
class DepthFirstScanner : public AbstractFlowScanner {
protected:
    void reset() override;
    FlowNode* set_heads(const std::vector<FlowNode*>& heads) override;
    FlowNode* next_node(FlowNode* current) override;

private:
    // Marks the node visited; false if it already was
    bool visit(FlowNode* node) { return visited_.insert(node).second; }

    std::vector<FlowNode*> pending_;
    std::unordered_set<const FlowNode*, FlowNodePtrHash, FlowNodePtrEqual> visited_;
};

} // namespace flowgraph

#endif // FLOWGRAPH_DEPTH_FIRST_SCANNER_HPP
