#ifndef FLOWGRAPH_LINEAR_SCANNER_HPP
#define FLOWGRAPH_LINEAR_SCANNER_HPP

#include <flowgraph/flow_scanner.hpp>

namespace flowgraph {

/**
 * Follows only the first parent of every node, so it never enters the
 * other branches of a parallel join. Only the first head is used.
 */
class LinearScanner : public AbstractFlowScanner {
protected:
    void reset() override {}
    FlowNode* set_heads(const std::vector<FlowNode*>& heads) override;
    FlowNode* next_node(FlowNode* current) override;
};

} // namespace flowgraph

#endif // FLOWGRAPH_LINEAR_SCANNER_HPP
