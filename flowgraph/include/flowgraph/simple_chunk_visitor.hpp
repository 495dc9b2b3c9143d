#ifndef FLOWGRAPH_SIMPLE_CHUNK_VISITOR_HPP
#define FLOWGRAPH_SIMPLE_CHUNK_VISITOR_HPP

#include <flowgraph/flow_node.hpp>

namespace flowgraph {

class ForkScanner;

/**
 * Callbacks fired by ForkScanner::visit_simple_chunks while walking
 * backward. "before" is earlier in time, "after" is later; either may be
 * nullptr at the edges of the walk. Default implementations do nothing.
 */
class SimpleChunkVisitor {
public:
    virtual ~SimpleChunkVisitor() = default;

    virtual void chunk_start(FlowNode* /*start_node*/, FlowNode* /*before_chunk*/, ForkScanner& /*scanner*/) {}
    virtual void chunk_end(FlowNode* /*end_node*/, FlowNode* /*after_chunk*/, ForkScanner& /*scanner*/) {}

    virtual void parallel_start(FlowNode* /*parallel_start*/, FlowNode* /*branch_node*/, ForkScanner& /*scanner*/) {}
    virtual void parallel_end(FlowNode* /*parallel_start*/, FlowNode* /*parallel_end*/, ForkScanner& /*scanner*/) {}
    virtual void parallel_branch_start(FlowNode* /*parallel_start*/, FlowNode* /*branch_start*/, ForkScanner& /*scanner*/) {}
    virtual void parallel_branch_end(FlowNode* /*parallel_start*/, FlowNode* /*branch_end*/, ForkScanner& /*scanner*/) {}

    // A node that is neither a chunk start nor a chunk end
    virtual void atom_node(FlowNode* /*before*/, FlowNode* /*atom*/, FlowNode* /*after*/, ForkScanner& /*scanner*/) {}
};

} // namespace flowgraph

#endif // FLOWGRAPH_SIMPLE_CHUNK_VISITOR_HPP
