#ifndef FLOWGRAPH_FLOW_SCANNING_UTILS_HPP
#define FLOWGRAPH_FLOW_SCANNING_UTILS_HPP

#include <flowgraph/filterator.hpp>
#include <flowgraph/flow_node.hpp>

namespace flowgraph {
namespace scanning {

template<typename T>
NodePredicate node_has_action_predicate() {
    return [](FlowNode* node) { return node != nullptr && node->has_action<T>(); };
}

// Common predicates
extern const NodePredicate MATCH_HAS_LABEL;
extern const NodePredicate MATCH_IS_STAGE;
extern const NodePredicate MATCH_HAS_WORKSPACE;
extern const NodePredicate MATCH_HAS_ERROR;
extern const NodePredicate MATCH_BLOCK_START;

/**
 * Lazily iterate the block starts enclosing a node, innermost first, by
 * hopping backward over closed blocks. Needs no lookup cache.
 */
Filterator filterable_enclosing_blocks(FlowNode* node);

} // namespace scanning
} // namespace flowgraph

#endif // FLOWGRAPH_FLOW_SCANNING_UTILS_HPP
