#ifndef FLOWGRAPH_FLOW_SCANNER_HPP
#define FLOWGRAPH_FLOW_SCANNER_HPP

#include <flowgraph/filterator.hpp>
#include <flowgraph/flow_node.hpp>
#include <flowgraph/stop_node_set.hpp>

#include <functional>
#include <vector>

namespace flowgraph {

class FlowExecution;

// Return false to end the walk early
using NodeVisitor = std::function<bool(FlowNode*)>;

/**
 * Common contract for walking the flow graph backward (from heads toward
 * the root).
 *
 * Stop nodes bound the walk: a stop node is never visited and nothing
 * reachable only through one is visited. Heads that are stop nodes are
 * dropped; if no heads remain the scan is empty.
 *
 * Instances are reusable but not thread-safe; every setup() resets all
 * traversal state.
 */
class AbstractFlowScanner {
public:
    virtual ~AbstractFlowScanner() = default;

    // === ITERATION ===

    /**
     * Prepare a walk. Returns false if there is nothing to visit.
     */
    bool setup(const std::vector<FlowNode*>& heads, const std::vector<FlowNode*>& stop_nodes);
    bool setup(const std::vector<FlowNode*>& heads);
    bool setup(FlowNode* head);

    bool has_next() const { return next_ != nullptr; }

    // Throws std::out_of_range when exhausted
    FlowNode* next();

    FlowNode* current() const { return current_; }

    /**
     * True if the current walk met a stop node (including heads dropped
     * as stop nodes). Nodes beyond the bound were not visited.
     */
    bool reached_stop_nodes() const { return stop_reached_; }

    // Lazily filtered view of the rest of the current walk
    Filterator filter(NodePredicate predicate);

    // === QUERIES ===

    FlowNode* find_first_match(const std::vector<FlowNode*>& heads,
                               const std::vector<FlowNode*>& stop_nodes,
                               const NodePredicate& predicate);
    FlowNode* find_first_match(const std::vector<FlowNode*>& heads, const NodePredicate& predicate);
    FlowNode* find_first_match(FlowNode* head, const NodePredicate& predicate);
    FlowNode* find_first_match(FlowExecution& execution, const NodePredicate& predicate);

    std::vector<FlowNode*> filtered_nodes(const std::vector<FlowNode*>& heads,
                                          const std::vector<FlowNode*>& stop_nodes,
                                          const NodePredicate& predicate);
    std::vector<FlowNode*> filtered_nodes(const std::vector<FlowNode*>& heads, const NodePredicate& predicate);
    std::vector<FlowNode*> filtered_nodes(FlowNode* head, const NodePredicate& predicate);

    std::vector<FlowNode*> find_all_matches(const std::vector<FlowNode*>& heads,
                                            const std::vector<FlowNode*>& stop_nodes,
                                            const NodePredicate& predicate) {
        return filtered_nodes(heads, stop_nodes, predicate);
    }

    std::vector<FlowNode*> all_nodes(const std::vector<FlowNode*>& heads);
    std::vector<FlowNode*> all_nodes(FlowExecution& execution);

    void visit_all(const std::vector<FlowNode*>& heads,
                   const std::vector<FlowNode*>& stop_nodes,
                   const NodeVisitor& visitor);
    void visit_all(const std::vector<FlowNode*>& heads, const NodeVisitor& visitor);

protected:
    // Clear per-walk state
    virtual void reset() = 0;

    /**
     * Seed the walk from heads already stripped of stop nodes (never empty).
     * Returns the first node to visit, or nullptr.
     */
    virtual FlowNode* set_heads(const std::vector<FlowNode*>& heads) = 0;

    // Next node after current, or nullptr when done
    virtual FlowNode* next_node(FlowNode* current) = 0;

    // Stop-node check that also records the walk as bounded
    bool is_stop_node(const FlowNode* node) {
        if (stop_nodes_.contains(node)) {
            stop_reached_ = true;
            return true;
        }
        return false;
    }

    FlowNode* current_ = nullptr;
    FlowNode* next_ = nullptr;
    StopNodeSet stop_nodes_;
    bool stop_reached_ = false;
};

} // namespace flowgraph

#endif // FLOWGRAPH_FLOW_SCANNER_HPP
