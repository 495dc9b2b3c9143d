#ifndef FLOWGRAPH_FLOW_EXECUTION_HPP
#define FLOWGRAPH_FLOW_EXECUTION_HPP

#include <flowgraph/flow_node.hpp>
#include <flowgraph/graph_listener.hpp>
#include <flowgraph/graph_lookup_view.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flowgraph {

class StandardGraphLookupView;

/**
 * The execution engine's side of the graph: node storage, the frontier and
 * new-node notification. The engine subclasses this and calls
 * notify_new_head() once per appended node.
 *
 * Structural lookups are answered by an owned StandardGraphLookupView,
 * which is always notified before any registered listener.
 */
class FlowExecution : public GraphLookupView {
public:
    FlowExecution();
    ~FlowExecution() override;

    FlowExecution(const FlowExecution&) = delete;
    FlowExecution& operator=(const FlowExecution&) = delete;

    /**
     * Resolve a node by id. Returns nullptr for an unknown id and throws
     * NodeLoadError if storage fails.
     */
    virtual FlowNode* get_node(const std::string& id) = 0;

    // Ordered snapshot of the frontier
    virtual std::vector<FlowNode*> get_current_heads() = 0;

    // Identity of this execution across restarts, used as a cache key
    virtual std::string get_url() const = 0;

    virtual bool is_current_head(const FlowNode* node);

    // Complete once the only head is the flow end
    virtual bool is_complete();

    void add_listener(GraphListener* listener);
    void remove_listener(GraphListener* listener);

    // === GraphLookupView ===

    bool is_active(const FlowNode* node) override;
    BlockEndNode* get_end_node(const BlockStartNode* start) override;
    BlockStartNode* find_enclosing_block_start(const FlowNode* node) override;
    std::vector<BlockStartNode*> find_all_enclosing_block_starts(const FlowNode* node) override;

    StandardGraphLookupView& lookup_view() { return *lookup_view_; }

protected:
    void notify_new_head(FlowNode* node);

private:
    std::unique_ptr<StandardGraphLookupView> lookup_view_;

    std::mutex listeners_mutex_;
    std::vector<GraphListener*> listeners_;
};

} // namespace flowgraph

#endif // FLOWGRAPH_FLOW_EXECUTION_HPP
