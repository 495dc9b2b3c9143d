#ifndef FLOWGRAPH_MEMORY_FLOW_EXECUTION_HPP
#define FLOWGRAPH_MEMORY_FLOW_EXECUTION_HPP

#include <flowgraph/flow_execution.hpp>

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace flowgraph {

/**
 * In-memory execution: an id-keyed arena of nodes plus a frontier.
 *
 * A single writer appends nodes with the builder methods; each append moves
 * the frontier (parents leave, the new node joins) and then notifies the
 * lookup view and listeners. Readers may query concurrently.
 *
 * Between begin_restore() and end_restore() appends skip notification,
 * which models history loaded from storage before any cache existed.
 */
class MemoryFlowExecution : public FlowExecution {
public:
    explicit MemoryFlowExecution(std::string url);

    FlowNode* get_node(const std::string& id) override;
    std::vector<FlowNode*> get_current_heads() override;
    std::string get_url() const override { return url_; }

    // === APPEND API ===
    // All builders throw std::invalid_argument on malformed input.

    FlowStartNode* begin_flow(const std::string& id);
    AtomNode* add_atom(const std::string& id, const std::vector<std::string>& parent_ids);
    BlockStartNode* add_block_start(const std::string& id, const std::vector<std::string>& parent_ids);
    BlockEndNode* add_block_end(const std::string& id, const std::string& start_id,
                                const std::vector<std::string>& parent_ids);
    FlowEndNode* end_flow(const std::string& id, const std::vector<std::string>& parent_ids);

    // Sequential ids "2", "3", ... skipping any already in use
    std::string generate_id();

    void begin_restore() { restoring_ = true; }
    void end_restore() { restoring_ = false; }

    /**
     * Overwrite the frontier without appending. Unknown ids throw
     * std::invalid_argument.
     */
    void set_heads(const std::vector<std::string>& head_ids);

    std::size_t num_nodes() const;

protected:
    // Lookup without the virtual get_node hook
    FlowNode* find_node(const std::string& id) const;

private:
    template<typename NodeT>
    NodeT* append(std::unique_ptr<NodeT> node);

    void validate_new_node(const std::string& id, const std::vector<std::string>& parent_ids,
                           bool allow_join) const;

    std::string url_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<FlowNode>> nodes_;
    std::vector<FlowNode*> heads_;
    std::unordered_set<std::string> ended_starts_;
    std::string flow_start_id_;

    std::atomic<std::size_t> next_id_{2};
    std::atomic<bool> restoring_{false};
};

} // namespace flowgraph

#endif // FLOWGRAPH_MEMORY_FLOW_EXECUTION_HPP
