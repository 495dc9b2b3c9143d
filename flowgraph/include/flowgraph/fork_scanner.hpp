#ifndef FLOWGRAPH_FORK_SCANNER_HPP
#define FLOWGRAPH_FORK_SCANNER_HPP

#include <flowgraph/flow_scanner.hpp>
#include <flowgraph/chunk_finder.hpp>
#include <flowgraph/simple_chunk_visitor.hpp>

#include <utility>
#include <vector>

namespace flowgraph {

/**
 * Visits every node exactly once, resolving parallel blocks as a unit.
 *
 * At a join (a block end with several parents) a fork record is pushed and
 * each branch is walked down to the parallel's block start, last parent
 * first. The block start is emitted once, after its final branch, provided
 * at least one branch reached it without crossing a stop node; nested
 * parallels stack. A non-end node with several parents is corruption.
 *
 * Only a single head is supported.
 */
class ForkScanner : public AbstractFlowScanner {
public:
    enum class NodeType {
        NORMAL,
        PARALLEL_START,          // Block start of a parallel, after all branches
        PARALLEL_END,            // Join node
        PARALLEL_BRANCH_START,   // Earliest node of a branch
        PARALLEL_BRANCH_END      // Latest node of a branch, entered from the join
    };

    NodeType get_current_type() const { return current_info_.type; }
    NodeType get_next_type() const { return next_info_.type; }

    // Innermost parallel the walk is currently inside, or nullptr
    BlockStartNode* get_current_parallel_start_node() const;

    std::size_t get_parallel_depth() const { return forks_.size(); }

    bool is_walking_from_finish() const { return walking_from_finish_; }

    /**
     * Extra test marking a block start as a parallel start when it is
     * reached along a branch, e.g. while a parallel is still running.
     */
    void set_parallel_start_predicate(NodePredicate predicate) {
        parallel_start_predicate_ = std::move(predicate);
    }

    /**
     * Walk from the heads set up by the last setup() and report chunk and
     * parallel structure to the visitor.
     */
    void visit_simple_chunks(SimpleChunkVisitor& visitor, const ChunkFinder& finder);

    void visit_simple_chunks(const std::vector<FlowNode*>& heads,
                             SimpleChunkVisitor& visitor, const ChunkFinder& finder);

protected:
    void reset() override;
    FlowNode* set_heads(const std::vector<FlowNode*>& heads) override;
    FlowNode* next_node(FlowNode* current) override;

private:
    struct NodeInfo {
        NodeType type = NodeType::NORMAL;
        bool branch_start = false;
        bool branch_end = false;
        BlockStartNode* enclosing_parallel = nullptr;  // Innermost open fork when emitted
    };

    struct ForkRecord {
        BlockStartNode* start = nullptr;
        std::vector<FlowNode*> pending_branches;  // Back is walked next
        bool start_reached = false;               // Some branch walked down to start
    };

    bool is_join(const FlowNode* node) const {
        return node->is_block_end() && node->parent_ids().size() > 1;
    }

    bool is_fork_start(const FlowNode* node) const {
        return !forks_.empty() && forks_.back().start->id() == node->id();
    }

    FlowNode* emit(FlowNode* node, bool branch_end, NodeType type);
    FlowNode* next_branch();

    std::vector<ForkRecord> forks_;
    NodeInfo current_info_;
    NodeInfo next_info_;
    bool walking_from_finish_ = false;
    NodePredicate parallel_start_predicate_;
};

} // namespace flowgraph

#endif // FLOWGRAPH_FORK_SCANNER_HPP
