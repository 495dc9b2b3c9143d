#ifndef FLOWGRAPH_GRAPH_LOOKUP_VIEW_HPP
#define FLOWGRAPH_GRAPH_LOOKUP_VIEW_HPP

#include <flowgraph/flow_node.hpp>

#include <cstddef>
#include <iterator>
#include <vector>

namespace flowgraph {

class GraphLookupView;

/**
 * Lazy range over the enclosing block starts of a node, innermost first.
 * Each increment performs one lookup, so callers that stop early pay only
 * for the levels they consume.
 */
class EnclosingBlocksRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = BlockStartNode*;
        using difference_type = std::ptrdiff_t;
        using pointer = BlockStartNode* const*;
        using reference = BlockStartNode* const&;

        iterator() = default;
        iterator(GraphLookupView* view, BlockStartNode* current) : view_(view), current_(current) {}

        reference operator*() const { return current_; }
        iterator& operator++();
        iterator operator++(int) {
            iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const iterator& other) const { return current_ == other.current_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        GraphLookupView* view_ = nullptr;
        BlockStartNode* current_ = nullptr;
    };

    EnclosingBlocksRange(GraphLookupView* view, const FlowNode* node) : view_(view), node_(node) {}

    iterator begin() const;
    iterator end() const { return iterator(); }

private:
    GraphLookupView* view_;
    const FlowNode* node_;
};

/**
 * Derived structural facts about a flow graph: block end for a start,
 * enclosing blocks, and whether a node is still running.
 */
class GraphLookupView {
public:
    virtual ~GraphLookupView() = default;

    virtual bool is_active(const FlowNode* node) = 0;

    /**
     * Matching end of a block, or nullptr while the block is still open.
     */
    virtual BlockEndNode* get_end_node(const BlockStartNode* start) = 0;

    /**
     * Nearest enclosing block start, or nullptr for nodes directly inside
     * the flow (and for the flow start/end themselves).
     */
    virtual BlockStartNode* find_enclosing_block_start(const FlowNode* node) = 0;

    // Innermost first
    virtual std::vector<BlockStartNode*> find_all_enclosing_block_starts(const FlowNode* node);

    EnclosingBlocksRange iterate_enclosing_blocks(const FlowNode* node) {
        return EnclosingBlocksRange(this, node);
    }
};

} // namespace flowgraph

#endif // FLOWGRAPH_GRAPH_LOOKUP_VIEW_HPP
