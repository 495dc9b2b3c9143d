#ifndef FLOWGRAPH_FILTERATOR_HPP
#define FLOWGRAPH_FILTERATOR_HPP

#include <flowgraph/flow_node.hpp>

#include <functional>

namespace flowgraph {

using NodePredicate = std::function<bool(FlowNode*)>;

/**
 * Lazy filtered view over a node sequence. The source yields nullptr once
 * exhausted. Matches are produced one at a time as the caller asks.
 */
class Filterator {
public:
    using Source = std::function<FlowNode*()>;

    Filterator(Source source, NodePredicate predicate);

    bool has_next() const { return pending_ != nullptr; }

    // Throws std::out_of_range when exhausted
    FlowNode* next();

    /**
     * Narrow further. Consumes this filterator: the returned one takes over
     * its remaining sequence.
     */
    Filterator filter(NodePredicate predicate);

private:
    void advance();

    Source source_;
    NodePredicate predicate_;
    FlowNode* pending_ = nullptr;
};

} // namespace flowgraph

#endif // FLOWGRAPH_FILTERATOR_HPP
