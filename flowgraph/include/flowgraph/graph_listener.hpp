#ifndef FLOWGRAPH_GRAPH_LISTENER_HPP
#define FLOWGRAPH_GRAPH_LISTENER_HPP

namespace flowgraph {

class FlowNode;

/**
 * Invoked synchronously, in append order, once per new node after the node
 * and its actions are fully constructed. Runs in the writer's append path.
 */
class GraphListener {
public:
    virtual ~GraphListener() = default;

    virtual void on_new_head(FlowNode* node) = 0;
};

} // namespace flowgraph

#endif // FLOWGRAPH_GRAPH_LISTENER_HPP
