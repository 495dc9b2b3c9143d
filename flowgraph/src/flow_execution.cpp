#include <flowgraph/flow_execution.hpp>
#include <flowgraph/standard_graph_lookup_view.hpp>
#include <flowgraph/debug_log.hpp>

#include <algorithm>
#include <exception>

namespace flowgraph {

FlowExecution::FlowExecution()
    : lookup_view_(std::make_unique<StandardGraphLookupView>(*this)) {}

FlowExecution::~FlowExecution() = default;

bool FlowExecution::is_current_head(const FlowNode* node) {
    if (!node) {
        return false;
    }
    for (FlowNode* head : get_current_heads()) {
        if (head->id() == node->id()) {
            return true;
        }
    }
    return false;
}

bool FlowExecution::is_complete() {
    auto heads = get_current_heads();
    return heads.size() == 1 && heads.front()->is_flow_end();
}

void FlowExecution::add_listener(GraphListener* listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void FlowExecution::remove_listener(GraphListener* listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void FlowExecution::notify_new_head(FlowNode* node) {
    FLOWGRAPH_DEBUG_LOG("New head %s in %s", node->id().c_str(), get_url().c_str());

    lookup_view_->on_new_head(node);

    std::vector<GraphListener*> snapshot;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        snapshot = listeners_;
    }

    for (GraphListener* listener : snapshot) {
        try {
            listener->on_new_head(node);
        } catch (const std::exception& e) {
            FLOWGRAPH_LOG_ERROR("Listener failed on new head %s: %s", node->id().c_str(), e.what());
        }
    }
}

bool FlowExecution::is_active(const FlowNode* node) {
    return lookup_view_->is_active(node);
}

BlockEndNode* FlowExecution::get_end_node(const BlockStartNode* start) {
    return lookup_view_->get_end_node(start);
}

BlockStartNode* FlowExecution::find_enclosing_block_start(const FlowNode* node) {
    return lookup_view_->find_enclosing_block_start(node);
}

std::vector<BlockStartNode*> FlowExecution::find_all_enclosing_block_starts(const FlowNode* node) {
    return lookup_view_->find_all_enclosing_block_starts(node);
}

} // namespace flowgraph
