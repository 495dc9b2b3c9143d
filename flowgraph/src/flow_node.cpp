#include <flowgraph/flow_node.hpp>
#include <flowgraph/flow_execution.hpp>
#include <flowgraph/errors.hpp>
#include <flowgraph/debug_log.hpp>

#include <typeinfo>

namespace flowgraph {

FlowNode::FlowNode(FlowExecution* execution, std::string id, std::vector<std::string> parent_ids)
    : execution_(execution), id_(std::move(id)), parent_ids_(std::move(parent_ids)) {}

std::vector<FlowNode*> FlowNode::get_parents() const {
    if (parents_resolved_.load(std::memory_order_acquire)) {
        return parents_;
    }

    std::lock_guard<std::mutex> lock(parents_mutex_);
    if (parents_resolved_.load(std::memory_order_relaxed)) {
        return parents_;
    }

    if (!execution_) {
        FLOWGRAPH_LOG_WARN("Node %s has no owning execution, cannot resolve parents", id_.c_str());
        return {};
    }

    std::vector<FlowNode*> resolved;
    resolved.reserve(parent_ids_.size());
    bool complete = true;

    for (const auto& parent_id : parent_ids_) {
        try {
            FlowNode* parent = execution_->get_node(parent_id);
            if (!parent) {
                FLOWGRAPH_LOG_WARN("Parent %s of node %s not found", parent_id.c_str(), id_.c_str());
                complete = false;
                continue;
            }
            resolved.push_back(parent);
        } catch (const NodeLoadError& e) {
            FLOWGRAPH_LOG_WARN("Failed to load parent %s of node %s: %s",
                               parent_id.c_str(), id_.c_str(), e.what());
            complete = false;
        }
    }

    if (complete) {
        parents_ = resolved;
        parents_resolved_.store(true, std::memory_order_release);
    }
    return resolved;
}

bool FlowNode::is_active() const {
    if (!execution_) {
        return false;
    }
    return execution_->is_active(this);
}

std::string FlowNode::get_type_display_name() const {
    return "Step";
}

std::string FlowNode::get_display_name() const {
    if (auto label = get_action<LabelAction>()) {
        return label->get_label();
    }
    return get_type_display_name();
}

void FlowNode::add_action(std::shared_ptr<Action> action) {
    if (!action) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(actions_mutex_);
    actions_.push_back(std::move(action));
}

void FlowNode::add_or_replace_action(std::shared_ptr<Action> action) {
    if (!action) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(actions_mutex_);
    const Action& incoming = *action;
    for (auto& existing : actions_) {
        if (typeid(*existing) == typeid(incoming)) {
            existing = std::move(action);
            return;
        }
    }
    actions_.push_back(std::move(action));
}

std::vector<std::shared_ptr<Action>> FlowNode::get_actions() const {
    std::shared_lock<std::shared_mutex> lock(actions_mutex_);
    return actions_;
}

// =============================================================================
// Block nodes
// =============================================================================

std::string BlockStartNode::get_type_display_name() const {
    return "Start of Block";
}

BlockEndNode::BlockEndNode(FlowExecution* execution, std::string id, std::string start_id,
                           std::vector<std::string> parent_ids)
    : FlowNode(execution, std::move(id), std::move(parent_ids)), start_id_(std::move(start_id)) {}

std::string BlockEndNode::get_type_display_name() const {
    return "End of Block";
}

BlockStartNode* BlockEndNode::get_start_node() const {
    BlockStartNode* cached = start_.load(std::memory_order_acquire);
    if (cached) {
        return cached;
    }

    if (!execution()) {
        throw GraphCorruptionError("Block end " + id() + " has no owning execution");
    }

    FlowNode* node = nullptr;
    try {
        node = execution()->get_node(start_id_);
    } catch (const NodeLoadError& e) {
        throw GraphCorruptionError("Failed to load start node " + start_id_ +
                                   " of block end " + id() + ": " + e.what());
    }

    if (!node) {
        throw GraphCorruptionError("Start node " + start_id_ + " of block end " + id() + " is missing");
    }
    if (!node->is_block_start()) {
        throw GraphCorruptionError("Node " + start_id_ + " referenced by block end " + id() +
                                   " is not a block start");
    }

    auto* start = static_cast<BlockStartNode*>(node);
    start_.store(start, std::memory_order_release);
    return start;
}

} // namespace flowgraph
