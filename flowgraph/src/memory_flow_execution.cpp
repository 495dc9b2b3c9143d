#include <flowgraph/memory_flow_execution.hpp>
#include <flowgraph/debug_log.hpp>

#include <algorithm>
#include <stdexcept>

namespace flowgraph {

MemoryFlowExecution::MemoryFlowExecution(std::string url) : url_(std::move(url)) {}

FlowNode* MemoryFlowExecution::get_node(const std::string& id) {
    return find_node(id);
}

FlowNode* MemoryFlowExecution::find_node(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
}

std::vector<FlowNode*> MemoryFlowExecution::get_current_heads() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return heads_;
}

std::size_t MemoryFlowExecution::num_nodes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodes_.size();
}

std::string MemoryFlowExecution::generate_id() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    while (true) {
        std::string candidate = std::to_string(next_id_.fetch_add(1));
        if (nodes_.find(candidate) == nodes_.end()) {
            return candidate;
        }
    }
}

void MemoryFlowExecution::validate_new_node(const std::string& id,
                                            const std::vector<std::string>& parent_ids,
                                            bool allow_join) const {
    if (id.empty()) {
        throw std::invalid_argument("Node id must not be empty");
    }
    if (nodes_.count(id)) {
        throw std::invalid_argument("Duplicate node id: " + id);
    }
    if (flow_start_id_.empty()) {
        throw std::invalid_argument("Flow has not been started, cannot append " + id);
    }
    if (parent_ids.empty()) {
        throw std::invalid_argument("Node " + id + " needs at least one parent");
    }
    if (!allow_join && parent_ids.size() > 1) {
        throw std::invalid_argument("Only block end nodes may have multiple parents: " + id);
    }
    for (const auto& parent_id : parent_ids) {
        if (!nodes_.count(parent_id)) {
            throw std::invalid_argument("Unknown parent " + parent_id + " for node " + id);
        }
    }
}

template<typename NodeT>
NodeT* MemoryFlowExecution::append(std::unique_ptr<NodeT> node) {
    NodeT* raw = node.get();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const auto& parent_ids = raw->parent_ids();
        heads_.erase(std::remove_if(heads_.begin(), heads_.end(),
                                    [&parent_ids](FlowNode* head) {
                                        return std::find(parent_ids.begin(), parent_ids.end(),
                                                         head->id()) != parent_ids.end();
                                    }),
                     heads_.end());
        heads_.push_back(raw);
        nodes_.emplace(raw->id(), std::move(node));
    }

    if (!restoring_.load()) {
        notify_new_head(raw);
    }
    return raw;
}

FlowStartNode* MemoryFlowExecution::begin_flow(const std::string& id) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!flow_start_id_.empty()) {
            throw std::invalid_argument("Flow already started with " + flow_start_id_);
        }
        if (id.empty()) {
            throw std::invalid_argument("Node id must not be empty");
        }
        flow_start_id_ = id;
    }
    return append(std::make_unique<FlowStartNode>(this, id));
}

AtomNode* MemoryFlowExecution::add_atom(const std::string& id,
                                        const std::vector<std::string>& parent_ids) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        validate_new_node(id, parent_ids, false);
    }
    return append(std::make_unique<AtomNode>(this, id, parent_ids));
}

BlockStartNode* MemoryFlowExecution::add_block_start(const std::string& id,
                                                     const std::vector<std::string>& parent_ids) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        validate_new_node(id, parent_ids, false);
    }
    return append(std::make_unique<BlockStartNode>(this, id, parent_ids));
}

BlockEndNode* MemoryFlowExecution::add_block_end(const std::string& id, const std::string& start_id,
                                                 const std::vector<std::string>& parent_ids) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        validate_new_node(id, parent_ids, true);
        auto it = nodes_.find(start_id);
        if (it == nodes_.end() || it->second->kind() != NodeKind::BLOCK_START) {
            throw std::invalid_argument("Block end " + id + " references " + start_id +
                                        ", which is not an open block start");
        }
        if (!ended_starts_.insert(start_id).second) {
            throw std::invalid_argument("Block " + start_id + " already has an end node");
        }
    }
    return append(std::make_unique<BlockEndNode>(this, id, start_id, parent_ids));
}

FlowEndNode* MemoryFlowExecution::end_flow(const std::string& id,
                                           const std::vector<std::string>& parent_ids) {
    std::string start_id;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        validate_new_node(id, parent_ids, true);
        if (!ended_starts_.insert(flow_start_id_).second) {
            throw std::invalid_argument("Flow " + url_ + " already ended");
        }
        start_id = flow_start_id_;
    }
    return append(std::make_unique<FlowEndNode>(this, id, start_id, parent_ids));
}

void MemoryFlowExecution::set_heads(const std::vector<std::string>& head_ids) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<FlowNode*> heads;
    heads.reserve(head_ids.size());
    for (const auto& id : head_ids) {
        auto it = nodes_.find(id);
        if (it == nodes_.end()) {
            throw std::invalid_argument("Unknown head id: " + id);
        }
        heads.push_back(it->second.get());
    }
    heads_ = std::move(heads);
}

} // namespace flowgraph
