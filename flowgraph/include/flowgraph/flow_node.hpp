#ifndef FLOWGRAPH_FLOW_NODE_HPP
#define FLOWGRAPH_FLOW_NODE_HPP

#include <flowgraph/actions.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include <functional>
#include <utility>

namespace flowgraph {

class FlowExecution;

enum class NodeKind {
    ATOM,         // Plain step without a body
    BLOCK_START,
    BLOCK_END,
    FLOW_START,   // Unique root, a kind of block start
    FLOW_END      // Unique terminal node, a kind of block end
};

/**
 * One immutable point in the execution history.
 *
 * Parents are stored as ids and resolved on demand through the owning
 * execution. The execution owns the node; the node only keeps a
 * non-owning back pointer for lookups.
 */
class FlowNode {
public:
    FlowNode(FlowExecution* execution, std::string id, std::vector<std::string> parent_ids);
    virtual ~FlowNode() = default;

    FlowNode(const FlowNode&) = delete;
    FlowNode& operator=(const FlowNode&) = delete;

    const std::string& id() const { return id_; }
    const std::vector<std::string>& parent_ids() const { return parent_ids_; }
    FlowExecution* execution() const { return execution_; }

    virtual NodeKind kind() const = 0;

    bool is_block_start() const {
        return kind() == NodeKind::BLOCK_START || kind() == NodeKind::FLOW_START;
    }
    bool is_block_end() const {
        return kind() == NodeKind::BLOCK_END || kind() == NodeKind::FLOW_END;
    }
    bool is_flow_start() const { return kind() == NodeKind::FLOW_START; }
    bool is_flow_end() const { return kind() == NodeKind::FLOW_END; }

    /**
     * Resolve parent ids to nodes. A parent that fails to load is logged
     * and skipped, so the result may be shorter than parent_ids() (even empty
     * off the root). Only a fully resolved list is cached.
     */
    std::vector<FlowNode*> get_parents() const;

    /**
     * A plain node is active while it is a head, a block start while its
     * end does not exist; a flow end is never active.
     */
    bool is_active() const;

    virtual std::string get_type_display_name() const;

    // Label if one is attached, otherwise the type display name
    std::string get_display_name() const;

    // === ACTIONS ===

    void add_action(std::shared_ptr<Action> action);

    /**
     * Replace the first action with the same dynamic type, or append.
     */
    void add_or_replace_action(std::shared_ptr<Action> action);

    std::vector<std::shared_ptr<Action>> get_actions() const;

    template<typename T>
    std::shared_ptr<T> get_action() const {
        std::shared_lock<std::shared_mutex> lock(actions_mutex_);
        for (const auto& action : actions_) {
            if (auto typed = std::dynamic_pointer_cast<T>(action)) {
                return typed;
            }
        }
        return nullptr;
    }

    template<typename T>
    bool has_action() const {
        return get_action<T>() != nullptr;
    }

    std::shared_ptr<ErrorAction> get_error() const {
        return get_action<ErrorAction>();
    }

    bool operator==(const FlowNode& other) const { return id_ == other.id_; }
    bool operator!=(const FlowNode& other) const { return !(*this == other); }

private:
    FlowExecution* execution_;
    std::string id_;
    std::vector<std::string> parent_ids_;

    mutable std::mutex parents_mutex_;
    mutable std::atomic<bool> parents_resolved_{false};
    mutable std::vector<FlowNode*> parents_;

    mutable std::shared_mutex actions_mutex_;
    std::vector<std::shared_ptr<Action>> actions_;
};

class AtomNode : public FlowNode {
public:
    using FlowNode::FlowNode;

    NodeKind kind() const override { return NodeKind::ATOM; }
};

class BlockStartNode : public FlowNode {
public:
    using FlowNode::FlowNode;

    NodeKind kind() const override { return NodeKind::BLOCK_START; }
    std::string get_type_display_name() const override;
};

class BlockEndNode : public FlowNode {
public:
    BlockEndNode(FlowExecution* execution, std::string id, std::string start_id,
                 std::vector<std::string> parent_ids);

    NodeKind kind() const override { return NodeKind::BLOCK_END; }
    std::string get_type_display_name() const override;

    const std::string& start_id() const { return start_id_; }

    /**
     * Resolve the matching start. Throws GraphCorruptionError if it cannot
     * be found or is not a block start.
     */
    BlockStartNode* get_start_node() const;

private:
    std::string start_id_;
    mutable std::atomic<BlockStartNode*> start_{nullptr};
};

class FlowStartNode : public BlockStartNode {
public:
    FlowStartNode(FlowExecution* execution, std::string id)
        : BlockStartNode(execution, std::move(id), {}) {}

    NodeKind kind() const override { return NodeKind::FLOW_START; }
    std::string get_type_display_name() const override { return "Start of Pipeline"; }
};

class FlowEndNode : public BlockEndNode {
public:
    using BlockEndNode::BlockEndNode;

    NodeKind kind() const override { return NodeKind::FLOW_END; }
    std::string get_type_display_name() const override { return "End of Pipeline"; }
};

// Hashing and equality on node pointers by id
struct FlowNodePtrHash {
    std::size_t operator()(const FlowNode* node) const {
        return node ? std::hash<std::string>{}(node->id()) : 0;
    }
};

struct FlowNodePtrEqual {
    bool operator()(const FlowNode* a, const FlowNode* b) const {
        if (a == b) return true;
        if (!a || !b) return false;
        return a->id() == b->id();
    }
};

} // namespace flowgraph

namespace std {
    template<>
    struct hash<flowgraph::FlowNode> {
        std::size_t operator()(const flowgraph::FlowNode& node) const {
            return std::hash<std::string>{}(node.id());
        }
    };
}

#endif // FLOWGRAPH_FLOW_NODE_HPP
