#include <flowgraph/fork_scanner.hpp>
#include <flowgraph/errors.hpp>
#include <flowgraph/debug_log.hpp>

#include <stdexcept>

namespace flowgraph {

void ForkScanner::reset() {
    forks_.clear();
    current_info_ = NodeInfo{};
    next_info_ = NodeInfo{};
    walking_from_finish_ = false;
}

FlowNode* ForkScanner::set_heads(const std::vector<FlowNode*>& heads) {
    if (heads.size() > 1) {
        throw std::invalid_argument("ForkScanner can't handle multiple head nodes yet");
    }
    FlowNode* head = heads.front();
    walking_from_finish_ = head->is_flow_end();
    return emit(head, false, NodeType::NORMAL);
}

BlockStartNode* ForkScanner::get_current_parallel_start_node() const {
    return forks_.empty() ? nullptr : forks_.back().start;
}

FlowNode* ForkScanner::emit(FlowNode* node, bool branch_end, NodeType type) {
    NodeInfo info;
    info.branch_end = branch_end;
    if (!forks_.empty()) {
        info.enclosing_parallel = forks_.back().start;
        info.branch_start = node->parent_ids().size() == 1 &&
                            node->parent_ids().front() == forks_.back().start->id();
    }

    if (type == NodeType::NORMAL) {
        if (is_join(node)) {
            type = NodeType::PARALLEL_END;
        } else if (parallel_start_predicate_ && node->is_block_start() && parallel_start_predicate_(node)) {
            type = NodeType::PARALLEL_START;
        } else if (info.branch_end) {
            type = NodeType::PARALLEL_BRANCH_END;
        } else if (info.branch_start) {
            type = NodeType::PARALLEL_BRANCH_START;
        }
    }
    info.type = type;
    next_info_ = info;
    return node;
}

FlowNode* ForkScanner::next_branch() {
    while (!forks_.empty()) {
        ForkRecord& fork = forks_.back();
        while (!fork.pending_branches.empty()) {
            FlowNode* branch = fork.pending_branches.back();
            fork.pending_branches.pop_back();
            if (branch->id() == fork.start->id()) {
                fork.start_reached = true;  // Empty branch
                continue;
            }
            if (is_stop_node(branch)) {
                continue;
            }
            return emit(branch, true, NodeType::NORMAL);
        }

        // All branches done: the parallel start comes next if some branch
        // got there without crossing a stop node
        BlockStartNode* start = fork.start;
        bool reachable = fork.start_reached && !is_stop_node(start);
        forks_.pop_back();
        if (reachable) {
            FLOWGRAPH_DEBUG_LOG("ForkScanner finished branches of %s", start->id().c_str());
            return emit(start, false, NodeType::PARALLEL_START);
        }
    }
    return nullptr;
}

FlowNode* ForkScanner::next_node(FlowNode* current) {
    current_info_ = next_info_;
    next_info_ = NodeInfo{};

    if (is_join(current)) {
        ForkRecord fork;
        fork.start = static_cast<BlockEndNode*>(current)->get_start_node();
        fork.pending_branches = current->get_parents();
        forks_.push_back(std::move(fork));
        return next_branch();
    }

    if (current->parent_ids().size() > 1) {
        throw GraphCorruptionError("Node " + current->id() + " has multiple parents but is not a block end");
    }

    auto parents = current->get_parents();
    if (parents.empty()) {
        return next_branch();
    }

    FlowNode* parent = parents.front();
    if (is_fork_start(parent)) {
        forks_.back().start_reached = true;
        return next_branch();
    }
    if (is_stop_node(parent)) {
        return next_branch();
    }
    return emit(parent, false, NodeType::NORMAL);
}

// =============================================================================
// Chunk visiting
// =============================================================================

void ForkScanner::visit_simple_chunks(const std::vector<FlowNode*>& heads,
                                      SimpleChunkVisitor& visitor, const ChunkFinder& finder) {
    if (!setup(heads)) {
        return;
    }
    visit_simple_chunks(visitor, finder);
}

void ForkScanner::visit_simple_chunks(SimpleChunkVisitor& visitor, const ChunkFinder& finder) {
    if (finder.is_start_inside_chunk() && has_next()) {
        visitor.chunk_end(next_, nullptr, *this);
    }

    while (has_next()) {
        FlowNode* prev = current_;
        FlowNode* node = next();

        bool boundary = false;
        if (finder.is_chunk_start(node, prev)) {
            visitor.chunk_start(node, next_, *this);
            boundary = true;
        }
        if (finder.is_chunk_end(node, prev)) {
            visitor.chunk_end(node, prev, *this);
            boundary = true;
        }
        if (!boundary) {
            visitor.atom_node(next_, node, prev, *this);
        }

        const NodeInfo& info = current_info_;
        if (info.type == NodeType::PARALLEL_END) {
            visitor.parallel_end(static_cast<BlockEndNode*>(node)->get_start_node(), node, *this);
        } else if (info.type == NodeType::PARALLEL_START) {
            visitor.parallel_start(node, prev, *this);
        }

        // A one-node branch is both the branch end and the branch start
        if (info.enclosing_parallel) {
            if (info.branch_end) {
                visitor.parallel_branch_end(info.enclosing_parallel, node, *this);
            }
            if (info.branch_start) {
                visitor.parallel_branch_start(info.enclosing_parallel, node, *this);
            }
        }
    }
}

} // namespace flowgraph
