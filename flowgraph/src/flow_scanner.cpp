#include <flowgraph/flow_scanner.hpp>
#include <flowgraph/flow_execution.hpp>

#include <stdexcept>

namespace flowgraph {

bool AbstractFlowScanner::setup(const std::vector<FlowNode*>& heads,
                                const std::vector<FlowNode*>& stop_nodes) {
    reset();
    current_ = nullptr;
    next_ = nullptr;
    stop_reached_ = false;
    stop_nodes_ = StopNodeSet(stop_nodes);

    std::vector<FlowNode*> filtered;
    filtered.reserve(heads.size());
    for (FlowNode* head : heads) {
        if (head && !is_stop_node(head)) {
            filtered.push_back(head);
        }
    }

    if (filtered.empty()) {
        return false;
    }

    next_ = set_heads(filtered);
    return next_ != nullptr;
}

bool AbstractFlowScanner::setup(const std::vector<FlowNode*>& heads) {
    return setup(heads, {});
}

bool AbstractFlowScanner::setup(FlowNode* head) {
    if (!head) {
        return setup(std::vector<FlowNode*>{}, {});
    }
    return setup(std::vector<FlowNode*>{head}, {});
}

FlowNode* AbstractFlowScanner::next() {
    if (!next_) {
        throw std::out_of_range("Scan exhausted");
    }
    current_ = next_;
    next_ = next_node(current_);
    return current_;
}

Filterator AbstractFlowScanner::filter(NodePredicate predicate) {
    return Filterator([this]() -> FlowNode* {
        return has_next() ? next() : nullptr;
    }, std::move(predicate));
}

// =============================================================================
// Queries
// =============================================================================

FlowNode* AbstractFlowScanner::find_first_match(const std::vector<FlowNode*>& heads,
                                                const std::vector<FlowNode*>& stop_nodes,
                                                const NodePredicate& predicate) {
    if (!setup(heads, stop_nodes)) {
        return nullptr;
    }
    while (has_next()) {
        FlowNode* node = next();
        if (predicate(node)) {
            return node;
        }
    }
    return nullptr;
}

FlowNode* AbstractFlowScanner::find_first_match(const std::vector<FlowNode*>& heads,
                                                const NodePredicate& predicate) {
    return find_first_match(heads, {}, predicate);
}

FlowNode* AbstractFlowScanner::find_first_match(FlowNode* head, const NodePredicate& predicate) {
    if (!head) {
        return nullptr;
    }
    return find_first_match(std::vector<FlowNode*>{head}, {}, predicate);
}

FlowNode* AbstractFlowScanner::find_first_match(FlowExecution& execution, const NodePredicate& predicate) {
    return find_first_match(execution.get_current_heads(), {}, predicate);
}

std::vector<FlowNode*> AbstractFlowScanner::filtered_nodes(const std::vector<FlowNode*>& heads,
                                                           const std::vector<FlowNode*>& stop_nodes,
                                                           const NodePredicate& predicate) {
    std::vector<FlowNode*> result;
    if (!setup(heads, stop_nodes)) {
        return result;
    }
    while (has_next()) {
        FlowNode* node = next();
        if (predicate(node)) {
            result.push_back(node);
        }
    }
    return result;
}

std::vector<FlowNode*> AbstractFlowScanner::filtered_nodes(const std::vector<FlowNode*>& heads,
                                                           const NodePredicate& predicate) {
    return filtered_nodes(heads, {}, predicate);
}

std::vector<FlowNode*> AbstractFlowScanner::filtered_nodes(FlowNode* head, const NodePredicate& predicate) {
    if (!head) {
        return {};
    }
    return filtered_nodes(std::vector<FlowNode*>{head}, {}, predicate);
}

std::vector<FlowNode*> AbstractFlowScanner::all_nodes(const std::vector<FlowNode*>& heads) {
    std::vector<FlowNode*> result;
    if (!setup(heads)) {
        return result;
    }
    while (has_next()) {
        result.push_back(next());
    }
    return result;
}

std::vector<FlowNode*> AbstractFlowScanner::all_nodes(FlowExecution& execution) {
    return all_nodes(execution.get_current_heads());
}

void AbstractFlowScanner::visit_all(const std::vector<FlowNode*>& heads,
                                    const std::vector<FlowNode*>& stop_nodes,
                                    const NodeVisitor& visitor) {
    if (!setup(heads, stop_nodes)) {
        return;
    }
    while (has_next()) {
        if (!visitor(next())) {
            return;
        }
    }
}

void AbstractFlowScanner::visit_all(const std::vector<FlowNode*>& heads, const NodeVisitor& visitor) {
    visit_all(heads, {}, visitor);
}

} // namespace flowgraph
