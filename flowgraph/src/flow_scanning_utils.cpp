#include <flowgraph/flow_scanning_utils.hpp>
#include <flowgraph/linear_block_hopping_scanner.hpp>

#include <memory>

namespace flowgraph {
namespace scanning {

const NodePredicate MATCH_HAS_LABEL = node_has_action_predicate<LabelAction>();
const NodePredicate MATCH_IS_STAGE = node_has_action_predicate<StageAction>();
const NodePredicate MATCH_HAS_WORKSPACE = node_has_action_predicate<WorkspaceAction>();
const NodePredicate MATCH_HAS_ERROR = node_has_action_predicate<ErrorAction>();
const NodePredicate MATCH_BLOCK_START = [](FlowNode* node) {
    return node != nullptr && node->is_block_start();
};

Filterator filterable_enclosing_blocks(FlowNode* node) {
    auto scanner = std::make_shared<LinearBlockHoppingScanner>();
    if (node) {
        // A block end shares the enclosing blocks of its start
        FlowNode* origin = node->is_block_end()
            ? static_cast<BlockEndNode*>(node)->get_start_node()
            : node;
        // Skip the origin itself
        if (scanner->setup(origin)) {
            scanner->next();
        }
    }
    return Filterator([scanner]() -> FlowNode* {
        return scanner->has_next() ? scanner->next() : nullptr;
    }, [](FlowNode* candidate) {
        return candidate->is_block_start() && !candidate->is_flow_start();
    });
}

} // namespace scanning
} // namespace flowgraph
