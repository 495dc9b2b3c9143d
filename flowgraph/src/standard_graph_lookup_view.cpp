#include <flowgraph/standard_graph_lookup_view.hpp>
#include <flowgraph/depth_first_scanner.hpp>
#include <flowgraph/flow_execution.hpp>
#include <flowgraph/errors.hpp>
#include <flowgraph/debug_log.hpp>

#include <vector>

namespace flowgraph {

StandardGraphLookupView::StandardGraphLookupView(FlowExecution& execution, std::size_t bucket_count)
    : execution_(execution),
      block_end_cache_(bucket_count),
      enclosing_cache_(bucket_count) {}

void StandardGraphLookupView::clear() {
    block_end_cache_.clear();
    enclosing_cache_.clear();
}

// =============================================================================
// Incremental maintenance
// =============================================================================

void StandardGraphLookupView::on_new_head(FlowNode* node) {
    if (node->is_block_end()) {
        auto* end = static_cast<BlockEndNode*>(node);
        block_end_cache_.insert_or_assign(end->start_id(), ended(end->id()));

        if (node->is_flow_end()) {
            enclosing_cache_.insert(node->id(), no_enclosing());
        } else if (auto start_entry = enclosing_cache_.find(end->start_id())) {
            enclosing_cache_.insert(node->id(), *start_entry);
        }
        return;
    }

    if (node->is_block_start()) {
        block_end_cache_.insert(node->id(), incomplete());
    }

    if (auto entry = derive_enclosing(node)) {
        enclosing_cache_.insert(node->id(), *entry);
    }
}

std::optional<StandardGraphLookupView::EnclosingEntry>
StandardGraphLookupView::derive_enclosing(const FlowNode* node) {
    if (node->is_flow_start()) {
        return no_enclosing();
    }
    if (node->parent_ids().empty()) {
        return std::nullopt;
    }

    auto parents = node->get_parents();
    if (parents.empty() || parents.front()->id() != node->parent_ids().front()) {
        return std::nullopt;
    }

    FlowNode* parent = parents.front();
    if (parent->is_flow_start()) {
        return no_enclosing();
    }
    if (parent->is_block_start()) {
        return enclosed_by(parent->id());
    }
    if (parent->is_block_end()) {
        // After a closed block we are back in whatever enclosed its start
        return enclosing_cache_.find(static_cast<BlockEndNode*>(parent)->start_id());
    }
    return enclosing_cache_.find(parent->id());
}

// =============================================================================
// Block ends
// =============================================================================

std::optional<StandardGraphLookupView::BlockEndEntry>
StandardGraphLookupView::lookup_block_end(const BlockStartNode* start) {
    if (auto entry = block_end_cache_.find(start->id())) {
        return entry;
    }
    return brute_force_scan_for_end(start);
}

std::optional<StandardGraphLookupView::BlockEndEntry>
StandardGraphLookupView::brute_force_scan_for_end(const BlockStartNode* start) {
    brute_force_scans_.fetch_add(1, std::memory_order_relaxed);
    FLOWGRAPH_DEBUG_LOG("Brute force scan for end of block %s", start->id().c_str());

    // Every end is visited before its own start, so meeting the start means
    // the block has not ended within the current heads
    std::optional<BlockEndEntry> result;
    DepthFirstScanner scanner;
    scanner.visit_all(execution_.get_current_heads(), [&](FlowNode* node) {
        if (node->is_block_end()) {
            auto* end = static_cast<BlockEndNode*>(node);
            block_end_cache_.insert_or_assign(end->start_id(), ended(end->id()));
            if (end->start_id() == start->id()) {
                result = ended(end->id());
                return false;
            }
        } else if (node->is_block_start()) {
            block_end_cache_.insert(node->id(), incomplete());
            if (node->id() == start->id()) {
                result = block_end_cache_.find(node->id());
                return false;
            }
        }
        return true;
    });
    return result;
}

BlockEndNode* StandardGraphLookupView::get_end_node(const BlockStartNode* start) {
    if (!start) {
        return nullptr;
    }
    auto entry = lookup_block_end(start);
    if (!entry || entry->state == BlockEndEntry::State::INCOMPLETE) {
        return nullptr;
    }
    return resolve_end(entry->end_id);
}

BlockEndNode* StandardGraphLookupView::resolve_end(const std::string& end_id) {
    try {
        FlowNode* node = execution_.get_node(end_id);
        if (node && node->is_block_end()) {
            return static_cast<BlockEndNode*>(node);
        }
        FLOWGRAPH_LOG_WARN("Cached block end %s is missing or not a block end", end_id.c_str());
    } catch (const NodeLoadError& e) {
        FLOWGRAPH_LOG_WARN("Failed to load block end %s: %s", end_id.c_str(), e.what());
    }
    return nullptr;
}

// =============================================================================
// Enclosing blocks
// =============================================================================

std::optional<StandardGraphLookupView::EnclosingEntry>
StandardGraphLookupView::brute_force_scan_for_enclosing(const FlowNode* node) {
    brute_force_scans_.fetch_add(1, std::memory_order_relaxed);
    FLOWGRAPH_DEBUG_LOG("Brute force scan for enclosing block of %s", node->id().c_str());

    // Walk back along first parents, hopping over closed blocks. Every node
    // on the walk shares the answer.
    std::vector<std::string> walked{node->id()};
    const FlowNode* current = node;
    std::optional<EnclosingEntry> result;

    while (!result) {
        if (current->parent_ids().empty()) {
            result = no_enclosing();
            break;
        }
        auto parents = current->get_parents();
        if (parents.empty() || parents.front()->id() != current->parent_ids().front()) {
            // Parent unavailable; answer unknown, cache nothing
            return std::nullopt;
        }

        FlowNode* parent = parents.front();
        if (parent->is_flow_start()) {
            result = no_enclosing();
        } else if (parent->is_block_start()) {
            result = enclosed_by(parent->id());
        } else {
            if (parent->is_block_end()) {
                walked.push_back(parent->id());
                parent = static_cast<BlockEndNode*>(parent)->get_start_node();
            }
            if (auto cached = enclosing_cache_.find(parent->id())) {
                result = cached;
            } else {
                walked.push_back(parent->id());
                current = parent;
            }
        }
    }

    for (const auto& id : walked) {
        enclosing_cache_.insert(id, *result);
    }
    return result;
}

BlockStartNode* StandardGraphLookupView::find_enclosing_block_start(const FlowNode* node) {
    if (!node || node->is_flow_start() || node->is_flow_end()) {
        return nullptr;
    }
    if (node->is_block_end()) {
        return find_enclosing_block_start(static_cast<const BlockEndNode*>(node)->get_start_node());
    }

    std::optional<EnclosingEntry> entry = enclosing_cache_.find(node->id());
    if (!entry) {
        entry = brute_force_scan_for_enclosing(node);
    }
    if (!entry) {
        return nullptr;
    }
    return resolve_start(*entry);
}

BlockStartNode* StandardGraphLookupView::resolve_start(const EnclosingEntry& entry) {
    if (entry.state == EnclosingEntry::State::NONE) {
        return nullptr;
    }
    try {
        FlowNode* node = execution_.get_node(entry.start_id);
        if (node && node->is_block_start()) {
            return static_cast<BlockStartNode*>(node);
        }
        FLOWGRAPH_LOG_WARN("Cached enclosing block %s is missing or not a block start",
                           entry.start_id.c_str());
    } catch (const NodeLoadError& e) {
        FLOWGRAPH_LOG_WARN("Failed to load enclosing block %s: %s", entry.start_id.c_str(), e.what());
    }
    return nullptr;
}

// =============================================================================
// Activity
// =============================================================================

bool StandardGraphLookupView::is_active(const FlowNode* node) {
    if (!node || node->is_flow_end()) {
        return false;
    }
    if (node->is_block_start()) {
        auto entry = lookup_block_end(static_cast<const BlockStartNode*>(node));
        return !entry || entry->state == BlockEndEntry::State::INCOMPLETE;
    }
    return execution_.is_current_head(node);
}

} // namespace flowgraph
