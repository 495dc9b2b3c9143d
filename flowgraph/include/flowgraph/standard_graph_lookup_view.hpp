#ifndef FLOWGRAPH_STANDARD_GRAPH_LOOKUP_VIEW_HPP
#define FLOWGRAPH_STANDARD_GRAPH_LOOKUP_VIEW_HPP

#include <flowgraph/graph_lookup_view.hpp>
#include <flowgraph/graph_listener.hpp>
#include <flowgraph/concurrent_hash_map.hpp>

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>

namespace flowgraph {

class FlowExecution;

/**
 * Cached structural lookups over one execution.
 *
 * Two lock-free maps keyed by node id hold the block end of each start and
 * the enclosing block of each node. They are filled in O(1) per appended
 * node by on_new_head(); anything missing (history loaded before the view
 * existed) is computed by a fallback walk that caches what it learns.
 * Entries only move forward: an open block becomes ended, never the reverse.
 */
class StandardGraphLookupView : public GraphLookupView, public GraphListener {
public:
    explicit StandardGraphLookupView(FlowExecution& execution,
                                     std::size_t bucket_count = DEFAULT_BUCKET_COUNT);

    void on_new_head(FlowNode* node) override;

    bool is_active(const FlowNode* node) override;
    BlockEndNode* get_end_node(const BlockStartNode* start) override;
    BlockStartNode* find_enclosing_block_start(const FlowNode* node) override;

    // Number of fallback walks run for cache misses
    std::size_t brute_force_scan_count() const {
        return brute_force_scans_.load(std::memory_order_relaxed);
    }

    std::size_t num_cached_block_ends() const { return block_end_cache_.size(); }
    std::size_t num_cached_enclosing() const { return enclosing_cache_.size(); }

    // Drop all cached facts. Not safe against concurrent lookups.
    void clear();

private:
    static constexpr std::size_t DEFAULT_BUCKET_COUNT = 1024;

    struct BlockEndEntry {
        enum class State {
            INCOMPLETE,  // Start seen, no end yet
            ENDED
        };
        State state = State::INCOMPLETE;
        std::string end_id;
    };

    struct EnclosingEntry {
        enum class State {
            NONE,       // Directly inside the flow
            ENCLOSED
        };
        State state = State::NONE;
        std::string start_id;
    };

    static BlockEndEntry ended(const std::string& end_id) {
        return BlockEndEntry{BlockEndEntry::State::ENDED, end_id};
    }
    static BlockEndEntry incomplete() {
        return BlockEndEntry{BlockEndEntry::State::INCOMPLETE, {}};
    }
    static EnclosingEntry enclosed_by(const std::string& start_id) {
        return EnclosingEntry{EnclosingEntry::State::ENCLOSED, start_id};
    }
    static EnclosingEntry no_enclosing() {
        return EnclosingEntry{EnclosingEntry::State::NONE, {}};
    }

    // Enclosing entry for a node, derived from its first parent's cached state
    std::optional<EnclosingEntry> derive_enclosing(const FlowNode* node);

    // Cached or brute-forced block end state; nullopt if start is unreachable
    std::optional<BlockEndEntry> lookup_block_end(const BlockStartNode* start);

    std::optional<BlockEndEntry> brute_force_scan_for_end(const BlockStartNode* start);
    std::optional<EnclosingEntry> brute_force_scan_for_enclosing(const FlowNode* node);

    BlockEndNode* resolve_end(const std::string& end_id);
    BlockStartNode* resolve_start(const EnclosingEntry& entry);

    FlowExecution& execution_;
    ConcurrentHashMap<std::string, BlockEndEntry> block_end_cache_;
    ConcurrentHashMap<std::string, EnclosingEntry> enclosing_cache_;
    std::atomic<std::size_t> brute_force_scans_{0};
};

} // namespace flowgraph

#endif // FLOWGRAPH_STANDARD_GRAPH_LOOKUP_VIEW_HPP
