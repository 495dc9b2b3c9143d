#ifndef FLOWGRAPH_INCREMENTAL_FLOW_ANALYSIS_CACHE_HPP
#define FLOWGRAPH_INCREMENTAL_FLOW_ANALYSIS_CACHE_HPP

#include <flowgraph/flow_execution.hpp>
#include <flowgraph/linear_block_hopping_scanner.hpp>
#include <flowgraph/errors.hpp>
#include <flowgraph/debug_log.hpp>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flowgraph {

/**
 * Memoizes "value of the nearest node matching a predicate" per execution.
 *
 * Each execution (keyed by its URL) remembers the head ids it was last
 * computed against. A repeat query with the same heads costs nothing; when
 * the heads have moved, only the nodes appended since are walked, using the
 * previous heads as stop nodes. If the delta has no match but the walk
 * reached the previous heads, the previous value still holds.
 *
 * One instance per predicate/extractor pair. State is kept for every URL
 * queried until the owner calls evict() (typically once an execution
 * completes) or clear().
 */
template<typename T>
class IncrementalFlowAnalysisCache {
public:
    using ValueExtractor = std::function<T(FlowNode*)>;

    static constexpr std::size_t DEFAULT_CAPACITY = 100;

    IncrementalFlowAnalysisCache(NodePredicate predicate, ValueExtractor extractor,
                                 std::size_t initial_capacity = DEFAULT_CAPACITY)
        : predicate_(std::move(predicate)), extractor_(std::move(extractor)) {
        analyses_.reserve(initial_capacity);
    }

    std::optional<T> get_analysis_value(FlowExecution& execution) {
        return get_analysis_value(execution, execution.get_current_heads());
    }

    /**
     * Value relative to explicit heads, or nullopt if no node matches.
     * Empty heads yield nullopt without touching the cache.
     */
    std::optional<T> get_analysis_value(FlowExecution& execution, const std::vector<FlowNode*>& heads) {
        if (heads.empty()) {
            return std::nullopt;
        }

        std::shared_ptr<IncrementalAnalysis> analysis = analysis_for(execution.get_url());
        std::lock_guard<std::mutex> lock(analysis->mutex);

        std::vector<std::string> head_ids = sorted_ids(heads);
        if (analysis->has_run && head_ids == analysis->last_head_ids) {
            return analysis->last_value;
        }

        std::vector<FlowNode*> stop_nodes;
        if (analysis->has_run) {
            stop_nodes = resolve_previous_heads(execution, analysis->last_head_ids);
        }

        LinearBlockHoppingScanner scanner;
        FlowNode* match = scanner.find_first_match(heads, stop_nodes, predicate_);

        std::optional<T> value;
        if (match) {
            value = extractor_(match);
        } else if (analysis->has_run && scanner.reached_stop_nodes()) {
            value = analysis->last_value;
        }

        FLOWGRAPH_DEBUG_LOG("Incremental analysis of %s: %s", execution.get_url().c_str(),
                            match ? match->id().c_str() : "no match in delta");

        analysis->last_head_ids = std::move(head_ids);
        analysis->last_value = value;
        analysis->has_run = true;
        return value;
    }

    // Number of executions with cached state
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return analyses_.size();
    }

    // Forget one execution. Returns false if nothing was cached for it.
    bool evict(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        return analyses_.erase(url) > 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        analyses_.clear();
    }

private:
    struct IncrementalAnalysis {
        std::mutex mutex;
        std::vector<std::string> last_head_ids;  // Sorted
        std::optional<T> last_value;
        bool has_run = false;
    };

    std::shared_ptr<IncrementalAnalysis> analysis_for(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = analyses_[url];
        if (!slot) {
            slot = std::make_shared<IncrementalAnalysis>();
        }
        return slot;
    }

    static std::vector<std::string> sorted_ids(const std::vector<FlowNode*>& nodes) {
        std::vector<std::string> ids;
        ids.reserve(nodes.size());
        for (const FlowNode* node : nodes) {
            ids.push_back(node->id());
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    // Previous heads that fail to load are dropped from the bound
    static std::vector<FlowNode*> resolve_previous_heads(FlowExecution& execution,
                                                         const std::vector<std::string>& ids) {
        std::vector<FlowNode*> nodes;
        nodes.reserve(ids.size());
        for (const auto& id : ids) {
            try {
                FlowNode* node = execution.get_node(id);
                if (node) {
                    nodes.push_back(node);
                } else {
                    FLOWGRAPH_LOG_WARN("Previous head %s no longer exists in %s",
                                       id.c_str(), execution.get_url().c_str());
                }
            } catch (const NodeLoadError& e) {
                FLOWGRAPH_LOG_WARN("Failed to load previous head %s: %s", id.c_str(), e.what());
            }
        }
        return nodes;
    }

    NodePredicate predicate_;
    ValueExtractor extractor_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<IncrementalAnalysis>> analyses_;
};

} // namespace flowgraph

#endif // FLOWGRAPH_INCREMENTAL_FLOW_ANALYSIS_CACHE_HPP
