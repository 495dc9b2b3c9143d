#pragma once
#include <gtest/gtest.h>
#include <flowgraph/flow_execution.hpp>
#include <flowgraph/memory_flow_execution.hpp>
#include <flowgraph/errors.hpp>
#include <flowgraph/debug_log.hpp>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>
#include <algorithm>

namespace test_utils {

using flowgraph::FlowNode;

/**
 * Ids of a node sequence, in order
 */
inline std::vector<std::string> ids(const std::vector<FlowNode*>& nodes) {
    std::vector<std::string> result;
    result.reserve(nodes.size());
    for (const FlowNode* node : nodes) {
        result.push_back(node ? node->id() : "<null>");
    }
    return result;
}

template<typename NodeT>
inline std::vector<std::string> ids(const std::vector<NodeT*>& nodes) {
    return ids(std::vector<FlowNode*>(nodes.begin(), nodes.end()));
}

inline FlowNode* node(flowgraph::FlowExecution& exec, const std::string& id) {
    FlowNode* found = exec.get_node(id);
    EXPECT_NE(found, nullptr) << "No node " << id;
    return found;
}

template<typename NodeT>
inline NodeT* node_as(flowgraph::FlowExecution& exec, const std::string& id) {
    return dynamic_cast<NodeT*>(node(exec, id));
}

/**
 * In-memory execution whose storage can be made to fail for chosen ids
 */
class FlakyExecution : public flowgraph::MemoryFlowExecution {
public:
    explicit FlakyExecution(std::string url = "job/flaky/1") : MemoryFlowExecution(std::move(url)) {}

    FlowNode* get_node(const std::string& id) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failing_.count(id)) {
                throw flowgraph::NodeLoadError("simulated storage failure for " + id);
            }
        }
        return MemoryFlowExecution::get_node(id);
    }

    void fail(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(id);
    }

    void recover(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.erase(id);
    }

private:
    std::mutex mutex_;
    std::set<std::string> failing_;
};

/**
 * Execution assembled from raw nodes with no validation, for corrupt graphs
 */
class HandBuiltExecution : public flowgraph::FlowExecution {
public:
    template<typename NodeT, typename... Args>
    NodeT* add(Args&&... args) {
        auto owned = std::make_unique<NodeT>(this, std::forward<Args>(args)...);
        NodeT* raw = owned.get();
        nodes_[raw->id()] = std::move(owned);
        return raw;
    }

    void set_heads(std::vector<FlowNode*> heads) { heads_ = std::move(heads); }

    FlowNode* get_node(const std::string& id) override {
        auto it = nodes_.find(id);
        return it == nodes_.end() ? nullptr : it->second.get();
    }

    std::vector<FlowNode*> get_current_heads() override { return heads_; }
    std::string get_url() const override { return "job/handbuilt/1"; }

private:
    std::unordered_map<std::string, std::unique_ptr<FlowNode>> nodes_;
    std::vector<FlowNode*> heads_;
};

// === GRAPH BUILDERS ===

/**
 * start -> A -> B -> end
 */
inline void build_linear(flowgraph::MemoryFlowExecution& exec) {
    exec.begin_flow("start");
    exec.add_atom("A", {"start"});
    exec.add_atom("B", {"A"});
    exec.end_flow("end", {"B"});
}

/**
 * start -> S -> A -> E -> end, stopping after A when closed is false
 */
inline void build_block(flowgraph::MemoryFlowExecution& exec, bool closed = true) {
    exec.begin_flow("start");
    exec.add_block_start("S", {"start"});
    exec.add_atom("A", {"S"});
    if (closed) {
        exec.add_block_end("E", "S", {"A"});
        exec.end_flow("end", {"E"});
    }
}

/**
 * start -> P -> {B1, B2} -> J(B1, B2) -> end
 */
inline void build_parallel(flowgraph::MemoryFlowExecution& exec) {
    exec.begin_flow("start");
    exec.add_block_start("P", {"start"});
    exec.add_atom("B1", {"P"});
    exec.add_atom("B2", {"P"});
    exec.add_block_end("J", "P", {"B1", "B2"});
    exec.end_flow("end", {"J"});
}

/**
 * Parallel with real branch blocks and a nested parallel in branch two:
 *
 * start -> pre -> P
 *   P -> BS1 -> a1 -> BE1
 *   P -> BS2 -> a2 -> Q -> {c1, c2} -> QJ -> BE2
 *   J(BE1, BE2) -> post -> end
 *
 * BS1/BS2 carry ThreadNameActions "one"/"two".
 */
inline void build_nested_parallel(flowgraph::MemoryFlowExecution& exec) {
    exec.begin_flow("start");
    exec.add_atom("pre", {"start"});
    exec.add_block_start("P", {"pre"});
    exec.add_block_start("BS1", {"P"})->add_action(std::make_shared<flowgraph::ThreadNameAction>("one"));
    exec.add_block_start("BS2", {"P"})->add_action(std::make_shared<flowgraph::ThreadNameAction>("two"));
    exec.add_atom("a1", {"BS1"});
    exec.add_atom("a2", {"BS2"});
    exec.add_block_end("BE1", "BS1", {"a1"});
    exec.add_block_start("Q", {"a2"});
    exec.add_atom("c1", {"Q"});
    exec.add_atom("c2", {"Q"});
    exec.add_block_end("QJ", "Q", {"c1", "c2"});
    exec.add_block_end("BE2", "BS2", {"QJ"});
    exec.add_block_end("J", "P", {"BE1", "BE2"});
    exec.add_atom("post", {"J"});
    exec.end_flow("end", {"post"});
}

/**
 * Captures log output for the duration of a test
 */
class LogCapture {
public:
    LogCapture() {
        {
            std::lock_guard<std::mutex> lock(mutex());
            messages().clear();
        }
        flowgraph::debug::set_log_callback(&LogCapture::record);
    }

    ~LogCapture() {
        flowgraph::debug::clear_log_callback();
    }

    std::size_t count(flowgraph::debug::LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex());
        return std::count_if(messages().begin(), messages().end(),
                             [level](const auto& entry) { return entry.first == level; });
    }

    bool contains(const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(mutex());
        return std::any_of(messages().begin(), messages().end(),
                           [&fragment](const auto& entry) {
                               return entry.second.find(fragment) != std::string::npos;
                           });
    }

private:
    static void record(flowgraph::debug::LogLevel level, const char* message) {
        std::lock_guard<std::mutex> lock(mutex());
        messages().emplace_back(level, message);
    }

    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }

    static std::vector<std::pair<flowgraph::debug::LogLevel, std::string>>& messages() {
        static std::vector<std::pair<flowgraph::debug::LogLevel, std::string>> m;
        return m;
    }
};

} // namespace test_utils
