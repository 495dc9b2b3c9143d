#include <gtest/gtest.h>
#include <flowgraph/concurrent_hash_map.hpp>
#include <flowgraph/memory_flow_execution.hpp>
#include <flowgraph/depth_first_scanner.hpp>
#include <flowgraph/flow_scanning_utils.hpp>
#include "test_helpers.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace flowgraph;
using test_utils::ids;

class ConcurrentReadsTest : public ::testing::Test {
protected:
    static constexpr int NUM_READERS = 4;
    static constexpr int NESTING = 20;
};

// === CONCURRENT HASH MAP ===

TEST_F(ConcurrentReadsTest, HashMapInsertOrAssignReplaces) {
    ConcurrentHashMap<std::string, int> map(8);

    EXPECT_TRUE(map.insert("a", 1));
    EXPECT_FALSE(map.insert("a", 2));
    EXPECT_EQ(map.find("a"), std::optional<int>(1));

    map.insert_or_assign("a", 3);
    EXPECT_EQ(map.find("a"), std::optional<int>(3));
    EXPECT_EQ(map.size(), 1);

    map.insert_or_assign("b", 4);
    EXPECT_EQ(map.size(), 2);
    EXPECT_TRUE(map.contains("b"));
    EXPECT_FALSE(map.contains("c"));

    int total = 0;
    map.for_each([&total](const std::string&, int value) { total += value; });
    EXPECT_EQ(total, 7);

    map.clear();
    EXPECT_TRUE(map.empty());
}

TEST_F(ConcurrentReadsTest, HashMapParallelInserts) {
    ConcurrentHashMap<int, int> map(16);
    const int per_thread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_READERS; ++t) {
        threads.emplace_back([&map, t, per_thread]() {
            for (int i = 0; i < per_thread; ++i) {
                map.insert(t * per_thread + i, i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(map.size(), static_cast<std::size_t>(NUM_READERS * per_thread));
}

TEST_F(ConcurrentReadsTest, HashMapInsertOrGetHasOneWinner) {
    ConcurrentHashMap<std::string, int> map;
    std::atomic<int> winners{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_READERS; ++t) {
        threads.emplace_back([&map, &winners, t]() {
            if (map.insert_or_get("shared", t).second) {
                ++winners;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(map.size(), 1);
}

// === GRAPH READS DURING APPEND ===

TEST_F(ConcurrentReadsTest, ReadersDuringAppend) {
    MemoryFlowExecution exec("job/concurrent/1");
    exec.begin_flow("start");

    std::atomic<bool> done{false};
    std::atomic<int> violations{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < NUM_READERS; ++r) {
        readers.emplace_back([&]() {
            DepthFirstScanner scanner;
            while (!done.load(std::memory_order_acquire)) {
                for (FlowNode* n : scanner.all_nodes(exec)) {
                    for (BlockStartNode* start : exec.iterate_enclosing_blocks(n)) {
                        if (!start->is_block_start() || start->is_flow_start()) {
                            ++violations;
                        }
                    }
                }
            }
        });
    }

    // Nest NESTING blocks with an atom in each, then close them all
    std::string last = "start";
    for (int i = 0; i < NESTING; ++i) {
        std::string start_id = "S" + std::to_string(i);
        std::string atom_id = "a" + std::to_string(i);
        exec.add_block_start(start_id, {last});
        exec.add_atom(atom_id, {start_id});
        last = atom_id;
    }
    for (int i = NESTING - 1; i >= 0; --i) {
        std::string end_id = "E" + std::to_string(i);
        exec.add_block_end(end_id, "S" + std::to_string(i), {last});
        last = end_id;
    }
    exec.end_flow("end", {last});

    done.store(true, std::memory_order_release);
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(exec.num_nodes(), static_cast<std::size_t>(3 * NESTING + 2));

    // Cached answers agree with a cache-free walk
    DepthFirstScanner scanner;
    for (FlowNode* n : scanner.all_nodes(exec)) {
        std::vector<std::string> walked;
        auto blocks = scanning::filterable_enclosing_blocks(n);
        while (blocks.has_next()) {
            walked.push_back(blocks.next()->id());
        }
        EXPECT_EQ(ids(exec.find_all_enclosing_block_starts(n)), walked) << n->id();
    }

    EXPECT_EQ(exec.find_all_enclosing_block_starts(exec.get_node("a" + std::to_string(NESTING - 1))).size(),
              static_cast<std::size_t>(NESTING));
}

TEST_F(ConcurrentReadsTest, ParallelColdLookupsAgree) {
    MemoryFlowExecution exec("job/concurrent/2");
    exec.begin_restore();
    test_utils::build_nested_parallel(exec);
    exec.end_restore();

    std::vector<std::vector<std::string>> results(NUM_READERS);
    std::vector<std::thread> readers;
    for (int r = 0; r < NUM_READERS; ++r) {
        readers.emplace_back([&exec, &results, r]() {
            results[r] = ids(exec.find_all_enclosing_block_starts(exec.get_node("c1")));
            BlockEndNode* end = exec.get_end_node(static_cast<BlockStartNode*>(exec.get_node("Q")));
            results[r].push_back(end ? end->id() : "<none>");
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }

    for (const auto& result : results) {
        EXPECT_EQ(result, (std::vector<std::string>{"Q", "BS2", "P", "QJ"}));
    }
}
