#include <gtest/gtest.h>
#include <flowgraph/flow_node.hpp>
#include <flowgraph/memory_flow_execution.hpp>
#include <flowgraph/depth_first_scanner.hpp>
#include <flowgraph/errors.hpp>
#include "test_helpers.hpp"

#include <stdexcept>
#include <unordered_set>

using namespace flowgraph;
using test_utils::ids;
using test_utils::node;

class FlowNodeTest : public ::testing::Test {
protected:
    MemoryFlowExecution exec{"job/nodes/1"};
};

// === PARENT RESOLUTION ===

TEST_F(FlowNodeTest, ParentsResolveToNodes) {
    test_utils::build_linear(exec);

    FlowNode* b = node(exec, "B");
    auto parents = b->get_parents();
    ASSERT_EQ(parents.size(), 1);
    EXPECT_EQ(parents[0]->id(), "A");
    EXPECT_EQ(parents[0], exec.get_node("A"));
}

TEST_F(FlowNodeTest, RootHasNoParents) {
    test_utils::build_linear(exec);
    EXPECT_TRUE(node(exec, "start")->get_parents().empty());
}

TEST_F(FlowNodeTest, EveryNonRootNodeHasParents) {
    test_utils::build_nested_parallel(exec);

    DepthFirstScanner scanner;
    auto all = scanner.all_nodes(exec);
    ASSERT_EQ(all.size(), exec.num_nodes());
    for (FlowNode* n : all) {
        if (n->is_flow_start()) {
            EXPECT_TRUE(n->get_parents().empty());
        } else {
            EXPECT_FALSE(n->get_parents().empty()) << n->id();
        }
    }
}

TEST_F(FlowNodeTest, JoinKeepsParentOrder) {
    test_utils::build_parallel(exec);
    EXPECT_EQ(ids(node(exec, "J")->get_parents()), (std::vector<std::string>{"B1", "B2"}));
}

TEST_F(FlowNodeTest, ParentLoadFailureIsSkippedAndRetried) {
    test_utils::FlakyExecution flaky;
    // Restored history: nothing has resolved parents yet
    flaky.begin_restore();
    test_utils::build_linear(flaky);
    flaky.end_restore();
    test_utils::LogCapture log;

    FlowNode* b = flaky.get_node("B");
    flaky.fail("A");
    EXPECT_TRUE(b->get_parents().empty());
    EXPECT_GE(log.count(debug::LogLevel::WARN), 1);

    flaky.recover("A");
    auto parents = b->get_parents();
    ASSERT_EQ(parents.size(), 1);
    EXPECT_EQ(parents[0]->id(), "A");
}

TEST_F(FlowNodeTest, ResolvedParentsAreCached) {
    test_utils::FlakyExecution flaky;
    test_utils::build_linear(flaky);

    FlowNode* b = flaky.get_node("B");
    ASSERT_EQ(b->get_parents().size(), 1);

    // Once fully resolved, storage is no longer consulted
    flaky.fail("A");
    EXPECT_EQ(b->get_parents().size(), 1);
}

// === IDENTITY ===

TEST_F(FlowNodeTest, EqualityIsById) {
    test_utils::build_linear(exec);
    MemoryFlowExecution other("job/nodes/2");
    test_utils::build_linear(other);

    FlowNode* a1 = exec.get_node("A");
    FlowNode* a2 = other.get_node("A");
    ASSERT_NE(a1, a2);
    EXPECT_TRUE(*a1 == *a2);
    EXPECT_TRUE(*a1 != *exec.get_node("B"));
    EXPECT_TRUE(FlowNodePtrEqual{}(a1, a2));
    EXPECT_EQ(FlowNodePtrHash{}(a1), FlowNodePtrHash{}(a2));
    EXPECT_EQ(std::hash<FlowNode>{}(*a1), std::hash<FlowNode>{}(*a2));

    std::unordered_set<const FlowNode*, FlowNodePtrHash, FlowNodePtrEqual> set{a1};
    EXPECT_EQ(set.count(a2), 1);
}

TEST_F(FlowNodeTest, NodeKinds) {
    test_utils::build_block(exec);

    EXPECT_EQ(node(exec, "start")->kind(), NodeKind::FLOW_START);
    EXPECT_EQ(node(exec, "S")->kind(), NodeKind::BLOCK_START);
    EXPECT_EQ(node(exec, "A")->kind(), NodeKind::ATOM);
    EXPECT_EQ(node(exec, "E")->kind(), NodeKind::BLOCK_END);
    EXPECT_EQ(node(exec, "end")->kind(), NodeKind::FLOW_END);

    EXPECT_TRUE(node(exec, "start")->is_block_start());
    EXPECT_TRUE(node(exec, "end")->is_block_end());
    EXPECT_FALSE(node(exec, "A")->is_block_start());
    EXPECT_FALSE(node(exec, "A")->is_block_end());
}

// === BLOCK PAIRING ===

TEST_F(FlowNodeTest, BlockEndResolvesItsStart) {
    test_utils::build_block(exec);

    auto* end = test_utils::node_as<BlockEndNode>(exec, "E");
    ASSERT_NE(end, nullptr);
    EXPECT_EQ(end->get_start_node(), exec.get_node("S"));

    auto* flow_end = test_utils::node_as<FlowEndNode>(exec, "end");
    ASSERT_NE(flow_end, nullptr);
    EXPECT_EQ(flow_end->get_start_node(), exec.get_node("start"));
}

TEST_F(FlowNodeTest, EveryBlockEndPairsWithEarlierStart) {
    test_utils::build_nested_parallel(exec);

    DepthFirstScanner scanner;
    for (FlowNode* n : scanner.all_nodes(exec)) {
        if (!n->is_block_end()) {
            continue;
        }
        auto* end = static_cast<BlockEndNode*>(n);
        BlockStartNode* start = end->get_start_node();

        // Start is an ancestor of its end
        DepthFirstScanner ancestry;
        auto before = ids(ancestry.all_nodes({n}));
        EXPECT_NE(std::find(before.begin(), before.end(), start->id()), before.end()) << n->id();

        EXPECT_EQ(exec.get_end_node(start), end) << n->id();
    }
}

TEST_F(FlowNodeTest, MissingStartIsCorruption) {
    test_utils::build_linear(exec);
    BlockEndNode orphan(&exec, "orphan", "no-such-start", {"B"});
    EXPECT_THROW(orphan.get_start_node(), GraphCorruptionError);
}

TEST_F(FlowNodeTest, StartThatIsNotABlockStartIsCorruption) {
    test_utils::build_linear(exec);
    BlockEndNode bogus(&exec, "bogus", "A", {"B"});
    EXPECT_THROW(bogus.get_start_node(), GraphCorruptionError);
}

TEST_F(FlowNodeTest, UnloadableStartIsCorruption) {
    test_utils::FlakyExecution flaky;
    test_utils::build_block(flaky);

    auto* end = dynamic_cast<BlockEndNode*>(flaky.get_node("E"));
    ASSERT_NE(end, nullptr);
    flaky.fail("S");
    EXPECT_THROW(end->get_start_node(), GraphCorruptionError);
}

// === ACTIVITY ===

TEST_F(FlowNodeTest, PlainNodeActiveOnlyWhileHead) {
    exec.begin_flow("start");
    exec.add_atom("A", {"start"});
    EXPECT_TRUE(node(exec, "A")->is_active());

    exec.add_atom("B", {"A"});
    EXPECT_FALSE(node(exec, "A")->is_active());
    EXPECT_TRUE(node(exec, "B")->is_active());
}

TEST_F(FlowNodeTest, BlockStartActiveUntilEnded) {
    test_utils::build_block(exec, false);
    EXPECT_TRUE(node(exec, "S")->is_active());
    EXPECT_TRUE(node(exec, "start")->is_active());

    exec.add_block_end("E", "S", {"A"});
    EXPECT_FALSE(node(exec, "S")->is_active());

    exec.end_flow("end", {"E"});
    EXPECT_FALSE(node(exec, "start")->is_active());
    EXPECT_FALSE(node(exec, "end")->is_active());
    EXPECT_TRUE(exec.is_complete());
}

// === ACTIONS ===

TEST_F(FlowNodeTest, ActionsAndDisplayName) {
    test_utils::build_linear(exec);
    FlowNode* a = node(exec, "A");

    EXPECT_EQ(a->get_display_name(), "Step");
    EXPECT_EQ(node(exec, "start")->get_display_name(), "Start of Pipeline");
    EXPECT_EQ(a->get_action<LabelAction>(), nullptr);

    a->add_action(std::make_shared<LabelAction>("compile"));
    EXPECT_EQ(a->get_display_name(), "compile");
    EXPECT_TRUE(a->has_action<LabelAction>());
    EXPECT_FALSE(a->has_action<StageAction>());
}

TEST_F(FlowNodeTest, AddOrReplaceKeepsOneActionPerType) {
    test_utils::build_linear(exec);
    FlowNode* a = node(exec, "A");

    a->add_or_replace_action(std::make_shared<ErrorAction>("first"));
    a->add_or_replace_action(std::make_shared<ErrorAction>("second"));
    a->add_or_replace_action(std::make_shared<WorkspaceAction>("agent-1", "/ws"));

    EXPECT_EQ(a->get_actions().size(), 2);
    ASSERT_NE(a->get_error(), nullptr);
    EXPECT_EQ(a->get_error()->get_message(), "second");
    EXPECT_EQ(a->get_action<WorkspaceAction>()->get_path(), "/ws");
}

TEST_F(FlowNodeTest, ThreadNameIsALabel) {
    test_utils::build_nested_parallel(exec);
    FlowNode* branch = node(exec, "BS1");

    auto label = branch->get_action<LabelAction>();
    ASSERT_NE(label, nullptr);
    EXPECT_EQ(label->get_label(), "one");
    EXPECT_NE(branch->get_action<ThreadNameAction>(), nullptr);
}

// === APPEND API ===

TEST_F(FlowNodeTest, GeneratedIdsSkipIdsInUse) {
    std::string first = exec.generate_id();
    EXPECT_EQ(first, "2");
    exec.begin_flow(first);

    exec.add_atom("3", {first});
    std::string next = exec.generate_id();
    EXPECT_EQ(next, "4");
    exec.add_atom(next, {"3"});

    EXPECT_EQ(exec.num_nodes(), 3u);
    EXPECT_EQ(ids(exec.get_current_heads()), (std::vector<std::string>{"4"}));
}

TEST_F(FlowNodeTest, MalformedAppendsAreRejected) {
    EXPECT_THROW(exec.add_atom("A", {"start"}), std::invalid_argument);

    test_utils::build_block(exec, false);
    EXPECT_THROW(exec.begin_flow("again"), std::invalid_argument);
    EXPECT_THROW(exec.add_atom("A", {"S"}), std::invalid_argument);
    EXPECT_THROW(exec.add_atom("", {"A"}), std::invalid_argument);
    EXPECT_THROW(exec.add_atom("X", {}), std::invalid_argument);
    EXPECT_THROW(exec.add_atom("X", {"missing"}), std::invalid_argument);
    EXPECT_THROW(exec.add_atom("X", {"A", "S"}), std::invalid_argument);
    EXPECT_THROW(exec.add_block_end("E", "A", {"A"}), std::invalid_argument);

    exec.add_block_end("E", "S", {"A"});
    EXPECT_THROW(exec.add_block_end("E2", "S", {"E"}), std::invalid_argument);
    EXPECT_EQ(exec.num_nodes(), 4u);
}
