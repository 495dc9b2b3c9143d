/**
 * Basic Flow Graph Usage Example
 *
 * Demonstrates:
 * - Appending nodes to an in-memory execution
 * - Walking the graph backward with the scanners
 * - Structural lookups (block ends, enclosing blocks)
 * - Incremental "current stage" analysis
 */

#include <flowgraph/memory_flow_execution.hpp>
#include <flowgraph/standard_graph_lookup_view.hpp>
#include <flowgraph/depth_first_scanner.hpp>
#include <flowgraph/fork_scanner.hpp>
#include <flowgraph/flow_scanning_utils.hpp>
#include <flowgraph/incremental_flow_analysis_cache.hpp>
#include <flowgraph/standard_chunk_visitor.hpp>
#include <flowgraph/debug_log.hpp>
#include <iostream>
#include <memory>

using namespace flowgraph;

namespace {

template<typename NodeT>
void print_nodes(const char* title, const std::vector<NodeT*>& nodes) {
    std::cout << title << ":";
    for (const NodeT* node : nodes) {
        std::cout << " " << node->id();
    }
    std::cout << "\n";
}

std::string stage_name(FlowNode* node) {
    return node->get_action<LabelAction>()->get_label();
}

} // namespace

int main() {
    std::cout << "=== Basic Flow Graph Usage Example ===\n\n";

    debug::set_log_level(debug::LogLevel::INFO);

    MemoryFlowExecution exec("job/example/1");
    IncrementalFlowAnalysisCache<std::string> current_stage(scanning::MATCH_HAS_LABEL, &stage_name);

    // Build stage with a two-branch parallel inside it
    exec.begin_flow("start");
    exec.add_atom("build", {"start"})->add_action(std::make_shared<LabelAction>("Build"));
    exec.add_block_start("par", {"build"});
    exec.add_block_start("left", {"par"})->add_action(std::make_shared<ThreadNameAction>("left"));
    exec.add_block_start("right", {"par"})->add_action(std::make_shared<ThreadNameAction>("right"));
    exec.add_atom("compile", {"left"});
    exec.add_atom("lint", {"right"});

    print_nodes("Heads while running", exec.get_current_heads());
    auto* par = static_cast<BlockStartNode*>(exec.get_node("par"));
    std::cout << "Parallel active: " << (exec.is_active(par) ? "yes" : "no") << "\n";
    print_nodes("Blocks enclosing 'compile'", exec.find_all_enclosing_block_starts(exec.get_node("compile")));

    // Close the branches and the parallel, then a test stage
    exec.add_block_end("left-end", "left", {"compile"});
    exec.add_block_end("right-end", "right", {"lint"});
    exec.add_block_end("join", "par", {"left-end", "right-end"});
    exec.add_atom("test", {"join"})->add_action(std::make_shared<LabelAction>("Test"));

    auto stage = current_stage.get_analysis_value(exec);
    std::cout << "Current stage: " << (stage ? *stage : "<none>") << "\n";

    std::string report_id = exec.generate_id();
    exec.add_atom(report_id, {"test"});
    exec.end_flow("end", {report_id});

    stage = current_stage.get_analysis_value(exec);
    std::cout << "Current stage after completion: " << (stage ? *stage : "<none>") << "\n";
    current_stage.evict(exec.get_url());
    std::cout << "Analyses cached after eviction: " << current_stage.size() << "\n\n";

    BlockEndNode* join = exec.get_end_node(par);
    std::cout << "End of 'par': " << (join ? join->id() : "<none>") << "\n";
    std::cout << "Flow complete: " << (exec.is_complete() ? "yes" : "no") << "\n\n";

    DepthFirstScanner dfs;
    print_nodes("Depth-first order", dfs.all_nodes(exec));

    ForkScanner fork;
    print_nodes("Fork-aware order", fork.all_nodes(exec));

    std::cout << "\nStages:\n";
    for (const auto& chunk : FlowChunker::find_chunks(exec, StageChunkFinder())) {
        std::cout << "  " << chunk.first_node->get_display_name()
                  << " [" << chunk.first_node->id() << " .. " << chunk.last_node->id() << "]\n";
    }

    std::cout << "\nLookup cache: " << exec.lookup_view().num_cached_block_ends() << " block ends, "
              << exec.lookup_view().num_cached_enclosing() << " enclosing entries, "
              << exec.lookup_view().brute_force_scan_count() << " brute-force scans\n";

    return 0;
}
