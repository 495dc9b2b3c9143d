#include <flowgraph/standard_chunk_visitor.hpp>
#include <flowgraph/fork_scanner.hpp>
#include <flowgraph/flow_execution.hpp>

#include <algorithm>

namespace flowgraph {

void StandardChunkVisitor::chunk_start(FlowNode* start_node, FlowNode* before_chunk, ForkScanner& /*scanner*/) {
    chunk_.node_before = before_chunk;
    chunk_.first_node = start_node;
    if (chunk_.last_node) {
        handle_chunk_done(chunk_);
    }
    chunk_.reset();
}

void StandardChunkVisitor::chunk_end(FlowNode* end_node, FlowNode* after_chunk, ForkScanner& /*scanner*/) {
    chunk_.last_node = end_node;
    chunk_.node_after = after_chunk;
}

namespace {

class CollectingChunkVisitor : public StandardChunkVisitor {
public:
    std::vector<MemoryFlowChunk> chunks;

protected:
    void handle_chunk_done(const MemoryFlowChunk& chunk) override {
        chunks.push_back(chunk);
    }
};

} // namespace

std::vector<MemoryFlowChunk> FlowChunker::find_chunks(const std::vector<FlowNode*>& heads,
                                                      const ChunkFinder& finder) {
    CollectingChunkVisitor visitor;
    ForkScanner scanner;
    scanner.visit_simple_chunks(heads, visitor, finder);
    std::reverse(visitor.chunks.begin(), visitor.chunks.end());
    return visitor.chunks;
}

std::vector<MemoryFlowChunk> FlowChunker::find_chunks(FlowExecution& execution, const ChunkFinder& finder) {
    return find_chunks(execution.get_current_heads(), finder);
}

} // namespace flowgraph
