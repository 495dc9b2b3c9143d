#ifndef FLOWGRAPH_STANDARD_CHUNK_VISITOR_HPP
#define FLOWGRAPH_STANDARD_CHUNK_VISITOR_HPP

#include <flowgraph/flow_chunk.hpp>
#include <flowgraph/chunk_finder.hpp>
#include <flowgraph/simple_chunk_visitor.hpp>

#include <vector>

namespace flowgraph {

class FlowExecution;

/**
 * Tracks one chunk at a time, handing each to handle_chunk_done() once its
 * start has been reached. Chunks arrive newest first.
 */
class StandardChunkVisitor : public SimpleChunkVisitor {
public:
    void chunk_start(FlowNode* start_node, FlowNode* before_chunk, ForkScanner& scanner) override;
    void chunk_end(FlowNode* end_node, FlowNode* after_chunk, ForkScanner& scanner) override;

protected:
    virtual void handle_chunk_done(const MemoryFlowChunk& /*chunk*/) {}

    MemoryFlowChunk chunk_;
};

// Collects complete chunks in chronological order
class FlowChunker {
public:
    static std::vector<MemoryFlowChunk> find_chunks(FlowExecution& execution, const ChunkFinder& finder);
    static std::vector<MemoryFlowChunk> find_chunks(const std::vector<FlowNode*>& heads, const ChunkFinder& finder);
};

} // namespace flowgraph

#endif // FLOWGRAPH_STANDARD_CHUNK_VISITOR_HPP
