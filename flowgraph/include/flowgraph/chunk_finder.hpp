#ifndef FLOWGRAPH_CHUNK_FINDER_HPP
#define FLOWGRAPH_CHUNK_FINDER_HPP

#include <flowgraph/flow_node.hpp>

namespace flowgraph {

/**
 * Decides where chunks (runs of nodes such as a stage) begin and end while
 * walking backward. "previous" is the node visited just before current,
 * which is later in time; it is nullptr at the head.
 */
class ChunkFinder {
public:
    virtual ~ChunkFinder() = default;

    // If true, the walk starts inside an implicit chunk ending at the head
    virtual bool is_start_inside_chunk() const = 0;

    virtual bool is_chunk_start(const FlowNode* current, const FlowNode* previous) const = 0;
    virtual bool is_chunk_end(const FlowNode* current, const FlowNode* previous) const = 0;
};

// Every block is a chunk
class BlockChunkFinder : public ChunkFinder {
public:
    bool is_start_inside_chunk() const override { return false; }
    bool is_chunk_start(const FlowNode* current, const FlowNode* previous) const override;
    bool is_chunk_end(const FlowNode* current, const FlowNode* previous) const override;
};

/**
 * A labelled node starts a chunk that runs until the next labelled node,
 * or until the end of a labelled block.
 */
class LabelledChunkFinder : public ChunkFinder {
public:
    bool is_start_inside_chunk() const override { return true; }
    bool is_chunk_start(const FlowNode* current, const FlowNode* previous) const override;
    bool is_chunk_end(const FlowNode* current, const FlowNode* previous) const override;
};

// Labelled chunks excluding parallel branch names
class StageChunkFinder : public LabelledChunkFinder {
public:
    bool is_chunk_start(const FlowNode* current, const FlowNode* previous) const override;
};

} // namespace flowgraph

#endif // FLOWGRAPH_CHUNK_FINDER_HPP
