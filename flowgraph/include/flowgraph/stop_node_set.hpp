#ifndef FLOWGRAPH_STOP_NODE_SET_HPP
#define FLOWGRAPH_STOP_NODE_SET_HPP

#include <flowgraph/flow_node.hpp>

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace flowgraph {

/**
 * Membership structure for the nodes a scan must not visit or cross.
 * Built once per scan; the representation is chosen by size since the
 * check runs for every candidate node.
 */
class StopNodeSet {
public:
    // Above this many entries a hash set beats a linear scan of ids
    static constexpr std::size_t MAX_LIST_CHECK_SIZE = 5;

    enum class Mode {
        EMPTY,
        SINGLE,
        LIST,
        HASHED
    };

    StopNodeSet() = default;
    explicit StopNodeSet(const std::vector<FlowNode*>& nodes);

    bool contains(const FlowNode* node) const;

    Mode mode() const { return mode_; }
    std::size_t size() const;
    bool empty() const { return mode_ == Mode::EMPTY; }

private:
    Mode mode_ = Mode::EMPTY;
    std::vector<std::string> ids_;
    std::unordered_set<std::string> hashed_ids_;
};

} // namespace flowgraph

#endif // FLOWGRAPH_STOP_NODE_SET_HPP
