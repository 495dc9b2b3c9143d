#include <flowgraph/stop_node_set.hpp>

#include <algorithm>

namespace flowgraph {

StopNodeSet::StopNodeSet(const std::vector<FlowNode*>& nodes) {
    for (const FlowNode* node : nodes) {
        if (node && std::find(ids_.begin(), ids_.end(), node->id()) == ids_.end()) {
            ids_.push_back(node->id());
        }
    }

    if (ids_.empty()) {
        mode_ = Mode::EMPTY;
    } else if (ids_.size() == 1) {
        mode_ = Mode::SINGLE;
    } else if (ids_.size() <= MAX_LIST_CHECK_SIZE) {
        mode_ = Mode::LIST;
    } else {
        mode_ = Mode::HASHED;
        hashed_ids_.insert(ids_.begin(), ids_.end());
        ids_.clear();
    }
}

bool StopNodeSet::contains(const FlowNode* node) const {
    if (!node) {
        return false;
    }
    switch (mode_) {
        case Mode::EMPTY:
            return false;
        case Mode::SINGLE:
            return ids_.front() == node->id();
        case Mode::LIST:
            return std::find(ids_.begin(), ids_.end(), node->id()) != ids_.end();
        case Mode::HASHED:
            return hashed_ids_.count(node->id()) > 0;
    }
    return false;
}

std::size_t StopNodeSet::size() const {
    return mode_ == Mode::HASHED ? hashed_ids_.size() : ids_.size();
}

} // namespace flowgraph
