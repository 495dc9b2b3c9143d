#ifndef FLOWGRAPH_ERRORS_HPP
#define FLOWGRAPH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace flowgraph {

/**
 * Raised by FlowExecution::get_node when storage fails to load a node.
 * Callers that can degrade (skip a parent, report "unavailable") catch this.
 */
class NodeLoadError : public std::runtime_error {
public:
    explicit NodeLoadError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * The graph violates a structural invariant (missing block start,
 * multi-parent non-end node, cycle). Not retryable.
 */
class GraphCorruptionError : public std::runtime_error {
public:
    explicit GraphCorruptionError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace flowgraph

#endif // FLOWGRAPH_ERRORS_HPP
