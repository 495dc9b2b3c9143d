#ifndef FLOWGRAPH_ACTIONS_HPP
#define FLOWGRAPH_ACTIONS_HPP

#include <string>
#include <utility>

namespace flowgraph {

/**
 * Metadata attached to a FlowNode. Persistence of actions belongs to the
 * execution engine; the graph core only reads them through predicates.
 */
class Action {
public:
    virtual ~Action() = default;
};

/**
 * Human-readable label for a node (stage names, branch names).
 */
class LabelAction : public Action {
public:
    explicit LabelAction(std::string label) : label_(std::move(label)) {}

    const std::string& get_label() const { return label_; }

private:
    std::string label_;
};

// Marks the start of one branch of a parallel block
class ThreadNameAction : public LabelAction {
public:
    explicit ThreadNameAction(std::string thread_name) : LabelAction(std::move(thread_name)) {}

    const std::string& get_thread_name() const { return get_label(); }
};

class StageAction : public Action {
public:
    explicit StageAction(std::string stage_name) : stage_name_(std::move(stage_name)) {}

    const std::string& get_stage_name() const { return stage_name_; }

private:
    std::string stage_name_;
};

class ErrorAction : public Action {
public:
    explicit ErrorAction(std::string message) : message_(std::move(message)) {}

    const std::string& get_message() const { return message_; }

private:
    std::string message_;
};

class WorkspaceAction : public Action {
public:
    WorkspaceAction(std::string node_label, std::string path)
        : node_label_(std::move(node_label)), path_(std::move(path)) {}

    const std::string& get_node_label() const { return node_label_; }
    const std::string& get_path() const { return path_; }

private:
    std::string node_label_;
    std::string path_;
};

} // namespace flowgraph

#endif // FLOWGRAPH_ACTIONS_HPP
