#include <flowgraph/filterator.hpp>

#include <memory>
#include <stdexcept>
#include <utility>

namespace flowgraph {

Filterator::Filterator(Source source, NodePredicate predicate)
    : source_(std::move(source)), predicate_(std::move(predicate)) {
    advance();
}

void Filterator::advance() {
    pending_ = nullptr;
    if (!source_) {
        return;
    }
    while (FlowNode* candidate = source_()) {
        if (!predicate_ || predicate_(candidate)) {
            pending_ = candidate;
            return;
        }
    }
}

FlowNode* Filterator::next() {
    if (!pending_) {
        throw std::out_of_range("Filterator exhausted");
    }
    FlowNode* result = pending_;
    advance();
    return result;
}

Filterator Filterator::filter(NodePredicate predicate) {
    auto inner = std::make_shared<Filterator>(std::move(*this));
    source_ = nullptr;
    pending_ = nullptr;
    return Filterator([inner]() -> FlowNode* {
        return inner->has_next() ? inner->next() : nullptr;
    }, std::move(predicate));
}

} // namespace flowgraph
