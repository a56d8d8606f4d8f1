#include "NavigationController.hpp"
#include <algorithm>

NavigationController::NavigationController(NodeStore& store)
    : store_(store), current_(store.root()) {
    sub_ = store_.bus().subscribe([this](const ChangeEvent& ev){ onChange(ev); });
}

void NavigationController::navigateTo(const NodeId& node) {
    throwIf(!store_.isAlive(node), ErrorCode::NotFound, "stale node handle");
    throwIf(!store_.isDirectory(node), ErrorCode::WrongKind, store_.name(node));
    history_.push_back(current_);
    future_.clear();
    current_ = node;
}

void NavigationController::back() {
    if (history_.empty()) return;
    future_.push_back(current_);
    current_ = history_.back();
    history_.pop_back();
}

void NavigationController::forward() {
    if (future_.empty()) return;
    history_.push_back(current_);
    current_ = future_.back();
    future_.pop_back();
}

void NavigationController::up() {
    if (auto p = store_.parent(current_)) navigateTo(*p);
}

void NavigationController::onChange(const ChangeEvent& ev) {
    if (const auto* removed = std::get_if<Events::Removed>(&ev)) scrub(removed->node);
}

void NavigationController::scrub(const NodeId& dead) {
    if (current_ == dead) current_ = store_.root();
    // после удаления соседние записи могут совпасть, back/forward на них были бы пустыми шагами
    auto drop = [&](std::vector<NodeId>& stack) {
        stack.erase(std::remove(stack.begin(), stack.end(), dead), stack.end());
        stack.erase(std::unique(stack.begin(), stack.end()), stack.end());
        while (!stack.empty() && stack.back() == current_) stack.pop_back();
    };
    drop(history_);
    drop(future_);
}
