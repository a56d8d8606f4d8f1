#pragma once

#include "NodeStore.hpp"
#include "ChangeBus.hpp"
#include <vector>

/**
 * Текущая директория и история назад/вперёд.
 * Подписан на шину NodeStore: при удалении узла вычищает его из обоих стеков,
 * а если удалён current, возвращается в корень. Поэтому стеки никогда
 * не содержат мёртвых дескрипторов.
 */
class NavigationController {
public:
    explicit NavigationController(NodeStore& store);
    NavigationController(const NavigationController&) = delete;
    NavigationController& operator=(const NavigationController&) = delete;

    [[nodiscard]] NodeId current() const noexcept { return current_; }

    void navigateTo(const NodeId& node);
    void back();
    void forward();
    void up();

    [[nodiscard]] bool canGoBack() const noexcept { return !history_.empty(); }
    [[nodiscard]] bool canGoForward() const noexcept { return !future_.empty(); }
    [[nodiscard]] const std::vector<NodeId>& history() const noexcept { return history_; }
    [[nodiscard]] const std::vector<NodeId>& future() const noexcept { return future_; }

private:
    NodeStore& store_;
    NodeId current_;
    std::vector<NodeId> history_;
    std::vector<NodeId> future_;
    ChangeNotificationBus::Subscription sub_;

    void onChange(const ChangeEvent& ev);
    void scrub(const NodeId& dead);
};
