#pragma once

#include "FSNode.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Events {

struct Inserted {
    NodeId parent;
    NodeId node;
};

// node уже мёртв к моменту доставки, поэтому имя передаётся отдельно
struct Removed {
    NodeId parent;
    NodeId node;
    std::string name;
};

struct Renamed {
    NodeId node;
    std::string oldName;
};

struct ContentChanged {
    NodeId node;
};

}

using ChangeEvent = std::variant<Events::Inserted, Events::Removed, Events::Renamed, Events::ContentChanged>;

class ChangeNotificationBus {
public:
    using Handler = std::function<void(const ChangeEvent&)>;

    // RAII-подписка: отписывается в деструкторе. Может пережить шину.
    class Subscription {
    public:
        Subscription() = default;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;
        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        ~Subscription();

        void reset() noexcept;
        [[nodiscard]] bool active() const noexcept;

    private:
        friend class ChangeNotificationBus;
        struct State;
        Subscription(std::weak_ptr<State> bus, std::size_t id) : bus_(std::move(bus)), id_(id) {}

        std::weak_ptr<State> bus_;
        std::size_t id_{0};
    };

    ChangeNotificationBus();
    ChangeNotificationBus(const ChangeNotificationBus&) = delete;
    ChangeNotificationBus& operator=(const ChangeNotificationBus&) = delete;

    [[nodiscard("subscription ends when the returned object is destroyed")]]
    Subscription subscribe(Handler handler);

    void publish(const ChangeEvent& event) const;
    void publish(const std::vector<ChangeEvent>& batch) const;

    [[nodiscard]] std::size_t subscriberCount() const noexcept;

private:
    std::shared_ptr<Subscription::State> state_;
};
