#include "ChangeBus.hpp"
#include <algorithm>
#include <utility>

struct ChangeNotificationBus::Subscription::State {
    std::size_t nextId{1};
    std::vector<std::pair<std::size_t, std::shared_ptr<Handler>>> handlers;

    bool contains(std::size_t id) const {
        return std::any_of(handlers.begin(), handlers.end(),
                           [&](const auto& h){ return h.first == id; });
    }

    void remove(std::size_t id) {
        handlers.erase(std::remove_if(handlers.begin(), handlers.end(),
                                      [&](const auto& h){ return h.first == id; }),
                       handlers.end());
    }
};

ChangeNotificationBus::Subscription::Subscription(Subscription&& other) noexcept
    : bus_(std::move(other.bus_)), id_(other.id_) {
    other.id_ = 0;
}

ChangeNotificationBus::Subscription&
ChangeNotificationBus::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        bus_ = std::move(other.bus_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

ChangeNotificationBus::Subscription::~Subscription() {
    reset();
}

void ChangeNotificationBus::Subscription::reset() noexcept {
    if (id_ == 0) return;
    if (auto st = bus_.lock()) st->remove(id_);
    bus_.reset();
    id_ = 0;
}

bool ChangeNotificationBus::Subscription::active() const noexcept {
    auto st = bus_.lock();
    return st && id_ != 0 && st->contains(id_);
}

ChangeNotificationBus::ChangeNotificationBus()
    : state_(std::make_shared<Subscription::State>()) {}

ChangeNotificationBus::Subscription ChangeNotificationBus::subscribe(Handler handler) {
    auto id = state_->nextId++;
    state_->handlers.emplace_back(id, std::make_shared<Handler>(std::move(handler)));
    return Subscription(state_, id);
}

void ChangeNotificationBus::publish(const ChangeEvent& event) const {
    // snapshot: обработчик может подписаться или отписаться во время рассылки
    auto snapshot = state_->handlers;
    for (auto& [id, handler] : snapshot) {
        if (!state_->contains(id)) continue;
        (*handler)(event);
    }
}

void ChangeNotificationBus::publish(const std::vector<ChangeEvent>& batch) const {
    for (const auto& ev : batch) publish(ev);
}

std::size_t ChangeNotificationBus::subscriberCount() const noexcept {
    return state_->handlers.size();
}
