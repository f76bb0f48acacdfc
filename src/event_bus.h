#pragma once

#include "events.h"
#include <functional>
#include <unordered_map>
#include <vector>
#include <cstddef>

namespace peerq {

/**
 * Typed publish/subscribe dispatcher for the single event context.
 *
 * Each event struct names its kind through a static `kind` member.
 * Handlers run synchronously, in subscription order, on the thread that
 * calls emit(). Handlers may emit further events and may subscribe new
 * handlers; those only see later emissions.
 *
 * Usage:
 *   bus.on<UserStatusEvent>([this](const UserStatusEvent& e) { ... });
 *   bus.emit(UserStatusEvent{"alice", UserStatus::ONLINE, std::nullopt});
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template <typename Event>
    void on(std::function<void(const Event&)> handler) {
        handlers_[Event::kind].push_back([handler](const void* event) {
            handler(*static_cast<const Event*>(event));
        });
    }

    template <typename Event>
    void emit(const Event& event) {
        auto it = handlers_.find(Event::kind);
        if (it == handlers_.end()) {
            return;
        }

        // Handlers may subscribe while we dispatch
        std::vector<ErasedHandler> handlers = it->second;
        for (const auto& handler : handlers) {
            handler(&event);
        }
    }

    size_t handler_count(EventKind kind) const {
        auto it = handlers_.find(kind);
        return it == handlers_.end() ? 0 : it->second.size();
    }

    void clear() { handlers_.clear(); }

private:
    using ErasedHandler = std::function<void(const void*)>;

    std::unordered_map<EventKind, std::vector<ErasedHandler>> handlers_;
};

} // namespace peerq
