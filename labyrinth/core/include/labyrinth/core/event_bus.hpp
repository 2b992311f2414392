#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <variant>
#include <vector>

namespace labyrinth::core {

// ============================================================================
// ScopedConnection - RAII handle for event subscriptions
// ============================================================================

class ScopedConnection {
public:
    ScopedConnection() = default;

    explicit ScopedConnection(std::function<void()> disconnect_fn)
        : m_disconnect(std::move(disconnect_fn)) {}

    ~ScopedConnection() {
        disconnect();
    }

    // Non-copyable
    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    // Movable
    ScopedConnection(ScopedConnection&& other) noexcept
        : m_disconnect(std::move(other.m_disconnect)) {
        other.m_disconnect = nullptr;
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_disconnect = std::move(other.m_disconnect);
            other.m_disconnect = nullptr;
        }
        return *this;
    }

    void disconnect() {
        if (m_disconnect) {
            m_disconnect();
            m_disconnect = nullptr;
        }
    }

    bool connected() const {
        return m_disconnect != nullptr;
    }

    // Release ownership without disconnecting
    void release() {
        m_disconnect = nullptr;
    }

private:
    std::function<void()> m_disconnect;
};

// ============================================================================
// EventBus - Publish/subscribe over a closed set of event types
// ============================================================================
//
// Variant is a std::variant of event payload structs. Subscribers either
// receive every event (subscribe_all) or a single alternative (subscribe<T>).
// Handlers run synchronously in subscription order on the publishing thread.

template<typename Variant>
class EventBus {
public:
    using Callback = std::function<void(const Variant&)>;

    EventBus() : m_handlers(std::make_shared<HandlerList>()) {}
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Subscribe to every event
    ScopedConnection subscribe_all(Callback callback) {
        uint64_t handler_id = m_next_handler_id++;
        m_handlers->push_back({handler_id, std::move(callback)});

        // Connections may outlive the bus
        std::weak_ptr<HandlerList> weak = m_handlers;
        return ScopedConnection([weak, handler_id]() {
            if (auto handlers = weak.lock()) {
                handlers->erase(
                    std::remove_if(handlers->begin(), handlers->end(),
                        [handler_id](const Handler& h) { return h.id == handler_id; }),
                    handlers->end()
                );
            }
        });
    }

    // Subscribe to one event alternative
    template<typename T>
    ScopedConnection subscribe(std::function<void(const T&)> callback) {
        return subscribe_all([callback = std::move(callback)](const Variant& event) {
            if (const auto* typed = std::get_if<T>(&event)) {
                callback(*typed);
            }
        });
    }

    void publish(const Variant& event) {
        // Copy so handlers may subscribe/unsubscribe while dispatching
        HandlerList handlers_copy = *m_handlers;
        for (const auto& handler : handlers_copy) {
            handler.callback(event);
        }
    }

    template<typename T>
    void publish(T event) {
        publish(Variant(std::move(event)));
    }

    size_t handler_count() const {
        return m_handlers->size();
    }

    void clear_handlers() {
        m_handlers->clear();
    }

private:
    struct Handler {
        uint64_t id;
        Callback callback;
    };
    using HandlerList = std::vector<Handler>;

    std::shared_ptr<HandlerList> m_handlers;
    uint64_t m_next_handler_id = 1;
};

} // namespace labyrinth::core
