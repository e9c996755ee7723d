#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace hilite::editor {

// Handle returned by Event::subscribe. Unsubscribes when destroyed.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> release)
        : release_(std::move(release))
    {}

    ~Subscription() { unsubscribe(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : release_(std::exchange(other.release_, nullptr))
    {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            release_ = std::exchange(other.release_, nullptr);
        }
        return *this;
    }

    // Safe to call repeatedly, and after the event itself is gone
    void unsubscribe() {
        if (auto release = std::exchange(release_, nullptr)) {
            release();
        }
    }

    [[nodiscard]] bool active() const noexcept { return static_cast<bool>(release_); }

private:
    std::function<void()> release_;
};

// Synchronous multicast event. Listeners run in subscription order. A
// listener removed during emission is not called afterwards; one added
// during emission is called from the next emission on.
template<typename... Args>
class Event {
public:
    using Listener = std::function<void(Args...)>;

    Event() = default;
    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;

    [[nodiscard]] Subscription subscribe(Listener listener) {
        auto slot = std::make_shared<Slot>(std::move(listener));
        slots_->push_back(slot);

        std::weak_ptr<SlotList> weak_slots = slots_;
        std::weak_ptr<Slot> weak_slot = slot;
        return Subscription([weak_slots, weak_slot] {
            auto slots = weak_slots.lock();
            auto target = weak_slot.lock();
            if (!slots || !target) return;
            target->active = false;
            std::erase(*slots, target);
        });
    }

    void emit(const Args&... args) const {
        const SlotList snapshot = *slots_;
        for (const auto& slot : snapshot) {
            if (slot->active) {
                slot->listener(args...);
            }
        }
    }

    [[nodiscard]] std::size_t listener_count() const noexcept { return slots_->size(); }

private:
    struct Slot {
        explicit Slot(Listener fn) : listener(std::move(fn)) {}

        Listener listener;
        bool active{true};
    };

    using SlotList = std::vector<std::shared_ptr<Slot>>;

    std::shared_ptr<SlotList> slots_ = std::make_shared<SlotList>();
};

} // namespace hilite::editor
