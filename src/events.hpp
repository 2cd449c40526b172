#pragma once
#include <ecs/ecs.hpp>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T> — typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// EventRegistry::flush_all() clears all queues at the start of each frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    std::size_t           size()   const  { return buffer_.size(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// ---------------------------------------------------------------------------
// EventRegistry — flush coordinator (stored as a World resource)
//
// register_queue<T>(world) once per event type during startup; flush_all()
// as the first Pre-Update step each frame.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

    std::size_t queue_count() const { return flush_fns_.size(); }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// Emits into a registered queue; silently dropped if T was never registered.
template<typename T>
void emit(ecs::World& world, T event) {
    if (auto* q = world.try_resource<Events<T>>()) q->send(std::move(event));
}

// ---------------------------------------------------------------------------
// Concrete event types
// ---------------------------------------------------------------------------

// Emitted by CharacterInputSystem when JumpGate accepts a jump.
// jump_number: 1 = first jump, 2+ = air jumps.
// impulse: vertical velocity applied (units/s).
struct JumpEvent {
    ecs::Entity entity;
    int         jump_number;
    float       impulse;
};

// Emitted by CharacterMotorSystem on the Airborne -> Grounded transition.
// fall_speed: downward speed just before touching down (units/s, >= 0).
struct LandEvent {
    ecs::Entity entity;
    float       fall_speed;
};
