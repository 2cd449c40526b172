#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <vector>

namespace ecs {

/**
 * @brief Groups systems by execution phase and owns the fixed-step clock.
 *
 * Per frame: update() (Pre-Update, Logic), step_physics() zero or more
 * times at fixed_dt, then render(). The movement controller and Jolt both
 * advance only inside the Physics phase.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    static constexpr float kDefaultFixedDt = 1.0f / 60.0f;

    // Upper bound on physics steps per frame; hitting it resets the
    // accumulator.
    static constexpr int kMaxStepsPerFrame = 8;

    explicit Pipeline(float fixed_dt = kDefaultFixedDt) : fixed_dt_(fixed_dt) {}

    void add_pre_update(SystemFunc func) { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func) { logic_.push_back(std::move(func)); }
    void add_physics(SystemFunc func) { physics_.push_back(std::move(func)); }
    void add_render(SystemFunc func) { render_.push_back(std::move(func)); }

    /**
     * @brief Input / Pre-processing, then gameplay Logic, then a structural
     * sync (e.g. scene reloads) before physics.
     */
    void update(World& world, float dt) {
        for (auto& sys : pre_update_) sys(world, dt);
        for (auto& sys : logic_) sys(world, dt);
        world.deferred().flush(world);
    }

    /**
     * @brief Accumulates frame time and runs the Physics phase in fixed steps.
     * @return Number of steps taken this frame.
     */
    int advance(World& world, float frame_dt) {
        accumulator_ += frame_dt;
        int steps = 0;
        while (accumulator_ >= fixed_dt_ && steps < kMaxStepsPerFrame) {
            step_physics(world, fixed_dt_);
            accumulator_ -= fixed_dt_;
            ++steps;
        }
        if (steps == kMaxStepsPerFrame) accumulator_ = 0.0f;
        last_steps_ = steps;
        return steps;
    }

    void step_physics(World& world, float dt) {
        for (auto& sys : physics_) sys(world, dt);
    }

    void render(World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

    float fixed_dt()    const { return fixed_dt_; }
    float accumulator() const { return accumulator_; }
    int   last_steps()  const { return last_steps_; }

private:
    float fixed_dt_;
    float accumulator_ = 0.0f;
    int   last_steps_  = 0;

    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> physics_;
    std::vector<SystemFunc> render_;
};

} // namespace ecs
