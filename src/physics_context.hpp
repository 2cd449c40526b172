#pragma once
#include "components.hpp"
#include <Jolt/Jolt.h>
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <thread>

// ---------------------------------------------------------------------------
// Layer tables
//
// Object layers come from components.hpp so the movement obstacle mask and
// Jolt agree on bit positions. Each object layer has a broad phase layer of
// the same index. Static geometry only collides with moving objects.
// ---------------------------------------------------------------------------

inline bool object_layers_collide(JPH::ObjectLayer a, JPH::ObjectLayer b) {
    return a == Layers::MOVING || b == Layers::MOVING;
}

class LayerTable final : public JPH::BroadPhaseLayerInterface {
public:
    JPH::uint GetNumBroadPhaseLayers() const override { return Layers::NUM_LAYERS; }

    JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer inLayer) const override {
        JPH_ASSERT(inLayer < Layers::NUM_LAYERS);
        return JPH::BroadPhaseLayer(static_cast<JPH::BroadPhaseLayer::Type>(inLayer));
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer inLayer) const override {
        return static_cast<JPH::BroadPhaseLayer::Type>(inLayer) == Layers::MOVING
            ? "Moving" : "NonMoving";
    }
#endif
};

class LayerVsBroadPhaseFilter final : public JPH::ObjectVsBroadPhaseLayerFilter {
public:
    bool ShouldCollide(JPH::ObjectLayer inLayer, JPH::BroadPhaseLayer inBroad) const override {
        return object_layers_collide(
            inLayer, static_cast<JPH::ObjectLayer>(static_cast<JPH::BroadPhaseLayer::Type>(inBroad)));
    }
};

class LayerPairFilter final : public JPH::ObjectLayerPairFilter {
public:
    bool ShouldCollide(JPH::ObjectLayer a, JPH::ObjectLayer b) const override {
        return object_layers_collide(a, b);
    }
};

// Accepts the object layers whose bit is set in a MovementConfig::obstacle_mask.
class ObstacleMaskFilter final : public JPH::ObjectLayerFilter {
public:
    explicit ObstacleMaskFilter(uint32_t mask) : mask_(mask) {}

    bool ShouldCollide(JPH::ObjectLayer inLayer) const override {
        return inLayer < 32 && ((mask_ >> inLayer) & 1u) != 0;
    }

private:
    uint32_t mask_;
};

// ---------------------------------------------------------------------------
// PhysicsContext — Jolt world shared by bodies, characters and ray queries.
//
// Stored in the World as std::shared_ptr<PhysicsContext>. Owns the Jolt
// factory registration for its lifetime, so only one may exist at a time.
// ---------------------------------------------------------------------------

class PhysicsContext {
public:
    static constexpr JPH::uint kMaxBodies        = 1024;
    static constexpr JPH::uint kMaxBodyPairs     = 1024;
    static constexpr JPH::uint kMaxContacts      = 1024;
    static constexpr JPH::uint kTempAllocatorMiB = 10;

    // Call once before the first PhysicsContext is created.
    static void InitJoltAllocator() { JPH::RegisterDefaultAllocator(); }

    explicit PhysicsContext(float gravity_y = -9.81f) {
        JPH::Factory::sInstance = new JPH::Factory();
        JPH::RegisterTypes();

        const int workers = std::max(1, static_cast<int>(std::thread::hardware_concurrency()) - 1);
        temp_allocator_ = std::make_unique<JPH::TempAllocatorImpl>(kTempAllocatorMiB * 1024 * 1024);
        jobs_ = std::make_unique<JPH::JobSystemThreadPool>(
            JPH::cMaxPhysicsJobs, JPH::cMaxPhysicsBarriers, workers);

        system_ = std::make_unique<JPH::PhysicsSystem>();
        system_->Init(kMaxBodies, 0, kMaxBodyPairs, kMaxContacts,
                      layer_table_, layer_vs_broad_phase_, layer_pairs_);
        system_->SetGravity(JPH::Vec3(0.0f, gravity_y, 0.0f));

        std::cout << "PhysicsContext: Jolt ready, " << workers << " worker thread(s), gravity "
                  << gravity_y << std::endl;
    }

    ~PhysicsContext() {
        system_.reset();
        jobs_.reset();
        temp_allocator_.reset();
        JPH::UnregisterTypes();
        delete JPH::Factory::sInstance;
        JPH::Factory::sInstance = nullptr;
    }

    PhysicsContext(const PhysicsContext&) = delete;
    PhysicsContext& operator=(const PhysicsContext&) = delete;

    JPH::PhysicsSystem&     system()         { return *system_; }
    JPH::TempAllocator&     temp_allocator() { return *temp_allocator_; }
    JPH::BodyInterface&     bodies()         { return system_->GetBodyInterface(); }

    // Advances every body by one fixed step.
    void step(float dt) { system_->Update(dt, 1, temp_allocator_.get(), jobs_.get()); }

    // Filters for a query issued on behalf of an object in `layer`.
    JPH::DefaultBroadPhaseLayerFilter broad_phase_filter(JPH::ObjectLayer layer) const {
        return JPH::DefaultBroadPhaseLayerFilter(layer_vs_broad_phase_, layer);
    }
    JPH::DefaultObjectLayerFilter object_filter(JPH::ObjectLayer layer) const {
        return JPH::DefaultObjectLayerFilter(layer_pairs_, layer);
    }

private:
    LayerTable              layer_table_;
    LayerVsBroadPhaseFilter layer_vs_broad_phase_;
    LayerPairFilter         layer_pairs_;

    std::unique_ptr<JPH::TempAllocatorImpl>   temp_allocator_;
    std::unique_ptr<JPH::JobSystemThreadPool> jobs_;
    std::unique_ptr<JPH::PhysicsSystem>       system_;
};
