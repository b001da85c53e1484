#pragma once

#include "ByteStream.hpp"
#include "Interpolator.hpp"
#include "NetworkSerializer.hpp"
#include "NetworkTypes.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <cstddef>
#include <memory>

namespace Spraynet {

enum class EntityKind : uint8_t
{
    Projectile = 0,   // Rocket without flags
    Grenade = 1,      // Rideable, can be frozen by its owner
    Cannonball = 2
};

constexpr uint8_t ENTITY_KIND_COUNT = 3;

inline bool isValidKind(uint8_t kind) {
    return kind < ENTITY_KIND_COUNT;
}

// Per-kind behaviour, looked up instead of dispatched virtually so the
// snapshot field order stays in one place
struct KindCapabilities
{
    const char* name;
    bool has_armed_flags;        // riding + frozen follow the transform in snapshots
    bool has_detonation_guard;   // non-owners must not detonate locally
    bool has_ghost_collider;     // non-owners collide as ghosts
    bool shatters_on_kill;
    bool explodes_on_kill;       // always harmless, damage belongs to the owner
};

const KindCapabilities& getCapabilities(EntityKind kind);

// Body after the snapshot header
size_t snapshotBodySize(EntityKind kind);

// Header + body
inline size_t snapshotSize(EntityKind kind) {
    return ENTITY_SNAPSHOT_HEADER_SIZE + snapshotBodySize(kind);
}

// One-way calls into the game's physics objects. The entity never reads back.
class IPhysicsBridge
{
public:
    virtual ~IPhysicsBridge() = default;

    virtual void setKinematic(bool kinematic) = 0;
    virtual void setGhostCollider(bool ghost) = 0;
    virtual void setDetonationSuppressed(bool suppressed) = 0;
    virtual void setFrozen(bool frozen) = 0;
    virtual void attachToRider(NetworkIdentity rider) = 0;
    virtual void detachFromRider() = 0;
    virtual void setTransform(const glm::vec3& position, const glm::vec3& rotation) = 0;
    virtual void explode(bool harmless) = 0;
    virtual void shatter() = 0;
    virtual void destroy() = 0;
};

class NullPhysicsBridge final : public IPhysicsBridge
{
public:
    void setKinematic(bool) override {}
    void setGhostCollider(bool) override {}
    void setDetonationSuppressed(bool) override {}
    void setFrozen(bool) override {}
    void attachToRider(NetworkIdentity) override {}
    void detachFromRider() override {}
    void setTransform(const glm::vec3&, const glm::vec3&) override {}
    void explode(bool) override {}
    void shatter() override {}
    void destroy() override {}
};

enum class EntityState : uint8_t
{
    Unowned,       // only while constructing
    OwnedLocal,
    OwnedRemote,
    Dead
};

// Replicated object with exactly one authoritative participant.
// The owner mutates the true state and writes snapshots; everyone else reads
// them and renders interpolated transforms.
class OwnableEntity
{
private:
    EntityId entity_id;
    EntityKind kind;
    NetworkIdentity local_identity;
    NetworkIdentity owner = INVALID_IDENTITY;
    EntityState state = EntityState::Unowned;

    std::unique_ptr<IPhysicsBridge> physics;

    // Owner: live values. Non-owner: last applied snapshot.
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 rotation = glm::vec3(0.0f);
    bool riding = false;
    bool frozen = false;

    Vector3Interpolator position_interp{false};
    Vector3Interpolator rotation_interp{true};

    uint32_t sequence = 0;         // Next outgoing snapshot
    uint32_t last_received = 0;    // Newest applied snapshot
    bool has_received = false;
    bool attached = false;

    void reconcileAuthority(double now);

public:
    OwnableEntity(EntityId id, EntityKind kind, NetworkIdentity local_identity, NetworkIdentity owner,
                  const glm::vec3& position, const glm::vec3& rotation, double now,
                  std::unique_ptr<IPhysicsBridge> physics = nullptr);

    OwnableEntity(OwnableEntity&&) = default;
    OwnableEntity& operator=(OwnableEntity&&) = default;

    EntityId getId() const { return entity_id; }
    EntityKind getKind() const { return kind; }
    const KindCapabilities& capabilities() const { return getCapabilities(kind); }
    NetworkIdentity getOwner() const { return owner; }
    EntityState getState() const { return state; }

    bool isOwner() const { return state == EntityState::OwnedLocal; }
    bool isDead() const { return state == EntityState::Dead; }

    // Owner and physics flags change in the same call; there is no tick at
    // which both or neither participant considers itself authoritative.
    void transferOwnership(NetworkIdentity new_owner, double now);

    // Owner only; ignored (false) otherwise
    bool setTransform(const glm::vec3& new_position, const glm::vec3& new_rotation);
    bool setRiding(bool value);
    bool setFrozen(bool value);

    const glm::vec3& getPosition() const { return position; }
    const glm::vec3& getRotation() const { return rotation; }
    bool isRiding() const { return riding; }
    bool isFrozen() const { return frozen; }

    // Rendered transform of a non-owner at 'now'
    glm::vec3 getInterpolatedPosition(double now, float interval) const;
    glm::vec3 getInterpolatedRotation(double now, float interval) const;

    // Non-owner: follow the rider or apply the interpolated transform
    void tick(double now, float interval);

    // Bumps the outgoing sequence; call once per snapshot sent
    uint32_t advanceSequence() { return sequence++; }
    uint32_t getSequence() const { return sequence; }

    // Header then position, rotation, [riding, frozen]
    void write(ByteWriter& writer) const;

    // Returns false and keeps the current state when the snapshot is
    // malformed, stale, from the wrong owner or addressed to the owner.
    bool read(const EntitySnapshotHeader& header, ByteReader& reader, double now);

    // Terminal. A second call is a no-op.
    void kill();
};

} // namespace Spraynet
