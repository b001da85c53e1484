#include "OwnableEntity.hpp"
#include "Utils/Log.hpp"

namespace Spraynet {

namespace {

const KindCapabilities KIND_TABLE[ENTITY_KIND_COUNT] = {
    // name          armed  guard  ghost  shatter explode
    { "Projectile",  false, false, false, false,  false },
    { "Grenade",     true,  true,  false, false,  true  },
    { "Cannonball",  false, false, true,  true,   false },
};

// Wraparound-aware "a is newer than b"
bool sequenceNewer(uint32_t a, uint32_t b) {
    return static_cast<int32_t>(a - b) > 0;
}

}

const KindCapabilities& getCapabilities(EntityKind kind)
{
    uint8_t index = static_cast<uint8_t>(kind);
    return KIND_TABLE[isValidKind(index) ? index : 0];
}

size_t snapshotBodySize(EntityKind kind)
{
    return VECTOR3_SIZE * 2 + (getCapabilities(kind).has_armed_flags ? 2 : 0);
}

OwnableEntity::OwnableEntity(EntityId id, EntityKind entity_kind, NetworkIdentity local, NetworkIdentity initial_owner,
                             const glm::vec3& spawn_position, const glm::vec3& spawn_rotation, double now,
                             std::unique_ptr<IPhysicsBridge> bridge)
    : entity_id(id)
    , kind(entity_kind)
    , local_identity(local)
    , physics(bridge ? std::move(bridge) : std::make_unique<NullPhysicsBridge>())
    , position(spawn_position)
    , rotation(spawn_rotation)
{
    position_interp.reset(position, now);
    rotation_interp.reset(rotation, now);
    transferOwnership(initial_owner, now);
}

void OwnableEntity::transferOwnership(NetworkIdentity new_owner, double now)
{
    if (state == EntityState::Dead) {
        return;
    }

    owner = new_owner;
    if (owner == INVALID_IDENTITY) {
        state = EntityState::Unowned;
    } else {
        state = (owner == local_identity) ? EntityState::OwnedLocal : EntityState::OwnedRemote;
    }
    reconcileAuthority(now);
}

void OwnableEntity::reconcileAuthority(double now)
{
    const KindCapabilities& caps = capabilities();
    const bool local = isOwner();

    physics->setKinematic(!local);
    if (caps.has_ghost_collider) {
        physics->setGhostCollider(!local);
    }
    if (caps.has_detonation_guard) {
        physics->setDetonationSuppressed(!local);
    }

    if (local && attached) {
        physics->detachFromRider();
        attached = false;
    }

    // Start interpolating from where the entity is now, not from the previous owner's stream
    position_interp.reset(position, now);
    rotation_interp.reset(rotation, now);
    has_received = false;
}

bool OwnableEntity::setTransform(const glm::vec3& new_position, const glm::vec3& new_rotation)
{
    if (!isOwner()) {
        return false;
    }
    position = new_position;
    rotation = new_rotation;
    return true;
}

bool OwnableEntity::setRiding(bool value)
{
    if (!isOwner() || !capabilities().has_armed_flags) {
        return false;
    }
    riding = value;
    return true;
}

bool OwnableEntity::setFrozen(bool value)
{
    if (!isOwner() || !capabilities().has_armed_flags) {
        return false;
    }
    frozen = value;
    physics->setFrozen(value);
    return true;
}

glm::vec3 OwnableEntity::getInterpolatedPosition(double now, float interval) const
{
    return position_interp.get(now, interval);
}

glm::vec3 OwnableEntity::getInterpolatedRotation(double now, float interval) const
{
    return rotation_interp.get(now, interval);
}

void OwnableEntity::tick(double now, float interval)
{
    if (state != EntityState::OwnedRemote) {
        return;
    }

    if (riding) {
        if (!attached) {
            physics->attachToRider(owner);
            attached = true;
        }
        return;
    }

    if (attached) {
        physics->detachFromRider();
        attached = false;
    }
    physics->setTransform(position_interp.get(now, interval), rotation_interp.get(now, interval));
}

void OwnableEntity::write(ByteWriter& writer) const
{
    EntitySnapshotHeader header;
    header.entity_id = entity_id;
    header.kind = static_cast<uint8_t>(kind);
    header.owner = owner;
    header.sequence = sequence;
    NetworkSerializer::serialize(writer, header);

    writer.writeVector3f(position);
    writer.writeVector3f(rotation);

    if (capabilities().has_armed_flags) {
        writer.writeBool(riding);
        writer.writeBool(frozen);
    }
}

bool OwnableEntity::read(const EntitySnapshotHeader& header, ByteReader& reader, double now)
{
    if (state != EntityState::OwnedRemote) {
        LOG_NET_TRACE("Snapshot for entity {0:x} ignored in state {1}", entity_id, static_cast<int>(state));
        return false;
    }
    if (header.kind != static_cast<uint8_t>(kind)) {
        LOG_NET_WARN("Snapshot for entity {0:x} has kind {1}, expected {2}", entity_id, header.kind, capabilities().name);
        return false;
    }
    if (header.owner != owner) {
        LOG_NET_DEBUG("Snapshot for entity {0:x} from {1} but owner is {2}", entity_id, header.owner, owner);
        return false;
    }
    if (has_received && !sequenceNewer(header.sequence, last_received)) {
        LOG_NET_TRACE("Stale snapshot {0} for entity {1:x} (newest {2})", header.sequence, entity_id, last_received);
        return false;
    }

    if (!reader.canRead(snapshotBodySize(kind))) {
        LOG_NET_WARN("Truncated snapshot for entity {0:x} ({1} bytes), keeping previous state", entity_id, reader.getSize());
        return false;
    }

    // Decode everything before applying anything
    glm::vec3 new_position = reader.readVector3f();
    glm::vec3 new_rotation = reader.readVector3f();
    bool new_riding = riding;
    bool new_frozen = frozen;
    if (capabilities().has_armed_flags) {
        new_riding = reader.readBool();
        new_frozen = reader.readBool();
    }

    if (reader.hasError()) {
        LOG_NET_WARN("Truncated snapshot for entity {0:x} ({1} bytes), keeping previous state", entity_id, reader.getSize());
        return false;
    }

    position = new_position;
    rotation = new_rotation;
    position_interp.set(new_position, now);
    rotation_interp.set(new_rotation, now);

    riding = new_riding;
    if (new_frozen != frozen) {
        physics->setFrozen(new_frozen);
    }
    frozen = new_frozen;

    last_received = header.sequence;
    has_received = true;
    return true;
}

void OwnableEntity::kill()
{
    if (state == EntityState::Dead) {
        return;
    }

    const KindCapabilities& caps = capabilities();
    state = EntityState::Dead;

    if (attached) {
        physics->detachFromRider();
        attached = false;
    }

    // Guard is lifted before any destroy effect runs
    if (caps.has_detonation_guard) {
        physics->setDetonationSuppressed(false);
    }
    if (caps.explodes_on_kill) {
        physics->explode(true);
    }
    if (caps.shatters_on_kill) {
        physics->shatter();
    }
    physics->destroy();

    LOG_NET_DEBUG("Entity {0:x} ({1}) killed", entity_id, caps.name);
}

} // namespace Spraynet
