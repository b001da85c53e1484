#include "ReplicationManager.hpp"
#include "NetworkSerializer.hpp"
#include "SharedComponents.hpp"
#include "Console/ConVar.hpp"
#include "Utils/Log.hpp"

#include <vector>

EXTERN_CONVAR(net_snapshot_interval);

namespace Spraynet {

namespace {
constexpr float DEFAULT_SNAPSHOT_INTERVAL = 1.0f / 16.0f;
}

ReplicationManager::ReplicationManager(entt::registry& reg, ITransport& net, NetworkIdentity identity)
    : registry(reg)
    , transport(net)
    , local_identity(identity)
{
}

float ReplicationManager::getSnapshotInterval() const
{
    float interval = g_cvar_net_snapshot_interval.getFloat();
    return interval > 0.0f ? interval : DEFAULT_SNAPSHOT_INTERVAL;
}

entt::entity ReplicationManager::createEntity(EntityId id, EntityKind kind, NetworkIdentity owner,
                                              const glm::vec3& position, const glm::vec3& rotation, double now)
{
    std::unique_ptr<IPhysicsBridge> bridge = physics_factory ? physics_factory(id, kind) : nullptr;

    entt::entity handle = registry.create();
    registry.emplace<NetworkedEntity>(handle, id, static_cast<NetworkIdentity>(id >> 32));
    registry.emplace<TransformComponent>(handle, position, rotation);
    registry.emplace<TagComponent>(handle, TagComponent{getCapabilities(kind).name});
    registry.emplace<OwnableEntity>(handle, id, kind, local_identity, owner, position, rotation, now, std::move(bridge));

    entities[id] = handle;
    return handle;
}

void ReplicationManager::destroyEntity(EntityId id)
{
    auto it = entities.find(id);
    if (it == entities.end()) {
        return;
    }
    if (registry.valid(it->second)) {
        registry.destroy(it->second);
    }
    entities.erase(it);
}

OwnableEntity* ReplicationManager::find(EntityId id)
{
    auto it = entities.find(id);
    if (it == entities.end() || !registry.valid(it->second)) {
        return nullptr;
    }
    return registry.try_get<OwnableEntity>(it->second);
}

entt::entity ReplicationManager::findHandle(EntityId id) const
{
    auto it = entities.find(id);
    return it != entities.end() ? it->second : entt::entity{entt::null};
}

EntityId ReplicationManager::spawnLocal(EntityKind kind, const glm::vec3& position, const glm::vec3& rotation, double now)
{
    EntitySpawnMessage msg;
    msg.entity_id = makeEntityId(local_identity, next_counter);
    msg.kind = static_cast<uint8_t>(kind);
    msg.owner = local_identity;
    msg.position = position;
    msg.rotation = rotation;

    if (entities.count(msg.entity_id) != 0) {
        LOG_NET_ERROR("Entity id {0:x} is already in use", msg.entity_id);
        return INVALID_ENTITY_ID;
    }

    bool sent = transport.broadcast(PacketType::ENTITY_SPAWN, ENTITY_SPAWN_SIZE, [&](ByteWriter& writer) {
        NetworkSerializer::serialize(writer, msg);
    });
    if (!sent) {
        LOG_NET_ERROR("Failed to announce {0} spawn", getCapabilities(kind).name);
        return INVALID_ENTITY_ID;
    }

    ++next_counter;
    createEntity(msg.entity_id, kind, local_identity, position, rotation, now);
    LOG_NET_DEBUG("Spawned local {0} {1:x}", getCapabilities(kind).name, msg.entity_id);
    return msg.entity_id;
}

bool ReplicationManager::claimOwnership(EntityId id, double now)
{
    OwnableEntity* entity = find(id);
    if (!entity || entity->isDead()) {
        return false;
    }
    if (entity->isOwner()) {
        return true;
    }

    EntityClaimMessage msg;
    msg.entity_id = id;
    msg.requester = local_identity;

    bool sent = transport.broadcast(PacketType::ENTITY_CLAIM, ENTITY_CLAIM_SIZE, [&](ByteWriter& writer) {
        NetworkSerializer::serialize(writer, msg);
    });
    if (!sent) {
        return false;
    }

    LOG_NET_DEBUG("Asked {0} for entity {1:x}", entity->getOwner(), id);
    return true;
}

bool ReplicationManager::handOff(EntityId id, NetworkIdentity new_owner, double now)
{
    OwnableEntity* entity = find(id);
    if (!entity || entity->isDead() || !entity->isOwner() || new_owner == INVALID_IDENTITY) {
        return false;
    }
    if (new_owner == local_identity) {
        return true;
    }

    EntityOwnershipMessage msg;
    msg.entity_id = id;
    msg.previous_owner = local_identity;
    msg.new_owner = new_owner;

    bool sent = transport.broadcast(PacketType::ENTITY_OWNERSHIP, ENTITY_OWNERSHIP_SIZE, [&](ByteWriter& writer) {
        NetworkSerializer::serialize(writer, msg);
    });
    if (!sent) {
        LOG_NET_WARN("Hand-off of entity {0:x} to {1} was not sent, keeping it", id, new_owner);
        return false;
    }

    entity->transferOwnership(new_owner, now);
    LOG_NET_DEBUG("Handed entity {0:x} to {1}", id, new_owner);
    return true;
}

bool ReplicationManager::killEntity(EntityId id)
{
    OwnableEntity* entity = find(id);
    if (!entity) {
        return false;
    }

    EntityKillMessage msg;
    msg.entity_id = id;
    bool sent = transport.broadcast(PacketType::ENTITY_KILL, ENTITY_KILL_SIZE, [&](ByteWriter& writer) {
        NetworkSerializer::serialize(writer, msg);
    });
    if (!sent) {
        LOG_NET_WARN("Kill of entity {0:x} was not announced", id);
    }

    entity->kill();
    destroyEntity(id);
    return true;
}

bool ReplicationManager::handleSpawn(ByteReader& reader, double now)
{
    EntitySpawnMessage msg;
    if (!NetworkSerializer::deserialize(reader, msg)) {
        LOG_NET_WARN("Malformed entity spawn ({0} bytes)", reader.getSize());
        return false;
    }
    if (!isValidKind(msg.kind)) {
        LOG_NET_WARN("Entity spawn {0:x} has unknown kind {1}", msg.entity_id, msg.kind);
        return false;
    }
    if (msg.entity_id == INVALID_ENTITY_ID || msg.owner == INVALID_IDENTITY) {
        LOG_NET_WARN("Entity spawn without id or owner");
        return false;
    }
    if (entities.count(msg.entity_id) != 0) {
        LOG_NET_DEBUG("Duplicate spawn for entity {0:x} ignored", msg.entity_id);
        return false;
    }

    createEntity(msg.entity_id, static_cast<EntityKind>(msg.kind), msg.owner, msg.position, msg.rotation, now);
    LOG_NET_DEBUG("Spawned remote {0} {1:x} owned by {2}",
        getCapabilities(static_cast<EntityKind>(msg.kind)).name, msg.entity_id, msg.owner);
    return true;
}

bool ReplicationManager::handleSnapshot(ByteReader& reader, double now)
{
    EntitySnapshotHeader header;
    if (!NetworkSerializer::deserialize(reader, header)) {
        LOG_NET_WARN("Malformed snapshot header ({0} bytes)", reader.getSize());
        return false;
    }

    OwnableEntity* entity = find(header.entity_id);
    if (!entity) {
        LOG_NET_TRACE("Snapshot for unknown entity {0:x}", header.entity_id);
        return false;
    }

    return entity->read(header, reader, now);
}

bool ReplicationManager::handleOwnership(ByteReader& reader, double now)
{
    EntityOwnershipMessage msg;
    if (!NetworkSerializer::deserialize(reader, msg)) {
        LOG_NET_WARN("Malformed ownership message ({0} bytes)", reader.getSize());
        return false;
    }
    if (msg.new_owner == INVALID_IDENTITY) {
        LOG_NET_WARN("Ownership of entity {0:x} given to nobody", msg.entity_id);
        return false;
    }

    OwnableEntity* entity = find(msg.entity_id);
    if (!entity || entity->isDead()) {
        LOG_NET_DEBUG("Ownership change for unknown entity {0:x}", msg.entity_id);
        return false;
    }

    if (msg.previous_owner != entity->getOwner()) {
        LOG_NET_DEBUG("Hand-off of entity {0:x} from {1} ignored, owner is {2}",
            msg.entity_id, msg.previous_owner, entity->getOwner());
        return false;
    }
    if (msg.previous_owner == local_identity) {
        // Our own authority only moves through handOff
        return false;
    }

    entity->transferOwnership(msg.new_owner, now);
    LOG_NET_DEBUG("Entity {0:x} now owned by {1}", msg.entity_id, msg.new_owner);
    return true;
}

bool ReplicationManager::handleClaim(ByteReader& reader, double now)
{
    EntityClaimMessage msg;
    if (!NetworkSerializer::deserialize(reader, msg)) {
        LOG_NET_WARN("Malformed claim message ({0} bytes)", reader.getSize());
        return false;
    }
    if (msg.requester == INVALID_IDENTITY) {
        return false;
    }

    OwnableEntity* entity = find(msg.entity_id);
    if (!entity || entity->isDead() || !entity->isOwner()) {
        // Not ours to give, or already handed to an earlier claimant
        LOG_NET_TRACE("Claim for entity {0:x} by {1} ignored", msg.entity_id, msg.requester);
        return false;
    }

    return handOff(msg.entity_id, msg.requester, now);
}

bool ReplicationManager::handleKill(ByteReader& reader)
{
    EntityKillMessage msg;
    if (!NetworkSerializer::deserialize(reader, msg)) {
        LOG_NET_WARN("Malformed kill message ({0} bytes)", reader.getSize());
        return false;
    }

    OwnableEntity* entity = find(msg.entity_id);
    if (!entity) {
        return false;
    }

    entity->kill();
    destroyEntity(msg.entity_id);
    return true;
}

bool ReplicationManager::broadcastSnapshot(OwnableEntity& entity)
{
    bool sent = transport.broadcast(PacketType::ENTITY_SNAPSHOT, snapshotSize(entity.getKind()), [&](ByteWriter& writer) {
        entity.write(writer);
    });
    if (sent) {
        entity.advanceSequence();
    }
    return sent;
}

void ReplicationManager::update(double now)
{
    const float interval = getSnapshotInterval();

    auto view = registry.view<OwnableEntity, TransformComponent>();
    for (auto handle : view) {
        auto& entity = view.get<OwnableEntity>(handle);
        auto& transform = view.get<TransformComponent>(handle);

        entity.tick(now, interval);
        if (entity.isOwner()) {
            transform.position = entity.getPosition();
            transform.rotation = entity.getRotation();
        } else {
            transform.position = entity.getInterpolatedPosition(now, interval);
            transform.rotation = entity.getInterpolatedRotation(now, interval);
        }
    }

    if (last_broadcast >= 0.0 && now - last_broadcast < interval) {
        return;
    }
    last_broadcast = now;

    for (auto handle : view) {
        auto& entity = view.get<OwnableEntity>(handle);
        if (entity.isOwner()) {
            broadcastSnapshot(entity);
        }
    }
}

size_t ReplicationManager::onMemberLeft(NetworkIdentity identity)
{
    std::vector<EntityId> owned;
    for (const auto& pair : entities) {
        const OwnableEntity* entity = registry.try_get<OwnableEntity>(pair.second);
        if (entity && entity->getOwner() == identity) {
            owned.push_back(pair.first);
        }
    }

    for (EntityId id : owned) {
        if (OwnableEntity* entity = find(id)) {
            entity->kill();
        }
        destroyEntity(id);
    }

    if (!owned.empty()) {
        LOG_NET_INFO("Removed {0} entities owned by departed member {1}", owned.size(), identity);
    }
    return owned.size();
}

void ReplicationManager::clear()
{
    for (const auto& pair : entities) {
        if (registry.valid(pair.second)) {
            registry.destroy(pair.second);
        }
    }
    entities.clear();
    last_broadcast = -1.0;
}

} // namespace Spraynet
