#pragma once

#include "ByteStream.hpp"
#include "NetworkTypes.hpp"
#include "OwnableEntity.hpp"
#include "Transport.hpp"
#include <entt/entt.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace Spraynet {

// Owns every replicated entity of the session. Local entities are spawned
// here, remote ones arrive through the packet handlers; the owner of each
// entity broadcasts a snapshot every replication interval.
class ReplicationManager
{
public:
    using PhysicsFactory = std::function<std::unique_ptr<IPhysicsBridge>(EntityId, EntityKind)>;

    ReplicationManager(entt::registry& registry, ITransport& transport, NetworkIdentity local_identity);

    void setLocalIdentity(NetworkIdentity identity) { local_identity = identity; }
    NetworkIdentity getLocalIdentity() const { return local_identity; }

    void setPhysicsFactory(PhysicsFactory factory) { physics_factory = std::move(factory); }

    // Creates an entity owned by this participant and announces it.
    // Returns INVALID_ENTITY_ID if the announcement could not be sent.
    EntityId spawnLocal(EntityKind kind, const glm::vec3& position, const glm::vec3& rotation, double now);

    // Asks the current owner for authority over a live entity (e.g. after catching it).
    // Only the owner changes ownership; this peer becomes owner once the owner's
    // hand-off arrives. Returns true if the request went out or we already own it.
    bool claimOwnership(EntityId id, double now);

    // Owner only: gives the entity to new_owner and drops local authority
    bool handOff(EntityId id, NetworkIdentity new_owner, double now);

    bool killEntity(EntityId id);

    OwnableEntity* find(EntityId id);
    entt::entity findHandle(EntityId id) const;
    size_t size() const { return entities.size(); }

    // Bodies only; the type byte has already been consumed
    bool handleSpawn(ByteReader& reader, double now);
    bool handleSnapshot(ByteReader& reader, double now);
    bool handleOwnership(ByteReader& reader, double now);
    bool handleClaim(ByteReader& reader, double now);
    bool handleKill(ByteReader& reader);

    void update(double now);

    // Kills everything the departing participant owned; returns the count
    size_t onMemberLeft(NetworkIdentity identity);

    // Scene change / session end, no kill effects
    void clear();

    float getSnapshotInterval() const;

private:
    entt::entity createEntity(EntityId id, EntityKind kind, NetworkIdentity owner,
                              const glm::vec3& position, const glm::vec3& rotation, double now);
    void destroyEntity(EntityId id);
    bool broadcastSnapshot(OwnableEntity& entity);

    entt::registry& registry;
    ITransport& transport;
    NetworkIdentity local_identity;
    PhysicsFactory physics_factory;

    std::unordered_map<EntityId, entt::entity> entities;
    uint32_t next_counter = 1;
    double last_broadcast = -1.0;
};

} // namespace Spraynet
