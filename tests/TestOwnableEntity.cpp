#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "OwnableEntity.hpp"
#include "TestHelpers.hpp"

namespace Spraynet {

using Catch::Matchers::WithinAbs;
using Test::RecordingPhysicsBridge;

namespace {

constexpr NetworkIdentity LOCAL = 100;
constexpr NetworkIdentity REMOTE = 200;
constexpr float INTERVAL = 1.0f / 16.0f;

OwnableEntity makeEntity(EntityKind kind, NetworkIdentity owner, RecordingPhysicsBridge::Calls& calls,
                         NetworkIdentity local = LOCAL)
{
    return OwnableEntity(makeEntityId(owner, 1), kind, local, owner, glm::vec3(0.0f), glm::vec3(0.0f), 0.0,
                         std::make_unique<RecordingPhysicsBridge>(calls));
}

std::vector<uint8_t> writeSnapshot(const OwnableEntity& entity)
{
    ByteWriter writer(snapshotSize(entity.getKind()));
    entity.write(writer);
    REQUIRE_FALSE(writer.hasError());
    REQUIRE(writer.getByteSize() == snapshotSize(entity.getKind()));
    return writer.release();
}

bool readSnapshot(OwnableEntity& entity, const std::vector<uint8_t>& data, double now)
{
    ByteReader reader(data.data(), data.size());
    EntitySnapshotHeader header;
    if (!NetworkSerializer::deserialize(reader, header)) {
        return false;
    }
    return entity.read(header, reader, now);
}

}

TEST_CASE("Capability table drives per-kind behaviour", "[entity]")
{
    REQUIRE_FALSE(getCapabilities(EntityKind::Projectile).has_armed_flags);
    REQUIRE(getCapabilities(EntityKind::Grenade).has_armed_flags);
    REQUIRE(getCapabilities(EntityKind::Grenade).has_detonation_guard);
    REQUIRE(getCapabilities(EntityKind::Cannonball).has_ghost_collider);
    REQUIRE(getCapabilities(EntityKind::Cannonball).shatters_on_kill);

    REQUIRE(snapshotBodySize(EntityKind::Projectile) == 24);
    REQUIRE(snapshotBodySize(EntityKind::Grenade) == 26);
    REQUIRE_FALSE(isValidKind(3));
}

TEST_CASE("Ownership transfer flips authority and physics in one step", "[entity]")
{
    RecordingPhysicsBridge::Calls calls;
    OwnableEntity entity = makeEntity(EntityKind::Cannonball, REMOTE, calls);

    REQUIRE(entity.getState() == EntityState::OwnedRemote);
    REQUIRE_FALSE(entity.isOwner());
    REQUIRE(calls.kinematic);
    REQUIRE(calls.ghost);

    entity.transferOwnership(LOCAL, 1.0);
    REQUIRE(entity.isOwner());
    REQUIRE(entity.getOwner() == LOCAL);
    REQUIRE_FALSE(calls.kinematic);
    REQUIRE_FALSE(calls.ghost);

    entity.transferOwnership(REMOTE, 2.0);
    REQUIRE_FALSE(entity.isOwner());
    REQUIRE(entity.getState() == EntityState::OwnedRemote);
    REQUIRE(calls.kinematic);
}

TEST_CASE("Exactly one side owns after a transfer", "[entity]")
{
    RecordingPhysicsBridge::Calls calls_a;
    RecordingPhysicsBridge::Calls calls_b;
    OwnableEntity on_a = makeEntity(EntityKind::Grenade, LOCAL, calls_a, LOCAL);
    OwnableEntity on_b = makeEntity(EntityKind::Grenade, LOCAL, calls_b, REMOTE);

    REQUIRE(on_a.isOwner() != on_b.isOwner());

    on_a.transferOwnership(REMOTE, 1.0);
    on_b.transferOwnership(REMOTE, 1.0);
    REQUIRE(on_a.isOwner() != on_b.isOwner());
    REQUIRE(on_b.isOwner());
    REQUIRE(calls_a.suppressed);
    REQUIRE_FALSE(calls_b.suppressed);
}

TEST_CASE("Non-owners interpolate received transforms", "[entity]")
{
    RecordingPhysicsBridge::Calls owner_calls;
    RecordingPhysicsBridge::Calls remote_calls;
    OwnableEntity owner = makeEntity(EntityKind::Projectile, LOCAL, owner_calls, LOCAL);
    OwnableEntity replica = makeEntity(EntityKind::Projectile, LOCAL, remote_calls, REMOTE);

    REQUIRE(owner.setTransform(glm::vec3(8.0f, 0.0f, 0.0f), glm::vec3(0.0f, 90.0f, 0.0f)));
    REQUIRE_FALSE(replica.setTransform(glm::vec3(1.0f), glm::vec3(0.0f)));

    REQUIRE(readSnapshot(replica, writeSnapshot(owner), 1.0));

    replica.tick(1.0 + INTERVAL / 2.0, INTERVAL);
    REQUIRE_THAT(remote_calls.position.x, WithinAbs(4.0f, 1e-4));
    REQUIRE_THAT(remote_calls.rotation.y, WithinAbs(45.0f, 1e-3));

    replica.tick(1.0 + INTERVAL, INTERVAL);
    REQUIRE_THAT(remote_calls.position.x, WithinAbs(8.0f, 1e-4));
    REQUIRE(replica.getPosition().x == 8.0f);
}

TEST_CASE("Flags are applied immediately, without interpolation", "[entity]")
{
    RecordingPhysicsBridge::Calls owner_calls;
    RecordingPhysicsBridge::Calls remote_calls;
    OwnableEntity owner = makeEntity(EntityKind::Grenade, LOCAL, owner_calls, LOCAL);
    OwnableEntity replica = makeEntity(EntityKind::Grenade, LOCAL, remote_calls, REMOTE);

    REQUIRE(owner.setRiding(true));
    REQUIRE(owner.setFrozen(true));
    REQUIRE(readSnapshot(replica, writeSnapshot(owner), 1.0));

    REQUIRE(replica.isRiding());
    REQUIRE(replica.isFrozen());
    REQUIRE(remote_calls.frozen);

    replica.tick(1.0, INTERVAL);
    REQUIRE(remote_calls.attached);
    REQUIRE(remote_calls.rider == LOCAL);
    REQUIRE(remote_calls.transform_count == 0);
}

TEST_CASE("Flags are ignored for kinds without them", "[entity]")
{
    RecordingPhysicsBridge::Calls calls;
    OwnableEntity entity = makeEntity(EntityKind::Projectile, LOCAL, calls);
    REQUIRE_FALSE(entity.setRiding(true));
    REQUIRE_FALSE(entity.isRiding());
}

TEST_CASE("Snapshot field order is header, position, rotation, flags", "[entity]")
{
    RecordingPhysicsBridge::Calls calls;
    OwnableEntity entity = makeEntity(EntityKind::Grenade, LOCAL, calls);
    entity.setTransform(glm::vec3(1.0f, 2.0f, 3.0f), glm::vec3(4.0f, 5.0f, 6.0f));
    entity.setFrozen(true);

    std::vector<uint8_t> data = writeSnapshot(entity);
    ByteReader reader(data.data(), data.size());
    REQUIRE(reader.readUInt64() == entity.getId());
    REQUIRE(reader.readByte() == static_cast<uint8_t>(EntityKind::Grenade));
    REQUIRE(reader.readId() == LOCAL);
    REQUIRE(reader.readUInt32() == entity.getSequence());
    REQUIRE(reader.readVector3f() == glm::vec3(1.0f, 2.0f, 3.0f));
    REQUIRE(reader.readVector3f() == glm::vec3(4.0f, 5.0f, 6.0f));
    REQUIRE_FALSE(reader.readBool());
    REQUIRE(reader.readBool());
    REQUIRE(reader.remaining() == 0);
}

TEST_CASE("Truncated snapshots leave the entity unchanged", "[entity]")
{
    RecordingPhysicsBridge::Calls owner_calls;
    RecordingPhysicsBridge::Calls remote_calls;
    OwnableEntity owner = makeEntity(EntityKind::Grenade, LOCAL, owner_calls, LOCAL);
    OwnableEntity replica = makeEntity(EntityKind::Grenade, LOCAL, remote_calls, REMOTE);

    owner.setTransform(glm::vec3(5.0f), glm::vec3(0.0f));
    owner.setRiding(true);
    std::vector<uint8_t> data = writeSnapshot(owner);
    data.pop_back();

    REQUIRE_FALSE(readSnapshot(replica, data, 1.0));
    REQUIRE(replica.getPosition() == glm::vec3(0.0f));
    REQUIRE_FALSE(replica.isRiding());
}

TEST_CASE("Stale and foreign snapshots are discarded", "[entity]")
{
    RecordingPhysicsBridge::Calls owner_calls;
    RecordingPhysicsBridge::Calls remote_calls;
    OwnableEntity owner = makeEntity(EntityKind::Projectile, LOCAL, owner_calls, LOCAL);
    OwnableEntity replica = makeEntity(EntityKind::Projectile, LOCAL, remote_calls, REMOTE);

    owner.setTransform(glm::vec3(1.0f), glm::vec3(0.0f));
    std::vector<uint8_t> older = writeSnapshot(owner);
    owner.advanceSequence();
    owner.setTransform(glm::vec3(2.0f), glm::vec3(0.0f));
    std::vector<uint8_t> newer = writeSnapshot(owner);

    REQUIRE(readSnapshot(replica, newer, 1.0));
    REQUIRE_FALSE(readSnapshot(replica, older, 1.1));
    REQUIRE_FALSE(readSnapshot(replica, newer, 1.2));
    REQUIRE(replica.getPosition() == glm::vec3(2.0f));

    SECTION("Owner mismatch")
    {
        replica.transferOwnership(300, 2.0);
        owner.advanceSequence();
        REQUIRE_FALSE(readSnapshot(replica, writeSnapshot(owner), 2.1));
    }

    SECTION("Snapshots never overwrite the owner")
    {
        REQUIRE_FALSE(readSnapshot(owner, newer, 1.0));
    }
}

TEST_CASE("Kill is terminal and idempotent", "[entity]")
{
    RecordingPhysicsBridge::Calls calls;
    OwnableEntity grenade = makeEntity(EntityKind::Grenade, REMOTE, calls);
    REQUIRE(calls.suppressed);

    grenade.kill();
    REQUIRE(grenade.isDead());
    REQUIRE(calls.explode_count == 1);
    REQUIRE(calls.explode_harmless);
    REQUIRE_FALSE(calls.suppressed_when_exploded);
    REQUIRE(calls.destroy_count == 1);

    grenade.kill();
    REQUIRE(calls.explode_count == 1);
    REQUIRE(calls.destroy_count == 1);

    grenade.transferOwnership(LOCAL, 5.0);
    REQUIRE(grenade.isDead());
    REQUIRE_FALSE(grenade.isOwner());
}

TEST_CASE("Cannonballs shatter when killed", "[entity]")
{
    RecordingPhysicsBridge::Calls calls;
    OwnableEntity ball = makeEntity(EntityKind::Cannonball, LOCAL, calls);
    ball.kill();
    ball.kill();
    REQUIRE(calls.shatter_count == 1);
    REQUIRE(calls.explode_count == 0);
}

} // namespace Spraynet
