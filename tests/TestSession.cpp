#include <catch2/catch_test_macros.hpp>

#include "NetworkSerializer.hpp"
#include "Session.hpp"
#include "TestHelpers.hpp"

namespace Spraynet {

namespace {

constexpr NetworkIdentity ALICE = 0xA11CE;
constexpr NetworkIdentity BOB = 0xB0B;

size_t deliver(Test::RecordingTransport& from, Session& to, double now)
{
    size_t accepted = 0;
    for (const auto& packet : from.take()) {
        accepted += to.handlePacket(packet.data.data(), packet.data.size(), now) ? 1 : 0;
    }
    return accepted;
}

}

TEST_CASE("Session routes entity packets to replication", "[session]")
{
    Test::RecordingTransport alice_transport;
    Test::RecordingTransport bob_transport;
    Session alice(alice_transport, ALICE);
    Session bob(bob_transport, BOB);

    EntityId id = alice.getReplication().spawnLocal(EntityKind::Cannonball, glm::vec3(1.0f), glm::vec3(0.0f), 0.0);
    REQUIRE(id != INVALID_ENTITY_ID);
    alice.update(0.0);

    // spawn + first snapshot
    REQUIRE(deliver(alice_transport, bob, 0.0) == 2);
    REQUIRE(bob.getReplication().find(id) != nullptr);
    REQUIRE(bob.getStats().packets_received == 2);
    REQUIRE(bob.getStats().packets_dropped == 0);
}

TEST_CASE("Session drops packets it cannot route", "[session]")
{
    Test::RecordingTransport transport;
    Session session(transport, ALICE);

    const uint8_t unknown[] = {0xEE, 1, 2, 3};
    REQUIRE_FALSE(session.handlePacket(unknown, sizeof(unknown), 0.0));
    REQUIRE_FALSE(session.handlePacket(unknown, 0, 0.0));

    const uint8_t hello[] = {static_cast<uint8_t>(PacketType::MEMBER_HELLO), 0, 0, 0, 0, 0, 0, 0, 1};
    REQUIRE_FALSE(session.handlePacket(hello, sizeof(hello), 0.0));

    // Begin packets must be exactly 13 bytes
    const uint8_t short_begin[] = {static_cast<uint8_t>(PacketType::TRANSFER_BEGIN), 0x0B, 0x0B, 0, 0, 0, 0, 0, 0, 4, 0};
    REQUIRE_FALSE(session.handlePacket(short_begin, sizeof(short_begin), 0.0));

    REQUIRE(session.getStats().packets_received == 4);
    REQUIRE(session.getStats().packets_dropped == 4);
    REQUIRE(transport.size() == 0);
}

TEST_CASE("Departure of a member removes its entities", "[session]")
{
    Test::RecordingTransport alice_transport;
    Test::RecordingTransport bob_transport;
    Session alice(alice_transport, ALICE);
    Session bob(bob_transport, BOB);

    alice.getReplication().spawnLocal(EntityKind::Projectile, glm::vec3(0.0f), glm::vec3(0.0f), 0.0);
    deliver(alice_transport, bob, 0.0);
    REQUIRE(bob.getReplication().size() == 1);

    bob.onMemberLeft(BOB);
    REQUIRE(bob.getReplication().size() == 1);

    bob.onMemberLeft(ALICE);
    REQUIRE(bob.getReplication().size() == 0);
}

} // namespace Spraynet
