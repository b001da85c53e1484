#include "Session.hpp"
#include "NetworkSerializer.hpp"
#include "Utils/Log.hpp"

namespace Spraynet {

Session::Session(ITransport& transport, NetworkIdentity identity)
    : local_identity(identity)
    , upload_worker(&completion_queue)
    , sprays(registry, transport, upload_worker, decoder, identity)
    , replication(registry, transport, identity)
{
    LOG_NET_INFO("Session started as {0}", local_identity);
}

Session::~Session()
{
    shutdown();
}

void Session::shutdown()
{
    upload_worker.shutdown();
}

bool Session::handlePacket(const uint8_t* data, size_t size, double now)
{
    stats.packets_received++;
    stats.bytes_received += static_cast<uint32_t>(size);

    PacketType type;
    if (!NetworkSerializer::getPacketType(data, size, type)) {
        stats.packets_dropped++;
        return false;
    }

    ByteReader reader(data + PACKET_TYPE_SIZE, size - PACKET_TYPE_SIZE);
    if (!dispatch(type, reader, now)) {
        stats.packets_dropped++;
        return false;
    }
    return true;
}

bool Session::dispatch(PacketType type, ByteReader& reader, double now)
{
    switch (type) {
        case PacketType::TRANSFER_BEGIN:
            return sprays.handleTransferBegin(reader, now);
        case PacketType::TRANSFER_CHUNK:
            return sprays.handleTransferChunk(reader, now);
        case PacketType::TRANSFER_RESYNC:
            return sprays.handleTransferResync(reader);
        case PacketType::SPRAY_SPAWN:
            return sprays.handleSpraySpawn(reader);
        case PacketType::ENTITY_SPAWN:
            return replication.handleSpawn(reader, now);
        case PacketType::ENTITY_SNAPSHOT:
            return replication.handleSnapshot(reader, now);
        case PacketType::ENTITY_OWNERSHIP:
            return replication.handleOwnership(reader, now);
        case PacketType::ENTITY_CLAIM:
            return replication.handleClaim(reader, now);
        case PacketType::ENTITY_KILL:
            return replication.handleKill(reader);
        case PacketType::MEMBER_HELLO:
        case PacketType::MEMBER_JOINED:
        case PacketType::MEMBER_LEFT:
            LOG_NET_WARN("Membership packet {0} reached the session", packetTypeName(type));
            return false;
    }

    LOG_NET_WARN("Unknown packet type {0}", static_cast<int>(type));
    return false;
}

void Session::onMemberJoined(NetworkIdentity identity)
{
    if (identity == local_identity) {
        return;
    }
    LOG_NET_INFO("Member {0} joined", identity);
    sprays.onMemberJoined(identity);
}

void Session::onMemberLeft(NetworkIdentity identity)
{
    if (identity == local_identity) {
        return;
    }
    LOG_NET_INFO("Member {0} left", identity);
    sprays.onMemberLeft(identity);
    replication.onMemberLeft(identity);
}

void Session::onSceneLoaded()
{
    sprays.onSceneLoaded();
    replication.clear();
}

void Session::update(double now)
{
    completion_queue.processAll();
    sprays.update(now);
    replication.update(now);
}

} // namespace Spraynet
