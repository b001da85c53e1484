#pragma once

#include <cstdint>
#include <cstddef>

namespace Spraynet {

// Protocol version, exchanged in MemberHello
constexpr uint32_t NETWORK_PROTOCOL_VERSION = 1;

// Packet type enumeration (first byte of every packet)
enum class PacketType : uint8_t
{
    // Session membership (transport)
    MEMBER_HELLO = 0,         // Peer → Host
    MEMBER_JOINED = 1,        // Host → Peers
    MEMBER_LEFT = 2,          // Host → Peers

    // Chunked asset transfer (Reliable)
    TRANSFER_BEGIN = 10,
    TRANSFER_CHUNK = 11,
    TRANSFER_RESYNC = 12,     // Ask a sender to restart its transfer

    // Sprays (Reliable)
    SPRAY_SPAWN = 20,

    // Ownable entities
    ENTITY_SPAWN = 30,        // Reliable
    ENTITY_SNAPSHOT = 31,     // Unreliable
    ENTITY_OWNERSHIP = 32,    // Reliable, sent by the current owner only
    ENTITY_KILL = 33,         // Reliable
    ENTITY_CLAIM = 34         // Reliable, asks the owner to hand off
};

// Network channels for ENet
enum class NetworkChannel : uint8_t
{
    RELIABLE_ORDERED = 0,      // Membership, transfers, entity lifecycle
    UNRELIABLE_SEQUENCED = 1   // Entity snapshots
};

constexpr size_t CHANNEL_COUNT = 2;

inline NetworkChannel channelFor(PacketType type)
{
    return type == PacketType::ENTITY_SNAPSHOT ? NetworkChannel::UNRELIABLE_SEQUENCED
                                               : NetworkChannel::RELIABLE_ORDERED;
}

const char* packetTypeName(PacketType type);

// Field widths
constexpr size_t PACKET_TYPE_SIZE = 1;
constexpr size_t IDENTITY_SIZE = 8;
constexpr size_t VECTOR3_SIZE = 12;

// Body sizes (excluding the type byte)
constexpr size_t TRANSFER_BEGIN_SIZE = IDENTITY_SIZE + 4;
constexpr size_t TRANSFER_BEGIN_PACKET_SIZE = PACKET_TYPE_SIZE + TRANSFER_BEGIN_SIZE;   // 13, fixed
constexpr size_t TRANSFER_CHUNK_PAYLOAD = 240;
constexpr size_t TRANSFER_CHUNK_MAX_SIZE = IDENTITY_SIZE + TRANSFER_CHUNK_PAYLOAD;
constexpr size_t TRANSFER_RESYNC_SIZE = IDENTITY_SIZE * 2;
constexpr size_t SPRAY_SPAWN_SIZE = IDENTITY_SIZE + VECTOR3_SIZE * 2;                   // 32
constexpr size_t MEMBER_HELLO_SIZE = IDENTITY_SIZE + 4;
constexpr size_t MEMBER_EVENT_SIZE = IDENTITY_SIZE;
constexpr size_t ENTITY_ID_SIZE = 8;
constexpr size_t ENTITY_SPAWN_SIZE = ENTITY_ID_SIZE + 1 + IDENTITY_SIZE + VECTOR3_SIZE * 2;
constexpr size_t ENTITY_SNAPSHOT_HEADER_SIZE = ENTITY_ID_SIZE + 1 + IDENTITY_SIZE + 4;
constexpr size_t ENTITY_OWNERSHIP_SIZE = ENTITY_ID_SIZE + IDENTITY_SIZE * 2;
constexpr size_t ENTITY_CLAIM_SIZE = ENTITY_ID_SIZE + IDENTITY_SIZE;
constexpr size_t ENTITY_KILL_SIZE = ENTITY_ID_SIZE;

// Largest asset accepted for a chunked transfer
constexpr uint32_t MAX_ASSET_SIZE = 512 * 1024;

} // namespace Spraynet
