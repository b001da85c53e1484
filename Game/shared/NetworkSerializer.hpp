#pragma once

#include "ByteStream.hpp"
#include "NetworkProtocol.hpp"
#include "NetworkTypes.hpp"
#include <glm/glm.hpp>
#include <cstdint>

namespace Spraynet {

// Message bodies. The packet type byte is written by the transport and
// consumed by the dispatcher before these are read.

struct MemberHelloMessage
{
    NetworkIdentity identity = INVALID_IDENTITY;
    uint32_t protocol_version = NETWORK_PROTOCOL_VERSION;
};

struct MemberEventMessage
{
    NetworkIdentity identity = INVALID_IDENTITY;
};

struct TransferBeginMessage
{
    NetworkIdentity sender = INVALID_IDENTITY;
    uint32_t total_length = 0;
};

struct TransferChunkMessage
{
    NetworkIdentity sender = INVALID_IDENTITY;
    const uint8_t* data = nullptr;   // Points into the packet being read
    size_t size = 0;
};

struct TransferResyncMessage
{
    NetworkIdentity requester = INVALID_IDENTITY;
    NetworkIdentity target = INVALID_IDENTITY;
};

struct SpraySpawnMessage
{
    NetworkIdentity sender = INVALID_IDENTITY;
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 direction = glm::vec3(0.0f);
};

struct EntitySpawnMessage
{
    EntityId entity_id = INVALID_ENTITY_ID;
    uint8_t kind = 0;
    NetworkIdentity owner = INVALID_IDENTITY;
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 rotation = glm::vec3(0.0f);
};

// Common prefix of every entity snapshot; the kind-specific body follows
struct EntitySnapshotHeader
{
    EntityId entity_id = INVALID_ENTITY_ID;
    uint8_t kind = 0;
    NetworkIdentity owner = INVALID_IDENTITY;
    uint32_t sequence = 0;
};

// Hand-off from previous_owner; ignored by peers that see a different owner
struct EntityOwnershipMessage
{
    EntityId entity_id = INVALID_ENTITY_ID;
    NetworkIdentity previous_owner = INVALID_IDENTITY;
    NetworkIdentity new_owner = INVALID_IDENTITY;
};

struct EntityClaimMessage
{
    EntityId entity_id = INVALID_ENTITY_ID;
    NetworkIdentity requester = INVALID_IDENTITY;
};

struct EntityKillMessage
{
    EntityId entity_id = INVALID_ENTITY_ID;
};

namespace NetworkSerializer
{
    inline void serialize(ByteWriter& writer, const MemberHelloMessage& msg) {
        writer.writeId(msg.identity);
        writer.writeUInt32(msg.protocol_version);
    }

    inline bool deserialize(ByteReader& reader, MemberHelloMessage& msg) {
        msg.identity = reader.readId();
        msg.protocol_version = reader.readUInt32();
        return !reader.hasError();
    }

    inline void serialize(ByteWriter& writer, const MemberEventMessage& msg) {
        writer.writeId(msg.identity);
    }

    inline bool deserialize(ByteReader& reader, MemberEventMessage& msg) {
        msg.identity = reader.readId();
        return !reader.hasError();
    }

    inline void serialize(ByteWriter& writer, const TransferBeginMessage& msg) {
        writer.writeId(msg.sender);
        writer.writeUInt32(msg.total_length);
    }

    inline bool deserialize(ByteReader& reader, TransferBeginMessage& msg) {
        msg.sender = reader.readId();
        msg.total_length = reader.readUInt32();
        return !reader.hasError();
    }

    inline void serialize(ByteWriter& writer, const TransferChunkMessage& msg) {
        writer.writeId(msg.sender);
        writer.writeBytes(msg.data, msg.size);
    }

    // The chunk payload is everything after the sender id
    inline bool deserialize(ByteReader& reader, TransferChunkMessage& msg) {
        msg.sender = reader.readId();
        if (reader.hasError()) return false;
        msg.size = reader.remaining();
        msg.data = reader.readRaw(msg.size);
        return !reader.hasError();
    }

    inline void serialize(ByteWriter& writer, const TransferResyncMessage& msg) {
        writer.writeId(msg.requester);
        writer.writeId(msg.target);
    }

    inline bool deserialize(ByteReader& reader, TransferResyncMessage& msg) {
        msg.requester = reader.readId();
        msg.target = reader.readId();
        return !reader.hasError();
    }

    inline void serialize(ByteWriter& writer, const SpraySpawnMessage& msg) {
        writer.writeId(msg.sender);
        writer.writeVector3f(msg.position);
        writer.writeVector3f(msg.direction);
    }

    inline bool deserialize(ByteReader& reader, SpraySpawnMessage& msg) {
        msg.sender = reader.readId();
        msg.position = reader.readVector3f();
        msg.direction = reader.readVector3f();
        return !reader.hasError();
    }

    inline void serialize(ByteWriter& writer, const EntitySpawnMessage& msg) {
        writer.writeUInt64(msg.entity_id);
        writer.writeByte(msg.kind);
        writer.writeId(msg.owner);
        writer.writeVector3f(msg.position);
        writer.writeVector3f(msg.rotation);
    }

    inline bool deserialize(ByteReader& reader, EntitySpawnMessage& msg) {
        msg.entity_id = reader.readUInt64();
        msg.kind = reader.readByte();
        msg.owner = reader.readId();
        msg.position = reader.readVector3f();
        msg.rotation = reader.readVector3f();
        return !reader.hasError();
    }

    inline void serialize(ByteWriter& writer, const EntitySnapshotHeader& header) {
        writer.writeUInt64(header.entity_id);
        writer.writeByte(header.kind);
        writer.writeId(header.owner);
        writer.writeUInt32(header.sequence);
    }

    inline bool deserialize(ByteReader& reader, EntitySnapshotHeader& header) {
        header.entity_id = reader.readUInt64();
        header.kind = reader.readByte();
        header.owner = reader.readId();
        header.sequence = reader.readUInt32();
        return !reader.hasError();
    }

    inline void serialize(ByteWriter& writer, const EntityOwnershipMessage& msg) {
        writer.writeUInt64(msg.entity_id);
        writer.writeId(msg.previous_owner);
        writer.writeId(msg.new_owner);
    }

    inline bool deserialize(ByteReader& reader, EntityOwnershipMessage& msg) {
        msg.entity_id = reader.readUInt64();
        msg.previous_owner = reader.readId();
        msg.new_owner = reader.readId();
        return !reader.hasError();
    }

    inline void serialize(ByteWriter& writer, const EntityClaimMessage& msg) {
        writer.writeUInt64(msg.entity_id);
        writer.writeId(msg.requester);
    }

    inline bool deserialize(ByteReader& reader, EntityClaimMessage& msg) {
        msg.entity_id = reader.readUInt64();
        msg.requester = reader.readId();
        return !reader.hasError();
    }

    inline void serialize(ByteWriter& writer, const EntityKillMessage& msg) {
        writer.writeUInt64(msg.entity_id);
    }

    inline bool deserialize(ByteReader& reader, EntityKillMessage& msg) {
        msg.entity_id = reader.readUInt64();
        return !reader.hasError();
    }

    // Peek the packet type (first byte)
    inline bool getPacketType(const uint8_t* data, size_t size, PacketType& type) {
        if (size < PACKET_TYPE_SIZE) return false;
        type = static_cast<PacketType>(data[0]);
        return true;
    }
}

} // namespace Spraynet
