#include "NetworkProtocol.hpp"

namespace Spraynet {

const char* packetTypeName(PacketType type)
{
    switch (type) {
        case PacketType::MEMBER_HELLO:      return "MEMBER_HELLO";
        case PacketType::MEMBER_JOINED:     return "MEMBER_JOINED";
        case PacketType::MEMBER_LEFT:       return "MEMBER_LEFT";
        case PacketType::TRANSFER_BEGIN:    return "TRANSFER_BEGIN";
        case PacketType::TRANSFER_CHUNK:    return "TRANSFER_CHUNK";
        case PacketType::TRANSFER_RESYNC:   return "TRANSFER_RESYNC";
        case PacketType::SPRAY_SPAWN:       return "SPRAY_SPAWN";
        case PacketType::ENTITY_SPAWN:      return "ENTITY_SPAWN";
        case PacketType::ENTITY_SNAPSHOT:   return "ENTITY_SNAPSHOT";
        case PacketType::ENTITY_OWNERSHIP:  return "ENTITY_OWNERSHIP";
        case PacketType::ENTITY_KILL:       return "ENTITY_KILL";
        case PacketType::ENTITY_CLAIM:      return "ENTITY_CLAIM";
    }
    return "UNKNOWN";
}

} // namespace Spraynet
