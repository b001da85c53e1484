#pragma once

#include <cstdint>

namespace Spraynet {

// Opaque 64-bit participant identity, unique within a session
using NetworkIdentity = uint64_t;
constexpr NetworkIdentity INVALID_IDENTITY = 0;

// Replicated entity id: creator identity low 32 bits << 32 | creator-local counter
using EntityId = uint64_t;
constexpr EntityId INVALID_ENTITY_ID = 0;

inline EntityId makeEntityId(NetworkIdentity creator, uint32_t counter) {
    return (static_cast<EntityId>(creator & 0xFFFFFFFFull) << 32) | counter;
}

// Network statistics
struct NetworkStats
{
    uint32_t packets_sent = 0;
    uint32_t packets_received = 0;
    uint32_t bytes_sent = 0;
    uint32_t bytes_received = 0;
    uint32_t packets_dropped = 0;   // Malformed, stale or unexpected
};

} // namespace Spraynet
