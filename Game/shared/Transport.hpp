#pragma once

#include "ByteStream.hpp"
#include "NetworkProtocol.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace Spraynet {

// Writes the body of one packet
using PacketFill = std::function<void(ByteWriter&)>;

// Outward broadcast primitive. Implementations must be safe to call from the
// upload worker thread as well as the simulation thread.
class ITransport
{
public:
    virtual ~ITransport() = default;

    // size_hint is the body size, excluding the type byte. Returns false if the
    // packet could not be encoded or queued.
    virtual bool broadcast(PacketType type, size_t size_hint, const PacketFill& fill) = 0;
};

// Encodes [type][body] into 'out'. Fails (and logs) when fill overruns size_hint.
bool encodePacket(PacketType type, size_t size_hint, const PacketFill& fill, std::vector<uint8_t>& out);

} // namespace Spraynet
