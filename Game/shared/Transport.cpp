#include "Transport.hpp"
#include "Utils/Log.hpp"

namespace Spraynet {

bool encodePacket(PacketType type, size_t size_hint, const PacketFill& fill, std::vector<uint8_t>& out)
{
    ByteWriter writer(PACKET_TYPE_SIZE + size_hint);
    writer.writeByte(static_cast<uint8_t>(type));
    if (fill) {
        fill(writer);
    }

    if (writer.hasError()) {
        LOG_NET_ERROR("Packet {0} overran its declared size of {1} bytes", packetTypeName(type), size_hint);
        return false;
    }

    out = writer.release();
    return true;
}

} // namespace Spraynet
