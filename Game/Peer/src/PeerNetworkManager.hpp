#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "enet.h"
#include "ByteStream.hpp"
#include "NetworkProtocol.hpp"
#include "NetworkTypes.hpp"
#include "Transport.hpp"

namespace Spraynet {

enum class PeerRole : uint8_t
{
    NONE,
    HOST,     // Accepts members and relays their packets
    MEMBER    // Connected to a host
};

enum class ConnectionState : uint8_t
{
    DISCONNECTED,
    CONNECTING,
    CONNECTED
};

// ENet transport for one participant. The host relays every packet to the
// other members and announces membership; members only talk to the host.
class PeerNetworkManager : public ITransport
{
private:
    struct OutgoingPacket
    {
        PacketType type;
        std::vector<uint8_t> data;
    };

    ENetHost* enet_host = nullptr;
    ENetPeer* host_peer = nullptr;   // Member side
    std::atomic<PeerRole> role{PeerRole::NONE};
    std::atomic<ConnectionState> connection_state{ConnectionState::DISCONNECTED};
    NetworkIdentity local_identity = INVALID_IDENTITY;
    bool enet_initialized = false;

    // Host side: members that completed the hello
    std::unordered_map<ENetPeer*, NetworkIdentity> peer_identities;
    // Everyone else in the session, as announced (host: same as peer_identities)
    std::unordered_set<NetworkIdentity> remote_members;

    float connection_timeout = 0.0f;
    static constexpr float CONNECTION_TIMEOUT_SECONDS = 5.0f;

    // Filled from any thread, drained by update()
    std::deque<OutgoingPacket> outgoing;
    std::mutex outgoing_mutex;

    std::function<void(const uint8_t*, size_t)> on_packet;
    std::function<void(NetworkIdentity)> on_member_joined;
    std::function<void(NetworkIdentity)> on_member_left;
    std::function<void()> on_disconnected;

    NetworkStats stats;

public:
    explicit PeerNetworkManager(NetworkIdentity identity);
    ~PeerNetworkManager() override;

    PeerNetworkManager(const PeerNetworkManager&) = delete;
    PeerNetworkManager& operator=(const PeerNetworkManager&) = delete;

    bool initialize();
    bool hostSession(uint16_t port, uint32_t max_peers);
    bool joinSession(const char* address, uint16_t port);
    void disconnect();
    void shutdown();

    // Services ENet and sends everything queued by broadcast()
    void update(float delta_time);

    // Thread-safe; the packet is sent on the next update()
    bool broadcast(PacketType type, size_t size_hint, const PacketFill& fill) override;

    PeerRole getRole() const { return role; }
    ConnectionState getConnectionState() const { return connection_state; }
    bool isInSession() const;
    NetworkIdentity getLocalIdentity() const { return local_identity; }
    size_t getMemberCount() const { return remote_members.size(); }
    const NetworkStats& getStats() const { return stats; }

    // Random non-zero identity for this process
    static NetworkIdentity generateIdentity();

    void setOnPacket(std::function<void(const uint8_t*, size_t)> callback) { on_packet = std::move(callback); }
    void setOnMemberJoined(std::function<void(NetworkIdentity)> callback) { on_member_joined = std::move(callback); }
    void setOnMemberLeft(std::function<void(NetworkIdentity)> callback) { on_member_left = std::move(callback); }
    void setOnDisconnected(std::function<void()> callback) { on_disconnected = std::move(callback); }

private:
    void handleConnect(ENetEvent& event);
    void handleDisconnect(ENetEvent& event);
    void handleReceive(ENetEvent& event);

    // Host side
    void handleMemberHello(ENetPeer* peer, ByteReader& reader);
    void relay(ENetPeer* source, const uint8_t* data, size_t size, NetworkChannel channel);

    // Member side
    void handleMembershipEvent(PacketType type, ByteReader& reader);
    void forgetAllMembers();

    void flushOutgoing();
    bool sendPacket(ENetPeer* peer, const uint8_t* data, size_t size, NetworkChannel channel);
    bool sendMemberEvent(ENetPeer* peer, PacketType type, NetworkIdentity identity);
};

} // namespace Spraynet
