#include "PeerNetworkManager.hpp"
#include "NetworkSerializer.hpp"
#include "Utils/Log.hpp"
#include <random>

namespace Spraynet {

PeerNetworkManager::PeerNetworkManager(NetworkIdentity identity)
    : local_identity(identity)
{
}

PeerNetworkManager::~PeerNetworkManager()
{
    shutdown();
}

NetworkIdentity PeerNetworkManager::generateIdentity()
{
    std::random_device device;
    std::mt19937_64 generator((static_cast<uint64_t>(device()) << 32) | device());
    NetworkIdentity identity = INVALID_IDENTITY;
    while (identity == INVALID_IDENTITY) {
        identity = generator();
    }
    return identity;
}

bool PeerNetworkManager::initialize()
{
    if (enet_initialized) {
        return true;
    }
    if (enet_initialize() != 0) {
        LOG_APP_ERROR("Failed to initialize ENet");
        return false;
    }

    enet_initialized = true;
    LOG_APP_INFO("ENet initialized (identity {0})", local_identity);
    return true;
}

bool PeerNetworkManager::isInSession() const
{
    PeerRole current = role.load();
    return current == PeerRole::HOST ||
        (current == PeerRole::MEMBER && connection_state.load() == ConnectionState::CONNECTED);
}

bool PeerNetworkManager::hostSession(uint16_t port, uint32_t max_peers)
{
    if (enet_host != nullptr) {
        LOG_APP_WARN("Network already started");
        return false;
    }

    ENetAddress address;
    address.host = ENET_HOST_ANY;
    address.port = port;

    enet_host = enet_host_create(&address, max_peers, CHANNEL_COUNT, 0, 0);
    if (enet_host == nullptr) {
        LOG_APP_ERROR("Failed to host on port {0}", port);
        return false;
    }

    role = PeerRole::HOST;
    connection_state = ConnectionState::CONNECTED;
    LOG_APP_INFO("Hosting session on port {0} (max {1} peers)", port, max_peers);
    return true;
}

bool PeerNetworkManager::joinSession(const char* address, uint16_t port)
{
    if (enet_host != nullptr) {
        LOG_APP_WARN("Network already started");
        return false;
    }

    enet_host = enet_host_create(nullptr, 1, CHANNEL_COUNT, 0, 0);
    if (enet_host == nullptr) {
        LOG_APP_ERROR("Failed to create ENet client host");
        return false;
    }

    ENetAddress host_address;
    if (enet_address_set_host(&host_address, address) != 0) {
        LOG_APP_ERROR("Failed to resolve host address: {0}", address);
        enet_host_destroy(enet_host);
        enet_host = nullptr;
        return false;
    }
    host_address.port = port;

    host_peer = enet_host_connect(enet_host, &host_address, CHANNEL_COUNT, 0);
    if (host_peer == nullptr) {
        LOG_APP_ERROR("Failed to create connection to host");
        enet_host_destroy(enet_host);
        enet_host = nullptr;
        return false;
    }

    role = PeerRole::MEMBER;
    connection_state = ConnectionState::CONNECTING;
    connection_timeout = 0.0f;
    LOG_APP_INFO("Joining session at {0}:{1}...", address, port);
    return true;
}

void PeerNetworkManager::disconnect()
{
    if (role == PeerRole::HOST) {
        for (const auto& pair : peer_identities) {
            enet_peer_disconnect_later(pair.first, 0);
        }
    } else if (role == PeerRole::MEMBER && host_peer != nullptr) {
        enet_peer_disconnect(host_peer, 0);
    }

    forgetAllMembers();
    peer_identities.clear();
    host_peer = nullptr;
    role = PeerRole::NONE;
    connection_state = ConnectionState::DISCONNECTED;
}

void PeerNetworkManager::shutdown()
{
    disconnect();

    if (enet_host != nullptr) {
        // Give the disconnects a moment to go out
        ENetEvent event;
        while (enet_host_service(enet_host, &event, 100) > 0) {
            if (event.type == ENET_EVENT_TYPE_RECEIVE) {
                enet_packet_destroy(event.packet);
            }
        }

        enet_host_destroy(enet_host);
        enet_host = nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(outgoing_mutex);
        outgoing.clear();
    }

    if (enet_initialized) {
        enet_deinitialize();
        enet_initialized = false;
        LOG_APP_INFO("Network shutdown complete");
    }
}

void PeerNetworkManager::update(float delta_time)
{
    if (enet_host == nullptr) {
        return;
    }

    if (role == PeerRole::MEMBER && connection_state == ConnectionState::CONNECTING) {
        connection_timeout += delta_time;
        if (connection_timeout >= CONNECTION_TIMEOUT_SECONDS) {
            LOG_APP_ERROR("Connection timeout - no response from host");
            disconnect();
            if (on_disconnected) {
                on_disconnected();
            }
            return;
        }
    }

    ENetEvent event;
    while (enet_host != nullptr && enet_host_service(enet_host, &event, 0) > 0) {
        switch (event.type) {
            case ENET_EVENT_TYPE_CONNECT:
                handleConnect(event);
                break;

            case ENET_EVENT_TYPE_RECEIVE:
                handleReceive(event);
                enet_packet_destroy(event.packet);
                break;

            case ENET_EVENT_TYPE_DISCONNECT:
            case ENET_EVENT_TYPE_DISCONNECT_TIMEOUT:
                handleDisconnect(event);
                break;

            case ENET_EVENT_TYPE_NONE:
                break;
        }
    }

    flushOutgoing();
    if (enet_host != nullptr) {
        enet_host_flush(enet_host);
    }
}

bool PeerNetworkManager::broadcast(PacketType type, size_t size_hint, const PacketFill& fill)
{
    if (!isInSession()) {
        return false;
    }

    OutgoingPacket packet;
    packet.type = type;
    if (!encodePacket(type, size_hint, fill, packet.data)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(outgoing_mutex);
    outgoing.push_back(std::move(packet));
    return true;
}

void PeerNetworkManager::flushOutgoing()
{
    std::deque<OutgoingPacket> pending;
    {
        std::lock_guard<std::mutex> lock(outgoing_mutex);
        pending.swap(outgoing);
    }

    for (const OutgoingPacket& packet : pending) {
        NetworkChannel channel = channelFor(packet.type);
        if (role == PeerRole::HOST) {
            for (const auto& pair : peer_identities) {
                sendPacket(pair.first, packet.data.data(), packet.data.size(), channel);
            }
        } else if (role == PeerRole::MEMBER && host_peer != nullptr) {
            sendPacket(host_peer, packet.data.data(), packet.data.size(), channel);
        }
    }
}

bool PeerNetworkManager::sendPacket(ENetPeer* peer, const uint8_t* data, size_t size, NetworkChannel channel)
{
    enet_uint32 flags = channel == NetworkChannel::RELIABLE_ORDERED ? ENET_PACKET_FLAG_RELIABLE : 0;
    ENetPacket* packet = enet_packet_create(data, size, flags);
    if (packet == nullptr) {
        LOG_APP_ERROR("Failed to allocate packet of {0} bytes", size);
        return false;
    }

    if (enet_peer_send(peer, static_cast<uint8_t>(channel), packet) != 0) {
        enet_packet_destroy(packet);
        stats.packets_dropped++;
        return false;
    }

    stats.packets_sent++;
    stats.bytes_sent += static_cast<uint32_t>(size);
    return true;
}

bool PeerNetworkManager::sendMemberEvent(ENetPeer* peer, PacketType type, NetworkIdentity identity)
{
    std::vector<uint8_t> data;
    MemberEventMessage msg;
    msg.identity = identity;
    bool ok = encodePacket(type, MEMBER_EVENT_SIZE, [&](ByteWriter& writer) {
        NetworkSerializer::serialize(writer, msg);
    }, data);
    return ok && sendPacket(peer, data.data(), data.size(), NetworkChannel::RELIABLE_ORDERED);
}

void PeerNetworkManager::handleConnect(ENetEvent& event)
{
    if (role == PeerRole::HOST) {
        LOG_APP_INFO("Peer connecting, waiting for hello");
        return;
    }

    connection_state = ConnectionState::CONNECTED;
    LOG_APP_INFO("Connected to host, sending hello");

    std::vector<uint8_t> data;
    MemberHelloMessage hello;
    hello.identity = local_identity;
    bool ok = encodePacket(PacketType::MEMBER_HELLO, MEMBER_HELLO_SIZE, [&](ByteWriter& writer) {
        NetworkSerializer::serialize(writer, hello);
    }, data);
    if (!ok || !sendPacket(event.peer, data.data(), data.size(), NetworkChannel::RELIABLE_ORDERED)) {
        LOG_APP_ERROR("Failed to send hello to host");
    }
}

void PeerNetworkManager::handleDisconnect(ENetEvent& event)
{
    if (role == PeerRole::HOST) {
        auto it = peer_identities.find(event.peer);
        if (it == peer_identities.end()) {
            return;
        }

        NetworkIdentity identity = it->second;
        peer_identities.erase(it);
        remote_members.erase(identity);
        LOG_APP_INFO("Member {0} disconnected", identity);

        for (const auto& pair : peer_identities) {
            sendMemberEvent(pair.first, PacketType::MEMBER_LEFT, identity);
        }
        if (on_member_left) {
            on_member_left(identity);
        }
        return;
    }

    LOG_APP_INFO("Disconnected from host");
    host_peer = nullptr;
    forgetAllMembers();
    role = PeerRole::NONE;
    connection_state = ConnectionState::DISCONNECTED;
    if (on_disconnected) {
        on_disconnected();
    }
}

void PeerNetworkManager::handleReceive(ENetEvent& event)
{
    const uint8_t* data = event.packet->data;
    const size_t size = event.packet->dataLength;

    stats.packets_received++;
    stats.bytes_received += static_cast<uint32_t>(size);

    PacketType type;
    if (!NetworkSerializer::getPacketType(data, size, type)) {
        stats.packets_dropped++;
        return;
    }

    ByteReader reader(data + PACKET_TYPE_SIZE, size - PACKET_TYPE_SIZE);

    if (role == PeerRole::HOST) {
        if (type == PacketType::MEMBER_HELLO) {
            handleMemberHello(event.peer, reader);
            return;
        }
        if (peer_identities.count(event.peer) == 0 ||
            type == PacketType::MEMBER_JOINED || type == PacketType::MEMBER_LEFT) {
            LOG_APP_WARN("Dropped {0} from unidentified or misbehaving peer", packetTypeName(type));
            stats.packets_dropped++;
            return;
        }

        relay(event.peer, data, size, static_cast<NetworkChannel>(event.channelID));
        if (on_packet) {
            on_packet(data, size);
        }
        return;
    }

    if (type == PacketType::MEMBER_JOINED || type == PacketType::MEMBER_LEFT) {
        handleMembershipEvent(type, reader);
        return;
    }
    if (on_packet) {
        on_packet(data, size);
    }
}

void PeerNetworkManager::handleMemberHello(ENetPeer* peer, ByteReader& reader)
{
    MemberHelloMessage msg;
    if (!NetworkSerializer::deserialize(reader, msg)) {
        LOG_APP_WARN("Malformed hello, disconnecting peer");
        enet_peer_disconnect_later(peer, 0);
        return;
    }

    if (msg.protocol_version != NETWORK_PROTOCOL_VERSION) {
        LOG_APP_WARN("Peer protocol version mismatch: {0} (expected {1})",
            msg.protocol_version, NETWORK_PROTOCOL_VERSION);
        enet_peer_disconnect_later(peer, 0);
        return;
    }

    if (msg.identity == INVALID_IDENTITY || msg.identity == local_identity ||
        remote_members.count(msg.identity) != 0 || peer_identities.count(peer) != 0) {
        LOG_APP_WARN("Rejected hello with identity {0}", msg.identity);
        enet_peer_disconnect_later(peer, 0);
        return;
    }

    // Tell the newcomer who is already here, then tell everyone about it
    sendMemberEvent(peer, PacketType::MEMBER_JOINED, local_identity);
    for (const auto& pair : peer_identities) {
        sendMemberEvent(peer, PacketType::MEMBER_JOINED, pair.second);
        sendMemberEvent(pair.first, PacketType::MEMBER_JOINED, msg.identity);
    }

    peer_identities[peer] = msg.identity;
    remote_members.insert(msg.identity);
    LOG_APP_INFO("Member {0} joined ({1} in session)", msg.identity, remote_members.size() + 1);

    if (on_member_joined) {
        on_member_joined(msg.identity);
    }
}

void PeerNetworkManager::relay(ENetPeer* source, const uint8_t* data, size_t size, NetworkChannel channel)
{
    for (const auto& pair : peer_identities) {
        if (pair.first != source) {
            sendPacket(pair.first, data, size, channel);
        }
    }
}

void PeerNetworkManager::handleMembershipEvent(PacketType type, ByteReader& reader)
{
    MemberEventMessage msg;
    if (!NetworkSerializer::deserialize(reader, msg)) {
        LOG_APP_WARN("Malformed {0}", packetTypeName(type));
        stats.packets_dropped++;
        return;
    }
    if (msg.identity == local_identity) {
        return;
    }

    if (type == PacketType::MEMBER_JOINED) {
        if (remote_members.insert(msg.identity).second && on_member_joined) {
            on_member_joined(msg.identity);
        }
    } else {
        if (remote_members.erase(msg.identity) != 0 && on_member_left) {
            on_member_left(msg.identity);
        }
    }
}

void PeerNetworkManager::forgetAllMembers()
{
    std::unordered_set<NetworkIdentity> members;
    members.swap(remote_members);
    for (NetworkIdentity identity : members) {
        if (on_member_left) {
            on_member_left(identity);
        }
    }
}

} // namespace Spraynet
