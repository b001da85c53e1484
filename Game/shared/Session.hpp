#pragma once

#include "NetworkTypes.hpp"
#include "ReplicationManager.hpp"
#include "SprayManager.hpp"
#include "Transport.hpp"
#include "Assets/ImageDecoder.hpp"
#include "Threading/MainThreadQueue.hpp"
#include "Threading/UploadWorker.hpp"
#include <entt/entt.hpp>
#include <cstdint>
#include <cstddef>

namespace Spraynet {

// Everything a participant runs for one session: the entity registry, the
// spray and replication managers, and the upload worker. Packets and
// membership events come in from the transport on the simulation thread.
class Session
{
public:
    Session(ITransport& transport, NetworkIdentity local_identity);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    NetworkIdentity getLocalIdentity() const { return local_identity; }

    // Full packet including the type byte. Returns false when the packet was dropped.
    bool handlePacket(const uint8_t* data, size_t size, double now);

    void onMemberJoined(NetworkIdentity identity);
    void onMemberLeft(NetworkIdentity identity);
    void onSceneLoaded();

    // Runs upload completions, expires transfers and replicates entities
    void update(double now);

    // Stops the upload worker; queued uploads are dropped
    void shutdown();

    entt::registry& getRegistry() { return registry; }
    SprayManager& getSprays() { return sprays; }
    ReplicationManager& getReplication() { return replication; }
    Threading::UploadWorker& getUploadWorker() { return upload_worker; }
    Threading::MainThreadQueue& getCompletionQueue() { return completion_queue; }

    const NetworkStats& getStats() const { return stats; }

private:
    bool dispatch(PacketType type, ByteReader& reader, double now);

    NetworkIdentity local_identity;
    entt::registry registry;
    Assets::StbImageDecoder decoder;
    Threading::MainThreadQueue completion_queue;
    Threading::UploadWorker upload_worker;
    SprayManager sprays;
    ReplicationManager replication;
    NetworkStats stats;
};

} // namespace Spraynet
