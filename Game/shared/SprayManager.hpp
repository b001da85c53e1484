#pragma once

#include "ByteStream.hpp"
#include "EntityDirectory.hpp"
#include "NetworkTypes.hpp"
#include "TransferAssembler.hpp"
#include "Transport.hpp"
#include "Assets/SprayLibrary.hpp"
#include "Threading/UploadWorker.hpp"
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Spraynet {

// Places sprays, uploads the local spray image to the session once and
// reassembles the images other participants upload.
//
// All methods run on the simulation thread. The upload itself runs on the
// UploadWorker and only touches the transport.
class SprayManager
{
public:
    using NotifyCallback = std::function<void(const std::string&)>;

    SprayManager(entt::registry& registry, ITransport& transport, Threading::UploadWorker& worker,
                 Assets::IImageDecoder& decoder, NetworkIdentity local_identity);

    void setLocalIdentity(NetworkIdentity identity) { local_identity = identity; }
    NetworkIdentity getLocalIdentity() const { return local_identity; }

    // User-facing messages (missing spray, file too large, ...)
    void setNotifyCallback(NotifyCallback callback) { notify_callback = std::move(callback); }

    Assets::SprayLibrary& getLibrary() { return library; }
    EntityDirectory& getDirectory() { return directory; }
    const TransferAssembler& getAssembler() const { return assembler; }

    // Re-reads the spray directory (cl_spray_directory unless given)
    size_t reloadLibrary(const std::string& directory = {});

    // Places the selected spray. Nothing is sent when no spray is selected or
    // the file is larger than MAX_ASSET_SIZE.
    bool createLocalSpray(const glm::vec3& position, const glm::vec3& direction);

    // Bodies only; the type byte has already been consumed
    bool handleTransferBegin(ByteReader& reader, double now);
    bool handleTransferChunk(ByteReader& reader, double now);
    bool handleTransferResync(ByteReader& reader);
    bool handleSpraySpawn(ByteReader& reader);

    // New participant: nobody can rely on what it has cached
    void onMemberJoined(NetworkIdentity identity);
    void onMemberLeft(NetworkIdentity identity);
    void onSceneLoaded();

    // Expires stalled transfers and ages temporary decals
    void update(double now);

    // Splits the payload into TransferBegin + TransferChunk packets.
    // Cancelled when the token fires between chunks, Failed when the transport refuses a packet.
    static Threading::UploadStatus uploadPayload(ITransport& transport, NetworkIdentity sender, const std::vector<uint8_t>& payload,
                              const Threading::CancelToken& token);

    entt::entity spawnDecal(NetworkIdentity owner, const glm::vec3& position, const glm::vec3& direction);

    bool isUploading() const;

private:
    bool scheduleUpload(std::shared_ptr<const std::vector<uint8_t>> payload);
    void onUploadFinished(Threading::UploadStatus status);
    void requestResync(NetworkIdentity target, double now);
    void finishTransfer(NetworkIdentity sender, std::vector<uint8_t> payload);
    void notify(const std::string& message);

    entt::registry& registry;
    ITransport& transport;
    Threading::UploadWorker& worker;
    NetworkIdentity local_identity;

    Assets::SprayLibrary library;
    EntityDirectory directory;
    TransferAssembler assembler;

    std::unordered_map<NetworkIdentity, double> last_resync_request;
    bool reupload_requested = false;
    bool upload_failed = false;     // Next local spray uploads again
    double last_update = -1.0;

    NotifyCallback notify_callback;
};

} // namespace Spraynet
