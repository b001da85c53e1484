#include "SprayManager.hpp"
#include "NetworkSerializer.hpp"
#include "SharedComponents.hpp"
#include "Console/ConVar.hpp"
#include "Utils/Log.hpp"

#include <algorithm>

EXTERN_CONVAR(net_transfer_timeout);
EXTERN_CONVAR(cl_disable_sprays);
EXTERN_CONVAR(cl_spray_directory);
EXTERN_CONVAR(cl_spray_replace_lifetime);

namespace Spraynet {

SprayManager::SprayManager(entt::registry& reg, ITransport& net, Threading::UploadWorker& upload_worker,
                           Assets::IImageDecoder& decoder, NetworkIdentity identity)
    : registry(reg)
    , transport(net)
    , worker(upload_worker)
    , local_identity(identity)
    , directory(reg, decoder)
    , assembler(MAX_ASSET_SIZE, g_cvar_net_transfer_timeout.getFloat())
{
}

void SprayManager::notify(const std::string& message)
{
    LOG_APP_INFO("{0}", message);
    if (notify_callback) {
        notify_callback(message);
    }
}

size_t SprayManager::reloadLibrary(const std::string& path)
{
    const std::string dir = path.empty() ? g_cvar_cl_spray_directory.getString() : path;
    return library.loadFromDirectory(dir);
}

bool SprayManager::createLocalSpray(const glm::vec3& position, const glm::vec3& direction)
{
    const Assets::SprayFile* current = library.getCurrent();
    if (!current || !current->data) {
        notify("No spray selected. Pick one from the spray list first.");
        return false;
    }

    if (current->size() > MAX_ASSET_SIZE) {
        notify(fmt::format("Spray '{0}' is too large ({1} KiB, limit is {2} KiB)",
            current->getShortName(), current->size() / 1024, MAX_ASSET_SIZE / 1024));
        return false;
    }

    SpraySpawnMessage msg;
    msg.sender = local_identity;
    msg.position = position;
    msg.direction = direction;
    bool sent = transport.broadcast(PacketType::SPRAY_SPAWN, SPRAY_SPAWN_SIZE, [&](ByteWriter& writer) {
        NetworkSerializer::serialize(writer, msg);
    });
    if (!sent) {
        LOG_NET_WARN("Spray spawn could not be broadcast, placing it locally only");
    }

    // The image goes out once per membership; after that everyone has it cached
    if (directory.find(local_identity) == nullptr || upload_failed) {
        if (scheduleUpload(current->data)) {
            upload_failed = false;
        } else {
            reupload_requested = true;
        }
        if (!directory.assign(local_identity, *current->data)) {
            notify(fmt::format("Spray '{0}' could not be decoded and shows as a placeholder", current->getShortName()));
        }
    } else {
        LOG_APP_DEBUG("Spray already cached by the session, not uploading");
    }

    spawnDecal(local_identity, position, direction);
    return true;
}

entt::entity SprayManager::spawnDecal(NetworkIdentity owner, const glm::vec3& position, const glm::vec3& direction)
{
    CachedAsset& asset = directory.getOrCreate(owner);

    // Only one spray per participant stays for good
    if (asset.active != entt::null && registry.valid(asset.active)) {
        if (SprayDecal* previous = registry.try_get<SprayDecal>(asset.active)) {
            previous->lifetime = g_cvar_cl_spray_replace_lifetime.getFloat();
        }
    }
    asset.active = entt::null;

    if (owner != local_identity && g_cvar_cl_disable_sprays.getBool()) {
        LOG_APP_DEBUG("Sprays are disabled, not showing spray of {0}", owner);
        return entt::null;
    }

    entt::entity decal = registry.create();
    SprayDecal& component = registry.emplace<SprayDecal>(decal);
    component.owner = owner;
    component.position = position;
    component.direction = direction;
    component.image = asset.image;

    directory.bindActive(owner, decal);
    return decal;
}

bool SprayManager::scheduleUpload(std::shared_ptr<const std::vector<uint8_t>> payload)
{
    if (!payload) {
        return false;
    }

    const NetworkIdentity sender = local_identity;
    ITransport& net = transport;
    return worker.submit(sender, "spray upload",
        [&net, sender, payload](const Threading::CancelToken& token) {
            return uploadPayload(net, sender, *payload, token);
        },
        [this](uint64_t, Threading::UploadStatus status) {
            onUploadFinished(status);
        });
}

void SprayManager::onUploadFinished(Threading::UploadStatus status)
{
    if (status == Threading::UploadStatus::Failed) {
        upload_failed = true;
        notify("Spray upload failed, it will be sent again with your next spray");
    } else if (status == Threading::UploadStatus::Cancelled) {
        LOG_NET_DEBUG("Spray upload cancelled");
    } else {
        upload_failed = false;
    }

    if (!reupload_requested) {
        return;
    }
    reupload_requested = false;

    const CachedAsset* own = directory.find(local_identity);
    if (own && !own->bytes.empty()) {
        LOG_NET_DEBUG("Restarting spray upload");
        if (!scheduleUpload(std::make_shared<const std::vector<uint8_t>>(own->bytes))) {
            reupload_requested = true;
        }
    }
}

bool SprayManager::isUploading() const
{
    return worker.isBusy(local_identity);
}

Threading::UploadStatus SprayManager::uploadPayload(ITransport& net, NetworkIdentity sender,
                                                    const std::vector<uint8_t>& payload,
                                                    const Threading::CancelToken& token)
{
    TransferBeginMessage begin;
    begin.sender = sender;
    begin.total_length = static_cast<uint32_t>(payload.size());
    bool ok = net.broadcast(PacketType::TRANSFER_BEGIN, TRANSFER_BEGIN_SIZE, [&](ByteWriter& writer) {
        NetworkSerializer::serialize(writer, begin);
    });
    if (!ok) {
        LOG_NET_ERROR("Could not start upload of {0} bytes", payload.size());
        return Threading::UploadStatus::Failed;
    }

    for (size_t offset = 0; offset < payload.size(); offset += TRANSFER_CHUNK_PAYLOAD) {
        if (token.isCancelled()) {
            LOG_NET_DEBUG("Upload stopped at {0}/{1} bytes", offset, payload.size());
            return Threading::UploadStatus::Cancelled;
        }

        TransferChunkMessage chunk;
        chunk.sender = sender;
        chunk.data = payload.data() + offset;
        chunk.size = std::min(TRANSFER_CHUNK_PAYLOAD, payload.size() - offset);

        ok = net.broadcast(PacketType::TRANSFER_CHUNK, IDENTITY_SIZE + chunk.size, [&](ByteWriter& writer) {
            NetworkSerializer::serialize(writer, chunk);
        });
        if (!ok) {
            LOG_NET_ERROR("Upload failed at {0}/{1} bytes", offset, payload.size());
            return Threading::UploadStatus::Failed;
        }
    }

    LOG_NET_DEBUG("Uploaded {0} bytes", payload.size());
    return Threading::UploadStatus::Completed;
}

void SprayManager::requestResync(NetworkIdentity target, double now)
{
    const double window = g_cvar_net_transfer_timeout.getFloat();
    auto it = last_resync_request.find(target);
    if (it != last_resync_request.end() && now - it->second < window) {
        return;
    }
    last_resync_request[target] = now;

    TransferResyncMessage msg;
    msg.requester = local_identity;
    msg.target = target;
    bool sent = transport.broadcast(PacketType::TRANSFER_RESYNC, TRANSFER_RESYNC_SIZE, [&](ByteWriter& writer) {
        NetworkSerializer::serialize(writer, msg);
    });
    if (sent) {
        LOG_NET_INFO("Asked {0} to restart its transfer", target);
    }
}

void SprayManager::finishTransfer(NetworkIdentity sender, std::vector<uint8_t> payload)
{
    last_resync_request.erase(sender);
    if (!directory.assign(sender, std::move(payload))) {
        LOG_NET_DEBUG("Spray from {0} kept as placeholder", sender);
    }
}

bool SprayManager::handleTransferBegin(ByteReader& reader, double now)
{
    if (PACKET_TYPE_SIZE + reader.remaining() != TRANSFER_BEGIN_PACKET_SIZE) {
        LOG_NET_ERROR("Transfer begin has {0} bytes, expected {1}", PACKET_TYPE_SIZE + reader.remaining(), TRANSFER_BEGIN_PACKET_SIZE);
        return false;
    }

    TransferBeginMessage msg;
    if (!NetworkSerializer::deserialize(reader, msg)) {
        return false;
    }
    if (msg.sender == local_identity || msg.sender == INVALID_IDENTITY) {
        return false;
    }

    assembler.setTimeout(g_cvar_net_transfer_timeout.getFloat());

    std::vector<uint8_t> completed;
    TransferStatus status = assembler.begin(msg.sender, msg.total_length, now, completed);
    if (status == TransferStatus::Completed) {
        finishTransfer(msg.sender, std::move(completed));
        return true;
    }
    return status == TransferStatus::Started;
}

bool SprayManager::handleTransferChunk(ByteReader& reader, double now)
{
    TransferChunkMessage msg;
    if (!NetworkSerializer::deserialize(reader, msg)) {
        LOG_NET_WARN("Truncated transfer chunk ({0} bytes)", reader.getSize());
        return false;
    }
    if (msg.sender == local_identity || msg.sender == INVALID_IDENTITY) {
        return false;
    }

    std::vector<uint8_t> completed;
    TransferStatus status = assembler.append(msg.sender, msg.data, msg.size, completed);
    switch (status) {
        case TransferStatus::Appended:
            return true;
        case TransferStatus::Completed:
            finishTransfer(msg.sender, std::move(completed));
            return true;
        case TransferStatus::InitialPacketLost:
        case TransferStatus::Malformed:
            requestResync(msg.sender, now);
            return false;
        default:
            return false;
    }
}

bool SprayManager::handleTransferResync(ByteReader& reader)
{
    TransferResyncMessage msg;
    if (!NetworkSerializer::deserialize(reader, msg)) {
        LOG_NET_WARN("Malformed resync request ({0} bytes)", reader.getSize());
        return false;
    }
    if (msg.target != local_identity) {
        return false;
    }

    const CachedAsset* own = directory.find(local_identity);
    if (!own || own->bytes.empty()) {
        LOG_NET_DEBUG("Resync requested by {0} but nothing was uploaded", msg.requester);
        return false;
    }

    LOG_NET_INFO("{0} lost our transfer, uploading again", msg.requester);
    if (worker.isBusy(local_identity) || !scheduleUpload(std::make_shared<const std::vector<uint8_t>>(own->bytes))) {
        reupload_requested = true;
    }
    return true;
}

bool SprayManager::handleSpraySpawn(ByteReader& reader)
{
    SpraySpawnMessage msg;
    if (!NetworkSerializer::deserialize(reader, msg)) {
        LOG_NET_WARN("Malformed spray spawn ({0} bytes)", reader.getSize());
        return false;
    }
    if (msg.sender == local_identity || msg.sender == INVALID_IDENTITY) {
        return false;
    }

    spawnDecal(msg.sender, msg.position, msg.direction);
    return true;
}

void SprayManager::onMemberJoined(NetworkIdentity identity)
{
    LOG_NET_DEBUG("Member {0} joined, dropping cached sprays", identity);
    directory.clear();
}

void SprayManager::onMemberLeft(NetworkIdentity identity)
{
    LOG_NET_DEBUG("Member {0} left, dropping its spray", identity);
    assembler.cancel(identity);
    directory.clear(identity);
    last_resync_request.erase(identity);
}

void SprayManager::onSceneLoaded()
{
    directory.clear();

    auto view = registry.view<SprayDecal>();
    std::vector<entt::entity> decals(view.begin(), view.end());
    for (auto entity : decals) {
        registry.destroy(entity);
    }
}

void SprayManager::update(double now)
{
    assembler.setTimeout(g_cvar_net_transfer_timeout.getFloat());
    for (NetworkIdentity sender : assembler.expire(now)) {
        requestResync(sender, now);
    }

    const float dt = last_update < 0.0 ? 0.0f : static_cast<float>(now - last_update);
    last_update = now;

    std::vector<entt::entity> expired;
    auto view = registry.view<SprayDecal>();
    for (auto entity : view) {
        SprayDecal& decal = view.get<SprayDecal>(entity);
        if (decal.isPermanent()) {
            continue;
        }
        decal.lifetime -= dt;
        if (decal.lifetime <= 0.0f) {
            expired.push_back(entity);
        }
    }
    for (auto entity : expired) {
        registry.destroy(entity);
    }
}

} // namespace Spraynet
