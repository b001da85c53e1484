#pragma once

#include "NetworkTypes.hpp"
#include "Assets/ImageDecoder.hpp"
#include <entt/entt.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace Spraynet {

// Side state kept per participant: the last payload it sent us and the
// image decoded from it
struct CachedAsset
{
    NetworkIdentity owner = INVALID_IDENTITY;
    std::vector<uint8_t> bytes;
    std::shared_ptr<const Assets::DecodedImage> image;
    entt::entity active = entt::null;   // Live decal showing this asset

    bool hasImage() const { return image != nullptr; }
};

// NetworkIdentity -> CachedAsset, at most one entry per identity.
// Returned pointers and references are invalidated by clear(); do not keep
// them across packet handling or session events.
class EntityDirectory
{
public:
    using AssetCallback = std::function<void(const CachedAsset&)>;

    EntityDirectory(entt::registry& registry, Assets::IImageDecoder& decoder);

    CachedAsset* find(NetworkIdentity owner);
    const CachedAsset* find(NetworkIdentity owner) const;
    CachedAsset& getOrCreate(NetworkIdentity owner);

    // Decodes the payload and stores it for 'owner'. Undecodable bytes are kept
    // with a placeholder image and false is returned. The live decal, if any,
    // switches to the new image immediately.
    bool assign(NetworkIdentity owner, std::vector<uint8_t> bytes);

    void bindActive(NetworkIdentity owner, entt::entity decal);

    // Membership reset
    void clear();
    // Departure
    bool clear(NetworkIdentity owner);

    size_t size() const { return assets.size(); }

    // Fired after assign() commits
    void setOnAssetChanged(AssetCallback callback) { on_asset_changed = std::move(callback); }

private:
    entt::registry& registry;
    Assets::IImageDecoder& decoder;
    std::unordered_map<NetworkIdentity, CachedAsset> assets;
    AssetCallback on_asset_changed;
};

} // namespace Spraynet
