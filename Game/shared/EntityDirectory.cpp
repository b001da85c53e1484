#include "EntityDirectory.hpp"
#include "SharedComponents.hpp"
#include "Utils/Log.hpp"

#include <string>

namespace Spraynet {

EntityDirectory::EntityDirectory(entt::registry& reg, Assets::IImageDecoder& image_decoder)
    : registry(reg)
    , decoder(image_decoder)
{
}

CachedAsset* EntityDirectory::find(NetworkIdentity owner)
{
    auto it = assets.find(owner);
    return it != assets.end() ? &it->second : nullptr;
}

const CachedAsset* EntityDirectory::find(NetworkIdentity owner) const
{
    auto it = assets.find(owner);
    return it != assets.end() ? &it->second : nullptr;
}

CachedAsset& EntityDirectory::getOrCreate(NetworkIdentity owner)
{
    auto it = assets.find(owner);
    if (it == assets.end()) {
        CachedAsset asset;
        asset.owner = owner;
        it = assets.emplace(owner, std::move(asset)).first;
    }
    return it->second;
}

bool EntityDirectory::assign(NetworkIdentity owner, std::vector<uint8_t> bytes)
{
    // Decode and allocate everything up front; the table is only touched once nothing can fail
    Assets::DecodedImage decoded;
    std::string error;
    bool ok = decoder.decode(bytes, decoded, error);
    if (!ok) {
        LOG_NET_WARN("Asset from {0} could not be decoded ({1}), using placeholder", owner, error);
        decoded = Assets::makePlaceholderImage();
    }
    auto image = std::make_shared<const Assets::DecodedImage>(std::move(decoded));

    CachedAsset& asset = getOrCreate(owner);
    asset.bytes = std::move(bytes);
    asset.image = image;

    if (asset.active != entt::null) {
        if (registry.valid(asset.active) && registry.all_of<SprayDecal>(asset.active)) {
            registry.get<SprayDecal>(asset.active).image = image;
        } else {
            asset.active = entt::null;
        }
    }

    LOG_NET_DEBUG("Cached asset for {0}: {1} bytes, {2}x{3}", owner, asset.bytes.size(), image->width, image->height);

    if (on_asset_changed) {
        on_asset_changed(asset);
    }
    return ok;
}

void EntityDirectory::bindActive(NetworkIdentity owner, entt::entity decal)
{
    getOrCreate(owner).active = decal;
}

void EntityDirectory::clear()
{
    if (!assets.empty()) {
        LOG_NET_DEBUG("Clearing {0} cached assets", assets.size());
    }
    assets.clear();
}

bool EntityDirectory::clear(NetworkIdentity owner)
{
    return assets.erase(owner) != 0;
}

} // namespace Spraynet
