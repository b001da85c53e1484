#pragma once

#include "NetworkTypes.hpp"
#include "Assets/ImageDecoder.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace Spraynet {

struct TransformComponent
{
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 rotation = glm::vec3(0.0f);   // Euler degrees

    TransformComponent() = default;
    TransformComponent(const glm::vec3& pos, const glm::vec3& rot) : position(pos), rotation(rot) {}
};

struct TagComponent
{
    std::string name;
};

// Marks a registry entity as replicated
struct NetworkedEntity
{
    EntityId entity_id = INVALID_ENTITY_ID;
    NetworkIdentity creator = INVALID_IDENTITY;

    NetworkedEntity() = default;
    NetworkedEntity(EntityId id, NetworkIdentity created_by) : entity_id(id), creator(created_by) {}
};

// A spray placed in the world. The image is shared with the owner's cached
// asset and replaced in place when a newer transfer from that owner completes.
struct SprayDecal
{
    NetworkIdentity owner = INVALID_IDENTITY;
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 direction = glm::vec3(0.0f);
    float lifetime = -1.0f;   // Seconds left, < 0 = until replaced or cleared
    std::shared_ptr<const Assets::DecodedImage> image;

    bool isPermanent() const { return lifetime < 0.0f; }
    bool hasImage() const { return image && image->isValid(); }
};

} // namespace Spraynet
