module;
#include <entt/fwd.hpp>
#include <glm/glm.hpp>

export module ECS:Systems.Transform;

export namespace ECS::Systems::Transform
{
    // Propagates dirty local transforms down the hierarchy into WorldMatrix.
    void OnUpdate(entt::registry& registry);

    // Computes the world matrix by walking the parent chain, independent of
    // the cached WorldMatrix. Used where a value must be current before the
    // next OnUpdate (anchor sampling, immediate look-at).
    [[nodiscard]] glm::mat4 ComputeWorldMatrix(const entt::registry& registry, entt::entity entity);

    [[nodiscard]] glm::vec3 ComputeWorldPosition(const entt::registry& registry, entt::entity entity);
}
