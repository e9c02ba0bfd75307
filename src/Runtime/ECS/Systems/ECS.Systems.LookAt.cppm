module;
#include <entt/fwd.hpp>

export module ECS:Systems.LookAt;

export namespace ECS::Systems::LookAt
{
    // Re-orients every LookAt component with AlwaysUpdate set.
    void OnUpdate(entt::registry& registry);

    // Re-orients one entity now, regardless of AlwaysUpdate.
    // Returns false when the entity has no LookAt component, the target is
    // invalid, or the target sits on the entity's position.
    bool Apply(entt::registry& registry, entt::entity entity);
}
