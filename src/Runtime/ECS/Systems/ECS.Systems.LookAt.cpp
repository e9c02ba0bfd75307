module;
#include <cmath>
#include <entt/entity/registry.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/quaternion.hpp>

module ECS:Systems.LookAt.Impl;
import :Systems.LookAt;
import :Systems.Transform;
import :Components.LookAt;
import :Components.Transform;
import :Components.Hierarchy;

namespace ECS::Systems::LookAt::Detail
{
    constexpr float kMinDistanceSq = 1e-8f;

    // Rotation part of a world matrix with scale removed.
    glm::quat ExtractRotation(const glm::mat4& m)
    {
        glm::mat3 basis(m);
        basis[0] = glm::normalize(basis[0]);
        basis[1] = glm::normalize(basis[1]);
        basis[2] = glm::normalize(basis[2]);
        return glm::normalize(glm::quat_cast(basis));
    }
}

namespace ECS::Systems::LookAt
{
    bool Apply(entt::registry& registry, entt::entity entity)
    {
        auto* lookAt = registry.try_get<Components::LookAt::Component>(entity);
        auto* transform = registry.try_get<Components::Transform::Component>(entity);
        if (!lookAt || !transform) return false;
        if (lookAt->Target == entt::null || !registry.valid(lookAt->Target)) return false;

        const glm::vec3 from = Transform::ComputeWorldPosition(registry, entity);
        const glm::vec3 to = Transform::ComputeWorldPosition(registry, lookAt->Target);

        glm::vec3 dir = to - from;
        if (lookAt->Axis == Components::LookAt::Axes::Y) dir.y = 0.0f;
        if (glm::dot(dir, dir) < Detail::kMinDistanceSq) return false;
        dir = glm::normalize(dir);

        // Forward is -Z (same convention as the camera); pick another up
        // vector when looking straight up or down.
        glm::vec3 up{0.0f, 1.0f, 0.0f};
        if (std::abs(glm::dot(dir, up)) > 0.999f) up = {0.0f, 0.0f, 1.0f};

        glm::quat world = glm::quatLookAt(dir, up) * glm::quat(lookAt->Offset);

        // Express in the parent's space.
        const entt::entity parent = Components::Hierarchy::GetParent(registry, entity);
        if (parent != entt::null)
        {
            const glm::quat parentRotation = Detail::ExtractRotation(Transform::ComputeWorldMatrix(registry, parent));
            world = glm::inverse(parentRotation) * world;
        }

        transform->Rotation = glm::normalize(world);
        registry.emplace_or_replace<Components::Transform::IsDirtyTag>(entity);
        return true;
    }

    void OnUpdate(entt::registry& registry)
    {
        auto view = registry.view<Components::LookAt::Component>();
        for (auto [entity, lookAt] : view.each())
        {
            if (lookAt.AlwaysUpdate)
            {
                Apply(registry, entity);
            }
        }
    }
}
