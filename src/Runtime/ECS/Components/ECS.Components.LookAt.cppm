module;
#include <cstdint>
#include <entt/entity/entity.hpp>
#include <glm/glm.hpp>

export module ECS:Components.LookAt;

export namespace ECS::Components::LookAt
{
    enum class Axes : uint8_t
    {
        Y = 0,   // Yaw only, the entity stays upright
        XYZ = 1  // Full orientation toward the target
    };

    // Orients the owning entity toward Target.
    // With AlwaysUpdate == false the orientation is only recomputed on
    // explicit Systems::LookAt::Apply calls (e.g. when a card is revealed).
    struct Component
    {
        entt::entity Target = entt::null;
        Axes Axis = Axes::XYZ;
        bool AlwaysUpdate = false;
        glm::vec3 Offset{0.0f}; // Euler offset (radians) applied after facing the target
    };
}
