module;
#include <glm/glm.hpp>

export module Overlay:Components;

export namespace Overlay::Components
{
    // Presentation values of one card panel, refreshed every tick for the renderer.
    struct PanelVisual
    {
        glm::vec2 Size{1.0f};
        float Outline = 0.0f; // eased frame extent, 0..1
        float Body = 0.0f;    // eased fill opacity, 0..1
        float Progress = 0.0f;
    };

    // Marks an entity as a click target for the host's pointer raycaster.
    struct HitRegion
    {
        float Expansion = 1.0f;
        float CursorScale = 1.0f;
        int EventPriority = 0;
    };
}
