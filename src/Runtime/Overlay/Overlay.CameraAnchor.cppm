module;
#include <optional>
#include <entt/entity/entity.hpp>
#include <glm/glm.hpp>

export module Overlay:CameraAnchor;

import :Config;
import ECS;

export namespace Overlay
{
    struct AnchorSample
    {
        glm::vec3 Position{0.0f};
        float DepthOffset = 0.0f;
    };

    // Viewer-relative placement for overlays. The anchor node is a child of
    // the viewer (camera) entity; sampling pushes it to the platform depth
    // offset along the viewer's local -z and reads its world position.
    class CameraAnchor
    {
    public:
        CameraAnchor(ECS::Scene& scene, entt::entity anchorNode, PlatformProfile profile = {});

        // nullopt when the anchor node does not exist (anymore).
        [[nodiscard]] std::optional<AnchorSample> Sample();

        [[nodiscard]] bool IsAvailable() const;

        [[nodiscard]] entt::entity GetNode() const { return m_Node; }

        // The entity the anchor hangs from; the node itself if it has no parent.
        [[nodiscard]] entt::entity GetViewer() const;

        [[nodiscard]] const PlatformProfile& GetProfile() const { return m_Profile; }

    private:
        ECS::Scene& m_Scene;
        entt::entity m_Node;
        PlatformProfile m_Profile;
    };
}
