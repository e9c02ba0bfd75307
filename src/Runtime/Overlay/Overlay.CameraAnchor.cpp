module;
#include <optional>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module Overlay:CameraAnchor.Impl;
import :CameraAnchor;
import :Config;
import ECS;
import Core;

namespace Overlay
{
    CameraAnchor::CameraAnchor(ECS::Scene& scene, entt::entity anchorNode, PlatformProfile profile)
        : m_Scene(scene)
        , m_Node(anchorNode)
        , m_Profile(profile)
    {
    }

    bool CameraAnchor::IsAvailable() const
    {
        const auto& registry = m_Scene.GetRegistry();
        return m_Node != entt::null
            && registry.valid(m_Node)
            && registry.all_of<ECS::Components::Transform::Component>(m_Node);
    }

    entt::entity CameraAnchor::GetViewer() const
    {
        if (!IsAvailable()) return entt::null;
        const entt::entity parent = ECS::Components::Hierarchy::GetParent(m_Scene.GetRegistry(), m_Node);
        return parent != entt::null ? parent : m_Node;
    }

    std::optional<AnchorSample> CameraAnchor::Sample()
    {
        if (!IsAvailable()) return std::nullopt;

        const float depth = m_Profile.GetDepthOffset();
        m_Scene.SetPosition(m_Node, {0.0f, 0.0f, depth});

        AnchorSample sample;
        sample.Position = ECS::Systems::Transform::ComputeWorldPosition(m_Scene.GetRegistry(), m_Node);
        sample.DepthOffset = depth;

        Core::Log::Debug("CameraAnchor: sampled ({:.3f}, {:.3f}, {:.3f}) on {}.",
                         sample.Position.x, sample.Position.y, sample.Position.z,
                         PlatformClassToString(m_Profile.Class));
        return sample;
    }
}
