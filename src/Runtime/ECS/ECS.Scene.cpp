module;
#include <algorithm>
#include <string>
#include <entt/entity/registry.hpp>
#include <entt/signal/dispatcher.hpp>
#include <glm/glm.hpp>

module ECS:Scene.Impl;
import :Scene;
import :Components;
import :Events;
import Core;

namespace ECS
{
    Scene::Scene()
    {
        // Create the event pools up front so a listener triggering another
        // event type never grows the pool table mid-dispatch.
        (void)m_Dispatcher.sink<Events::StateAdded>();
        (void)m_Dispatcher.sink<Events::StateRemoved>();
        (void)m_Dispatcher.sink<Events::PointerUp>();
        (void)m_Dispatcher.sink<Events::Custom>();

        m_Root = CreateEntity("Scene");
    }

    entt::entity Scene::CreateEntity(const std::string& name, entt::entity parent)
    {
        entt::entity e = m_Registry.create();
        m_Registry.emplace<Components::NameTag::Component>(e, name);
        m_Registry.emplace<Components::Transform::Component>(e);
        m_Registry.emplace<Components::Transform::WorldMatrix>(e);
        m_Registry.emplace<Components::Transform::IsDirtyTag>(e);
        m_Registry.emplace<Components::Hierarchy::Component>(e);

        if (parent != entt::null)
        {
            Components::Hierarchy::Attach(m_Registry, e, parent);
        }
        return e;
    }

    bool Scene::AddState(entt::entity entity, Core::Hash::StringID state)
    {
        if (!m_Registry.valid(entity)) return false;

        auto& states = m_Registry.get_or_emplace<Components::States::Component>(entity);
        if (states.Has(state)) return false;

        states.Active.push_back(state);
        m_Dispatcher.trigger(Events::StateAdded{entity, state});
        return true;
    }

    bool Scene::RemoveState(entt::entity entity, Core::Hash::StringID state)
    {
        if (!m_Registry.valid(entity)) return false;

        auto* states = m_Registry.try_get<Components::States::Component>(entity);
        if (!states) return false;

        auto it = std::find(states->Active.begin(), states->Active.end(), state);
        if (it == states->Active.end()) return false;

        states->Active.erase(it);
        m_Dispatcher.trigger(Events::StateRemoved{entity, state});
        return true;
    }

    bool Scene::HasState(entt::entity entity, Core::Hash::StringID state) const
    {
        if (!m_Registry.valid(entity)) return false;
        const auto* states = m_Registry.try_get<Components::States::Component>(entity);
        return states && states->Has(state);
    }

    void Scene::SetVisible(entt::entity entity, bool visible)
    {
        if (!m_Registry.valid(entity)) return;
        m_Registry.get_or_emplace<Components::Visibility::Component>(entity).Visible = visible;
    }

    bool Scene::IsVisible(entt::entity entity) const
    {
        if (!m_Registry.valid(entity)) return false;
        const auto* vis = m_Registry.try_get<Components::Visibility::Component>(entity);
        return !vis || vis->Visible;
    }

    void Scene::SetPosition(entt::entity entity, const glm::vec3& position)
    {
        if (!m_Registry.valid(entity)) return;
        m_Registry.get<Components::Transform::Component>(entity).Position = position;
        m_Registry.emplace_or_replace<Components::Transform::IsDirtyTag>(entity);
    }

    void Scene::Emit(entt::entity entity, Core::Hash::StringID name)
    {
        m_Dispatcher.trigger(Events::Custom{entity, name});
    }

    void Scene::DispatchPointerUp(entt::entity target)
    {
        entt::entity current = target;
        while (current != entt::null && m_Registry.valid(current))
        {
            m_Dispatcher.trigger(Events::PointerUp{target, current});
            current = Components::Hierarchy::GetParent(m_Registry, current);
        }
    }
}
