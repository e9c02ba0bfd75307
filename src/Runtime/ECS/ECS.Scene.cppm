module;
#include <cstddef>
#include <string>
#include <entt/entity/registry.hpp>
#include <entt/signal/dispatcher.hpp>
#include <glm/glm.hpp>

export module ECS:Scene;

import Core;

export namespace ECS
{
    // Owns the entity registry and the event dispatcher for one scene.
    // A root entity ("Scene") is created up front and carries scene-wide
    // states such as "modal".
    class Scene
    {
    public:
        Scene();
        ~Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        // Creates an entity with NameTag, Transform, WorldMatrix and Hierarchy.
        // If 'parent' is valid the new entity is attached below it.
        entt::entity CreateEntity(const std::string& name, entt::entity parent = entt::null);

        [[nodiscard]] entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }
        [[nodiscard]] entt::dispatcher& GetDispatcher() { return m_Dispatcher; }

        [[nodiscard]] entt::entity GetRoot() const { return m_Root; }

        [[nodiscard]] size_t Size() const { return m_Registry.storage<entt::entity>()->size(); }

        // --- Named states ---
        // Add/Remove return false (and emit nothing) when the state was already
        // present/absent. Listeners run before the call returns.
        bool AddState(entt::entity entity, Core::Hash::StringID state);
        bool RemoveState(entt::entity entity, Core::Hash::StringID state);
        [[nodiscard]] bool HasState(entt::entity entity, Core::Hash::StringID state) const;

        // --- Visibility ---
        void SetVisible(entt::entity entity, bool visible);
        [[nodiscard]] bool IsVisible(entt::entity entity) const;

        // --- Transform ---
        // Sets the local position and marks the transform dirty.
        void SetPosition(entt::entity entity, const glm::vec3& position);

        // --- Events ---
        void Emit(entt::entity entity, Core::Hash::StringID name);

        // Delivers a pointer-up to 'target' and then to each ancestor.
        void DispatchPointerUp(entt::entity target);

    private:
        entt::registry m_Registry;
        entt::dispatcher m_Dispatcher;
        entt::entity m_Root = entt::null;
    };
}
