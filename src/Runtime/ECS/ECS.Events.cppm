module;
#include <entt/entity/entity.hpp>

export module ECS:Events;

import Core;

// -------------------------------------------------------------------------
// Scene events, delivered synchronously through Scene::GetDispatcher().
// Listeners connect with dispatcher.sink<Event>().connect<&Fn>(instance)
// and must filter on the entity they care about.
// -------------------------------------------------------------------------
export namespace ECS::Events
{
    struct StateAdded
    {
        entt::entity Entity = entt::null;
        Core::Hash::StringID State;
    };

    struct StateRemoved
    {
        entt::entity Entity = entt::null;
        Core::Hash::StringID State;
    };

    // Pointer released over 'Target'. Bubbles: one event per entity on the
    // parent chain, with 'Current' set to the entity being notified.
    struct PointerUp
    {
        entt::entity Target = entt::null;
        entt::entity Current = entt::null;
    };

    // Named event raised by a component on its entity (e.g. "hide-complete").
    struct Custom
    {
        entt::entity Entity = entt::null;
        Core::Hash::StringID Name;
    };
}
