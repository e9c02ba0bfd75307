module;
#include <cstdint>
#include <entt/entity/registry.hpp>

export module ECS:Components.Hierarchy;

export namespace ECS::Components::Hierarchy
{
    // Intrusive child list: each node links to its first child and its siblings.
    struct Component
    {
        entt::entity Parent = entt::null;
        entt::entity FirstChild = entt::null;
        entt::entity NextSibling = entt::null;
        entt::entity PrevSibling = entt::null;
        uint32_t ChildCount = 0;
    };

    // Re-parents 'child' under 'newParent' (detaching it first if needed).
    // Passing entt::null detaches. Attaching an entity below its own subtree is rejected.
    void Attach(entt::registry& registry, entt::entity child, entt::entity newParent);
    void Detach(entt::registry& registry, entt::entity child);

    // True if 'ancestor' appears on the parent chain of 'entity' (or is 'entity').
    [[nodiscard]] bool IsSelfOrAncestor(const entt::registry& registry, entt::entity ancestor, entt::entity entity);

    [[nodiscard]] entt::entity GetParent(const entt::registry& registry, entt::entity entity);

    // Visits the direct children of 'parent', most recently attached first.
    template <typename Fn>
    void ForEachChild(const entt::registry& registry, entt::entity parent, Fn&& fn)
    {
        const auto* node = registry.try_get<Component>(parent);
        if (!node) return;

        entt::entity child = node->FirstChild;
        while (child != entt::null)
        {
            // Fetch the sibling before the callback in case it re-parents 'child'.
            const entt::entity next = registry.get<Component>(child).NextSibling;
            fn(child);
            child = next;
        }
    }
}
