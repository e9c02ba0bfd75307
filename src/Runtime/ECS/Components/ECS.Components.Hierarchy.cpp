module;

#include <entt/entity/registry.hpp>

module ECS:Components.Hierarchy.Impl;
import :Components.Hierarchy;
import Core;

namespace ECS::Components::Hierarchy::Detail
{
    void Link(entt::registry& registry, entt::entity child, Component& childNode,
              entt::entity parent, Component& parentNode)
    {
        childNode.Parent = parent;

        // New children go to the head of the parent's list.
        childNode.NextSibling = parentNode.FirstChild;
        childNode.PrevSibling = entt::null;

        if (parentNode.FirstChild != entt::null)
        {
            registry.get<Component>(parentNode.FirstChild).PrevSibling = child;
        }

        parentNode.FirstChild = child;
        parentNode.ChildCount++;
    }

    void Unlink(entt::registry& registry, Component& childNode)
    {
        auto& parentNode = registry.get<Component>(childNode.Parent);

        if (childNode.PrevSibling != entt::null)
            registry.get<Component>(childNode.PrevSibling).NextSibling = childNode.NextSibling;
        else
            parentNode.FirstChild = childNode.NextSibling;

        if (childNode.NextSibling != entt::null)
            registry.get<Component>(childNode.NextSibling).PrevSibling = childNode.PrevSibling;

        parentNode.ChildCount--;

        childNode.Parent = entt::null;
        childNode.NextSibling = entt::null;
        childNode.PrevSibling = entt::null;
    }
}

namespace ECS::Components::Hierarchy
{
    void Attach(entt::registry& registry, entt::entity child, entt::entity newParent)
    {
        if (!registry.valid(child) || child == newParent) return;

        if (newParent == entt::null)
        {
            Detach(registry, child);
            return;
        }

        if (!registry.valid(newParent))
        {
            Core::Log::Warn("Hierarchy: attach to an invalid parent ignored.");
            return;
        }

        // Parenting A under one of A's descendants would close a cycle.
        if (IsSelfOrAncestor(registry, child, newParent))
        {
            Core::Log::Error("Hierarchy: cannot attach an entity below its own subtree.");
            return;
        }

        auto& childNode = registry.get_or_emplace<Component>(child);
        if (childNode.Parent == newParent) return;
        if (childNode.Parent != entt::null)
        {
            Detail::Unlink(registry, childNode);
        }

        auto& parentNode = registry.get_or_emplace<Component>(newParent);
        // get_or_emplace on the parent may relocate storage; re-fetch the child node.
        Detail::Link(registry, child, registry.get<Component>(child), newParent, parentNode);
    }

    void Detach(entt::registry& registry, entt::entity child)
    {
        if (!registry.valid(child)) return;

        auto* childNode = registry.try_get<Component>(child);
        if (childNode && childNode->Parent != entt::null)
        {
            Detail::Unlink(registry, *childNode);
        }
    }

    bool IsSelfOrAncestor(const entt::registry& registry, entt::entity ancestor, entt::entity entity)
    {
        entt::entity current = entity;
        while (current != entt::null && registry.valid(current))
        {
            if (current == ancestor) return true;

            const auto* node = registry.try_get<Component>(current);
            if (!node) break;
            current = node->Parent;
        }
        return false;
    }

    entt::entity GetParent(const entt::registry& registry, entt::entity entity)
    {
        if (!registry.valid(entity)) return entt::null;
        const auto* node = registry.try_get<Component>(entity);
        return node ? node->Parent : entt::null;
    }
}
