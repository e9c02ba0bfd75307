module;
#include <algorithm>
#include <vector>

export module ECS:Components.States;

import Core;

export namespace ECS::Components::States
{
    // Set of named states currently held by an entity ("visible", "modal", ...).
    // Mutate through Scene::AddState / Scene::RemoveState so listeners are notified.
    struct Component
    {
        std::vector<Core::Hash::StringID> Active;

        [[nodiscard]] bool Has(Core::Hash::StringID state) const
        {
            return std::find(Active.begin(), Active.end(), state) != Active.end();
        }
    };
}
