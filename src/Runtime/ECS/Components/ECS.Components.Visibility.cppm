export module ECS:Components.Visibility;

export namespace ECS::Components::Visibility
{
    // Whether the entity (and its subtree) is drawn. Entities without the
    // component are treated as visible.
    struct Component
    {
        bool Visible = true;
    };
}
