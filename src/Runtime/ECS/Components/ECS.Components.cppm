export module ECS:Components;
export import :Components.Hierarchy;
export import :Components.LookAt;
export import :Components.NameTag;
export import :Components.States;
export import :Components.TextLabel;
export import :Components.Transform;
export import :Components.Visibility;
