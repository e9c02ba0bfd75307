module;
#include <cstdint>
#include <string>
#include <glm/glm.hpp>

export module ECS:Components.TextLabel;

export namespace ECS::Components::TextLabel
{
    // Text block handed to the host text renderer. Layout and shaping happen there.
    struct Component
    {
        std::string Value;
        std::string Font;
        glm::vec4 Color{1.0f};
        float LetterSpacing = 0.0f;
        float Width = 1.0f;
        uint32_t WrapCount = 40;
    };
}
