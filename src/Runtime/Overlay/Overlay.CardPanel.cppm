module;
#include <entt/signal/sigh.hpp>
#include <glm/glm.hpp>

export module Overlay:CardPanel;

// -------------------------------------------------------------------------
// Overlay::CardPanel - one animatable layer of a card
// -------------------------------------------------------------------------
// A panel animates two channels toward a shared target (0 = hidden,
// 1 = shown): the Outline (frame extent) and the Body (fill opacity).
// A Show/Hide command starts its leading channel after 'delay' and its
// trailing channel after 'delay + stagger'. Show leads with the outline,
// Hide leads with the body.
//
// AnimationProgress is the mean of both channels: exactly 0 when both are
// hidden and exactly 1 when both are shown.
//
// Redirecting (Hide during a Show, or the reverse) keeps the current
// channel values; they hold for the new delay and then move monotonically
// toward the new target.
// -------------------------------------------------------------------------

export namespace Overlay
{
    class CardPanel
    {
    public:
        static constexpr float kDefaultChannelDuration = 0.4f;

        CardPanel(float width, float height, float channelDuration = kDefaultChannelDuration);

        // Move-only: a copy would carry the connected hide-complete listeners.
        CardPanel(const CardPanel&) = delete;
        CardPanel& operator=(const CardPanel&) = delete;
        CardPanel(CardPanel&&) = default;
        CardPanel& operator=(CardPanel&&) = default;

        // Card-local offset of the panel centre.
        void SetPosition(float x, float y) { m_Offset = {x, y}; }
        [[nodiscard]] glm::vec2 GetPosition() const { return m_Offset; }
        [[nodiscard]] glm::vec2 GetSize() const { return m_Size; }

        void Show(float delaySeconds, float staggerSeconds = 0.0f);
        void Hide(float delaySeconds = 0.0f, float staggerSeconds = 0.0f);

        // Consumes pending delays first, then moves the channels.
        // Non-positive dt is ignored.
        void Advance(float dt);

        [[nodiscard]] float GetAnimationProgress() const { return 0.5f * (m_Outline.Value + m_Body.Value); }

        // True while at least one channel is past its delay and not yet at the target.
        [[nodiscard]] bool IsAnimating() const;

        // True while the last command has not fully played out (delays included).
        [[nodiscard]] bool IsPending() const;

        [[nodiscard]] bool IsTargetShown() const { return m_Target > 0.5f; }

        // Smoothstep-eased channel values for presentation.
        [[nodiscard]] float GetOutline() const;
        [[nodiscard]] float GetBody() const;

        // Published once when a Hide has brought both channels to 0.
        [[nodiscard]] entt::sink<entt::sigh<void()>> OnHideComplete() { return entt::sink{m_HideComplete}; }

    private:
        struct Channel
        {
            float Value = 0.0f;
            float Delay = 0.0f; // remaining seconds before the channel moves
        };

        void AdvanceChannel(Channel& channel, float dt) const;
        [[nodiscard]] bool IsChannelMoving(const Channel& channel) const;

        glm::vec2 m_Size;
        glm::vec2 m_Offset{0.0f};
        float m_ChannelDuration;

        Channel m_Outline;
        Channel m_Body;
        float m_Target = 0.0f;
        bool m_HideArmed = false;

        entt::sigh<void()> m_HideComplete;
    };
}
