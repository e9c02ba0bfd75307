module;
#include <cstdint>
#include <string_view>
#include <entt/signal/sigh.hpp>

export module Overlay:TransitionController;

import :CardPanel;

export namespace Overlay
{
    enum class TransitionState : uint8_t
    {
        Hidden = 0,
        Showing,
        Shown,
        Hiding
    };

    constexpr std::string_view TransitionStateToString(TransitionState state)
    {
        switch (state)
        {
            case TransitionState::Hidden:  return "Hidden";
            case TransitionState::Showing: return "Showing";
            case TransitionState::Shown:   return "Shown";
            case TransitionState::Hiding:  return "Hiding";
        }
        return "Unknown";
    }

    // Sequences the header and background panels of a card.
    // The state is never stored; GetState() derives it from the panels.
    // Sole owner of both panels: nothing else may drive their animation.
    class TransitionController
    {
    public:
        TransitionController(CardPanel header, CardPanel background);

        // Holds its own address in the panels' hide-complete signal.
        TransitionController(const TransitionController&) = delete;
        TransitionController& operator=(const TransitionController&) = delete;
        TransitionController(TransitionController&&) = delete;
        TransitionController& operator=(TransitionController&&) = delete;

        // Header first, background after. No-op (returns false) while Showing or Shown.
        bool PlayIn();

        // Background first, header after. No-op (returns false) while Hidden or Hiding.
        bool PlayOut();

        void Advance(float dt);

        [[nodiscard]] TransitionState GetState() const;

        [[nodiscard]] const CardPanel& GetHeader() const { return m_Header; }
        [[nodiscard]] const CardPanel& GetBackground() const { return m_Background; }

        // Published once per completed hide sequence, when the header reaches 0.
        [[nodiscard]] entt::sink<entt::sigh<void()>> OnFullyHidden() { return entt::sink{m_FullyHidden}; }

    private:
        void HandleHeaderHideComplete();

        CardPanel m_Header;
        CardPanel m_Background;
        entt::sigh<void()> m_FullyHidden;
    };
}
