module;
#include <utility>
#include <entt/signal/sigh.hpp>

module Overlay:TransitionController.Impl;
import :TransitionController;
import :CardPanel;
import :Config;
import Core;

namespace Overlay
{
    TransitionController::TransitionController(CardPanel header, CardPanel background)
        : m_Header(std::move(header))
        , m_Background(std::move(background))
    {
        m_Header.OnHideComplete().connect<&TransitionController::HandleHeaderHideComplete>(*this);
    }

    bool TransitionController::PlayIn()
    {
        const TransitionState state = GetState();
        if (state == TransitionState::Showing || state == TransitionState::Shown)
        {
            Core::Log::Debug("TransitionController: PlayIn ignored while {}.", TransitionStateToString(state));
            return false;
        }

        m_Header.Show(Timing::RevealHeader.Delay, Timing::RevealHeader.Stagger);
        m_Background.Show(Timing::RevealBackground.Delay, Timing::RevealBackground.Stagger);
        return true;
    }

    bool TransitionController::PlayOut()
    {
        const TransitionState state = GetState();
        if (state == TransitionState::Hidden || state == TransitionState::Hiding)
        {
            Core::Log::Debug("TransitionController: PlayOut ignored while {}.", TransitionStateToString(state));
            return false;
        }

        m_Background.Hide(Timing::DismissBackground.Delay, Timing::DismissBackground.Stagger);
        m_Header.Hide(Timing::DismissHeader.Delay, Timing::DismissHeader.Stagger);
        return true;
    }

    void TransitionController::Advance(float dt)
    {
        m_Background.Advance(dt);
        m_Header.Advance(dt);
    }

    TransitionState TransitionController::GetState() const
    {
        const float header = m_Header.GetAnimationProgress();
        const float background = m_Background.GetAnimationProgress();

        if (m_Header.IsTargetShown() || m_Background.IsTargetShown())
        {
            return (header >= 1.0f && background >= 1.0f) ? TransitionState::Shown : TransitionState::Showing;
        }
        return (header <= 0.0f && background <= 0.0f) ? TransitionState::Hidden : TransitionState::Hiding;
    }

    void TransitionController::HandleHeaderHideComplete()
    {
        m_FullyHidden.publish();
    }
}
