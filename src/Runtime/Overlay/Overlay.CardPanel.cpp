module;
#include <algorithm>
#include <entt/signal/sigh.hpp>
#include <glm/glm.hpp>

module Overlay:CardPanel.Impl;
import :CardPanel;

namespace Overlay
{
    namespace
    {
        float Smoothstep(float t)
        {
            return t * t * (3.0f - 2.0f * t);
        }
    }

    CardPanel::CardPanel(float width, float height, float channelDuration)
        : m_Size(width, height)
        , m_ChannelDuration(channelDuration > 0.0f ? channelDuration : kDefaultChannelDuration)
    {
    }

    void CardPanel::Show(float delaySeconds, float staggerSeconds)
    {
        const float delay = std::max(0.0f, delaySeconds);
        m_Target = 1.0f;
        m_Outline.Delay = delay;
        m_Body.Delay = delay + std::max(0.0f, staggerSeconds);
        m_HideArmed = false;
    }

    void CardPanel::Hide(float delaySeconds, float staggerSeconds)
    {
        const float delay = std::max(0.0f, delaySeconds);
        m_Target = 0.0f;
        m_Body.Delay = delay;
        m_Outline.Delay = delay + std::max(0.0f, staggerSeconds);
        m_HideArmed = true;
    }

    void CardPanel::Advance(float dt)
    {
        if (dt <= 0.0f) return;

        AdvanceChannel(m_Outline, dt);
        AdvanceChannel(m_Body, dt);

        if (m_HideArmed && !IsPending())
        {
            m_HideArmed = false;
            m_HideComplete.publish();
        }
    }

    void CardPanel::AdvanceChannel(Channel& channel, float dt) const
    {
        float remaining = dt;
        if (channel.Delay > 0.0f)
        {
            const float consumed = std::min(channel.Delay, remaining);
            channel.Delay -= consumed;
            remaining -= consumed;
        }
        if (remaining <= 0.0f) return;

        const float step = remaining / m_ChannelDuration;
        if (m_Target > channel.Value)
            channel.Value = std::min(m_Target, channel.Value + step);
        else
            channel.Value = std::max(m_Target, channel.Value - step);
    }

    bool CardPanel::IsChannelMoving(const Channel& channel) const
    {
        return channel.Delay <= 0.0f && channel.Value != m_Target;
    }

    bool CardPanel::IsAnimating() const
    {
        return IsChannelMoving(m_Outline) || IsChannelMoving(m_Body);
    }

    bool CardPanel::IsPending() const
    {
        return m_Outline.Delay > 0.0f || m_Body.Delay > 0.0f
            || m_Outline.Value != m_Target || m_Body.Value != m_Target;
    }

    float CardPanel::GetOutline() const
    {
        return Smoothstep(m_Outline.Value);
    }

    float CardPanel::GetBody() const
    {
        return Smoothstep(m_Body.Value);
    }
}
