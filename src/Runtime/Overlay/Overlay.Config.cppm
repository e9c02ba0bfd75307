module;
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <glm/glm.hpp>

export module Overlay:Config;

import Core;

export namespace Overlay
{
    // Immutable per-card configuration, fixed at Initialize.
    struct OverlayConfig
    {
        float Width = 2.0f;
        float Height = 1.0f;
        std::string Title;

        [[nodiscard]] Core::Result Validate() const
        {
            if (!std::isfinite(Width) || Width <= 0.0f) return Core::Err(Core::ErrorCode::InvalidArgument);
            if (!std::isfinite(Height) || Height <= 0.0f) return Core::Err(Core::ErrorCode::InvalidArgument);
            return Core::Ok();
        }
    };

    enum class PlatformClass : uint8_t
    {
        Desktop = 0,
        Mobile,
        Headset
    };

    constexpr std::string_view PlatformClassToString(PlatformClass platform)
    {
        switch (platform)
        {
            case PlatformClass::Desktop: return "Desktop";
            case PlatformClass::Mobile:  return "Mobile";
            case PlatformClass::Headset: return "Headset";
        }
        return "Unknown";
    }

    // Distance in front of the viewer (negative z, camera space) at which the
    // card is placed on reveal, per platform class.
    struct PlatformProfile
    {
        PlatformClass Class = PlatformClass::Desktop;
        float DesktopDepthOffset = -1.5f;
        float MobileDepthOffset = -1.75f;
        float HeadsetDepthOffset = -1.5f;

        [[nodiscard]] float GetDepthOffset() const
        {
            switch (Class)
            {
                case PlatformClass::Mobile:  return MobileDepthOffset;
                case PlatformClass::Headset: return HeadsetDepthOffset;
                case PlatformClass::Desktop: break;
            }
            return DesktopDepthOffset;
        }
    };

    // Card geometry, in card-local units.
    namespace Layout
    {
        constexpr float HeaderHeight = 0.1f;
        constexpr float HeaderYOffset = 0.566f;
        constexpr float TextLeftPadding = 0.025f;
        constexpr float TextBaselineNudge = 0.025f;

        constexpr float HitRegionDepth = -1.0f;
        constexpr float HitRegionExpansion = 20.0f;
        constexpr float HitRegionCursorScale = 0.3f;
        constexpr int HitRegionEventPriority = 100;

        constexpr float TitleLetterSpacing = 6.0f;
        constexpr uint32_t TitleWrapCount = 64;
        constexpr std::string_view TitleFont = "fonts/NowAlt-Bold.json";
        inline const glm::vec4 TitleColor{0.94f, 0.94f, 0.94f, 1.0f};
    }

    struct PanelTiming
    {
        float Delay = 0.0f;
        float Stagger = 0.0f;
    };

    // Reveal: header leads, background follows.
    // Dismiss: the exact mirror, background leads and the header leaves last.
    namespace Timing
    {
        constexpr PanelTiming RevealHeader{0.05f, 0.0f};
        constexpr PanelTiming RevealBackground{0.25f, 0.05f};
        constexpr PanelTiming DismissBackground{0.0f, 0.0f};
        constexpr PanelTiming DismissHeader{0.05f, 0.25f};
    }

    // Names used on the scene's state and event channels.
    namespace Names
    {
        constexpr Core::Hash::StringID Visible{"visible"};
        constexpr Core::Hash::StringID Modal{"modal"};
        constexpr Core::Hash::StringID HideComplete{"hide-complete"};

        constexpr std::string_view AnalyticsCategory = "orientation-card";
        constexpr std::string_view AnalyticsOpened = "opened";
        constexpr std::string_view AnalyticsDismissed = "dismissed";
    }
}
