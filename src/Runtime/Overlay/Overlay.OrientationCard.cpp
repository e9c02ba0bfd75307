module;
#include <algorithm>
#include <cctype>
#include <memory>
#include <numbers>
#include <string>
#include <entt/entity/registry.hpp>
#include <entt/signal/dispatcher.hpp>
#include <glm/glm.hpp>

module Overlay:OrientationCard.Impl;
import :OrientationCard;
import :Analytics;
import :CameraAnchor;
import :CardPanel;
import :Components;
import :Config;
import :TransitionController;
import ECS;
import Core;

namespace Overlay
{
    namespace
    {
        std::string ToUpper(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return text;
        }
    }

    OrientationCard::OrientationCard(ECS::Scene& scene, entt::entity cardEntity, Analytics::Sink* analytics)
        : m_Scene(scene)
        , m_Card(cardEntity)
        , m_Analytics(analytics)
    {
    }

    OrientationCard::~OrientationCard()
    {
        DisconnectTriggers();
    }

    Core::Result OrientationCard::Initialize(const OverlayConfig& config, CameraAnchor& anchor)
    {
        if (IsInitialized())
        {
            Core::Log::Error("OrientationCard: already initialized.");
            return Core::Err(Core::ErrorCode::AlreadyInitialized);
        }
        if (auto valid = config.Validate(); !valid)
        {
            Core::Log::Error("OrientationCard: invalid size {}x{}.", config.Width, config.Height);
            return valid;
        }
        if (!m_Scene.GetRegistry().valid(m_Card))
        {
            Core::Log::Error("OrientationCard: card entity does not exist.");
            return Core::Err(Core::ErrorCode::EntityNotFound);
        }

        CardPanel background(config.Width, config.Height);
        CardPanel header(config.Width, Layout::HeaderHeight);
        header.SetPosition(0.0f, Layout::HeaderYOffset);

        m_Transitions = std::make_unique<TransitionController>(std::move(header), std::move(background));
        m_Transitions->OnFullyHidden().connect<&OrientationCard::HandleFullyHidden>(*this);

        m_Anchor = &anchor;
        m_Config = config;

        // Face the viewer: forward (-z) toward the camera, then turned around
        // so the card's front (+z) is what the viewer sees.
        m_Scene.GetRegistry().emplace_or_replace<ECS::Components::LookAt::Component>(
            m_Card, ECS::Components::LookAt::Component{
                .Target = anchor.GetViewer(),
                .Axis = ECS::Components::LookAt::Axes::XYZ,
                .AlwaysUpdate = false,
                .Offset = {0.0f, std::numbers::pi_v<float>, 0.0f}});

        BuildEntities(config);
        ConnectTriggers();

        // Hidden until the first reveal raises the header.
        m_Scene.SetVisible(m_Card, false);

        Core::Log::Info("OrientationCard: initialized '{}' ({}x{}).", config.Title, config.Width, config.Height);
        return Core::Ok();
    }

    void OrientationCard::BuildEntities(const OverlayConfig& config)
    {
        auto& registry = m_Scene.GetRegistry();

        // Panels and the hit region live under the back-meshes node so they
        // draw behind the title.
        m_Back = m_Scene.CreateEntity("orientation-back-meshes", m_Card);

        const CardPanel& background = m_Transitions->GetBackground();
        const CardPanel& header = m_Transitions->GetHeader();

        m_BackgroundPanel = m_Scene.CreateEntity("card-background", m_Back);
        registry.emplace<Components::PanelVisual>(m_BackgroundPanel, Components::PanelVisual{.Size = background.GetSize()});

        m_HeaderPanel = m_Scene.CreateEntity("card-header", m_Back);
        m_Scene.SetPosition(m_HeaderPanel, {header.GetPosition(), 0.0f});
        registry.emplace<Components::PanelVisual>(m_HeaderPanel, Components::PanelVisual{.Size = header.GetSize()});

        m_HitRegion = m_Scene.CreateEntity("card-hitbox", m_Back);
        m_Scene.SetPosition(m_HitRegion, {0.0f, 0.0f, Layout::HitRegionDepth});
        registry.emplace<Components::HitRegion>(m_HitRegion, Components::HitRegion{
            .Expansion = Layout::HitRegionExpansion,
            .CursorScale = Layout::HitRegionCursorScale,
            .EventPriority = Layout::HitRegionEventPriority});

        // Title block: left-aligned with a small padding, vertically centred on the header.
        m_HeaderAnchor = m_Scene.CreateEntity("card-header-text", m_Back);
        m_Scene.SetPosition(m_HeaderAnchor, {
            -config.Width / 2.0f + Layout::TextLeftPadding,
            Layout::HeaderYOffset - Layout::HeaderHeight / 2.0f + Layout::TextBaselineNudge,
            0.0f});

        m_Title = m_Scene.CreateEntity("card-title", m_HeaderAnchor);
        registry.emplace<ECS::Components::TextLabel::Component>(m_Title, ECS::Components::TextLabel::Component{
            .Value = ToUpper(config.Title),
            .Font = std::string(Layout::TitleFont),
            .Color = Layout::TitleColor,
            .LetterSpacing = Layout::TitleLetterSpacing,
            .Width = config.Width,
            .WrapCount = Layout::TitleWrapCount});
    }

    void OrientationCard::ConnectTriggers()
    {
        auto& dispatcher = m_Scene.GetDispatcher();
        dispatcher.sink<ECS::Events::StateAdded>().connect<&OrientationCard::HandleStateAdded>(*this);
        dispatcher.sink<ECS::Events::StateRemoved>().connect<&OrientationCard::HandleStateRemoved>(*this);
        dispatcher.sink<ECS::Events::PointerUp>().connect<&OrientationCard::HandlePointerUp>(*this);
        m_Connected = true;
    }

    void OrientationCard::DisconnectTriggers()
    {
        if (!m_Connected) return;

        auto& dispatcher = m_Scene.GetDispatcher();
        dispatcher.sink<ECS::Events::StateAdded>().disconnect<&OrientationCard::HandleStateAdded>(*this);
        dispatcher.sink<ECS::Events::StateRemoved>().disconnect<&OrientationCard::HandleStateRemoved>(*this);
        dispatcher.sink<ECS::Events::PointerUp>().disconnect<&OrientationCard::HandlePointerUp>(*this);
        m_Connected = false;
    }

    TransitionState OrientationCard::GetState() const
    {
        return m_Transitions ? m_Transitions->GetState() : TransitionState::Hidden;
    }

    Core::Result OrientationCard::OnReveal()
    {
        if (!IsInitialized())
        {
            Core::Log::Error("OrientationCard: reveal before Initialize.");
            return Core::Err(Core::ErrorCode::NotInitialized);
        }
        if (!m_Anchor->IsAvailable())
        {
            Core::Log::Error("OrientationCard: reveal without a camera anchor.");
            return Core::Err(Core::ErrorCode::AnchorUnavailable);
        }

        const TransitionState state = m_Transitions->GetState();
        if (state == TransitionState::Showing || state == TransitionState::Shown)
        {
            Core::Log::Debug("OrientationCard: reveal ignored while {}.", TransitionStateToString(state));
            return Core::Ok();
        }

        m_Scene.AddState(m_Scene.GetRoot(), Names::Modal);
        m_Scene.AddState(m_Title, Names::Visible);

        m_Transitions->PlayIn();
        m_HideCompletePending = false;

        // Availability was checked above, so the sample is present.
        const auto sample = m_Anchor->Sample();
        m_Scene.SetPosition(m_Card, sample->Position);

        // Orient now so the first rendered frame already faces the viewer.
        ECS::Systems::LookAt::Apply(m_Scene.GetRegistry(), m_Card);

        Core::Log::Debug("OrientationCard: revealed at ({:.3f}, {:.3f}, {:.3f}).",
                         sample->Position.x, sample->Position.y, sample->Position.z);
        return Core::Ok();
    }

    void OrientationCard::OnDismiss()
    {
        if (!IsInitialized() || m_Dismissing) return;

        // Removing our own "visible" state re-enters through HandleStateRemoved.
        m_Dismissing = true;

        m_Scene.RemoveState(m_Scene.GetRoot(), Names::Modal);
        m_Scene.RemoveState(m_Card, Names::Visible);
        m_Scene.RemoveState(m_Title, Names::Visible);

        m_Transitions->PlayOut();

        m_Dismissing = false;
    }

    void OrientationCard::Tick(float dt)
    {
        if (!IsInitialized()) return;

        m_Transitions->Advance(dt);

        SyncPanel(m_BackgroundPanel, m_Transitions->GetBackground());
        SyncPanel(m_HeaderPanel, m_Transitions->GetHeader());

        // The header alone decides visibility, even while the background is still hidden.
        m_Scene.SetVisible(m_Card, m_Transitions->GetHeader().GetAnimationProgress() > 0.0f);

        if (m_HideCompletePending)
        {
            m_HideCompletePending = false;
            m_Scene.Emit(m_Card, Names::HideComplete);
        }
    }

    void OrientationCard::SyncPanel(entt::entity entity, const CardPanel& panel)
    {
        auto& registry = m_Scene.GetRegistry();
        if (!registry.valid(entity)) return;

        auto& visual = registry.get_or_emplace<Components::PanelVisual>(entity);
        visual.Size = panel.GetSize();
        visual.Outline = panel.GetOutline();
        visual.Body = panel.GetBody();
        visual.Progress = panel.GetAnimationProgress();

        // The frame grows vertically out of its centre line.
        auto& transform = registry.get<ECS::Components::Transform::Component>(entity);
        transform.Scale = {1.0f, visual.Outline, 1.0f};
        registry.emplace_or_replace<ECS::Components::Transform::IsDirtyTag>(entity);
    }

    void OrientationCard::HandleStateAdded(const ECS::Events::StateAdded& event)
    {
        if (event.Entity != m_Card || event.State != Names::Visible) return;

        const TransitionState before = GetState();
        if (auto result = OnReveal(); !result)
        {
            Core::Log::Error("OrientationCard: reveal failed ({}).", Core::ErrorCodeToString(result.error()));
            return;
        }

        // Only a reveal that started a sequence counts as opened.
        if (before == TransitionState::Hidden || before == TransitionState::Hiding)
        {
            Analytics::Track(m_Analytics, Names::AnalyticsCategory, Names::AnalyticsOpened);
        }
    }

    void OrientationCard::HandleStateRemoved(const ECS::Events::StateRemoved& event)
    {
        if (event.Entity != m_Card || event.State != Names::Visible) return;
        OnDismiss();
    }

    void OrientationCard::HandlePointerUp(const ECS::Events::PointerUp& event)
    {
        if (event.Current != m_Back) return;

        // A fully hidden card cannot be clicked.
        if (GetState() == TransitionState::Hidden) return;

        Analytics::Track(m_Analytics, Names::AnalyticsCategory, Names::AnalyticsDismissed);
        OnDismiss();
    }

    void OrientationCard::HandleFullyHidden()
    {
        m_HideCompletePending = true;
    }
}
