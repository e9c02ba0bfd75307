module;
#include <memory>
#include <optional>
#include <entt/entity/entity.hpp>

export module Overlay:OrientationCard;

import :Analytics;
import :CameraAnchor;
import :CardPanel;
import :Config;
import :TransitionController;
import ECS;
import Core;

// -------------------------------------------------------------------------
// Overlay::OrientationCard - camera-facing info card
// -------------------------------------------------------------------------
// Triggers (wired in Initialize, delivered by the scene dispatcher):
//   - "visible" state added to the card entity    -> OnReveal
//   - "visible" state removed from the card entity -> OnDismiss
//   - pointer-up reaching the back-meshes entity  -> OnDismiss
//
// Tick(dt) must be called once per frame. It advances the panels and sets
// the card's visibility to (header progress > 0). When the header finishes
// hiding, a "hide-complete" custom event is emitted on the card entity
// after that frame's visibility update.
// -------------------------------------------------------------------------

export namespace Overlay
{
    class OrientationCard
    {
    public:
        // 'analytics' may be null; it must outlive the card otherwise.
        OrientationCard(ECS::Scene& scene, entt::entity cardEntity, Analytics::Sink* analytics = nullptr);
        ~OrientationCard();

        OrientationCard(const OrientationCard&) = delete;
        OrientationCard& operator=(const OrientationCard&) = delete;
        OrientationCard(OrientationCard&&) = delete;
        OrientationCard& operator=(OrientationCard&&) = delete;

        // Builds the panels and child entities and connects the triggers.
        // 'anchor' must outlive the card.
        [[nodiscard]] Core::Result Initialize(const OverlayConfig& config, CameraAnchor& anchor);

        // Fails with NotInitialized / AnchorUnavailable without side effects.
        // A reveal while Showing or Shown is a no-op.
        [[nodiscard]] Core::Result OnReveal();

        void OnDismiss();

        void Tick(float dt);

        [[nodiscard]] bool IsInitialized() const { return m_Transitions != nullptr; }
        [[nodiscard]] TransitionState GetState() const;

        // Null before Initialize.
        [[nodiscard]] const TransitionController* GetTransitions() const { return m_Transitions.get(); }
        [[nodiscard]] const std::optional<OverlayConfig>& GetConfig() const { return m_Config; }

        [[nodiscard]] entt::entity GetCardEntity() const { return m_Card; }
        [[nodiscard]] entt::entity GetBackEntity() const { return m_Back; }
        [[nodiscard]] entt::entity GetHeaderPanelEntity() const { return m_HeaderPanel; }
        [[nodiscard]] entt::entity GetBackgroundPanelEntity() const { return m_BackgroundPanel; }
        [[nodiscard]] entt::entity GetHitRegionEntity() const { return m_HitRegion; }
        [[nodiscard]] entt::entity GetHeaderEntity() const { return m_HeaderAnchor; }
        [[nodiscard]] entt::entity GetTitleEntity() const { return m_Title; }

    private:
        void BuildEntities(const OverlayConfig& config);
        void ConnectTriggers();
        void DisconnectTriggers();

        void HandleStateAdded(const ECS::Events::StateAdded& event);
        void HandleStateRemoved(const ECS::Events::StateRemoved& event);
        void HandlePointerUp(const ECS::Events::PointerUp& event);
        void HandleFullyHidden();

        void SyncPanel(entt::entity entity, const CardPanel& panel);

        ECS::Scene& m_Scene;
        entt::entity m_Card;
        Analytics::Sink* m_Analytics;

        CameraAnchor* m_Anchor = nullptr;
        std::optional<OverlayConfig> m_Config;
        std::unique_ptr<TransitionController> m_Transitions;

        entt::entity m_Back = entt::null;
        entt::entity m_BackgroundPanel = entt::null;
        entt::entity m_HeaderPanel = entt::null;
        entt::entity m_HitRegion = entt::null;
        entt::entity m_HeaderAnchor = entt::null;
        entt::entity m_Title = entt::null;

        bool m_Dismissing = false;
        bool m_HideCompletePending = false;
        bool m_Connected = false;
    };
}
