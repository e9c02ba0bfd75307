#include <cstdlib>
#include <string_view>
#include <entt/entity/registry.hpp>
#include <entt/signal/dispatcher.hpp>
#include <glm/glm.hpp>

import Core;
import ECS;
import Overlay;

using namespace Core;

// Headless frame loop: reveal the card, let it settle, click the hit
// region and run until the card reports hide-complete.
namespace
{
    struct DemoConfig
    {
        float FrameRate = 60.0f;
        float ShownSeconds = 1.0f;
        int MaxFrames = 600;
        Overlay::PlatformClass Platform = Overlay::PlatformClass::Desktop;
    };

    struct HideCompleteWatcher
    {
        entt::entity Card = entt::null;
        bool Done = false;

        void OnCustom(const ECS::Events::Custom& event)
        {
            if (event.Entity == Card && event.Name == Overlay::Names::HideComplete) Done = true;
        }
    };

    DemoConfig ParseArgs(int argc, char** argv)
    {
        DemoConfig config;
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            if (arg == "--mobile") config.Platform = Overlay::PlatformClass::Mobile;
            else if (arg == "--headset") config.Platform = Overlay::PlatformClass::Headset;
            else Log::Warn("CardDemo: unknown argument '{}'.", arg);
        }
        return config;
    }

    void StepFrame(ECS::Scene& scene, Overlay::OrientationCard& card, float dt)
    {
        card.Tick(dt);
        ECS::Systems::LookAt::OnUpdate(scene.GetRegistry());
        ECS::Systems::Transform::OnUpdate(scene.GetRegistry());
    }
}

int main(int argc, char** argv)
{
    const DemoConfig config = ParseArgs(argc, argv);
    const float dt = 1.0f / config.FrameRate;

    ECS::Scene scene;

    entt::entity camera = scene.CreateEntity("camera");
    scene.SetPosition(camera, {0.0f, 1.6f, 0.0f});
    entt::entity anchorNode = scene.CreateEntity("ui-anchor", camera);

    Overlay::CameraAnchor anchor(scene, anchorNode, Overlay::PlatformProfile{.Class = config.Platform});

    entt::entity cardEntity = scene.CreateEntity("orientation-card");
    Overlay::Analytics::LogSink analytics;
    Overlay::OrientationCard card(scene, cardEntity, &analytics);

    if (auto result = card.Initialize({.Width = 2.0f, .Height = 1.0f, .Title = "Look around"}, anchor); !result)
    {
        Log::Error("CardDemo: initialize failed ({}).", ErrorCodeToString(result.error()));
        return EXIT_FAILURE;
    }

    HideCompleteWatcher watcher{.Card = cardEntity};
    scene.GetDispatcher().sink<ECS::Events::Custom>().connect<&HideCompleteWatcher::OnCustom>(watcher);

    Overlay::TransitionState last = card.GetState();
    auto report = [&](int frame)
    {
        const Overlay::TransitionState now = card.GetState();
        if (now == last) return;
        Log::Info("CardDemo: frame {:4} {} -> {} (visible: {})", frame,
                  Overlay::TransitionStateToString(last), Overlay::TransitionStateToString(now),
                  scene.IsVisible(cardEntity));
        last = now;
    };

    scene.AddState(cardEntity, Overlay::Names::Visible);
    report(0);

    const int shownFrames = static_cast<int>(config.ShownSeconds * config.FrameRate);
    int frame = 1;
    for (; frame <= shownFrames; ++frame)
    {
        StepFrame(scene, card, dt);
        report(frame);
    }

    scene.DispatchPointerUp(card.GetHitRegionEntity());
    report(frame);

    for (; frame <= config.MaxFrames && !watcher.Done; ++frame)
    {
        StepFrame(scene, card, dt);
        report(frame);
    }

    scene.GetDispatcher().sink<ECS::Events::Custom>().disconnect<&HideCompleteWatcher::OnCustom>(watcher);

    if (!watcher.Done)
    {
        Log::Error("CardDemo: hide-complete not received after {} frames.", config.MaxFrames);
        return EXIT_FAILURE;
    }

    Log::Info("CardDemo: hide-complete after {} frames, modal: {}.", frame,
              scene.HasState(scene.GetRoot(), Overlay::Names::Modal));
    return EXIT_SUCCESS;
}
