#include <gtest/gtest.h>
#include <type_traits>
#include <utility>
#include <glm/glm.hpp>
#include <entt/signal/sigh.hpp>

import Overlay;

using namespace Overlay;

namespace
{
    struct CompletionCounter
    {
        int Count = 0;
        void OnComplete() { ++Count; }
    };

    // Advances in small fixed steps, like a frame loop.
    void Run(CardPanel& panel, float seconds, float dt = 0.01f)
    {
        const int steps = static_cast<int>(seconds / dt + 0.5f);
        for (int i = 0; i < steps; ++i) panel.Advance(dt);
    }
}

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------

TEST(Overlay_CardPanel, StartsHidden)
{
    CardPanel panel(2.0f, 1.0f);

    EXPECT_FLOAT_EQ(panel.GetAnimationProgress(), 0.0f);
    EXPECT_FALSE(panel.IsAnimating());
    EXPECT_FALSE(panel.IsPending());
    EXPECT_FALSE(panel.IsTargetShown());
    EXPECT_EQ(panel.GetSize(), glm::vec2(2.0f, 1.0f));
    EXPECT_EQ(panel.GetPosition(), glm::vec2(0.0f));
}

TEST(Overlay_CardPanel, SetPosition)
{
    CardPanel panel(2.0f, 0.1f);
    panel.SetPosition(0.0f, 0.566f);

    EXPECT_FLOAT_EQ(panel.GetPosition().x, 0.0f);
    EXPECT_FLOAT_EQ(panel.GetPosition().y, 0.566f);
}

TEST(Overlay_CardPanel, MoveOnly)
{
    EXPECT_FALSE(std::is_copy_constructible_v<CardPanel>);
    EXPECT_FALSE(std::is_copy_assignable_v<CardPanel>);
    EXPECT_TRUE(std::is_move_constructible_v<CardPanel>);

    CardPanel panel(1.0f, 1.0f);
    panel.Show(0.0f);
    panel.Advance(1.0f);

    CardPanel moved(std::move(panel));
    EXPECT_FLOAT_EQ(moved.GetAnimationProgress(), 1.0f);
    EXPECT_TRUE(moved.IsTargetShown());
}

// -----------------------------------------------------------------------------
// Show / Hide timing
// -----------------------------------------------------------------------------

TEST(Overlay_CardPanel, Show_WaitsForDelay)
{
    CardPanel panel(1.0f, 1.0f);
    panel.Show(0.2f);

    EXPECT_TRUE(panel.IsTargetShown());
    EXPECT_TRUE(panel.IsPending());
    EXPECT_FALSE(panel.IsAnimating());

    panel.Advance(0.1f);
    EXPECT_FLOAT_EQ(panel.GetAnimationProgress(), 0.0f);
    EXPECT_FALSE(panel.IsAnimating());

    panel.Advance(0.1f);
    EXPECT_FLOAT_EQ(panel.GetAnimationProgress(), 0.0f);
    EXPECT_TRUE(panel.IsAnimating());

    panel.Advance(0.1f);
    EXPECT_GT(panel.GetAnimationProgress(), 0.0f);
    EXPECT_LT(panel.GetAnimationProgress(), 1.0f);
}

TEST(Overlay_CardPanel, Show_OutlineLeadsBody)
{
    CardPanel panel(1.0f, 1.0f);
    panel.Show(0.0f, 0.2f);

    panel.Advance(0.2f);

    // Outline is half way, body has not started.
    EXPECT_NEAR(panel.GetAnimationProgress(), 0.25f, 1e-5f);
    EXPECT_GT(panel.GetOutline(), 0.0f);
    EXPECT_FLOAT_EQ(panel.GetBody(), 0.0f);
}

TEST(Overlay_CardPanel, Show_ClampsAtOne)
{
    CardPanel panel(1.0f, 1.0f);
    panel.Show(0.0f, 0.05f);

    panel.Advance(5.0f);

    EXPECT_FLOAT_EQ(panel.GetAnimationProgress(), 1.0f);
    EXPECT_FLOAT_EQ(panel.GetOutline(), 1.0f);
    EXPECT_FLOAT_EQ(panel.GetBody(), 1.0f);
    EXPECT_FALSE(panel.IsAnimating());
    EXPECT_FALSE(panel.IsPending());
}

TEST(Overlay_CardPanel, Hide_BodyLeadsOutline)
{
    CardPanel panel(1.0f, 1.0f);
    panel.Show(0.0f);
    panel.Advance(1.0f);

    panel.Hide(0.0f, 0.2f);
    panel.Advance(0.2f);

    EXPECT_NEAR(panel.GetAnimationProgress(), 0.75f, 1e-5f);
    EXPECT_FLOAT_EQ(panel.GetOutline(), 1.0f);
    EXPECT_LT(panel.GetBody(), 1.0f);

    panel.Advance(5.0f);
    EXPECT_FLOAT_EQ(panel.GetAnimationProgress(), 0.0f);
}

TEST(Overlay_CardPanel, Advance_NonPositiveIgnored)
{
    CardPanel panel(1.0f, 1.0f);
    panel.Show(0.1f);

    panel.Advance(0.0f);
    panel.Advance(-1.0f);

    // Delay still fully pending.
    panel.Advance(0.05f);
    EXPECT_FALSE(panel.IsAnimating());
    EXPECT_FLOAT_EQ(panel.GetAnimationProgress(), 0.0f);
}

TEST(Overlay_CardPanel, InvalidChannelDuration_FallsBackToDefault)
{
    CardPanel panel(1.0f, 1.0f, 0.0f);
    panel.Show(0.0f);

    panel.Advance(CardPanel::kDefaultChannelDuration / 2.0f);

    EXPECT_NEAR(panel.GetAnimationProgress(), 0.5f, 1e-5f);
}

TEST(Overlay_CardPanel, EasedChannelsStayInRange)
{
    CardPanel panel(1.0f, 1.0f);
    panel.Show(0.0f, 0.1f);

    for (int i = 0; i < 60; ++i)
    {
        panel.Advance(0.01f);
        EXPECT_GE(panel.GetOutline(), 0.0f);
        EXPECT_LE(panel.GetOutline(), 1.0f);
        EXPECT_GE(panel.GetBody(), 0.0f);
        EXPECT_LE(panel.GetBody(), 1.0f);
        EXPECT_LE(panel.GetBody(), panel.GetOutline());
    }
}

// -----------------------------------------------------------------------------
// Redirects
// -----------------------------------------------------------------------------

TEST(Overlay_CardPanel, Redirect_HoldsThenDecreasesMonotonically)
{
    CardPanel panel(1.0f, 1.0f);
    panel.Show(0.0f);
    Run(panel, 0.2f);

    const float atRedirect = panel.GetAnimationProgress();
    ASSERT_GT(atRedirect, 0.0f);
    ASSERT_LT(atRedirect, 1.0f);

    panel.Hide(0.1f);

    // Nothing moves during the new delay.
    panel.Advance(0.05f);
    EXPECT_FLOAT_EQ(panel.GetAnimationProgress(), atRedirect);

    float previous = panel.GetAnimationProgress();
    for (int i = 0; i < 100; ++i)
    {
        panel.Advance(0.01f);
        const float current = panel.GetAnimationProgress();
        EXPECT_LE(current, previous);
        previous = current;
    }
    EXPECT_FLOAT_EQ(panel.GetAnimationProgress(), 0.0f);
}

// -----------------------------------------------------------------------------
// Hide completion
// -----------------------------------------------------------------------------

TEST(Overlay_CardPanel, HideComplete_PublishedOnce)
{
    CardPanel panel(1.0f, 1.0f);
    CompletionCounter counter;
    panel.OnHideComplete().connect<&CompletionCounter::OnComplete>(counter);

    panel.Show(0.0f);
    Run(panel, 1.0f);
    EXPECT_EQ(counter.Count, 0);

    panel.Hide(0.05f, 0.25f);
    Run(panel, 0.5f);
    EXPECT_EQ(counter.Count, 0);

    Run(panel, 0.5f);
    EXPECT_EQ(counter.Count, 1);

    Run(panel, 1.0f);
    EXPECT_EQ(counter.Count, 1);
}

TEST(Overlay_CardPanel, HideComplete_CancelledByShow)
{
    CardPanel panel(1.0f, 1.0f);
    CompletionCounter counter;
    panel.OnHideComplete().connect<&CompletionCounter::OnComplete>(counter);

    panel.Show(0.0f);
    Run(panel, 1.0f);

    panel.Hide(0.0f);
    Run(panel, 0.1f);
    panel.Show(0.0f);
    Run(panel, 1.0f);

    EXPECT_EQ(counter.Count, 0);
    EXPECT_FLOAT_EQ(panel.GetAnimationProgress(), 1.0f);
}

TEST(Overlay_CardPanel, HideComplete_AgainAfterSecondCycle)
{
    CardPanel panel(1.0f, 1.0f);
    CompletionCounter counter;
    panel.OnHideComplete().connect<&CompletionCounter::OnComplete>(counter);

    for (int cycle = 0; cycle < 2; ++cycle)
    {
        panel.Show(0.0f);
        Run(panel, 1.0f);
        panel.Hide(0.0f);
        Run(panel, 1.0f);
    }

    EXPECT_EQ(counter.Count, 2);
}
