#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

import Core;

namespace
{
    struct Captured
    {
        Core::Log::Level Level;
        std::string Message;
    };

    std::vector<Captured> g_Captured;

    void CaptureSink(Core::Log::Level level, std::string_view message)
    {
        g_Captured.push_back({level, std::string(message)});
    }

    class CoreLoggingTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            g_Captured.clear();
            Core::Log::SetSink(&CaptureSink);
            Core::Log::SetMinLevel(Core::Log::Level::Debug);
        }

        void TearDown() override
        {
            Core::Log::SetSink(nullptr);
            Core::Log::SetMinLevel(Core::Log::Level::Debug);
        }
    };
}

TEST_F(CoreLoggingTest, SinkReceivesFormattedMessage)
{
    Core::Log::Info("card {} at {:.1f}", "orientation", 1.5f);

    ASSERT_EQ(g_Captured.size(), 1u);
    EXPECT_EQ(g_Captured[0].Level, Core::Log::Level::Info);
    EXPECT_EQ(g_Captured[0].Message, "card orientation at 1.5");
}

TEST_F(CoreLoggingTest, MinLevelFiltersLowerLevels)
{
    Core::Log::SetMinLevel(Core::Log::Level::Warning);

    Core::Log::Info("dropped");
    Core::Log::Debug("dropped");
    Core::Log::Warn("kept {}", 1);
    Core::Log::Error("kept {}", 2);

    ASSERT_EQ(g_Captured.size(), 2u);
    EXPECT_EQ(g_Captured[0].Level, Core::Log::Level::Warning);
    EXPECT_EQ(g_Captured[1].Level, Core::Log::Level::Error);
}

TEST_F(CoreLoggingTest, DebugOnlyInDebugBuilds)
{
    Core::Log::Debug("trace {}", 7);

#ifndef NDEBUG
    ASSERT_EQ(g_Captured.size(), 1u);
    EXPECT_EQ(g_Captured[0].Message, "trace 7");
#else
    EXPECT_TRUE(g_Captured.empty());
#endif
}

namespace
{
    int g_ReentrantDepth = 0;

    // Forwards to the capture sink and logs once more from inside the sink.
    void ReentrantSink(Core::Log::Level level, std::string_view message)
    {
        CaptureSink(level, message);
        if (g_ReentrantDepth == 0)
        {
            ++g_ReentrantDepth;
            Core::Log::Warn("nested after '{}'", message);
            --g_ReentrantDepth;
        }
    }
}

TEST_F(CoreLoggingTest, SinkMayLogItself)
{
    Core::Log::SetSink(&ReentrantSink);

    Core::Log::Info("outer");

    ASSERT_EQ(g_Captured.size(), 2u);
    EXPECT_EQ(g_Captured[0].Message, "outer");
    EXPECT_EQ(g_Captured[1].Level, Core::Log::Level::Warning);
    EXPECT_EQ(g_Captured[1].Message, "nested after 'outer'");
}
