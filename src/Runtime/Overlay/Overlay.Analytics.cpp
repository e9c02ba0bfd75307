module;
#include <exception>
#include <string_view>

module Overlay:Analytics.Impl;
import :Analytics;
import Core;

namespace Overlay::Analytics
{
    void LogSink::Send(std::string_view category, std::string_view action, std::string_view label)
    {
        Core::Log::Info("Analytics: {} / {} / '{}'", category, action, label);
    }

    void Track(Sink* sink, std::string_view category, std::string_view action, std::string_view label)
    {
        if (!sink)
        {
            Core::Log::Debug("Analytics: no sink, dropped {} / {}.", category, action);
            return;
        }

        try
        {
            sink->Send(category, action, label);
        }
        catch (const std::exception& e)
        {
            Core::Log::Warn("Analytics: {} / {} not delivered: {}", category, action, e.what());
        }
    }
}
