module;
#include <string_view>

export module Overlay:Analytics;

export namespace Overlay::Analytics
{
    // Fire-and-forget event reporting. Implementations may throw; callers go
    // through Track(), which never lets a failure reach the caller.
    class Sink
    {
    public:
        virtual ~Sink() = default;
        virtual void Send(std::string_view category, std::string_view action, std::string_view label) = 0;
    };

    // Writes events to the engine log at info level.
    class LogSink final : public Sink
    {
    public:
        void Send(std::string_view category, std::string_view action, std::string_view label) override;
    };

    // Best effort: a null sink or a throwing sink is logged and ignored.
    void Track(Sink* sink, std::string_view category, std::string_view action, std::string_view label = {});
}
