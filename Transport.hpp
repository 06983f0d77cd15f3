#ifndef TRANSPORT_H_
#define TRANSPORT_H_

#include <functional>
#include <string>

namespace KUCHIPAKU {

    enum class TransportEvent {
        Ended,
        Error
    };

    // Completion callback. Fired from Poll() on the frame thread, never after
    // Stop().
    using TransportEventCallback =
        std::function<void(TransportEvent event, const std::string& detail)>;

    // Playback handle for one segment's audio.
    class Transport {
    public:
        virtual ~Transport() = default;

        // Begins playback from the start. Returns false when playback could not
        // start; GetLastError() then describes why and no event will follow.
        virtual bool Start(TransportEventCallback on_event) = 0;

        // Halts playback and rewinds. Safe to call when not playing.
        virtual void Stop() = 0;

        // Checks for completion and fires the pending event, if any.
        virtual void Poll() = 0;

        virtual bool IsPlaying() const = 0;

        // Milliseconds since Start(), 0 when not playing.
        virtual double GetPlayheadMs() const = 0;

        virtual std::string GetLastError() const = 0;
    };

}  // namespace KUCHIPAKU

#endif
