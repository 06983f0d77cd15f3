#ifndef RENDER_DRIVER_H_
#define RENDER_DRIVER_H_

#include "MouthTarget.hpp"
#include "PlaybackSequencer.hpp"
#include "TimingTracker.hpp"

namespace KUCHIPAKU {

    // Per-character animation state. Each driver owns its own.
    struct RenderContext {
        Role role = Role::Lead;
        MouthTarget* target = nullptr;
        float openness = 0.0f;
    };

    // Moves one character's mouth while that character's line is playing.
    // The driver is scheduled only between the state update that makes its
    // role active and the one that ends it; otherwise the mouth is held shut
    // and Tick() does nothing.
    class RenderDriver {
    public:
        RenderDriver(const RenderContext& context, const PlaybackSequencer& sequencer,
            const TimingTracker& timing);

        void OnPlaybackState(const PlaybackState& state);

        // One animation frame.
        void Tick();

        bool IsScheduled() const { return scheduled_; }
        float GetOpenness() const { return context_.openness; }
        Role GetRole() const { return context_.role; }
        const RenderContext& GetContext() const { return context_; }

    private:
        void Apply(float openness);

        RenderContext context_;
        const PlaybackSequencer& sequencer_;
        const TimingTracker& timing_;
        bool scheduled_ = false;
    };

}  // namespace KUCHIPAKU

#endif
