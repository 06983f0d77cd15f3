#ifndef STAGE_H_
#define STAGE_H_

#include <memory>
#include <vector>

#include "MouthTarget.hpp"
#include "PlaybackSequencer.hpp"
#include "RenderDriver.hpp"
#include "TimingSource.hpp"
#include "TimingTracker.hpp"
#include "WindowMirror.hpp"

namespace KUCHIPAKU {

    // Two-character dialogue playback. Owns the sequencer, the timing tracker
    // and one render driver per character, and runs them from a single
    // per-frame Tick():
    //   1. poll the active transport (may end or fail the segment),
    //   2. poll the timing source,
    //   3. tick every render driver,
    //   4. mirror the combined state while playing.
    // Every sequencer transition is mirrored as well.
    class Stage {
    public:
        explicit Stage(TimingSource& timing_source);
        ~Stage();

        Stage(const Stage&) = delete;
        Stage& operator=(const Stage&) = delete;

        // Replaces the driver for role, if any. target may be null.
        void AddCharacter(Role role, MouthTarget* target);

        // target may be null or closed; sends then do nothing.
        void SetMirror(MirrorTarget* target) { mirror_ = target; }

        void LoadSegments(std::vector<Segment> segments);
        bool Play();
        void Stop();

        void Tick();

        // Sequencer state with the speaking character's openness filled in.
        PlaybackState GetState() const;

        PlaybackSequencer& GetSequencer() { return sequencer_; }
        const PlaybackSequencer& GetSequencer() const { return sequencer_; }
        const TimingTracker& GetTimingTracker() const { return tracker_; }
        // nullptr when no character was added for role.
        const RenderDriver* GetDriver(Role role) const;

    private:
        void OnPlaybackState(const PlaybackState& state);

        TimingSource& timing_source_;
        PlaybackSequencer sequencer_;
        // Subscribes before the stage so timing is requested before drivers
        // are scheduled.
        TimingTracker tracker_;
        std::vector<std::unique_ptr<RenderDriver>> drivers_;
        MirrorTarget* mirror_ = nullptr;
        int subscription_ = 0;
    };

}  // namespace KUCHIPAKU

#endif
