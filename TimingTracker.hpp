#ifndef TIMING_TRACKER_H_
#define TIMING_TRACKER_H_

#include <cstdint>
#include <memory>

#include "PlaybackSequencer.hpp"
#include "TimingSource.hpp"

namespace KUCHIPAKU {

    // Holds the timing data of the segment that is currently playing.
    // A fetch is issued each time a segment becomes active and the previous
    // segment's data is dropped at the same moment. Results are tagged with
    // the playback generation that requested them; anything arriving for a
    // generation that is no longer active is thrown away.
    class TimingTracker {
    public:
        TimingTracker(PlaybackSequencer& sequencer, TimingSource& source);
        ~TimingTracker();

        TimingTracker(const TimingTracker&) = delete;
        TimingTracker& operator=(const TimingTracker&) = delete;

        // nullptr until the active segment's data has arrived.
        const TimingData* GetActiveTiming() const;

        // Completions dropped because their segment was no longer active.
        int GetDiscardedCount() const { return discarded_count_; }

    private:
        void OnPlaybackState(const PlaybackState& state);
        void OnTimingReady(uint64_t generation, bool ok, const TimingData& data);
        void Discard();

        PlaybackSequencer& sequencer_;
        TimingSource& source_;
        int subscription_ = 0;

        uint64_t generation_ = 0;
        bool has_timing_ = false;
        TimingData timing_;
        int discarded_count_ = 0;

        // Expires with the tracker so late completions become no-ops.
        std::shared_ptr<bool> alive_;
    };

}  // namespace KUCHIPAKU

#endif
