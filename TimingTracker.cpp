#include "TimingTracker.hpp"

#include <iostream>

namespace KUCHIPAKU {

    TimingTracker::TimingTracker(PlaybackSequencer& sequencer, TimingSource& source)
        : sequencer_(sequencer),
        source_(source),
        alive_(std::make_shared<bool>(true)) {
        subscription_ = sequencer_.Subscribe(
            [this](const PlaybackState& state) { OnPlaybackState(state); });
    }

    TimingTracker::~TimingTracker() {
        sequencer_.Unsubscribe(subscription_);
    }

    const TimingData* TimingTracker::GetActiveTiming() const {
        return has_timing_ ? &timing_ : nullptr;
    }

    void TimingTracker::OnPlaybackState(const PlaybackState& state) {
        if (!state.is_playing) {
            Discard();
            generation_ = state.generation;
            return;
        }
        if (state.generation == generation_) {
            return;
        }

        Discard();
        generation_ = state.generation;

        const Segment* segment = sequencer_.GetSegment(state.active_index);
        if (segment == nullptr) {
            return;
        }

        TimingRequest request;
        request.text = segment->text;
        request.speaker_id = segment->speaker_id;
        request.timing_path = segment->timing_path;

        std::weak_ptr<bool> alive = alive_;
        const uint64_t generation = state.generation;
        source_.Request(request,
            [this, alive, generation](bool ok, const TimingData& data) {
                if (alive.expired())
                    return;
                OnTimingReady(generation, ok, data);
            });
    }

    void TimingTracker::OnTimingReady(uint64_t generation, bool ok, const TimingData& data) {
        if (generation != generation_ || !sequencer_.IsPlaying()) {
            ++discarded_count_;
            return;
        }
        if (!ok) {
            // Mouth stays closed for this segment.
            std::cerr << "No timing data for segment " << sequencer_.GetActiveIndex() << "\n";
            return;
        }
        timing_ = data;
        has_timing_ = true;
    }

    void TimingTracker::Discard() {
        has_timing_ = false;
        timing_ = TimingData();
    }

}  // namespace KUCHIPAKU
