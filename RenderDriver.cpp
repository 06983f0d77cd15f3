#include "RenderDriver.hpp"

#include "MoraOpenness.hpp"

namespace KUCHIPAKU {

    RenderDriver::RenderDriver(const RenderContext& context, const PlaybackSequencer& sequencer,
        const TimingTracker& timing)
        : context_(context),
        sequencer_(sequencer),
        timing_(timing) {
        Apply(0.0f);
    }

    void RenderDriver::OnPlaybackState(const PlaybackState& state) {
        const Segment* segment = sequencer_.GetSegment(state.active_index);
        scheduled_ = state.is_playing && segment != nullptr && segment->role == context_.role;
        if (!scheduled_) {
            Apply(0.0f);
        }
    }

    void RenderDriver::Tick() {
        if (!scheduled_) {
            return;
        }

        const Segment* segment = sequencer_.GetActiveSegment();
        if (segment == nullptr || segment->role != context_.role || !segment->transport) {
            scheduled_ = false;
            Apply(0.0f);
            return;
        }

        // Timing data may still be in flight; keep the mouth shut until then.
        const TimingData* timing = timing_.GetActiveTiming();
        if (timing == nullptr) {
            Apply(0.0f);
            return;
        }

        Apply(ComputeMouthOpenness(*timing, segment->transport->GetPlayheadMs()));
    }

    void RenderDriver::Apply(float openness) {
        context_.openness = openness;
        if (context_.target != nullptr) {
            context_.target->SetMouthOpenness(openness);
        }
    }

}  // namespace KUCHIPAKU
