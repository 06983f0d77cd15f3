#ifndef PLAYBACK_SEQUENCER_H_
#define PLAYBACK_SEQUENCER_H_

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "Segment.hpp"

namespace KUCHIPAKU {

    struct PlaybackState {
        bool is_playing = false;
        int active_index = -1;  // -1 while idle
        float openness = 0.0f;
        // Playback attempt that produced this state.
        uint64_t generation = 0;
    };

    // Outcome of one run from Start() to the terminal Idle transition.
    struct PlaybackSummary {
        int played = 0;  // segments that reached their end
        int failed = 0;  // segments that failed to start or errored
    };

    // Plays a list of segments strictly in order, one at a time.
    //
    //   Idle --Start()--> Playing(0) --end--> Playing(1) ... --end--> Idle
    //   Playing(i) --Stop()--> Idle
    //
    // Every transition is published to subscribers. A transport failure skips
    // to the next segment. Completions carry the generation they were started
    // with and are dropped once the sequencer has moved on, so a late "ended"
    // from a stopped or replaced segment can never advance playback.
    class PlaybackSequencer {
    public:
        using StateCallback = std::function<void(const PlaybackState&)>;
        using DiagnosticCallback = std::function<void(const std::string&)>;
        using FinishedCallback = std::function<void(const PlaybackSummary&)>;

        PlaybackSequencer() = default;
        ~PlaybackSequencer();

        PlaybackSequencer(const PlaybackSequencer&) = delete;
        PlaybackSequencer& operator=(const PlaybackSequencer&) = delete;

        // Halts any active segment, installs the new list and publishes Idle.
        void Replace(std::vector<Segment> segments);

        // Idle -> Playing(0). Returns false when already playing, when there
        // is nothing to play, or when no segment could be started.
        bool Start();

        // Playing(i) -> Idle. The active transport is halted and rewound
        // before this returns. No-op while idle.
        void Stop();

        // Ends the active segment as if its transport had reported the end.
        void OnSegmentEnd();

        // Polls the active transport; call once per frame.
        void Update();

        int Subscribe(StateCallback callback);
        void Unsubscribe(int id);

        void SetDiagnosticCallback(DiagnosticCallback callback) {
            diagnostic_callback_ = std::move(callback);
        }
        void SetFinishedCallback(FinishedCallback callback) {
            finished_callback_ = std::move(callback);
        }

        bool IsPlaying() const { return active_index_ >= 0; }
        int GetActiveIndex() const { return active_index_; }
        uint64_t GetGeneration() const { return generation_; }
        PlaybackState GetState() const;

        size_t GetSegmentCount() const { return segments_.size(); }
        // nullptr when index is out of range.
        const Segment* GetSegment(int index) const;
        const Segment* GetActiveSegment() const { return GetSegment(active_index_); }

    private:
        // Starts the first segment at or after index that accepts playback;
        // finishes the run when none does.
        void BeginFrom(size_t index);
        void Advance();
        void FinishRun();
        void HaltActive();
        void HandleTransportEvent(uint64_t generation, TransportEvent event,
            const std::string& detail);
        void Emit();
        void ReportDiagnostic(const std::string& message);

        std::vector<Segment> segments_;
        int active_index_ = -1;
        uint64_t generation_ = 0;
        PlaybackSummary summary_;

        std::vector<std::pair<int, StateCallback>> subscribers_;
        int next_subscriber_id_ = 1;
        DiagnosticCallback diagnostic_callback_;
        FinishedCallback finished_callback_;
    };

}  // namespace KUCHIPAKU

#endif
