#include "PlaybackSequencer.hpp"

#include <algorithm>
#include <iostream>

namespace KUCHIPAKU {

    PlaybackSequencer::~PlaybackSequencer() {
        // Subscribers may already be gone; halt without publishing.
        HaltActive();
    }

    void PlaybackSequencer::Replace(std::vector<Segment> segments) {
        HaltActive();
        segments_ = std::move(segments);
        summary_ = PlaybackSummary();
        ++generation_;
        Emit();
    }

    bool PlaybackSequencer::Start() {
        if (IsPlaying() || segments_.empty()) {
            return false;
        }
        summary_ = PlaybackSummary();
        BeginFrom(0);
        return IsPlaying();
    }

    void PlaybackSequencer::Stop() {
        if (!IsPlaying()) {
            return;
        }
        HaltActive();
        Emit();
    }

    void PlaybackSequencer::OnSegmentEnd() {
        if (!IsPlaying()) {
            return;
        }
        ++summary_.played;
        Advance();
    }

    void PlaybackSequencer::Update() {
        if (!IsPlaying()) {
            return;
        }
        Transport* transport = segments_[active_index_].transport.get();
        if (transport != nullptr) {
            transport->Poll();
        }
    }

    int PlaybackSequencer::Subscribe(StateCallback callback) {
        int id = next_subscriber_id_++;
        subscribers_.emplace_back(id, std::move(callback));
        return id;
    }

    void PlaybackSequencer::Unsubscribe(int id) {
        subscribers_.erase(
            std::remove_if(subscribers_.begin(), subscribers_.end(),
                [id](const std::pair<int, StateCallback>& s) { return s.first == id; }),
            subscribers_.end());
    }

    PlaybackState PlaybackSequencer::GetState() const {
        PlaybackState state;
        state.is_playing = IsPlaying();
        state.active_index = active_index_;
        state.generation = generation_;
        return state;
    }

    const Segment* PlaybackSequencer::GetSegment(int index) const {
        if (index < 0 || static_cast<size_t>(index) >= segments_.size()) {
            return nullptr;
        }
        return &segments_[index];
    }

    void PlaybackSequencer::BeginFrom(size_t index) {
        for (size_t i = index; i < segments_.size(); ++i) {
            ++generation_;
            const uint64_t generation = generation_;
            Segment& segment = segments_[i];

            if (!segment.transport) {
                ++summary_.failed;
                ReportDiagnostic("Segment " + std::to_string(i) + " has no audio, skipping");
                continue;
            }

            active_index_ = static_cast<int>(i);
            bool started = segment.transport->Start(
                [this, generation](TransportEvent event, const std::string& detail) {
                    HandleTransportEvent(generation, event, detail);
                });
            if (started) {
                Emit();
                return;
            }

            active_index_ = -1;
            ++summary_.failed;
            ReportDiagnostic("Segment " + std::to_string(i) + " failed to start: " +
                segment.transport->GetLastError());
        }
        FinishRun();
    }

    void PlaybackSequencer::Advance() {
        size_t next = static_cast<size_t>(active_index_) + 1;
        Transport* transport = segments_[active_index_].transport.get();
        if (transport != nullptr) {
            transport->Stop();
        }
        active_index_ = -1;
        BeginFrom(next);
    }

    void PlaybackSequencer::FinishRun() {
        active_index_ = -1;
        ++generation_;
        if (summary_.played == 0 && summary_.failed > 0) {
            std::cerr << "Playback finished without playing any of "
                << summary_.failed << " segment(s)\n";
        }
        // Subscribers may Replace or Start from the Idle notification, which
        // resets summary_.
        const PlaybackSummary summary = summary_;
        Emit();
        if (finished_callback_) {
            finished_callback_(summary);
        }
    }

    void PlaybackSequencer::HaltActive() {
        if (IsPlaying()) {
            Transport* transport = segments_[active_index_].transport.get();
            if (transport != nullptr) {
                transport->Stop();
            }
        }
        active_index_ = -1;
        ++generation_;
    }

    void PlaybackSequencer::HandleTransportEvent(uint64_t generation, TransportEvent event,
        const std::string& detail) {
        if (generation != generation_ || !IsPlaying()) {
            return;
        }

        if (event == TransportEvent::Error) {
            ++summary_.failed;
            ReportDiagnostic("Segment " + std::to_string(active_index_) +
                " playback error: " + detail);
        }
        else {
            ++summary_.played;
        }
        Advance();
    }

    void PlaybackSequencer::Emit() {
        PlaybackState state = GetState();
        // Subscribers may subscribe, unsubscribe or drive the sequencer from
        // inside the callback.
        auto subscribers = subscribers_;
        for (const auto& subscriber : subscribers) {
            subscriber.second(state);
        }
    }

    void PlaybackSequencer::ReportDiagnostic(const std::string& message) {
        std::cerr << "PlaybackSequencer: " << message << "\n";
        if (diagnostic_callback_) {
            diagnostic_callback_(message);
        }
    }

}  // namespace KUCHIPAKU
