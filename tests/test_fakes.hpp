#ifndef KUCHIPAKU_TEST_FAKES_H_
#define KUCHIPAKU_TEST_FAKES_H_

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "MouthTarget.hpp"
#include "Segment.hpp"
#include "TimingData.hpp"
#include "TimingSource.hpp"
#include "Transport.hpp"
#include "WindowMirror.hpp"

namespace KUCHIPAKU {
namespace fakes {

    // Shared with the test so it survives the transport being moved into a
    // segment list (or destroyed by Replace).
    struct TransportControl {
        int starts = 0;
        int stops = 0;
        bool fail_start = false;
        bool playing = false;
        double playhead_ms = 0.0;
        TransportEventCallback callback;

        // Delivers a completion the way a real transport does from Poll().
        // Returns false when no callback was pending.
        bool Fire(TransportEvent event, const std::string& detail = "") {
            TransportEventCallback pending = std::move(callback);
            callback = nullptr;
            playing = false;
            if (!pending)
                return false;
            pending(event, detail);
            return true;
        }
    };

    class FakeTransport : public Transport {
    public:
        explicit FakeTransport(std::shared_ptr<TransportControl> control)
            : control_(std::move(control)) {}

        bool Start(TransportEventCallback on_event) override {
            ++control_->starts;
            if (control_->fail_start) {
                return false;
            }
            control_->callback = std::move(on_event);
            control_->playing = true;
            return true;
        }

        void Stop() override {
            ++control_->stops;
            control_->playing = false;
            control_->callback = nullptr;
        }

        void Poll() override {}

        bool IsPlaying() const override { return control_->playing; }

        double GetPlayheadMs() const override {
            return control_->playing ? control_->playhead_ms : 0.0;
        }

        std::string GetLastError() const override {
            return control_->fail_start ? "device busy" : "";
        }

    private:
        std::shared_ptr<TransportControl> control_;
    };

    inline Segment MakeSegment(Role role, const std::string& text,
        const std::shared_ptr<TransportControl>& control) {
        Segment segment;
        segment.role = role;
        segment.text = text;
        segment.speaker_id = role == Role::Lead ? 1 : 2;
        segment.transport = std::make_unique<FakeTransport>(control);
        return segment;
    }

    // Requests are held until the test completes them.
    class FakeTimingSource : public TimingSource {
    public:
        struct PendingRequest {
            TimingRequest request;
            TimingCallback callback;
        };

        void Request(const TimingRequest& request, TimingCallback callback) override {
            requests.push_back(PendingRequest{request, std::move(callback)});
        }

        void Poll() override { ++polls; }

        size_t GetPendingCount() const override { return requests.size(); }

        // Completes the request at index; it is removed first so the callback
        // may issue new ones.
        void Complete(size_t index, bool ok, const TimingData& data) {
            PendingRequest pending = std::move(requests[index]);
            requests.erase(requests.begin() + static_cast<std::ptrdiff_t>(index));
            pending.callback(ok, data);
        }

        std::vector<PendingRequest> requests;
        int polls = 0;
    };

    class RecordingMirrorTarget : public MirrorTarget {
    public:
        bool IsOpen() const override { return open; }
        void PostMessage(const std::string& text) override { messages.push_back(text); }

        bool open = true;
        std::vector<std::string> messages;
    };

    class RecordingMouthTarget : public MouthTarget {
    public:
        void SetMouthOpenness(float openness) override { values.push_back(openness); }

        float Last() const { return values.empty() ? -1.0f : values.back(); }

        std::vector<float> values;
    };

    inline Mora MakeMora(const std::string& text, double start_ms, double end_ms) {
        Mora mora;
        mora.text = text;
        mora.start_ms = start_ms;
        mora.end_ms = end_ms;
        return mora;
    }

    // One phrase: a [0, 100) then i [100, 200).
    inline TimingData MakeSimpleTiming() {
        AccentPhrase phrase;
        phrase.moras.push_back(MakeMora("あ", 0.0, 100.0));
        phrase.moras.push_back(MakeMora("い", 100.0, 200.0));
        TimingData timing;
        timing.accent_phrases.push_back(phrase);
        return timing;
    }

}  // namespace fakes
}  // namespace KUCHIPAKU

#endif
