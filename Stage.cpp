#include "Stage.hpp"

#include <utility>

namespace KUCHIPAKU {

    Stage::Stage(TimingSource& timing_source)
        : timing_source_(timing_source),
        tracker_(sequencer_, timing_source) {
        subscription_ = sequencer_.Subscribe(
            [this](const PlaybackState& state) { OnPlaybackState(state); });
    }

    Stage::~Stage() {
        sequencer_.Unsubscribe(subscription_);
    }

    void Stage::AddCharacter(Role role, MouthTarget* target) {
        RenderContext context;
        context.role = role;
        context.target = target;

        auto driver = std::make_unique<RenderDriver>(context, sequencer_, tracker_);
        driver->OnPlaybackState(sequencer_.GetState());

        for (auto& existing : drivers_) {
            if (existing->GetRole() == role) {
                existing = std::move(driver);
                return;
            }
        }
        drivers_.push_back(std::move(driver));
    }

    void Stage::LoadSegments(std::vector<Segment> segments) {
        sequencer_.Replace(std::move(segments));
    }

    bool Stage::Play() {
        return sequencer_.Start();
    }

    void Stage::Stop() {
        sequencer_.Stop();
    }

    void Stage::Tick() {
        sequencer_.Update();
        timing_source_.Poll();
        for (auto& driver : drivers_) {
            driver->Tick();
        }
        if (sequencer_.IsPlaying()) {
            SendState(mirror_, GetState());
        }
    }

    PlaybackState Stage::GetState() const {
        PlaybackState state = sequencer_.GetState();
        for (const auto& driver : drivers_) {
            if (driver->IsScheduled()) {
                state.openness = driver->GetOpenness();
                break;
            }
        }
        return state;
    }

    const RenderDriver* Stage::GetDriver(Role role) const {
        for (const auto& driver : drivers_) {
            if (driver->GetRole() == role)
                return driver.get();
        }
        return nullptr;
    }

    void Stage::OnPlaybackState(const PlaybackState& state) {
        for (auto& driver : drivers_) {
            driver->OnPlaybackState(state);
        }
        PlaybackState mirrored = state;
        mirrored.openness = 0.0f;
        SendState(mirror_, mirrored);
    }

}  // namespace KUCHIPAKU
