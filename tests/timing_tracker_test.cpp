#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "TimingTracker.hpp"
#include "test_fakes.hpp"

namespace KUCHIPAKU {
namespace {

    using fakes::FakeTimingSource;
    using fakes::MakeSegment;
    using fakes::MakeSimpleTiming;
    using fakes::TransportControl;

    class TimingTrackerTest : public ::testing::Test {
    protected:
        TimingTrackerTest()
            : tracker_(sequencer_, source_) {
            std::vector<Segment> segments;
            for (int i = 0; i < 2; ++i) {
                controls_.push_back(std::make_shared<TransportControl>());
                Role role = i == 0 ? Role::Lead : Role::Foil;
                segments.push_back(MakeSegment(role, "line " + std::to_string(i), controls_.back()));
            }
            segments[1].timing_path = "timing/line1.json";
            sequencer_.Replace(std::move(segments));
        }

        FakeTimingSource source_;
        PlaybackSequencer sequencer_;
        TimingTracker tracker_;
        std::vector<std::shared_ptr<TransportControl>> controls_;
    };

    TEST_F(TimingTrackerTest, NothingRequestedWhileIdle) {
        EXPECT_TRUE(source_.requests.empty());
        EXPECT_EQ(tracker_.GetActiveTiming(), nullptr);
    }

    TEST_F(TimingTrackerTest, RequestsTimingForActiveSegment) {
        ASSERT_TRUE(sequencer_.Start());
        ASSERT_EQ(source_.requests.size(), 1u);
        EXPECT_EQ(source_.requests[0].request.text, "line 0");
        EXPECT_EQ(source_.requests[0].request.speaker_id, 1);
        EXPECT_EQ(tracker_.GetActiveTiming(), nullptr);

        source_.Complete(0, true, MakeSimpleTiming());
        const TimingData* timing = tracker_.GetActiveTiming();
        ASSERT_NE(timing, nullptr);
        EXPECT_EQ(timing->accent_phrases.size(), 1u);
    }

    TEST_F(TimingTrackerTest, AdvancingDropsPreviousTiming) {
        ASSERT_TRUE(sequencer_.Start());
        source_.Complete(0, true, MakeSimpleTiming());
        ASSERT_NE(tracker_.GetActiveTiming(), nullptr);

        controls_[0]->Fire(TransportEvent::Ended);
        EXPECT_EQ(tracker_.GetActiveTiming(), nullptr);
        ASSERT_EQ(source_.requests.size(), 1u);
        EXPECT_EQ(source_.requests[0].request.text, "line 1");
        EXPECT_EQ(source_.requests[0].request.speaker_id, 2);
        EXPECT_EQ(source_.requests[0].request.timing_path, "timing/line1.json");
    }

    TEST_F(TimingTrackerTest, LateResultForPreviousSegmentIsDiscarded) {
        ASSERT_TRUE(sequencer_.Start());
        controls_[0]->Fire(TransportEvent::Ended);
        ASSERT_EQ(source_.requests.size(), 2u);

        // Segment 0's fetch finishes after segment 1 became active.
        source_.Complete(0, true, MakeSimpleTiming());
        EXPECT_EQ(tracker_.GetActiveTiming(), nullptr);
        EXPECT_EQ(tracker_.GetDiscardedCount(), 1);

        source_.Complete(0, true, MakeSimpleTiming());
        EXPECT_NE(tracker_.GetActiveTiming(), nullptr);
    }

    TEST_F(TimingTrackerTest, ResultAfterStopIsDiscarded) {
        ASSERT_TRUE(sequencer_.Start());
        sequencer_.Stop();
        source_.Complete(0, true, MakeSimpleTiming());
        EXPECT_EQ(tracker_.GetActiveTiming(), nullptr);
        EXPECT_EQ(tracker_.GetDiscardedCount(), 1);
    }

    TEST_F(TimingTrackerTest, StopClearsTiming) {
        ASSERT_TRUE(sequencer_.Start());
        source_.Complete(0, true, MakeSimpleTiming());
        sequencer_.Stop();
        EXPECT_EQ(tracker_.GetActiveTiming(), nullptr);
    }

    TEST_F(TimingTrackerTest, FailedFetchLeavesNoTiming) {
        ASSERT_TRUE(sequencer_.Start());
        source_.Complete(0, false, TimingData());
        EXPECT_EQ(tracker_.GetActiveTiming(), nullptr);
        EXPECT_EQ(tracker_.GetDiscardedCount(), 0);
    }

    TEST(TimingTrackerLifetimeTest, CompletionAfterTrackerIsGoneIsHarmless) {
        FakeTimingSource source;
        PlaybackSequencer sequencer;
        auto control = std::make_shared<TransportControl>();
        std::vector<Segment> segments;
        segments.push_back(MakeSegment(Role::Lead, "a", control));
        sequencer.Replace(std::move(segments));

        auto tracker = std::make_unique<TimingTracker>(sequencer, source);
        ASSERT_TRUE(sequencer.Start());
        ASSERT_EQ(source.requests.size(), 1u);
        tracker.reset();

        source.Complete(0, true, MakeSimpleTiming());
        // Still playing, and no subscriber points at the dead tracker.
        control->Fire(TransportEvent::Ended);
        EXPECT_FALSE(sequencer.IsPlaying());
    }

}  // namespace
}  // namespace KUCHIPAKU
