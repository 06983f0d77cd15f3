#include "BlinkController.hpp"

#include <algorithm>

namespace KUCHIPAKU {

    namespace {
        const float kMinDurationSec = 0.01f;
    }

    BlinkController::BlinkController(float interval_sec, float duration_sec)
        : blink_interval_sec_(std::max(0.0f, interval_sec)),
        blink_duration_sec_(std::max(kMinDurationSec, duration_sec)) {
    }

    void BlinkController::SetIntervalSec(float interval_sec) {
        blink_interval_sec_ = std::max(0.0f, interval_sec);
    }

    void BlinkController::SetDurationSec(float duration_sec) {
        blink_duration_sec_ = std::max(kMinDurationSec, duration_sec);
    }

    float BlinkController::Update(uint32_t now_ms) {
        if (!started_) {
            started_ = true;
            last_blink_ticks_ = now_ms;
        }

        float time_since_last_blink = (now_ms - last_blink_ticks_) / 1000.0f;

        if (!blink_active_ && time_since_last_blink >= blink_interval_sec_) {
            blink_active_ = true;
            blink_start_ticks_ = now_ms;
            last_blink_ticks_ = now_ms;
        }

        if (!blink_active_)
            return 0.0f;

        float t = (now_ms - blink_start_ticks_) / 1000.0f;
        if (t >= blink_duration_sec_) {
            blink_active_ = false;
            return 0.0f;
        }

        float u = t / blink_duration_sec_;
        if (u <= 0.5f) {
            return u / 0.5f;
        }
        else {
            return (1.0f - u) / 0.5f;
        }
    }

}  // namespace KUCHIPAKU
