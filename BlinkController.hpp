#ifndef BLINK_CONTROLLER_H_
#define BLINK_CONTROLLER_H_

#include <cstdint>

namespace KUCHIPAKU {

    // Periodic eye blink on wall-clock milliseconds (SDL_GetTicks in the
    // viewer). The weight ramps 0 -> 1 -> 0 linearly over one blink.
    class BlinkController {
    public:
        BlinkController(float interval_sec = 3.0f, float duration_sec = 0.16f);

        // Returns the blink weight in [0, 1] at now_ms.
        float Update(uint32_t now_ms);

        bool IsBlinking() const { return blink_active_; }
        float GetIntervalSec() const { return blink_interval_sec_; }
        float GetDurationSec() const { return blink_duration_sec_; }

        void SetIntervalSec(float interval_sec);
        void SetDurationSec(float duration_sec);

    private:
        bool started_ = false;
        bool blink_active_ = false;
        uint32_t blink_start_ticks_ = 0;
        uint32_t last_blink_ticks_ = 0;
        float blink_interval_sec_;
        float blink_duration_sec_;
    };

}  // namespace KUCHIPAKU

#endif
