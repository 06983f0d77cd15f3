#ifndef TIMING_SOURCE_H_
#define TIMING_SOURCE_H_

#include <functional>
#include <string>

#include "TimingData.hpp"

namespace KUCHIPAKU {

    struct TimingRequest {
        std::string text;
        int speaker_id = 1;
        // Pre-rendered timing file for this line, may be empty.
        std::string timing_path;
    };

    // ok is false when no usable timing data could be obtained; data is then
    // empty.
    using TimingCallback = std::function<void(bool ok, const TimingData& data)>;

    // Asynchronous provider of per-utterance timing data. Requests are
    // fire-and-forget; callbacks run from Poll() on the frame thread, never
    // from inside Request().
    class TimingSource {
    public:
        virtual ~TimingSource() = default;

        virtual void Request(const TimingRequest& request, TimingCallback callback) = 0;
        virtual void Poll() = 0;
        // Requests that have not completed yet.
        virtual size_t GetPendingCount() const = 0;
    };

}  // namespace KUCHIPAKU

#endif
