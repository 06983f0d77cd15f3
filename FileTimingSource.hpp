#ifndef FILE_TIMING_SOURCE_H_
#define FILE_TIMING_SOURCE_H_

#include <deque>
#include <utility>

#include "TimingSource.hpp"

namespace KUCHIPAKU {

    // Serves timing data rendered ahead of time next to the audio. The file
    // named by the request is read on the next Poll(). Paths are used as
    // given; the script manifest has already resolved them.
    class FileTimingSource : public TimingSource {
    public:
        FileTimingSource() = default;

        void Request(const TimingRequest& request, TimingCallback callback) override;
        void Poll() override;
        size_t GetPendingCount() const override { return pending_.size(); }

    private:
        std::deque<std::pair<TimingRequest, TimingCallback>> pending_;
    };

}  // namespace KUCHIPAKU

#endif
