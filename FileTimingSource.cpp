#include "FileTimingSource.hpp"

namespace KUCHIPAKU {

    void FileTimingSource::Request(const TimingRequest& request, TimingCallback callback) {
        pending_.emplace_back(request, std::move(callback));
    }

    void FileTimingSource::Poll() {
        // Only what was queued before this poll; callbacks may queue more.
        size_t count = pending_.size();
        for (size_t i = 0; i < count && !pending_.empty(); ++i) {
            auto entry = std::move(pending_.front());
            pending_.pop_front();

            TimingData data;
            bool ok = false;
            if (!entry.first.timing_path.empty()) {
                ok = LoadTimingDataFromFile(entry.first.timing_path, &data);
            }
            if (entry.second) {
                entry.second(ok && !data.empty(), data);
            }
        }
    }

}  // namespace KUCHIPAKU
