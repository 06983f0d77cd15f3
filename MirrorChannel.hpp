#ifndef MIRROR_CHANNEL_H_
#define MIRROR_CHANNEL_H_

#include <cstdio>
#include <string>
#include <vector>

#include "WindowMirror.hpp"

namespace KUCHIPAKU {

    // Launches the display window as a child process and writes mirror
    // messages to its stdin, one per line. Writes never block the frame loop:
    // a message that does not fit in the pipe is dropped, and a broken pipe
    // closes the target for good.
    class PipeMirrorTarget : public MirrorTarget {
    public:
        PipeMirrorTarget() = default;
        ~PipeMirrorTarget() override;

        PipeMirrorTarget(const PipeMirrorTarget&) = delete;
        PipeMirrorTarget& operator=(const PipeMirrorTarget&) = delete;

        bool Open(const std::string& command);
        void Close();

        bool IsOpen() const override { return pipe_ != nullptr; }
        void PostMessage(const std::string& text) override;

        int GetDroppedCount() const { return dropped_count_; }

    private:
        FILE* pipe_ = nullptr;
        int dropped_count_ = 0;
    };

    // Display-mode side of the pipe: drains stdin without blocking.
    class StdinMirrorSource {
    public:
        StdinMirrorSource();

        // Messages completed since the last call.
        std::vector<MirrorMessage> Poll();

        // True once the sender has gone away.
        bool IsClosed() const { return closed_; }
        int GetRejectedCount() const { return receiver_.GetRejectedCount(); }

    private:
        MirrorReceiver receiver_;
        bool closed_ = false;
    };

}  // namespace KUCHIPAKU

#endif
