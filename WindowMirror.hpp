#ifndef WINDOW_MIRROR_H_
#define WINDOW_MIRROR_H_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "PlaybackSequencer.hpp"

namespace KUCHIPAKU {

    enum class MirrorMessageKind {
        StateUpdate
    };

    const char* MirrorMessageTypeName(MirrorMessageKind kind);

    // Only kind, and the PlaybackState fields that cross the boundary
    // (is_playing, openness, active_index), are carried.
    struct MirrorMessage {
        MirrorMessageKind kind = MirrorMessageKind::StateUpdate;
        PlaybackState payload;
    };

    // {"type":"STATE_UPDATE","payload":{"isPlaying","opennessValue","activeIndex"}}
    nlohmann::json EncodeMirrorMessage(const MirrorMessage& message);

    // Validates the tag and payload. isPlaying is required; opennessValue
    // defaults to 0 and is clamped to [0, 1]; activeIndex defaults to -1.
    bool DecodeMirrorMessage(const nlohmann::json& j, MirrorMessage* out);
    bool DecodeMirrorLine(const std::string& line, MirrorMessage* out);

    // Handle to the detached display window.
    class MirrorTarget {
    public:
        virtual ~MirrorTarget() = default;

        virtual bool IsOpen() const = 0;
        // Best effort. text is one serialized message without a newline.
        virtual void PostMessage(const std::string& text) = 0;
    };

    // Publishes one state update. Does nothing when target is null or closed.
    void SendState(MirrorTarget* target, const PlaybackState& state);

    // Reassembles newline-delimited messages from arbitrary chunks. Lines that
    // fail validation are dropped.
    class MirrorReceiver {
    public:
        std::vector<MirrorMessage> Feed(const std::string& chunk);

        int GetRejectedCount() const { return rejected_count_; }

    private:
        std::string partial_;
        int rejected_count_ = 0;
    };

}  // namespace KUCHIPAKU

#endif
