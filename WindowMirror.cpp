#include "WindowMirror.hpp"

#include <cstdint>
#include <iostream>
#include <limits>

#include "glm/glm.hpp"

namespace KUCHIPAKU {

    using json = nlohmann::json;

    namespace {
        // A line longer than this is garbage; drop it instead of growing.
        const size_t kMaxLineBytes = 64 * 1024;
    }

    const char* MirrorMessageTypeName(MirrorMessageKind kind) {
        switch (kind) {
        case MirrorMessageKind::StateUpdate:
            return "STATE_UPDATE";
        }
        return "";
    }

    json EncodeMirrorMessage(const MirrorMessage& message) {
        json j;
        j["type"] = MirrorMessageTypeName(message.kind);
        j["payload"] = {
            {"isPlaying", message.payload.is_playing},
            {"opennessValue", message.payload.openness},
            {"activeIndex", message.payload.active_index}
        };
        return j;
    }

    bool DecodeMirrorMessage(const json& j, MirrorMessage* out) {
        if (!j.is_object())
            return false;

        auto type_it = j.find("type");
        if (type_it == j.end() || !type_it->is_string())
            return false;
        if (type_it->get<std::string>() != MirrorMessageTypeName(MirrorMessageKind::StateUpdate))
            return false;

        auto payload_it = j.find("payload");
        if (payload_it == j.end() || !payload_it->is_object())
            return false;
        const json& payload = *payload_it;

        auto playing_it = payload.find("isPlaying");
        if (playing_it == payload.end() || !playing_it->is_boolean())
            return false;

        MirrorMessage message;
        message.kind = MirrorMessageKind::StateUpdate;
        message.payload.is_playing = playing_it->get<bool>();

        auto openness_it = payload.find("opennessValue");
        if (openness_it != payload.end()) {
            if (!openness_it->is_number())
                return false;
            message.payload.openness = glm::clamp(openness_it->get<float>(), 0.0f, 1.0f);
        }

        auto index_it = payload.find("activeIndex");
        if (index_it != payload.end()) {
            if (!index_it->is_number_integer())
                return false;
            int64_t index = index_it->get<int64_t>();
            if (index < -1 || index > std::numeric_limits<int>::max())
                return false;
            message.payload.active_index = static_cast<int>(index);
        }

        *out = message;
        return true;
    }

    bool DecodeMirrorLine(const std::string& line, MirrorMessage* out) {
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded())
            return false;
        return DecodeMirrorMessage(j, out);
    }

    void SendState(MirrorTarget* target, const PlaybackState& state) {
        if (target == nullptr || !target->IsOpen())
            return;

        MirrorMessage message;
        message.payload = state;
        target->PostMessage(EncodeMirrorMessage(message).dump());
    }

    std::vector<MirrorMessage> MirrorReceiver::Feed(const std::string& chunk) {
        std::vector<MirrorMessage> messages;
        partial_ += chunk;

        size_t line_start = 0;
        size_t newline = partial_.find('\n', line_start);
        while (newline != std::string::npos) {
            std::string line = partial_.substr(line_start, newline - line_start);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (!line.empty()) {
                MirrorMessage message;
                if (DecodeMirrorLine(line, &message)) {
                    messages.push_back(message);
                }
                else {
                    ++rejected_count_;
                }
            }
            line_start = newline + 1;
            newline = partial_.find('\n', line_start);
        }
        partial_.erase(0, line_start);

        if (partial_.size() > kMaxLineBytes) {
            std::cerr << "Mirror: dropping oversized line (" << partial_.size() << " bytes)\n";
            partial_.clear();
            ++rejected_count_;
        }
        return messages;
    }

}  // namespace KUCHIPAKU
