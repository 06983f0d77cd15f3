#ifndef MIXER_TRANSPORT_H_
#define MIXER_TRANSPORT_H_

#include <string>

#include <SDL.h>
#include <SDL_mixer.h>

#include "Transport.hpp"

namespace KUCHIPAKU {

    // Opens the SDL audio subsystem and the mixer device. Returns false (after
    // logging why) when audio is unavailable; transports then fail to start.
    bool OpenMixerAudio(int frequency, int chunk_size);
    void CloseMixerAudio();

    // Plays one WAV file on a free SDL_mixer channel. Completion is detected by
    // polling Mix_Playing() from the frame loop, so no mixer callback ever runs
    // on the audio thread.
    class MixerTransport : public Transport {
    public:
        explicit MixerTransport(const std::string& audio_path);
        ~MixerTransport() override;

        MixerTransport(const MixerTransport&) = delete;
        MixerTransport& operator=(const MixerTransport&) = delete;

        bool Start(TransportEventCallback on_event) override;
        void Stop() override;
        void Poll() override;
        bool IsPlaying() const override { return playing_; }
        double GetPlayheadMs() const override;
        std::string GetLastError() const override { return last_error_; }

    private:
        // Loads the chunk on first use.
        bool EnsureLoaded();

        std::string audio_path_;
        Mix_Chunk* audio_clip_ = nullptr;
        int audio_channel_ = -1;
        bool playing_ = false;
        Uint32 audio_start_ticks_ = 0;
        std::string last_error_;
        TransportEventCallback on_event_;
    };

}  // namespace KUCHIPAKU

#endif
