#include "MixerTransport.hpp"

#include <iostream>

namespace KUCHIPAKU {

    bool OpenMixerAudio(int frequency, int chunk_size) {
        if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
            std::cerr << "SDL_InitSubSystem(SDL_INIT_AUDIO) failed: "
                << SDL_GetError() << "\n";
            return false;
        }
        if (Mix_OpenAudio(frequency, MIX_DEFAULT_FORMAT, 2, chunk_size) < 0) {
            std::cerr << "Mix_OpenAudio failed: " << Mix_GetError() << "\n";
            SDL_QuitSubSystem(SDL_INIT_AUDIO);
            return false;
        }
        return true;
    }

    void CloseMixerAudio() {
        Mix_CloseAudio();
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
    }

    MixerTransport::MixerTransport(const std::string& audio_path)
        : audio_path_(audio_path) {
    }

    MixerTransport::~MixerTransport() {
        if (audio_channel_ >= 0) {
            Mix_HaltChannel(audio_channel_);
            audio_channel_ = -1;
        }
        if (audio_clip_ != nullptr) {
            Mix_FreeChunk(audio_clip_);
            audio_clip_ = nullptr;
        }
    }

    bool MixerTransport::EnsureLoaded() {
        if (audio_clip_ != nullptr) {
            return true;
        }
        audio_clip_ = Mix_LoadWAV(audio_path_.c_str());
        if (audio_clip_ == nullptr) {
            last_error_ = std::string("Mix_LoadWAV failed for ") + audio_path_ +
                ": " + Mix_GetError();
            return false;
        }
        return true;
    }

    bool MixerTransport::Start(TransportEventCallback on_event) {
        Stop();
        last_error_.clear();
        if (!EnsureLoaded()) {
            return false;
        }

        audio_channel_ = Mix_PlayChannel(-1, audio_clip_, 0);
        if (audio_channel_ < 0) {
            last_error_ = std::string("Mix_PlayChannel failed: ") + Mix_GetError();
            return false;
        }

        on_event_ = std::move(on_event);
        audio_start_ticks_ = SDL_GetTicks();
        playing_ = true;
        return true;
    }

    void MixerTransport::Stop() {
        if (audio_channel_ >= 0) {
            Mix_HaltChannel(audio_channel_);
            audio_channel_ = -1;
        }
        playing_ = false;
        on_event_ = nullptr;
    }

    void MixerTransport::Poll() {
        if (!playing_ || audio_channel_ < 0) {
            return;
        }
        if (Mix_Playing(audio_channel_) != 0) {
            return;
        }

        // The channel went idle: the clip ran to its end.
        playing_ = false;
        audio_channel_ = -1;
        TransportEventCallback callback = std::move(on_event_);
        on_event_ = nullptr;
        const std::string detail = audio_path_;
        if (callback) {
            // The receiver may stop or destroy this transport.
            callback(TransportEvent::Ended, detail);
        }
    }

    double MixerTransport::GetPlayheadMs() const {
        if (!playing_) {
            return 0.0;
        }
        return static_cast<double>(SDL_GetTicks() - audio_start_ticks_);
    }

}  // namespace KUCHIPAKU
