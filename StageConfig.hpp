#ifndef STAGE_CONFIG_H_
#define STAGE_CONFIG_H_

#include <string>

#include <nlohmann/json.hpp>

#include "Segment.hpp"

namespace KUCHIPAKU {

    struct CharacterConfig {
        std::string name;
        std::string mesh_path = "head_variants/head3/mesh/head.obj";
        std::string morph_path = "../assets/phonemes/head_phonemes.json";
        int speaker_id = 1;
        // Morph target driven by the mouth-openness value.
        std::string mouth_shape = "JawOpen";
    };

    struct AudioConfig {
        int frequency = 44100;
        int chunk_size = 2048;
    };

    struct MirrorConfig {
        bool enabled = false;
        // Run through /bin/sh; receives mirror messages on stdin.
        std::string command = "./kuchipaku_viewer --display";
    };

    struct TimingConfig {
        // External helper printing timing JSON; empty means pre-rendered
        // timing files only.
        std::string command;
        std::string work_dir = "/tmp";
    };

    struct BlinkConfig {
        float interval_sec = 3.0f;
        float duration_sec = 0.16f;
    };

    struct StageConfig {
        CharacterConfig lead;
        CharacterConfig foil;
        AudioConfig audio;
        MirrorConfig mirror;
        TimingConfig timing;
        BlinkConfig blink;
        // Manifest loaded at startup, may be empty.
        std::string script_path;

        const CharacterConfig& GetCharacter(Role role) const;
    };

    StageConfig DefaultStageConfig();

    // Overlays the keys present in j onto *config. Keys with the wrong type
    // keep their current value and produce a warning. Returns false only when
    // j is not an object.
    bool ParseStageConfig(const nlohmann::json& j, StageConfig* config);

    // *config is reset to the defaults first. Returns false, keeping the
    // defaults, when the file cannot be read or parsed.
    bool LoadStageConfigFromFile(const std::string& path, StageConfig* config);

}  // namespace KUCHIPAKU

#endif
