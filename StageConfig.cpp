#include "StageConfig.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>

namespace KUCHIPAKU {

    using json = nlohmann::json;

    namespace {

        std::string KeyPath(const std::string& section, const char* key) {
            return section.empty() ? std::string(key) : section + "." + key;
        }

        void WarnType(const std::string& key, const std::string& expected) {
            std::cerr << "WARNING: config key '" << key << "' should be " << expected
                << "; using default.\n";
        }

        void ReadString(const json& obj, const std::string& section, const char* key,
            std::string* value) {
            auto it = obj.find(key);
            if (it == obj.end())
                return;
            if (!it->is_string()) {
                WarnType(KeyPath(section, key), "a string");
                return;
            }
            *value = it->get<std::string>();
        }

        void ReadInt(const json& obj, const std::string& section, const char* key,
            int* value, int min_value) {
            auto it = obj.find(key);
            if (it == obj.end())
                return;
            if (!it->is_number_integer() || it->get<int64_t>() < min_value ||
                it->get<int64_t>() > std::numeric_limits<int>::max()) {
                WarnType(KeyPath(section, key), "an integer >= " + std::to_string(min_value));
                return;
            }
            *value = static_cast<int>(it->get<int64_t>());
        }

        void ReadFloat(const json& obj, const std::string& section, const char* key,
            float* value) {
            auto it = obj.find(key);
            if (it == obj.end())
                return;
            if (!it->is_number() || it->get<float>() < 0.0f) {
                WarnType(KeyPath(section, key), "a non-negative number");
                return;
            }
            *value = it->get<float>();
        }

        void ReadBool(const json& obj, const std::string& section, const char* key,
            bool* value) {
            auto it = obj.find(key);
            if (it == obj.end())
                return;
            if (!it->is_boolean()) {
                WarnType(KeyPath(section, key), "true or false");
                return;
            }
            *value = it->get<bool>();
        }

        // Returns nullptr when the section is absent or not an object.
        const json* FindSection(const json& parent, const std::string& name,
            const std::string& path) {
            auto it = parent.find(name);
            if (it == parent.end())
                return nullptr;
            if (!it->is_object()) {
                WarnType(path, "an object");
                return nullptr;
            }
            return &*it;
        }

        void ReadCharacter(const json& obj, const std::string& path, CharacterConfig* character) {
            ReadString(obj, path, "name", &character->name);
            ReadString(obj, path, "mesh_path", &character->mesh_path);
            ReadString(obj, path, "morph_path", &character->morph_path);
            ReadInt(obj, path, "speaker_id", &character->speaker_id, 0);
            ReadString(obj, path, "mouth_shape", &character->mouth_shape);
        }

    }  // namespace

    const CharacterConfig& StageConfig::GetCharacter(Role role) const {
        return role == Role::Lead ? lead : foil;
    }

    StageConfig DefaultStageConfig() {
        StageConfig config;
        config.lead.name = "Tsukkomi";
        config.lead.speaker_id = 1;
        config.foil.name = "Boke";
        config.foil.speaker_id = 2;
        return config;
    }

    bool ParseStageConfig(const json& j, StageConfig* config) {
        if (!j.is_object()) {
            std::cerr << "ERROR: config root must be a JSON object\n";
            return false;
        }

        if (const json* characters = FindSection(j, "characters", "characters")) {
            if (const json* lead = FindSection(*characters, "lead", "characters.lead"))
                ReadCharacter(*lead, "characters.lead", &config->lead);
            if (const json* foil = FindSection(*characters, "foil", "characters.foil"))
                ReadCharacter(*foil, "characters.foil", &config->foil);
        }

        if (const json* audio = FindSection(j, "audio", "audio")) {
            ReadInt(*audio, "audio", "frequency", &config->audio.frequency, 1);
            ReadInt(*audio, "audio", "chunk_size", &config->audio.chunk_size, 1);
        }

        if (const json* mirror = FindSection(j, "mirror", "mirror")) {
            ReadBool(*mirror, "mirror", "enabled", &config->mirror.enabled);
            ReadString(*mirror, "mirror", "command", &config->mirror.command);
        }

        if (const json* timing = FindSection(j, "timing", "timing")) {
            ReadString(*timing, "timing", "command", &config->timing.command);
            ReadString(*timing, "timing", "work_dir", &config->timing.work_dir);
        }

        if (const json* blink = FindSection(j, "blink", "blink")) {
            ReadFloat(*blink, "blink", "interval_sec", &config->blink.interval_sec);
            ReadFloat(*blink, "blink", "duration_sec", &config->blink.duration_sec);
        }

        ReadString(j, "", "script_path", &config->script_path);
        return true;
    }

    bool LoadStageConfigFromFile(const std::string& path, StageConfig* config) {
        *config = DefaultStageConfig();

        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "Failed to open config: " << path << "\n";
            return false;
        }

        json j;
        try {
            f >> j;
        }
        catch (const std::exception& e) {
            std::cerr << "Failed to parse config (" << path << "): " << e.what() << "\n";
            return false;
        }

        StageConfig parsed = *config;
        if (!ParseStageConfig(j, &parsed))
            return false;

        *config = parsed;
        std::cout << "Loaded config from: " << path << "\n";
        return true;
    }

}  // namespace KUCHIPAKU
