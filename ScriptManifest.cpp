#include "ScriptManifest.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

namespace KUCHIPAKU {

    using json = nlohmann::json;

    namespace {

        std::string ResolvePath(const std::string& base_dir, const std::string& path) {
            if (path.empty() || base_dir.empty() || path[0] == '/')
                return path;
            if (base_dir.back() == '/')
                return base_dir + path;
            return base_dir + "/" + path;
        }

        std::string StringField(const json& obj, const char* key) {
            auto it = obj.find(key);
            if (it == obj.end() || !it->is_string())
                return std::string();
            return it->get<std::string>();
        }

        std::string DirectoryOf(const std::string& path) {
            size_t slash = path.find_last_of('/');
            if (slash == std::string::npos)
                return std::string();
            if (slash == 0)
                return "/";
            return path.substr(0, slash);
        }

    }  // namespace

    std::vector<ScriptLine> ParseScriptManifest(const json& j, const std::string& base_dir) {
        std::vector<ScriptLine> lines;
        if (!j.is_object()) {
            std::cerr << "Script manifest must be a JSON object\n";
            return lines;
        }

        auto script_it = j.find("script");
        auto audio_it = j.find("audio_data");
        if (script_it == j.end() || !script_it->is_array()) {
            std::cerr << "Script manifest has no script array\n";
            return lines;
        }
        if (audio_it == j.end() || !audio_it->is_array()) {
            std::cerr << "Script manifest has no audio_data array\n";
            return lines;
        }

        const json& script = *script_it;
        const json& audio = *audio_it;
        if (script.size() != audio.size()) {
            std::cerr << "WARNING: script has " << script.size() << " lines but "
                << audio.size() << " audio entries; extra entries ignored.\n";
        }

        size_t count = std::min(script.size(), audio.size());
        for (size_t i = 0; i < count; ++i) {
            const json& line_json = script[i];
            const json& audio_json = audio[i];
            if (!line_json.is_object() || !audio_json.is_object()) {
                std::cerr << "WARNING: skipping malformed script entry " << i << "\n";
                continue;
            }

            ScriptLine line;
            const std::string role_name = StringField(line_json, "role");
            if (!ParseRole(role_name, &line.role)) {
                std::cerr << "WARNING: skipping script entry " << i
                    << " with unknown role '" << role_name << "'\n";
                continue;
            }

            Role audio_role;
            const std::string audio_role_name = StringField(audio_json, "role");
            if (!audio_role_name.empty() && ParseRole(audio_role_name, &audio_role) &&
                audio_role != line.role) {
                std::cerr << "WARNING: audio entry " << i << " is tagged '" << audio_role_name
                    << "' but the line belongs to '" << role_name << "'\n";
            }

            line.text = StringField(line_json, "text");
            line.audio_path = ResolvePath(base_dir, StringField(audio_json, "audio_path"));
            line.timing_path = ResolvePath(base_dir, StringField(audio_json, "timing_path"));
            if (line.text.empty() || line.audio_path.empty()) {
                std::cerr << "WARNING: skipping script entry " << i << " without text or audio\n";
                continue;
            }
            lines.push_back(line);
        }
        return lines;
    }

    bool LoadScriptManifestFromFile(const std::string& path, std::vector<ScriptLine>* lines) {
        lines->clear();

        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "Failed to open script manifest: " << path << "\n";
            return false;
        }

        json j;
        try {
            f >> j;
        }
        catch (const std::exception& e) {
            std::cerr << "Failed to parse script manifest: " << e.what() << "\n";
            return false;
        }

        *lines = ParseScriptManifest(j, DirectoryOf(path));
        std::cout << "Loaded script manifest from: " << path
            << "  (#lines = " << lines->size() << ")\n";
        return true;
    }

    std::vector<Segment> MakeSegments(const std::vector<ScriptLine>& lines,
        const StageConfig& config, const TransportFactory& make_transport) {
        std::vector<Segment> segments;
        segments.reserve(lines.size());
        for (const ScriptLine& line : lines) {
            Segment segment;
            segment.role = line.role;
            segment.text = line.text;
            segment.speaker_id = config.GetCharacter(line.role).speaker_id;
            segment.timing_path = line.timing_path;
            segment.transport = make_transport(line.audio_path);
            segments.push_back(std::move(segment));
        }
        return segments;
    }

}  // namespace KUCHIPAKU
