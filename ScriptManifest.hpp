#ifndef SCRIPT_MANIFEST_H_
#define SCRIPT_MANIFEST_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Segment.hpp"
#include "StageConfig.hpp"

namespace KUCHIPAKU {

    // One line of a generated skit with its rendered audio.
    struct ScriptLine {
        Role role = Role::Lead;
        std::string text;
        std::string audio_path;
        std::string timing_path;
    };

    // Reads the script generator's response:
    //   {"script":[{"role","text"}], "audio_data":[{"role","audio_path","timing_path"?}]}
    // Entries are paired by position. Pairs with an unknown role, no text or no
    // audio are skipped with a warning. Relative paths resolve against base_dir
    // when it is set.
    std::vector<ScriptLine> ParseScriptManifest(const nlohmann::json& j,
        const std::string& base_dir = "");

    // Paths resolve against the manifest's directory. Returns false when the
    // file cannot be read or parsed.
    bool LoadScriptManifestFromFile(const std::string& path, std::vector<ScriptLine>* lines);

    using TransportFactory = std::function<std::unique_ptr<Transport>(const std::string& audio_path)>;

    // Builds one Segment per line, each with its own transport and the
    // speaker id configured for its role.
    std::vector<Segment> MakeSegments(const std::vector<ScriptLine>& lines,
        const StageConfig& config, const TransportFactory& make_transport);

}  // namespace KUCHIPAKU

#endif
