#ifndef STAGE_APP_H_
#define STAGE_APP_H_

#include <memory>
#include <string>
#include <vector>

#include "gloo/Application.hpp"
#include "BlinkController.hpp"
#include "HeadNode.hpp"
#include "MirrorChannel.hpp"
#include "ScriptManifest.hpp"
#include "Stage.hpp"
#include "StageConfig.hpp"
#include "TimingSource.hpp"

namespace KUCHIPAKU {

    // Stage mode: both characters side by side (LEAD left, FOIL right) with
    // the dialogue panel, playing a script manifest through SDL_mixer.
    // Display mode: a single head that only follows mirror messages on stdin.
    class StageApp : public GLOO::Application {
    public:
        StageApp(const std::string& app_name,
            glm::ivec2 window_size,
            const StageConfig& config,
            bool display_mode);
        ~StageApp() override;

        void SetupScene() override;

    protected:
        void DrawGUI() override;

    private:
        HeadNode* AddHead(GLOO::SceneNode& root, const CharacterConfig& character,
            const glm::vec3& position, const glm::vec3& tint);
        void SetupStage();
        void LoadScript(const std::string& path);

        void UpdateBlink();
        void UpdateDisplay();
        void DrawDialoguePanel();
        void DrawDisplayPanel();

        StageConfig config_;
        bool display_mode_;

        HeadNode* lead_head_ = nullptr;
        HeadNode* foil_head_ = nullptr;
        BlinkController lead_blink_;
        BlinkController foil_blink_;

        // Stage mode. The mirror and timing source outlive the stage.
        bool audio_ready_ = false;
        PipeMirrorTarget mirror_;
        std::unique_ptr<TimingSource> timing_source_;
        std::unique_ptr<Stage> stage_;
        std::vector<ScriptLine> script_lines_;
        char script_path_buffer_[512];
        std::string status_;

        // Display mode.
        std::unique_ptr<StdinMirrorSource> mirror_source_;
        PlaybackState mirrored_state_;
    };

}  // namespace KUCHIPAKU

#endif
