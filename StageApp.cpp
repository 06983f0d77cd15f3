#include "StageApp.hpp"

#include <cstring>
#include <iostream>

#include <SDL.h>
#include "gloo/external.hpp"
#include "gloo/cameras/ArcBallCameraNode.hpp"
#include "gloo/lights/AmbientLight.hpp"
#include "gloo/lights/PointLight.hpp"
#include "gloo/lights/DirectionalLight.hpp"
#include "gloo/components/LightComponent.hpp"
#include "glm/gtc/constants.hpp"
#include "glm/gtx/quaternion.hpp"

#include "FileTimingSource.hpp"
#include "MixerTransport.hpp"
#include "PipelineTimingSource.hpp"

namespace KUCHIPAKU {

    using namespace GLOO;

    namespace {
        const glm::vec3 kLeadTint(0.2f, 0.22f, 0.3f);
        const glm::vec3 kFoilTint(0.3f, 0.22f, 0.2f);
        const ImVec4 kActiveLineColor(1.0f, 0.85f, 0.3f, 1.0f);
    }

    StageApp::StageApp(const std::string& app_name,
        glm::ivec2 window_size,
        const StageConfig& config,
        bool display_mode)
        : Application(app_name, window_size),
        config_(config),
        display_mode_(display_mode),
        lead_blink_(config.blink.interval_sec, config.blink.duration_sec),
        foil_blink_(config.blink.interval_sec, config.blink.duration_sec) {
        std::memset(script_path_buffer_, 0, sizeof(script_path_buffer_));
        std::strncpy(script_path_buffer_, config_.script_path.c_str(),
            sizeof(script_path_buffer_) - 1);
    }

    StageApp::~StageApp() {
        // Transports free their chunks before the mixer closes.
        stage_.reset();
        timing_source_.reset();
        mirror_.Close();
        if (audio_ready_) {
            CloseMixerAudio();
        }
    }

    void StageApp::SetupScene() {
        SceneNode& root = scene_->GetRootNode();

        glPolygonMode(GL_FRONT_AND_BACK, GL_FILL);
        glDisable(GL_CULL_FACE);
        glEnable(GL_DEPTH_TEST);

        GL_CHECK(glEnable(GL_BLEND));
        GL_CHECK(glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA));

        // Camera
        float distance = display_mode_ ? 3.0f : 4.5f;
        auto camera_node = std::make_unique<ArcBallCameraNode>(45.f, 0.75f, distance);
        scene_->ActivateCamera(camera_node->GetComponentPtr<CameraComponent>());
        root.AddChild(std::move(camera_node));

        // Lighting
        auto ambient_light = std::make_shared<AmbientLight>();
        ambient_light->SetAmbientColor(glm::vec3(0.2f));
        root.CreateComponent<LightComponent>(ambient_light);

        auto point_light = std::make_shared<PointLight>();
        point_light->SetAttenuation(glm::vec3(1.0f, 0.09f, 0.032f));
        auto point_light_node = std::make_unique<SceneNode>();
        point_light_node->CreateComponent<LightComponent>(point_light);
        point_light_node->GetTransform().SetPosition(glm::vec3(0.0f, 0.0f, 3.0f));
        root.AddChild(std::move(point_light_node));

        auto sun_light = std::make_shared<DirectionalLight>();
        sun_light->SetDiffuseColor(glm::vec3(0.6f));
        sun_light->SetSpecularColor(glm::vec3(0.4f));
        sun_light->SetDirection(glm::vec3(0.0f, 0.f, -1.0f));
        auto sun_light_node = std::make_unique<SceneNode>();
        sun_light_node->CreateComponent<LightComponent>(sun_light);
        root.AddChild(std::move(sun_light_node));

        if (display_mode_) {
            lead_head_ = AddHead(root, config_.lead, glm::vec3(0.0f), kLeadTint);
            mirror_source_ = std::make_unique<StdinMirrorSource>();
            return;
        }

        lead_head_ = AddHead(root, config_.lead, glm::vec3(-0.7f, 0.0f, 0.0f), kLeadTint);
        foil_head_ = AddHead(root, config_.foil, glm::vec3(0.7f, 0.0f, 0.0f), kFoilTint);
        SetupStage();
    }

    HeadNode* StageApp::AddHead(SceneNode& root, const CharacterConfig& character,
        const glm::vec3& position, const glm::vec3& tint) {
        auto head_node = std::make_unique<HeadNode>(character.mesh_path, character.morph_path,
            character.mouth_shape);
        HeadNode* head = head_node.get();
        head->GetTransform().SetPosition(position);

        // Rotate head so it faces the camera.
        glm::quat head_rot =
            glm::angleAxis(-glm::half_pi<float>(), glm::vec3(1.f, 0.f, 0.f));
        head->GetTransform().SetRotation(head_rot);
        head->SetTint(tint);
        head->SetMouthOpenness(0.0f);
        root.AddChild(std::move(head_node));
        return head;
    }

    void StageApp::SetupStage() {
        audio_ready_ = OpenMixerAudio(config_.audio.frequency, config_.audio.chunk_size);
        if (!audio_ready_) {
            status_ = "Audio unavailable; lines will be skipped.";
        }

        if (!config_.timing.command.empty()) {
            std::cout << "Timing data from helper: " << config_.timing.command << "\n";
            timing_source_ = std::make_unique<PipelineTimingSource>(config_.timing.command,
                config_.timing.work_dir);
        }
        else {
            timing_source_ = std::make_unique<FileTimingSource>();
        }

        stage_ = std::make_unique<Stage>(*timing_source_);
        stage_->AddCharacter(Role::Lead, lead_head_);
        stage_->AddCharacter(Role::Foil, foil_head_);

        stage_->GetSequencer().SetFinishedCallback([this](const PlaybackSummary& summary) {
            status_ = "Finished: " + std::to_string(summary.played) + " played, " +
                std::to_string(summary.failed) + " failed.";
            if (summary.played == 0 && summary.failed > 0) {
                status_ += " Nothing could be played.";
            }
        });

        if (config_.mirror.enabled) {
            if (mirror_.Open(config_.mirror.command)) {
                stage_->SetMirror(&mirror_);
            }
        }

        if (!config_.script_path.empty()) {
            LoadScript(config_.script_path);
        }
    }

    void StageApp::LoadScript(const std::string& path) {
        std::vector<ScriptLine> lines;
        if (!LoadScriptManifestFromFile(path, &lines)) {
            status_ = "Could not load " + path;
            return;
        }

        script_lines_ = lines;
        stage_->LoadSegments(MakeSegments(script_lines_, config_,
            [](const std::string& audio_path) -> std::unique_ptr<Transport> {
                return std::make_unique<MixerTransport>(audio_path);
            }));
        status_ = "Loaded " + std::to_string(script_lines_.size()) + " lines.";
    }

    // -----------------------------------------------------------------------------
    // Per-frame update. gloo calls DrawGUI once per Tick.
    // -----------------------------------------------------------------------------
    void StageApp::DrawGUI() {
        UpdateBlink();

        if (display_mode_) {
            UpdateDisplay();
            DrawDisplayPanel();
            return;
        }

        if (stage_) {
            stage_->Tick();
        }
        DrawDialoguePanel();
    }

    void StageApp::UpdateBlink() {
        Uint32 now = SDL_GetTicks();
        if (lead_head_ != nullptr) {
            lead_head_->SetBlinkWeight(lead_blink_.Update(now));
        }
        if (foil_head_ != nullptr) {
            foil_head_->SetBlinkWeight(foil_blink_.Update(now));
        }
    }

    void StageApp::UpdateDisplay() {
        if (!mirror_source_)
            return;

        bool was_closed = mirror_source_->IsClosed();
        for (const MirrorMessage& message : mirror_source_->Poll()) {
            mirrored_state_ = message.payload;
        }
        if (mirror_source_->IsClosed()) {
            mirrored_state_ = PlaybackState();
            if (!was_closed) {
                // The stage waits for this window when it shuts down.
                glfwSetWindowShouldClose(glfwGetCurrentContext(), GLFW_TRUE);
            }
        }

        if (lead_head_ != nullptr) {
            lead_head_->SetMouthOpenness(mirrored_state_.is_playing ? mirrored_state_.openness : 0.0f);
        }
    }

    void StageApp::DrawDialoguePanel() {
        ImGui::Begin("Dialogue");

        ImGui::InputText("Script", script_path_buffer_, sizeof(script_path_buffer_));
        ImGui::SameLine();
        if (ImGui::Button("Load")) {
            LoadScript(script_path_buffer_);
        }

        const PlaybackSequencer& sequencer = stage_->GetSequencer();
        bool playing = sequencer.IsPlaying();
        if (!playing) {
            if (ImGui::Button("Play") && !stage_->Play()) {
                if (sequencer.GetSegmentCount() == 0) {
                    status_ = "Load a script first.";
                }
            }
        }
        else {
            if (ImGui::Button("Stop")) {
                stage_->Stop();
                status_ = "Stopped.";
            }
        }

        if (mirror_.IsOpen()) {
            ImGui::Text("Mirror: connected (%d dropped)", mirror_.GetDroppedCount());
        }
        else {
            ImGui::Text("Mirror: off");
        }
        if (!status_.empty()) {
            ImGui::TextWrapped("%s", status_.c_str());
        }

        PlaybackState state = stage_->GetState();
        ImGui::ProgressBar(state.openness, ImVec2(-1.0f, 0.0f), "mouth");

        ImGui::Separator();
        for (size_t i = 0; i < script_lines_.size(); ++i) {
            const ScriptLine& line = script_lines_[i];
            const std::string& who = config_.GetCharacter(line.role).name;
            if (static_cast<int>(i) == state.active_index) {
                ImGui::TextColored(kActiveLineColor, "> %s: %s", who.c_str(), line.text.c_str());
            }
            else {
                ImGui::TextWrapped("  %s: %s", who.c_str(), line.text.c_str());
            }
        }

        ImGui::End();
    }

    void StageApp::DrawDisplayPanel() {
        ImGui::Begin("Display");
        if (mirror_source_ && mirror_source_->IsClosed()) {
            ImGui::Text("Stage disconnected.");
        }
        else {
            ImGui::Text("%s  line %d", mirrored_state_.is_playing ? "Playing" : "Idle",
                mirrored_state_.active_index);
        }
        ImGui::ProgressBar(mirrored_state_.openness, ImVec2(-1.0f, 0.0f), "mouth");
        ImGui::End();
    }

}  // namespace KUCHIPAKU
