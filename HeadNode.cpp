#include "HeadNode.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>
#include "gloo/Material.hpp"
#include "gloo/MeshLoader.hpp"
#include "gloo/external.hpp"
#include "gloo/components/MaterialComponent.hpp"
#include "gloo/components/RenderingComponent.hpp"
#include "gloo/components/ShadingComponent.hpp"
#include "gloo/shaders/PhongShader.hpp"

namespace KUCHIPAKU {

    using json = nlohmann::json;
    using namespace GLOO;

    namespace {
        const char* const kBlinkLeft = "EyeBlink_L";
        const char* const kBlinkRight = "EyeBlink_R";
        // Smaller changes are not worth a mesh upload.
        const float kWeightEpsilon = 1e-3f;
    }

    HeadNode::HeadNode(const std::string& mesh_path, const std::string& morph_path,
        const std::string& mouth_shape)
        : SceneNode(),
        mouth_shape_(mouth_shape) {
        shader_ = std::make_shared<PhongShader>();
        LoadMesh(mesh_path);

        std::cout << "Looking for morph targets at: " << morph_path << std::endl;
        LoadMorphTargets(morph_path);
        if (shapes_loaded_ && !HasShape(mouth_shape_)) {
            std::cerr << "WARNING: mouth shape '" << mouth_shape_
                << "' not found; the mouth will not move.\n";
        }

        material_ = std::make_shared<Material>(Material::GetDefault());
        material_->SetAmbientColor(glm::vec3(0.02f, 0.03f, 0.04f));
        material_->SetDiffuseColor(glm::vec3(0.2f, 0.2f, 0.2f));
        material_->SetSpecularColor(glm::vec3(0.9f, 0.9f, 0.95f));
        material_->SetShininess(200.0f);

        if (!head_mesh_)
            return;

        auto mesh_node = std::make_unique<SceneNode>();
        mesh_node->CreateComponent<ShadingComponent>(shader_);
        mesh_node->CreateComponent<MaterialComponent>(material_);
        mesh_node->CreateComponent<RenderingComponent>(head_mesh_);
        AddChild(std::move(mesh_node));

        if (shapes_loaded_ && !basis_positions_.empty()) {
            UploadPositionsAndRecomputeNormals(basis_positions_);
        }
    }

    void HeadNode::LoadMesh(const std::string& mesh_path) {
        auto result = MeshLoader::Import(mesh_path);
        head_mesh_ = std::move(result.vertex_obj);
        if (!head_mesh_) {
            std::cerr << "ERROR: Failed to load mesh from " << mesh_path << "\n";
            return;
        }
        std::cout << "Loaded head mesh from: " << mesh_path
            << "  (#verts = " << head_mesh_->GetPositions().size() << ")\n";
    }

    void HeadNode::LoadMorphTargets(const std::string& json_path) {
        shapes_loaded_ = false;

        std::ifstream file(json_path);
        if (!file.is_open()) {
            std::cerr << "WARNING: Could not open morph target file: " << json_path << "\n";
            return;
        }

        json j;
        try {
            file >> j;
        }
        catch (const std::exception& e) {
            std::cerr << "ERROR: Failed to parse morph targets (" << json_path
                << "): " << e.what() << "\n";
            return;
        }

        if (!head_mesh_) {
            std::cerr << "WARNING: Mesh not loaded before morph targets.\n";
            return;
        }

        auto count_it = j.find("vertex_count");
        auto basis_it = j.find("basis");
        auto shapes_it = j.find("phonemes");
        if (count_it == j.end() || basis_it == j.end() || shapes_it == j.end() ||
            !count_it->is_number_integer() || !basis_it->is_array() || !shapes_it->is_object()) {
            std::cerr << "ERROR: morph targets need vertex_count/basis/phonemes\n";
            return;
        }

        int json_vcount = count_it->get<int>();
        if (json_vcount <= 0) {
            std::cerr << "ERROR: morph vertex_count invalid: " << json_vcount << "\n";
            return;
        }

        size_t mesh_vcount = head_mesh_->GetPositions().size();
        if (mesh_vcount != static_cast<size_t>(json_vcount)) {
            std::cerr << "WARNING: Mesh verts (" << mesh_vcount
                << ") != morph vertex_count (" << json_vcount << "). Using min.\n";
        }
        size_t N = std::min(mesh_vcount, static_cast<size_t>(json_vcount));

        try {
            std::vector<glm::vec3> basis(N);
            for (size_t i = 0; i < N; ++i) {
                const json& v = basis_it->at(i);
                basis[i] = glm::vec3(v.at(0).get<float>(), v.at(1).get<float>(),
                    v.at(2).get<float>());
            }

            std::unordered_map<std::string, std::vector<glm::vec3>> shapes;
            for (auto it = shapes_it->begin(); it != shapes_it->end(); ++it) {
                std::vector<glm::vec3> pose(N);
                for (size_t i = 0; i < N; ++i) {
                    const json& v = it.value().at(i);
                    pose[i] = glm::vec3(v.at(0).get<float>(), v.at(1).get<float>(),
                        v.at(2).get<float>());
                }
                shapes[it.key()] = std::move(pose);
            }

            basis_positions_ = std::move(basis);
            shape_positions_ = std::move(shapes);
        }
        catch (const std::exception& e) {
            std::cerr << "ERROR: Malformed morph targets (" << json_path << "): "
                << e.what() << "\n";
            return;
        }

        shapes_loaded_ = true;
        std::cout << "Loaded morph targets from: " << json_path
            << "  (#shapes = " << shape_positions_.size() << ")\n";
    }

    void HeadNode::UploadPositionsAndRecomputeNormals(
        const std::vector<glm::vec3>& positions) {
        if (!head_mesh_)
            return;

        const auto& idx = head_mesh_->GetIndices();
        size_t NV = positions.size();
        std::vector<glm::vec3> new_nrm(NV, glm::vec3(0.f));

        for (size_t t = 0; t + 2 < idx.size(); t += 3) {
            uint32_t i0 = idx[t + 0];
            uint32_t i1 = idx[t + 1];
            uint32_t i2 = idx[t + 2];
            if (i0 >= NV || i1 >= NV || i2 >= NV)
                continue;

            glm::vec3 fn = glm::cross(positions[i1] - positions[i0],
                positions[i2] - positions[i0]);
            new_nrm[i0] += fn;
            new_nrm[i1] += fn;
            new_nrm[i2] += fn;
        }

        for (glm::vec3& n : new_nrm) {
            float len = glm::length(n);
            n = len > 0.0f ? n / len : glm::vec3(0.0f, 0.0f, 1.0f);
        }

        head_mesh_->UpdatePositions(std::make_unique<PositionArray>(positions));
        head_mesh_->UpdateNormals(std::make_unique<PositionArray>(std::move(new_nrm)));
    }

    // -----------------------------------------------------------------------------
    // basis + sum_i w_i (pose_i - basis)
    // -----------------------------------------------------------------------------
    void HeadNode::RecomputeFromWeights() {
        if (!head_mesh_ || basis_positions_.empty())
            return;

        std::vector<glm::vec3> blended = basis_positions_;
        size_t N = blended.size();

        for (const auto& kv : active_weights_) {
            float w = kv.second;
            if (w == 0.0f)
                continue;

            auto it = shape_positions_.find(kv.first);
            if (it == shape_positions_.end())
                continue;

            const auto& pose = it->second;
            size_t M = std::min(N, pose.size());
            for (size_t i = 0; i < M; ++i) {
                blended[i] += w * (pose[i] - basis_positions_[i]);
            }
        }

        UploadPositionsAndRecomputeNormals(blended);
    }

    void HeadNode::SetShapeWeight(const std::string& shape, float alpha) {
        alpha = glm::clamp(alpha, 0.0f, 1.0f);
        if (!shapes_loaded_ || !HasShape(shape))
            return;

        auto it = active_weights_.find(shape);
        float current = it == active_weights_.end() ? 0.0f : it->second;
        if (std::fabs(current - alpha) < kWeightEpsilon && (alpha > 0.0f || current == 0.0f))
            return;

        if (alpha <= 0.0f) {
            active_weights_.erase(shape);
        }
        else {
            active_weights_[shape] = alpha;
        }
        RecomputeFromWeights();
    }

    void HeadNode::SetMouthOpenness(float openness) {
        SetShapeWeight(mouth_shape_, openness);
    }

    void HeadNode::SetBlinkWeight(float weight) {
        SetShapeWeight(kBlinkLeft, weight);
        SetShapeWeight(kBlinkRight, weight);
    }

    void HeadNode::SetTint(const glm::vec3& diffuse) {
        material_->SetDiffuseColor(diffuse);
    }

    bool HeadNode::HasShape(const std::string& shape) const {
        return shape_positions_.find(shape) != shape_positions_.end();
    }

}  // namespace KUCHIPAKU
