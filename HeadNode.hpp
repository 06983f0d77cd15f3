#ifndef HEAD_NODE_H_
#define HEAD_NODE_H_

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "glm/glm.hpp"
#include "gloo/SceneNode.hpp"
#include "gloo/VertexObject.hpp"
#include "gloo/shaders/ShaderProgram.hpp"

#include "MouthTarget.hpp"

namespace GLOO {
    class Material;
}

namespace KUCHIPAKU {

    // Morph-target head. The mesh is the basis plus a weighted sum of shape
    // offsets; the mouth is driven by one shape, the eyes by the blink pair.
    class HeadNode : public GLOO::SceneNode, public MouthTarget {
    public:
        HeadNode(const std::string& mesh_path, const std::string& morph_path,
            const std::string& mouth_shape);

        void SetMouthOpenness(float openness) override;
        void SetBlinkWeight(float weight);

        // Additive shape weight in [0, 1]; 0 removes the shape.
        void SetShapeWeight(const std::string& shape, float alpha);
        bool HasShape(const std::string& shape) const;

        void SetTint(const glm::vec3& diffuse);

    private:
        void LoadMesh(const std::string& mesh_path);
        void LoadMorphTargets(const std::string& json_path);

        void UploadPositionsAndRecomputeNormals(const std::vector<glm::vec3>& positions);

        // Combine basis + all active_weights_ into a single deformed mesh.
        void RecomputeFromWeights();

        std::shared_ptr<GLOO::ShaderProgram> shader_;
        std::shared_ptr<GLOO::VertexObject>  head_mesh_;

        // Neutral (basis) positions and per-shape target positions.
        std::vector<glm::vec3> basis_positions_;
        std::unordered_map<std::string, std::vector<glm::vec3>> shape_positions_;
        bool shapes_loaded_ = false;

        std::unordered_map<std::string, float> active_weights_;

        std::string mouth_shape_;

        std::shared_ptr<GLOO::Material> material_;
    };

}  // namespace KUCHIPAKU

#endif
