#include "ShaderEmbed/StageTable.h"
#include <algorithm>

namespace ShaderEmbed {

std::optional<ShaderStage> StageFromExtension(std::string_view extension) {
    auto it = std::find_if(STAGE_EXTENSIONS.begin(), STAGE_EXTENSIONS.end(),
        [extension](const StageExtension& row) {
            return row.extension == extension;
        });
    if (it == STAGE_EXTENSIONS.end()) {
        return std::nullopt;
    }
    return it->stage;
}

std::optional<ShaderStage> InferStageFromPath(const std::filesystem::path& path) {
    std::string ext = path.extension().string();

    // Remove leading dot
    if (ext.empty() || ext[0] != '.') {
        return std::nullopt;
    }
    return StageFromExtension(std::string_view(ext).substr(1));
}

const char* GetShaderStageExtension(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex:          return "vert";
        case ShaderStage::Fragment:        return "frag";
        case ShaderStage::Compute:         return "comp";
        case ShaderStage::Geometry:        return "geom";
        case ShaderStage::TessControl:     return "tesc";
        case ShaderStage::TessEval:        return "tese";
        case ShaderStage::Mesh:            return "mesh";
        case ShaderStage::Task:            return "task";
        case ShaderStage::RayGen:          return "rgen";
        case ShaderStage::Miss:            return "rmiss";
        case ShaderStage::ClosestHit:      return "rchit";
        case ShaderStage::AnyHit:          return "rahit";
        case ShaderStage::Intersection:    return "rint";
        case ShaderStage::Callable:        return "rcall";
        case ShaderStage::InferFromSource: return "glsl";
        default:                           return "unknown";
    }
}

} // namespace ShaderEmbed
