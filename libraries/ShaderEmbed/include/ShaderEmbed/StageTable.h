#pragma once

#include "ShaderStage.h"
#include <array>
#include <filesystem>
#include <optional>
#include <string_view>

namespace ShaderEmbed {

/**
 * @brief One row of the extension table
 */
struct StageExtension {
    std::string_view extension;   // Without the leading dot
    ShaderStage stage;
};

/**
 * @brief Fixed extension -> stage table
 *
 * Long and short forms alias the same stage for vertex, fragment and
 * geometry. ".glsl" defers the decision to the source contents.
 */
inline constexpr std::array<StageExtension, 18> STAGE_EXTENSIONS{{
    {"vert",  ShaderStage::Vertex},
    {"vs",    ShaderStage::Vertex},
    {"frag",  ShaderStage::Fragment},
    {"fs",    ShaderStage::Fragment},
    {"gs",    ShaderStage::Geometry},
    {"geom",  ShaderStage::Geometry},
    {"comp",  ShaderStage::Compute},
    {"tesc",  ShaderStage::TessControl},
    {"tese",  ShaderStage::TessEval},
    {"rgen",  ShaderStage::RayGen},
    {"rint",  ShaderStage::Intersection},
    {"rahit", ShaderStage::AnyHit},
    {"rchit", ShaderStage::ClosestHit},
    {"rmiss", ShaderStage::Miss},
    {"rcall", ShaderStage::Callable},
    {"mesh",  ShaderStage::Mesh},
    {"task",  ShaderStage::Task},
    {"glsl",  ShaderStage::InferFromSource},
}};

/**
 * @brief Look up a bare extension ("vert", not ".vert")
 * @return Stage, or nullopt when the extension is not a shader extension
 */
std::optional<ShaderStage> StageFromExtension(std::string_view extension);

/**
 * @brief Infer shader stage from a file path's extension
 *
 * Files without an extension (including dot-files such as ".vert")
 * yield nullopt.
 */
std::optional<ShaderStage> InferStageFromPath(const std::filesystem::path& path);

/**
 * @brief Canonical file extension for a stage (e.g. "vert", "frag")
 */
const char* GetShaderStageExtension(ShaderStage stage);

} // namespace ShaderEmbed
