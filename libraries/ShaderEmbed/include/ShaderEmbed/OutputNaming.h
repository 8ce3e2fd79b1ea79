#pragma once

#include <filesystem>
#include <string>

namespace ShaderEmbed {

// Subdirectory of the build-output directory holding compiled artifacts
inline constexpr const char* SPIRV_OUTPUT_SUBDIR = "SPIR-V";

// Suffix appended to every artifact name
inline constexpr const char* SPIRV_OUTPUT_SUFFIX = ".spirv";

// Separator placed between flattened path components
inline constexpr const char* PATH_COMPONENT_SEPARATOR = "__";

/**
 * @brief Flatten a shader source path into a single file name
 *
 * Only ordinary components are kept (root names, root directories, "."
 * and ".." are dropped). They are joined with "__" and ".spirv" is
 * appended:
 *
 *   shaders/post/blur.comp -> shaders__post__blur.comp.spirv
 *
 * Paths whose ordinary-component sequences differ map to different names.
 */
std::string ShaderPathToFileName(const std::filesystem::path& path);

/**
 * @brief Full artifact path: <buildOutputDir>/SPIR-V/<flattened name>
 */
std::filesystem::path ShaderOutputPath(
    const std::filesystem::path& buildOutputDir,
    const std::filesystem::path& sourcePath
);

/**
 * @brief Artifact directory: <buildOutputDir>/SPIR-V
 */
std::filesystem::path SpirvOutputDirectory(const std::filesystem::path& buildOutputDir);

} // namespace ShaderEmbed
