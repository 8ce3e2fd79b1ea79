#include "ShaderEmbed/OutputNaming.h"

namespace ShaderEmbed {

namespace {

bool IsNormalComponent(const std::filesystem::path& component) {
    if (component.empty() || component == "." || component == "..") {
        return false;
    }
    // Root name ("C:") or root directory ("/")
    return !component.has_root_name() && !component.has_root_directory();
}

} // namespace

std::string ShaderPathToFileName(const std::filesystem::path& path) {
    std::string name;
    size_t index = 0;
    for (const auto& component : path) {
        if (!IsNormalComponent(component)) {
            continue;
        }
        if (index > 0) {
            name += PATH_COMPONENT_SEPARATOR;
        }
        name += component.string();
        ++index;
    }
    name += SPIRV_OUTPUT_SUFFIX;
    return name;
}

std::filesystem::path SpirvOutputDirectory(const std::filesystem::path& buildOutputDir) {
    return buildOutputDir / SPIRV_OUTPUT_SUBDIR;
}

std::filesystem::path ShaderOutputPath(
    const std::filesystem::path& buildOutputDir,
    const std::filesystem::path& sourcePath)
{
    return SpirvOutputDirectory(buildOutputDir) / ShaderPathToFileName(sourcePath);
}

} // namespace ShaderEmbed
