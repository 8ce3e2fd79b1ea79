#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vulkan/vulkan.h>

namespace ShaderEmbed {

/**
 * @brief A compiled shader baked into the consuming program
 *
 * identifier is the artifact name without ".spirv",
 * e.g. "shaders__post__blur.comp".
 */
struct EmbeddedShader {
    std::string_view identifier;
    std::span<const std::uint32_t> words;
};

/**
 * @brief Lookup in a generated shader table
 * @return Words, or an empty span for an unknown identifier
 */
template <std::size_t N>
constexpr std::span<const std::uint32_t> FindEmbeddedShader(
    const std::array<EmbeddedShader, N>& shaders,
    std::string_view identifier)
{
    for (const auto& shader : shaders) {
        if (shader.identifier == identifier) {
            return shader.words;
        }
    }
    return {};
}

/**
 * @brief Fill a VkShaderModuleCreateInfo for SPIR-V words
 *
 * The words must outlive the returned struct.
 */
inline VkShaderModuleCreateInfo MakeShaderModuleCreateInfo(std::span<const std::uint32_t> words) {
    VkShaderModuleCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    info.codeSize = words.size_bytes();
    info.pCode = words.data();
    return info;
}

} // namespace ShaderEmbed
