#pragma once

#include "CompilationError.h"
#include "EmbeddedShader.h"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace ShaderEmbed {

// First word of every SPIR-V module
inline constexpr uint32_t SPIRV_MAGIC = 0x07230203;

/**
 * @brief Header generation settings
 */
struct EmbedHeaderOptions {
    std::string namespaceName = "ShaderEmbed::Generated";
    std::string macroName = "SHADER_EMBED_INCLUDE_SHADER";
};

/**
 * @brief Load a compiled artifact as 32-bit words
 *
 * Fails when the file cannot be read, is empty, or its byte length is not a
 * multiple of 4.
 */
std::expected<std::vector<uint32_t>, CompilationError> LoadSpirvWords(const std::filesystem::path& path);

/**
 * @brief Render a C++ header embedding every *.spirv file in @p spirvDir
 *
 * The header defines, inside options.namespaceName:
 * - one `inline constexpr std::uint32_t` array per artifact
 * - SHADERS, a table of ShaderEmbed::EmbeddedShader sorted by identifier
 * - Find(identifier), returning an empty span when unknown
 * - Require(identifier), consteval, ill-formed for an unknown identifier
 *
 * and the macro options.macroName(identifier) expanding to Require().
 *
 * Every malformed artifact is reported; any error means no header.
 */
std::expected<std::string, CompilationErrors> GenerateEmbedHeader(
    const std::filesystem::path& spirvDir,
    const EmbedHeaderOptions& options = {}
);

/**
 * @brief Generate and write the header
 *
 * The file is left untouched when its content would not change.
 * @return Number of embedded shaders
 */
std::expected<size_t, CompilationErrors> WriteEmbedHeader(
    const std::filesystem::path& spirvDir,
    const std::filesystem::path& headerPath,
    const EmbedHeaderOptions& options = {}
);

} // namespace ShaderEmbed
