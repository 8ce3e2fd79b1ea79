#pragma once

#include "ShaderStage.h"
#include <vector>
#include <string>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ShaderEmbed {

/**
 * @brief Shader compilation options
 *
 * Defaults match what a compilation run requests: no macro definitions,
 * no validation, Vulkan 1.3 / SPIR-V 1.6 target.
 */
struct CompilationOptions {
    bool optimizePerformance = false;   // Run glslang's SPIR-V optimizer
    bool generateDebugInfo = false;     // Include debug symbols
    int targetVulkanVersion = 130;      // 100, 110, 120, 130 (Vulkan 1.x.0)
    int targetSpirvVersion = 160;       // 100 .. 160 (SPIR-V 1.x)

    // Run the SPIRV-Tools validator on the produced module
    bool validateSpirv = false;
};

// Vulkan target versions accepted in CompilationOptions::targetVulkanVersion
bool IsSupportedVulkanVersion(int version);

// SPIR-V versions accepted in CompilationOptions::targetSpirvVersion
bool IsSupportedSpirvVersion(int version);

/**
 * @brief One compiler invocation
 */
struct CompileRequest {
    std::string_view source;
    ShaderStage stage = ShaderStage::InferFromSource;
    std::string virtualPath;            // Display-only name used in diagnostics
    std::string entryPoint = "main";
    CompilationOptions options;
};

/**
 * @brief Compilation result
 */
struct CompilationOutput {
    bool success = false;
    std::vector<uint32_t> spirv;        // Compiled SPIR-V words
    std::string errorLog;               // Compiler diagnostic on failure
    std::string infoLog;                // Warnings on success

    operator bool() const { return success; }
};

/**
 * @brief Compiler seam used by a compilation run
 *
 * A black box from (source, stage, virtual path, entry point) to either a
 * SPIR-V module or a diagnostic.
 */
class IShaderCompiler {
public:
    virtual ~IShaderCompiler() = default;

    virtual CompilationOutput Compile(const CompileRequest& request) = 0;
};

/**
 * @brief GLSL to SPIR-V compiler backed by glslang
 *
 * glslang's process state is initialised once and shared by every instance.
 */
class GlslangCompiler : public IShaderCompiler {
public:
    GlslangCompiler();
    ~GlslangCompiler() override = default;

    // Disable copy (glslang process state is shared)
    GlslangCompiler(const GlslangCompiler&) = delete;
    GlslangCompiler& operator=(const GlslangCompiler&) = delete;

    CompilationOutput Compile(const CompileRequest& request) override;

    /**
     * @brief Validate SPIR-V with SPIRV-Tools
     * @param outError Receives the first validator message on failure
     */
    static bool ValidateSpirv(const std::vector<uint32_t>& spirv, std::string& outError);

    /**
     * @brief Resolve the stage named by `#pragma shader_stage(<name>)`
     * @return Stage, or nullopt if the pragma is missing or names no stage
     */
    static std::optional<ShaderStage> DeduceStageFromSource(std::string_view source);
};

} // namespace ShaderEmbed
