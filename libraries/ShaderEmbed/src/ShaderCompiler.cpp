#include "ShaderEmbed/ShaderCompiler.h"
#include <glslang/Public/ShaderLang.h>
#include <glslang/Public/ResourceLimits.h>
#include <glslang/SPIRV/GlslangToSpv.h>
#include <spirv-tools/libspirv.hpp>
#include <array>
#include <cctype>
#include <mutex>
#include <utility>

namespace ShaderEmbed {

namespace {

// Initialize glslang process (global, once per process)
std::once_flag s_glslangInit;

// Default GLSL version assumed when the source has no #version line
constexpr int DEFAULT_GLSL_VERSION = 450;

constexpr std::array<std::pair<std::string_view, ShaderStage>, 17> PRAGMA_STAGE_NAMES{{
    {"vertex",       ShaderStage::Vertex},
    {"fragment",     ShaderStage::Fragment},
    {"geometry",     ShaderStage::Geometry},
    {"compute",      ShaderStage::Compute},
    {"tesscontrol",  ShaderStage::TessControl},
    {"tesseval",     ShaderStage::TessEval},
    {"raygen",       ShaderStage::RayGen},
    {"intersect",    ShaderStage::Intersection},
    {"intersection", ShaderStage::Intersection},
    {"anyhit",       ShaderStage::AnyHit},
    {"closest",      ShaderStage::ClosestHit},
    {"closesthit",   ShaderStage::ClosestHit},
    {"miss",         ShaderStage::Miss},
    {"callable",     ShaderStage::Callable},
    {"mesh",         ShaderStage::Mesh},
    {"task",         ShaderStage::Task},
    {"amplification", ShaderStage::Task},
}};

// Convert ShaderStage to glslang EShLanguage
EShLanguage GetGlslangStage(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex:       return EShLangVertex;
        case ShaderStage::Fragment:     return EShLangFragment;
        case ShaderStage::Compute:      return EShLangCompute;
        case ShaderStage::Geometry:     return EShLangGeometry;
        case ShaderStage::TessControl:  return EShLangTessControl;
        case ShaderStage::TessEval:     return EShLangTessEvaluation;
        case ShaderStage::Mesh:         return EShLangMesh;
        case ShaderStage::Task:         return EShLangTask;
        case ShaderStage::RayGen:       return EShLangRayGen;
        case ShaderStage::Miss:         return EShLangMiss;
        case ShaderStage::ClosestHit:   return EShLangClosestHit;
        case ShaderStage::AnyHit:       return EShLangAnyHit;
        case ShaderStage::Intersection: return EShLangIntersect;
        case ShaderStage::Callable:     return EShLangCallable;
        default:                        return EShLangVertex;
    }
}

std::string_view TrimLeft(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    return text.substr(start);
}

struct StagePragma {
    size_t lineBegin = 0;
    size_t lineEnd = 0;
    std::string_view name;
};

// Copy of the source with every comment character replaced by a space.
// Newlines are kept so offsets and line numbers match the original.
std::string MaskComments(std::string_view source) {
    std::string masked(source);
    enum class State { Code, LineComment, BlockComment };
    State state = State::Code;

    for (size_t i = 0; i < masked.size(); ++i) {
        char c = masked[i];
        char next = i + 1 < masked.size() ? masked[i + 1] : '\0';
        switch (state) {
            case State::Code:
                if (c == '/' && next == '/') {
                    state = State::LineComment;
                    masked[i] = masked[i + 1] = ' ';
                    ++i;
                } else if (c == '/' && next == '*') {
                    state = State::BlockComment;
                    masked[i] = masked[i + 1] = ' ';
                    ++i;
                }
                break;
            case State::LineComment:
                if (c == '\n') {
                    state = State::Code;
                } else {
                    masked[i] = ' ';
                }
                break;
            case State::BlockComment:
                if (c == '*' && next == '/') {
                    state = State::Code;
                    masked[i] = masked[i + 1] = ' ';
                    ++i;
                } else if (c != '\n') {
                    masked[i] = ' ';
                }
                break;
        }
    }
    return masked;
}

// Locates the first `#pragma shader_stage(<name>)` line outside comments
std::optional<StagePragma> FindStagePragma(std::string_view source) {
    const std::string masked = MaskComments(source);
    const std::string_view code = masked;

    size_t lineBegin = 0;
    while (lineBegin <= code.size()) {
        size_t lineEnd = code.find('\n', lineBegin);
        if (lineEnd == std::string_view::npos) {
            lineEnd = code.size();
        }

        std::string_view line = TrimLeft(code.substr(lineBegin, lineEnd - lineBegin));
        if (line.starts_with('#')) {
            line = TrimLeft(line.substr(1));
            if (line.starts_with("pragma")) {
                line = TrimLeft(line.substr(6));
                if (line.starts_with("shader_stage")) {
                    line = TrimLeft(line.substr(12));
                    size_t close = line.find(')');
                    if (line.starts_with('(') && close != std::string_view::npos) {
                        std::string_view name = TrimLeft(line.substr(1, close - 1));
                        while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
                            name.remove_suffix(1);
                        }
                        // Report the name as a view into the caller's source
                        size_t offset = static_cast<size_t>(name.data() - code.data());
                        return StagePragma{lineBegin, lineEnd, source.substr(offset, name.size())};
                    }
                }
            }
        }

        if (lineEnd == code.size()) {
            break;
        }
        lineBegin = lineEnd + 1;
    }
    return std::nullopt;
}

} // namespace

bool IsSupportedVulkanVersion(int version) {
    return version == 100 || version == 110 || version == 120 || version == 130;
}

bool IsSupportedSpirvVersion(int version) {
    return version >= 100 && version <= 160 && version % 10 == 0;
}

GlslangCompiler::GlslangCompiler() {
    // glslang::FinalizeProcess() is never called: the state is shared by all instances
    std::call_once(s_glslangInit, [] { glslang::InitializeProcess(); });
}

std::optional<ShaderStage> GlslangCompiler::DeduceStageFromSource(std::string_view source) {
    auto pragma = FindStagePragma(source);
    if (!pragma) {
        return std::nullopt;
    }
    for (const auto& [name, stage] : PRAGMA_STAGE_NAMES) {
        if (name == pragma->name) {
            return stage;
        }
    }
    return std::nullopt;
}

CompilationOutput GlslangCompiler::Compile(const CompileRequest& request) {
    CompilationOutput output;

    ShaderStage stage = request.stage;
    std::string source(request.source);

    if (stage == ShaderStage::InferFromSource) {
        auto deduced = DeduceStageFromSource(source);
        if (!deduced) {
            output.errorLog = request.virtualPath +
                ": error: failed to deduce shader stage: no #pragma shader_stage(<stage>) naming a known stage";
            return output;
        }
        stage = *deduced;

        // Blank the pragma line so glslang sees the same line numbering
        auto pragma = FindStagePragma(source);
        source.replace(pragma->lineBegin, pragma->lineEnd - pragma->lineBegin, "");
    }

    EShLanguage shaderStage = GetGlslangStage(stage);
    const CompilationOptions& options = request.options;

    glslang::TShader shader(shaderStage);

    const char* sourceStr = source.c_str();
    const int sourceLength = static_cast<int>(source.size());
    const char* nameStr = request.virtualPath.c_str();
    shader.setStringsWithLengthsAndNames(&sourceStr, &sourceLength, &nameStr, 1);

    shader.setEntryPoint(request.entryPoint.c_str());
    shader.setSourceEntryPoint(request.entryPoint.c_str());

    int vulkanVersion = options.targetVulkanVersion;
    glslang::EShTargetClientVersion clientVersion = glslang::EShTargetVulkan_1_3;
    switch (vulkanVersion) {
        case 100: clientVersion = glslang::EShTargetVulkan_1_0; break;
        case 110: clientVersion = glslang::EShTargetVulkan_1_1; break;
        case 120: clientVersion = glslang::EShTargetVulkan_1_2; break;
        default:  break;
    }
    glslang::EShTargetLanguageVersion spirvVersion = glslang::EShTargetSpv_1_6;
    switch (options.targetSpirvVersion) {
        case 100: spirvVersion = glslang::EShTargetSpv_1_0; break;
        case 110: spirvVersion = glslang::EShTargetSpv_1_1; break;
        case 120: spirvVersion = glslang::EShTargetSpv_1_2; break;
        case 130: spirvVersion = glslang::EShTargetSpv_1_3; break;
        case 140: spirvVersion = glslang::EShTargetSpv_1_4; break;
        case 150: spirvVersion = glslang::EShTargetSpv_1_5; break;
        default:  break;
    }
    shader.setEnvInput(glslang::EShSourceGlsl, shaderStage, glslang::EShClientVulkan, 100);
    shader.setEnvClient(glslang::EShClientVulkan, clientVersion);
    shader.setEnvTarget(glslang::EShTargetSpv, spirvVersion);

    const TBuiltInResource* resources = GetDefaultResources();

    EShMessages messages = static_cast<EShMessages>(EShMsgSpvRules | EShMsgVulkanRules);
    if (options.generateDebugInfo) {
        messages = static_cast<EShMessages>(messages | EShMsgDebugInfo);
    }

    if (!shader.parse(resources, DEFAULT_GLSL_VERSION, false, messages)) {
        output.errorLog = shader.getInfoLog();
        return output;
    }

    glslang::TProgram program;
    program.addShader(&shader);

    if (!program.link(messages)) {
        output.errorLog = program.getInfoLog();
        return output;
    }

    glslang::SpvOptions spvOptions;
    spvOptions.generateDebugInfo = options.generateDebugInfo;
    spvOptions.disableOptimizer = !options.optimizePerformance;
    spvOptions.validate = false;

    std::vector<unsigned int> spirv;
    glslang::GlslangToSpv(*program.getIntermediate(shaderStage), spirv, &spvOptions);
    output.spirv.assign(spirv.begin(), spirv.end());

    if (options.validateSpirv) {
        std::string validationError;
        if (!ValidateSpirv(output.spirv, validationError)) {
            output.spirv.clear();
            output.errorLog = "SPIR-V validation failed: " + validationError;
            return output;
        }
    }

    output.success = true;
    output.infoLog = shader.getInfoLog();
    if (output.infoLog.empty()) {
        output.infoLog = program.getInfoLog();
    }
    // glslang leaves a trailing newline even on clean compiles
    while (!output.infoLog.empty() && std::isspace(static_cast<unsigned char>(output.infoLog.back()))) {
        output.infoLog.pop_back();
    }
    return output;
}

bool GlslangCompiler::ValidateSpirv(const std::vector<uint32_t>& spirv, std::string& outError) {
    if (spirv.empty()) {
        outError = "SPIR-V buffer is empty";
        return false;
    }

    spvtools::SpirvTools tools(SPV_ENV_VULKAN_1_3);
    tools.SetMessageConsumer([&outError](spv_message_level_t, const char*, const spv_position_t&, const char* message) {
        if (outError.empty()) {
            outError = message;
        }
    });

    if (!tools.Validate(spirv)) {
        if (outError.empty()) {
            outError = "Unknown validation error";
        }
        return false;
    }
    return true;
}

} // namespace ShaderEmbed
