#include "ShaderEmbed/RunConfig.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace ShaderEmbed {

using json = nlohmann::json;

std::expected<RunConfig, std::string> ParseRunConfig(std::string_view text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(std::string("Invalid JSON"));
    }
    if (!j.is_object()) {
        return std::unexpected(std::string("Configuration must be a JSON object"));
    }

    RunConfig config;
    try {
        if (j.contains("roots")) {
            const auto& roots = j.at("roots");
            if (roots.is_string()) {
                config.roots.emplace_back(roots.get<std::string>());
            } else if (roots.is_array()) {
                for (const auto& root : roots) {
                    config.roots.emplace_back(root.get<std::string>());
                }
            } else {
                return std::unexpected(std::string("\"roots\" must be a string or an array of strings"));
            }
        }
        if (j.contains("maxDepth")) {
            const auto& depth = j.at("maxDepth");
            if (!depth.is_number_unsigned()) {
                return std::unexpected(std::string("\"maxDepth\" must be a non-negative integer"));
            }
            config.maxDepth = depth.get<size_t>();
        }
        if (j.contains("outputDir")) {
            config.outputDir = j.at("outputDir").get<std::string>();
        }
        if (j.contains("validate")) {
            config.validate = j.at("validate").get<bool>();
        }
        if (j.contains("optimize")) {
            config.optimize = j.at("optimize").get<bool>();
        }
        if (j.contains("debugInfo")) {
            config.debugInfo = j.at("debugInfo").get<bool>();
        }
        if (j.contains("targetVulkan")) {
            int version = j.at("targetVulkan").get<int>();
            if (!IsSupportedVulkanVersion(version)) {
                return std::unexpected("Unsupported \"targetVulkan\": " + std::to_string(version) +
                    " (expected 100, 110, 120 or 130)");
            }
            config.targetVulkanVersion = version;
        }
        if (j.contains("targetSpirv")) {
            int version = j.at("targetSpirv").get<int>();
            if (!IsSupportedSpirvVersion(version)) {
                return std::unexpected("Unsupported \"targetSpirv\": " + std::to_string(version) +
                    " (expected 100 to 160 in steps of 10)");
            }
            config.targetSpirvVersion = version;
        }
        if (j.contains("logLevel")) {
            std::string name = j.at("logLevel").get<std::string>();
            auto level = Log::Logger::ParseLogLevel(name);
            if (!level) {
                return std::unexpected("Unknown \"logLevel\": " + name);
            }
            config.logLevel = *level;
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Invalid configuration value: ") + e.what());
    }

    return config;
}

std::expected<RunConfig, std::string> LoadRunConfig(const std::filesystem::path& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + configPath.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = ParseRunConfig(buffer.str());
    if (!config) {
        return std::unexpected(configPath.string() + ": " + config.error());
    }
    return config;
}

RunConfig MergeRunConfig(RunConfig base, const RunConfig& overrides, std::optional<size_t> overrideDepth) {
    base.roots.insert(base.roots.end(), overrides.roots.begin(), overrides.roots.end());
    if (overrides.outputDir) {
        base.outputDir = overrides.outputDir;
    }
    base.validate = base.validate || overrides.validate;
    base.optimize = base.optimize || overrides.optimize;
    base.debugInfo = base.debugInfo || overrides.debugInfo;
    if (overrides.targetVulkanVersion) {
        base.targetVulkanVersion = overrides.targetVulkanVersion;
    }
    if (overrides.targetSpirvVersion) {
        base.targetSpirvVersion = overrides.targetSpirvVersion;
    }
    if (overrides.logLevel) {
        base.logLevel = overrides.logLevel;
    }
    if (overrideDepth) {
        base.maxDepth = *overrideDepth;
    }
    return base;
}

std::expected<CompilationRun, std::string> MakeCompilationRun(const RunConfig& config) {
    if (config.roots.empty()) {
        return std::unexpected(std::string("No shader directories configured"));
    }

    CompilationRun run(config.roots.front());
    for (size_t i = 1; i < config.roots.size(); ++i) {
        run.WithDir(config.roots[i]);
    }
    run.MaxDepth(config.maxDepth);
    if (config.outputDir) {
        run.OutputDirectory(*config.outputDir);
    }

    CompilationOptions options;
    options.validateSpirv = config.validate;
    options.optimizePerformance = config.optimize;
    options.generateDebugInfo = config.debugInfo;
    if (config.targetVulkanVersion) {
        options.targetVulkanVersion = *config.targetVulkanVersion;
    }
    if (config.targetSpirvVersion) {
        options.targetSpirvVersion = *config.targetSpirvVersion;
    }
    run.WithOptions(options);

    if (config.logLevel) {
        run.SetLoggerEnabled(true);
        run.GetLogger()->SetMinimumLevel(*config.logLevel);
    }

    return run;
}

} // namespace ShaderEmbed
