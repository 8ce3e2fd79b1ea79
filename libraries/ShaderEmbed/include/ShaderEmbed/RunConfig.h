#pragma once

#include "CompilationRun.h"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ShaderEmbed {

/**
 * @brief Serializable description of a compilation run
 *
 * JSON form (every key optional, unknown keys ignored):
 * @code
 * {
 *   "roots": ["shaders", "extra/shaders"],
 *   "maxDepth": 4,
 *   "outputDir": "build/generated",
 *   "validate": false,
 *   "optimize": false,
 *   "debugInfo": false,
 *   "targetVulkan": 130,
 *   "targetSpirv": 160,
 *   "logLevel": "warning"
 * }
 * @endcode
 *
 * Paths are used as written; relative paths resolve against the working
 * directory of the process executing the run.
 */
struct RunConfig {
    std::vector<std::filesystem::path> roots;
    size_t maxDepth = 0;
    std::optional<std::filesystem::path> outputDir;
    bool validate = false;
    bool optimize = false;
    bool debugInfo = false;
    std::optional<int> targetVulkanVersion;     // 100, 110, 120, 130
    std::optional<int> targetSpirvVersion;      // 100 .. 160
    std::optional<Log::LogLevel> logLevel;      // Enables the run's logger at this level
};

/**
 * @brief Parse configuration JSON text
 * @return Config, or an error message for malformed JSON / wrong value types
 */
std::expected<RunConfig, std::string> ParseRunConfig(std::string_view json);

/**
 * @brief Read and parse a configuration file
 */
std::expected<RunConfig, std::string> LoadRunConfig(const std::filesystem::path& configPath);

/**
 * @brief Overlay @p overrides onto @p base
 *
 * Roots are appended. Flags are or-ed. outputDir, target versions and
 * logLevel replace when set. maxDepth replaces when @p overrideDepth is set.
 */
RunConfig MergeRunConfig(RunConfig base, const RunConfig& overrides, std::optional<size_t> overrideDepth);

/**
 * @brief Build a run from a configuration
 *
 * With a logLevel the run's logger is enabled and filtered to that level;
 * where its entries go is left to the caller.
 * @return Run, or an error message when no root is configured
 */
std::expected<CompilationRun, std::string> MakeCompilationRun(const RunConfig& config);

} // namespace ShaderEmbed
