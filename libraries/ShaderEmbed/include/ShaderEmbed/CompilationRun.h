#pragma once

#include "CompilationError.h"
#include "ShaderCompiler.h"
#include "ILoggable.h"
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace ShaderEmbed {

// Environment variable consulted when no build-output directory is set
inline constexpr const char* OUTPUT_DIR_ENV = "SHADER_EMBED_OUT_DIR";

/**
 * @brief Outcome of CompilationRun::Execute
 */
struct RunReport {
    CompilationErrors errors;                   // Encounter order
    std::vector<std::filesystem::path> outputs; // Artifacts written, encounter order

    bool Succeeded() const { return errors.empty(); }
    operator bool() const { return Succeeded(); }
};

/**
 * @brief Raised by CompilationRun::Run after the failures were printed
 *
 * what() is the failure summary citing the total error count.
 */
class CompilationRunFailed : public std::runtime_error {
public:
    explicit CompilationRunFailed(CompilationErrors errors);

    const CompilationErrors& GetErrors() const { return errors_; }
    size_t GetErrorCount() const { return errors_.size(); }

private:
    CompilationErrors errors_;
};

/**
 * @brief Batch compilation of every shader found under a set of roots
 *
 * Walks each root up to a maximum depth, classifies files by extension,
 * compiles each shader and writes the SPIR-V to
 * <buildOutputDir>/SPIR-V/<flattened source path>.spirv.
 *
 * Every file is attempted before success is decided: per-file failures are
 * collected and reported together.
 *
 * Depth: MaxDepth(n) descends n directory levels below each root. With the
 * default of 0 only the root's direct children are visited.
 *
 * @code
 * CompilationRun("shaders")
 *     .WithDir("third_party_shaders")
 *     .MaxDepth(4)
 *     .OutputDirectory(buildDir)
 *     .Run();   // prints failures and throws CompilationRunFailed
 * @endcode
 *
 * A run is single use; executing it twice throws std::logic_error.
 */
class CompilationRun : public Log::ILoggable {
public:
    explicit CompilationRun(std::filesystem::path root);

    CompilationRun(CompilationRun&&) = default;
    CompilationRun& operator=(CompilationRun&&) = default;

    // ===== Configuration Methods =====

    /**
     * @brief Add a directory to search (not checked until execution)
     */
    CompilationRun& WithDir(std::filesystem::path dir);

    /**
     * @brief Traversal depth bound shared by all roots
     */
    CompilationRun& MaxDepth(size_t depth);

    /**
     * @brief Build-output directory; SPIR-V/ is created beneath it
     *
     * Falls back to $SHADER_EMBED_OUT_DIR when unset.
     */
    CompilationRun& OutputDirectory(std::filesystem::path dir);

    /**
     * @brief Options passed with every compile request
     */
    CompilationRun& WithOptions(const CompilationOptions& options);

    /**
     * @brief Use a caller-owned compiler instead of the glslang default
     */
    CompilationRun& WithCompiler(IShaderCompiler& compiler);

    const std::vector<std::filesystem::path>& GetDirectories() const { return directories_; }
    size_t GetMaxDepth() const { return maxDepth_; }
    const CompilationOptions& GetOptions() const { return options_; }

    // ===== Execution =====

    /**
     * @brief Compile everything and return the aggregated outcome
     *
     * Never throws for per-file failures.
     */
    RunReport Execute();

    /**
     * @brief Execute, then report failures
     *
     * On failure every error is written to @p diagnostics in encounter
     * order and CompilationRunFailed is thrown. Success prints nothing.
     */
    void Run(std::ostream& diagnostics = std::cerr);

private:
    struct RunState {
        IShaderCompiler& compiler;
        std::filesystem::path buildOutputDir;
        RunReport report;
    };

    void WalkDirectory(RunState& state, const std::filesystem::path& dir, size_t depth);
    void ProcessEntry(RunState& state, const std::filesystem::path& path);
    std::optional<std::filesystem::path> ResolveOutputDirectory() const;

    void Record(RunState& state, CompilationError error);

    std::vector<std::filesystem::path> directories_;
    size_t maxDepth_ = 0;
    std::optional<std::filesystem::path> outputDir_;
    CompilationOptions options_;
    IShaderCompiler* compiler_ = nullptr;   // Non-owning
    bool consumed_ = false;
};

} // namespace ShaderEmbed
