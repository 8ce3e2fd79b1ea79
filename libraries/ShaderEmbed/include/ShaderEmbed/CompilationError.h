#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace ShaderEmbed {

/**
 * @brief Filesystem operation that failed
 */
enum class IoOperation : uint8_t {
    Traverse,           // Listing a root or subdirectory
    ReadSource,
    CreateOutputDir,
    WriteArtifact,
    ReadArtifact,       // Loading a .spirv file for embedding
    Configure,          // No usable build-output directory
};

/**
 * @brief A failed filesystem operation
 */
struct IoFailure {
    std::filesystem::path path;
    IoOperation operation = IoOperation::ReadSource;
    std::error_code code;
    std::string detail;         // Optional, replaces the error_code message

    /**
     * @brief Underlying cause, e.g. `failed to read "a/b.vert": No such file or directory`
     */
    std::string Describe() const;
};

/**
 * @brief The compiler rejected a source file
 */
struct CompileFailure {
    std::filesystem::path path;
    std::string diagnostic;     // Compiler output, opaque
};

/**
 * @brief One entry of a run's aggregated error set
 */
using CompilationError = std::variant<IoFailure, CompileFailure>;

/**
 * @brief Ordered failures of one run; empty means success
 */
using CompilationErrors = std::vector<CompilationError>;

const char* IoOperationName(IoOperation operation);

/**
 * @brief Report line for one failure
 *
 * IO failures:      IO error: <cause>
 * Compile failures: Error compiling shader at "<path>": <diagnostic>
 */
std::string FormatError(const CompilationError& error);

/**
 * @brief Terminal message for a failed run
 */
std::string FormatFailureSummary(size_t errorCount);

bool IsCompileFailure(const CompilationError& error);
bool IsIoFailure(const CompilationError& error);

/**
 * @brief Path the failure refers to
 */
const std::filesystem::path& ErrorPath(const CompilationError& error);

} // namespace ShaderEmbed
