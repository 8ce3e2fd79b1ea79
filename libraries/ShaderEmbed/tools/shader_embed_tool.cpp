/**
 * @file shader_embed_tool.cpp
 * @brief Build-time shader compiler and embedding header generator
 *
 * Usage:
 *   shader_embed_tool compile <root>... --output-dir <build-dir> [--max-depth N]
 *   shader_embed_tool embed <build-dir>/SPIR-V --output <shaders.h>
 *   shader_embed_tool name <shader-path>
 *
 * CMake Integration (cmake/ShaderEmbed.cmake):
 *   shader_embed_compile(MyShaders
 *       ROOTS shaders                 # relative: identifiers become shaders__...
 *       MAX_DEPTH 4
 *       OUTPUT_DIR ${CMAKE_BINARY_DIR}/shaders
 *   )
 */

#include "ShaderEmbed/CompilationRun.h"
#include "ShaderEmbed/OutputNaming.h"
#include "ShaderEmbed/RunConfig.h"
#include "ShaderEmbed/SpirvEmbed.h"
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace ShaderEmbed;
namespace fs = std::filesystem;

// Tool version - update on releases
constexpr const char* SHADER_EMBED_TOOL_VERSION = "1.0.0";

// ===== Exit Codes (semantic codes for CI/CD debugging) =====
namespace ExitCode {
    constexpr int Success = 0;       // All shaders compiled / header written
    constexpr int UsageError = 2;    // Bad arguments, invalid options, show help
    constexpr int InputError = 3;    // Missing roots, unreadable or malformed config
    constexpr int CompileError = 4;  // At least one shader failed to compile
    constexpr int IOError = 5;       // Only filesystem failures
}

// ===== Command Line Parsing =====

struct ToolOptions {
    std::string command;
    std::vector<std::string> inputs;
    std::string outputPath;
    std::string outputDir;
    std::string configPath;
    std::string namespaceName;
    std::string logFile;
    std::optional<size_t> maxDepth;
    std::optional<int> targetVulkan;
    std::optional<int> targetSpirv;
    std::optional<Log::LogLevel> logLevel;
    bool validate = false;
    bool optimize = false;
    bool debugInfo = false;
    bool verbose = false;
    bool quiet = false;       // CI mode: only output errors

    bool shouldPrint() const { return !quiet; }
    bool shouldPrintVerbose() const { return verbose && !quiet; }
};

void PrintUsage() {
    std::cout << R"(
Shader Embed Tool - compiles shader trees to SPIR-V and embeds the results

Usage:
  shader_embed_tool compile <root>... [options]
  shader_embed_tool embed <spirv-dir> --output <header> [options]
  shader_embed_tool name <shader-path>
  shader_embed_tool --help | --version

Commands:
  compile     Search each root for shaders, compile them, and write
              <output-dir>/SPIR-V/<flattened-path>.spirv. Every failure is
              reported before the tool exits non-zero.
  embed       Generate a C++ header embedding every .spirv file of a directory
  name        Print the artifact file name derived from a shader path

Options:
  -d, --output-dir <dir>   Build-output directory (default: $SHADER_EMBED_OUT_DIR)
  --max-depth <n>          Directory levels to descend below each root (default: 0)
  -c, --config <file>      JSON run configuration (roots, maxDepth, outputDir, validate, ...)
  --validate               Validate produced SPIR-V with SPIRV-Tools
  --optimize               Run glslang's SPIR-V optimizer
  --debug-info             Emit debug information into the SPIR-V
  --target-vulkan <v>      Vulkan target: 100, 110, 120, 130 (default: 130)
  --target-spirv <v>       SPIR-V target: 100 .. 160 (default: 160)
  --log-level <level>      Echo run log entries at or above debug|info|warning|error|critical
  --log-file <file>        Write the full run log to a file
  -o, --output <path>      Header path (embed)
  --namespace <ns>         Namespace of the generated header (default: ShaderEmbed::Generated)
  -v, --verbose            Print detailed output (same as --log-level debug)
  -q, --quiet              Suppress all output except errors (for CI/CD)
  -h, --help               Show this help
  --version                Show version information

Recognised extensions:
  .vert .vs  vertex        .frag .fs   fragment     .geom .gs  geometry
  .comp      compute       .tesc       tess control .tese      tess evaluation
  .rgen .rint .rahit .rchit .rmiss .rcall           ray tracing stages
  .mesh .task              mesh shading             .glsl      #pragma shader_stage(...)

Examples:
  shader_embed_tool compile shaders --max-depth 4 -d build/gen
  shader_embed_tool compile -c shaders.json -q
  shader_embed_tool embed build/gen/SPIR-V -o build/gen/EmbeddedShaders.h
  shader_embed_tool name shaders/post/blur.comp     # shaders__post__blur.comp.spirv
)" << std::endl;
}

template <typename T>
bool ParseNumber(const std::string& text, T& value) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last && !text.empty();
}

/**
 * @brief Parse a single command-line option
 * @return -1 = show help, 0 = recognized option, 1 = unknown option, 2 = input, 3 = bad value
 */
int ParseOption(const std::string& arg, const std::string& nextArg, bool hasNext, ToolOptions& options, int& skip) {
    skip = 0;

    if (arg == "--help" || arg == "-h") {
        return -1;
    }
    if (arg == "--output-dir" || arg == "-d") {
        if (!hasNext) return 3;
        options.outputDir = nextArg;
        skip = 1;
        return 0;
    }
    if (arg == "--output" || arg == "-o") {
        if (!hasNext) return 3;
        options.outputPath = nextArg;
        skip = 1;
        return 0;
    }
    if (arg == "--config" || arg == "-c") {
        if (!hasNext) return 3;
        options.configPath = nextArg;
        skip = 1;
        return 0;
    }
    if (arg == "--namespace") {
        if (!hasNext) return 3;
        options.namespaceName = nextArg;
        skip = 1;
        return 0;
    }
    if (arg == "--max-depth") {
        size_t depth = 0;
        if (!hasNext || !ParseNumber(nextArg, depth)) return 3;
        options.maxDepth = depth;
        skip = 1;
        return 0;
    }
    if (arg == "--validate") {
        options.validate = true;
        return 0;
    }
    if (arg == "--optimize") {
        options.optimize = true;
        return 0;
    }
    if (arg == "--debug-info") {
        options.debugInfo = true;
        return 0;
    }
    if (arg == "--target-vulkan") {
        int version = 0;
        if (!hasNext || !ParseNumber(nextArg, version) || !IsSupportedVulkanVersion(version)) return 3;
        options.targetVulkan = version;
        skip = 1;
        return 0;
    }
    if (arg == "--target-spirv") {
        int version = 0;
        if (!hasNext || !ParseNumber(nextArg, version) || !IsSupportedSpirvVersion(version)) return 3;
        options.targetSpirv = version;
        skip = 1;
        return 0;
    }
    if (arg == "--log-level") {
        auto level = hasNext ? Log::Logger::ParseLogLevel(nextArg) : std::nullopt;
        if (!level) return 3;
        options.logLevel = level;
        skip = 1;
        return 0;
    }
    if (arg == "--log-file") {
        if (!hasNext) return 3;
        options.logFile = nextArg;
        skip = 1;
        return 0;
    }
    if (arg == "--verbose" || arg == "-v") {
        options.verbose = true;
        return 0;
    }
    if (arg == "--quiet" || arg == "-q") {
        options.quiet = true;
        return 0;
    }

    if (!arg.empty() && arg[0] == '-') {
        return 1;
    }
    return 2;
}

/**
 * @return std::nullopt to continue, otherwise the exit code
 */
std::optional<int> ParseCommandLine(int argc, char** argv, ToolOptions& options) {
    if (argc < 2) {
        PrintUsage();
        return ExitCode::UsageError;
    }

    std::string firstArg = argv[1];
    if (firstArg == "--help" || firstArg == "-h" || firstArg == "help") {
        PrintUsage();
        return ExitCode::Success;
    }
    if (firstArg == "--version") {
        std::cout << "shader_embed_tool version " << SHADER_EMBED_TOOL_VERSION << "\n";
        return ExitCode::Success;
    }

    options.command = firstArg;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string nextArg = (i + 1 < argc) ? argv[i + 1] : "";
        int skip = 0;

        int result = ParseOption(arg, nextArg, i + 1 < argc, options, skip);
        if (result == -1) {
            PrintUsage();
            return ExitCode::Success;
        } else if (result == 1) {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            std::cerr << "Run 'shader_embed_tool --help' for usage information.\n";
            return ExitCode::UsageError;
        } else if (result == 2) {
            options.inputs.push_back(arg);
        } else if (result == 3) {
            std::cerr << "Error: Option '" << arg << "' requires a valid value\n";
            return ExitCode::UsageError;
        }
        i += skip;
    }

    if (options.quiet && options.verbose) {
        std::cerr << "Warning: --quiet and --verbose are mutually exclusive. Using --quiet.\n";
        options.verbose = false;
    }
    return std::nullopt;
}

// ===== Command Implementations =====

bool WriteLogFile(const Log::Logger& logger, const std::string& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << logger.ExtractLogs();
    return static_cast<bool>(file);
}

int CommandCompile(const ToolOptions& options) {
    RunConfig config;
    if (!options.configPath.empty()) {
        auto loaded = LoadRunConfig(options.configPath);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error() << "\n";
            return ExitCode::InputError;
        }
        config = std::move(*loaded);
    }

    RunConfig fromArgs;
    for (const auto& input : options.inputs) {
        fromArgs.roots.emplace_back(input);
    }
    if (!options.outputDir.empty()) {
        fromArgs.outputDir = options.outputDir;
    }
    fromArgs.validate = options.validate;
    fromArgs.optimize = options.optimize;
    fromArgs.debugInfo = options.debugInfo;
    fromArgs.targetVulkanVersion = options.targetVulkan;
    fromArgs.targetSpirvVersion = options.targetSpirv;
    fromArgs.logLevel = options.logLevel;
    if (!fromArgs.logLevel && options.shouldPrintVerbose()) {
        fromArgs.logLevel = Log::LogLevel::LOG_DEBUG;
    }
    config = MergeRunConfig(std::move(config), fromArgs, options.maxDepth);

    // Only an explicitly requested level is echoed; a log file alone stays silent
    const bool echoLog = config.logLevel.has_value() && !options.quiet;
    if (!options.logFile.empty() && !config.logLevel) {
        config.logLevel = Log::LogLevel::LOG_DEBUG;
    }

    auto run = MakeCompilationRun(config);
    if (!run) {
        std::cerr << "Error: " << run.error() << "\n";
        std::cerr << "Hint: Pass shader directories as arguments, e.g.: shader_embed_tool compile shaders\n";
        return ExitCode::InputError;
    }

    Log::Logger toolLogger("shader_embed_tool", true);
    run->RegisterToParentLogger(toolLogger);
    if (echoLog) {
        run->GetLogger()->SetOutputStream(&std::cerr);
        run->SetLoggerTerminalOutput(true);
    }

    int exitCode = ExitCode::Success;
    try {
        run->Run(std::cerr);
    } catch (const CompilationRunFailed& failed) {
        std::cerr << failed.what() << "\n";
        bool anyCompileFailure = std::any_of(failed.GetErrors().begin(), failed.GetErrors().end(),
            [](const CompilationError& error) { return IsCompileFailure(error); });
        toolLogger.Error(failed.what());
        exitCode = anyCompileFailure ? ExitCode::CompileError : ExitCode::IOError;
    }

    if (!options.logFile.empty() && !WriteLogFile(toolLogger, options.logFile)) {
        std::cerr << "Warning: Failed to write log file " << options.logFile << "\n";
    }

    if (exitCode == ExitCode::Success && options.shouldPrintVerbose()) {
        std::cout << "All shaders compiled\n";
    }
    return exitCode;
}

int CommandEmbed(const ToolOptions& options) {
    if (options.inputs.size() != 1) {
        std::cerr << "Error: embed takes exactly one SPIR-V directory\n";
        return ExitCode::UsageError;
    }
    if (options.outputPath.empty()) {
        std::cerr << "Error: No header path specified\n";
        std::cerr << "Hint: Use -o or --output to name the generated header\n";
        return ExitCode::UsageError;
    }

    EmbedHeaderOptions headerOptions;
    if (!options.namespaceName.empty()) {
        headerOptions.namespaceName = options.namespaceName;
    }

    auto written = WriteEmbedHeader(options.inputs.front(), options.outputPath, headerOptions);
    if (!written) {
        for (const auto& error : written.error()) {
            std::cerr << FormatError(error) << "\n";
        }
        std::cerr << written.error().size() << " errors were encountered while embedding shaders.\n";
        return ExitCode::InputError;
    }

    if (options.shouldPrint()) {
        std::cout << "Embedded " << *written << " shader(s) into " << options.outputPath << "\n";
    }
    return ExitCode::Success;
}

int CommandName(const ToolOptions& options) {
    if (options.inputs.empty()) {
        std::cerr << "Error: No shader path specified\n";
        return ExitCode::UsageError;
    }
    for (const auto& input : options.inputs) {
        std::cout << ShaderPathToFileName(input) << "\n";
    }
    return ExitCode::Success;
}

int main(int argc, char** argv) {
    ToolOptions options;
    if (auto exitCode = ParseCommandLine(argc, argv, options)) {
        return *exitCode;
    }

    try {
        if (options.command == "compile") {
            return CommandCompile(options);
        }
        if (options.command == "embed") {
            return CommandEmbed(options);
        }
        if (options.command == "name") {
            return CommandName(options);
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return ExitCode::IOError;
    }

    std::cerr << "Error: Unknown command '" << options.command << "'\n";
    std::cerr << "Run 'shader_embed_tool --help' for usage information.\n";
    return ExitCode::UsageError;
}
