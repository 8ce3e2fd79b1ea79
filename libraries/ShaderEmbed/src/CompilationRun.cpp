#include "ShaderEmbed/CompilationRun.h"
#include "ShaderEmbed/OutputNaming.h"
#include "ShaderEmbed/StageTable.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>

namespace ShaderEmbed {

namespace fs = std::filesystem;

namespace {

// errno is not guaranteed to be set by iostreams
std::error_code LastStreamError() {
    int err = errno;
    if (err == 0) {
        return std::make_error_code(std::errc::io_error);
    }
    return std::error_code(err, std::generic_category());
}

} // namespace

CompilationRunFailed::CompilationRunFailed(CompilationErrors errors)
    : std::runtime_error(FormatFailureSummary(errors.size()))
    , errors_(std::move(errors))
{
}

CompilationRun::CompilationRun(fs::path root) {
    InitializeLogger("CompilationRun");
    directories_.push_back(std::move(root));
}

CompilationRun& CompilationRun::WithDir(fs::path dir) {
    directories_.push_back(std::move(dir));
    return *this;
}

CompilationRun& CompilationRun::MaxDepth(size_t depth) {
    maxDepth_ = depth;
    return *this;
}

CompilationRun& CompilationRun::OutputDirectory(fs::path dir) {
    outputDir_ = std::move(dir);
    return *this;
}

CompilationRun& CompilationRun::WithOptions(const CompilationOptions& options) {
    options_ = options;
    return *this;
}

CompilationRun& CompilationRun::WithCompiler(IShaderCompiler& compiler) {
    compiler_ = &compiler;
    return *this;
}

std::optional<fs::path> CompilationRun::ResolveOutputDirectory() const {
    if (outputDir_ && !outputDir_->empty()) {
        return outputDir_;
    }
    const char* env = std::getenv(OUTPUT_DIR_ENV);
    if (env && *env) {
        return fs::path(env);
    }
    return std::nullopt;
}

RunReport CompilationRun::Execute() {
    if (consumed_) {
        throw std::logic_error("CompilationRun: a run can only be executed once");
    }
    consumed_ = true;

    std::unique_ptr<GlslangCompiler> defaultCompiler;
    if (!compiler_) {
        defaultCompiler = std::make_unique<GlslangCompiler>();
    }
    IShaderCompiler& compiler = compiler_ ? *compiler_ : *defaultCompiler;

    auto buildOutputDir = ResolveOutputDirectory();
    if (!buildOutputDir) {
        RunState state{compiler, {}, {}};
        Record(state, IoFailure{
            .path = {},
            .operation = IoOperation::Configure,
            .code = std::make_error_code(std::errc::invalid_argument),
            .detail = std::string("set an output directory or $") + OUTPUT_DIR_ENV
        });
        return std::move(state.report);
    }

    RunState state{compiler, *buildOutputDir, {}};
    for (const auto& root : directories_) {
        LOG_DEBUG("Searching " + root.string() + " (max depth " + std::to_string(maxDepth_) + ")");
        WalkDirectory(state, root, 0);
    }

    if (state.report.Succeeded()) {
        LOG_INFO("Compiled " + std::to_string(state.report.outputs.size()) + " shader(s)");
    } else {
        LOG_ERROR(FormatFailureSummary(state.report.errors.size()));
    }
    return std::move(state.report);
}

void CompilationRun::Run(std::ostream& diagnostics) {
    RunReport report = Execute();
    if (report.Succeeded()) {
        return;
    }

    for (const auto& error : report.errors) {
        diagnostics << FormatError(error) << "\n";
    }
    diagnostics.flush();

    throw CompilationRunFailed(std::move(report.errors));
}

// `level` counts directory levels below the root; entries of the root are level 0
void CompilationRun::WalkDirectory(RunState& state, const fs::path& dir, size_t level) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        Record(state, IoFailure{.path = dir, .operation = IoOperation::Traverse, .code = ec});
        return;
    }

    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(*it);
    }
    if (ec) {
        Record(state, IoFailure{.path = dir, .operation = IoOperation::Traverse, .code = ec});
    }

    std::sort(entries.begin(), entries.end(),
        [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename() < b.path().filename();
        });

    for (const auto& entry : entries) {
        std::error_code statEc;
        bool isDirectory = entry.is_directory(statEc);
        // A dangling link reports not-found and is read (and reported) as a file
        if (statEc && statEc != std::errc::no_such_file_or_directory) {
            Record(state, IoFailure{.path = entry.path(), .operation = IoOperation::Traverse, .code = statEc});
            continue;
        }
        if (isDirectory) {
            // Symlinked directories are classified as directories but not followed
            if (level < maxDepth_ && !entry.is_symlink(statEc)) {
                WalkDirectory(state, entry.path(), level + 1);
            }
            continue;
        }
        ProcessEntry(state, entry.path());
    }
}

void CompilationRun::ProcessEntry(RunState& state, const fs::path& path) {
    auto stage = InferStageFromPath(path);
    if (!stage) {
        LOG_DEBUG("Skipping " + path.string());
        return;
    }

    std::string source;
    {
        errno = 0;
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            Record(state, IoFailure{.path = path, .operation = IoOperation::ReadSource, .code = LastStreamError()});
            return;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            Record(state, IoFailure{.path = path, .operation = IoOperation::ReadSource, .code = LastStreamError()});
            return;
        }
        source = buffer.str();
    }

    CompileRequest request{
        .source = source,
        .stage = *stage,
        .virtualPath = path.string(),
        .entryPoint = "main",
        .options = options_
    };
    CompilationOutput output = state.compiler.Compile(request);
    if (!output.success) {
        Record(state, CompileFailure{.path = path, .diagnostic = output.errorLog});
        return;
    }
    if (!output.infoLog.empty()) {
        LOG_WARNING(path.string() + ": " + output.infoLog);
    }

    fs::path spirvDir = SpirvOutputDirectory(state.buildOutputDir);
    std::error_code ec;
    fs::create_directories(spirvDir, ec);
    if (ec) {
        Record(state, IoFailure{.path = spirvDir, .operation = IoOperation::CreateOutputDir, .code = ec});
        return;
    }

    fs::path artifactPath = spirvDir / ShaderPathToFileName(path);
    {
        errno = 0;
        std::ofstream file(artifactPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (file.is_open()) {
            file.write(reinterpret_cast<const char*>(output.spirv.data()),
                static_cast<std::streamsize>(output.spirv.size() * sizeof(uint32_t)));
            file.close();
        }
        if (!file) {
            Record(state, IoFailure{.path = artifactPath, .operation = IoOperation::WriteArtifact, .code = LastStreamError()});
            return;
        }
    }

    LOG_INFO(std::string(ShaderStageName(*stage)) + " " + path.string() + " -> " + artifactPath.string());
    state.report.outputs.push_back(std::move(artifactPath));
}

void CompilationRun::Record(RunState& state, CompilationError error) {
    LOG_ERROR(FormatError(error));
    state.report.errors.push_back(std::move(error));
}

} // namespace ShaderEmbed
