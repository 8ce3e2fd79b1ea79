#include "ShaderEmbed/CompilationError.h"
#include <sstream>

namespace ShaderEmbed {

const char* IoOperationName(IoOperation operation) {
    switch (operation) {
        case IoOperation::Traverse:        return "failed to list directory";
        case IoOperation::ReadSource:      return "failed to read";
        case IoOperation::CreateOutputDir: return "failed to create directory";
        case IoOperation::WriteArtifact:   return "failed to write";
        case IoOperation::ReadArtifact:    return "failed to load";
        case IoOperation::Configure:       return "no build-output directory";
        default:                           return "failed to access";
    }
}

std::string IoFailure::Describe() const {
    std::ostringstream oss;
    oss << IoOperationName(operation);
    if (!path.empty()) {
        oss << " " << path;
    }
    oss << ": ";
    if (!detail.empty()) {
        oss << detail;
    } else {
        oss << code.message();
    }
    return oss.str();
}

std::string FormatError(const CompilationError& error) {
    struct Formatter {
        std::string operator()(const IoFailure& failure) const {
            return "IO error: " + failure.Describe();
        }
        std::string operator()(const CompileFailure& failure) const {
            return "Error compiling shader at \"" + failure.path.string() + "\": " + failure.diagnostic;
        }
    };
    return std::visit(Formatter{}, error);
}

std::string FormatFailureSummary(size_t errorCount) {
    return std::to_string(errorCount) +
        " errors were encountered while attempting to compile shaders.";
}

bool IsCompileFailure(const CompilationError& error) {
    return std::holds_alternative<CompileFailure>(error);
}

bool IsIoFailure(const CompilationError& error) {
    return std::holds_alternative<IoFailure>(error);
}

const std::filesystem::path& ErrorPath(const CompilationError& error) {
    return std::visit([](const auto& failure) -> const std::filesystem::path& {
        return failure.path;
    }, error);
}

} // namespace ShaderEmbed
