#include "ShaderEmbed/SpirvEmbed.h"
#include "ShaderEmbed/OutputNaming.h"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ShaderEmbed {

namespace fs = std::filesystem;

namespace {

// Words per line in generated arrays
constexpr size_t WORDS_PER_LINE = 8;

IoFailure MakeLoadFailure(const fs::path& path, std::errc errc, std::string detail = {}) {
    return IoFailure{
        .path = path,
        .operation = IoOperation::ReadArtifact,
        .code = std::make_error_code(errc),
        .detail = std::move(detail)
    };
}

std::string EscapeStringLiteral(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string IdentifierFromArtifact(const fs::path& artifact) {
    std::string name = artifact.filename().string();
    std::string_view suffix = SPIRV_OUTPUT_SUFFIX;
    if (name.ends_with(suffix)) {
        name.resize(name.size() - suffix.size());
    }
    return name;
}

} // namespace

std::expected<std::vector<uint32_t>, CompilationError> LoadSpirvWords(const fs::path& path) {
    errno = 0;
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        int err = errno != 0 ? errno : static_cast<int>(std::errc::no_such_file_or_directory);
        return std::unexpected(IoFailure{
            .path = path,
            .operation = IoOperation::ReadArtifact,
            .code = std::error_code(err, std::generic_category())
        });
    }

    size_t fileSize = static_cast<size_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    if (fileSize == 0) {
        return std::unexpected(MakeLoadFailure(path, std::errc::invalid_argument, "empty SPIR-V file"));
    }
    if (fileSize % 4 != 0) {
        return std::unexpected(MakeLoadFailure(path, std::errc::invalid_argument,
            "SPIR-V size " + std::to_string(fileSize) + " is not a multiple of 4 bytes"));
    }

    std::vector<uint32_t> words(fileSize / 4);
    file.read(reinterpret_cast<char*>(words.data()), static_cast<std::streamsize>(fileSize));
    if (!file.good()) {
        return std::unexpected(MakeLoadFailure(path, std::errc::io_error));
    }

    return words;
}

namespace {

using ArtifactWords = std::vector<std::pair<std::string, std::vector<uint32_t>>>;

std::expected<ArtifactWords, CompilationErrors> CollectArtifacts(const fs::path& spirvDir) {
    CompilationErrors errors;

    std::vector<fs::path> artifacts;
    std::error_code ec;
    fs::directory_iterator it(spirvDir, ec);
    if (ec) {
        errors.push_back(IoFailure{.path = spirvDir, .operation = IoOperation::Traverse, .code = ec});
        return std::unexpected(std::move(errors));
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (it->path().extension() == SPIRV_OUTPUT_SUFFIX && !it->is_directory(ec)) {
            artifacts.push_back(it->path());
        }
    }
    if (ec) {
        errors.push_back(IoFailure{.path = spirvDir, .operation = IoOperation::Traverse, .code = ec});
        return std::unexpected(std::move(errors));
    }
    std::sort(artifacts.begin(), artifacts.end());

    ArtifactWords shaders;
    for (const auto& artifact : artifacts) {
        auto words = LoadSpirvWords(artifact);
        if (!words) {
            errors.push_back(std::move(words.error()));
            continue;
        }
        shaders.emplace_back(IdentifierFromArtifact(artifact), std::move(*words));
    }
    if (!errors.empty()) {
        return std::unexpected(std::move(errors));
    }

    return shaders;
}

std::string RenderHeader(
    const fs::path& spirvDir,
    const ArtifactWords& shaders,
    const EmbedHeaderOptions& options)
{
    std::ostringstream out;
    out << "// Generated by shader_embed_tool from " << spirvDir.generic_string() << ". Do not edit.\n"
        << "#pragma once\n\n"
        << "#include <ShaderEmbed/EmbeddedShader.h>\n\n"
        << "namespace " << options.namespaceName << " {\n\n";

    for (size_t i = 0; i < shaders.size(); ++i) {
        const auto& [identifier, words] = shaders[i];
        out << "// " << identifier << SPIRV_OUTPUT_SUFFIX << "\n"
            << "inline constexpr std::uint32_t Shader_" << i << "[" << words.size() << "] = {";
        for (size_t w = 0; w < words.size(); ++w) {
            if (w % WORDS_PER_LINE == 0) {
                out << "\n    ";
            }
            out << "0x" << std::hex << std::setw(8) << std::setfill('0') << words[w] << std::dec << "u,";
            if (w % WORDS_PER_LINE != WORDS_PER_LINE - 1 && w + 1 != words.size()) {
                out << ' ';
            }
        }
        out << "\n};\n\n";
    }

    out << "inline constexpr std::array<::ShaderEmbed::EmbeddedShader, " << shaders.size() << "> SHADERS{";
    if (!shaders.empty()) {
        out << "{\n";
        for (size_t i = 0; i < shaders.size(); ++i) {
            out << "    {\"" << EscapeStringLiteral(shaders[i].first) << "\", Shader_" << i << "},\n";
        }
        out << "}";
    }
    out << "};\n\n";

    out << "constexpr std::span<const std::uint32_t> Find(std::string_view identifier) {\n"
        << "    return ::ShaderEmbed::FindEmbeddedShader(SHADERS, identifier);\n"
        << "}\n\n"
        << "// Not a constant expression for an unknown identifier\n"
        << "consteval std::span<const std::uint32_t> Require(std::string_view identifier) {\n"
        << "    auto words = Find(identifier);\n"
        << "    if (words.empty()) {\n"
        << "        throw \"unknown embedded shader identifier\";\n"
        << "    }\n"
        << "    return words;\n"
        << "}\n\n"
        << "} // namespace " << options.namespaceName << "\n\n"
        << "#define " << options.macroName << "(identifier) (::" << options.namespaceName << "::Require(identifier))\n";

    return out.str();
}

} // namespace

std::expected<std::string, CompilationErrors> GenerateEmbedHeader(
    const fs::path& spirvDir,
    const EmbedHeaderOptions& options)
{
    auto shaders = CollectArtifacts(spirvDir);
    if (!shaders) {
        return std::unexpected(std::move(shaders.error()));
    }
    return RenderHeader(spirvDir, *shaders, options);
}

std::expected<size_t, CompilationErrors> WriteEmbedHeader(
    const fs::path& spirvDir,
    const fs::path& headerPath,
    const EmbedHeaderOptions& options)
{
    auto shaders = CollectArtifacts(spirvDir);
    if (!shaders) {
        return std::unexpected(std::move(shaders.error()));
    }
    const size_t shaderCount = shaders->size();
    const std::string header = RenderHeader(spirvDir, *shaders, options);

    {
        std::ifstream existing(headerPath, std::ios::binary);
        if (existing.is_open()) {
            std::stringstream buffer;
            buffer << existing.rdbuf();
            if (buffer.str() == header) {
                return shaderCount;
            }
        }
    }

    std::error_code ec;
    if (headerPath.has_parent_path()) {
        fs::create_directories(headerPath.parent_path(), ec);
        if (ec) {
            return std::unexpected(CompilationErrors{IoFailure{
                .path = headerPath.parent_path(),
                .operation = IoOperation::CreateOutputDir,
                .code = ec
            }});
        }
    }

    std::ofstream file(headerPath, std::ios::binary | std::ios::trunc);
    if (file.is_open()) {
        file << header;
        file.close();
    }
    if (!file) {
        return std::unexpected(CompilationErrors{IoFailure{
            .path = headerPath,
            .operation = IoOperation::WriteArtifact,
            .code = std::make_error_code(std::errc::io_error)
        }});
    }

    return shaderCount;
}

} // namespace ShaderEmbed
