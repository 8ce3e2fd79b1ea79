#include <gtest/gtest.h>
#include "TestFixtures.h"
#include "ShaderEmbed/CompilationRun.h"
#include "ShaderEmbed/OutputNaming.h"
#include <cstdlib>
#include <sstream>

using namespace ShaderEmbed;
using namespace ShaderEmbed::TestFixtures;
namespace fs = std::filesystem;

class CompilationRunTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        sourceDir = testDir / "src";
        outDir = testDir / "out";
        fs::create_directories(sourceDir);
        fs::create_directories(outDir);
    }

    fs::path SpirvDir() const { return outDir / SPIRV_OUTPUT_SUBDIR; }

    std::vector<std::string> Outputs() const { return ListFileNames(SpirvDir()); }

    fs::path sourceDir;
    fs::path outDir;
    FakeCompiler compiler;
};

// ===== Configuration =====

TEST_F(CompilationRunTest, DefaultsToSingleRootAndDepthZero) {
    CompilationRun run(sourceDir);
    ASSERT_EQ(run.GetDirectories().size(), 1u);
    EXPECT_EQ(run.GetDirectories()[0], sourceDir);
    EXPECT_EQ(run.GetMaxDepth(), 0u);
}

TEST_F(CompilationRunTest, BuilderAppendsRootsWithoutDeduplication) {
    CompilationRun run(sourceDir);
    run.WithDir("missing").WithDir(sourceDir).MaxDepth(3);

    ASSERT_EQ(run.GetDirectories().size(), 3u);
    EXPECT_EQ(run.GetDirectories()[1], fs::path("missing"));
    EXPECT_EQ(run.GetDirectories()[2], sourceDir);
    EXPECT_EQ(run.GetMaxDepth(), 3u);
}

// ===== Dispatch =====

TEST_F(CompilationRunTest, CompilesClassifiedFilesWithFixedArguments) {
    WriteFile(sourceDir / "a.vert", "vertex source");
    WriteFile(sourceDir / "b.fs", "fragment source");
    WriteFile(sourceDir / "c.glsl", "#pragma shader_stage(compute)");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    EXPECT_TRUE(report.Succeeded());
    ASSERT_EQ(compiler.requests.size(), 3u);

    EXPECT_EQ(compiler.requests[0].source, "vertex source");
    EXPECT_EQ(compiler.requests[0].stage, ShaderStage::Vertex);
    EXPECT_EQ(compiler.requests[0].virtualPath, (sourceDir / "a.vert").string());
    EXPECT_EQ(compiler.requests[0].entryPoint, "main");
    EXPECT_EQ(compiler.requests[1].stage, ShaderStage::Fragment);
    EXPECT_EQ(compiler.requests[2].stage, ShaderStage::InferFromSource);
}

TEST_F(CompilationRunTest, OutputFileCountMatchesSuccessfulFiles) {
    WriteFile(sourceDir / "a.vert", "ok");
    WriteFile(sourceDir / "b.frag", "FAIL");
    WriteFile(sourceDir / "c.comp", "ok");
    WriteFile(sourceDir / "readme.md", "docs");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    EXPECT_EQ(report.outputs.size(), 2u);
    EXPECT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(Outputs().size(), report.outputs.size());
}

TEST_F(CompilationRunTest, NonShaderFilesProduceNothing) {
    WriteFile(sourceDir / "notes.txt", "text");
    WriteFile(sourceDir / "README.md", "# readme");
    WriteFile(sourceDir / "Makefile", "all:");
    WriteFile(sourceDir / ".vert", "dot file");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    EXPECT_TRUE(report.Succeeded());
    EXPECT_TRUE(report.outputs.empty());
    EXPECT_TRUE(compiler.requests.empty());
    EXPECT_FALSE(fs::exists(SpirvDir()));
}

TEST_F(CompilationRunTest, DirectoriesAreNotClassified) {
    fs::create_directories(sourceDir / "folder.vert");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    EXPECT_TRUE(report.Succeeded());
    EXPECT_TRUE(compiler.requests.empty());
}

TEST_F(CompilationRunTest, ArtifactNameFlattensSourcePath) {
    WriteFile(sourceDir / "post" / "blur.comp", "ok");

    CompilationRun run(sourceDir);
    run.MaxDepth(1).OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    ASSERT_EQ(report.outputs.size(), 1u);
    fs::path expected = SpirvDir() / ShaderPathToFileName(sourceDir / "post" / "blur.comp");
    EXPECT_EQ(report.outputs[0], expected);
    EXPECT_TRUE(fs::exists(expected));
    EXPECT_TRUE(expected.filename().string().ends_with("__src__post__blur.comp.spirv"));
}

TEST_F(CompilationRunTest, ArtifactContainsRawWords) {
    WriteFile(sourceDir / "a.vert", "12345");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    ASSERT_EQ(report.outputs.size(), 1u);
    auto words = LoadSpirvWords(report.outputs[0]);
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 4u);
    EXPECT_EQ((*words)[0], SPIRV_MAGIC);
    EXPECT_EQ((*words)[2], 5u);
    EXPECT_EQ(fs::file_size(report.outputs[0]), 16u);
}

// ===== Traversal depth =====

TEST_F(CompilationRunTest, DepthZeroVisitsOnlyDirectChildren) {
    WriteFile(sourceDir / "top.vert", "ok");
    WriteFile(sourceDir / "sub" / "nested.vert", "ok");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    ASSERT_EQ(compiler.requests.size(), 1u);
    EXPECT_EQ(compiler.requests[0].virtualPath, (sourceDir / "top.vert").string());
    EXPECT_EQ(report.outputs.size(), 1u);
}

TEST_F(CompilationRunTest, FileOneLevelBeyondMaxDepthIsNeverVisited) {
    WriteFile(sourceDir / "l0.vert", "ok");
    WriteFile(sourceDir / "a" / "l1.vert", "ok");
    WriteFile(sourceDir / "a" / "b" / "l2.vert", "ok");
    WriteFile(sourceDir / "a" / "b" / "c" / "l3.vert", "FAIL");

    CompilationRun run(sourceDir);
    run.MaxDepth(2).OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    EXPECT_TRUE(report.Succeeded());
    EXPECT_EQ(report.outputs.size(), 3u);
    for (const auto& name : Outputs()) {
        EXPECT_EQ(name.find("l3.vert"), std::string::npos) << name;
    }
}

TEST_F(CompilationRunTest, DepthAppliesToEveryRoot) {
    fs::path otherRoot = testDir / "other";
    WriteFile(sourceDir / "x" / "a.vert", "ok");
    WriteFile(otherRoot / "y" / "b.frag", "ok");
    WriteFile(otherRoot / "y" / "z" / "c.frag", "ok");

    CompilationRun run(sourceDir);
    run.WithDir(otherRoot).MaxDepth(1).OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    EXPECT_TRUE(report.Succeeded());
    EXPECT_EQ(report.outputs.size(), 2u);
}

// ===== Ordering =====

TEST_F(CompilationRunTest, RootsAndEntriesVisitedInConsistentOrder) {
    fs::path second = testDir / "second";
    WriteFile(sourceDir / "b.vert", "ok");
    WriteFile(sourceDir / "a.vert", "ok");
    WriteFile(sourceDir / "c" / "d.vert", "ok");
    WriteFile(second / "a.frag", "ok");

    CompilationRun run(sourceDir);
    run.WithDir(second).MaxDepth(1).OutputDirectory(outDir).WithCompiler(compiler);
    run.Execute();

    std::vector<std::string> visited;
    for (const auto& request : compiler.requests) {
        visited.push_back(request.virtualPath);
    }
    std::vector<std::string> expected = {
        (sourceDir / "a.vert").string(),
        (sourceDir / "b.vert").string(),
        (sourceDir / "c" / "d.vert").string(),
        (second / "a.frag").string(),
    };
    EXPECT_EQ(visited, expected);
}

TEST_F(CompilationRunTest, DuplicateRootsCompileTwice) {
    WriteFile(sourceDir / "a.vert", "ok");

    CompilationRun run(sourceDir);
    run.WithDir(sourceDir).OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    EXPECT_TRUE(report.Succeeded());
    EXPECT_EQ(compiler.requests.size(), 2u);
    EXPECT_EQ(Outputs().size(), 1u);
}

// ===== Error aggregation =====

TEST_F(CompilationRunTest, ErrorsCollectedInEncounterOrder) {
    WriteFile(sourceDir / "a.frag", "FAIL");
    WriteFile(sourceDir / "b.vert", "ok");
    WriteFile(sourceDir / "c.comp", "FAIL");

    CompilationRun run(sourceDir);
    run.WithDir(testDir / "does_not_exist").OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    ASSERT_EQ(report.errors.size(), 3u);
    ASSERT_TRUE(IsCompileFailure(report.errors[0]));
    EXPECT_EQ(ErrorPath(report.errors[0]), sourceDir / "a.frag");
    ASSERT_TRUE(IsCompileFailure(report.errors[1]));
    EXPECT_EQ(ErrorPath(report.errors[1]), sourceDir / "c.comp");
    ASSERT_TRUE(IsIoFailure(report.errors[2]));
    EXPECT_EQ(std::get<IoFailure>(report.errors[2]).operation, IoOperation::Traverse);

    // The successful file is still written
    EXPECT_EQ(report.outputs.size(), 1u);
}

TEST_F(CompilationRunTest, CompileFailureCarriesCompilerDiagnostic) {
    WriteFile(sourceDir / "bad.frag", "FAIL");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    ASSERT_EQ(report.errors.size(), 1u);
    const auto& failure = std::get<CompileFailure>(report.errors[0]);
    EXPECT_EQ(failure.diagnostic, (sourceDir / "bad.frag").string() + ":1: error: syntax error");
}

TEST_F(CompilationRunTest, UnwritableOutputIsIoFailureAndRunContinues) {
    WriteFile(sourceDir / "a.vert", "ok");
    WriteFile(sourceDir / "b.vert", "ok");
    // A directory squatting on a's artifact name makes that write fail
    fs::create_directories(SpirvDir() / ShaderPathToFileName(sourceDir / "a.vert"));

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    ASSERT_EQ(report.errors.size(), 1u);
    const auto& failure = std::get<IoFailure>(report.errors[0]);
    EXPECT_EQ(failure.operation, IoOperation::WriteArtifact);
    EXPECT_EQ(report.outputs.size(), 1u);
}

TEST_F(CompilationRunTest, UnreadableSourceIsIoFailureAndRunContinues) {
    // Dangling link: classified by name, but opening it fails
    fs::create_symlink(testDir / "does_not_exist.vert", sourceDir / "a.vert");
    WriteFile(sourceDir / "b.vert", "ok");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    ASSERT_EQ(report.errors.size(), 1u);
    const auto& failure = std::get<IoFailure>(report.errors[0]);
    EXPECT_EQ(failure.operation, IoOperation::ReadSource);
    EXPECT_EQ(failure.path, sourceDir / "a.vert");
    EXPECT_EQ(failure.code, std::errc::no_such_file_or_directory);
    EXPECT_EQ(FormatError(report.errors[0]).rfind("IO error: failed to read ", 0), 0u);

    ASSERT_EQ(compiler.requests.size(), 1u);
    EXPECT_EQ(Outputs(), std::vector<std::string>{ShaderPathToFileName(sourceDir / "b.vert")});
}

TEST_F(CompilationRunTest, EntryStatFailureIsTraverseFailure) {
    // A self-referencing link cannot be resolved (ELOOP)
    fs::create_symlink("loop.vert", sourceDir / "loop.vert");
    WriteFile(sourceDir / "main.vert", "ok");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    ASSERT_EQ(report.errors.size(), 1u);
    const auto& failure = std::get<IoFailure>(report.errors[0]);
    EXPECT_EQ(failure.operation, IoOperation::Traverse);
    EXPECT_EQ(failure.path, sourceDir / "loop.vert");
    EXPECT_EQ(report.outputs.size(), 1u);
}

TEST_F(CompilationRunTest, BlockedOutputDirectoryIsPerFileFailure) {
    WriteFile(sourceDir / "a.vert", "ok");
    WriteFile(sourceDir / "b.vert", "ok");
    // A regular file where SPIR-V/ must be created
    WriteFile(SpirvDir(), "not a directory");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    RunReport report = run.Execute();

    ASSERT_EQ(report.errors.size(), 2u);
    for (const auto& error : report.errors) {
        ASSERT_TRUE(IsIoFailure(error));
        EXPECT_EQ(std::get<IoFailure>(error).operation, IoOperation::CreateOutputDir);
    }
    EXPECT_TRUE(report.outputs.empty());
}

TEST_F(CompilationRunTest, ExistingOutputDirectoryIsNotAnError) {
    fs::create_directories(SpirvDir());
    WriteFile(sourceDir / "a.vert", "ok");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    EXPECT_TRUE(run.Execute().Succeeded());
}

TEST_F(CompilationRunTest, MissingOutputDirectoryConfigurationReported) {
#ifndef _WIN32
    unsetenv(OUTPUT_DIR_ENV);
#endif
    WriteFile(sourceDir / "a.vert", "ok");

    CompilationRun run(sourceDir);
    run.WithCompiler(compiler);
    RunReport report = run.Execute();

    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(std::get<IoFailure>(report.errors[0]).operation, IoOperation::Configure);
    EXPECT_TRUE(compiler.requests.empty());
}

#ifndef _WIN32
TEST_F(CompilationRunTest, OutputDirectoryFallsBackToEnvironment) {
    setenv(OUTPUT_DIR_ENV, outDir.string().c_str(), 1);
    WriteFile(sourceDir / "a.vert", "ok");

    CompilationRun run(sourceDir);
    run.WithCompiler(compiler);
    RunReport report = run.Execute();
    unsetenv(OUTPUT_DIR_ENV);

    EXPECT_TRUE(report.Succeeded());
    EXPECT_EQ(Outputs().size(), 1u);
}
#endif

// ===== Reporting =====

TEST_F(CompilationRunTest, RunPrintsEveryFailureThenThrows) {
    WriteFile(sourceDir / "ok.frag", "ok");
    WriteFile(sourceDir / "bad.frag", "FAIL");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);

    std::ostringstream diagnostics;
    try {
        run.Run(diagnostics);
        FAIL() << "Run() should throw when a shader fails";
    } catch (const CompilationRunFailed& e) {
        EXPECT_EQ(e.GetErrorCount(), 1u);
        EXPECT_STREQ(e.what(), "1 errors were encountered while attempting to compile shaders.");
    }

    std::string text = diagnostics.str();
    EXPECT_EQ(text.rfind("Error compiling shader at \"" + (sourceDir / "bad.frag").string() + "\": ", 0), 0u) << text;
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 1);

    // The valid shader was still written
    std::vector<std::string> expected = {ShaderPathToFileName(sourceDir / "ok.frag")};
    EXPECT_EQ(Outputs(), expected);
}

TEST_F(CompilationRunTest, PrintedDiagnosticCountMatchesErrorSet) {
    WriteFile(sourceDir / "a.vert", "FAIL");
    WriteFile(sourceDir / "b.vert", "FAIL");

    CompilationRun run(sourceDir);
    run.WithDir(testDir / "missing_root").OutputDirectory(outDir).WithCompiler(compiler);

    std::ostringstream diagnostics;
    EXPECT_THROW(run.Run(diagnostics), CompilationRunFailed);

    std::string text = diagnostics.str();
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 3);
    EXPECT_NE(text.find("IO error: "), std::string::npos);
}

TEST_F(CompilationRunTest, SuccessfulRunPrintsNothing) {
    WriteFile(sourceDir / "a.vert", "ok");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);

    std::ostringstream diagnostics;
    EXPECT_NO_THROW(run.Run(diagnostics));
    EXPECT_TRUE(diagnostics.str().empty());
}

TEST_F(CompilationRunTest, RunIsSingleUse) {
    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    run.Execute();

    EXPECT_THROW(run.Execute(), std::logic_error);
    EXPECT_THROW(run.Run(), std::logic_error);
}

TEST_F(CompilationRunTest, RerunOverwritesWithIdenticalBytes) {
    WriteFile(sourceDir / "a.vert", "ok");
    WriteFile(sourceDir / "sub" / "b.frag", "ok");

    CompilationRun first(sourceDir);
    first.MaxDepth(1).OutputDirectory(outDir).WithCompiler(compiler);
    RunReport firstReport = first.Execute();
    ASSERT_TRUE(firstReport.Succeeded());

    std::vector<std::string> firstBytes;
    for (const auto& output : firstReport.outputs) {
        firstBytes.push_back(ReadFile(output));
    }

    CompilationRun second(sourceDir);
    second.MaxDepth(1).OutputDirectory(outDir).WithCompiler(compiler);
    RunReport secondReport = second.Execute();
    ASSERT_TRUE(secondReport.Succeeded());

    ASSERT_EQ(secondReport.outputs, firstReport.outputs);
    for (size_t i = 0; i < secondReport.outputs.size(); ++i) {
        EXPECT_EQ(ReadFile(secondReport.outputs[i]), firstBytes[i]);
    }
    EXPECT_EQ(Outputs().size(), 2u);
}

TEST_F(CompilationRunTest, LoggerRecordsArtifactsWhenEnabled) {
    WriteFile(sourceDir / "a.vert", "ok");
    WriteFile(sourceDir / "notes.txt", "skip me");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    run.SetLoggerEnabled(true);
    run.Execute();

    ASSERT_NE(run.GetLogger(), nullptr);
    std::string logs = run.GetLogger()->ExtractLogs();
    EXPECT_NE(logs.find("Skipping"), std::string::npos);
    EXPECT_NE(logs.find("Vertex"), std::string::npos);
}

TEST_F(CompilationRunTest, CompilerWarningsAreLogged) {
    WriteFile(sourceDir / "a.vert", "WARN");
    WriteFile(sourceDir / "b.vert", "clean");

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler);
    run.SetLoggerEnabled(true);
    run.GetLogger()->SetMinimumLevel(Log::LogLevel::LOG_WARNING);
    RunReport report = run.Execute();

    EXPECT_TRUE(report.Succeeded());
    const auto& entries = run.GetLogger()->GetEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, Log::LogLevel::LOG_WARNING);
    EXPECT_NE(entries[0].message.find("warning: unused variable"), std::string::npos);
}

TEST_F(CompilationRunTest, OptionsReachEveryRequest) {
    WriteFile(sourceDir / "a.vert", "ok");
    WriteFile(sourceDir / "b.frag", "ok");

    CompilationOptions options;
    options.optimizePerformance = true;
    options.generateDebugInfo = true;
    options.targetVulkanVersion = 120;
    options.targetSpirvVersion = 150;

    CompilationRun run(sourceDir);
    run.OutputDirectory(outDir).WithCompiler(compiler).WithOptions(options);
    RunReport report = run.Execute();

    ASSERT_TRUE(report.Succeeded());
    ASSERT_EQ(compiler.requests.size(), 2u);
    for (const auto& request : compiler.requests) {
        EXPECT_TRUE(request.options.optimizePerformance);
        EXPECT_TRUE(request.options.generateDebugInfo);
        EXPECT_EQ(request.options.targetVulkanVersion, 120);
        EXPECT_EQ(request.options.targetSpirvVersion, 150);
        EXPECT_FALSE(request.options.validateSpirv);
    }
}
