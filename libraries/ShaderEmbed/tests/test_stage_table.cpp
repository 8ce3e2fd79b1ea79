#include <gtest/gtest.h>
#include "ShaderEmbed/StageTable.h"
#include <set>

using namespace ShaderEmbed;

TEST(StageTableTest, EveryExtensionMapsToItsStage) {
    const std::vector<std::pair<std::string, ShaderStage>> expected = {
        {"vert", ShaderStage::Vertex},        {"vs", ShaderStage::Vertex},
        {"frag", ShaderStage::Fragment},      {"fs", ShaderStage::Fragment},
        {"gs", ShaderStage::Geometry},        {"geom", ShaderStage::Geometry},
        {"comp", ShaderStage::Compute},
        {"tesc", ShaderStage::TessControl},   {"tese", ShaderStage::TessEval},
        {"rgen", ShaderStage::RayGen},        {"rint", ShaderStage::Intersection},
        {"rahit", ShaderStage::AnyHit},       {"rchit", ShaderStage::ClosestHit},
        {"rmiss", ShaderStage::Miss},         {"rcall", ShaderStage::Callable},
        {"mesh", ShaderStage::Mesh},          {"task", ShaderStage::Task},
        {"glsl", ShaderStage::InferFromSource},
    };

    ASSERT_EQ(expected.size(), STAGE_EXTENSIONS.size());
    for (const auto& [ext, stage] : expected) {
        auto result = StageFromExtension(ext);
        ASSERT_TRUE(result.has_value()) << ext;
        EXPECT_EQ(*result, stage) << ext;
    }
}

TEST(StageTableTest, ExtensionsAreUnique) {
    std::set<std::string_view> seen;
    for (const auto& row : STAGE_EXTENSIONS) {
        EXPECT_TRUE(seen.insert(row.extension).second) << row.extension;
    }
}

TEST(StageTableTest, UnknownExtensionsAreSkipped) {
    for (const char* ext : {"txt", "md", "spv", "hlsl", "", "VERT", "Frag", "vert ", ".vert"}) {
        EXPECT_FALSE(StageFromExtension(ext).has_value()) << "'" << ext << "'";
    }
}

TEST(StageTableTest, InferFromPathUsesFinalExtension) {
    EXPECT_EQ(InferStageFromPath("shaders/post/blur.comp"), ShaderStage::Compute);
    EXPECT_EQ(InferStageFromPath("a/b.frag.vert"), ShaderStage::Vertex);
    EXPECT_EQ(InferStageFromPath("lighting.glsl"), ShaderStage::InferFromSource);
    EXPECT_FALSE(InferStageFromPath("a/b.vert.txt").has_value());
}

TEST(StageTableTest, PathsWithoutExtensionAreSkipped) {
    EXPECT_FALSE(InferStageFromPath("Makefile").has_value());
    EXPECT_FALSE(InferStageFromPath("shaders/vert").has_value());
    EXPECT_FALSE(InferStageFromPath("shaders/.vert").has_value());
    EXPECT_FALSE(InferStageFromPath("shaders/trailing.").has_value());
}

TEST(StageTableTest, CanonicalExtensionRoundTripsThroughTable) {
    for (ShaderStage stage : {ShaderStage::Vertex, ShaderStage::Fragment, ShaderStage::Geometry,
                              ShaderStage::Compute, ShaderStage::TessControl, ShaderStage::TessEval,
                              ShaderStage::RayGen, ShaderStage::Intersection, ShaderStage::AnyHit,
                              ShaderStage::ClosestHit, ShaderStage::Miss, ShaderStage::Callable,
                              ShaderStage::Mesh, ShaderStage::Task, ShaderStage::InferFromSource}) {
        EXPECT_EQ(StageFromExtension(GetShaderStageExtension(stage)), stage) << ShaderStageName(stage);
    }
}

TEST(ShaderStageTest, VulkanFlagsMatch) {
    EXPECT_EQ(ToVulkanStage(ShaderStage::Vertex), VK_SHADER_STAGE_VERTEX_BIT);
    EXPECT_EQ(ToVulkanStage(ShaderStage::Compute), VK_SHADER_STAGE_COMPUTE_BIT);
    EXPECT_EQ(ToVulkanStage(ShaderStage::ClosestHit), VK_SHADER_STAGE_CLOSEST_HIT_BIT_KHR);
    EXPECT_EQ(static_cast<uint32_t>(ToVulkanStage(ShaderStage::InferFromSource)), 0u);
}
