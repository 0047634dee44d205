#include <gtest/gtest.h>
#include <string>
#include <string_view>

import Core;
import Graphics;

using namespace Graphics;

// -----------------------------------------------------------------------------
// Material configs (.amt)
// -----------------------------------------------------------------------------

TEST(MaterialConfig, ParsesEveryKey)
{
    constexpr std::string_view text = R"(
# test material
version=1
name = cobblestone
shader=Shader.Builtin.Material
diffuse_colour=1.0 0.5 0.25 1.0
shininess=16.5
diffuse_map_name=cobblestone
specular_map_name=cobblestone_SPEC
normal_map_name=cobblestone_NRM
autorelease=false
)";

    auto config = ParseMaterialConfig(text, "fallback");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->Version, 1u);
    EXPECT_EQ(config->Name, "cobblestone");
    EXPECT_EQ(config->ShaderName, "Shader.Builtin.Material");
    EXPECT_FLOAT_EQ(config->DiffuseColour.y, 0.5f);
    EXPECT_FLOAT_EQ(config->DiffuseColour.z, 0.25f);
    EXPECT_FLOAT_EQ(config->Shininess, 16.5f);
    EXPECT_EQ(config->DiffuseMapName, "cobblestone");
    EXPECT_EQ(config->SpecularMapName, "cobblestone_SPEC");
    EXPECT_EQ(config->NormalMapName, "cobblestone_NRM");
    EXPECT_FALSE(config->AutoRelease);
}

TEST(MaterialConfig, FileNameIsDefaultName)
{
    auto config = ParseMaterialConfig("shader=Shader.Builtin.UI\n", "panel");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->Name, "panel");
    EXPECT_TRUE(config->AutoRelease);
    EXPECT_FLOAT_EQ(config->Shininess, 32.0f);
}

TEST(MaterialConfig, UnknownKeysAndJunkLinesAreSkipped)
{
    auto config = ParseMaterialConfig("shader=s\nfrobnicate=yes\njust some words\n", "m");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->ShaderName, "s");
}

TEST(MaterialConfig, MalformedValuesAreRejected)
{
    auto badColour = ParseMaterialConfig("shader=s\ndiffuse_colour=1 1 1\n", "m");
    ASSERT_FALSE(badColour.has_value());
    EXPECT_EQ(badColour.error(), Core::ErrorCode::InvalidFormat);

    auto badShininess = ParseMaterialConfig("shader=s\nshininess=shiny\n", "m");
    ASSERT_FALSE(badShininess.has_value());
    EXPECT_EQ(badShininess.error(), Core::ErrorCode::InvalidFormat);

    auto badBool = ParseMaterialConfig("shader=s\nautorelease=maybe\n", "m");
    EXPECT_FALSE(badBool.has_value());
}

TEST(MaterialConfig, ValidationRequiresShaderAndRanges)
{
    auto noShader = ParseMaterialConfig("name=m\n", "m");
    ASSERT_FALSE(noShader.has_value());
    EXPECT_EQ(noShader.error(), Core::ErrorCode::InvalidFormat);

    MaterialConfig config;
    config.Name = "m";
    config.ShaderName = "s";
    EXPECT_TRUE(ValidateMaterialConfig(config).has_value());

    config.DiffuseColour.x = 1.5f;
    EXPECT_FALSE(ValidateMaterialConfig(config).has_value());

    config.DiffuseColour.x = 1.0f;
    config.Shininess = -1.0f;
    EXPECT_FALSE(ValidateMaterialConfig(config).has_value());

    config.Shininess = 8.0f;
    config.Name.clear();
    EXPECT_FALSE(ValidateMaterialConfig(config).has_value());
}

// -----------------------------------------------------------------------------
// Shader configs
// -----------------------------------------------------------------------------

namespace
{
    ShaderConfig MakeShaderConfig()
    {
        ShaderConfig config;
        config.Name = "Shader.Test";
        config.RenderPassName = "Renderpass.Builtin.World";
        config.Stages = {ShaderStage::Vertex, ShaderStage::Fragment};
        config.StageFiles = {"shaders/test.vert.spv", "shaders/test.frag.spv"};
        config.Attributes = {{"in_position", ShaderAttributeType::Float32_3}, {"in_texcoord", ShaderAttributeType::Float32_2}};
        config.Uniforms = {
            {"projection", ShaderUniformType::Matrix4, ShaderScope::Global},
            {"model", ShaderUniformType::Matrix4, ShaderScope::Local},
        };
        return config;
    }
}

TEST(ShaderConfig, ValidConfigPasses)
{
    EXPECT_TRUE(ValidateShaderConfig(MakeShaderConfig()).has_value());
}

TEST(ShaderConfig, DuplicateNamesAreRejected)
{
    auto attributes = MakeShaderConfig();
    attributes.Attributes.push_back({"in_position", ShaderAttributeType::Float32_3});
    auto result = ValidateShaderConfig(attributes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidFormat);

    auto uniforms = MakeShaderConfig();
    uniforms.Uniforms.push_back({"projection", ShaderUniformType::Matrix4, ShaderScope::Instance});
    EXPECT_FALSE(ValidateShaderConfig(uniforms).has_value());
}

TEST(ShaderConfig, StructuralProblemsAreRejected)
{
    auto noName = MakeShaderConfig();
    noName.Name.clear();
    EXPECT_FALSE(ValidateShaderConfig(noName).has_value());

    auto noPass = MakeShaderConfig();
    noPass.RenderPassName.clear();
    EXPECT_FALSE(ValidateShaderConfig(noPass).has_value());

    auto mismatch = MakeShaderConfig();
    mismatch.StageFiles.pop_back();
    EXPECT_FALSE(ValidateShaderConfig(mismatch).has_value());

    auto noStages = MakeShaderConfig();
    noStages.Stages.clear();
    noStages.StageFiles.clear();
    EXPECT_FALSE(ValidateShaderConfig(noStages).has_value());
}

TEST(ShaderConfig, SizesFollowTypes)
{
    EXPECT_EQ(GetAttributeSize(ShaderAttributeType::Float32_3), 12u);
    EXPECT_EQ(GetAttributeSize(ShaderAttributeType::Matrix4), 64u);
    EXPECT_EQ(GetUniformSize({"m", ShaderUniformType::Matrix4}), 64u);
    EXPECT_EQ(GetUniformSize({"s", ShaderUniformType::Sampler}), 0u);
    EXPECT_EQ(GetUniformSize({"c", ShaderUniformType::Custom, ShaderScope::Global, 48}), 48u);
}

TEST(ShaderConfig, BuiltinShadersValidate)
{
    const auto configs = GetBuiltinShaderConfigs();
    ASSERT_EQ(configs.size(), 5u);
    for (const auto& config : configs)
        EXPECT_TRUE(ValidateShaderConfig(config).has_value()) << config.Name;

    EXPECT_EQ(configs[0].Name, BUILTIN_MATERIAL_SHADER_NAME);
    EXPECT_EQ(configs[1].Name, BUILTIN_UI_SHADER_NAME);
    EXPECT_EQ(configs[2].Name, BUILTIN_SKYBOX_SHADER_NAME);
}
