module;
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module Graphics;

namespace Graphics
{
    namespace
    {
        std::vector<ShaderAttributeConfig> Attributes3D()
        {
            return {
                {"in_position", ShaderAttributeType::Float32_3},
                {"in_normal", ShaderAttributeType::Float32_3},
                {"in_texcoord", ShaderAttributeType::Float32_2},
                {"in_colour", ShaderAttributeType::Float32_4},
                {"in_tangent", ShaderAttributeType::Float32_3},
            };
        }

        std::vector<ShaderAttributeConfig> Attributes2D()
        {
            return {
                {"in_position", ShaderAttributeType::Float32_2},
                {"in_texcoord", ShaderAttributeType::Float32_2},
            };
        }

        ShaderConfig MakeConfig(std::string_view name, std::string_view pass, std::string_view stageFile)
        {
            ShaderConfig config;
            config.Name = std::string(name);
            config.RenderPassName = std::string(pass);
            config.Stages = {ShaderStage::Vertex, ShaderStage::Fragment};
            config.StageFiles = {std::string("shaders/") + std::string(stageFile) + ".vert.spv",
                                 std::string("shaders/") + std::string(stageFile) + ".frag.spv"};
            return config;
        }

        ShaderUniformConfig Uniform(std::string_view name, ShaderUniformType type, ShaderScope scope)
        {
            return {std::string(name), type, scope, 0};
        }

        std::vector<ShaderUniformConfig> PickUniforms()
        {
            return {
                Uniform("projection", ShaderUniformType::Matrix4, ShaderScope::Global),
                Uniform("view", ShaderUniformType::Matrix4, ShaderScope::Global),
                Uniform("id_colour", ShaderUniformType::Float32_3, ShaderScope::Instance),
                Uniform("model", ShaderUniformType::Matrix4, ShaderScope::Local),
            };
        }
    }

    std::vector<ShaderConfig> GetBuiltinShaderConfigs()
    {
        std::vector<ShaderConfig> configs;

        ShaderConfig material = MakeConfig(BUILTIN_MATERIAL_SHADER_NAME, BUILTIN_WORLD_PASS_NAME, "Builtin.MaterialShader");
        material.UseInstances = true;
        material.UseLocal = true;
        material.Attributes = Attributes3D();
        material.Uniforms = {
            Uniform("projection", ShaderUniformType::Matrix4, ShaderScope::Global),
            Uniform("view", ShaderUniformType::Matrix4, ShaderScope::Global),
            Uniform("ambient_colour", ShaderUniformType::Float32_4, ShaderScope::Global),
            Uniform("view_position", ShaderUniformType::Float32_3, ShaderScope::Global),
            Uniform("mode", ShaderUniformType::Uint32, ShaderScope::Global),
            Uniform("diffuse_colour", ShaderUniformType::Float32_4, ShaderScope::Instance),
            Uniform("diffuse_texture", ShaderUniformType::Sampler, ShaderScope::Instance),
            Uniform("specular_texture", ShaderUniformType::Sampler, ShaderScope::Instance),
            Uniform("normal_texture", ShaderUniformType::Sampler, ShaderScope::Instance),
            Uniform("shininess", ShaderUniformType::Float32, ShaderScope::Instance),
            Uniform("model", ShaderUniformType::Matrix4, ShaderScope::Local),
        };
        configs.push_back(std::move(material));

        ShaderConfig ui = MakeConfig(BUILTIN_UI_SHADER_NAME, BUILTIN_UI_PASS_NAME, "Builtin.UIShader");
        ui.UseInstances = true;
        ui.UseLocal = true;
        ui.CullMode = FaceCullMode::None;
        ui.DepthTest = false;
        ui.DepthWrite = false;
        ui.Attributes = Attributes2D();
        ui.Uniforms = {
            Uniform("projection", ShaderUniformType::Matrix4, ShaderScope::Global),
            Uniform("view", ShaderUniformType::Matrix4, ShaderScope::Global),
            Uniform("diffuse_colour", ShaderUniformType::Float32_4, ShaderScope::Instance),
            Uniform("diffuse_texture", ShaderUniformType::Sampler, ShaderScope::Instance),
            Uniform("model", ShaderUniformType::Matrix4, ShaderScope::Local),
        };
        configs.push_back(std::move(ui));

        ShaderConfig skybox = MakeConfig(BUILTIN_SKYBOX_SHADER_NAME, BUILTIN_SKYBOX_PASS_NAME, "Builtin.SkyboxShader");
        skybox.UseInstances = true;
        skybox.CullMode = FaceCullMode::Front;
        skybox.DepthTest = false;
        skybox.DepthWrite = false;
        skybox.Attributes = Attributes3D();
        skybox.Uniforms = {
            Uniform("projection", ShaderUniformType::Matrix4, ShaderScope::Global),
            Uniform("view", ShaderUniformType::Matrix4, ShaderScope::Global),
            Uniform("cube_texture", ShaderUniformType::Sampler, ShaderScope::Instance),
        };
        configs.push_back(std::move(skybox));

        ShaderConfig worldPick = MakeConfig(BUILTIN_WORLD_PICK_SHADER_NAME, BUILTIN_WORLD_PICK_PASS_NAME, "Builtin.WorldPickShader");
        worldPick.UseInstances = true;
        worldPick.UseLocal = true;
        worldPick.Attributes = Attributes3D();
        worldPick.Uniforms = PickUniforms();
        configs.push_back(std::move(worldPick));

        ShaderConfig uiPick = MakeConfig(BUILTIN_UI_PICK_SHADER_NAME, BUILTIN_UI_PICK_PASS_NAME, "Builtin.UIPickShader");
        uiPick.UseInstances = true;
        uiPick.UseLocal = true;
        uiPick.CullMode = FaceCullMode::None;
        uiPick.DepthTest = false;
        uiPick.DepthWrite = false;
        uiPick.Attributes = Attributes2D();
        uiPick.Uniforms = PickUniforms();
        configs.push_back(std::move(uiPick));

        return configs;
    }

    std::vector<RenderPassConfig> GetDefaultRenderPassConfigs(uint32_t width, uint32_t height, uint8_t renderTargetCount)
    {
        const glm::vec4 area{0.0f, 0.0f, static_cast<float>(width), static_cast<float>(height)};

        auto colour = [](RenderTargetAttachmentSource source, RenderTargetAttachmentLoadOp load, bool presentAfter)
        {
            return RenderTargetAttachmentConfig{RenderTargetAttachmentType::Colour, source, load,
                                                RenderTargetAttachmentStoreOp::Store, presentAfter};
        };
        auto depth = [](RenderTargetAttachmentSource source)
        {
            return RenderTargetAttachmentConfig{RenderTargetAttachmentType::Depth, source, RenderTargetAttachmentLoadOp::DontCare,
                                                RenderTargetAttachmentStoreOp::Store, false};
        };

        std::vector<RenderPassConfig> passes(5);

        RenderPassConfig& skybox = passes[0];
        skybox.Name = std::string(BUILTIN_SKYBOX_PASS_NAME);
        skybox.ClearColour = {0.0f, 0.0f, 0.2f, 1.0f};
        skybox.ClearFlags = ToFlags(RenderPassClearFlag::ColourBuffer);
        skybox.Attachments = {colour(RenderTargetAttachmentSource::Default, RenderTargetAttachmentLoadOp::DontCare, false)};

        // Draws over the skybox.
        RenderPassConfig& world = passes[1];
        world.Name = std::string(BUILTIN_WORLD_PASS_NAME);
        world.ClearFlags = ToFlags(RenderPassClearFlag::DepthBuffer) | ToFlags(RenderPassClearFlag::StencilBuffer);
        world.Attachments = {colour(RenderTargetAttachmentSource::Default, RenderTargetAttachmentLoadOp::Load, false),
                             depth(RenderTargetAttachmentSource::Default)};

        RenderPassConfig& ui = passes[2];
        ui.Name = std::string(BUILTIN_UI_PASS_NAME);
        ui.ClearFlags = ToFlags(RenderPassClearFlag::None);
        ui.Attachments = {colour(RenderTargetAttachmentSource::Default, RenderTargetAttachmentLoadOp::Load, true)};

        // Cleared to white: 0x00FFFFFF reads back as "no object".
        RenderPassConfig& worldPick = passes[3];
        worldPick.Name = std::string(BUILTIN_WORLD_PICK_PASS_NAME);
        worldPick.ClearColour = {1.0f, 1.0f, 1.0f, 1.0f};
        worldPick.ClearFlags = ToFlags(RenderPassClearFlag::ColourBuffer) | ToFlags(RenderPassClearFlag::DepthBuffer);
        worldPick.Attachments = {colour(RenderTargetAttachmentSource::View, RenderTargetAttachmentLoadOp::DontCare, false),
                                 depth(RenderTargetAttachmentSource::View)};

        RenderPassConfig& uiPick = passes[4];
        uiPick.Name = std::string(BUILTIN_UI_PICK_PASS_NAME);
        uiPick.ClearFlags = ToFlags(RenderPassClearFlag::None);
        uiPick.Attachments = {colour(RenderTargetAttachmentSource::View, RenderTargetAttachmentLoadOp::Load, false)};

        for (auto& pass : passes)
        {
            pass.RenderArea = area;
            pass.RenderTargetCount = renderTargetCount;
        }
        return passes;
    }

    std::vector<RenderViewConfig> GetDefaultRenderViewConfigs(uint16_t width, uint16_t height)
    {
        return {
            {"skybox", "", width, height, RenderViewKind::Skybox, {std::string(BUILTIN_SKYBOX_PASS_NAME)}},
            {"world", "", width, height, RenderViewKind::World, {std::string(BUILTIN_WORLD_PASS_NAME)}},
            {"ui", "", width, height, RenderViewKind::UI, {std::string(BUILTIN_UI_PASS_NAME)}},
            {"pick", "", width, height, RenderViewKind::Pick,
             {std::string(BUILTIN_WORLD_PICK_PASS_NAME), std::string(BUILTIN_UI_PICK_PASS_NAME)}},
        };
    }
}
