module;
#include <cstdint>
#include <string_view>
#include <vector>

export module Graphics:BuiltinShaders;
import :ShaderConfig;
import :RenderTarget;
import :RenderView;

export namespace Graphics
{
    inline constexpr std::string_view BUILTIN_SKYBOX_SHADER_NAME = "Shader.Builtin.Skybox";
    inline constexpr std::string_view BUILTIN_WORLD_PICK_SHADER_NAME = "Shader.Builtin.WorldPick";
    inline constexpr std::string_view BUILTIN_UI_PICK_SHADER_NAME = "Shader.Builtin.UIPick";

    inline constexpr std::string_view BUILTIN_SKYBOX_PASS_NAME = "Renderpass.Builtin.Skybox";
    inline constexpr std::string_view BUILTIN_WORLD_PASS_NAME = "Renderpass.Builtin.World";
    inline constexpr std::string_view BUILTIN_UI_PASS_NAME = "Renderpass.Builtin.UI";
    inline constexpr std::string_view BUILTIN_WORLD_PICK_PASS_NAME = "Renderpass.Builtin.WorldPick";
    inline constexpr std::string_view BUILTIN_UI_PICK_PASS_NAME = "Renderpass.Builtin.UIPick";

    // Material, UI, skybox, world pick and UI pick, in creation order.
    [[nodiscard]] std::vector<ShaderConfig> GetBuiltinShaderConfigs();

    // Skybox, world, UI, then the two pick passes, all covering width x height.
    [[nodiscard]] std::vector<RenderPassConfig> GetDefaultRenderPassConfigs(uint32_t width, uint32_t height,
                                                                            uint8_t renderTargetCount);

    // "skybox", "world", "ui" and "pick" over the default passes.
    [[nodiscard]] std::vector<RenderViewConfig> GetDefaultRenderViewConfigs(uint16_t width, uint16_t height);
}
