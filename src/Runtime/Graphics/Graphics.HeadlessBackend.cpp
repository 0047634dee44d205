module;
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <mutex>
#include <span>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

module Graphics;

namespace Graphics
{
    namespace
    {
        Core::Result WriteUniformBytes(std::vector<std::byte>& block, uint64_t offset, uint16_t size, const UniformValue& value)
        {
            return std::visit([&](const auto& v) -> Core::Result
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, TextureMap*>)
                {
                    return Core::Err(Core::ErrorCode::TypeMismatch);
                }
                else
                {
                    if (sizeof(T) != size)
                        return Core::Err(Core::ErrorCode::TypeMismatch);
                    if (offset + sizeof(T) > block.size())
                        return Core::Err(Core::ErrorCode::OutOfRange);

                    std::memcpy(block.data() + offset, &v, sizeof(T));
                    return Core::Ok();
                }
            }, value);
        }

        uint8_t ToByte(float channel)
        {
            return static_cast<uint8_t>(std::lround(std::clamp(channel, 0.0f, 1.0f) * 255.0f));
        }
    }

    HeadlessBackend::HeadlessBackend(const HeadlessBackendConfig& config)
        : m_Config(config)
    {
    }

    HeadlessBackend::~HeadlessBackend()
    {
        if (m_Initialized) Shutdown();
    }

    Core::Result HeadlessBackend::Initialize(std::string_view appName, uint32_t width, uint32_t height)
    {
        if (m_Initialized)
            return Core::Err(Core::ErrorCode::InvalidState);
        if (m_Config.WindowAttachmentCount == 0)
        {
            Core::Log::Error("Headless backend: at least one window attachment is required.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        m_Width = width;
        m_Height = height;
        CreateWindowAttachments();
        m_Initialized = true;

        Core::Log::Info("Headless backend initialized for '{}' ({}x{}, {} attachments).",
                        appName, width, height, m_Config.WindowAttachmentCount);
        return Core::Ok();
    }

    void HeadlessBackend::Shutdown()
    {
        if (!m_Initialized) return;

        DestroyWindowAttachments();
        {
            std::lock_guard lock(m_TextureMutex);
            if (!m_Textures.empty())
                Core::Log::Warn("Headless backend: {} textures still alive at shutdown.", m_Textures.size());
            m_Textures.clear();
        }
        m_Geometries.clear();
        m_Shaders.clear();
        m_Buffers.clear();
        m_ActivePass = nullptr;
        m_BoundShader = nullptr;
        m_FrameActive = false;
        m_Initialized = false;
    }

    void HeadlessBackend::Resized(uint32_t width, uint32_t height)
    {
        m_Width = width;
        m_Height = height;
        ++m_Stats.ResizeCount;
        if (!m_Initialized) return;

        DestroyWindowAttachments();
        CreateWindowAttachments();
    }

    void HeadlessBackend::CreateWindowAttachments()
    {
        m_WindowAttachments.assign(m_Config.WindowAttachmentCount, Texture{});
        m_DepthAttachments.assign(m_Config.WindowAttachmentCount, Texture{});

        for (uint8_t i = 0; i < m_Config.WindowAttachmentCount; ++i)
        {
            Texture& colour = m_WindowAttachments[i];
            colour.Id = i;
            colour.Name = std::format("__window_colour_{}", i);
            colour.Width = m_Width;
            colour.Height = m_Height;
            colour.ChannelCount = 4;
            colour.SetFlag(TextureFlag::IsWrapped, true);
            colour.InternalHandle = CreateTextureStorage(m_Width, m_Height, 4, 1, 0);
            colour.Generation = 0;

            Texture& depth = m_DepthAttachments[i];
            depth.Id = i;
            depth.Name = std::format("__window_depth_{}", i);
            depth.Width = m_Width;
            depth.Height = m_Height;
            depth.ChannelCount = 4;
            depth.SetFlag(TextureFlag::IsWrapped, true);
            depth.SetFlag(TextureFlag::Depth, true);
            depth.InternalHandle = CreateTextureStorage(m_Width, m_Height, 4, 1, 0xFF);
            depth.Generation = 0;
        }
        m_AttachmentIndex = 0;
    }

    void HeadlessBackend::DestroyWindowAttachments()
    {
        std::lock_guard lock(m_TextureMutex);
        for (auto& texture : m_WindowAttachments) m_Textures.erase(texture.InternalHandle);
        for (auto& texture : m_DepthAttachments) m_Textures.erase(texture.InternalHandle);
        // The Texture objects stay put; render targets point at them.
        for (auto& texture : m_WindowAttachments) texture.InternalHandle = 0;
        for (auto& texture : m_DepthAttachments) texture.InternalHandle = 0;
    }

    Core::Result HeadlessBackend::BeginFrame(double)
    {
        if (!m_Initialized || m_FrameActive)
        {
            Core::Log::Error("Headless backend: BeginFrame without a finished previous frame.");
            return Core::Err(Core::ErrorCode::InvalidState);
        }
        m_FrameActive = true;
        ++m_Stats.FramesBegun;
        return Core::Ok();
    }

    Core::Result HeadlessBackend::EndFrame(double)
    {
        if (!m_FrameActive)
        {
            Core::Log::Error("Headless backend: EndFrame without BeginFrame.");
            return Core::Err(Core::ErrorCode::InvalidState);
        }
        if (m_ActivePass)
        {
            Core::Log::Error("Headless backend: render pass '{}' still open at EndFrame.", m_ActivePass->Name);
            return Core::Err(Core::ErrorCode::FrameSubmitFailed);
        }

        m_FrameActive = false;
        m_AttachmentIndex = static_cast<uint8_t>((m_AttachmentIndex + 1) % m_WindowAttachments.size());
        ++m_Stats.FramesEnded;
        return Core::Ok();
    }

    // --- Textures ---

    uint64_t HeadlessBackend::CreateTextureStorage(uint32_t width, uint32_t height, uint8_t channels, uint32_t layers, uint8_t fill)
    {
        const uint64_t handle = m_NextHandle++;
        TextureStorage storage{width, height, channels, layers, {}};
        storage.Pixels.assign(static_cast<size_t>(width) * height * channels * layers, fill);

        std::lock_guard lock(m_TextureMutex);
        m_Textures.emplace(handle, std::move(storage));
        return handle;
    }

    HeadlessBackend::TextureStorage* HeadlessBackend::FindTexture(uint64_t handle)
    {
        auto it = m_Textures.find(handle);
        return it == m_Textures.end() ? nullptr : &it->second;
    }

    const HeadlessBackend::TextureStorage* HeadlessBackend::FindTexture(uint64_t handle) const
    {
        auto it = m_Textures.find(handle);
        return it == m_Textures.end() ? nullptr : &it->second;
    }

    Core::Result HeadlessBackend::TextureCreate(std::span<const uint8_t> pixels, Texture& texture)
    {
        const uint32_t layers = texture.Type == TextureType::Cube ? 6 : 1;
        const size_t expected = static_cast<size_t>(texture.Width) * texture.Height * texture.ChannelCount * layers;
        if (expected == 0 || pixels.size() < expected)
        {
            Core::Log::Error("Headless backend: texture '{}' needs {} bytes, got {}.", texture.Name, expected, pixels.size());
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        const uint64_t handle = CreateTextureStorage(texture.Width, texture.Height, texture.ChannelCount, layers, 0);
        {
            std::lock_guard lock(m_TextureMutex);
            auto* storage = FindTexture(handle);
            std::copy_n(pixels.begin(), expected, storage->Pixels.begin());
        }
        texture.InternalHandle = handle;
        return Core::Ok();
    }

    Core::Result HeadlessBackend::TextureCreateWriteable(Texture& texture)
    {
        if (texture.Width == 0 || texture.Height == 0 || texture.ChannelCount == 0)
        {
            Core::Log::Error("Headless backend: writeable texture '{}' has a zero dimension.", texture.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        // Cleared to white so an untouched pick buffer reads back as "no object".
        texture.InternalHandle = CreateTextureStorage(texture.Width, texture.Height, texture.ChannelCount, 1, 0xFF);
        return Core::Ok();
    }

    Core::Result HeadlessBackend::TextureResize(Texture& texture, uint32_t width, uint32_t height)
    {
        std::lock_guard lock(m_TextureMutex);
        auto* storage = FindTexture(texture.InternalHandle);
        if (!storage)
            return Core::Err(Core::ErrorCode::ResourceNotFound);

        storage->Width = width;
        storage->Height = height;
        storage->Pixels.assign(static_cast<size_t>(width) * height * storage->ChannelCount * storage->LayerCount, 0xFF);
        texture.Width = width;
        texture.Height = height;
        return Core::Ok();
    }

    Core::Result HeadlessBackend::TextureWriteData(Texture& texture, uint32_t offset, std::span<const uint8_t> pixels)
    {
        std::lock_guard lock(m_TextureMutex);
        auto* storage = FindTexture(texture.InternalHandle);
        if (!storage)
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (static_cast<size_t>(offset) + pixels.size() > storage->Pixels.size())
            return Core::Err(Core::ErrorCode::OutOfRange);

        std::ranges::copy(pixels, storage->Pixels.begin() + offset);
        return Core::Ok();
    }

    Core::Expected<std::array<uint8_t, 4>> HeadlessBackend::TextureReadPixel(const Texture& texture, uint32_t x, uint32_t y)
    {
        std::lock_guard lock(m_TextureMutex);
        const auto* storage = FindTexture(texture.InternalHandle);
        if (!storage)
            return std::unexpected(Core::ErrorCode::ResourceNotFound);
        if (x >= storage->Width || y >= storage->Height)
            return std::unexpected(Core::ErrorCode::OutOfRange);

        std::array<uint8_t, 4> rgba{0, 0, 0, 0xFF};
        const size_t base = (static_cast<size_t>(y) * storage->Width + x) * storage->ChannelCount;
        for (uint8_t c = 0; c < std::min<uint8_t>(storage->ChannelCount, 4); ++c)
            rgba[c] = storage->Pixels[base + c];
        return rgba;
    }

    void HeadlessBackend::TextureDestroy(Texture& texture)
    {
        {
            std::lock_guard lock(m_TextureMutex);
            m_Textures.erase(texture.InternalHandle);
        }
        texture.InternalHandle = 0;
    }

    Core::Result HeadlessBackend::TextureMapAcquireResources(TextureMap& map)
    {
        map.InternalHandle = m_NextHandle++;
        return Core::Ok();
    }

    void HeadlessBackend::TextureMapReleaseResources(TextureMap& map)
    {
        map.InternalHandle = 0;
    }

    size_t HeadlessBackend::GetLiveTextureCount() const
    {
        std::lock_guard lock(m_TextureMutex);
        return m_Textures.size();
    }

    // --- Geometry ---

    Core::Result HeadlessBackend::GeometryCreate(Geometry& geometry, std::span<const std::byte> vertices,
                                                 uint32_t vertexStride, uint32_t vertexCount,
                                                 std::span<const uint32_t> indices)
    {
        if (vertexCount == 0 || vertexStride == 0 || vertices.size() < static_cast<size_t>(vertexStride) * vertexCount)
        {
            Core::Log::Error("Headless backend: geometry '{}' has no usable vertex data.", geometry.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        // A reload replaces the old buffers in place.
        const bool reload = geometry.InternalId != INVALID_ID && m_Geometries.contains(geometry.InternalId);
        const uint32_t id = reload ? geometry.InternalId : m_NextGeometryId++;

        GeometryStorage& storage = m_Geometries[id];
        storage.Vertices.assign(vertices.begin(), vertices.end());
        storage.VertexStride = vertexStride;
        storage.VertexCount = vertexCount;
        storage.Indices.assign(indices.begin(), indices.end());

        geometry.InternalId = id;
        geometry.Generation = (geometry.Generation == INVALID_ID) ? 0 : geometry.Generation + 1;
        return Core::Ok();
    }

    void HeadlessBackend::GeometryDestroy(Geometry& geometry)
    {
        m_Geometries.erase(geometry.InternalId);
        geometry.InternalId = INVALID_ID;
        geometry.Generation = INVALID_ID;
    }

    void HeadlessBackend::DrawGeometry(const GeometryRenderData& data)
    {
        if (!data.Geometry || !m_Geometries.contains(data.Geometry->InternalId))
        {
            Core::Log::Warn("Headless backend: draw of a geometry that was never uploaded.");
            return;
        }
        if (!m_ActivePass)
        {
            Core::Log::Warn("Headless backend: draw of '{}' outside a render pass.", data.Geometry->Name);
            return;
        }
        ++m_Stats.DrawCalls;
    }

    // --- Render passes ---

    Core::Result HeadlessBackend::RenderPassCreate(const RenderPassConfig& config, RenderPass& pass)
    {
        if (config.RenderTargetCount == 0)
        {
            Core::Log::Error("Headless backend: render pass '{}' needs at least one render target.", config.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        pass.Id = m_NextPassId++;
        pass.Targets.assign(config.RenderTargetCount, RenderTarget{});
        for (auto& target : pass.Targets)
        {
            for (const auto& attachment : config.Attachments)
            {
                target.Attachments.push_back({
                    .Type = attachment.Type,
                    .Source = attachment.Source,
                    .LoadOperation = attachment.LoadOperation,
                    .StoreOperation = attachment.StoreOperation,
                    .PresentAfter = attachment.PresentAfter,
                    .Texture = nullptr,
                });
            }
        }
        pass.InternalHandle = m_NextHandle++;
        return Core::Ok();
    }

    void HeadlessBackend::RenderPassDestroy(RenderPass& pass)
    {
        for (auto& target : pass.Targets)
            RenderTargetDestroy(target, true);
        pass.Targets.clear();
        pass.InternalHandle = 0;
    }

    Core::Result HeadlessBackend::RenderPassBegin(RenderPass& pass, RenderTarget& target)
    {
        if (!m_FrameActive || m_ActivePass)
        {
            Core::Log::Error("Headless backend: cannot begin render pass '{}' here.", pass.Name);
            return Core::Err(Core::ErrorCode::InvalidState);
        }
        if (target.InternalHandle == 0)
        {
            Core::Log::Error("Headless backend: render pass '{}' has no render target.", pass.Name);
            return Core::Err(Core::ErrorCode::RenderPassFailed);
        }

        std::lock_guard lock(m_TextureMutex);
        for (const auto& attachment : target.Attachments)
        {
            if (!attachment.Texture) continue;
            auto* storage = FindTexture(attachment.Texture->InternalHandle);
            if (!storage) continue;

            if (attachment.Type == RenderTargetAttachmentType::Colour && (pass.ClearFlags & ToFlags(RenderPassClearFlag::ColourBuffer)))
            {
                const std::array<uint8_t, 4> clear{ToByte(pass.ClearColour.r), ToByte(pass.ClearColour.g),
                                                   ToByte(pass.ClearColour.b), ToByte(pass.ClearColour.a)};
                for (size_t i = 0; i < storage->Pixels.size(); ++i)
                    storage->Pixels[i] = clear[i % storage->ChannelCount % 4];
            }
            else if (attachment.Type == RenderTargetAttachmentType::Depth && (pass.ClearFlags & ToFlags(RenderPassClearFlag::DepthBuffer)))
            {
                std::ranges::fill(storage->Pixels, ToByte(pass.Depth));
            }
        }

        m_ActivePass = &pass;
        ++m_Stats.RenderPassesBegun;
        return Core::Ok();
    }

    Core::Result HeadlessBackend::RenderPassEnd(RenderPass& pass)
    {
        if (m_ActivePass != &pass)
        {
            Core::Log::Error("Headless backend: render pass '{}' ended but was not begun.", pass.Name);
            return Core::Err(Core::ErrorCode::InvalidState);
        }
        m_ActivePass = nullptr;
        return Core::Ok();
    }

    // --- Render targets ---

    Core::Result HeadlessBackend::RenderTargetCreate(std::span<const RenderTargetAttachment> attachments,
                                                     RenderPass& pass, uint32_t width, uint32_t height,
                                                     RenderTarget& target)
    {
        if (width == 0 || height == 0)
        {
            Core::Log::Error("Headless backend: zero-sized render target for pass '{}'.", pass.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        for (const auto& attachment : attachments)
        {
            if (!attachment.Texture)
            {
                Core::Log::Error("Headless backend: render target for pass '{}' has an attachment without a texture.", pass.Name);
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }
        }

        target.Attachments.assign(attachments.begin(), attachments.end());
        target.InternalHandle = m_NextHandle++;
        return Core::Ok();
    }

    void HeadlessBackend::RenderTargetDestroy(RenderTarget& target, bool freeInternalMemory)
    {
        target.InternalHandle = 0;
        if (freeInternalMemory)
            target.Attachments.clear();
    }

    Texture* HeadlessBackend::WindowAttachmentGet(uint8_t index)
    {
        if (index >= m_WindowAttachments.size())
        {
            Core::Log::Error("Headless backend: window attachment {} out of range.", index);
            return nullptr;
        }
        return &m_WindowAttachments[index];
    }

    Texture* HeadlessBackend::DepthAttachmentGet(uint8_t index)
    {
        if (index >= m_DepthAttachments.size())
        {
            Core::Log::Error("Headless backend: depth attachment {} out of range.", index);
            return nullptr;
        }
        return &m_DepthAttachments[index];
    }

    // --- Shaders ---

    HeadlessBackend::ShaderStorage* HeadlessBackend::FindShader(const Shader& shader)
    {
        auto it = m_Shaders.find(shader.InternalHandle);
        return it == m_Shaders.end() ? nullptr : &it->second;
    }

    Core::Result HeadlessBackend::ShaderCreate(Shader& shader, const ShaderConfig& config, const RenderPass& pass)
    {
        if (config.Stages.empty())
        {
            Core::Log::Error("Headless backend: shader '{}' has no stages.", shader.Name);
            return Core::Err(Core::ErrorCode::ShaderCreationFailed);
        }

        const uint64_t handle = m_NextHandle++;
        ShaderStorage& storage = m_Shaders[handle];
        storage.RenderPassName = pass.Name;
        storage.StageCount = static_cast<uint32_t>(config.Stages.size());
        shader.InternalHandle = handle;
        return Core::Ok();
    }

    Core::Result HeadlessBackend::ShaderInitialize(Shader& shader)
    {
        auto* storage = FindShader(shader);
        if (!storage)
            return Core::Err(Core::ErrorCode::ResourceNotFound);

        shader.GlobalUboStride = AlignUp(shader.GlobalUboSize, shader.RequiredUboAlignment);
        shader.UboStride = AlignUp(shader.UboSize, shader.RequiredUboAlignment);
        shader.GlobalUboOffset = 0;

        storage->GlobalBlock.assign(shader.GlobalUboStride, std::byte{0});
        storage->PushConstants.assign(shader.PushConstantStride, std::byte{0});
        return Core::Ok();
    }

    void HeadlessBackend::ShaderDestroy(Shader& shader)
    {
        if (m_BoundShader == &shader) m_BoundShader = nullptr;
        m_Shaders.erase(shader.InternalHandle);
        shader.InternalHandle = 0;
    }

    Core::Result HeadlessBackend::ShaderUse(Shader& shader)
    {
        if (!FindShader(shader))
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        m_BoundShader = &shader;
        return Core::Ok();
    }

    Core::Result HeadlessBackend::ShaderBindGlobals(Shader& shader)
    {
        if (!FindShader(shader))
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        shader.BoundScope = ShaderScope::Global;
        return Core::Ok();
    }

    Core::Result HeadlessBackend::ShaderBindInstance(Shader& shader, uint32_t instanceId)
    {
        auto* storage = FindShader(shader);
        if (!storage)
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (instanceId >= storage->Instances.size() || !storage->Instances[instanceId].InUse)
        {
            Core::Log::Error("Headless backend: shader '{}' has no instance {}.", shader.Name, instanceId);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        shader.BoundInstanceId = instanceId;
        shader.BoundScope = ShaderScope::Instance;
        return Core::Ok();
    }

    Core::Result HeadlessBackend::ShaderApplyGlobals(Shader& shader)
    {
        if (!FindShader(shader))
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        return Core::Ok();
    }

    Core::Result HeadlessBackend::ShaderApplyInstance(Shader& shader, bool)
    {
        if (!FindShader(shader))
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (shader.BoundInstanceId == INVALID_ID)
        {
            Core::Log::Error("Headless backend: apply instance on '{}' with no bound instance.", shader.Name);
            return Core::Err(Core::ErrorCode::InvalidState);
        }
        return Core::Ok();
    }

    Core::Expected<uint32_t> HeadlessBackend::ShaderAcquireInstanceResources(Shader& shader, std::span<TextureMap* const> maps)
    {
        auto* storage = FindShader(shader);
        if (!storage)
            return std::unexpected(Core::ErrorCode::ResourceNotFound);
        if (maps.size() != shader.InstanceTextureCount)
        {
            Core::Log::Error("Headless backend: shader '{}' expects {} instance textures, got {}.",
                             shader.Name, shader.InstanceTextureCount, maps.size());
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        auto free = std::ranges::find_if(storage->Instances, [](const ShaderInstance& i) { return !i.InUse; });
        uint32_t id;
        if (free != storage->Instances.end())
        {
            id = static_cast<uint32_t>(std::distance(storage->Instances.begin(), free));
        }
        else
        {
            if (storage->Instances.size() >= m_Config.MaxShaderInstances)
            {
                Core::Log::Error("Headless backend: shader '{}' is out of instance slots.", shader.Name);
                return std::unexpected(Core::ErrorCode::ResourceExhausted);
            }
            id = static_cast<uint32_t>(storage->Instances.size());
            storage->Instances.emplace_back();
        }

        ShaderInstance& instance = storage->Instances[id];
        instance.InUse = true;
        instance.Maps.assign(maps.begin(), maps.end());
        instance.UniformBlock.assign(shader.UboStride, std::byte{0});
        return id;
    }

    Core::Result HeadlessBackend::ShaderReleaseInstanceResources(Shader& shader, uint32_t instanceId)
    {
        auto* storage = FindShader(shader);
        if (!storage)
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (instanceId >= storage->Instances.size() || !storage->Instances[instanceId].InUse)
        {
            Core::Log::Warn("Headless backend: release of unused instance {} on '{}'.", instanceId, shader.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        ShaderInstance& instance = storage->Instances[instanceId];
        instance.InUse = false;
        instance.Maps.clear();
        instance.UniformBlock.clear();
        if (shader.BoundInstanceId == instanceId) shader.BoundInstanceId = INVALID_ID;
        return Core::Ok();
    }

    Core::Result HeadlessBackend::ShaderSetUniform(Shader& shader, const ShaderUniform& uniform, const UniformValue& value)
    {
        auto* storage = FindShader(shader);
        if (!storage)
            return Core::Err(Core::ErrorCode::ResourceNotFound);

        if (uniform.Type == ShaderUniformType::Sampler)
        {
            auto* const* map = std::get_if<TextureMap*>(&value);
            if (!map || !*map)
                return Core::Err(Core::ErrorCode::TypeMismatch);

            if (uniform.Scope == ShaderScope::Global)
            {
                if (uniform.Location >= shader.GlobalTextureMaps.size())
                    return Core::Err(Core::ErrorCode::OutOfRange);
                shader.GlobalTextureMaps[uniform.Location].Texture = (*map)->Texture;
            }
            else
            {
                if (shader.BoundInstanceId >= storage->Instances.size())
                    return Core::Err(Core::ErrorCode::InvalidState);
                auto& maps = storage->Instances[shader.BoundInstanceId].Maps;
                if (uniform.Location >= maps.size())
                    return Core::Err(Core::ErrorCode::OutOfRange);
                maps[uniform.Location] = *map;
            }
            ++m_Stats.UniformWrites;
            return Core::Ok();
        }

        std::vector<std::byte>* block = nullptr;
        switch (uniform.Scope)
        {
        case ShaderScope::Global:
            block = &storage->GlobalBlock;
            break;
        case ShaderScope::Instance:
            if (shader.BoundInstanceId >= storage->Instances.size())
                return Core::Err(Core::ErrorCode::InvalidState);
            block = &storage->Instances[shader.BoundInstanceId].UniformBlock;
            break;
        case ShaderScope::Local:
            block = &storage->PushConstants;
            break;
        }

        auto written = WriteUniformBytes(*block, uniform.Offset, uniform.Size, value);
        if (!written)
        {
            Core::Log::Error("Headless backend: uniform {} of '{}' rejected ({}).",
                             uniform.Index, shader.Name, Core::ErrorCodeToString(written.error()));
            return written;
        }
        ++m_Stats.UniformWrites;
        return Core::Ok();
    }

    size_t HeadlessBackend::GetLiveInstanceCount(const Shader& shader) const
    {
        auto it = m_Shaders.find(shader.InternalHandle);
        if (it == m_Shaders.end()) return 0;
        return static_cast<size_t>(std::ranges::count_if(it->second.Instances, [](const ShaderInstance& i) { return i.InUse; }));
    }

    std::span<const std::byte> HeadlessBackend::GetGlobalUniformBlock(const Shader& shader) const
    {
        auto it = m_Shaders.find(shader.InternalHandle);
        if (it == m_Shaders.end()) return {};
        return it->second.GlobalBlock;
    }

    // --- Render buffers ---

    std::vector<std::byte>* HeadlessBackend::FindBuffer(const RenderBuffer& buffer)
    {
        auto it = m_Buffers.find(buffer.InternalHandle);
        return it == m_Buffers.end() ? nullptr : &it->second;
    }

    Core::Result HeadlessBackend::RenderBufferCreate(RenderBuffer& buffer)
    {
        if (buffer.Type == RenderBufferType::Unknown)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        const uint64_t handle = m_NextHandle++;
        m_Buffers[handle].assign(buffer.TotalSize, std::byte{0});
        buffer.InternalHandle = handle;
        return Core::Ok();
    }

    void HeadlessBackend::RenderBufferDestroy(RenderBuffer& buffer)
    {
        m_Buffers.erase(buffer.InternalHandle);
        buffer.InternalHandle = 0;
    }

    Core::Result HeadlessBackend::RenderBufferBind(RenderBuffer& buffer, uint64_t offset)
    {
        auto* bytes = FindBuffer(buffer);
        if (!bytes) return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (offset > bytes->size()) return Core::Err(Core::ErrorCode::OutOfRange);
        return Core::Ok();
    }

    Core::Result HeadlessBackend::RenderBufferUnbind(RenderBuffer& buffer)
    {
        if (!FindBuffer(buffer)) return Core::Err(Core::ErrorCode::ResourceNotFound);
        return Core::Ok();
    }

    Core::Result HeadlessBackend::RenderBufferLoadRange(RenderBuffer& buffer, uint64_t offset, std::span<const std::byte> data)
    {
        auto* bytes = FindBuffer(buffer);
        if (!bytes) return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (offset + data.size() > bytes->size()) return Core::Err(Core::ErrorCode::OutOfRange);

        std::ranges::copy(data, bytes->begin() + static_cast<std::ptrdiff_t>(offset));
        return Core::Ok();
    }

    Core::Result HeadlessBackend::RenderBufferCopyRange(RenderBuffer& source, uint64_t sourceOffset,
                                                       RenderBuffer& dest, uint64_t destOffset, uint64_t size)
    {
        auto* from = FindBuffer(source);
        auto* to = FindBuffer(dest);
        if (!from || !to) return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (sourceOffset + size > from->size() || destOffset + size > to->size())
            return Core::Err(Core::ErrorCode::OutOfRange);

        std::copy_n(from->begin() + static_cast<std::ptrdiff_t>(sourceOffset), size,
                    to->begin() + static_cast<std::ptrdiff_t>(destOffset));
        return Core::Ok();
    }

    Core::Expected<std::vector<std::byte>> HeadlessBackend::RenderBufferRead(RenderBuffer& buffer, uint64_t offset, uint64_t size)
    {
        auto* bytes = FindBuffer(buffer);
        if (!bytes) return std::unexpected(Core::ErrorCode::ResourceNotFound);
        if (offset + size > bytes->size()) return std::unexpected(Core::ErrorCode::OutOfRange);

        const auto first = bytes->begin() + static_cast<std::ptrdiff_t>(offset);
        return std::vector<std::byte>(first, first + static_cast<std::ptrdiff_t>(size));
    }

    Core::Result HeadlessBackend::RenderBufferResize(RenderBuffer& buffer, uint64_t newSize)
    {
        auto* bytes = FindBuffer(buffer);
        if (!bytes) return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (newSize < buffer.TotalSize)
        {
            Core::Log::Error("Headless backend: render buffers only grow ({} -> {}).", buffer.TotalSize, newSize);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        bytes->resize(newSize, std::byte{0});
        buffer.TotalSize = newSize;
        return Core::Ok();
    }

    Core::Result HeadlessBackend::RenderBufferFlush(RenderBuffer& buffer, uint64_t offset, uint64_t size)
    {
        auto* bytes = FindBuffer(buffer);
        if (!bytes) return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (offset + size > bytes->size()) return Core::Err(Core::ErrorCode::OutOfRange);
        return Core::Ok();
    }

    Core::Result HeadlessBackend::RenderBufferDraw(RenderBuffer& buffer, uint64_t offset, uint32_t elementCount, bool bindOnly)
    {
        auto* bytes = FindBuffer(buffer);
        if (!bytes) return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (offset > bytes->size()) return Core::Err(Core::ErrorCode::OutOfRange);
        if (!bindOnly && elementCount > 0) ++m_Stats.DrawCalls;
        return Core::Ok();
    }
}
