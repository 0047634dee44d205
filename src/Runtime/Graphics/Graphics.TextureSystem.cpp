module;
#include <algorithm>
#include <array>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

module Graphics;

namespace Graphics
{
    struct TextureSystem::LoadRequest
    {
        std::string Name;
        TextureType Type = TextureType::Texture2D;
        TextureHandle Handle;
        uint32_t Width = 0;
        uint32_t Height = 0;
        uint8_t ChannelCount = 0;
        bool HasTransparency = false;
        std::vector<uint8_t> Pixels;
    };

    namespace
    {
        constexpr std::array<std::string_view, 6> CUBE_FACE_SUFFIXES = {"_r", "_l", "_u", "_d", "_f", "_b"};

        bool HasTransparentPixel(std::span<const uint8_t> pixels, uint8_t channelCount)
        {
            if (channelCount < 4) return false;
            for (size_t i = 3; i < pixels.size(); i += channelCount)
            {
                if (pixels[i] < 255) return true;
            }
            return false;
        }

        uint32_t NextGeneration(uint32_t generation)
        {
            return generation == INVALID_ID ? 0 : generation + 1;
        }
    }

    TextureSystem::TextureSystem(IRendererBackend& backend, IResourceLoader& loader, Core::Tasks::JobSystem* jobs)
        : m_Backend(backend), m_Loader(loader), m_Jobs(jobs)
    {
    }

    TextureSystem::~TextureSystem()
    {
        Shutdown();
    }

    Core::Result TextureSystem::Initialize(const TextureSystemConfig& config)
    {
        if (config.MaxTextureCount == 0)
        {
            Core::Log::Error("TextureSystem: MaxTextureCount must be > 0.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        m_Config = config;
        m_Pool.Initialize(config.FramesInFlight, config.MaxTextureCount);

        if (auto defaults = CreateDefaults(); !defaults)
            return defaults;

        m_Initialized = true;
        return Core::Ok();
    }

    void TextureSystem::Shutdown()
    {
        if (!m_Initialized) return;

        m_Registry.ReleaseAll([this](const TextureHandle& handle)
        {
            if (Texture* texture = m_Pool.TryGet(handle); texture && !texture->HasFlag(TextureFlag::IsWrapped))
                m_Backend.TextureDestroy(*texture);
        });

        {
            std::lock_guard lock(m_PendingMutex);
            for (auto& pending : m_PendingDestroy)
            {
                if (!pending.Target->HasFlag(TextureFlag::IsWrapped) && pending.Target->InternalHandle != 0)
                    m_Backend.TextureDestroy(*pending.Target);
            }
            m_PendingDestroy.clear();
        }
        m_Pool.Clear();

        for (auto& texture : m_Defaults)
            m_Backend.TextureDestroy(texture);

        m_Initialized = false;
    }

    Core::Result TextureSystem::CreateDefaults()
    {
        auto makeDefault = [this](Texture& texture, std::string_view name, uint32_t size, std::vector<uint8_t>& pixels) -> Core::Result
        {
            texture = Texture{};
            texture.Name = std::string(name);
            texture.Width = size;
            texture.Height = size;
            texture.ChannelCount = 4;
            // Defaults keep an invalid generation.
            texture.Generation = INVALID_ID;

            if (auto created = m_Backend.TextureCreate(pixels, texture); !created)
            {
                Core::Log::Error("TextureSystem: failed to create default texture '{}'.", name);
                return created;
            }
            return Core::Ok();
        };

        // 256x256 white/blue checkerboard.
        constexpr uint32_t checkerSize = 256;
        std::vector<uint8_t> checker(checkerSize * checkerSize * 4, 255);
        for (uint32_t row = 0; row < checkerSize; ++row)
        {
            for (uint32_t col = 0; col < checkerSize; ++col)
            {
                if ((row % 2) == (col % 2))
                {
                    const size_t index = (static_cast<size_t>(row) * checkerSize + col) * 4;
                    checker[index + 0] = 0;
                    checker[index + 1] = 0;
                }
            }
        }
        if (auto r = makeDefault(m_Defaults[0], DEFAULT_TEXTURE_NAME, checkerSize, checker); !r) return r;

        constexpr uint32_t smallSize = 16;
        auto solid = [](uint8_t r, uint8_t g, uint8_t b, uint8_t a)
        {
            std::vector<uint8_t> pixels(smallSize * smallSize * 4);
            for (size_t i = 0; i < pixels.size(); i += 4)
            {
                pixels[i + 0] = r;
                pixels[i + 1] = g;
                pixels[i + 2] = b;
                pixels[i + 3] = a;
            }
            return pixels;
        };

        auto diffuse = solid(255, 255, 255, 255);
        if (auto r = makeDefault(m_Defaults[1], DEFAULT_DIFFUSE_TEXTURE_NAME, smallSize, diffuse); !r) return r;

        auto specular = solid(0, 0, 0, 255);
        if (auto r = makeDefault(m_Defaults[2], DEFAULT_SPECULAR_TEXTURE_NAME, smallSize, specular); !r) return r;

        auto normal = solid(128, 128, 255, 255);
        if (auto r = makeDefault(m_Defaults[3], DEFAULT_NORMAL_TEXTURE_NAME, smallSize, normal); !r) return r;

        return Core::Ok();
    }

    Texture* TextureSystem::FindDefault(std::string_view name)
    {
        for (auto& texture : m_Defaults)
        {
            if (texture.Name == name) return &texture;
        }
        return nullptr;
    }

    Core::Expected<TextureHandle> TextureSystem::CreateEntry(std::string_view name, TextureType type)
    {
        auto handle = m_Pool.Create();
        if (!handle)
        {
            Core::Log::Error("TextureSystem: no free slot for '{}' (max {}).", name, m_Config.MaxTextureCount);
            return std::unexpected(handle.error());
        }

        Texture* texture = m_Pool.TryGet(*handle);
        texture->Id = handle->Index;
        texture->Name = std::string(name);
        texture->Type = type;
        texture->Generation = INVALID_ID;
        return *handle;
    }

    Core::Result TextureSystem::DecodeInto(LoadRequest& request) const
    {
        const size_t faceCount = request.Type == TextureType::Cube ? CUBE_FACE_SUFFIXES.size() : 1;

        for (size_t face = 0; face < faceCount; ++face)
        {
            std::string resourceName = request.Name;
            if (request.Type == TextureType::Cube) resourceName += CUBE_FACE_SUFFIXES[face];

            auto resource = m_Loader.Load(resourceName, ResourceType::Image);
            if (!resource)
                return Core::Err(resource.error());

            auto* image = std::get_if<ImageResourceData>(&resource->Payload);
            if (!image)
            {
                Core::Log::Error("TextureSystem: '{}' did not load as an image.", resourceName);
                m_Loader.Unload(*resource);
                return Core::Err(Core::ErrorCode::AssetTypeMismatch);
            }

            if (face == 0)
            {
                request.Width = image->Width;
                request.Height = image->Height;
                request.ChannelCount = image->ChannelCount;
                request.Pixels.reserve(image->Pixels.size() * faceCount);
            }
            else if (image->Width != request.Width || image->Height != request.Height || image->ChannelCount != request.ChannelCount)
            {
                Core::Log::Error("TextureSystem: cube face '{}' is {}x{}, expected {}x{}.",
                                 resourceName, image->Width, image->Height, request.Width, request.Height);
                m_Loader.Unload(*resource);
                return Core::Err(Core::ErrorCode::InvalidFormat);
            }

            request.Pixels.insert(request.Pixels.end(), image->Pixels.begin(), image->Pixels.end());
            m_Loader.Unload(*resource);
        }

        request.HasTransparency = HasTransparentPixel(request.Pixels, request.ChannelCount);
        return Core::Ok();
    }

    Core::Result TextureSystem::Upload(TextureHandle handle, LoadRequest& request)
    {
        Texture* texture = m_Pool.TryGet(handle);
        if (!texture)
        {
            // Released before the decode finished.
            Core::Log::Debug("TextureSystem: dropping upload of released texture '{}'.", request.Name);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }

        Texture staged = *texture;
        staged.Width = request.Width;
        staged.Height = request.Height;
        staged.ChannelCount = request.ChannelCount;
        staged.SetFlag(TextureFlag::HasTransparency, request.HasTransparency);
        staged.InternalHandle = 0;

        if (auto created = m_Backend.TextureCreate(request.Pixels, staged); !created)
        {
            Core::Log::Error("TextureSystem: backend upload of '{}' failed.", request.Name);
            return created;
        }

        // Swap in the new backend texture, then drop the old one.
        Texture previous = *texture;
        *texture = std::move(staged);
        texture->Generation = NextGeneration(previous.Generation);
        if (previous.InternalHandle != 0)
            m_Backend.TextureDestroy(previous);

        return Core::Ok();
    }

    Core::Expected<TextureHandle> TextureSystem::LoadEntry(std::string_view name, TextureType type)
    {
        auto handle = CreateEntry(name, type);
        if (!handle) return handle;

        auto request = std::make_shared<LoadRequest>();
        request->Name = std::string(name);
        request->Type = type;
        request->Handle = *handle;

        if (m_Jobs)
        {
            Core::Tasks::JobInfo job{
                .Type = Core::Tasks::JobType::ResourceLoad,
                .Priority = Core::Tasks::JobPriority::Normal,
                .Entry = [this, request]() { return DecodeInto(*request).has_value(); },
                .OnSuccess = [this, request]()
                {
                    if (auto uploaded = Upload(request->Handle, *request); uploaded)
                        Core::Log::Debug("TextureSystem: '{}' uploaded.", request->Name);
                },
                .OnFailure = [request]()
                {
                    Core::Log::Error("TextureSystem: failed to load '{}', keeping defaults.", request->Name);
                },
            };

            if (auto submitted = m_Jobs->Submit(std::move(job)); !submitted)
            {
                m_Pool.Remove(*handle, m_FrameNumber);
                return std::unexpected(submitted.error());
            }
            return *handle;
        }

        auto loaded = DecodeInto(*request).and_then([&](Core::Unit) { return Upload(*handle, *request); });
        if (!loaded)
        {
            Core::Log::Error("TextureSystem: failed to load '{}' ({}).", name, Core::ErrorCodeToString(loaded.error()));
            m_Pool.Remove(*handle, m_FrameNumber);
            return std::unexpected(loaded.error());
        }
        return *handle;
    }

    Core::Expected<Texture*> TextureSystem::Acquire(std::string_view name, bool autoRelease)
    {
        if (name.empty())
            return std::unexpected(Core::ErrorCode::InvalidArgument);

        if (Texture* fallback = FindDefault(name))
        {
            Core::Log::Warn("TextureSystem: Acquire('{}') returns the built-in default.", name);
            return fallback;
        }

        auto handle = m_Registry.Acquire(name, autoRelease, [&] { return LoadEntry(name, TextureType::Texture2D); });
        if (!handle) return std::unexpected(handle.error());
        return m_Pool.Get(*handle);
    }

    Core::Expected<Texture*> TextureSystem::AcquireCube(std::string_view name, bool autoRelease)
    {
        if (name.empty())
            return std::unexpected(Core::ErrorCode::InvalidArgument);

        auto handle = m_Registry.Acquire(name, autoRelease, [&] { return LoadEntry(name, TextureType::Cube); });
        if (!handle) return std::unexpected(handle.error());
        return m_Pool.Get(*handle);
    }

    Core::Expected<Texture*> TextureSystem::AcquireWriteable(std::string_view name, uint32_t width, uint32_t height,
                                                             uint8_t channelCount, bool hasTransparency)
    {
        auto handle = m_Registry.Acquire(name, false, [&]() -> Core::Expected<TextureHandle>
        {
            auto entry = CreateEntry(name, TextureType::Texture2D);
            if (!entry) return entry;

            Texture* texture = m_Pool.TryGet(*entry);
            texture->Width = width;
            texture->Height = height;
            texture->ChannelCount = channelCount;
            texture->SetFlag(TextureFlag::IsWriteable, true);
            texture->SetFlag(TextureFlag::HasTransparency, hasTransparency);

            if (auto created = m_Backend.TextureCreateWriteable(*texture); !created)
            {
                m_Pool.Remove(*entry, m_FrameNumber);
                return std::unexpected(created.error());
            }
            texture->Generation = 0;
            return *entry;
        });
        if (!handle) return std::unexpected(handle.error());
        return m_Pool.Get(*handle);
    }

    Core::Expected<Texture*> TextureSystem::WrapInternal(std::string_view name, uint32_t width, uint32_t height,
                                                         uint8_t channelCount, bool hasTransparency, bool isWriteable,
                                                         uint64_t internalHandle)
    {
        auto handle = m_Registry.Acquire(name, false, [&]() -> Core::Expected<TextureHandle>
        {
            auto entry = CreateEntry(name, TextureType::Texture2D);
            if (!entry) return entry;

            Texture* texture = m_Pool.TryGet(*entry);
            texture->Width = width;
            texture->Height = height;
            texture->ChannelCount = channelCount;
            texture->SetFlag(TextureFlag::HasTransparency, hasTransparency);
            texture->SetFlag(TextureFlag::IsWriteable, isWriteable);
            texture->SetFlag(TextureFlag::IsWrapped, true);
            texture->InternalHandle = internalHandle;
            texture->Generation = 0;
            return *entry;
        });
        if (!handle) return std::unexpected(handle.error());
        return m_Pool.Get(*handle);
    }

    void TextureSystem::Unload(const TextureHandle& handle)
    {
        Texture* texture = m_Pool.TryGet(handle);
        if (!texture) return;

        m_Pool.Remove(handle, m_FrameNumber);
        std::lock_guard lock(m_PendingMutex);
        m_PendingDestroy.push_back({texture, m_FrameNumber});
    }

    Core::Result TextureSystem::Release(std::string_view name)
    {
        if (FindDefault(name))
        {
            Core::Log::Warn("TextureSystem: ignoring release of default texture '{}'.", name);
            return Core::Ok();
        }
        return m_Registry.Release(name, [this](const TextureHandle& handle) { Unload(handle); });
    }

    Core::Result TextureSystem::Resize(Texture& texture, uint32_t width, uint32_t height, bool regenerateInternalData)
    {
        if (!texture.HasFlag(TextureFlag::IsWriteable))
        {
            Core::Log::Warn("TextureSystem: '{}' is not writeable and cannot be resized.", texture.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        if (!texture.HasFlag(TextureFlag::IsWrapped) && regenerateInternalData)
        {
            if (auto resized = m_Backend.TextureResize(texture, width, height); !resized)
                return resized;
        }
        texture.Width = width;
        texture.Height = height;
        texture.Generation = NextGeneration(texture.Generation);
        return Core::Ok();
    }

    Core::Result TextureSystem::WriteData(Texture& texture, uint32_t offset, std::span<const uint8_t> pixels)
    {
        return m_Backend.TextureWriteData(texture, offset, pixels);
    }

    void TextureSystem::ProcessDeletions(uint64_t frameNumber)
    {
        m_FrameNumber = frameNumber;
        {
            std::lock_guard lock(m_PendingMutex);
            std::erase_if(m_PendingDestroy, [&](const PendingDestroy& pending)
            {
                if (frameNumber <= pending.FrameNumber + m_Config.FramesInFlight)
                    return false;
                if (!pending.Target->HasFlag(TextureFlag::IsWrapped) && pending.Target->InternalHandle != 0)
                    m_Backend.TextureDestroy(*pending.Target);
                return true;
            });
        }
        m_Pool.ProcessDeletions(frameNumber);
    }
}
