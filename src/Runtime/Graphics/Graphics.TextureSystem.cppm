module;
#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module Graphics:TextureSystem;
import Core;
import :Texture;
import :Backend;
import :Resources;
import :ReferenceRegistry;

export namespace Graphics
{
    struct TextureTag {};
    using TextureHandle = Core::StrongHandle<TextureTag>;

    struct TextureSystemConfig
    {
        uint32_t MaxTextureCount = 65536;
        uint32_t FramesInFlight = 2;
    };

    // Owns every texture. Named textures are reference counted; the four defaults
    // live outside the pool and are never counted.
    //
    // With a job system attached, decoding runs as a ResourceLoad job and the upload
    // happens in JobSystem::Update() on the owning thread. Until then the texture's
    // generation stays INVALID_ID and users fall back to the defaults.
    class TextureSystem
    {
    public:
        TextureSystem(IRendererBackend& backend, IResourceLoader& loader, Core::Tasks::JobSystem* jobs = nullptr);
        ~TextureSystem();

        TextureSystem(const TextureSystem&) = delete;
        TextureSystem& operator=(const TextureSystem&) = delete;

        [[nodiscard]] Core::Result Initialize(const TextureSystemConfig& config = {});
        void Shutdown();

        [[nodiscard]] Core::Expected<Texture*> Acquire(std::string_view name, bool autoRelease);

        // Loads <name>_r, _l, _u, _d, _f, _b.
        [[nodiscard]] Core::Expected<Texture*> AcquireCube(std::string_view name, bool autoRelease);

        // Never auto-released.
        [[nodiscard]] Core::Expected<Texture*> AcquireWriteable(std::string_view name, uint32_t width, uint32_t height,
                                                                uint8_t channelCount, bool hasTransparency);

        // Registers a texture whose backend object is owned elsewhere. Never auto-released.
        [[nodiscard]] Core::Expected<Texture*> WrapInternal(std::string_view name, uint32_t width, uint32_t height,
                                                            uint8_t channelCount, bool hasTransparency, bool isWriteable,
                                                            uint64_t internalHandle);

        [[nodiscard]] Core::Result Release(std::string_view name);

        // Writeable textures only.
        [[nodiscard]] Core::Result Resize(Texture& texture, uint32_t width, uint32_t height, bool regenerateInternalData);
        [[nodiscard]] Core::Result WriteData(Texture& texture, uint32_t offset, std::span<const uint8_t> pixels);

        [[nodiscard]] Texture* GetDefault() { return &m_Defaults[0]; }
        [[nodiscard]] Texture* GetDefaultDiffuse() { return &m_Defaults[1]; }
        [[nodiscard]] Texture* GetDefaultSpecular() { return &m_Defaults[2]; }
        [[nodiscard]] Texture* GetDefaultNormal() { return &m_Defaults[3]; }

        // Frees released textures once FramesInFlight frames have passed.
        void ProcessDeletions(uint64_t frameNumber);

        [[nodiscard]] uint64_t GetReferenceCount(std::string_view name) const { return m_Registry.GetReferenceCount(name); }
        [[nodiscard]] size_t GetLoadedCount() const { return m_Pool.Size(); }
        [[nodiscard]] bool IsInitialized() const { return m_Initialized; }

    private:
        struct LoadRequest;
        struct PendingDestroy
        {
            Texture* Target = nullptr;
            uint64_t FrameNumber = 0;
        };

        Core::Expected<TextureHandle> CreateEntry(std::string_view name, TextureType type);
        Core::Expected<TextureHandle> LoadEntry(std::string_view name, TextureType type);
        Core::Result DecodeInto(LoadRequest& request) const;
        Core::Result Upload(TextureHandle handle, LoadRequest& request);
        void Unload(const TextureHandle& handle);
        Core::Result CreateDefaults();
        [[nodiscard]] Texture* FindDefault(std::string_view name);

        IRendererBackend& m_Backend;
        IResourceLoader& m_Loader;
        Core::Tasks::JobSystem* m_Jobs = nullptr;

        TextureSystemConfig m_Config;
        bool m_Initialized = false;
        uint64_t m_FrameNumber = 0;

        std::array<Texture, 4> m_Defaults;
        Core::ResourcePool<Texture, TextureHandle> m_Pool;
        ReferenceRegistry<TextureHandle> m_Registry;

        std::mutex m_PendingMutex;
        std::vector<PendingDestroy> m_PendingDestroy;
    };
}
