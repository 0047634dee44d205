module;
#include <cstdint>
#include <string_view>

export module Graphics:GeometrySystem;
import Core;
import :Geometry;
import :ReferenceRegistry;
import :Renderer;
import :MaterialSystem;

export namespace Graphics
{
    struct GeometryTag {};
    using GeometryHandle = Core::StrongHandle<GeometryTag>;

    struct GeometrySystemConfig
    {
        uint32_t MaxGeometryCount = 4096;
        uint32_t FramesInFlight = 2;
    };

    class GeometrySystem
    {
    public:
        GeometrySystem(Renderer& renderer, MaterialSystem& materials);
        ~GeometrySystem();

        GeometrySystem(const GeometrySystem&) = delete;
        GeometrySystem& operator=(const GeometrySystem&) = delete;

        [[nodiscard]] Core::Result Initialize(const GeometrySystemConfig& config = {});
        void Shutdown();

        // Keyed by config.Name; later acquires of the same name only add a reference.
        [[nodiscard]] Core::Expected<Geometry*> AcquireFromConfig(const GeometryConfig& config, bool autoRelease);

        // Existing geometries only; ResourceNotFound otherwise.
        [[nodiscard]] Core::Expected<Geometry*> Acquire(std::string_view name);

        [[nodiscard]] Core::Result Release(std::string_view name);

        [[nodiscard]] Geometry* GetDefault() { return &m_DefaultGeometry; }
        [[nodiscard]] Geometry* GetDefault2D() { return &m_Default2DGeometry; }

        void ProcessDeletions(uint64_t frameNumber);

        [[nodiscard]] uint64_t GetReferenceCount(std::string_view name) const { return m_Registry.GetReferenceCount(name); }
        [[nodiscard]] size_t GetLoadedCount() const { return m_Pool.Size(); }

        // Zero sizes, segment counts and tiling default to 1 with a warning.
        [[nodiscard]] static GeometryConfig GeneratePlaneConfig(float width, float height,
                                                                uint32_t xSegmentCount, uint32_t ySegmentCount,
                                                                float tileX, float tileY,
                                                                std::string_view name, std::string_view materialName);

        [[nodiscard]] static GeometryConfig GenerateCubeConfig(float width, float height, float depth,
                                                               float tileX, float tileY,
                                                               std::string_view name, std::string_view materialName);

    private:
        Core::Result CreateGeometry(const GeometryConfig& config, Geometry& geometry);
        void DestroyGeometry(Geometry& geometry);
        Core::Result CreateDefaultGeometries();

        Renderer& m_Renderer;
        MaterialSystem& m_Materials;
        GeometrySystemConfig m_Config;
        bool m_Initialized = false;
        uint64_t m_FrameNumber = 0;

        Geometry m_DefaultGeometry;
        Geometry m_Default2DGeometry;
        Core::ResourcePool<Geometry, GeometryHandle> m_Pool;
        ReferenceRegistry<GeometryHandle> m_Registry;
    };
}
