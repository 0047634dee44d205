module;

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

export module Core:ResourcePool;
import :Error;

export namespace Core
{
    template<typename H>
    concept GenerationalHandle = requires(H h) {
        { h.Index } -> std::convertible_to<uint32_t>;
        { h.Generation } -> std::convertible_to<uint32_t>;
    };

    // Generational slot storage for textures, materials, geometries and cameras.
    //
    // Remove() hides a slot at once; its memory survives until ProcessDeletions()
    // sees a frame number past removal + FramesInFlight, so packets recorded for
    // frames still on the GPU keep valid pointers. Addresses never move: each
    // resource sits in its own allocation.
    template <typename T, GenerationalHandle Handle>
    class ResourcePool
    {
    public:
        ResourcePool() = default;

        ResourcePool(const ResourcePool&) = delete;
        ResourcePool& operator=(const ResourcePool&) = delete;

        // maxCount 0: unbounded.
        void Initialize(uint32_t framesInFlight, uint32_t maxCount)
        {
            std::unique_lock lock(m_Mutex);
            m_FramesInFlight = framesInFlight;
            m_MaxCount = maxCount;
        }

        [[nodiscard]] Expected<Handle> Add(std::unique_ptr<T> resource)
        {
            std::unique_lock lock(m_Mutex);

            uint32_t index = 0;
            if (m_NextFree < m_FreeList.size())
            {
                index = m_FreeList[m_NextFree++];
                if (m_NextFree == m_FreeList.size())
                {
                    m_FreeList.clear();
                    m_NextFree = 0;
                }
            }
            else if (m_MaxCount == 0 || m_Slots.size() < m_MaxCount)
            {
                index = static_cast<uint32_t>(m_Slots.size());
                m_Slots.emplace_back();
            }
            else
            {
                return std::unexpected(ErrorCode::ResourceExhausted);
            }

            Slot& slot = m_Slots[index];
            slot.Data = std::move(resource);
            slot.Live = true;
            ++m_LiveCount;
            return Handle{index, ++slot.Generation};
        }

        template<typename... Args>
        [[nodiscard]] Expected<Handle> Create(Args&&... args)
        {
            return Add(std::make_unique<T>(std::forward<Args>(args)...));
        }

        // False for stale or already removed handles.
        bool Remove(Handle handle, uint64_t frameNumber)
        {
            std::unique_lock lock(m_Mutex);
            Slot* slot = FindLive(handle);
            if (!slot) return false;

            slot->Live = false;
            --m_LiveCount;
            m_Retired.push_back({handle.Index, handle.Generation, frameNumber});
            return true;
        }

        void ProcessDeletions(uint64_t frameNumber)
        {
            std::unique_lock lock(m_Mutex);
            std::erase_if(m_Retired, [&](const Retired& retired)
            {
                if (frameNumber <= retired.FrameNumber + m_FramesInFlight) return false;

                Slot& slot = m_Slots[retired.Index];
                if (!slot.Live && slot.Generation == retired.Generation)
                {
                    slot.Data.reset();
                    m_FreeList.push_back(retired.Index);
                }
                return true;
            });
        }

        [[nodiscard]] Expected<T*> Get(Handle handle) const
        {
            std::shared_lock lock(m_Mutex);
            if (const Slot* slot = FindLive(handle))
                return slot->Data.get();
            return std::unexpected(ErrorCode::ResourceNotFound);
        }

        [[nodiscard]] T* TryGet(Handle handle) const
        {
            std::shared_lock lock(m_Mutex);
            const Slot* slot = FindLive(handle);
            return slot ? slot->Data.get() : nullptr;
        }

        // Drops everything, pending deletions included. The backend must be idle.
        void Clear()
        {
            std::unique_lock lock(m_Mutex);
            m_Slots.clear();
            m_FreeList.clear();
            m_NextFree = 0;
            m_Retired.clear();
            m_LiveCount = 0;
        }

        [[nodiscard]] size_t Size() const
        {
            std::shared_lock lock(m_Mutex);
            return m_LiveCount;
        }

        [[nodiscard]] size_t GetPendingDeletionCount() const
        {
            std::shared_lock lock(m_Mutex);
            return m_Retired.size();
        }

    private:
        struct Slot
        {
            std::unique_ptr<T> Data;
            uint32_t Generation = 0;
            bool Live = false;
        };

        struct Retired
        {
            uint32_t Index;
            uint32_t Generation;
            uint64_t FrameNumber;
        };

        [[nodiscard]] Slot* FindLive(Handle handle)
        {
            if (handle.Index >= m_Slots.size()) return nullptr;
            Slot& slot = m_Slots[handle.Index];
            return slot.Live && slot.Generation == handle.Generation ? &slot : nullptr;
        }

        [[nodiscard]] const Slot* FindLive(Handle handle) const
        {
            return const_cast<ResourcePool*>(this)->FindLive(handle);
        }

        std::vector<Slot> m_Slots;
        // Freed indices are reused oldest first.
        std::vector<uint32_t> m_FreeList;
        size_t m_NextFree = 0;
        std::vector<Retired> m_Retired;

        mutable std::shared_mutex m_Mutex;
        uint32_t m_FramesInFlight = 2;
        uint32_t m_MaxCount = 0;
        size_t m_LiveCount = 0;
    };
}
