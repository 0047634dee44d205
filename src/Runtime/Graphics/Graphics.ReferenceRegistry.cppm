module;
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

export module Graphics:ReferenceRegistry;
import Core;

export namespace Graphics
{
    // Name-keyed reference counts for shared resources.
    //
    // The mutex only guards the map. Load and unload callbacks run outside it, so a
    // load may acquire other resources. A second Acquire of a name whose load is
    // still running blocks on that load's shared future instead of loading twice.
    template <typename THandle>
    class ReferenceRegistry
    {
    public:
        using LoadFn = std::function<Core::Expected<THandle>()>;
        using UnloadFn = std::function<void(const THandle&)>;

        ReferenceRegistry() = default;
        ReferenceRegistry(const ReferenceRegistry&) = delete;
        ReferenceRegistry& operator=(const ReferenceRegistry&) = delete;

        // The auto-release flag of the first acquire sticks.
        [[nodiscard]] Core::Expected<THandle> Acquire(std::string_view name, bool autoRelease, const LoadFn& load)
        {
            std::promise<Core::Expected<THandle>> promise;
            std::shared_future<Core::Expected<THandle>> pending;
            uint64_t ticket = 0;
            {
                std::lock_guard lock(m_Mutex);
                if (auto it = m_Entries.find(name); it != m_Entries.end())
                {
                    ++it->second.ReferenceCount;
                    pending = it->second.Result;
                }
                else
                {
                    ticket = ++m_NextTicket;
                    pending = promise.get_future().share();
                    m_Entries.emplace(std::string(name), Entry{1, autoRelease, ticket, pending});
                }
            }

            if (ticket == 0)
                return pending.get();

            auto result = load();
            if (!result)
            {
                // Everyone waiting on this load sees the same error.
                std::lock_guard lock(m_Mutex);
                if (auto it = m_Entries.find(name); it != m_Entries.end() && it->second.Ticket == ticket)
                    m_Entries.erase(it);
            }
            promise.set_value(result);
            return result;
        }

        // At zero with auto-release the entry is dropped and `unload` runs once.
        [[nodiscard]] Core::Result Release(std::string_view name, const UnloadFn& unload)
        {
            std::shared_future<Core::Expected<THandle>> released;
            {
                std::lock_guard lock(m_Mutex);
                auto it = m_Entries.find(name);
                if (it == m_Entries.end())
                {
                    Core::Log::Warn("Release of unknown resource '{}'.", name);
                    return Core::Err(Core::ErrorCode::ResourceNotFound);
                }
                if (it->second.ReferenceCount == 0)
                {
                    Core::Log::Warn("Release of '{}' with no outstanding references.", name);
                    return Core::Err(Core::ErrorCode::InvalidState);
                }

                if (--it->second.ReferenceCount > 0 || !it->second.AutoRelease)
                    return Core::Ok();

                released = it->second.Result;
                m_Entries.erase(it);
            }

            if (auto handle = released.get(); handle && unload)
                unload(*handle);
            return Core::Ok();
        }

        // Handle of a loaded entry; nullopt while missing or still loading.
        [[nodiscard]] std::optional<THandle> Find(std::string_view name) const
        {
            std::lock_guard lock(m_Mutex);
            auto it = m_Entries.find(name);
            if (it == m_Entries.end()) return std::nullopt;
            if (it->second.Result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return std::nullopt;

            const auto& result = it->second.Result.get();
            if (!result) return std::nullopt;
            return *result;
        }

        [[nodiscard]] uint64_t GetReferenceCount(std::string_view name) const
        {
            std::lock_guard lock(m_Mutex);
            auto it = m_Entries.find(name);
            return it == m_Entries.end() ? 0 : it->second.ReferenceCount;
        }

        [[nodiscard]] bool Contains(std::string_view name) const
        {
            std::lock_guard lock(m_Mutex);
            return m_Entries.find(name) != m_Entries.end();
        }

        [[nodiscard]] size_t Size() const
        {
            std::lock_guard lock(m_Mutex);
            return m_Entries.size();
        }

        // Shutdown path: unloads every entry regardless of count or auto-release.
        void ReleaseAll(const UnloadFn& unload)
        {
            std::vector<std::shared_future<Core::Expected<THandle>>> entries;
            {
                std::lock_guard lock(m_Mutex);
                entries.reserve(m_Entries.size());
                for (auto& [name, entry] : m_Entries)
                    entries.push_back(entry.Result);
                m_Entries.clear();
            }

            for (const auto& entry : entries)
            {
                if (auto handle = entry.get(); handle && unload)
                    unload(*handle);
            }
        }

    private:
        struct Entry
        {
            uint64_t ReferenceCount = 0;
            bool AutoRelease = false;
            uint64_t Ticket = 0;
            std::shared_future<Core::Expected<THandle>> Result;
        };

        std::unordered_map<std::string, Entry, Core::Hash::StringHash, std::equal_to<>> m_Entries;
        mutable std::mutex m_Mutex;
        uint64_t m_NextTicket = 0;
    };
}
