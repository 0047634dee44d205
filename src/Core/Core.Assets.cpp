module;
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

module Core;

namespace Core::Assets
{
    std::string_view AssetTypeToString(AssetType type)
    {
        switch (type)
        {
        case AssetType::Text:       return "Text";
        case AssetType::Binary:     return "Binary";
        case AssetType::Image:      return "Image";
        case AssetType::Material:   return "Material";
        case AssetType::Shader:     return "Shader";
        case AssetType::Mesh:       return "Mesh";
        case AssetType::BitmapFont: return "BitmapFont";
        case AssetType::SystemFont: return "SystemFont";
        default:                    return "Unknown";
        }
    }

    AssetType ClassifyExtension(std::string_view extension)
    {
        std::string ext(extension);
        std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (ext == ".shadercfg") return AssetType::Shader;
        if (ext == ".fontcfg" || ext == ".ksf") return AssetType::SystemFont;
        if (ext == ".fnt" || ext == ".kbf") return AssetType::BitmapFont;
        if (ext == ".spv") return AssetType::Binary;
        if (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".tga" || ext == ".bmp") return AssetType::Image;
        if (ext == ".obj" || ext == ".ksm") return AssetType::Mesh;
        if (ext == ".amt") return AssetType::Material;
        if (ext == ".txt") return AssetType::Text;
        return AssetType::Unknown;
    }

    AssetIndex::AssetIndex(std::filesystem::path root)
        : m_Root(std::move(root))
    {
    }

    AssetIndex::~AssetIndex()
    {
        StopWatching();
    }

    std::string AssetIndex::MakeKey(std::string_view name, AssetType type)
    {
        std::string key(name);
        key += '#';
        key += AssetTypeToString(type);
        return key;
    }

    Expected<size_t> AssetIndex::Rescan()
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(m_Root, ec))
        {
            Log::Error("AssetIndex: '{}' is not a directory", m_Root.string());
            return std::unexpected(ErrorCode::InvalidPath);
        }

        // Walk without holding the lock; lookups stay live during the scan.
        EntryMap fresh;
        for (auto it = std::filesystem::recursive_directory_iterator(m_Root, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
        {
            if (!it->is_regular_file(ec)) continue;

            const auto& path = it->path();
            const AssetType type = ClassifyExtension(path.extension().string());
            if (type == AssetType::Unknown) continue;

            AssetEntry entry{path.stem().string(), type, path, it->last_write_time(ec)};
            auto key = MakeKey(entry.Name, type);
            if (auto existing = fresh.find(key); existing != fresh.end())
            {
                Log::Warn("AssetIndex: '{}' shadows '{}'", path.string(), existing->second.Path.string());
                continue;
            }
            fresh.emplace(std::move(key), std::move(entry));
        }

        if (ec)
        {
            Log::Error("AssetIndex: scan of '{}' failed: {}", m_Root.string(), ec.message());
            return std::unexpected(ErrorCode::FileReadError);
        }

        std::vector<std::pair<AssetEntry, ChangeKind>> changes;
        size_t count = 0;
        {
            std::unique_lock lock(m_Mutex);
            for (const auto& [key, entry] : fresh)
            {
                auto old = m_Entries.find(key);
                if (old == m_Entries.end())
                    changes.emplace_back(entry, ChangeKind::Added);
                else if (old->second.LastWrite != entry.LastWrite)
                    changes.emplace_back(entry, ChangeKind::Modified);
            }
            for (const auto& [key, entry] : m_Entries)
            {
                if (!fresh.contains(key))
                    changes.emplace_back(entry, ChangeKind::Removed);
            }
            m_Entries = std::move(fresh);
            count = m_Entries.size();
        }

        ChangeCallback callback;
        {
            std::lock_guard lock(m_CallbackMutex);
            callback = m_OnChanged;
        }
        if (callback)
        {
            for (const auto& [entry, kind] : changes)
                callback(entry, kind);
        }

        return count;
    }

    void AssetIndex::SetChangeCallback(ChangeCallback callback)
    {
        std::lock_guard lock(m_CallbackMutex);
        m_OnChanged = std::move(callback);
    }

    void AssetIndex::StartWatching(std::chrono::milliseconds interval)
    {
        if (m_Watching.exchange(true)) return;

        m_Thread = std::thread([this, interval] { WatchLoop(interval); });
        Log::Info("AssetIndex: watching '{}' every {} ms", m_Root.string(), interval.count());
    }

    void AssetIndex::StopWatching()
    {
        {
            std::lock_guard lock(m_WakeMutex);
            if (!m_Watching.exchange(false)) return;
        }
        m_WakeCondition.notify_all();
        if (m_Thread.joinable()) m_Thread.join();
    }

    void AssetIndex::WatchLoop(std::chrono::milliseconds interval)
    {
        while (true)
        {
            {
                std::unique_lock lock(m_WakeMutex);
                if (m_WakeCondition.wait_for(lock, interval, [this] { return !m_Watching.load(); }))
                    return;
            }

            if (auto result = Rescan(); !result)
                Log::Warn("AssetIndex: watcher rescan failed ({})", ErrorCodeToString(result.error()));
        }
    }

    std::optional<AssetEntry> AssetIndex::Find(std::string_view name, AssetType type) const
    {
        const auto key = MakeKey(name, type);
        std::shared_lock lock(m_Mutex);
        if (auto it = m_Entries.find(key); it != m_Entries.end())
            return it->second;
        return std::nullopt;
    }

    std::vector<AssetEntry> AssetIndex::Snapshot() const
    {
        std::shared_lock lock(m_Mutex);
        std::vector<AssetEntry> out;
        out.reserve(m_Entries.size());
        for (const auto& [key, entry] : m_Entries)
            out.push_back(entry);
        return out;
    }

    size_t AssetIndex::Count() const
    {
        std::shared_lock lock(m_Mutex);
        return m_Entries.size();
    }
}
