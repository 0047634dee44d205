module;
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

export module Core:Assets;
import :Error;
import :Hash;

export namespace Core::Assets
{
    enum class AssetType : uint8_t
    {
        Unknown,
        Text,
        Binary,
        Image,
        Material,
        Shader,
        Mesh,
        BitmapFont,
        SystemFont,
    };

    [[nodiscard]] std::string_view AssetTypeToString(AssetType type);

    // Lower-case extension including the dot, e.g. ".png".
    [[nodiscard]] AssetType ClassifyExtension(std::string_view extension);

    struct AssetEntry
    {
        std::string Name; // file stem
        AssetType Type = AssetType::Unknown;
        std::filesystem::path Path;
        std::filesystem::file_time_type LastWrite{};
    };

    enum class ChangeKind : uint8_t
    {
        Added,
        Modified,
        Removed,
    };

    // Recursive index of the asset directory, keyed by (stem, type).
    // Lookups take a shared lock; Rescan() swaps in a new index under an exclusive one.
    class AssetIndex
    {
    public:
        using ChangeCallback = std::function<void(const AssetEntry&, ChangeKind)>;

        explicit AssetIndex(std::filesystem::path root);
        ~AssetIndex();

        AssetIndex(const AssetIndex&) = delete;
        AssetIndex& operator=(const AssetIndex&) = delete;

        // Walks the tree and returns the number of indexed files. Change callbacks
        // fire for every difference against the previous scan, outside the lock.
        Expected<size_t> Rescan();

        // Callback runs on the watcher thread!
        void SetChangeCallback(ChangeCallback callback);

        void StartWatching(std::chrono::milliseconds interval = std::chrono::milliseconds(500));
        void StopWatching();
        [[nodiscard]] bool IsWatching() const { return m_Watching.load(); }

        [[nodiscard]] std::optional<AssetEntry> Find(std::string_view name, AssetType type) const;
        [[nodiscard]] std::vector<AssetEntry> Snapshot() const;
        [[nodiscard]] size_t Count() const;
        [[nodiscard]] const std::filesystem::path& GetRoot() const { return m_Root; }

    private:
        using EntryMap = std::unordered_map<std::string, AssetEntry, Hash::StringHash, std::equal_to<>>;

        static std::string MakeKey(std::string_view name, AssetType type);
        void WatchLoop(std::chrono::milliseconds interval);

        std::filesystem::path m_Root;
        EntryMap m_Entries;
        mutable std::shared_mutex m_Mutex;

        std::mutex m_CallbackMutex;
        ChangeCallback m_OnChanged;

        std::thread m_Thread;
        std::atomic<bool> m_Watching{false};
        std::mutex m_WakeMutex;
        std::condition_variable m_WakeCondition;
    };
}
