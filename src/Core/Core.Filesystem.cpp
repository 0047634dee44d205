module;
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

module Core;

namespace Core::Filesystem
{
    std::filesystem::path GetRoot()
    {
        std::error_code ec;
        if (std::filesystem::exists("assets", ec))
            return std::filesystem::current_path();

        if (std::filesystem::exists("../assets", ec))
            return std::filesystem::current_path().parent_path();

#ifdef PRISM_ROOT_DIR
        return std::filesystem::path(PRISM_ROOT_DIR);
#else
        return std::filesystem::current_path();
#endif
    }

    std::filesystem::path GetAssetRoot()
    {
        return GetRoot() / "assets";
    }

    std::string GetAssetPath(const std::string& relativePath)
    {
        return (GetAssetRoot() / relativePath).string();
    }

    Expected<std::string> ReadText(const std::filesystem::path& path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            Log::Error("Filesystem: cannot open '{}'", path.string());
            return std::unexpected(ErrorCode::FileNotFound);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad())
        {
            Log::Error("Filesystem: read failed for '{}'", path.string());
            return std::unexpected(ErrorCode::FileReadError);
        }
        return buffer.str();
    }

    Expected<std::vector<std::byte>> ReadBinary(const std::filesystem::path& path)
    {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file.is_open())
        {
            Log::Error("Filesystem: cannot open '{}'", path.string());
            return std::unexpected(ErrorCode::FileNotFound);
        }

        const std::streamsize size = file.tellg();
        if (size < 0)
            return std::unexpected(ErrorCode::FileReadError);

        std::vector<std::byte> bytes(static_cast<size_t>(size));
        file.seekg(0, std::ios::beg);
        if (size > 0 && !file.read(reinterpret_cast<char*>(bytes.data()), size))
        {
            Log::Error("Filesystem: read failed for '{}'", path.string());
            return std::unexpected(ErrorCode::FileReadError);
        }
        return bytes;
    }
}
