module;
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

export module Core:Filesystem;
import :Error;

export namespace Core::Filesystem
{
    // Directory that contains "assets": the working directory for a packaged build,
    // its parent when running from bin/, otherwise PRISM_ROOT_DIR.
    [[nodiscard]] std::filesystem::path GetRoot();

    [[nodiscard]] std::filesystem::path GetAssetRoot();

    [[nodiscard]] std::string GetAssetPath(const std::string& relativePath);

    [[nodiscard]] Expected<std::string> ReadText(const std::filesystem::path& path);
    [[nodiscard]] Expected<std::vector<std::byte>> ReadBinary(const std::filesystem::path& path);
}
