module;
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <expected>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <glm/glm.hpp>

module Graphics;

namespace Graphics
{
    namespace
    {
        std::string_view Trim(std::string_view text)
        {
            const auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) return {};
            const auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }

        std::string ToLower(std::string_view text)
        {
            std::string out(text);
            std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        template <typename T>
        bool ParseNumber(std::string_view text, T& out)
        {
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(text.data(), end, out);
            return ec == std::errc() && ptr == end;
        }

        bool ParseBool(std::string_view text, bool& out)
        {
            const std::string value = ToLower(text);
            if (value == "true" || value == "1") { out = true; return true; }
            if (value == "false" || value == "0") { out = false; return true; }
            return false;
        }

        bool ParseVec4(std::string_view text, glm::vec4& out)
        {
            glm::vec4 value{0.0f};
            int count = 0;
            size_t pos = 0;
            while (pos < text.size())
            {
                pos = text.find_first_not_of(" \t", pos);
                if (pos == std::string_view::npos) break;
                size_t end = text.find_first_of(" \t", pos);
                if (end == std::string_view::npos) end = text.size();

                if (count == 4 || !ParseNumber(text.substr(pos, end - pos), value[count])) return false;
                ++count;
                pos = end;
            }
            if (count != 4) return false;
            out = value;
            return true;
        }
    }

    Core::Expected<MaterialConfig> ParseMaterialConfig(std::string_view text, std::string_view defaultName)
    {
        MaterialConfig config;
        config.Name = std::string(defaultName);

        std::istringstream stream{std::string{text}};
        std::string rawLine;
        uint32_t lineNumber = 0;

        while (std::getline(stream, rawLine))
        {
            ++lineNumber;
            const std::string_view line = Trim(rawLine);
            if (line.empty() || line.front() == '#') continue;

            const auto equals = line.find('=');
            if (equals == std::string_view::npos)
            {
                Core::Log::Warn("Material '{}' line {}: no '=' found, skipping.", defaultName, lineNumber);
                continue;
            }

            const std::string key = ToLower(Trim(line.substr(0, equals)));
            const std::string_view value = Trim(line.substr(equals + 1));
            bool ok = true;

            if (key == "version")
                ok = ParseNumber(value, config.Version);
            else if (key == "name")
                config.Name = std::string(value);
            else if (key == "shader")
                config.ShaderName = std::string(value);
            else if (key == "diffuse_colour")
                ok = ParseVec4(value, config.DiffuseColour);
            else if (key == "shininess")
                ok = ParseNumber(value, config.Shininess);
            else if (key == "diffuse_map_name")
                config.DiffuseMapName = std::string(value);
            else if (key == "specular_map_name")
                config.SpecularMapName = std::string(value);
            else if (key == "normal_map_name")
                config.NormalMapName = std::string(value);
            else if (key == "autorelease")
                ok = ParseBool(value, config.AutoRelease);
            else
                Core::Log::Error("Material '{}' line {}: unknown key '{}', skipping.", defaultName, lineNumber, key);

            if (!ok)
            {
                Core::Log::Error("Material '{}' line {}: bad value '{}' for '{}'.", defaultName, lineNumber, value, key);
                return std::unexpected(Core::ErrorCode::InvalidFormat);
            }
        }

        if (auto valid = ValidateMaterialConfig(config); !valid)
            return std::unexpected(valid.error());
        return config;
    }

    Core::Result ValidateMaterialConfig(const MaterialConfig& config)
    {
        if (config.Name.empty())
        {
            Core::Log::Error("Material config: name is required.");
            return Core::Err(Core::ErrorCode::InvalidFormat);
        }
        if (config.ShaderName.empty())
        {
            Core::Log::Error("Material config '{}': shader is required.", config.Name);
            return Core::Err(Core::ErrorCode::InvalidFormat);
        }
        for (int i = 0; i < 4; ++i)
        {
            if (config.DiffuseColour[i] < 0.0f || config.DiffuseColour[i] > 1.0f)
            {
                Core::Log::Error("Material config '{}': diffuse colour component {} out of [0,1].", config.Name, i);
                return Core::Err(Core::ErrorCode::InvalidFormat);
            }
        }
        if (config.Shininess < 0.0f)
        {
            Core::Log::Error("Material config '{}': negative shininess.", config.Name);
            return Core::Err(Core::ErrorCode::InvalidFormat);
        }
        return Core::Ok();
    }
}
