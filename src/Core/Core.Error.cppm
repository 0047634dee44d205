module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. Expected<T>        - fallible operations the caller must handle
    //                         (loading, parsing, validation, backend calls).
    // 2. std::optional<T>   - lookups where "not there" is a normal answer.
    // 3. Raw pointers (T*)  - non-owning observation only. Never returned for
    //                         freshly allocated resources.
    // 4. Logging            - every error that ends an operation is logged at
    //                         the point where it is decided, then propagated.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,
        ResourceBusy = 102,
        ResourceCorrupted = 103,
        ResourceExhausted = 104,
        AlreadyExists = 105,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,
        InvalidPath = 202,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidFormat = 302,
        OutOfRange = 303,
        TypeMismatch = 304,

        // Graphics/backend errors (400-499)
        DeviceLost = 400,
        BackendFailure = 401,
        SwapchainOutOfDate = 402,
        RenderPassFailed = 403,
        ShaderCreationFailed = 404,
        FrameSubmitFailed = 405,

        // Asset errors (500-599)
        AssetLoadFailed = 500,
        AssetTypeMismatch = 501,

        // Container errors (600-699)
        QueueFull = 600,
        QueueEmpty = 601,

        // Generic
        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:              return "Success";
            case ErrorCode::OutOfMemory:          return "OutOfMemory";
            case ErrorCode::ResourceNotFound:     return "ResourceNotFound";
            case ErrorCode::ResourceBusy:         return "ResourceBusy";
            case ErrorCode::ResourceCorrupted:    return "ResourceCorrupted";
            case ErrorCode::ResourceExhausted:    return "ResourceExhausted";
            case ErrorCode::AlreadyExists:        return "AlreadyExists";
            case ErrorCode::FileNotFound:         return "FileNotFound";
            case ErrorCode::FileReadError:        return "FileReadError";
            case ErrorCode::InvalidPath:          return "InvalidPath";
            case ErrorCode::InvalidArgument:      return "InvalidArgument";
            case ErrorCode::InvalidState:         return "InvalidState";
            case ErrorCode::InvalidFormat:        return "InvalidFormat";
            case ErrorCode::OutOfRange:           return "OutOfRange";
            case ErrorCode::TypeMismatch:         return "TypeMismatch";
            case ErrorCode::DeviceLost:           return "DeviceLost";
            case ErrorCode::BackendFailure:       return "BackendFailure";
            case ErrorCode::SwapchainOutOfDate:   return "SwapchainOutOfDate";
            case ErrorCode::RenderPassFailed:     return "RenderPassFailed";
            case ErrorCode::ShaderCreationFailed: return "ShaderCreationFailed";
            case ErrorCode::FrameSubmitFailed:    return "FrameSubmitFailed";
            case ErrorCode::AssetLoadFailed:      return "AssetLoadFailed";
            case ErrorCode::AssetTypeMismatch:    return "AssetTypeMismatch";
            case ErrorCode::QueueFull:            return "QueueFull";
            case ErrorCode::QueueEmpty:           return "QueueEmpty";
            default:                              return "Unknown";
        }
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
