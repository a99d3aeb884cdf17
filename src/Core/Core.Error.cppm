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
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it (runtime polling,
    //                          arena appends, GPU object creation).
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome.
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          where nullptr means "no reference".
    //
    // A controlled shutdown (runtime reached EXITING, user interrupt) is NOT an
    // error. It is reported as a value by the session driver and never travels
    // through ErrorCode.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,
        ResourceBusy = 102,
        ArenaFull = 103,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        OutOfRange = 303,

        // Graphics/RHI errors (400-499)
        DeviceLost = 400,
        OutOfDeviceMemory = 401,
        DeviceInitFailed = 405,

        // XR runtime errors (700-799)
        RuntimeInitFailed = 700,
        RuntimeTeardown = 701,
        RuntimeCallFailed = 702,
        SessionNotRunning = 703,
        FrameOutOfOrder = 704,

        // Physics errors (800-899)
        PhysicsInitFailed = 800,
        BodyNotFound = 801,

        // Generic
        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:            return "Success";
            case ErrorCode::OutOfMemory:        return "OutOfMemory";
            case ErrorCode::ResourceNotFound:   return "ResourceNotFound";
            case ErrorCode::ResourceBusy:       return "ResourceBusy";
            case ErrorCode::ArenaFull:          return "ArenaFull";
            case ErrorCode::InvalidArgument:    return "InvalidArgument";
            case ErrorCode::InvalidState:       return "InvalidState";
            case ErrorCode::OutOfRange:         return "OutOfRange";
            case ErrorCode::DeviceLost:         return "DeviceLost";
            case ErrorCode::OutOfDeviceMemory:  return "OutOfDeviceMemory";
            case ErrorCode::DeviceInitFailed:   return "DeviceInitFailed";
            case ErrorCode::RuntimeInitFailed:  return "RuntimeInitFailed";
            case ErrorCode::RuntimeTeardown:    return "RuntimeTeardown";
            case ErrorCode::RuntimeCallFailed:  return "RuntimeCallFailed";
            case ErrorCode::SessionNotRunning:  return "SessionNotRunning";
            case ErrorCode::FrameOutOfOrder:    return "FrameOutOfOrder";
            case ErrorCode::PhysicsInitFailed:  return "PhysicsInitFailed";
            case ErrorCode::BodyNotFound:       return "BodyNotFound";
            default:                            return "Unknown";
        }
    }

    // Capacity overflow is a provisioning bug: retrying the same frame cannot help.
    constexpr bool IsFatal(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::ArenaFull:
            case ErrorCode::OutOfMemory:
            case ErrorCode::OutOfDeviceMemory:
            case ErrorCode::DeviceLost:
            case ErrorCode::DeviceInitFailed:
            case ErrorCode::RuntimeInitFailed:
            case ErrorCode::RuntimeTeardown:
            case ErrorCode::RuntimeCallFailed:
            case ErrorCode::PhysicsInitFailed:
            case ErrorCode::FrameOutOfOrder:
                return true;
            default:
                return false;
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
    inline constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    // Converts to any Expected<T>, so callers need not spell the value type.
    constexpr std::unexpected<ErrorCode> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
