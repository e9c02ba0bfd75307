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
    // 1. std::expected<T, E>  - For FALLIBLE operations the caller MUST check:
    //                          - Initialization with caller-supplied config
    //                          - Lifecycle calls that have ordering preconditions
    //                            (reveal before initialize, reveal without anchor)
    //
    // 2. std::optional<T>    - For QUERIES where "nothing there" is a valid outcome:
    //                          - Sampling an anchor node that may not exist yet
    //                          - Looking up a component that may not be attached
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation; nullptr means
    //                          "no reference". Never for newly allocated objects.
    //
    // 4. Silent no-op        - For REDUNDANT triggers (reveal while shown,
    //                          dismiss while hidden). Not an error.
    //
    // 5. Assertions          - For INVARIANTS that indicate a bug if violated.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Lookup errors (100-199)
        EntityNotFound = 100,

        // Validation errors (300-399)
        InvalidArgument = 300,

        // Lifecycle errors (700-799)
        NotInitialized = 700,
        AlreadyInitialized = 701,
        AnchorUnavailable = 702,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                 return "Success";
            case ErrorCode::EntityNotFound:          return "EntityNotFound";
            case ErrorCode::InvalidArgument:         return "InvalidArgument";
            case ErrorCode::NotInitialized:          return "NotInitialized";
            case ErrorCode::AlreadyInitialized:      return "AlreadyInitialized";
            case ErrorCode::AnchorUnavailable:       return "AnchorUnavailable";
            default:                                 return "Unknown";
        }
    }

    template <typename T>
    using Expected = std::expected<T, ErrorCode>;

    template <typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template <typename T>
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
