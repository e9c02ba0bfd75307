module;
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

export module Core:Hash;

export namespace Core::Hash
{
    // FNV-1a Hash
    constexpr uint32_t HashString(std::string_view str)
    {
        uint32_t hash = 2166136261u;
        for (char c : str)
        {
            hash ^= static_cast<uint8_t>(c);
            hash *= 16777619u;
        }
        return hash;
    }

    // Compact identifier for entity state names ("visible", "modal") and
    // custom event names ("hide-complete"). Compared by hash only.
    struct StringID
    {
        uint32_t Value;
#ifndef NDEBUG
        const char* DebugString = nullptr;
#endif

        constexpr StringID() : Value(0)
        {
        }

        constexpr StringID(uint32_t v) : Value(v)
        {
        }

        // DebugString points to the literal, safe only for string literals
        constexpr StringID(const char* str) : Value(HashString(str))
#ifndef NDEBUG
            , DebugString(str)
#endif
        {
        }

        constexpr StringID(std::string_view str) : Value(HashString(str))
#ifndef NDEBUG
            , DebugString(str.data())
#endif
        {
        }

        [[nodiscard]] constexpr bool IsValid() const { return Value != 0; }

        // Debug name when available, otherwise a placeholder. For log output only.
        [[nodiscard]] constexpr const char* Name() const
        {
#ifndef NDEBUG
            return DebugString ? DebugString : "<id>";
#else
            return "<id>";
#endif
        }

        constexpr bool operator==(const StringID& other) const { return Value == other.Value; }
        constexpr auto operator<=>(const StringID& other) const { return Value <=> other.Value; }
    };

    // User-defined literal for convenient IDs, e.g. "visible"_id.
    constexpr StringID operator""_id(const char* str, size_t len)
    {
        return {std::string_view(str, len)};
    }
}

// Allow Core::Hash::StringID to be used in unordered containers.
template <>
struct std::hash<Core::Hash::StringID>
{
    std::size_t operator()(const Core::Hash::StringID& id) const noexcept
    {
        return std::hash<uint32_t>{}(id.Value);
    }
};
