module;
#include <cstdint>
#include <limits>
#include <functional>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - Type-safe generational handle template
    // -------------------------------------------------------------------------
    // Handles are plain values: they may be copied into ECS components, stored
    // across any number of frames and compared cheaply. Validity against the
    // owning pool is decided by the pool (Index + Generation match), never by
    // the handle itself.
    //
    //   struct MeshTag {};
    //   using MeshHandle = Core::StrongHandle<MeshTag>;
    //
    // Handles of different tags cannot be mixed at compile time.
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;

        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        [[nodiscard]] constexpr uint64_t Packed() const noexcept
        {
            return (static_cast<uint64_t>(Generation) << 32) | Index;
        }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            uint64_t val = h.Packed();

            // MurmurHash3 finalizer
            val ^= val >> 33;
            val *= 0xff51afd7ed558ccd;
            val ^= val >> 33;
            val *= 0xc4ceb9fe1a85ec53;
            val ^= val >> 33;

            return static_cast<std::size_t>(val);
        }
    };
}
