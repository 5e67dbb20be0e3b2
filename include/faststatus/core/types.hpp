#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace faststatus::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i16 = std::int16_t;
    using i64 = std::int64_t;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    // 128-bit resource identifier. All-zero is the "no identifier" sentinel.
    struct ResourceId {
        std::array<u8, 16> b{};
        friend constexpr bool operator==(const ResourceId&, const ResourceId&) noexcept = default;
        friend constexpr auto operator<=>(const ResourceId&, const ResourceId&) noexcept = default;
    };
    static_assert(sizeof(ResourceId) == 16);

    inline constexpr ResourceId kZeroResourceId{};

    enum class Occupancy : u8 {
        Free = 0,
        Busy = 1,
        Occupied = 2,
    };

    inline constexpr u8 kOccupancyMax = static_cast<u8>(Occupancy::Occupied);

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_trivially_copyable_v<ResourceId>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferMut>);
    static_assert(std::is_standard_layout_v<ResourceId>);

} // namespace faststatus::core
