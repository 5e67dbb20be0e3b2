#pragma once

#include <string>

#include "faststatus/core/errors.hpp"
#include "faststatus/core/types.hpp"

namespace faststatus::resource {
    using u8 = faststatus::core::u8;
    using u32 = faststatus::core::u32;
    using Occupancy = faststatus::core::Occupancy;

    // Free (0) is a completely unoccupied resource, Occupied (2) is used to
    // capacity, and Busy (1) is anything in between.
    [[nodiscard]] constexpr bool occupancy_valid(Occupancy s) noexcept {
        return static_cast<u8>(s) <= faststatus::core::kOccupancyMax;
    }

    // Binary encoding is total: out-of-range values encode their raw byte.
    [[nodiscard]] constexpr u8 occupancy_to_binary(Occupancy s) noexcept {
        return static_cast<u8>(s);
    }

    // Length unless exactly one byte, Range if the byte exceeds Occupied.
    [[nodiscard]] faststatus::core::Status occupancy_from_binary(faststatus::core::BufferView in, Occupancy* out) noexcept;

    // "free" | "busy" | "occupied"; Range for any other value.
    [[nodiscard]] faststatus::core::Status occupancy_to_text(Occupancy s, std::string* out) noexcept;

    // Case-insensitive word or a single digit "0"/"1"/"2"; otherwise Format.
    [[nodiscard]] faststatus::core::Status occupancy_from_text(const char* txt, u32 len, Occupancy* out) noexcept;

    // Text form for logs and UIs. Out-of-range values read as "free".
    [[nodiscard]] const char* occupancy_display(Occupancy s) noexcept;

} // namespace faststatus::resource
