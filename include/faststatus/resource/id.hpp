#pragma once

#include <array>
#include <string>

#include "faststatus/core/errors.hpp"
#include "faststatus/core/types.hpp"

namespace faststatus::resource {
    using u8 = faststatus::core::u8;
    using u32 = faststatus::core::u32;
    using ResourceId = faststatus::core::ResourceId;

    inline constexpr u32 kIdBinaryBytes = 16;
    inline constexpr u32 kIdTextBytes = 36;
    inline constexpr u32 kIdHexDigits = 32;

    [[nodiscard]] constexpr bool id_is_zero(const ResourceId& id) noexcept {
        return id == faststatus::core::kZeroResourceId;
    }

    // Random UUID version 4 (byte 6 high nibble = 4, byte 8 top bits = 10).
    [[nodiscard]] faststatus::core::Status id_generate(ResourceId* out) noexcept;

    [[nodiscard]] constexpr std::array<u8, kIdBinaryBytes> id_to_binary(const ResourceId& id) noexcept {
        return id.b;
    }

    // Length unless exactly 16 bytes. Any 16 bytes are accepted.
    [[nodiscard]] faststatus::core::Status id_from_binary(faststatus::core::BufferView in, ResourceId* out) noexcept;

    // Canonical lowercase xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
    [[nodiscard]] std::string id_to_text(const ResourceId& id);

    // 32 hex digits (either case) grouped 8-4-4-4-12. Each of the four group
    // boundaries may carry at most one hyphen; hyphens anywhere else, and any
    // other deviation, are Format errors.
    [[nodiscard]] faststatus::core::Status id_from_text(const char* txt, u32 len, ResourceId* out) noexcept;

} // namespace faststatus::resource
