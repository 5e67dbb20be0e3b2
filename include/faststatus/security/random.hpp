#pragma once

#include "faststatus/core/errors.hpp"
#include "faststatus/core/types.hpp"

namespace faststatus::security {
    using u8 = faststatus::core::u8;
    using u32 = faststatus::core::u32;

    // Fills 'out' from the platform's cryptographically secure generator.
    // Unavailable when built without a crypto backend, Io if the backend fails.
    [[nodiscard]] faststatus::core::Status random_bytes(faststatus::core::BufferMut out) noexcept;

} // namespace faststatus::security
