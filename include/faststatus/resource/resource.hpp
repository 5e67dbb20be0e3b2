#pragma once

#include <string>
#include <vector>

#include "faststatus/core/errors.hpp"
#include "faststatus/core/time.hpp"
#include "faststatus/core/types.hpp"
#include "faststatus/resource/id.hpp"
#include "faststatus/resource/occupancy.hpp"

namespace faststatus::resource {
    using u8 = faststatus::core::u8;
    using u16 = faststatus::core::u16;
    using u32 = faststatus::core::u32;
    using Timestamp = faststatus::core::Timestamp;

    // A Resource is anything (a person, a room, a server) that needs to
    // communicate how busy it is, and since when.
    struct Resource {
        ResourceId id{};
        Occupancy status{Occupancy::Free};
        Timestamp since{};
        std::string friendly_name;
    };

    // Binary record layout (big-endian):
    // 0..1 magic "FS", 2 version, 3 reserved(=0), 4..19 id, 20 status,
    // 21..34 since (see kTimestampBinaryBytes), 35..36 name length(u16),
    // 37.. name bytes.
    inline constexpr u8 kResourceMagic[2] = {0x46, 0x53};
    inline constexpr u8 kResourceBinaryVersion = 1;
    inline constexpr u32 kResourceBinaryFixedBytes = 4 + kIdBinaryBytes + 1 + faststatus::core::kTimestampBinaryBytes + 2;
    inline constexpr u32 kFriendlyNameMaxBytes = 0xffffu;

    static_assert(kResourceBinaryFixedBytes == 37);

    // Older text and JSON records wrote an unset Since as 0001-01-01T00:00:00Z.
    // Decoders read that instant as the zero Timestamp.
    inline constexpr faststatus::core::i64 kLegacyZeroSinceSeconds = -62135596800;

    // Since is compared as an instant; the offset annotation is ignored.
    [[nodiscard]] bool resource_equal(const Resource& a, const Resource& b) noexcept;

    inline bool operator==(const Resource& a, const Resource& b) noexcept {
        return resource_equal(a, b);
    }

    // New random id, Free, zero Since, empty name.
    [[nodiscard]] faststatus::core::Status resource_new(Resource* out) noexcept;

    [[nodiscard]] bool resource_persistable(const Resource& r) noexcept;

    // "{id} {status} {since}[ {friendlyName}]", one line, name unescaped.
    [[nodiscard]] faststatus::core::Status resource_to_text(const Resource& r, std::string* out) noexcept;
    [[nodiscard]] faststatus::core::Status resource_from_text(const char* txt, u32 len, Resource* out) noexcept;

    // Text form, or "" if the resource cannot be encoded.
    [[nodiscard]] std::string resource_to_string(const Resource& r);

    // {"id": ..., "status": ..., "since": ..., "friendlyName": ...}
    [[nodiscard]] faststatus::core::Status resource_to_json(const Resource& r, std::string* out) noexcept;
    [[nodiscard]] faststatus::core::Status resource_from_json(const char* txt, u32 len, Resource* out) noexcept;

    [[nodiscard]] faststatus::core::Status resource_to_binary(const Resource& r, std::vector<u8>* out) noexcept;
    [[nodiscard]] faststatus::core::Status resource_from_binary(faststatus::core::BufferView in, Resource* out) noexcept;

} // namespace faststatus::resource
