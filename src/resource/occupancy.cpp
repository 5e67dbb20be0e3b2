#include "faststatus/resource/occupancy.hpp"

#include <strings.h>

namespace faststatus::resource {
    namespace {
        struct OccupancyName {
            Occupancy value;
            const char* word;
            u32 len;
        };

        constexpr OccupancyName kNames[] = {
            {Occupancy::Free, "free", 4},
            {Occupancy::Busy, "busy", 4},
            {Occupancy::Occupied, "occupied", 8},
        };

        faststatus::core::Status range_error(u32 value) noexcept {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Range, value);
        }
    } // namespace

    faststatus::core::Status occupancy_from_binary(faststatus::core::BufferView in, Occupancy* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Invalid);
        }
        if (in.len != 1 || in.data == nullptr) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Length, in.len);
        }
        if (in.data[0] > faststatus::core::kOccupancyMax) {
            return range_error(in.data[0]);
        }
        *out = static_cast<Occupancy>(in.data[0]);
        return faststatus::core::ok_status();
    }

    faststatus::core::Status occupancy_to_text(Occupancy s, std::string* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Invalid);
        }
        if (!occupancy_valid(s)) {
            return range_error(static_cast<u8>(s));
        }
        const OccupancyName& n = kNames[static_cast<u8>(s)];
        out->assign(n.word, n.len);
        return faststatus::core::ok_status();
    }

    faststatus::core::Status occupancy_from_text(const char* txt, u32 len, Occupancy* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Invalid);
        }
        if (txt == nullptr || len == 0) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Format);
        }
        if (len == 1 && txt[0] >= '0' && txt[0] <= static_cast<char>('0' + faststatus::core::kOccupancyMax)) {
            *out = static_cast<Occupancy>(txt[0] - '0');
            return faststatus::core::ok_status();
        }
        for (const OccupancyName& n : kNames) {
            if (len == n.len && strncasecmp(txt, n.word, n.len) == 0) {
                *out = n.value;
                return faststatus::core::ok_status();
            }
        }
        return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Format);
    }

    const char* occupancy_display(Occupancy s) noexcept {
        if (!occupancy_valid(s)) {
            return kNames[0].word;
        }
        return kNames[static_cast<u8>(s)].word;
    }

} // namespace faststatus::resource
