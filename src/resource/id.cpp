#include "faststatus/resource/id.hpp"

#include <cstring>

#include "faststatus/security/random.hpp"

namespace faststatus::resource {
    namespace {
        constexpr char kHexDigits[] = "0123456789abcdef";
        constexpr u32 kGroupDigits[] = {8, 4, 4, 4, 12};

        int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        faststatus::core::Status format_error() noexcept {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Format);
        }
    } // namespace

    faststatus::core::Status id_generate(ResourceId* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Invalid);
        }

        ResourceId id{};
        const faststatus::core::Status s = faststatus::security::random_bytes({id.b.data(), kIdBinaryBytes});
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::wrap_status(faststatus::core::StatusDomain::Security, faststatus::core::StatusCode::Io, s);
        }

        id.b[6] = static_cast<u8>((id.b[6] & 0x0fu) | 0x40u);
        id.b[8] = static_cast<u8>((id.b[8] & 0x3fu) | 0x80u);
        *out = id;
        return faststatus::core::ok_status();
    }

    faststatus::core::Status id_from_binary(faststatus::core::BufferView in, ResourceId* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Invalid);
        }
        if (in.len != kIdBinaryBytes || in.data == nullptr) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Length, in.len);
        }
        ResourceId id{};
        std::memcpy(id.b.data(), in.data, kIdBinaryBytes);
        *out = id;
        return faststatus::core::ok_status();
    }

    std::string id_to_text(const ResourceId& id) {
        std::string txt;
        txt.reserve(kIdTextBytes);
        u32 byte = 0;
        for (u32 g = 0; g < 5; ++g) {
            if (g > 0) {
                txt.push_back('-');
            }
            for (u32 i = 0; i < kGroupDigits[g] / 2; ++i, ++byte) {
                txt.push_back(kHexDigits[(id.b[byte] >> 4) & 0x0fu]);
                txt.push_back(kHexDigits[id.b[byte] & 0x0fu]);
            }
        }
        return txt;
    }

    faststatus::core::Status id_from_text(const char* txt, u32 len, ResourceId* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Codec, faststatus::core::StatusCode::Invalid);
        }
        if (txt == nullptr || len < kIdHexDigits || len > kIdTextBytes) {
            return format_error();
        }

        ResourceId id{};
        u32 pos = 0;
        u32 byte = 0;
        for (u32 g = 0; g < 5; ++g) {
            if (g > 0 && pos < len && txt[pos] == '-') {
                ++pos;
            }
            const u32 digits = kGroupDigits[g];
            if (len - pos < digits) {
                return format_error();
            }
            for (u32 i = 0; i < digits; i += 2, ++byte) {
                const int hi = hex_value(txt[pos + i]);
                const int lo = hex_value(txt[pos + i + 1]);
                if (hi < 0 || lo < 0) {
                    return format_error();
                }
                id.b[byte] = static_cast<u8>((hi << 4) | lo);
            }
            pos += digits;
        }
        if (pos != len) {
            return format_error();
        }

        *out = id;
        return faststatus::core::ok_status();
    }

} // namespace faststatus::resource
