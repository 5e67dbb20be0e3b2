#pragma once
#include <cstdint>
#include <type_traits>

namespace faststatus::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Conflict,
        ZeroValue,
        Length,
        Format,
        Range,
        Busy,
        Corrupt,
        Io,
        Unsupported,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Codec,
        Store,
        Db,
        Security,
        External,
    };

    // Which sub-value of a record an error refers to.
    enum class StatusField : u16 {
        None = 0,
        Id,
        Occupancy,
        Since,
        FriendlyName,
        Header,
        Record,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        StatusField field{StatusField::None};
        StatusCode cause{StatusCode::Ok}; // root code of a wrapped error
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, StatusField::None, StatusCode::Ok, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Attaches field context unless an inner layer already named the field.
    [[nodiscard]] constexpr Status with_field(Status s, StatusField field) noexcept {
        if (!is_ok(s) && s.field == StatusField::None) {
            s.field = field;
        }
        return s;
    }

    [[nodiscard]] constexpr StatusCode root_cause(Status s) noexcept {
        return s.cause != StatusCode::Ok ? s.cause : s.code;
    }

    [[nodiscard]] constexpr Status wrap_status(StatusDomain domain, StatusCode code, Status inner) noexcept {
        return Status{code, domain, inner.field, root_cause(inner), inner.aux};
    }

    // True if 'code' is the error itself or the root of what it wraps.
    [[nodiscard]] constexpr bool status_is(Status s, StatusCode code) noexcept {
        return code != StatusCode::Ok && (s.code == code || s.cause == code);
    }

    [[nodiscard]] constexpr bool is_length_error(Status s) noexcept { return status_is(s, StatusCode::Length); }
    [[nodiscard]] constexpr bool is_format_error(Status s) noexcept { return status_is(s, StatusCode::Format); }
    [[nodiscard]] constexpr bool is_range_error(Status s) noexcept { return status_is(s, StatusCode::Range); }
    [[nodiscard]] constexpr bool is_zero_value_error(Status s) noexcept { return status_is(s, StatusCode::ZeroValue); }
    [[nodiscard]] constexpr bool is_conflict_error(Status s) noexcept { return status_is(s, StatusCode::Conflict); }

    [[nodiscard]] constexpr const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::ZeroValue: return "ZeroValue";
            case StatusCode::Length: return "Length";
            case StatusCode::Format: return "Format";
            case StatusCode::Range: return "Range";
            case StatusCode::Busy: return "Busy";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    [[nodiscard]] constexpr const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Codec: return "Codec";
            case StatusDomain::Store: return "Store";
            case StatusDomain::Db: return "Db";
            case StatusDomain::Security: return "Security";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    [[nodiscard]] constexpr const char* status_field_name(StatusField field) noexcept {
        switch (field) {
            case StatusField::None: return "none";
            case StatusField::Id: return "id";
            case StatusField::Occupancy: return "status";
            case StatusField::Since: return "since";
            case StatusField::FriendlyName: return "friendlyName";
            case StatusField::Header: return "header";
            case StatusField::Record: return "record";
        }
        return "none";
    }

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace faststatus::core
