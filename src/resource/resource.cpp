#include "faststatus/resource/resource.hpp"

#include <cstring>
#include <utility>

#include <nlohmann/json.hpp>

namespace faststatus::resource {
    using faststatus::core::Status;
    using faststatus::core::StatusCode;
    using faststatus::core::StatusDomain;
    using faststatus::core::StatusField;

    namespace {
        void put_u16_be(u8* p, u16 v) noexcept {
            p[0] = static_cast<u8>((v >> 8) & 0xffu);
            p[1] = static_cast<u8>((v >> 0) & 0xffu);
        }

        u16 get_u16_be(const u8* p) noexcept {
            return static_cast<u16>((static_cast<u16>(p[0]) << 8) | static_cast<u16>(p[1]));
        }

        Status codec_error(StatusCode code, StatusField field, u32 aux = 0) noexcept {
            return faststatus::core::with_field(faststatus::core::make_status(StatusDomain::Codec, code, aux), field);
        }

        // Looks up 'key'; a missing key or JSON null reads as absent.
        const nlohmann::json* json_field(const nlohmann::json& obj, const char* key) noexcept {
            const auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) {
                return nullptr;
            }
            return &*it;
        }

        void normalize_legacy_zero(Timestamp* t) noexcept {
            if (t->seconds == kLegacyZeroSinceSeconds && t->nanos == 0) {
                *t = Timestamp{};
            }
        }

        Status occupancy_from_json(const nlohmann::json& v, Occupancy* out) noexcept {
            if (v.is_string()) {
                const std::string& s = v.get_ref<const std::string&>();
                return occupancy_from_text(s.data(), static_cast<u32>(s.size()), out);
            }
            // Older records carried the raw number.
            if (v.is_number_unsigned()) {
                const auto n = v.get<nlohmann::json::number_unsigned_t>();
                if (n > faststatus::core::kOccupancyMax) {
                    return faststatus::core::make_status(StatusDomain::Codec, StatusCode::Range);
                }
                *out = static_cast<Occupancy>(n);
                return faststatus::core::ok_status();
            }
            if (v.is_number_integer()) {
                return faststatus::core::make_status(StatusDomain::Codec, StatusCode::Range);
            }
            return faststatus::core::make_status(StatusDomain::Codec, StatusCode::Format);
        }
    } // namespace

    bool resource_equal(const Resource& a, const Resource& b) noexcept {
        return a.id == b.id &&
               a.status == b.status &&
               faststatus::core::instant_equal(a.since, b.since) &&
               a.friendly_name == b.friendly_name;
    }

    Status resource_new(Resource* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        Resource r{};
        const Status s = id_generate(&r.id);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Id);
        }
        *out = std::move(r);
        return faststatus::core::ok_status();
    }

    bool resource_persistable(const Resource& r) noexcept {
        return !id_is_zero(r.id) && !faststatus::core::timestamp_is_zero(r.since);
    }

    // ========================================================================
    // Text
    // ========================================================================

    Status resource_to_text(const Resource& r, std::string* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }

        std::string status;
        Status s = occupancy_to_text(r.status, &status);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Occupancy);
        }

        std::string since;
        s = faststatus::core::timestamp_to_text(r.since, &since);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Since);
        }

        std::string txt;
        txt.reserve(kIdTextBytes + status.size() + since.size() + r.friendly_name.size() + 3);
        txt += id_to_text(r.id);
        txt += ' ';
        txt += status;
        txt += ' ';
        txt += since;
        if (!r.friendly_name.empty()) {
            txt += ' ';
            txt += r.friendly_name;
        }

        *out = std::move(txt);
        return faststatus::core::ok_status();
    }

    Status resource_from_text(const char* txt, u32 len, Resource* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        if (txt == nullptr) {
            return codec_error(StatusCode::Format, StatusField::Record);
        }

        // Token boundaries: id [0, sp[0]), status (sp[0], sp[1]), since (sp[1], sp[2] or len).
        u32 sp[3] = {len, len, len};
        u32 found = 0;
        for (u32 i = 0; i < len && found < 3; ++i) {
            if (txt[i] == ' ') {
                sp[found++] = i;
            }
        }
        if (found < 2) {
            return codec_error(StatusCode::Format, StatusField::Record);
        }

        Resource r{};
        Status s = id_from_text(txt, sp[0], &r.id);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Id);
        }

        s = occupancy_from_text(txt + sp[0] + 1, sp[1] - sp[0] - 1, &r.status);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Occupancy);
        }

        s = faststatus::core::timestamp_from_text(txt + sp[1] + 1, sp[2] - sp[1] - 1, &r.since);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Since);
        }
        normalize_legacy_zero(&r.since);

        // Everything after the third space, spaces included.
        if (found == 3) {
            r.friendly_name.assign(txt + sp[2] + 1, len - sp[2] - 1);
        }

        *out = std::move(r);
        return faststatus::core::ok_status();
    }

    std::string resource_to_string(const Resource& r) {
        std::string txt;
        if (!faststatus::core::is_ok(resource_to_text(r, &txt))) {
            return std::string();
        }
        return txt;
    }

    // ========================================================================
    // JSON
    // ========================================================================

    Status resource_to_json(const Resource& r, std::string* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }

        std::string status;
        Status s = occupancy_to_text(r.status, &status);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Occupancy);
        }

        std::string since;
        s = faststatus::core::timestamp_to_text(r.since, &since);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Since);
        }

        try {
            nlohmann::ordered_json j;
            j["id"] = id_to_text(r.id);
            j["status"] = status;
            j["since"] = since;
            j["friendlyName"] = r.friendly_name;
            *out = j.dump();
        } catch (const nlohmann::json::exception&) {
            // dump() rejects names that are not valid UTF-8.
            return codec_error(StatusCode::Format, StatusField::FriendlyName);
        }
        return faststatus::core::ok_status();
    }

    Status resource_from_json(const char* txt, u32 len, Resource* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        if (txt == nullptr) {
            return codec_error(StatusCode::Format, StatusField::Record);
        }

        const nlohmann::json j = nlohmann::json::parse(txt, txt + len, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return codec_error(StatusCode::Format, StatusField::Record);
        }

        Resource r{};
        Status s = faststatus::core::ok_status();

        if (const nlohmann::json* v = json_field(j, "id")) {
            if (!v->is_string()) {
                return codec_error(StatusCode::Format, StatusField::Id);
            }
            const std::string& id = v->get_ref<const std::string&>();
            s = id_from_text(id.data(), static_cast<u32>(id.size()), &r.id);
            if (!faststatus::core::is_ok(s)) {
                return faststatus::core::with_field(s, StatusField::Id);
            }
        }

        if (const nlohmann::json* v = json_field(j, "status")) {
            s = occupancy_from_json(*v, &r.status);
            if (!faststatus::core::is_ok(s)) {
                return faststatus::core::with_field(s, StatusField::Occupancy);
            }
        }

        if (const nlohmann::json* v = json_field(j, "since")) {
            if (!v->is_string()) {
                return codec_error(StatusCode::Format, StatusField::Since);
            }
            const std::string& since = v->get_ref<const std::string&>();
            s = faststatus::core::timestamp_from_text(since.data(), static_cast<u32>(since.size()), &r.since);
            if (!faststatus::core::is_ok(s)) {
                return faststatus::core::with_field(s, StatusField::Since);
            }
            normalize_legacy_zero(&r.since);
        }

        if (const nlohmann::json* v = json_field(j, "friendlyName")) {
            if (!v->is_string()) {
                return codec_error(StatusCode::Format, StatusField::FriendlyName);
            }
            r.friendly_name = v->get_ref<const std::string&>();
        }

        *out = std::move(r);
        return faststatus::core::ok_status();
    }

    // ========================================================================
    // Binary
    // ========================================================================

    Status resource_to_binary(const Resource& r, std::vector<u8>* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        if (!occupancy_valid(r.status)) {
            return codec_error(StatusCode::Range, StatusField::Occupancy, static_cast<u8>(r.status));
        }
        if (!faststatus::core::timestamp_valid(r.since)) {
            return codec_error(StatusCode::Range, StatusField::Since);
        }
        if (r.friendly_name.size() > kFriendlyNameMaxBytes) {
            return codec_error(StatusCode::Length, StatusField::FriendlyName);
        }

        const u32 name_len = static_cast<u32>(r.friendly_name.size());
        std::vector<u8> buf(kResourceBinaryFixedBytes + name_len);
        u8* p = buf.data();

        p[0] = kResourceMagic[0];
        p[1] = kResourceMagic[1];
        p[2] = kResourceBinaryVersion;
        p[3] = 0; // reserved
        std::memcpy(p + 4, r.id.b.data(), kIdBinaryBytes);
        p[20] = occupancy_to_binary(r.status);
        if (faststatus::core::timestamp_write_binary(r.since, {p + 21, faststatus::core::kTimestampBinaryBytes}) == 0) {
            return codec_error(StatusCode::Unknown, StatusField::Since);
        }
        put_u16_be(p + 35, static_cast<u16>(name_len));
        if (name_len > 0) {
            std::memcpy(p + kResourceBinaryFixedBytes, r.friendly_name.data(), name_len);
        }

        *out = std::move(buf);
        return faststatus::core::ok_status();
    }

    Status resource_from_binary(faststatus::core::BufferView in, Resource* out) noexcept {
        if (out == nullptr) {
            return faststatus::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        if (in.data == nullptr || in.len < kResourceBinaryFixedBytes) {
            return codec_error(StatusCode::Format, StatusField::Header, in.len);
        }

        const u8* p = in.data;
        if (p[0] != kResourceMagic[0] || p[1] != kResourceMagic[1]) {
            return codec_error(StatusCode::Format, StatusField::Header);
        }
        if (p[2] == 0 || p[2] > kResourceBinaryVersion) {
            return codec_error(StatusCode::Format, StatusField::Header, p[2]);
        }
        if (p[3] != 0) {
            return codec_error(StatusCode::Format, StatusField::Header);
        }

        const u16 name_len = get_u16_be(p + 35);
        if (in.len != kResourceBinaryFixedBytes + name_len) {
            return codec_error(StatusCode::Format, StatusField::Record, in.len);
        }

        Resource r{};
        Status s = id_from_binary({p + 4, kIdBinaryBytes}, &r.id);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Id);
        }

        s = occupancy_from_binary({p + 20, 1}, &r.status);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Occupancy);
        }

        s = faststatus::core::timestamp_read_binary({p + 21, faststatus::core::kTimestampBinaryBytes}, &r.since);
        if (!faststatus::core::is_ok(s)) {
            return faststatus::core::with_field(s, StatusField::Since);
        }

        r.friendly_name.assign(reinterpret_cast<const char*>(p + kResourceBinaryFixedBytes), name_len);

        *out = std::move(r);
        return faststatus::core::ok_status();
    }

} // namespace faststatus::resource
