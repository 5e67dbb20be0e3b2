#include "faststatus/store/store.hpp"

#include <utility>
#include <vector>

#include "faststatus/core/log.hpp"

namespace faststatus::store {

using namespace faststatus::core;
using faststatus::resource::Resource;

namespace {
    [[nodiscard]] BufferView id_key(const ResourceId& id) noexcept {
        return BufferView{id.b.data(), static_cast<u32>(id.b.size())};
    }

    // Engine failures surface as generic store errors; only the store itself
    // produces Conflict or ZeroValue.
    [[nodiscard]] Status store_error(Status inner) noexcept {
        if (inner.domain == StatusDomain::Store) {
            return inner;
        }
        return wrap_status(StatusDomain::Store, StatusCode::Unknown, inner);
    }
}

Status Store::save(const Resource& r) noexcept {
    if (!engine_) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (faststatus::resource::id_is_zero(r.id)) {
        return make_status(StatusDomain::Store, StatusCode::ZeroValue);
    }

    const Status s = engine_->update([&](faststatus::db::KvTxn& txn) -> Status {
        std::vector<u8> latest;
        bool found = false;
        Status ts = txn.get(kBucketName, id_key(r.id), &latest, &found);
        if (!is_ok(ts)) {
            return ts;
        }

        if (found && !latest.empty()) {
            Resource stored{};
            ts = faststatus::resource::resource_from_binary({latest.data(), static_cast<u32>(latest.size())}, &stored);
            if (!is_ok(ts)) {
                return wrap_status(StatusDomain::Store, StatusCode::Corrupt, ts);
            }
            if (instant_after(stored.since, r.since)) {
                return make_status(StatusDomain::Store, StatusCode::Conflict);
            }
        }

        std::vector<u8> payload;
        ts = faststatus::resource::resource_to_binary(r, &payload);
        if (!is_ok(ts)) {
            return wrap_status(StatusDomain::Store, StatusCode::Invalid, ts);
        }
        return txn.put(kBucketName, id_key(r.id), {payload.data(), static_cast<u32>(payload.size())});
    });

    if (is_conflict_error(s)) {
        log_write(LogLevel::Debug, "store: rejected stale save for %s",
                  faststatus::resource::id_to_text(r.id).c_str());
        return s;
    }
    if (!is_ok(s)) {
        const Status out = store_error(s);
        log_status(LogLevel::Error, "store: save", out);
        return out;
    }
    return ok_status();
}

Status Store::get(const ResourceId& id, Resource* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (!engine_) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (faststatus::resource::id_is_zero(id)) {
        return make_status(StatusDomain::Store, StatusCode::ZeroValue);
    }

    Resource r{};
    const Status s = engine_->view([&](faststatus::db::KvTxn& txn) -> Status {
        std::vector<u8> raw;
        bool found = false;
        Status ts = txn.get(kBucketName, id_key(id), &raw, &found);
        if (!is_ok(ts)) {
            return ts;
        }
        if (!found || raw.empty()) {
            return ok_status();
        }
        ts = faststatus::resource::resource_from_binary({raw.data(), static_cast<u32>(raw.size())}, &r);
        if (!is_ok(ts)) {
            return wrap_status(StatusDomain::Store, StatusCode::Corrupt, ts);
        }
        return ok_status();
    });

    if (!is_ok(s)) {
        const Status err = store_error(s);
        log_status(LogLevel::Error, "store: get", err);
        return err;
    }

    *out = std::move(r);
    return ok_status();
}

} // namespace faststatus::store
