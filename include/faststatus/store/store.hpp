#pragma once

#include "faststatus/core/errors.hpp"
#include "faststatus/core/types.hpp"
#include "faststatus/db/kv.hpp"
#include "faststatus/resource/resource.hpp"

namespace faststatus::store {

// Bucket holding one binary-encoded Resource per 16-byte id key.
inline constexpr const char* kBucketName = "faststatus/store";

// Persists the most recent version of each Resource, by id.
//
// The read-compare-write in save() runs inside a single engine update
// transaction; the store keeps no locks or versions of its own. Safe to share
// between threads as long as the engine is.
class Store {
public:
    explicit Store(faststatus::db::KvEngine* engine) noexcept : engine_(engine) {}

    // Persists 'r' unless a strictly newer Since is already stored for its id.
    // - ZeroValue for the all-zero id
    // - Conflict when the stored record is newer (equal Since overwrites)
    // - Invalid when 'r' cannot be encoded (bad status or Since, long name)
    // - anything else (undecodable stored record, engine failure) is a generic
    //   Store-domain error whose cause keeps the underlying kind
    [[nodiscard]] faststatus::core::Status save(const faststatus::resource::Resource& r) noexcept;

    // Latest stored state for 'id'. An unknown id yields the zero Resource and ok.
    [[nodiscard]] faststatus::core::Status get(const faststatus::core::ResourceId& id,
                                               faststatus::resource::Resource* out) noexcept;

private:
    faststatus::db::KvEngine* engine_{nullptr};
};

} // namespace faststatus::store
