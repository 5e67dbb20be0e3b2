#include "faststatus/security/random.hpp"

#include <climits>

#if defined(FASTSTATUS_HAVE_LIBSODIUM)
#include <sodium.h>
#endif

#if defined(FASTSTATUS_HAVE_OPENSSL)
#include <openssl/rand.h>
#endif

namespace faststatus::security {
    namespace {
#if defined(FASTSTATUS_HAVE_LIBSODIUM)
        faststatus::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return faststatus::core::make_status(faststatus::core::StatusDomain::External, faststatus::core::StatusCode::Unavailable);
            }
            return faststatus::core::ok_status();
        }
#endif
    } // namespace

    faststatus::core::Status random_bytes(faststatus::core::BufferMut out) noexcept {
        if (out.len == 0) {
            return faststatus::core::ok_status();
        }
        if (out.data == nullptr) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Security, faststatus::core::StatusCode::Invalid);
        }

#if defined(FASTSTATUS_HAVE_LIBSODIUM)
        const faststatus::core::Status init = ensure_sodium();
        if (!faststatus::core::is_ok(init)) {
            return faststatus::core::wrap_status(faststatus::core::StatusDomain::Security, faststatus::core::StatusCode::Io, init);
        }
        randombytes_buf(out.data, out.len);
        return faststatus::core::ok_status();
#elif defined(FASTSTATUS_HAVE_OPENSSL)
        if (out.len > static_cast<u32>(INT_MAX)) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Security, faststatus::core::StatusCode::Invalid);
        }
        if (RAND_bytes(out.data, static_cast<int>(out.len)) != 1) {
            return faststatus::core::make_status(faststatus::core::StatusDomain::Security, faststatus::core::StatusCode::Io);
        }
        return faststatus::core::ok_status();
#else
        return faststatus::core::make_status(faststatus::core::StatusDomain::Security, faststatus::core::StatusCode::Unavailable);
#endif
    }

} // namespace faststatus::security
