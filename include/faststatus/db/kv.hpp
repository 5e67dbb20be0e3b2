#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "faststatus/core/errors.hpp"
#include "faststatus/core/types.hpp"

struct sqlite3;

namespace faststatus::db {
    using u8 = faststatus::core::u8;
    using u32 = faststatus::core::u32;

    struct KvConfig {
        const char* path{nullptr};   // SQLite database path (nullptr = in-memory)
        u32 busy_timeout_ms{1000};   // Wait bound for locks held by other connections
    };

    // Handle passed to transaction bodies. Only valid inside KvEngine::update/view.
    class KvTxn {
    public:
        KvTxn(const KvTxn&) = delete;
        KvTxn& operator=(const KvTxn&) = delete;

        // found=false (and value cleared) when the key is absent.
        [[nodiscard]] faststatus::core::Status get(const char* bucket,
                                                   faststatus::core::BufferView key,
                                                   std::vector<u8>* value,
                                                   bool* found) noexcept;

        // Inserts or replaces. Invalid inside a read-only transaction.
        [[nodiscard]] faststatus::core::Status put(const char* bucket,
                                                   faststatus::core::BufferView key,
                                                   faststatus::core::BufferView value) noexcept;

        [[nodiscard]] bool writable() const noexcept { return writable_; }

    private:
        friend class KvEngine;
        KvTxn(sqlite3* db, bool writable) noexcept : db_(db), writable_(writable) {}

        sqlite3* db_{nullptr};
        bool writable_{false};
    };

    // Transaction body. A non-ok return rolls the transaction back and is
    // returned from update()/view() unchanged.
    using KvTxnFn = std::function<faststatus::core::Status(KvTxn&)>;

    // Bucketed byte-string store over a single SQLite connection.
    // Transactions on one engine are serialized; update() additionally takes
    // SQLite's write lock up front (BEGIN IMMEDIATE) so other connections to
    // the same file are serialized as well.
    class KvEngine {
    public:
        KvEngine() noexcept = default;
        ~KvEngine() noexcept;

        KvEngine(const KvEngine&) = delete;
        KvEngine& operator=(const KvEngine&) = delete;

        // Journal mode comes from FASTSTATUS_DB_JOURNAL_MODE (default WAL).
        [[nodiscard]] faststatus::core::Status open(const KvConfig& cfg) noexcept;
        [[nodiscard]] faststatus::core::Status close() noexcept;
        [[nodiscard]] bool is_open() noexcept;

        [[nodiscard]] faststatus::core::Status update(const KvTxnFn& fn) noexcept;
        [[nodiscard]] faststatus::core::Status view(const KvTxnFn& fn) noexcept;

    private:
        [[nodiscard]] faststatus::core::Status run(const char* begin_sql, bool writable, const KvTxnFn& fn) noexcept;

        sqlite3* db_{nullptr};
        std::mutex mutex_;
    };

} // namespace faststatus::db
