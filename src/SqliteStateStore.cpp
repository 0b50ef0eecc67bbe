#include <echat/sync/SqliteStateStore.hpp>

#include <memory>
#include <stdexcept>

#include <vix/utils/Logger.hpp>

namespace echat::sync
{
    namespace
    {
        using Logger = vix::utils::Logger;
        using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

        void sqlite_check(int rc, sqlite3 *db, const char *stage)
        {
            if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE)
            {
                std::string msg = "[SqliteStateStore] ";
                msg += stage;
                msg += " error: ";
                msg += sqlite3_errmsg(db);
                throw std::runtime_error(msg);
            }
        }

        StmtPtr prepare(sqlite3 *db, const char *sql, const char *stage)
        {
            sqlite3_stmt *raw = nullptr;
            int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
            StmtPtr stmt{raw, &sqlite3_finalize};
            sqlite_check(rc, db, stage);
            return stmt;
        }

        void bind_text(sqlite3 *db, sqlite3_stmt *stmt, int idx, const std::string &value, const char *stage)
        {
            int rc = sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
            sqlite_check(rc, db, stage);
        }

        std::string column_text(sqlite3_stmt *stmt, int col)
        {
            const auto *txt = sqlite3_column_text(stmt, col);
            if (!txt)
                return {};
            return std::string(reinterpret_cast<const char *>(txt),
                               static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
        }

        /// Parse a stored payload. Unknown fields are kept, a corrupt row is
        /// reported and treated as absent.
        std::optional<nlohmann::json> parse_payload(const std::string &text, const char *table)
        {
            auto j = nlohmann::json::parse(text, nullptr, false);
            if (j.is_discarded() || !j.is_object())
            {
                Logger::getInstance().log(Logger::Level::WARN,
                                          "[sync][state] ignoring unreadable row in {}", table);
                return std::nullopt;
            }

            const int version = j.value("schema_version", 0);
            if (version > kStateSchemaVersion)
            {
                Logger::getInstance().log(Logger::Level::WARN,
                                          "[sync][state] {} row has newer schema_version {} (known {})",
                                          table, version, kStateSchemaVersion);
            }
            return j;
        }

        std::string escape_like(const std::string &prefix)
        {
            std::string out;
            out.reserve(prefix.size() + 1);
            for (char c : prefix)
            {
                if (c == '%' || c == '_' || c == '\\')
                    out += '\\';
                out += c;
            }
            out += '%';
            return out;
        }
    } // namespace

    SqliteStateStore::SqliteStateStore(const std::string &db_path)
    {
        int rc = sqlite3_open(db_path.c_str(), &db_);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteStateStore] Failed to open DB: ";
            msg += sqlite3_errstr(rc);
            if (db_)
            {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw std::runtime_error(msg);
        }

        exec("PRAGMA journal_mode=WAL;", "set WAL");
        init_schema();

        Logger::getInstance().log(Logger::Level::DEBUG, "[sync][state] opened {}", db_path);
    }

    SqliteStateStore::~SqliteStateStore()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    void SqliteStateStore::exec(const char *sql, const char *stage)
    {
        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteStateStore] ";
            msg += stage;
            msg += " error: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            else
            {
                msg += sqlite3_errstr(rc);
            }
            throw std::runtime_error(msg);
        }
    }

    void SqliteStateStore::init_schema()
    {
        exec("CREATE TABLE IF NOT EXISTS meta ("
             "  key   TEXT PRIMARY KEY,"
             "  value TEXT NOT NULL"
             ");"
             "CREATE TABLE IF NOT EXISTS credentials ("
             "  account      TEXT PRIMARY KEY,"
             "  backend      TEXT NOT NULL,"
             "  payload_json TEXT NOT NULL"
             ");"
             "CREATE TABLE IF NOT EXISTS sync_cursors ("
             "  account    TEXT NOT NULL,"
             "  backend    TEXT NOT NULL,"
             "  token      TEXT NOT NULL,"
             "  updated_at INTEGER NOT NULL,"
             "  PRIMARY KEY (account, backend)"
             ");"
             "CREATE TABLE IF NOT EXISTS secrets ("
             "  account      TEXT NOT NULL,"
             "  key          TEXT NOT NULL,"
             "  payload_json TEXT NOT NULL,"
             "  PRIMARY KEY (account, key)"
             ");",
             "create tables");

        auto stmt = prepare(db_, "INSERT OR IGNORE INTO meta (key, value) VALUES ('schema_version', ?);",
                            "prepare meta");
        bind_text(db_, stmt.get(), 1, std::to_string(kStateSchemaVersion), "bind schema_version");
        sqlite_check(sqlite3_step(stmt.get()), db_, "step meta");
    }

    int SqliteStateStore::schema_version()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto stmt = prepare(db_, "SELECT value FROM meta WHERE key = 'schema_version';", "prepare schema_version");
        int rc = sqlite3_step(stmt.get());
        sqlite_check(rc, db_, "step schema_version");
        if (rc != SQLITE_ROW)
            return 0;
        return std::stoi(column_text(stmt.get(), 0));
    }

    // ───────────────────────── credentials ─────────────────────────

    void SqliteStateStore::save_credentials(const AccountId &account, const Credentials &creds)
    {
        nlohmann::json payload{
            {"schema_version", kStateSchemaVersion},
            {"backend", to_string(creds.backend)},
            {"params", creds.params},
            {"session", creds.session},
        };
        const std::string text = payload.dump();

        std::lock_guard<std::mutex> lock(mutex_);

        auto stmt = prepare(db_,
                            "INSERT INTO credentials (account, backend, payload_json) VALUES (?, ?, ?) "
                            "ON CONFLICT(account) DO UPDATE SET backend = excluded.backend, "
                            "payload_json = excluded.payload_json;",
                            "prepare save_credentials");
        bind_text(db_, stmt.get(), 1, account, "bind account");
        bind_text(db_, stmt.get(), 2, to_string(creds.backend), "bind backend");
        bind_text(db_, stmt.get(), 3, text, "bind payload");
        sqlite_check(sqlite3_step(stmt.get()), db_, "step save_credentials");
    }

    std::optional<Credentials> SqliteStateStore::load_credentials(const AccountId &account)
    {
        std::string text;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto stmt = prepare(db_, "SELECT payload_json FROM credentials WHERE account = ?;",
                                "prepare load_credentials");
            bind_text(db_, stmt.get(), 1, account, "bind account");

            int rc = sqlite3_step(stmt.get());
            sqlite_check(rc, db_, "step load_credentials");
            if (rc != SQLITE_ROW)
                return std::nullopt;
            text = column_text(stmt.get(), 0);
        }

        auto j = parse_payload(text, "credentials");
        if (!j)
            return std::nullopt;

        auto backend = backend_from_string(j->value("backend", std::string{}));
        if (!backend)
            return std::nullopt;

        Credentials creds;
        creds.backend = *backend;
        creds.params = j->value("params", nlohmann::json::object());
        creds.session = j->value("session", nlohmann::json::object());
        return creds;
    }

    void SqliteStateStore::remove_credentials(const AccountId &account)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto stmt = prepare(db_, "DELETE FROM credentials WHERE account = ?;", "prepare remove_credentials");
        bind_text(db_, stmt.get(), 1, account, "bind account");
        sqlite_check(sqlite3_step(stmt.get()), db_, "step remove_credentials");
    }

    std::vector<AccountId> SqliteStateStore::list_accounts()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<AccountId> out;
        auto stmt = prepare(db_, "SELECT account FROM credentials ORDER BY rowid ASC;", "prepare list_accounts");

        int rc = SQLITE_OK;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            out.push_back(column_text(stmt.get(), 0));
        }
        sqlite_check(rc, db_, "step list_accounts");
        return out;
    }

    // ───────────────────────── cursors ─────────────────────────

    void SqliteStateStore::save_cursor(const SyncCursor &cursor)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto stmt = prepare(db_,
                            "INSERT INTO sync_cursors (account, backend, token, updated_at) VALUES (?, ?, ?, ?) "
                            "ON CONFLICT(account, backend) DO UPDATE SET token = excluded.token, "
                            "updated_at = excluded.updated_at;",
                            "prepare save_cursor");
        bind_text(db_, stmt.get(), 1, cursor.account, "bind account");
        bind_text(db_, stmt.get(), 2, to_string(cursor.backend), "bind backend");
        bind_text(db_, stmt.get(), 3, cursor.token, "bind token");
        sqlite_check(sqlite3_bind_int64(stmt.get(), 4, now_ms()), db_, "bind updated_at");
        sqlite_check(sqlite3_step(stmt.get()), db_, "step save_cursor");
    }

    std::optional<SyncCursor> SqliteStateStore::load_cursor(const AccountId &account, BackendKind backend)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto stmt = prepare(db_, "SELECT token FROM sync_cursors WHERE account = ? AND backend = ?;",
                            "prepare load_cursor");
        bind_text(db_, stmt.get(), 1, account, "bind account");
        bind_text(db_, stmt.get(), 2, to_string(backend), "bind backend");

        int rc = sqlite3_step(stmt.get());
        sqlite_check(rc, db_, "step load_cursor");
        if (rc != SQLITE_ROW)
            return std::nullopt;

        return SyncCursor{account, backend, column_text(stmt.get(), 0)};
    }

    // ───────────────────────── secrets ─────────────────────────

    void SqliteStateStore::save_secret(const AccountId &account, const std::string &key, const nlohmann::json &value)
    {
        nlohmann::json payload{
            {"schema_version", kStateSchemaVersion},
            {"value", value},
        };
        const std::string text = payload.dump();

        std::lock_guard<std::mutex> lock(mutex_);

        auto stmt = prepare(db_,
                            "INSERT INTO secrets (account, key, payload_json) VALUES (?, ?, ?) "
                            "ON CONFLICT(account, key) DO UPDATE SET payload_json = excluded.payload_json;",
                            "prepare save_secret");
        bind_text(db_, stmt.get(), 1, account, "bind account");
        bind_text(db_, stmt.get(), 2, key, "bind key");
        bind_text(db_, stmt.get(), 3, text, "bind payload");
        sqlite_check(sqlite3_step(stmt.get()), db_, "step save_secret");
    }

    std::optional<nlohmann::json> SqliteStateStore::load_secret(const AccountId &account, const std::string &key)
    {
        std::string text;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto stmt = prepare(db_, "SELECT payload_json FROM secrets WHERE account = ? AND key = ?;",
                                "prepare load_secret");
            bind_text(db_, stmt.get(), 1, account, "bind account");
            bind_text(db_, stmt.get(), 2, key, "bind key");

            int rc = sqlite3_step(stmt.get());
            sqlite_check(rc, db_, "step load_secret");
            if (rc != SQLITE_ROW)
                return std::nullopt;
            text = column_text(stmt.get(), 0);
        }

        auto j = parse_payload(text, "secrets");
        if (!j || !j->contains("value"))
            return std::nullopt;
        return (*j)["value"];
    }

    std::vector<std::pair<std::string, nlohmann::json>> SqliteStateStore::list_secrets(
        const AccountId &account,
        const std::string &prefix)
    {
        std::vector<std::pair<std::string, std::string>> rows;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto stmt = prepare(db_,
                                "SELECT key, payload_json FROM secrets "
                                "WHERE account = ? AND key LIKE ? ESCAPE '\\' ORDER BY key ASC;",
                                "prepare list_secrets");
            bind_text(db_, stmt.get(), 1, account, "bind account");
            bind_text(db_, stmt.get(), 2, escape_like(prefix), "bind prefix");

            int rc = SQLITE_OK;
            while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
            {
                rows.emplace_back(column_text(stmt.get(), 0), column_text(stmt.get(), 1));
            }
            sqlite_check(rc, db_, "step list_secrets");
        }

        std::vector<std::pair<std::string, nlohmann::json>> out;
        out.reserve(rows.size());
        for (auto &[key, text] : rows)
        {
            // LIKE is case-insensitive for ASCII.
            if (key.compare(0, prefix.size(), prefix) != 0)
                continue;

            auto j = parse_payload(text, "secrets");
            if (j && j->contains("value"))
                out.emplace_back(std::move(key), (*j)["value"]);
        }
        return out;
    }

    void SqliteStateStore::forget_account(const AccountId &account)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (const char *sql : {"DELETE FROM credentials WHERE account = ?;",
                                "DELETE FROM sync_cursors WHERE account = ?;",
                                "DELETE FROM secrets WHERE account = ?;"})
        {
            auto stmt = prepare(db_, sql, "prepare forget_account");
            bind_text(db_, stmt.get(), 1, account, "bind account");
            sqlite_check(sqlite3_step(stmt.get()), db_, "step forget_account");
        }

        Logger::getInstance().log(Logger::Level::INFO, "[sync][state] forgot account {}", account);
    }

} // namespace echat::sync
