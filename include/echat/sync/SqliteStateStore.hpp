#ifndef ECHAT_SYNC_SQLITE_STATE_STORE_HPP
#define ECHAT_SYNC_SQLITE_STATE_STORE_HPP

#include <mutex>
#include <string>

#include <sqlite3.h>

#include <echat/sync/StateStore.hpp>

namespace echat::sync
{
    /**
     * @brief IStateStore on a single SQLite file (WAL mode).
     *
     * Tables:
     *  - meta(key, value)                              schema_version
     *  - credentials(account, backend, payload_json)
     *  - sync_cursors(account, backend, token, updated_at)
     *  - secrets(account, key, payload_json)
     *
     * Pass ":memory:" for a throw-away store.
     */
    class SqliteStateStore : public IStateStore
    {
    public:
        explicit SqliteStateStore(const std::string &db_path);
        ~SqliteStateStore() override;

        SqliteStateStore(const SqliteStateStore &) = delete;
        SqliteStateStore &operator=(const SqliteStateStore &) = delete;

        void save_credentials(const AccountId &account, const Credentials &creds) override;
        std::optional<Credentials> load_credentials(const AccountId &account) override;
        void remove_credentials(const AccountId &account) override;
        std::vector<AccountId> list_accounts() override;

        void save_cursor(const SyncCursor &cursor) override;
        std::optional<SyncCursor> load_cursor(const AccountId &account, BackendKind backend) override;

        void save_secret(const AccountId &account, const std::string &key, const nlohmann::json &value) override;
        std::optional<nlohmann::json> load_secret(const AccountId &account, const std::string &key) override;
        std::vector<std::pair<std::string, nlohmann::json>> list_secrets(
            const AccountId &account,
            const std::string &prefix) override;

        void forget_account(const AccountId &account) override;

        /// Schema version read from the meta table.
        int schema_version();

    private:
        void init_schema();
        void exec(const char *sql, const char *stage);

    private:
        sqlite3 *db_{nullptr};
        std::mutex mutex_;
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_SQLITE_STATE_STORE_HPP
