#ifndef ECHAT_SYNC_STATE_STORE_HPP
#define ECHAT_SYNC_STATE_STORE_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <echat/sync/config.hpp>
#include <echat/sync/types.hpp>

namespace echat::sync
{
    /// Version written into every persisted JSON payload and the meta table.
    inline constexpr int kStateSchemaVersion = 1;

    /**
     * @brief Durable per-account state: credentials, sync cursors and crypto secrets.
     *
     * Implementations must be safe to call from several threads. Failures are
     * reported with std::runtime_error.
     */
    class IStateStore
    {
    public:
        virtual ~IStateStore() = default;

        virtual void save_credentials(const AccountId &account, const Credentials &creds) = 0;
        virtual std::optional<Credentials> load_credentials(const AccountId &account) = 0;
        virtual void remove_credentials(const AccountId &account) = 0;

        /// Accounts that have stored credentials, in insertion order.
        virtual std::vector<AccountId> list_accounts() = 0;

        /// Upsert; only called once a batch has been fully applied.
        virtual void save_cursor(const SyncCursor &cursor) = 0;
        virtual std::optional<SyncCursor> load_cursor(const AccountId &account, BackendKind backend) = 0;

        /// Opaque crypto state (olm account pickle, megolm session pickles...).
        virtual void save_secret(const AccountId &account, const std::string &key, const nlohmann::json &value) = 0;
        virtual std::optional<nlohmann::json> load_secret(const AccountId &account, const std::string &key) = 0;

        /// All secrets of @p account whose key starts with @p prefix.
        virtual std::vector<std::pair<std::string, nlohmann::json>> list_secrets(
            const AccountId &account,
            const std::string &prefix) = 0;

        /// Drop every row belonging to @p account (logout).
        virtual void forget_account(const AccountId &account) = 0;
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_STATE_STORE_HPP
