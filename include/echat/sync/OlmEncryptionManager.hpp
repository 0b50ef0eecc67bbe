#ifndef ECHAT_SYNC_OLM_ENCRYPTION_MANAGER_HPP
#define ECHAT_SYNC_OLM_ENCRYPTION_MANAGER_HPP

/**
 * @file OlmEncryptionManager.hpp
 * @brief Matrix end-to-end encryption on libolm.
 *
 * @details
 * Holds the Olm device account of one Matrix login, the Olm sessions other
 * devices opened with it, and the Megolm inbound group sessions they shared.
 * All of it is pickled with the account passphrase into the state store:
 *
 *   olm.account                      { pickle, user, device, uploaded }
 *   olm.session.<senderKey>.<id>     { pickle }
 *   megolm.<room>.<sessionId>        { pickle, sender_key }
 *   verified.<user>.<device>         { verified }
 *
 * so room keys survive restarts. Megolm sessions are loaded lazily on the
 * first event that needs them.
 *
 * Every public member is thread-safe.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <echat/sync/EncryptionProvider.hpp>
#include <echat/sync/StateStore.hpp>

namespace echat::sync
{
    inline constexpr const char *kOlmAlgorithm = "m.olm.v1.curve25519-aes-sha2";
    inline constexpr const char *kMegolmAlgorithm = "m.megolm.v1.aes-sha2";

    class OlmEncryptionManager : public IEncryptionProvider
    {
    public:
        OlmEncryptionManager(AccountId account, IStateStore &state, std::string pickleKey);
        ~OlmEncryptionManager() override;

        OlmEncryptionManager(const OlmEncryptionManager &) = delete;
        OlmEncryptionManager &operator=(const OlmEncryptionManager &) = delete;

        /**
         * @brief Restore the pickled device account of @p deviceId or create a new one.
         *
         * A stored account that belongs to another device is replaced: a new
         * login means a new device and new identity keys.
         */
        void load_or_create(const std::string &userId, const std::string &deviceId);

        [[nodiscard]] bool ready() const;

        /// Own curve25519 identity key.
        [[nodiscard]] std::string identity_key() const;

        /// Signed `device_keys` object for /keys/upload.
        [[nodiscard]] nlohmann::json device_keys() const;

        /// True once device_keys() was accepted by the homeserver.
        [[nodiscard]] bool device_keys_uploaded() const;

        /**
         * @brief Generate one-time keys so the server holds half the maximum.
         * @param onServer signed_curve25519 count reported by the homeserver.
         */
        void replenish_one_time_keys(std::size_t onServer);

        /// Unpublished one-time keys as a signed `one_time_keys` object (may be empty).
        [[nodiscard]] nlohmann::json one_time_keys() const;

        /// Called after a successful upload of device_keys() and one_time_keys().
        void mark_keys_published(bool deviceKeysIncluded);

        // IEncryptionProvider
        DecryptResult decrypt(const ConversationId &conversation,
                              const std::string &eventNative,
                              const EncryptedPayload &payload) override;

        std::vector<std::string> handle_to_device(const nlohmann::json &raw) override;

        bool import_room_key(const std::string &room,
                             const std::string &sessionId,
                             const std::string &sessionKey) override;

        void verify_device(const ParticipantId &participant, const std::string &deviceId) override;
        bool device_verified(const ParticipantId &participant, const std::string &deviceId) const override;

        void rotate() override;

    private:
        struct Account;
        struct Session;
        struct GroupSession;

        void require_ready_locked() const;
        void persist_account_locked();
        void persist_session_locked(const std::string &senderKey, const Session &session);
        nlohmann::json sign_locked(const nlohmann::json &object) const;

        /// Decrypt one Olm message with an existing or a new inbound session.
        std::optional<std::string> olm_decrypt_locked(const std::string &senderKey, int type, const std::string &body);

        /// Store a Megolm session; returns its id, or nullopt when the key is unusable.
        std::optional<std::string> add_group_session_locked(const std::string &room,
                                                            const std::string &senderKey,
                                                            const std::string &key,
                                                            bool exported,
                                                            const std::string &expectedId);

        GroupSession *group_session_locked(const std::string &room, const std::string &sessionId);

    private:
        AccountId account_;
        IStateStore &state_;
        std::string pickleKey_;

        mutable std::mutex mutex_;
        std::unique_ptr<Account> olm_;
        std::string userId_;
        std::string deviceId_;
        bool deviceKeysUploaded_{false};

        std::multimap<std::string, std::unique_ptr<Session>> sessions_; ///< keyed by sender curve25519 key
        std::map<std::pair<std::string, std::string>, std::unique_ptr<GroupSession>> groups_;

        /// (session id, message index) -> event id, for replay detection.
        std::map<std::pair<std::string, std::uint32_t>, std::string> indices_;

        std::set<std::pair<std::string, std::string>> verified_;
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_OLM_ENCRYPTION_MANAGER_HPP
