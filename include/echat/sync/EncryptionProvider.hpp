#ifndef ECHAT_SYNC_ENCRYPTION_PROVIDER_HPP
#define ECHAT_SYNC_ENCRYPTION_PROVIDER_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <echat/sync/types.hpp>

namespace echat::sync
{
    struct DecryptResult
    {
        bool ok = false;
        std::string plaintext; ///< decrypted event JSON when ok
        std::string error;     ///< failure reason otherwise
        std::string sessionId;

        static DecryptResult success(std::string plaintext, std::string sessionId)
        {
            return {true, std::move(plaintext), {}, std::move(sessionId)};
        }
        static DecryptResult failure(std::string error, std::string sessionId)
        {
            return {false, {}, std::move(error), std::move(sessionId)};
        }
    };

    /**
     * @brief End-to-end encryption capability of an adapter.
     *
     * Decryption failures are results, never exceptions: an undecryptable
     * message is stored with its ciphertext and retried when a key for its
     * session arrives.
     */
    class IEncryptionProvider
    {
    public:
        virtual ~IEncryptionProvider() = default;

        /// Decrypt one room event. @p eventNative is used for replay detection.
        virtual DecryptResult decrypt(const ConversationId &conversation,
                                      const std::string &eventNative,
                                      const EncryptedPayload &payload) = 0;

        /// Process raw to-device key material; returns newly usable session ids.
        virtual std::vector<std::string> handle_to_device(const nlohmann::json &raw) = 0;

        /// Import an exported session key for @p room. False if the key is unusable.
        virtual bool import_room_key(const std::string &room,
                                     const std::string &sessionId,
                                     const std::string &sessionKey) = 0;

        virtual void verify_device(const ParticipantId &participant, const std::string &deviceId) = 0;
        virtual bool device_verified(const ParticipantId &participant, const std::string &deviceId) const = 0;

        /// Generate fresh one-time keys; they are published on the next key upload.
        virtual void rotate() = 0;
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_ENCRYPTION_PROVIDER_HPP
