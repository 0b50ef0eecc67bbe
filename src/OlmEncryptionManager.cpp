#include <echat/sync/OlmEncryptionManager.hpp>

#include <stdexcept>

#include <olm/inbound_group_session.h>
#include <olm/olm.h>
#include <openssl/rand.h>

#include <vix/utils/Logger.hpp>

#include <echat/sync/errors.hpp>

#include "json_helpers.hpp"

namespace echat::sync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    using detail::json_member;
    using detail::json_string;

    namespace
    {
        const std::string kAccountKey = "olm.account";
        const std::string kSessionPrefix = "olm.session.";
        const std::string kGroupPrefix = "megolm.";
        const std::string kVerifiedPrefix = "verified.";

        std::runtime_error olm_failure(const char *stage, const char *what)
        {
            return std::runtime_error(std::string("[OlmEncryptionManager] ") + stage + ": " + (what ? what : "unknown"));
        }

        std::string random_bytes(std::size_t n)
        {
            std::string buf(n, '\0');
            if (n > 0 && RAND_bytes(reinterpret_cast<unsigned char *>(buf.data()), static_cast<int>(n)) != 1)
                throw std::runtime_error("[OlmEncryptionManager] RAND_bytes failed");
            return buf;
        }

        template <typename T, typename LengthFn, typename PickleFn, typename ErrorFn>
        std::string pickle_object(T *obj, const std::string &key, LengthFn length, PickleFn pickle, ErrorFn error)
        {
            std::string out(length(obj), '\0');
            if (pickle(obj, key.data(), key.size(), out.data(), out.size()) == olm_error())
                throw olm_failure("pickle", error(obj));
            return out;
        }

        template <typename T, typename UnpickleFn, typename ErrorFn>
        void unpickle_object(T *obj, const std::string &key, std::string pickled, UnpickleFn unpickle, ErrorFn error)
        {
            // libolm decodes in place
            if (unpickle(obj, key.data(), key.size(), pickled.data(), pickled.size()) == olm_error())
                throw olm_failure("unpickle", error(obj));
        }

    } // namespace

    // ───────────────────────── libolm objects ─────────────────────────

    struct OlmEncryptionManager::Account
    {
        std::unique_ptr<std::uint8_t[]> memory{new std::uint8_t[olm_account_size()]};
        OlmAccount *ptr = olm_account(memory.get());

        ~Account() { olm_clear_account(ptr); }

        const char *error() const { return olm_account_last_error(ptr); }
    };

    struct OlmEncryptionManager::Session
    {
        std::unique_ptr<std::uint8_t[]> memory{new std::uint8_t[olm_session_size()]};
        OlmSession *ptr = olm_session(memory.get());
        std::string id;

        ~Session() { olm_clear_session(ptr); }

        const char *error() const { return olm_session_last_error(ptr); }

        void load_id()
        {
            id.assign(olm_session_id_length(ptr), '\0');
            if (olm_session_id(ptr, id.data(), id.size()) == olm_error())
                throw olm_failure("session id", error());
        }

        std::optional<std::string> decrypt(int type, const std::string &body)
        {
            std::string buf = body;
            const std::size_t max = olm_decrypt_max_plaintext_length(ptr, static_cast<std::size_t>(type), buf.data(), buf.size());
            if (max == olm_error())
                return std::nullopt;

            buf = body;
            std::string plain(max, '\0');
            const std::size_t n = olm_decrypt(ptr, static_cast<std::size_t>(type), buf.data(), buf.size(), plain.data(), plain.size());
            if (n == olm_error())
                return std::nullopt;

            plain.resize(n);
            return plain;
        }
    };

    struct OlmEncryptionManager::GroupSession
    {
        std::unique_ptr<std::uint8_t[]> memory{new std::uint8_t[olm_inbound_group_session_size()]};
        OlmInboundGroupSession *ptr = olm_inbound_group_session(memory.get());
        std::string id;
        std::string senderKey;

        ~GroupSession() { olm_clear_inbound_group_session(ptr); }

        const char *error() const { return olm_inbound_group_session_last_error(ptr); }

        void load_id()
        {
            std::string buf(olm_inbound_group_session_id_length(ptr), '\0');
            if (olm_inbound_group_session_id(ptr, reinterpret_cast<std::uint8_t *>(buf.data()), buf.size()) == olm_error())
                throw olm_failure("group session id", error());
            id = std::move(buf);
        }
    };

    // ───────────────────────── lifecycle ─────────────────────────

    OlmEncryptionManager::OlmEncryptionManager(AccountId account, IStateStore &state, std::string pickleKey)
        : account_(std::move(account)),
          state_(state),
          pickleKey_(std::move(pickleKey))
    {
        if (pickleKey_.empty())
            throw std::invalid_argument("[OlmEncryptionManager] empty pickle key");
    }

    OlmEncryptionManager::~OlmEncryptionManager() = default;

    void OlmEncryptionManager::load_or_create(const std::string &userId, const std::string &deviceId)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        userId_ = userId;
        deviceId_ = deviceId;
        olm_.reset();
        sessions_.clear();

        verified_.clear();
        for (const auto &[key, value] : state_.list_secrets(account_, kVerifiedPrefix))
        {
            if (value.value("verified", false))
                verified_.emplace(json_string(value, "user"), json_string(value, "device"));
        }

        auto stored = state_.load_secret(account_, kAccountKey);
        if (stored && json_string(*stored, "device") == deviceId && json_member(*stored, "pickle").is_string())
        {
            try
            {
                auto acc = std::make_unique<Account>();
                unpickle_object(acc->ptr, pickleKey_, (*stored)["pickle"].get<std::string>(),
                                olm_unpickle_account, olm_account_last_error);
                olm_ = std::move(acc);
                deviceKeysUploaded_ = stored->value("uploaded", false);
            }
            catch (const std::runtime_error &e)
            {
                logger.log(Logger::Level::WARN, "[sync][crypto] {} cannot restore device {}, creating a new one: {}",
                           account_, deviceId, e.what());
            }
        }

        if (olm_)
        {
            for (const auto &[key, value] : state_.list_secrets(account_, kSessionPrefix))
            {
                try
                {
                    auto s = std::make_unique<Session>();
                    unpickle_object(s->ptr, pickleKey_, json_string(value, "pickle"),
                                    olm_unpickle_session, olm_session_last_error);
                    s->load_id();
                    sessions_.emplace(json_string(value, "sender_key"), std::move(s));
                }
                catch (const std::runtime_error &e)
                {
                    logger.log(Logger::Level::WARN, "[sync][crypto] {} skipped olm session {}: {}", account_, key, e.what());
                }
            }

            logger.log(Logger::Level::INFO, "[sync][crypto] {} restored device {} ({} olm session(s))",
                       account_, deviceId, sessions_.size());
            return;
        }

        auto acc = std::make_unique<Account>();
        auto rnd = random_bytes(olm_create_account_random_length(acc->ptr));
        if (olm_create_account(acc->ptr, rnd.data(), rnd.size()) == olm_error())
            throw olm_failure("create account", acc->error());

        olm_ = std::move(acc);
        deviceKeysUploaded_ = false;
        persist_account_locked();

        logger.log(Logger::Level::INFO, "[sync][crypto] {} created device account for {}", account_, deviceId);
    }

    bool OlmEncryptionManager::ready() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return olm_ != nullptr;
    }

    void OlmEncryptionManager::require_ready_locked() const
    {
        if (!olm_)
            throw std::logic_error("[OlmEncryptionManager] device account not loaded");
    }

    void OlmEncryptionManager::persist_account_locked()
    {
        nlohmann::json j{
            {"pickle", pickle_object(olm_->ptr, pickleKey_, olm_pickle_account_length, olm_pickle_account, olm_account_last_error)},
            {"user", userId_},
            {"device", deviceId_},
            {"uploaded", deviceKeysUploaded_},
        };
        state_.save_secret(account_, kAccountKey, j);
    }

    void OlmEncryptionManager::persist_session_locked(const std::string &senderKey, const Session &session)
    {
        nlohmann::json j{
            {"pickle", pickle_object(session.ptr, pickleKey_, olm_pickle_session_length, olm_pickle_session, olm_session_last_error)},
            {"sender_key", senderKey},
        };
        state_.save_secret(account_, kSessionPrefix + senderKey + "." + session.id, j);
    }

    // ───────────────────────── device keys ─────────────────────────

    namespace
    {
        nlohmann::json identity_keys(OlmAccount *acc)
        {
            std::string buf(olm_account_identity_keys_length(acc), '\0');
            if (olm_account_identity_keys(acc, buf.data(), buf.size()) == olm_error())
                throw olm_failure("identity keys", olm_account_last_error(acc));
            return nlohmann::json::parse(buf);
        }
    } // namespace

    std::string OlmEncryptionManager::identity_key() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_ready_locked();
        return identity_keys(olm_->ptr).at("curve25519").get<std::string>();
    }

    nlohmann::json OlmEncryptionManager::sign_locked(const nlohmann::json &object) const
    {
        nlohmann::json canonical = object;
        canonical.erase("signatures");
        canonical.erase("unsigned");

        // sorted keys, no whitespace: Matrix canonical JSON
        const std::string message = canonical.dump();

        std::string sig(olm_account_signature_length(olm_->ptr), '\0');
        if (olm_account_sign(olm_->ptr, message.data(), message.size(), sig.data(), sig.size()) == olm_error())
            throw olm_failure("sign", olm_->error());

        return nlohmann::json{{userId_, {{"ed25519:" + deviceId_, sig}}}};
    }

    nlohmann::json OlmEncryptionManager::device_keys() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_ready_locked();

        const auto keys = identity_keys(olm_->ptr);

        nlohmann::json dk{
            {"user_id", userId_},
            {"device_id", deviceId_},
            {"algorithms", {kOlmAlgorithm, kMegolmAlgorithm}},
            {"keys",
             {
                 {"curve25519:" + deviceId_, keys.at("curve25519")},
                 {"ed25519:" + deviceId_, keys.at("ed25519")},
             }},
        };
        dk["signatures"] = sign_locked(dk);
        return dk;
    }

    bool OlmEncryptionManager::device_keys_uploaded() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return deviceKeysUploaded_;
    }

    namespace
    {
        nlohmann::json unpublished_keys(OlmAccount *acc)
        {
            std::string buf(olm_account_one_time_keys_length(acc), '\0');
            if (olm_account_one_time_keys(acc, buf.data(), buf.size()) == olm_error())
                throw olm_failure("one-time keys", olm_account_last_error(acc));
            return json_member(nlohmann::json::parse(buf), "curve25519");
        }
    } // namespace

    void OlmEncryptionManager::replenish_one_time_keys(std::size_t onServer)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_ready_locked();

        const std::size_t target = olm_account_max_number_of_one_time_keys(olm_->ptr) / 2;
        const std::size_t have = onServer + unpublished_keys(olm_->ptr).size();
        if (have >= target)
            return;

        const std::size_t n = target - have;
        auto rnd = random_bytes(olm_account_generate_one_time_keys_random_length(olm_->ptr, n));
        if (olm_account_generate_one_time_keys(olm_->ptr, n, rnd.data(), rnd.size()) == olm_error())
            throw olm_failure("generate one-time keys", olm_->error());

        persist_account_locked();
        logger.log(Logger::Level::DEBUG, "[sync][crypto] {} generated {} one-time key(s)", account_, n);
    }

    nlohmann::json OlmEncryptionManager::one_time_keys() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_ready_locked();

        nlohmann::json out = nlohmann::json::object();
        for (const auto &[id, key] : unpublished_keys(olm_->ptr).items())
        {
            nlohmann::json entry{{"key", key}};
            entry["signatures"] = sign_locked(entry);
            out["signed_curve25519:" + id] = std::move(entry);
        }
        return out;
    }

    void OlmEncryptionManager::mark_keys_published(bool deviceKeysIncluded)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_ready_locked();

        olm_account_mark_keys_as_published(olm_->ptr);
        if (deviceKeysIncluded)
            deviceKeysUploaded_ = true;
        persist_account_locked();
    }

    void OlmEncryptionManager::rotate()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_ready_locked();

        const std::size_t n = olm_account_max_number_of_one_time_keys(olm_->ptr) / 2;
        auto rnd = random_bytes(olm_account_generate_one_time_keys_random_length(olm_->ptr, n));
        if (olm_account_generate_one_time_keys(olm_->ptr, n, rnd.data(), rnd.size()) == olm_error())
            throw olm_failure("generate one-time keys", olm_->error());

        persist_account_locked();
        logger.log(Logger::Level::INFO, "[sync][crypto] {} rotated {} one-time key(s)", account_, n);
    }

    // ───────────────────────── olm (to-device) ─────────────────────────

    std::optional<std::string> OlmEncryptionManager::olm_decrypt_locked(const std::string &senderKey,
                                                                        int type,
                                                                        const std::string &body)
    {
        auto range = sessions_.equal_range(senderKey);
        for (auto it = range.first; it != range.second; ++it)
        {
            Session &s = *it->second;

            if (type == 0)
            {
                std::string probe = body;
                if (olm_matches_inbound_session_from(s.ptr, senderKey.data(), senderKey.size(), probe.data(), probe.size()) != 1)
                    continue;
            }

            if (auto plain = s.decrypt(type, body))
            {
                persist_session_locked(senderKey, s);
                return plain;
            }

            if (type == 0)
                return std::nullopt; // matching session, corrupt message
        }

        if (type != 0)
            return std::nullopt;

        auto s = std::make_unique<Session>();
        std::string msg = body;
        if (olm_create_inbound_session_from(s->ptr, olm_->ptr, senderKey.data(), senderKey.size(), msg.data(), msg.size()) == olm_error())
        {
            logger.log(Logger::Level::WARN, "[sync][crypto] {} cannot open olm session with {}: {}",
                       account_, senderKey, s->error());
            return std::nullopt;
        }

        if (olm_remove_one_time_keys(olm_->ptr, s->ptr) == olm_error())
            logger.log(Logger::Level::WARN, "[sync][crypto] {} one-time key not removed: {}", account_, olm_->error());

        s->load_id();
        auto plain = s->decrypt(0, body);
        if (!plain)
            return std::nullopt;

        persist_account_locked();
        persist_session_locked(senderKey, *s);
        sessions_.emplace(senderKey, std::move(s));
        return plain;
    }

    std::vector<std::string> OlmEncryptionManager::handle_to_device(const nlohmann::json &raw)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!olm_ || json_string(raw, "type") != "m.room.encrypted")
            return {};

        const auto &content = json_member(raw, "content");
        if (json_string(content, "algorithm") != kOlmAlgorithm)
            return {};

        const std::string senderKey = json_string(content, "sender_key");
        const std::string ours = identity_keys(olm_->ptr).at("curve25519").get<std::string>();
        const auto &mine = json_member(json_member(content, "ciphertext"), ours.c_str());
        if (senderKey.empty() || !mine.contains("body"))
            return {}; // addressed to another device

        const int type = mine.value("type", 0);
        auto plain = olm_decrypt_locked(senderKey, type, json_string(mine, "body"));
        if (!plain)
        {
            logger.log(Logger::Level::WARN, "[sync][crypto] {} undecryptable to-device message from {}",
                       account_, json_string(raw, "sender"));
            return {};
        }

        const auto inner = nlohmann::json::parse(*plain, nullptr, false);
        if (inner.is_discarded() || !inner.is_object())
            return {};

        const std::string recipient = json_string(inner, "recipient");
        if (!recipient.empty() && recipient != userId_)
        {
            logger.log(Logger::Level::WARN, "[sync][crypto] {} to-device message for {} dropped", account_, recipient);
            return {};
        }

        const std::string innerType = json_string(inner, "type");
        const auto &c = json_member(inner, "content");
        if ((innerType != "m.room_key" && innerType != "m.forwarded_room_key") ||
            json_string(c, "algorithm") != kMegolmAlgorithm)
        {
            return {};
        }

        const bool forwarded = innerType == "m.forwarded_room_key";
        const std::string origin = forwarded ? json_string(c, "sender_key") : senderKey;

        auto id = add_group_session_locked(json_string(c, "room_id"), origin,
                                           json_string(c, "session_key"), forwarded,
                                           json_string(c, "session_id"));
        if (!id)
            return {};
        return {*id};
    }

    // ───────────────────────── megolm (room events) ─────────────────────────

    std::optional<std::string> OlmEncryptionManager::add_group_session_locked(const std::string &room,
                                                                              const std::string &senderKey,
                                                                              const std::string &key,
                                                                              bool exported,
                                                                              const std::string &expectedId)
    {
        if (room.empty() || key.empty())
            return std::nullopt;

        auto gs = std::make_unique<GroupSession>();
        const auto *bytes = reinterpret_cast<const std::uint8_t *>(key.data());
        const std::size_t r = exported
                                  ? olm_import_inbound_group_session(gs->ptr, bytes, key.size())
                                  : olm_init_inbound_group_session(gs->ptr, bytes, key.size());
        if (r == olm_error())
        {
            logger.log(Logger::Level::WARN, "[sync][crypto] {} rejected room key for {}: {}", account_, room, gs->error());
            return std::nullopt;
        }

        gs->load_id();
        gs->senderKey = senderKey;
        if (!expectedId.empty() && expectedId != gs->id)
        {
            logger.log(Logger::Level::WARN, "[sync][crypto] {} room key id mismatch ({} != {})", account_, expectedId, gs->id);
            return std::nullopt;
        }

        // keep the copy that can decrypt further back
        if (const GroupSession *existing = group_session_locked(room, gs->id))
        {
            if (olm_inbound_group_session_first_known_index(existing->ptr) <=
                olm_inbound_group_session_first_known_index(gs->ptr))
            {
                return std::nullopt;
            }
        }

        nlohmann::json j{
            {"pickle", pickle_object(gs->ptr, pickleKey_, olm_pickle_inbound_group_session_length,
                                     olm_pickle_inbound_group_session, olm_inbound_group_session_last_error)},
            {"sender_key", senderKey},
            {"room", room},
        };
        state_.save_secret(account_, kGroupPrefix + room + "." + gs->id, j);

        const std::string id = gs->id;
        groups_[{room, id}] = std::move(gs);

        logger.log(Logger::Level::INFO, "[sync][crypto] {} new megolm session {} for {}", account_, id, room);
        return id;
    }

    OlmEncryptionManager::GroupSession *OlmEncryptionManager::group_session_locked(const std::string &room,
                                                                                   const std::string &sessionId)
    {
        auto it = groups_.find({room, sessionId});
        if (it != groups_.end())
            return it->second.get();

        auto stored = state_.load_secret(account_, kGroupPrefix + room + "." + sessionId);
        if (!stored)
            return nullptr;

        try
        {
            auto gs = std::make_unique<GroupSession>();
            unpickle_object(gs->ptr, pickleKey_, json_string(*stored, "pickle"),
                            olm_unpickle_inbound_group_session, olm_inbound_group_session_last_error);
            gs->load_id();
            gs->senderKey = json_string(*stored, "sender_key");

            auto *raw = gs.get();
            groups_[{room, sessionId}] = std::move(gs);
            return raw;
        }
        catch (const std::runtime_error &e)
        {
            logger.log(Logger::Level::WARN, "[sync][crypto] {} cannot restore megolm session {}: {}",
                       account_, sessionId, e.what());
            return nullptr;
        }
    }

    DecryptResult OlmEncryptionManager::decrypt(const ConversationId &conversation,
                                                const std::string &eventNative,
                                                const EncryptedPayload &payload)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (payload.algorithm != kMegolmAlgorithm)
            return DecryptResult::failure("unsupported algorithm " + payload.algorithm, payload.sessionId);

        GroupSession *gs = group_session_locked(conversation.native, payload.sessionId);
        if (!gs)
            return DecryptResult::failure(reason::kNoSession, payload.sessionId);

        if (!payload.senderKey.empty() && !gs->senderKey.empty() && payload.senderKey != gs->senderKey)
            return DecryptResult::failure("sender key mismatch", payload.sessionId);

        std::string buf = payload.ciphertext;
        const std::size_t max = olm_group_decrypt_max_plaintext_length(
            gs->ptr, reinterpret_cast<std::uint8_t *>(buf.data()), buf.size());
        if (max == olm_error())
            return DecryptResult::failure(gs->error(), payload.sessionId);

        buf = payload.ciphertext;
        std::string plain(max, '\0');
        std::uint32_t index = 0;
        const std::size_t n = olm_group_decrypt(gs->ptr,
                                                reinterpret_cast<std::uint8_t *>(buf.data()), buf.size(),
                                                reinterpret_cast<std::uint8_t *>(plain.data()), plain.size(),
                                                &index);
        if (n == olm_error())
            return DecryptResult::failure(gs->error(), payload.sessionId);
        plain.resize(n);

        const auto inner = nlohmann::json::parse(plain, nullptr, false);
        if (inner.is_discarded() || !inner.is_object())
            return DecryptResult::failure("malformed plaintext", payload.sessionId);

        const std::string room = json_string(inner, "room_id");
        if (!room.empty() && room != conversation.native)
            return DecryptResult::failure("room mismatch", payload.sessionId);

        const auto slot = std::make_pair(payload.sessionId, index);
        auto seen = indices_.find(slot);
        if (seen != indices_.end() && seen->second != eventNative)
            return DecryptResult::failure("replayed message index " + std::to_string(index), payload.sessionId);
        indices_[slot] = eventNative;

        return DecryptResult::success(std::move(plain), payload.sessionId);
    }

    bool OlmEncryptionManager::import_room_key(const std::string &room,
                                               const std::string &sessionId,
                                               const std::string &sessionKey)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // session_key (m.room_key) format first, then the export format
        if (add_group_session_locked(room, {}, sessionKey, false, sessionId))
            return true;
        return add_group_session_locked(room, {}, sessionKey, true, sessionId).has_value();
    }

    // ───────────────────────── verification ─────────────────────────

    void OlmEncryptionManager::verify_device(const ParticipantId &participant, const std::string &deviceId)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        verified_.emplace(participant.native, deviceId);
        state_.save_secret(account_, kVerifiedPrefix + participant.native + "." + deviceId,
                           nlohmann::json{{"user", participant.native}, {"device", deviceId}, {"verified", true}});

        logger.log(Logger::Level::INFO, "[sync][crypto] {} verified {} / {}", account_, participant.native, deviceId);
    }

    bool OlmEncryptionManager::device_verified(const ParticipantId &participant, const std::string &deviceId) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return verified_.count({participant.native, deviceId}) > 0;
    }

} // namespace echat::sync
