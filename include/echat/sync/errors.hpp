#ifndef ECHAT_SYNC_ERRORS_HPP
#define ECHAT_SYNC_ERRORS_HPP

/**
 * @file errors.hpp
 * @brief Error taxonomy used at the backend adapter boundary.
 *
 * Adapters translate whatever their protocol reports (HTTP status, errcode,
 * TDLib error objects, socket errors) into one of three classes. The engine
 * and the outbound queue only look at the class:
 *
 *  - AuthError       : credentials rejected, the account needs a new login.
 *  - TransientError  : retry with backoff (network, 429, 5xx, timeouts).
 *  - PermanentError  : the request itself is wrong, retrying will not help.
 */

#include <stdexcept>
#include <string>

namespace echat::sync
{
    class BackendError : public std::runtime_error
    {
    public:
        enum class Kind
        {
            Auth,
            Transient,
            Permanent,
        };

        BackendError(Kind kind, const std::string &what)
            : std::runtime_error(what), kind_(kind)
        {
        }

        Kind kind() const noexcept { return kind_; }
        bool retryable() const noexcept { return kind_ == Kind::Transient; }

    private:
        Kind kind_;
    };

    class AuthError : public BackendError
    {
    public:
        explicit AuthError(const std::string &what)
            : BackendError(Kind::Auth, what)
        {
        }
    };

    class TransientError : public BackendError
    {
    public:
        explicit TransientError(const std::string &what)
            : BackendError(Kind::Transient, what)
        {
        }
    };

    class PermanentError : public BackendError
    {
    public:
        explicit PermanentError(const std::string &what)
            : BackendError(Kind::Permanent, what)
        {
        }
    };

    /// Raised by an event stream when its cancellation token fired.
    class Cancelled : public std::runtime_error
    {
    public:
        Cancelled() : std::runtime_error("cancelled") {}
    };

    /// Reasons attached to Failed messages.
    namespace reason
    {
        inline constexpr const char *kCancelled = "cancelled";
        inline constexpr const char *kReconciliationTimeout = "reconciliation timeout";
        inline constexpr const char *kTargetFailed = "target message failed";
        inline constexpr const char *kNoSession = "unknown megolm session";
    } // namespace reason

} // namespace echat::sync

#endif // ECHAT_SYNC_ERRORS_HPP
