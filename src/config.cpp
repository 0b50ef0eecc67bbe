#include <echat/sync/config.hpp>

#include <algorithm>
#include <cmath>

namespace echat::sync
{
    std::chrono::milliseconds BackoffPolicy::delay(unsigned attempt) const noexcept
    {
        if (attempt <= 1)
            return std::min(initial, max);

        const double factor = std::pow(multiplier, static_cast<double>(attempt - 1));
        const double raw = static_cast<double>(initial.count()) * factor;
        if (!std::isfinite(raw) || raw >= static_cast<double>(max.count()))
            return max;

        return std::chrono::milliseconds(static_cast<std::int64_t>(raw));
    }

    Config Config::from_core(const vix::config::Config &core)
    {
        Config cfg;

        if (core.has("sync.worker_threads"))
        {
            auto v = core.getInt("sync.worker_threads", static_cast<int>(cfg.workerThreads));
            cfg.workerThreads = static_cast<std::size_t>(std::clamp(v, 1, 64));
        }

        if (core.has("sync.account_threads"))
        {
            auto v = core.getInt("sync.account_threads", static_cast<int>(cfg.accountThreads));
            cfg.accountThreads = static_cast<std::size_t>(std::clamp(v, 1, 16));
        }

        if (core.has("sync.backoff.initial_ms"))
        {
            auto v = core.getInt("sync.backoff.initial_ms", static_cast<int>(cfg.reconnect.initial.count()));
            cfg.reconnect.initial = std::chrono::milliseconds(std::max(10, v));
        }

        if (core.has("sync.backoff.multiplier_pct"))
        {
            auto v = core.getInt("sync.backoff.multiplier_pct", 200);
            cfg.reconnect.multiplier = static_cast<double>(std::max(100, v)) / 100.0; // never shrinking
        }

        if (core.has("sync.backoff.max_ms"))
        {
            auto v = core.getInt("sync.backoff.max_ms", static_cast<int>(cfg.reconnect.max.count()));
            cfg.reconnect.max = std::chrono::milliseconds(std::max(static_cast<int>(cfg.reconnect.initial.count()), v));
        }

        if (core.has("sync.backoff.max_retries"))
        {
            auto v = core.getInt("sync.backoff.max_retries", static_cast<int>(cfg.reconnect.maxRetries));
            cfg.reconnect.maxRetries = static_cast<unsigned>(std::max(0, v));
        }

        if (core.has("sync.send.max_attempts"))
        {
            auto v = core.getInt("sync.send.max_attempts", static_cast<int>(cfg.send_max_attempts()));
            cfg.send.maxRetries = static_cast<unsigned>(std::max(1, v) - 1);
        }

        if (core.has("sync.send.initial_ms"))
        {
            auto v = core.getInt("sync.send.initial_ms", static_cast<int>(cfg.send.initial.count()));
            cfg.send.initial = std::chrono::milliseconds(std::max(1, v));
        }

        if (core.has("sync.send.max_ms"))
        {
            auto v = core.getInt("sync.send.max_ms", static_cast<int>(cfg.send.max.count()));
            cfg.send.max = std::chrono::milliseconds(std::max(static_cast<int>(cfg.send.initial.count()), v));
        }

        if (core.has("sync.reconcile_timeout_ms"))
        {
            auto v = core.getInt("sync.reconcile_timeout_ms", static_cast<int>(cfg.reconcileTimeout.count()));
            cfg.reconcileTimeout = std::chrono::milliseconds(std::max(100, v));
        }

        if (core.has("sync.history_page_size"))
        {
            auto v = core.getInt("sync.history_page_size", static_cast<int>(cfg.historyPageSize));
            cfg.historyPageSize = static_cast<std::size_t>(std::clamp(v, 1, 1000));
        }

        if (core.has("sync.long_poll_timeout_ms"))
        {
            auto v = core.getInt("sync.long_poll_timeout_ms", static_cast<int>(cfg.longPollTimeout.count()));
            cfg.longPollTimeout = std::chrono::milliseconds(std::max(0, v)); // 0 = return immediately
        }

        if (core.has("sync.subscription.buffer"))
        {
            auto v = core.getInt("sync.subscription.buffer", static_cast<int>(cfg.subscriptionBuffer));
            cfg.subscriptionBuffer = static_cast<std::size_t>(std::max(16, v));
        }

        if (core.has("sync.subscription.ttl_s"))
        {
            auto v = core.getInt("sync.subscription.ttl_s", static_cast<int>(cfg.subscriptionTtl.count()));
            cfg.subscriptionTtl = std::chrono::seconds(std::max(5, v));
        }

        if (core.has("sync.state_db"))
        {
            cfg.stateDb = core.getString("sync.state_db", cfg.stateDb);
        }

        return cfg;
    }

    std::vector<AccountConfig> Config::accounts_from_core(const vix::config::Config &core)
    {
        std::vector<AccountConfig> out;

        if (core.has("matrix.homeserver") && core.has("matrix.user"))
        {
            AccountConfig acc;
            acc.credentials.backend = BackendKind::Matrix;

            auto &p = acc.credentials.params;
            p["homeserver"] = core.getString("matrix.homeserver", "");
            p["user"] = core.getString("matrix.user", "");
            p["password"] = core.getString("matrix.password", "");
            p["device_name"] = core.getString("matrix.device_name", "echat");

            acc.account = std::string("matrix:") + p["user"].get<std::string>();
            out.push_back(std::move(acc));
        }

        if (core.has("telegram.api_id") && core.has("telegram.api_hash") && core.has("telegram.phone"))
        {
            AccountConfig acc;
            acc.credentials.backend = BackendKind::Telegram;

            auto &p = acc.credentials.params;
            p["api_id"] = core.getInt("telegram.api_id", 0);
            p["api_hash"] = core.getString("telegram.api_hash", "");
            p["phone"] = core.getString("telegram.phone", "");
            p["code"] = core.getString("telegram.code", "");
            p["password"] = core.getString("telegram.password", "");
            p["database_dir"] = core.getString("telegram.database_dir", "tdlib");

            acc.account = std::string("telegram:") + p["phone"].get<std::string>();
            out.push_back(std::move(acc));
        }

        return out;
    }

} // namespace echat::sync
