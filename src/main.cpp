//
// echat-sync
//
// Headless runner of the sync core. Loads the configuration, connects every
// configured (or previously stored) account and logs what a presentation
// layer would render, until SIGINT / SIGTERM.
//
//   echat-sync [config/config.json]
//

#include <csignal>
#include <functional>
#include <iostream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <vix/config/Config.hpp>
#include <vix/utils/Logger.hpp>

#include <echat/sync.hpp>

namespace
{
    using Logger = vix::utils::Logger;

    void log_snapshot(const echat::sync::Snapshot &snap)
    {
        auto &log = Logger::getInstance();
        log.log(Logger::Level::INFO, "[echat-sync] snapshot: {} conversation(s), {} participant(s)",
                snap.conversations.size(), snap.participants ? snap.participants->size() : 0);

        for (const auto &state : snap.conversations)
        {
            const auto &c = state->conversation;
            log.log(Logger::Level::INFO, "[echat-sync]   {} \"{}\" unread={} messages={}{}",
                    c.id.str(), c.displayName, c.unread, state->messages.size(), c.archived ? " (archived)" : "");
        }
    }

    void log_change(echat::sync::ChatCore &chat, const echat::sync::Change &change)
    {
        using echat::sync::ChangeKind;
        auto &log = Logger::getInstance();

        switch (change.kind)
        {
        case ChangeKind::Conversation:
        {
            auto state = chat.get_conversation(*change.conversation);
            if (!state || state->messages.empty())
                return;
            const auto &last = *state->messages.back();
            log.log(Logger::Level::INFO, "[echat-sync] {} <{}> {} [{}]",
                    state->conversation.displayName.empty() ? change.conversation->native
                                                            : state->conversation.displayName,
                    last.sender.native, last.display_text(), echat::sync::to_string(last.delivery.state));
            break;
        }
        case ChangeKind::Connectivity:
            log.log(Logger::Level::INFO, "[echat-sync] {} is {}{}{}",
                    change.status->account, echat::sync::to_string(change.status->state),
                    change.status->lastError.empty() ? "" : ": " + change.status->lastError,
                    change.status->needsLogin ? " (login required)" : "");
            break;
        case ChangeKind::Presence:
            log.log(Logger::Level::DEBUG, "[echat-sync] {} is {}",
                    change.presence->participant.native, change.presence->presence);
            break;
        case ChangeKind::Typing:
            log.log(Logger::Level::DEBUG, "[echat-sync] {} typing in {}",
                    change.typing->typing.size(), change.typing->conversation.native);
            break;
        case ChangeKind::Resync:
            log_snapshot(chat.snapshot());
            break;
        }
    }
} // namespace

int main(int argc, char **argv)
{
    const std::string configPath = argc > 1 ? argv[1] : "config/config.json";
    auto &log = Logger::getInstance();

    try
    {
        vix::config::Config core{configPath};
        const auto config = echat::sync::Config::from_core(core);

        echat::sync::ChatCore chat(config);

        const auto restored = chat.restore_accounts();
        for (const auto &acc : echat::sync::Config::accounts_from_core(core))
            chat.add_account(acc.account, acc.credentials);

        const auto accounts = chat.accounts();
        if (accounts.empty())
        {
            log.log(Logger::Level::ERROR, "[echat-sync] no account configured in {}", configPath);
            return 1;
        }

        log.log(Logger::Level::INFO, "[echat-sync] {} account(s), {} restored from {}",
                accounts.size(), restored, config.stateDb);

        auto sub = chat.subscribe();
        log_snapshot(sub.snapshot);

        for (const auto &status : accounts)
            chat.connect(status.account);

        boost::asio::io_context ioc;
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        boost::asio::steady_timer frame(ioc);

        // one "frame" every 250 ms, the way a UI would poll
        std::function<void()> pump = [&]()
        {
            frame.expires_after(std::chrono::milliseconds(250));
            frame.async_wait([&](const boost::system::error_code &ec)
                             {
                if (ec)
                    return;

                auto changes = chat.poll(sub.id);
                if (!changes)
                {
                    // expired: start over from a fresh snapshot
                    sub = chat.subscribe();
                    log_snapshot(sub.snapshot);
                }
                else
                {
                    for (const auto &change : *changes)
                        log_change(chat, change);
                }
                pump(); });
        };

        signals.async_wait([&](const boost::system::error_code &ec, int sig)
                           {
            if (ec)
                return;
            log.log(Logger::Level::INFO, "[echat-sync] signal {}, shutting down", sig);
            frame.cancel(); });

        pump();
        ioc.run();

        chat.shutdown();
        std::cout << chat.metrics().render_prometheus();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[echat-sync] fatal: " << e.what() << std::endl;
        return 1;
    }
}
