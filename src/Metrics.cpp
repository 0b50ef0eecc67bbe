#include <echat/sync/Metrics.hpp>

#include <sstream>

namespace echat::sync
{
    namespace
    {
        void sample(std::ostringstream &os,
                    const char *name,
                    const char *type,
                    const char *help,
                    const std::atomic<std::uint64_t> &value)
        {
            os << "# HELP " << name << ' ' << help << "\n"
               << "# TYPE " << name << ' ' << type << "\n"
               << name << ' ' << value.load(std::memory_order_relaxed) << "\n\n";
        }
    } // namespace

    std::string SyncMetrics::render_prometheus() const
    {
        std::ostringstream os;

        sample(os, "echat_sync_events_received_total", "counter",
               "Total raw events received from backends", events_received_total);
        sample(os, "echat_sync_duplicates_dropped_total", "counter",
               "Events dropped because they were already applied", duplicates_dropped_total);
        sample(os, "echat_sync_decryption_failures_total", "counter",
               "Messages stored as undecryptable", decryption_failures_total);
        sample(os, "echat_sync_redecryptions_total", "counter",
               "Messages decrypted after a late room key", redecryptions_total);
        sample(os, "echat_sync_reconnects_total", "counter",
               "Ingestion loop reconnect attempts", reconnects_total);

        sample(os, "echat_sync_messages_sent_total", "counter",
               "Outbound commands acknowledged by a backend", messages_sent_total);
        sample(os, "echat_sync_send_failures_total", "counter",
               "Outbound commands that ended Failed", send_failures_total);
        sample(os, "echat_sync_send_retries_total", "counter",
               "Outbound command retries after transient errors", send_retries_total);

        sample(os, "echat_sync_subscriptions_active", "gauge",
               "Current live subscriptions", subscriptions_active);
        sample(os, "echat_sync_notifications_enqueued_total", "counter",
               "Change notifications enqueued", notifications_enqueued_total);
        sample(os, "echat_sync_notifications_drained_total", "counter",
               "Change notifications drained by poll", notifications_drained_total);
        sample(os, "echat_sync_notifications_dropped_total", "counter",
               "Change notifications dropped by full buffers", notifications_dropped_total);

        return os.str();
    }

} // namespace echat::sync
