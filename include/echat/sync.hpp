#ifndef ECHAT_SYNC_HPP
#define ECHAT_SYNC_HPP

/**
 * @file sync.hpp
 * @brief Umbrella header of the echat sync core.
 *
 * Includes the public API. Embedders normally only need ChatCore and the
 * intent types it accepts.
 */

#include <echat/sync/types.hpp>
#include <echat/sync/events.hpp>
#include <echat/sync/errors.hpp>
#include <echat/sync/config.hpp>
#include <echat/sync/Metrics.hpp>
#include <echat/sync/StateStore.hpp>
#include <echat/sync/SqliteStateStore.hpp>
#include <echat/sync/EncryptionProvider.hpp>
#include <echat/sync/BackendAdapter.hpp>
#include <echat/sync/ConversationStore.hpp>
#include <echat/sync/SubscriptionHub.hpp>
#include <echat/sync/OutboundQueue.hpp>
#include <echat/sync/SyncEngine.hpp>
#include <echat/sync/ChatCore.hpp>

#endif // ECHAT_SYNC_HPP
