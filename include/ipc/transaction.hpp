#ifndef DCS_IPC_TRANSACTION_HPP
#define DCS_IPC_TRANSACTION_HPP

#include <chrono>
#include <string>
#include <string_view>
#include "ipc/clients.hpp"
#include "ipc/ipc_error.hpp"
#include "retry/retry.hpp"

namespace dcs::ipc {

static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{200};
static constexpr std::chrono::milliseconds DEFAULT_TX_TIMEOUT{120000};

// Blocks until tx_hash is mined. Checks once immediately, then every
// poll_interval. Throws TransactionFailed for a reverted transaction or a
// failing receipt lookup, TransactionTimeout past timeout, and
// retry::RetryAborted if cancel fires while waiting.
Receipt wait_for_transaction(ChainClient& client, const std::string& tx_hash,
                             std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL,
                             std::chrono::milliseconds timeout = DEFAULT_TX_TIMEOUT,
                             const retry::CancellationToken* cancel = nullptr);

// Node-side rejections that clear up when the transaction is resent
bool is_retryable_tx_error(std::string_view message);

} // namespace dcs::ipc

#endif // DCS_IPC_TRANSACTION_HPP
