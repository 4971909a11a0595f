#include "ipc/transaction.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <thread>
#include <boost/log/trivial.hpp>

namespace dcs::ipc {

namespace {

constexpr std::array<std::string_view, 4> RETRYABLE_TX_ERRORS = {
    "nonce too low",
    "replacement transaction underpriced",
    "already known",
    "known transaction",
};

// Single receipt lookup; nullopt while pending
std::optional<Receipt> check_receipt(ChainClient& client, const std::string& tx_hash) {
    std::optional<Receipt> receipt;
    try {
        receipt = client.transaction_receipt(tx_hash);
    } catch (const IpcError&) {
        throw;
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "IPC: Receipt lookup for " << tx_hash << " failed: " << e.what();
        throw TransactionFailed(std::string("error checking transaction receipt: ") + e.what());
    }

    if (receipt && !receipt->success) {
        BOOST_LOG_TRIVIAL(error) << "IPC: Transaction " << tx_hash << " reverted in block " << receipt->block_number;
        throw TransactionFailed(tx_hash);
    }
    return receipt;
}

} // namespace

Receipt wait_for_transaction(ChainClient& client, const std::string& tx_hash,
                             std::chrono::milliseconds poll_interval,
                             std::chrono::milliseconds timeout,
                             const retry::CancellationToken* cancel) {
    if (auto receipt = check_receipt(client, tx_hash)) {
        return *receipt;
    }

    BOOST_LOG_TRIVIAL(debug) << "IPC: Waiting for transaction " << tx_hash;
    const auto start = std::chrono::steady_clock::now();

    while (true) {
        if (std::chrono::steady_clock::now() - start > timeout) {
            BOOST_LOG_TRIVIAL(error) << "IPC: Timed out waiting for transaction " << tx_hash;
            throw TransactionTimeout("timeout waiting for transaction " + tx_hash);
        }

        if (cancel) {
            if (cancel->wait_for(poll_interval)) {
                BOOST_LOG_TRIVIAL(warning) << "IPC: Wait for " << tx_hash << " cancelled";
                throw retry::RetryAborted(
                    "transaction " + tx_hash + " still pending",
                    std::make_exception_ptr(TransactionTimeout("transaction " + tx_hash + " not mined")));
            }
        } else {
            std::this_thread::sleep_for(poll_interval);
        }

        if (auto receipt = check_receipt(client, tx_hash)) {
            BOOST_LOG_TRIVIAL(debug) << "IPC: Transaction " << tx_hash << " mined in block " << receipt->block_number;
            return *receipt;
        }
    }
}

bool is_retryable_tx_error(std::string_view message) {
    std::string lowered(message);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::any_of(RETRYABLE_TX_ERRORS.begin(), RETRYABLE_TX_ERRORS.end(),
                       [&](std::string_view pattern) { return lowered.find(pattern) != std::string::npos; });
}

} // namespace dcs::ipc
