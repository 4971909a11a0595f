#ifndef DCS_IPC_ERROR_HPP
#define DCS_IPC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dcs::ipc {

class IpcError : public std::runtime_error {
public:
    explicit IpcError(const std::string& message)
        : std::runtime_error(message) {}
};

class InvalidAddress : public IpcError {
public:
    explicit InvalidAddress(const std::string& message)
        : IpcError("Invalid address: " + message) {}
};

class TransactionFailed : public IpcError {
public:
    explicit TransactionFailed(const std::string& message)
        : IpcError("Transaction failed: " + message) {}
};

class TransactionTimeout : public IpcError {
public:
    explicit TransactionTimeout(const std::string& message)
        : IpcError("Transaction timeout: " + message) {}
};

} // namespace dcs::ipc

#endif // DCS_IPC_ERROR_HPP
