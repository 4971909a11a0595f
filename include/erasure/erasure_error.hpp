#ifndef DCS_ERASURE_ERROR_HPP
#define DCS_ERASURE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dcs::erasure {

class ErasureError : public std::runtime_error {
public:
    explicit ErasureError(const std::string& message)
        : std::runtime_error(message) {}
};

class InvalidShardConfig : public ErasureError {
public:
    explicit InvalidShardConfig(const std::string& message)
        : ErasureError("Invalid shard configuration: " + message) {}
};

class ErasureUndecodable : public ErasureError {
public:
    explicit ErasureUndecodable(const std::string& message)
        : ErasureError("Undecodable codeword: " + message) {}
};

} // namespace dcs::erasure

#endif // DCS_ERASURE_ERROR_HPP
