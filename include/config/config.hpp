#ifndef DCS_CONFIG_HPP
#define DCS_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include "logger/logger.hpp"

namespace dcs::config {

// ---- CONSTANTS ----
static constexpr size_t MIN_FILE_SIZE = 127;            // bytes
static constexpr size_t ENCRYPTION_OVERHEAD = 28;       // AES-GCM nonce + tag
static constexpr size_t MIN_BUCKET_NAME_LENGTH = 3;
static constexpr size_t MAX_BLOCKS_IN_CHUNK = 256;      // block index is a uint8 on chain
static constexpr int MAX_RETRY_ATTEMPTS = 30;

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message) {}
};

struct Config {
    // Chunking
    size_t block_size = 1024 * 1024;
    size_t max_blocks_in_chunk = 32;

    // Erasure coding, disabled while both are 0
    size_t data_shards = 0;
    size_t parity_shards = 0;

    // Upload pipeline
    size_t max_concurrency = 10;
    uint64_t chain_id = 31337;
    std::string storage_contract_address;
    std::string private_key;
    std::string encryption_key;      // empty disables encryption

    int retry_max_attempts = 5;
    std::chrono::milliseconds retry_base_delay{100};
    std::chrono::milliseconds tx_poll_interval{200};
    std::chrono::milliseconds tx_timeout{120000};
    std::chrono::seconds commitment_validity{3600};

    // Logging
    std::string log_file = "dcs.log";
    logger::severity_level log_level = logger::severity_level::info;

    bool erasure_enabled() const { return data_shards > 0 || parity_shards > 0; }

    // Payload bytes per chunk before encryption and erasure coding
    size_t chunk_size() const;

    // Throws ConfigError on the first inconsistent field
    void validate() const;
};

// Applies one "--name value" pair; throws ConfigError for unknown names or
// unparsable values
void set_option(Config& config, const std::string& name, const std::string& value);

} // namespace dcs::config

#endif // DCS_CONFIG_HPP
