#include "config/config.hpp"
#include "encoding/hex.hpp"
#include <functional>
#include <unordered_map>

namespace dcs::config {

namespace {

uint64_t parse_unsigned(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigError(name + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size() || value.front() == '-') {
        throw ConfigError(name + " expects a number, got '" + value + "'");
    }
    return parsed;
}

void check_hex(const std::string& name, const std::string& value, size_t expected_bytes) {
    Bytes raw;
    try {
        raw = encoding::from_hex(value);
    } catch (const encoding::DecodeError& e) {
        throw ConfigError(name + " is not valid hex: " + e.what());
    }
    if (raw.size() != expected_bytes) {
        throw ConfigError(name + " must be " + std::to_string(expected_bytes) + " bytes, got " +
                          std::to_string(raw.size()));
    }
}

} // namespace

size_t Config::chunk_size() const {
    if (erasure_enabled()) {
        return block_size * data_shards;
    }
    return block_size * max_blocks_in_chunk;
}

void Config::validate() const {
    if (block_size == 0) {
        throw ConfigError("block_size must be positive");
    }
    if (max_blocks_in_chunk == 0 || max_blocks_in_chunk > MAX_BLOCKS_IN_CHUNK) {
        throw ConfigError("max_blocks_in_chunk must be in [1, " + std::to_string(MAX_BLOCKS_IN_CHUNK) + "]");
    }
    if (erasure_enabled()) {
        if (data_shards == 0 || parity_shards == 0) {
            throw ConfigError("data_shards and parity_shards must both be set to enable erasure coding");
        }
        if (2 * parity_shards >= 255) {
            throw ConfigError("2 * parity_shards must be < 255");
        }
        if (data_shards > MAX_BLOCKS_IN_CHUNK) {
            throw ConfigError("data_shards exceeds the blocks a chunk can hold");
        }
    }
    if (max_concurrency == 0) {
        throw ConfigError("max_concurrency must be positive");
    }
    if (retry_max_attempts < 0 || retry_max_attempts > MAX_RETRY_ATTEMPTS) {
        throw ConfigError("retry_max_attempts must be in [0, " + std::to_string(MAX_RETRY_ATTEMPTS) + "]");
    }
    if (retry_base_delay.count() < 0) {
        throw ConfigError("retry_base_delay must not be negative");
    }
    if (tx_poll_interval.count() <= 0 || tx_timeout.count() <= 0) {
        throw ConfigError("transaction poll interval and timeout must be positive");
    }
    if (!storage_contract_address.empty()) {
        check_hex("storage_contract_address", storage_contract_address, 20);
    }
    if (!private_key.empty()) {
        check_hex("private_key", private_key, 32);
    }
    if (!encryption_key.empty()) {
        check_hex("encryption_key", encryption_key, 32);
    }
}

void set_option(Config& config, const std::string& name, const std::string& value) {
    using Setter = std::function<void(const std::string&)>;
    const std::unordered_map<std::string, Setter> setters = {
        {"--block-size", [&](const std::string& v) { config.block_size = parse_unsigned(name, v); }},
        {"--max-blocks", [&](const std::string& v) { config.max_blocks_in_chunk = parse_unsigned(name, v); }},
        {"--data-shards", [&](const std::string& v) { config.data_shards = parse_unsigned(name, v); }},
        {"--parity-shards", [&](const std::string& v) { config.parity_shards = parse_unsigned(name, v); }},
        {"--concurrency", [&](const std::string& v) { config.max_concurrency = parse_unsigned(name, v); }},
        {"--chain-id", [&](const std::string& v) { config.chain_id = parse_unsigned(name, v); }},
        {"--contract", [&](const std::string& v) { config.storage_contract_address = v; }},
        {"--private-key", [&](const std::string& v) { config.private_key = v; }},
        {"--encryption-key", [&](const std::string& v) { config.encryption_key = v; }},
        {"--log-file", [&](const std::string& v) { config.log_file = v; }},
        {"--log-level", [&](const std::string& v) {
            try {
                config.log_level = logger::parse_severity(v);
            } catch (const std::invalid_argument& e) {
                throw ConfigError(e.what());
            }
        }},
    };

    auto it = setters.find(name);
    if (it == setters.end()) {
        throw ConfigError("unknown option " + name);
    }
    it->second(value);
}

} // namespace dcs::config
