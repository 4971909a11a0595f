#ifndef DCS_IPC_CONTRACT_ERRORS_HPP
#define DCS_IPC_CONTRACT_ERRORS_HPP

#include <array>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include "ipc/ipc_error.hpp"

namespace dcs::ipc {

// Custom error selectors (first 4 bytes of keccak256 of the error
// signature) reverted by the storage contracts
enum class ContractErrorCode : uint32_t {
    BucketAlreadyExists = 0x497ef2c2,
    BucketInvalid = 0x4f4b202a,
    BucketInvalidOwner = 0xdc64d0ad,
    BucketNonexists = 0x938a92b7,
    BucketNonempty = 0x89fddc00,
    FileAlreadyExists = 0x6891dde0,
    FileInvalid = 0x77a3cbd8,
    FileNonexists = 0x21584586,
    FileNonempty = 0xc4a3b6f1,
    FileNameDuplicate = 0xd09ec7af,
    FileFullyUploaded = 0xd96b03b1,
    FileChunkDuplicate = 0x702cf740,
    BlockAlreadyExists = 0xc1edd16a,
    BlockInvalid = 0xcb20e88c,
    BlockNonexists = 0x15123121,
    InvalidArrayLength = 0x856b300d,
    InvalidFileBlocksCount = 0x17ec8370,
    InvalidLastBlockSize = 0x5660ebd2,
    InvalidEncodedSize = 0x1b6fdfeb,
    InvalidFileCID = 0xfe33db92,
    IndexMismatch = 0x37c7f255,
    NoPolicy = 0xcefa6b05,
    FileNotFilled = 0x5c371e92,
    BlockAlreadyFilled = 0xdad01942,
    ChunkCIDMismatch = 0x4b6b8ec8,
    NotBucketOwner = 0x0d6b18f0,
    BucketNotFound = 0xc4c1a0c5,
    FileDoesNotExist = 0x3bcbb0de,
    NotThePolicyOwner = 0xa2c09fea,
    CloneArgumentsTooLong = 0x94289054,
    Create2EmptyBytecode = 0x4ca249dc,
    ECDSAInvalidSignatureS = 0xf3714a9b,
    ECDSAInvalidSignatureLength = 0x367e2e27,
    ECDSAInvalidSignature = 0xf645eedf,
    AlreadyWhitelisted = 0xb73e95e1,
    InvalidAddress = 0xe6c4247b,
    NotWhitelisted = 0x584a7938,
    MathOverflowedMulDiv = 0x227bc153,
    InvalidBlocksAmount = 0xe7b199a6,
    InvalidBlockIndex = 0x59b452ef,
    LastChunkDuplicate = 0x55cbc831,
    FileNotExists = 0x2abde339,
    NotSignedByBucketOwner = 0x48e0ed68,
    NonceAlreadyUsed = 0x923b8cbb,
    OffsetOutOfBounds = 0x9605a010
};

struct ContractErrorEntry {
    ContractErrorCode code;
    const char* name;
};

static constexpr size_t CONTRACT_ERROR_COUNT = 45;

const std::array<ContractErrorEntry, CONTRACT_ERROR_COUNT>& contract_error_table();

const char* contract_error_to_string(ContractErrorCode code);

std::optional<ContractErrorCode> find_contract_error(uint32_t selector);

// First "0x" followed by 8 hex digits in message, if it names a known error
std::optional<ContractErrorCode> parse_contract_error(std::string_view message);

class ContractError : public IpcError {
public:
    explicit ContractError(ContractErrorCode code)
        : IpcError(std::string("Contract error: ") + contract_error_to_string(code)), code_(code) {}

    ContractErrorCode code() const { return code_; }
    uint32_t selector() const { return static_cast<uint32_t>(code_); }
    const char* name() const { return contract_error_to_string(code_); }

private:
    ContractErrorCode code_;
};

// Maps an error whose message carries a known selector to a ContractError;
// any other error is returned unchanged
std::exception_ptr error_from_selector(std::exception_ptr error);

// Returns null when error is OffsetOutOfBounds, otherwise error itself
std::exception_ptr ignore_offset_error(std::exception_ptr error);

} // namespace dcs::ipc

#endif // DCS_IPC_CONTRACT_ERRORS_HPP
