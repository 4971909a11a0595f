#include "ipc/contract_errors.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace dcs::ipc {

namespace {

const std::array<ContractErrorEntry, CONTRACT_ERROR_COUNT> CONTRACT_ERRORS = {{
    {ContractErrorCode::BucketAlreadyExists, "BucketAlreadyExists"},
    {ContractErrorCode::BucketInvalid, "BucketInvalid"},
    {ContractErrorCode::BucketInvalidOwner, "BucketInvalidOwner"},
    {ContractErrorCode::BucketNonexists, "BucketNonexists"},
    {ContractErrorCode::BucketNonempty, "BucketNonempty"},
    {ContractErrorCode::FileAlreadyExists, "FileAlreadyExists"},
    {ContractErrorCode::FileInvalid, "FileInvalid"},
    {ContractErrorCode::FileNonexists, "FileNonexists"},
    {ContractErrorCode::FileNonempty, "FileNonempty"},
    {ContractErrorCode::FileNameDuplicate, "FileNameDuplicate"},
    {ContractErrorCode::FileFullyUploaded, "FileFullyUploaded"},
    {ContractErrorCode::FileChunkDuplicate, "FileChunkDuplicate"},
    {ContractErrorCode::BlockAlreadyExists, "BlockAlreadyExists"},
    {ContractErrorCode::BlockInvalid, "BlockInvalid"},
    {ContractErrorCode::BlockNonexists, "BlockNonexists"},
    {ContractErrorCode::InvalidArrayLength, "InvalidArrayLength"},
    {ContractErrorCode::InvalidFileBlocksCount, "InvalidFileBlocksCount"},
    {ContractErrorCode::InvalidLastBlockSize, "InvalidLastBlockSize"},
    {ContractErrorCode::InvalidEncodedSize, "InvalidEncodedSize"},
    {ContractErrorCode::InvalidFileCID, "InvalidFileCID"},
    {ContractErrorCode::IndexMismatch, "IndexMismatch"},
    {ContractErrorCode::NoPolicy, "NoPolicy"},
    {ContractErrorCode::FileNotFilled, "FileNotFilled"},
    {ContractErrorCode::BlockAlreadyFilled, "BlockAlreadyFilled"},
    {ContractErrorCode::ChunkCIDMismatch, "ChunkCIDMismatch"},
    {ContractErrorCode::NotBucketOwner, "NotBucketOwner"},
    {ContractErrorCode::BucketNotFound, "BucketNotFound"},
    {ContractErrorCode::FileDoesNotExist, "FileDoesNotExist"},
    {ContractErrorCode::NotThePolicyOwner, "NotThePolicyOwner"},
    {ContractErrorCode::CloneArgumentsTooLong, "CloneArgumentsTooLong"},
    {ContractErrorCode::Create2EmptyBytecode, "Create2EmptyBytecode"},
    {ContractErrorCode::ECDSAInvalidSignatureS, "ECDSAInvalidSignatureS"},
    {ContractErrorCode::ECDSAInvalidSignatureLength, "ECDSAInvalidSignatureLength"},
    {ContractErrorCode::ECDSAInvalidSignature, "ECDSAInvalidSignature"},
    {ContractErrorCode::AlreadyWhitelisted, "AlreadyWhitelisted"},
    {ContractErrorCode::InvalidAddress, "InvalidAddress"},
    {ContractErrorCode::NotWhitelisted, "NotWhitelisted"},
    {ContractErrorCode::MathOverflowedMulDiv, "MathOverflowedMulDiv"},
    {ContractErrorCode::InvalidBlocksAmount, "InvalidBlocksAmount"},
    {ContractErrorCode::InvalidBlockIndex, "InvalidBlockIndex"},
    {ContractErrorCode::LastChunkDuplicate, "LastChunkDuplicate"},
    {ContractErrorCode::FileNotExists, "FileNotExists"},
    {ContractErrorCode::NotSignedByBucketOwner, "NotSignedByBucketOwner"},
    {ContractErrorCode::NonceAlreadyUsed, "NonceAlreadyUsed"},
    {ContractErrorCode::OffsetOutOfBounds, "OffsetOutOfBounds"}
}};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<ContractErrorCode> code_of(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const ContractError& e) {
        return e.code();
    } catch (const std::exception& e) {
        return parse_contract_error(e.what());
    }
    return std::nullopt;
}

} // namespace

const std::array<ContractErrorEntry, CONTRACT_ERROR_COUNT>& contract_error_table() {
    return CONTRACT_ERRORS;
}

const char* contract_error_to_string(ContractErrorCode code) {
    for (const auto& entry : CONTRACT_ERRORS) {
        if (entry.code == code) {
            return entry.name;
        }
    }
    return "UnknownContractError";
}

std::optional<ContractErrorCode> find_contract_error(uint32_t selector) {
    auto it = std::find_if(CONTRACT_ERRORS.begin(), CONTRACT_ERRORS.end(),
                           [selector](const ContractErrorEntry& entry) {
                               return static_cast<uint32_t>(entry.code) == selector;
                           });
    if (it == CONTRACT_ERRORS.end()) {
        return std::nullopt;
    }
    return it->code;
}

std::optional<ContractErrorCode> parse_contract_error(std::string_view message) {
    for (size_t pos = message.find("0x"); pos != std::string_view::npos; pos = message.find("0x", pos + 1)) {
        if (pos + 10 > message.size()) {
            break;
        }
        uint32_t selector = 0;
        bool valid = true;
        for (size_t i = pos + 2; i < pos + 10; ++i) {
            int digit = hex_value(message[i]);
            if (digit < 0) {
                valid = false;
                break;
            }
            selector = (selector << 4) | static_cast<uint32_t>(digit);
        }
        if (valid) {
            return find_contract_error(selector);
        }
    }
    return std::nullopt;
}

std::exception_ptr error_from_selector(std::exception_ptr error) {
    if (!error) {
        return error;
    }
    std::optional<ContractErrorCode> code = code_of(error);
    if (!code) {
        return error;
    }
    BOOST_LOG_TRIVIAL(debug) << "IPC: Mapped revert to " << contract_error_to_string(*code);
    return std::make_exception_ptr(ContractError(*code));
}

std::exception_ptr ignore_offset_error(std::exception_ptr error) {
    if (error && code_of(error) == ContractErrorCode::OffsetOutOfBounds) {
        BOOST_LOG_TRIVIAL(debug) << "IPC: Ignoring OffsetOutOfBounds";
        return nullptr;
    }
    return error;
}

} // namespace dcs::ipc
