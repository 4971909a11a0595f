#ifndef DCS_CID_ERROR_HPP
#define DCS_CID_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dcs::cid {

class CidError : public std::runtime_error {
public:
    explicit CidError(const std::string& message)
        : std::runtime_error(message) {}
};

class MalformedCid : public CidError {
public:
    explicit MalformedCid(const std::string& message)
        : CidError("Malformed CID: " + message) {}
};

class CidMismatch : public CidError {
public:
    explicit CidMismatch(const std::string& message)
        : CidError("CID mismatch: " + message) {}
};

class UnsupportedVersion : public CidError {
public:
    explicit UnsupportedVersion(const std::string& message)
        : CidError("Unsupported CID version: " + message) {}
};

} // namespace dcs::cid

#endif // DCS_CID_ERROR_HPP
