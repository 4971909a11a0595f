#ifndef DCS_UPLOAD_ERROR_HPP
#define DCS_UPLOAD_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dcs::upload {

class UploadError : public std::runtime_error {
public:
    explicit UploadError(const std::string& message)
        : std::runtime_error(message) {}
};

class StateSealed : public UploadError {
public:
    explicit StateSealed(const std::string& message)
        : UploadError("Upload state sealed: " + message) {}
};

class ChunksPending : public UploadError {
public:
    explicit ChunksPending(const std::string& message)
        : UploadError("Chunks pending: " + message) {}
};

class FileTooSmall : public UploadError {
public:
    explicit FileTooSmall(const std::string& message)
        : UploadError("File too small: " + message) {}
};

} // namespace dcs::upload

#endif // DCS_UPLOAD_ERROR_HPP
