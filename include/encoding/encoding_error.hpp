#ifndef DCS_ENCODING_ERROR_HPP
#define DCS_ENCODING_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dcs::encoding {

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message)
        : std::runtime_error("Decode error: " + message) {}
};

} // namespace dcs::encoding

#endif // DCS_ENCODING_ERROR_HPP
