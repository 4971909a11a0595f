#ifndef DCS_DAG_ERROR_HPP
#define DCS_DAG_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dcs::dag {

class DagError : public std::runtime_error {
public:
    explicit DagError(const std::string& message)
        : std::runtime_error(message) {}
};

class EmptyInput : public DagError {
public:
    explicit EmptyInput(const std::string& message)
        : DagError("Empty input: " + message) {}
};

class EncodingError : public DagError {
public:
    explicit EncodingError(const std::string& message)
        : DagError("Encoding error: " + message) {}
};

} // namespace dcs::dag

#endif // DCS_DAG_ERROR_HPP
