#ifndef IFS_COMMON_IFS_ERROR_HPP
#define IFS_COMMON_IFS_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ifs {

// Failure kinds reported to download clients. Values are part of the wire format.
enum class ErrorKind : uint8_t {
    NOT_FOUND = 1,
    RANGE_ERROR = 2,
    STORE_INCONSISTENCY = 3,
    TRANSPORT_FAILURE = 4,
    INVALID_ARGUMENT = 5,
    ALREADY_EXISTS = 6,
    INTERNAL = 7
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "Not found";
        case ErrorKind::RANGE_ERROR: return "Range error";
        case ErrorKind::STORE_INCONSISTENCY: return "Store inconsistency";
        case ErrorKind::TRANSPORT_FAILURE: return "Transport failure";
        case ErrorKind::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorKind::ALREADY_EXISTS: return "Already exists";
        case ErrorKind::INTERNAL: return "Internal error";
        default: return "Undefined error";
    }
}

// Returns true if the raw byte names a known ErrorKind
inline bool is_valid_error_kind(uint8_t raw) {
    return raw >= static_cast<uint8_t>(ErrorKind::NOT_FOUND) &&
           raw <= static_cast<uint8_t>(ErrorKind::INTERNAL);
}

class IfsError : public std::runtime_error {
public:
    IfsError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class NotFoundError : public IfsError {
public:
    explicit NotFoundError(const std::string& message)
        : IfsError(ErrorKind::NOT_FOUND, message) {}
};

class RangeError : public IfsError {
public:
    explicit RangeError(const std::string& message)
        : IfsError(ErrorKind::RANGE_ERROR, message) {}
};

class StoreInconsistencyError : public IfsError {
public:
    explicit StoreInconsistencyError(const std::string& message)
        : IfsError(ErrorKind::STORE_INCONSISTENCY, message) {}
};

class TransportError : public IfsError {
public:
    explicit TransportError(const std::string& message)
        : IfsError(ErrorKind::TRANSPORT_FAILURE, message) {}
};

class InvalidArgumentError : public IfsError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : IfsError(ErrorKind::INVALID_ARGUMENT, message) {}
};

class AlreadyExistsError : public IfsError {
public:
    explicit AlreadyExistsError(const std::string& message)
        : IfsError(ErrorKind::ALREADY_EXISTS, message) {}
};

} // namespace ifs

#endif // IFS_COMMON_IFS_ERROR_HPP
