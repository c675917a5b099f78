/**
 * @file error.hpp
 * @brief Status list error handling.
 *
 * Low-level routines (bit packing, compression, base64) report an Error
 * code. The object-level API (builder, decoder, serialization) throws the
 * matching StatusListException subclass, carrying the same code.
 */

#ifndef STATUSLIST_ERROR_HPP
#define STATUSLIST_ERROR_HPP

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace statuslist {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                          ///< Success
    InvalidBitWidth = -1,            ///< Bit width outside {1, 2, 4, 8}
    ValueOutOfRange = -2,            ///< Status code does not fit the bit width
    IndexOutOfBounds = -3,           ///< Status index beyond the list capacity
    BuilderAlreadyFinalized = -4,    ///< Builder used after build()
    CorruptData = -5,                ///< Malformed or truncated compressed data
    DecompressionLimitExceeded = -6, ///< Decompressed size exceeds the configured bound
    MalformedEncoding = -7,          ///< Invalid wire encoding (JSON, CBOR, base64, hex)
    InvalidArgument = -8,            ///< Invalid runtime parameter
    CompressionFailed = -9           ///< Compressor-internal failure
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidBitWidth:
        return "Invalid bit width (must be 1, 2, 4 or 8)";
    case Error::ValueOutOfRange:
        return "Status value out of range for bit width";
    case Error::IndexOutOfBounds:
        return "Status index out of bounds";
    case Error::BuilderAlreadyFinalized:
        return "Builder already finalized";
    case Error::CorruptData:
        return "Corrupt or truncated compressed data";
    case Error::DecompressionLimitExceeded:
        return "Decompressed size exceeds limit";
    case Error::MalformedEncoding:
        return "Malformed encoding";
    case Error::InvalidArgument:
        return "Invalid argument";
    case Error::CompressionFailed:
        return "Compression failed";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for status list errors.
 */
class StatusListException : public std::runtime_error {
public:
    explicit StatusListException(const std::string& message, Error code = Error::InvalidArgument)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for a bit width outside {1, 2, 4, 8}.
 */
class InvalidBitWidthException : public StatusListException {
public:
    explicit InvalidBitWidthException(const std::string& message)
        : StatusListException(message, Error::InvalidBitWidth) {}
};

/**
 * @brief Exception for a status code that does not fit the bit width.
 */
class ValueOutOfRangeException : public StatusListException {
public:
    explicit ValueOutOfRangeException(const std::string& message)
        : StatusListException(message, Error::ValueOutOfRange) {}
};

/**
 * @brief Exception for a lookup past the list capacity.
 */
class IndexOutOfBoundsException : public StatusListException {
public:
    explicit IndexOutOfBoundsException(const std::string& message)
        : StatusListException(message, Error::IndexOutOfBounds) {}
};

/**
 * @brief Exception for builder use after build().
 */
class BuilderAlreadyFinalizedException : public StatusListException {
public:
    explicit BuilderAlreadyFinalizedException(const std::string& message)
        : StatusListException(message, Error::BuilderAlreadyFinalized) {}
};

/**
 * @brief Exception for corrupt or truncated compressed data.
 */
class CorruptDataException : public StatusListException {
public:
    explicit CorruptDataException(const std::string& message)
        : StatusListException(message, Error::CorruptData) {}
};

/**
 * @brief Exception for a payload that inflates past the expansion limit.
 */
class DecompressionLimitExceededException : public StatusListException {
public:
    explicit DecompressionLimitExceededException(const std::string& message)
        : StatusListException(message, Error::DecompressionLimitExceeded) {}
};

/**
 * @brief Exception for structurally invalid wire data.
 */
class MalformedEncodingException : public StatusListException {
public:
    explicit MalformedEncodingException(const std::string& message)
        : StatusListException(message, Error::MalformedEncoding) {}
};

/**
 * @brief Exception for invalid runtime parameters.
 */
class InvalidArgumentException : public StatusListException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : StatusListException(message, Error::InvalidArgument) {}
};

/**
 * @brief Exception for compressor-internal failures.
 */
class CompressionFailedException : public StatusListException {
public:
    explicit CompressionFailedException(const std::string& message)
        : StatusListException(message, Error::CompressionFailed) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code to raise
 * @param context Prefix for the exception message
 */
void throw_if_error(Error error, const std::string& context);

} // namespace statuslist

#endif // STATUSLIST_ERROR_HPP
