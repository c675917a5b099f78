/**
 * @file error.cpp
 * @brief Error code to exception mapping.
 */

#include <statuslist/error.hpp>

namespace statuslist {

void throw_if_error(Error error, const std::string& context) {
    if (error == Error::Ok) {
        return;
    }

    std::string message = context.empty() ? std::string(error_string(error))
                                          : context + ": " + error_string(error);

    switch (error) {
    case Error::InvalidBitWidth:
        throw InvalidBitWidthException(message);
    case Error::ValueOutOfRange:
        throw ValueOutOfRangeException(message);
    case Error::IndexOutOfBounds:
        throw IndexOutOfBoundsException(message);
    case Error::BuilderAlreadyFinalized:
        throw BuilderAlreadyFinalizedException(message);
    case Error::CorruptData:
        throw CorruptDataException(message);
    case Error::DecompressionLimitExceeded:
        throw DecompressionLimitExceededException(message);
    case Error::MalformedEncoding:
        throw MalformedEncodingException(message);
    case Error::CompressionFailed:
        throw CompressionFailedException(message);
    case Error::InvalidArgument:
    default:
        throw InvalidArgumentException(message);
    }
}

} // namespace statuslist
