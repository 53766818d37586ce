#pragma once

/**
 * @file stream_errors.h
 * @brief Exception types raised by piecestream
 *
 * Invalid arguments are reported with std::invalid_argument.
 */

#include <stdexcept>
#include <string>

namespace piecestream {

/// Operation on a stream or accessor that has been closed
class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& what) : std::logic_error(what) {}
};

/// Failure of the underlying storage
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

/// The stream ended before the requested number of bytes was read
class EndOfStreamError : public IoError {
public:
    explicit EndOfStreamError(const std::string& what) : IoError(what) {}
};

/// A wait for a piece was cancelled through its CancellationToken
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what) : std::runtime_error(what) {}
};

/// A wait for a piece did not finish within the configured timeout
class PieceWaitTimeout : public std::runtime_error {
public:
    explicit PieceWaitTimeout(const std::string& what) : std::runtime_error(what) {}
};

} // namespace piecestream
