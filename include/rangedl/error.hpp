#pragma once

#include <stdexcept>
#include <string>

namespace rangedl {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The request could not be sent or the response could not be received.
class TransportError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Non-success status, or metadata that is missing or malformed.
class ProtocolError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class EmptyResourceError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// The other end of the result channel is gone.
class ChannelClosedError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class InvalidUrlError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class IoError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

} // namespace rangedl
