#ifndef PORTAL_PROTOCOL_ERROR_HPP
#define PORTAL_PROTOCOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace portal {
namespace protocol {

/*
  error.hpp
  --------------------------------
  Errors that end an operation. Transport and framing failures are fatal to a
  connection; file access and digest failures are fatal to one transfer and
  are reported through that transfer's result channel.

  Protocol-level outcomes (unknown file id, checksum mismatch, save failure)
  are NOT errors: they travel as ordinary Response variants.
*/

enum class ErrorKind {
    Io,
    ConnectionFailed,
    Disconnected,
    DataTooLarge,
    MalformedFrame,
    NotAFile,
    FileAccess,
    DigestFailed
};

inline const char *errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Io:               return "io error";
    case ErrorKind::ConnectionFailed: return "connection failed";
    case ErrorKind::Disconnected:     return "disconnected";
    case ErrorKind::DataTooLarge:     return "data too large";
    case ErrorKind::MalformedFrame:   return "malformed frame";
    case ErrorKind::NotAFile:         return "not a file";
    case ErrorKind::FileAccess:       return "file access error";
    case ErrorKind::DigestFailed:     return "digest failed";
    }
    return "unknown error";
}

class PortalError : public std::runtime_error
{
public:
    PortalError(ErrorKind kind, const std::string &detail)
        : std::runtime_error(std::string(errorKindName(kind)) + ": " + detail)
        , kind_(kind)
    {
    }

    ErrorKind kind() const { return kind_; }

    /// True for errors after which the connection can no longer be used.
    bool isConnectionFatal() const
    {
        return kind_ == ErrorKind::Io || kind_ == ErrorKind::ConnectionFailed ||
               kind_ == ErrorKind::Disconnected || kind_ == ErrorKind::MalformedFrame;
    }

private:
    ErrorKind kind_;
};

} // namespace protocol
} // namespace portal

#endif // PORTAL_PROTOCOL_ERROR_HPP
