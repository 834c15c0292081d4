#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  FormatError,        // audio does not match the negotiated format, connection-fatal
  BackendUnavailable, // backend unreachable after retries
  SegmentTimeout,     // one segment missed its deadline, session continues
  Busy,               // backpressure, client may retry
  ProtocolError,      // malformed control message, ignored
  TransportError      // backend stream broke mid-segment
};

inline const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::FormatError:
    return "FormatError";
  case ErrorKind::BackendUnavailable:
    return "BackendUnavailable";
  case ErrorKind::SegmentTimeout:
    return "SegmentTimeout";
  case ErrorKind::Busy:
    return "Busy";
  case ErrorKind::ProtocolError:
    return "ProtocolError";
  case ErrorKind::TransportError:
    return "TransportError";
  }
  return "Error";
}

class BridgeError : public std::runtime_error {
public:
  BridgeError(ErrorKind kind, const std::string &detail)
      : std::runtime_error(std::string(errorKindName(kind)) + ": " + detail),
        kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};
