#ifndef ANP_NET_ERRORS_HPP
#define ANP_NET_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace anp::net {

/*
    a clean close at a frame boundary is NOT an error: read primitives return std::nullopt for
    it. everything below tears down the connection it happened on, and only that connection.
*/
class ProtocolError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// peer closed after part of a value was delivered
class TruncatedStream : public ProtocolError {
   public:
    explicit TruncatedStream(std::size_t remaining)
        : ProtocolError("expected " + std::to_string(remaining) +
                        " more bytes but got end of stream"),
          remaining_(remaining) {}

    [[nodiscard]] std::size_t remaining() const noexcept {
        return remaining_;
    }

   private:
    std::size_t remaining_;
};

class UnknownCommand : public ProtocolError {
   public:
    explicit UnknownCommand(uint32_t command)
        : ProtocolError("unknown command " + std::to_string(command)), command_(command) {}

    [[nodiscard]] uint32_t command() const noexcept {
        return command_;
    }

   private:
    uint32_t command_;
};

// bytes arrived in full but don't form a valid value (bad cipher text, bad utf-16, bad path)
class DecodeError : public ProtocolError {
   public:
    using ProtocolError::ProtocolError;
};

// a socket call failed
class ConnectionError : public ProtocolError {
   public:
    using ProtocolError::ProtocolError;
};

// the listening socket could not be opened or accepted from. the accept loop recovers
class ListenFailure : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

}  // namespace anp::net

#endif
