#ifndef ANP_NET_STREAM_HPP
#define ANP_NET_STREAM_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace anp::net {

// byte-oriented duplex connection. a single call may transfer fewer bytes than asked for
class IStream {
   public:
    virtual ~IStream() = default;

    // returns 0 at end of stream. throws ConnectionError
    [[nodiscard]] virtual std::size_t read_some(uint8_t* buf, std::size_t len) = 0;
    // returns bytes accepted, always > 0. throws ConnectionError
    [[nodiscard]] virtual std::size_t write_some(const uint8_t* buf, std::size_t len) = 0;

    // wake up blocked readers/writers without releasing the handle. safe from any thread
    virtual void shutdown() = 0;
    virtual void close() = 0;

    [[nodiscard]] virtual std::string peer() const = 0;
};

class SocketStream : public IStream {
   public:
    // takes ownership of a connected socket
    explicit SocketStream(int fd, std::string peer = "");
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    [[nodiscard]] std::size_t read_some(uint8_t* buf, std::size_t len) override;
    [[nodiscard]] std::size_t write_some(const uint8_t* buf, std::size_t len) override;

    void shutdown() override;
    void close() override;

    [[nodiscard]] std::string peer() const override {
        return peer_;
    }

    [[nodiscard]] bool is_open() const noexcept {
        return fd_.load() >= 0;
    }

   private:
    // fd_ is read without the lock on the owning thread; close()/shutdown() take the lock so
    // a shutdown from another thread never hits a closed (and possibly reused) descriptor
    std::atomic<int> fd_;
    std::string peer_;
    std::mutex mutex_;
};

// "1.2.3.4:5678" for an AF_INET peer
[[nodiscard]] std::string peer_address(int fd);

}  // namespace anp::net

#endif
