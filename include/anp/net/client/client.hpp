#ifndef ANP_NET_CLIENT_CLIENT_HPP
#define ANP_NET_CLIENT_CLIENT_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "anp/crypto/cipher.hpp"
#include "anp/net/codec.hpp"
#include "anp/net/message.hpp"

namespace anp::net::client {

// opens a TCP connection and wraps it in a codec. throws ConnectionError
[[nodiscard]] FrameCodec connect(const std::string& host, uint16_t port = DEFAULT_PORT,
                                 crypto::EncryptionConfig encryption =
                                     crypto::EncryptionConfig::none(),
                                 std::size_t chunk_size = DEFAULT_CHUNK_SIZE,
                                 int timeout_seconds = 0);

struct ClientOptions {
    std::string host = "127.0.0.1";
    uint16_t port = DEFAULT_PORT;
    int timeout_seconds = 30;  // per socket read/write, 0 = block forever
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
};

class Client {
   public:
    explicit Client(const ClientOptions& options = {},
                    crypto::EncryptionConfig encryption = crypto::EncryptionConfig::none());
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    void connect();
    // sends EXIT first when still connected
    void disconnect();
    [[nodiscard]] bool connected() const noexcept;

    void send(const Message& message);
    // std::nullopt once the server closed the connection
    [[nodiscard]] std::optional<Message> receive();
    // send one message, wait for one reply
    [[nodiscard]] Message request(const Message& message);

    /*
        request helpers. they return the reply (OK, BUSY or ERROR) and throw ProtocolError when
        the server answers with anything else
    */
    [[nodiscard]] std::string ping(std::string_view text);
    [[nodiscard]] Message register_node();
    [[nodiscard]] Message available();
    [[nodiscard]] Message process(std::string_view target);
    [[nodiscard]] Message copy_file(const std::filesystem::path& source,
                                    std::string_view remote_path);

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace anp::net::client

#endif
