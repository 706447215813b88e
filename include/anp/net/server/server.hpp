#ifndef ANP_NET_SERVER_SERVER_HPP
#define ANP_NET_SERVER_SERVER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "anp/crypto/cipher.hpp"
#include "anp/net/codec.hpp"
#include "anp/net/message.hpp"
#include "anp/net/registry.hpp"
#include "anp/util/types.hpp"

namespace anp::net::server {

/*
    called on the connection's own worker thread, once per decoded message other than EXIT.
    may write any number of replies through codec. anything it throws is logged and ends that
    connection only.
*/
using CommandHandler = std::function<void(FrameCodec& codec, const Message& message)>;

enum class ServerState {
    Stopped,
    Listening,
    Stopping,
};

enum class ConnectionState {
    Accepted,
    Serving,
    Closed,
};

struct ServerOptions {
    std::string host = "127.0.0.1";  // "0.0.0.0" for every interface
    uint16_t port = DEFAULT_PORT;    // 0 picks a free port, see Server::port()
    int backlog = 5;
    std::size_t max_connections = 1000;
    util::Duration accept_timeout{1000};  // how often the accept loop re-checks for shutdown
    util::Duration retry_delay{1000};     // pause before reopening a failed listening socket
    util::Duration drain_timeout{5000};   // grace period for open connections on stop()
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
};

class Server {
   public:
    Server(CommandHandler handler, const ServerOptions& options = {},
           crypto::EncryptionConfig encryption = crypto::EncryptionConfig::none(),
           std::shared_ptr<IDestinationResolver> resolver = nullptr);
    ~Server();
    /*
        server owns Impl which has threads & mutexes and socket fds under the hood: no copies.
        with PIMPL a move only transfers the pointer, so moves are allowed.
    */
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    // listening failures are logged and retried in the background, never thrown
    void start();
    // joins the accept loop and every connection worker
    void stop();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] ServerState state() const noexcept;
    // actual bound port, also when options.port was 0. 0 until a bind succeeded
    [[nodiscard]] uint16_t port() const noexcept;

    // connections not yet Closed
    [[nodiscard]] std::size_t active_connections() const;
    // connections accepted since start()
    [[nodiscard]] std::size_t total_connections() const noexcept;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace anp::net::server

#endif
