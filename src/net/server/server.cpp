#include "anp/net/server/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include "anp/net/errors.hpp"
#include "anp/net/stream.hpp"
#include "anp/util/logger.hpp"

namespace anp::net::server {

class Server::Impl {
   public:
    Impl(CommandHandler handler, const ServerOptions& options,
         crypto::EncryptionConfig encryption, std::shared_ptr<IDestinationResolver> resolver)
        : handler_(std::move(handler)),
          options_(options),
          encryption_(std::move(encryption)),
          registry_(std::move(resolver)) {
        if (!handler_) {
            throw std::invalid_argument("Server needs a command handler");
        }
        // poll() blocks forever on a negative timeout and spins on zero
        if (options_.accept_timeout.count() <= 0) {
            throw std::invalid_argument("accept timeout must be positive");
        }
        if (options_.retry_delay.count() < 0 || options_.drain_timeout.count() < 0) {
            throw std::invalid_argument("retry delay and drain timeout must not be negative");
        }
    }

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard lifecycle(lifecycle_mutex_);
        if (state_ != ServerState::Stopped) {
            return;
        }

        running_ = true;
        total_connections_ = 0;

        // first attempt inline so port() is known when start() returns. if it fails the
        // accept loop keeps retrying
        try {
            open_listener();
        } catch (const ListenFailure& e) {
            LOG_ERROR("unable to open listening socket: " + std::string(e.what()));
            close_listener();
        }

        state_ = ServerState::Listening;
        accept_thread_ = std::thread(&Impl::accept_loop, this);

        LOG_INFO("Server started on " + options_.host + ":" + std::to_string(port()));
    }

    void stop() {
        std::lock_guard lifecycle(lifecycle_mutex_);
        // exchange sets the value as argument and returns old value
        // if already stopped, return early.
        if (!running_.exchange(false)) {
            return;
        }

        state_ = ServerState::Stopping;
        LOG_INFO("waiting for tcp server to stop...");

        // wake the accept loop if it is sleeping before a retry
        {
            std::lock_guard lock(wake_mutex_);
        }
        wake_cv_.notify_all();

        // the accept loop owns the listening socket and closes it on its way out
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        drain_clients();

        state_ = ServerState::Stopped;
        LOG_INFO("Server stopped");
    }

    [[nodiscard]] bool running() const noexcept {
        return running_;
    }

    [[nodiscard]] ServerState state() const noexcept {
        return state_;
    }

    [[nodiscard]] uint16_t port() const noexcept {
        return actual_port_;
    }

    [[nodiscard]] std::size_t active_connections() const {
        std::lock_guard lock(clients_mutex_);
        return count_active_locked();
    }

    [[nodiscard]] std::size_t total_connections() const noexcept {
        return total_connections_;
    }

   private:
    struct ClientInfo {
        std::string peer;
        std::shared_ptr<SocketStream> stream;
        std::thread thread;
        std::atomic<ConnectionState> state{ConnectionState::Accepted};
    };

    // ------------------------------------------------------------------------------------------
    // listening socket. only touched by start() before the accept thread exists, then only by
    // the accept thread
    // ------------------------------------------------------------------------------------------
    void open_listener() {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            throw ListenFailure("failed to create socket: " + std::string(strerror(errno)));
        }

        // SO_REUSEADDR lets us rebind immediately after a restart instead of waiting out
        // TIME_WAIT
        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            close(fd);
            throw ListenFailure("failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
        }

        // rebinding after a failure keeps the port clients already know about
        uint16_t bind_port = options_.port != 0 ? options_.port : actual_port_.load();

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(bind_port);
        if (options_.host.empty() || options_.host == "0.0.0.0") {
            addr.sin_addr.s_addr = htonl(INADDR_ANY);
        } else if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) <= 0) {
            close(fd);
            throw ListenFailure("Invalid address: " + options_.host);
        }

        if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd);
            throw ListenFailure("failed to bind to port " + std::to_string(bind_port) + ": " +
                                std::string(strerror(errno)));
        }

        // query actual bound port (for port 0)
        sockaddr_in bound_addr{};
        socklen_t bound_len = sizeof(bound_addr);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound_addr), &bound_len) == 0) {
            actual_port_ = ntohs(bound_addr.sin_port);
        } else {
            actual_port_ = bind_port;
        }

        if (listen(fd, options_.backlog) < 0) {
            close(fd);
            throw ListenFailure("failed to listen: " + std::string(strerror(errno)));
        }

        listen_fd_ = fd;
        LOG_DEBUG("listening for connections on " + options_.host + " port " +
                  std::to_string(actual_port_));
    }

    void close_listener() {
        if (listen_fd_ >= 0) {
            if (close(listen_fd_) < 0) {
                LOG_ERROR("unable to close tcp server socket: " + std::string(strerror(errno)));
            }
            listen_fd_ = -1;
        }
    }

    void accept_loop() {
        while (running_) {
            try {
                accept_once();
            } catch (const std::exception& e) {
                // drop the listening socket and build a new one on the next pass
                LOG_ERROR("unable to execute tcp server: " + std::string(e.what()));
                close_listener();
                sleep_unless_stopped(options_.retry_delay);
            }
        }
        close_listener();
    }

    void accept_once() {
        cleanup_finished_clients();

        if (listen_fd_ < 0) {
            open_listener();
        }

        std::size_t active = active_connections();
        if (active > 0) {
            LOG_DEBUG(std::to_string(active) + " tcp connections active");
        }
        if (active >= options_.max_connections) {
            sleep_unless_stopped(util::Duration(10));
            return;
        }

        // bounded wait so a shutdown request is noticed within accept_timeout
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(options_.accept_timeout.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                return;
            }
            throw ListenFailure("poll on listening socket failed: " +
                                std::string(strerror(errno)));
        }
        if (ready == 0) {
            return;  // timeout
        }
        if (pfd.revents & (POLLERR | POLLNVAL)) {
            throw ListenFailure("listening socket reported an error");
        }

        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            // the pending connection went away between poll and accept
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
                errno == ECONNABORTED) {
                return;
            }
            throw ListenFailure("accept failed: " + std::string(strerror(errno)));
        }

        char host[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &client_addr.sin_addr, host, sizeof(host));
        std::string peer = std::string(host) + ":" + std::to_string(ntohs(client_addr.sin_port));

        LOG_INFO("got connection from " + peer);
        spawn_worker(std::make_shared<SocketStream>(client_fd, peer));
    }

    void spawn_worker(std::shared_ptr<SocketStream> stream) {
        std::lock_guard lock(clients_mutex_);
        auto info = std::make_unique<ClientInfo>();
        info->peer = stream->peer();
        info->stream = std::move(stream);

        // pass a pointer: ClientInfo holds the (non-copyable) thread and lives on the heap, so
        // its address is stable while the vector grows
        try {
            info->thread = std::thread(&Impl::handle_client, this, info.get());
        } catch (const std::system_error& e) {
            LOG_ERROR("unable to start worker for " + info->peer + ": " + e.what());
            info->stream->close();
            return;
        }
        clients_.push_back(std::move(info));
        ++total_connections_;
    }

    void sleep_unless_stopped(util::Duration duration) {
        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, duration, [this] { return !running_; });
    }

    // ------------------------------------------------------------------------------------------
    // connection workers
    // ------------------------------------------------------------------------------------------
    void handle_client(ClientInfo* info) {
        const std::string& peer = info->peer;
        info->state = ConnectionState::Serving;

        try {
            FrameCodec codec(info->stream, encryption_, options_.chunk_size);

            // between messages, stop() is noticed here
            while (running_) {
                auto message = registry_.decode_incoming(codec);
                if (!message) {
                    LOG_DEBUG("connection closed by " + peer);
                    break;
                }

                LOG_INFO("received command " + to_string(*message) + " from " + peer);

                if (std::holds_alternative<Exit>(*message)) {
                    break;
                }
                if (!dispatch(codec, *message, peer)) {
                    break;
                }
            }
        } catch (const ProtocolError& e) {
            LOG_WARN("error when handling client request from " + peer + ": " + e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("error when handling client request from " + peer + ": " + e.what());
        }

        info->stream->close();
        {
            std::lock_guard lock(clients_mutex_);
            info->state = ConnectionState::Closed;
        }
        drained_cv_.notify_all();
        LOG_DEBUG("Client disconnected: " + peer);
    }

    bool dispatch(FrameCodec& codec, const Message& message, const std::string& peer) {
        try {
            handler_(codec, message);
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR("error processing command " + to_string(message) + " from " + peer + ": " +
                      e.what());
            return false;
        }
    }

    [[nodiscard]] std::size_t count_active_locked() const {
        std::size_t active = 0;
        for (const auto& info : clients_) {
            if (info->state != ConnectionState::Closed) {
                ++active;
            }
        }
        return active;
    }

    void cleanup_finished_clients() {
        std::lock_guard lock(clients_mutex_);
        auto it = clients_.begin();
        while (it != clients_.end()) {
            if ((*it)->state == ConnectionState::Closed) {
                // the worker takes no lock after marking itself Closed, so this join is short
                if ((*it)->thread.joinable()) {
                    (*it)->thread.join();
                }
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void drain_clients() {
        std::unique_lock lock(clients_mutex_);

        bool drained = drained_cv_.wait_for(lock, options_.drain_timeout,
                                            [this] { return count_active_locked() == 0; });
        if (!drained) {
            // peers that stay connected but idle would block their workers forever
            LOG_WARN("forcing " + std::to_string(count_active_locked()) +
                     " tcp connections closed");
            for (auto& info : clients_) {
                if (info->state != ConnectionState::Closed) {
                    info->stream->shutdown();
                }
            }
        }

        // join outside the lock: workers take clients_mutex_ on their way out
        std::vector<std::unique_ptr<ClientInfo>> clients = std::move(clients_);
        clients_.clear();
        lock.unlock();

        for (auto& info : clients) {
            if (info->thread.joinable()) {
                info->thread.join();
            }
        }
    }

    CommandHandler handler_;
    ServerOptions options_;
    crypto::EncryptionConfig encryption_;
    MessageRegistry registry_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<ServerState> state_{ServerState::Stopped};

    int listen_fd_ = -1;
    // written by the accept thread, read by port() from anywhere
    std::atomic<uint16_t> actual_port_{0};
    std::thread accept_thread_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    // unique_ptr keeps each ClientInfo at a stable address while the vector reallocates
    std::vector<std::unique_ptr<ClientInfo>> clients_;
    mutable std::mutex clients_mutex_;
    std::condition_variable drained_cv_;
    std::atomic<std::size_t> total_connections_{0};
};

// PIMPL INTERFACE -------------------------------------------------------------------------------
Server::Server(CommandHandler handler, const ServerOptions& options,
               crypto::EncryptionConfig encryption, std::shared_ptr<IDestinationResolver> resolver)
    : impl_(std::make_unique<Impl>(std::move(handler), options, std::move(encryption),
                                   std::move(resolver))) {}
Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;
void Server::start() {
    impl_->start();
}
void Server::stop() {
    impl_->stop();
}
bool Server::running() const noexcept {
    return impl_->running();
}
ServerState Server::state() const noexcept {
    return impl_->state();
}
uint16_t Server::port() const noexcept {
    return impl_->port();
}
std::size_t Server::active_connections() const {
    return impl_->active_connections();
}
std::size_t Server::total_connections() const noexcept {
    return impl_->total_connections();
}

}  // namespace anp::net::server
