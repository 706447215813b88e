#include "anp/net/client/client.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "anp/net/errors.hpp"
#include "anp/net/registry.hpp"
#include "anp/net/stream.hpp"
#include "anp/util/logger.hpp"

namespace anp::net::client {

FrameCodec connect(const std::string& host, uint16_t port, crypto::EncryptionConfig encryption,
                   std::size_t chunk_size, int timeout_seconds) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw ConnectionError("unable to resolve " + host + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addresses(result, &freeaddrinfo);

    std::string last_error = "no addresses";
    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = strerror(errno);
            continue;
        }

        if (timeout_seconds > 0) {
            struct timeval tv;
            tv.tv_sec = timeout_seconds;
            tv.tv_usec = 0;
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = strerror(errno);
            close(fd);
            continue;
        }

        auto stream = std::make_shared<SocketStream>(fd, host + ":" + service);
        return FrameCodec(std::move(stream), std::move(encryption), chunk_size);
    }

    throw ConnectionError("failed to connect to " + host + ":" + service + ": " + last_error);
}

class Client::Impl {
   public:
    Impl(const ClientOptions& options, crypto::EncryptionConfig encryption)
        : options_(options), encryption_(std::move(encryption)) {}

    ~Impl() {
        disconnect();
    }

    void connect() {
        if (codec_) {
            return;
        }
        codec_.emplace(client::connect(options_.host, options_.port, encryption_,
                                       options_.chunk_size, options_.timeout_seconds));
    }

    void disconnect() {
        if (!codec_) {
            return;
        }
        // best effort: the server also treats a plain close as the end of the session
        try {
            registry_.encode_outgoing(*codec_, Exit{});
        } catch (const std::exception& e) {
            LOG_DEBUG("unable to send exit to " + codec_->peer() + ": " + e.what());
        }
        codec_->close();
        codec_.reset();
    }

    [[nodiscard]] bool connected() const noexcept {
        return codec_.has_value();
    }

    void send(const Message& message) {
        auto& codec = require_connection();
        try {
            registry_.encode_outgoing(codec, message);
        } catch (const ProtocolError&) {
            // the frame was cut short on the wire
            drop();
            throw;
        }
    }

    [[nodiscard]] std::optional<Message> receive() {
        auto& codec = require_connection();
        std::optional<Message> reply;
        try {
            reply = registry_.decode_incoming(codec);
        } catch (const ProtocolError&) {
            drop();
            throw;
        }
        if (!reply) {
            drop();
        }
        return reply;
    }

    [[nodiscard]] Message request(const Message& message) {
        send(message);
        auto reply = receive();
        if (!reply) {
            throw ConnectionError("connection closed by server while waiting for reply to " +
                                  std::string(command_name(command_of(message))));
        }
        return std::move(*reply);
    }

    [[nodiscard]] std::string ping(std::string_view text) {
        auto reply = request(Ping{std::string(text)});
        if (auto* pong = std::get_if<Pong>(&reply)) {
            return pong->message;
        }
        if (auto* error = std::get_if<Error>(&reply)) {
            throw std::runtime_error("PING failed: " + error->error_message);
        }
        throw ProtocolError("unexpected reply to ping: " + to_string(reply));
    }

    [[nodiscard]] Message status_request(const Message& message) {
        auto reply = request(message);
        if (std::holds_alternative<Ok>(reply) || std::holds_alternative<Busy>(reply) ||
            std::holds_alternative<Error>(reply)) {
            return reply;
        }
        throw ProtocolError("unexpected reply to " +
                            std::string(command_name(command_of(message))) + ": " +
                            to_string(reply));
    }

   private:
    FrameCodec& require_connection() {
        if (!codec_) {
            throw ConnectionError("Not connected");
        }
        return *codec_;
    }

    // the stream position is unknown after a failure; the connection can't be reused
    void drop() {
        if (codec_) {
            codec_->close();
            codec_.reset();
        }
    }

    ClientOptions options_;
    crypto::EncryptionConfig encryption_;
    MessageRegistry registry_;
    std::optional<FrameCodec> codec_;
};

// PIMPL INTERFACE ------------------------------------------------------------------------
Client::Client(const ClientOptions& options, crypto::EncryptionConfig encryption)
    : impl_(std::make_unique<Impl>(options, std::move(encryption))) {}
Client::~Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;
void Client::connect() {
    impl_->connect();
}
void Client::disconnect() {
    impl_->disconnect();
}
bool Client::connected() const noexcept {
    return impl_->connected();
}
void Client::send(const Message& message) {
    impl_->send(message);
}
std::optional<Message> Client::receive() {
    return impl_->receive();
}
Message Client::request(const Message& message) {
    return impl_->request(message);
}
std::string Client::ping(std::string_view text) {
    return impl_->ping(text);
}
Message Client::register_node() {
    return impl_->status_request(Register{});
}
Message Client::available() {
    return impl_->status_request(Available{});
}
Message Client::process(std::string_view target) {
    return impl_->status_request(Process{std::string(target)});
}
Message Client::copy_file(const std::filesystem::path& source, std::string_view remote_path) {
    CopyFile message;
    message.path = std::string(remote_path);
    message.source = source;
    return impl_->status_request(message);
}

}  // namespace anp::net::client
