#include "anp/net/server/server.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "anp/net/client/client.hpp"
#include "anp/net/errors.hpp"

namespace anp::net::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(10ms);
    }
    return true;
}

class ServerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        opts_.port = 0;  // any free port, read back through server_->port()
        opts_.backlog = 64;
        opts_.accept_timeout = 50ms;
        opts_.retry_delay = 50ms;
        opts_.drain_timeout = 200ms;
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
    }

    // REGISTER -> OK, PING -> PONG, PROCESS "fail" throws, everything else -> ERROR
    void start(crypto::EncryptionConfig encryption = crypto::EncryptionConfig::none(),
               std::shared_ptr<IDestinationResolver> resolver = nullptr) {
        server_ = std::make_unique<server::Server>(
            [this](FrameCodec& codec, const Message& message) {
                ++handled_;
                if (std::holds_alternative<Register>(message)) {
                    ++registrations_;
                    replies_.encode_outgoing(codec, Ok{});
                } else if (const auto* ping = std::get_if<Ping>(&message)) {
                    replies_.encode_outgoing(codec, Pong{ping->message});
                } else if (const auto* process = std::get_if<Process>(&message)) {
                    if (process->target == "fail") {
                        throw std::runtime_error("handler failure");
                    }
                    replies_.encode_outgoing(codec, Ok{});
                } else if (std::holds_alternative<CopyFile>(message)) {
                    replies_.encode_outgoing(codec, Ok{});
                } else {
                    replies_.encode_outgoing(codec, Error{"unsupported"});
                }
            },
            opts_, std::move(encryption), std::move(resolver));
        server_->start();
        ASSERT_NE(server_->port(), 0);
    }

    client::ClientOptions client_options() const {
        client::ClientOptions options;
        options.host = "127.0.0.1";
        options.port = server_->port();
        options.timeout_seconds = 5;
        return options;
    }

    server::ServerOptions opts_;
    MessageRegistry replies_;
    std::atomic<int> handled_{0};
    std::atomic<int> registrations_{0};
    // last, so its workers are gone before the state they use
    std::unique_ptr<server::Server> server_;
};

TEST_F(ServerTest, StartAndStop) {
    start();
    EXPECT_TRUE(server_->running());
    EXPECT_EQ(server_->state(), server::ServerState::Listening);

    server_->stop();
    EXPECT_FALSE(server_->running());
    EXPECT_EQ(server_->state(), server::ServerState::Stopped);

    // a second stop is a no-op
    server_->stop();
    EXPECT_EQ(server_->state(), server::ServerState::Stopped);
}

TEST_F(ServerTest, PingPong) {
    start();
    client::Client client(client_options());
    client.connect();
    EXPECT_EQ(client.ping("hello"), "hello");
    EXPECT_EQ(client.ping(""), "");
    client.disconnect();
}

TEST_F(ServerTest, HandlerMayReplyManyTimesPerConnection) {
    start();
    client::Client client(client_options());
    client.connect();
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(client.ping("n" + std::to_string(i)), "n" + std::to_string(i));
    }
    EXPECT_EQ(handled_, 20);
}

TEST_F(ServerTest, ExitClosesConnection) {
    start();
    auto codec = client::connect("127.0.0.1", server_->port());
    MessageRegistry registry;
    registry.encode_outgoing(codec, Exit{});
    EXPECT_FALSE(registry.decode_incoming(codec).has_value());
    EXPECT_EQ(handled_, 0);
}

TEST_F(ServerTest, ConcurrentClients) {
    start();
    constexpr int CLIENTS = 50;

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < CLIENTS; ++i) {
        threads.emplace_back([this, &ok] {
            try {
                client::Client client(client_options());
                client.connect();
                if (std::holds_alternative<Ok>(client.register_node())) {
                    ++ok;
                }
                client.disconnect();
            } catch (const std::exception& e) {
                ADD_FAILURE() << e.what();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(ok, CLIENTS);
    EXPECT_EQ(registrations_, CLIENTS);
    EXPECT_TRUE(wait_until([this] { return server_->active_connections() == 0; }));
    EXPECT_EQ(server_->total_connections(), static_cast<std::size_t>(CLIENTS));
}

TEST_F(ServerTest, UnknownCommandOnlyClosesThatConnection) {
    start();
    client::Client healthy(client_options());
    healthy.connect();

    auto codec = client::connect("127.0.0.1", server_->port(), crypto::EncryptionConfig::none(),
                                 DEFAULT_CHUNK_SIZE, 5);
    codec.write_uint32(9999);
    MessageRegistry registry;
    EXPECT_FALSE(registry.decode_incoming(codec).has_value());

    EXPECT_EQ(healthy.ping("still here"), "still here");
    EXPECT_TRUE(server_->running());
}

TEST_F(ServerTest, TruncatedFrameOnlyClosesThatConnection) {
    start();
    client::Client healthy(client_options());
    healthy.connect();

    {
        auto codec = client::connect("127.0.0.1", server_->port());
        codec.write_uint32(static_cast<uint32_t>(CommandId::Ping));
        codec.write_uint32(100);  // block header without its payload
        codec.close();
    }

    EXPECT_EQ(healthy.ping("ok"), "ok");
    EXPECT_TRUE(wait_until([this] { return server_->active_connections() == 1; }));
}

TEST_F(ServerTest, HandlerFailureOnlyClosesThatConnection) {
    start();
    client::Client healthy(client_options());
    healthy.connect();

    client::Client failing(client_options());
    failing.connect();
    EXPECT_THROW((void)failing.process("fail"), ProtocolError);
    EXPECT_FALSE(failing.connected());

    EXPECT_EQ(healthy.ping("alive"), "alive");
    EXPECT_TRUE(std::holds_alternative<Ok>(healthy.process("work")));
}

TEST_F(ServerTest, StopWithIdleConnections) {
    start();
    client::Client first(client_options());
    client::Client second(client_options());
    first.connect();
    second.connect();
    EXPECT_EQ(first.ping("a"), "a");
    EXPECT_EQ(second.ping("b"), "b");
    EXPECT_EQ(server_->active_connections(), 2u);

    auto begin = std::chrono::steady_clock::now();
    server_->stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(server_->state(), server::ServerState::Stopped);
    EXPECT_EQ(server_->active_connections(), 0u);
    EXPECT_LT(elapsed, 3s);

    // the server side is gone; the next request can't get a reply
    EXPECT_THROW((void)first.ping("gone"), ProtocolError);
}

TEST_F(ServerTest, RestartAfterStop) {
    start();
    server_->stop();
    server_->start();
    EXPECT_EQ(server_->state(), server::ServerState::Listening);

    client::Client client(client_options());
    client.connect();
    EXPECT_EQ(client.ping("again"), "again");
}

TEST_F(ServerTest, EncryptedPing) {
    auto encryption = crypto::EncryptionConfig::from_secret("node-key");
    start(encryption);

    client::Client client(client_options(), encryption);
    client.connect();
    EXPECT_EQ(client.ping("encrypted hello"), "encrypted hello");
}

TEST_F(ServerTest, WrongSecretIsRejected) {
    start(crypto::EncryptionConfig::from_secret("server-key"));

    client::Client client(client_options(), crypto::EncryptionConfig::from_secret("other-key"));
    client.connect();
    EXPECT_THROW((void)client.ping("hello"), ProtocolError);
    EXPECT_EQ(handled_, 0);
}

TEST_F(ServerTest, CopyFileLandsInDataDirectory) {
    fs::path dir = fs::temp_directory_path() / ("anp_server_test_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path source = dir / "source.bin";
    std::string content(300 * 1024, 'q');
    {
        std::ofstream out(source, std::ios::binary);
        out << content;
    }

    start(crypto::EncryptionConfig::none(), std::make_shared<DirectoryResolver>(dir / "data"));

    client::Client client(client_options());
    client.connect();
    EXPECT_TRUE(std::holds_alternative<Ok>(client.copy_file(source, "in/copied.bin")));

    fs::path landed = dir / "data" / "in" / "copied.bin";
    ASSERT_TRUE(fs::exists(landed));
    EXPECT_EQ(fs::file_size(landed), content.size());

    client.disconnect();
    fs::remove_all(dir);
}

TEST_F(ServerTest, CopyFileWithoutDestinationPolicyClosesConnection) {
    fs::path source = fs::temp_directory_path() /
                      ("anp_server_test_src_" + std::to_string(::getpid()) + ".txt");
    {
        std::ofstream out(source);
        out << "data";
    }
    start();

    client::Client client(client_options());
    client.connect();
    EXPECT_THROW((void)client.copy_file(source, "x.txt"), ProtocolError);
    EXPECT_EQ(handled_, 0);
    fs::remove(source);
}

TEST_F(ServerTest, RejectsNullHandler) {
    EXPECT_THROW({ server::Server unusable{server::CommandHandler{}}; }, std::invalid_argument);
}

TEST_F(ServerTest, RejectsNonPositiveAcceptTimeout) {
    auto handler = [](FrameCodec&, const Message&) {};

    opts_.accept_timeout = util::Duration(0);
    EXPECT_THROW({ server::Server unusable(handler, opts_); }, std::invalid_argument);

    opts_.accept_timeout = util::Duration(-1);
    EXPECT_THROW({ server::Server unusable(handler, opts_); }, std::invalid_argument);

    opts_.accept_timeout = 50ms;
    opts_.drain_timeout = util::Duration(-1);
    EXPECT_THROW({ server::Server unusable(handler, opts_); }, std::invalid_argument);
}

}  // namespace anp::net::test
