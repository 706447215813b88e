#include "anp/node/node_handler.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "support/memory_stream.hpp"

namespace anp::node::test {

using anp::test::MemoryStream;

class NodeHandlerTest : public ::testing::Test {
   protected:
    // run one message through the handler and decode the single reply
    net::Message handle(NodeHandler& handler, const net::Message& message) {
        auto out = std::make_shared<MemoryStream>();
        net::FrameCodec codec(out);
        handler(codec, message);

        net::FrameCodec replies(std::make_shared<MemoryStream>(out->output()));
        net::MessageRegistry registry;
        auto reply = registry.decode_incoming(replies);
        EXPECT_TRUE(reply.has_value());
        EXPECT_FALSE(registry.decode_incoming(replies).has_value()) << "more than one reply";
        return reply.value_or(net::Exit{});
    }
};

TEST_F(NodeHandlerTest, RegisterCounts) {
    NodeHandler handler;
    EXPECT_EQ(handle(handler, net::Register{}), net::Message(net::Ok{}));
    EXPECT_EQ(handle(handler, net::Register{}), net::Message(net::Ok{}));
    EXPECT_EQ(handler.registrations(), 2u);
}

TEST_F(NodeHandlerTest, PingEchoes) {
    NodeHandler handler;
    EXPECT_EQ(handle(handler, net::Ping{"are you there"}),
              net::Message(net::Pong{"are you there"}));
}

TEST_F(NodeHandlerTest, Available) {
    NodeHandler handler;
    EXPECT_EQ(handle(handler, net::Available{}), net::Message(net::Ok{}));
}

TEST_F(NodeHandlerTest, ProcessRunsCallback) {
    std::vector<std::string> targets;
    NodeHandler handler([&targets](const std::string& target) { targets.push_back(target); });

    EXPECT_EQ(handle(handler, net::Process{"job-1"}), net::Message(net::Ok{}));
    EXPECT_EQ(handle(handler, net::Process{"job-2"}), net::Message(net::Ok{}));
    EXPECT_EQ(targets, (std::vector<std::string>{"job-1", "job-2"}));
    EXPECT_EQ(handler.processed(), 2u);
}

TEST_F(NodeHandlerTest, ProcessWhileBusy) {
    bool called = false;
    NodeHandler handler([&called](const std::string&) { called = true; });
    handler.set_busy(true);

    EXPECT_EQ(handle(handler, net::Process{"job"}), net::Message(net::Busy{}));
    EXPECT_FALSE(called);

    handler.set_busy(false);
    EXPECT_EQ(handle(handler, net::Process{"job"}), net::Message(net::Ok{}));
    EXPECT_TRUE(called);
}

TEST_F(NodeHandlerTest, ProcessFailureRepliesError) {
    NodeHandler handler([](const std::string& target) {
        throw std::runtime_error("no such target " + target);
    });
    EXPECT_EQ(handle(handler, net::Process{"x"}),
              net::Message(net::Error{"no such target x"}));
    EXPECT_EQ(handler.processed(), 0u);
}

TEST_F(NodeHandlerTest, CopyFileAcknowledged) {
    NodeHandler handler;
    net::CopyFile received;
    received.path = "a.txt";
    received.destination = "/tmp/a.txt";
    received.bytes = 3;
    EXPECT_EQ(handle(handler, received), net::Message(net::Ok{}));
}

TEST_F(NodeHandlerTest, RepliesAreNotRequests) {
    NodeHandler handler;
    auto reply = handle(handler, net::Pong{"x"});
    ASSERT_TRUE(std::holds_alternative<net::Error>(reply));
    EXPECT_EQ(std::get<net::Error>(reply).error_message, "unexpected command pong");
}

}  // namespace anp::node::test
