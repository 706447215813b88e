#ifndef ANP_NODE_NODE_HANDLER_HPP
#define ANP_NODE_NODE_HANDLER_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

#include "anp/net/codec.hpp"
#include "anp/net/message.hpp"
#include "anp/net/registry.hpp"

namespace anp::node {

// runs the work named by a PROCESS target. throw to reply ERROR
using ProcessCallback = std::function<void(const std::string& target)>;

/*
    command handler of a worker node:
        REGISTER   -> OK
        PING m     -> PONG m
        AVAILABLE  -> OK
        PROCESS t  -> BUSY while busy, else run callback -> OK / ERROR
        COPY_FILE  -> OK (the file is already on disk once the message is decoded)
        anything else -> ERROR
    shared by every connection worker, so all state is atomic.
*/
class NodeHandler {
   public:
    explicit NodeHandler(ProcessCallback on_process = {});

    void operator()(net::FrameCodec& codec, const net::Message& message);

    void set_busy(bool busy) noexcept {
        busy_ = busy;
    }

    [[nodiscard]] bool busy() const noexcept {
        return busy_;
    }

    [[nodiscard]] std::size_t registrations() const noexcept {
        return registrations_;
    }

    [[nodiscard]] std::size_t processed() const noexcept {
        return processed_;
    }

   private:
    void reply(net::FrameCodec& codec, const net::Message& message);

    ProcessCallback on_process_;
    net::MessageRegistry registry_;
    std::atomic<bool> busy_{false};
    std::atomic<std::size_t> registrations_{0};
    std::atomic<std::size_t> processed_{0};
};

}  // namespace anp::node

#endif
