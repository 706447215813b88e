#include "anp/node/node_handler.hpp"

#include <type_traits>

#include "anp/util/logger.hpp"

namespace anp::node {

NodeHandler::NodeHandler(ProcessCallback on_process) : on_process_(std::move(on_process)) {}

void NodeHandler::operator()(net::FrameCodec& codec, const net::Message& message) {
    std::visit(
        [this, &codec](const auto& m) {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, net::Register>) {
                ++registrations_;
                reply(codec, net::Ok{});
            } else if constexpr (std::is_same_v<T, net::Ping>) {
                reply(codec, net::Pong{m.message});
            } else if constexpr (std::is_same_v<T, net::Available>) {
                reply(codec, net::Ok{});
            } else if constexpr (std::is_same_v<T, net::CopyFile>) {
                LOG_INFO("received " + std::to_string(m.bytes) + " bytes into " +
                         m.destination.string());
                reply(codec, net::Ok{});
            } else if constexpr (std::is_same_v<T, net::Process>) {
                if (busy_) {
                    reply(codec, net::Busy{});
                    return;
                }
                try {
                    if (on_process_) {
                        on_process_(m.target);
                    }
                } catch (const std::exception& e) {
                    LOG_ERROR("unable to process " + m.target + ": " + e.what());
                    reply(codec, net::Error{e.what()});
                    return;
                }
                ++processed_;
                reply(codec, net::Ok{});
            } else {
                // replies and EXIT are never requests a node serves
                reply(codec, net::Error{"unexpected command " +
                                        std::string(net::command_name(T::command))});
            }
        },
        message);
}

void NodeHandler::reply(net::FrameCodec& codec, const net::Message& message) {
    registry_.encode_outgoing(codec, message);
}

}  // namespace anp::node
