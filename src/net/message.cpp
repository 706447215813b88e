#include "anp/net/message.hpp"

#include <type_traits>

namespace anp::net {

std::string_view command_name(CommandId id) noexcept {
    switch (id) {
        case CommandId::Exit:
            return "exit";
        case CommandId::Register:
            return "register";
        case CommandId::Ok:
            return "ok";
        case CommandId::Error:
            return "error";
        case CommandId::Ping:
            return "ping";
        case CommandId::Pong:
            return "pong";
        case CommandId::Available:
            return "available";
        case CommandId::CopyFile:
            return "copy_file";
        case CommandId::Process:
            return "process";
        case CommandId::Busy:
            return "busy";
    }
    return "unknown";
}

std::optional<CommandId> to_command_id(uint32_t raw) noexcept {
    if (raw < static_cast<uint32_t>(CommandId::Exit) ||
        raw > static_cast<uint32_t>(CommandId::Busy)) {
        return std::nullopt;
    }
    return static_cast<CommandId>(raw);
}

CommandId command_of(const Message& message) noexcept {
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::command; }, message);
}

std::string to_string(const Message& message) {
    std::string result(command_name(command_of(message)));

    std::visit(
        [&result](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, Error>) {
                result += " " + m.error_message;
            } else if constexpr (std::is_same_v<T, Ping> || std::is_same_v<T, Pong>) {
                result += " " + m.message;
            } else if constexpr (std::is_same_v<T, Process>) {
                result += " " + m.target;
            } else if constexpr (std::is_same_v<T, CopyFile>) {
                result += " " + m.path;
            }
        },
        message);
    return result;
}

}  // namespace anp::net
