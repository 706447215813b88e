#ifndef ANP_NET_MESSAGE_HPP
#define ANP_NET_MESSAGE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace anp::net {

// wire ids. part of the protocol contract: never renumber, never reuse
enum class CommandId : uint32_t {
    Exit = 1,
    Register = 2,
    Ok = 3,
    Error = 4,
    Ping = 5,
    Pong = 6,
    Available = 7,
    CopyFile = 8,
    Process = 9,
    Busy = 10,
};

[[nodiscard]] std::string_view command_name(CommandId id) noexcept;
[[nodiscard]] std::optional<CommandId> to_command_id(uint32_t raw) noexcept;

// ends the connection loop on the receiving side
struct Exit {
    static constexpr CommandId command = CommandId::Exit;
};

struct Register {
    static constexpr CommandId command = CommandId::Register;
};

struct Ok {
    static constexpr CommandId command = CommandId::Ok;
};

struct Error {
    static constexpr CommandId command = CommandId::Error;
    std::string error_message;
};

struct Ping {
    static constexpr CommandId command = CommandId::Ping;
    std::string message;
};

struct Pong {
    static constexpr CommandId command = CommandId::Pong;
    std::string message;
};

struct Available {
    static constexpr CommandId command = CommandId::Available;
};

/*
    wire payload: [string path][chunked stream]
    path is relative to the receiving node's data directory. source and destination never
    travel: the sender streams from source, the receiver fills in destination and bytes.
*/
struct CopyFile {
    static constexpr CommandId command = CommandId::CopyFile;
    std::string path;
    std::filesystem::path source;
    std::filesystem::path destination;
    uint64_t bytes = 0;
};

// target is opaque to the protocol; the command handler interprets it
struct Process {
    static constexpr CommandId command = CommandId::Process;
    std::string target;
};

struct Busy {
    static constexpr CommandId command = CommandId::Busy;
};

// equality over wire fields only
inline bool operator==(const Exit&, const Exit&) { return true; }
inline bool operator==(const Register&, const Register&) { return true; }
inline bool operator==(const Ok&, const Ok&) { return true; }
inline bool operator==(const Available&, const Available&) { return true; }
inline bool operator==(const Busy&, const Busy&) { return true; }
inline bool operator==(const Error& a, const Error& b) { return a.error_message == b.error_message; }
inline bool operator==(const Ping& a, const Ping& b) { return a.message == b.message; }
inline bool operator==(const Pong& a, const Pong& b) { return a.message == b.message; }
inline bool operator==(const Process& a, const Process& b) { return a.target == b.target; }
inline bool operator==(const CopyFile& a, const CopyFile& b) { return a.path == b.path; }
inline bool operator!=(const Exit& a, const Exit& b) { return !(a == b); }
inline bool operator!=(const Register& a, const Register& b) { return !(a == b); }
inline bool operator!=(const Ok& a, const Ok& b) { return !(a == b); }
inline bool operator!=(const Available& a, const Available& b) { return !(a == b); }
inline bool operator!=(const Busy& a, const Busy& b) { return !(a == b); }
inline bool operator!=(const Error& a, const Error& b) { return !(a == b); }
inline bool operator!=(const Ping& a, const Ping& b) { return !(a == b); }
inline bool operator!=(const Pong& a, const Pong& b) { return !(a == b); }
inline bool operator!=(const Process& a, const Process& b) { return !(a == b); }
inline bool operator!=(const CopyFile& a, const CopyFile& b) { return !(a == b); }

using Message =
    std::variant<Exit, Register, Ok, Error, Ping, Pong, Available, CopyFile, Process, Busy>;

[[nodiscard]] CommandId command_of(const Message& message) noexcept;

// "ping hello", "exit", ... for logs
[[nodiscard]] std::string to_string(const Message& message);

}  // namespace anp::net

#endif
