#include "anp/net/registry.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "anp/net/errors.hpp"
#include "anp/util/binary_io.hpp"
#include "anp/util/logger.hpp"

namespace anp::net {

namespace fs = std::filesystem;

namespace {

// a payload field missing entirely means the frame was cut after the command id
std::string require_string(FrameCodec& codec) {
    auto value = codec.read_string();
    if (!value) {
        throw TruncatedStream(4);
    }
    return std::move(*value);
}

// the string field of a variant in wire form. throws std::invalid_argument on bad utf-8
struct StringField {
    std::optional<util::Bytes> operator()(const Error& m) const {
        return util::encode_utf16(m.error_message);
    }
    std::optional<util::Bytes> operator()(const Ping& m) const {
        return util::encode_utf16(m.message);
    }
    std::optional<util::Bytes> operator()(const Pong& m) const {
        return util::encode_utf16(m.message);
    }
    std::optional<util::Bytes> operator()(const Process& m) const {
        return util::encode_utf16(m.target);
    }
    std::optional<util::Bytes> operator()(const CopyFile& m) const {
        return util::encode_utf16(m.path);
    }
    template <typename T>
    std::optional<util::Bytes> operator()(const T&) const {
        return std::nullopt;
    }
};

}  // namespace

// ---------------------------------------------------------------------------------------------
DirectoryResolver::DirectoryResolver(fs::path base_dir)
    : base_dir_(fs::absolute(std::move(base_dir)).lexically_normal()) {}

fs::path DirectoryResolver::resolve(const std::string& path) {
    if (path.empty()) {
        throw DecodeError("COPY_FILE with empty path");
    }

    fs::path relative(path);
    if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
        throw DecodeError("COPY_FILE path must be relative: " + path);
    }

    fs::path full_path = (base_dir_ / relative).lexically_normal();
    fs::path inside = full_path.lexically_relative(base_dir_);
    if (inside.empty() || *inside.begin() == ".." || inside == ".") {
        throw DecodeError("COPY_FILE path escapes " + base_dir_.string() + ": " + path);
    }

    LOG_DEBUG("target file is " + full_path.string());

    fs::path dir_path = full_path.parent_path();
    std::error_code ec;
    if (!fs::is_directory(dir_path, ec)) {
        LOG_DEBUG("creating directory " + dir_path.string());
        fs::create_directories(dir_path, ec);
        if (ec) {
            throw std::runtime_error("unable to create directory " + dir_path.string() + ": " +
                                     ec.message());
        }
    }

    if (fs::exists(full_path, ec)) {
        LOG_WARN("target file " + full_path.string() + " already exists");
    }

    return full_path;
}

// ---------------------------------------------------------------------------------------------
MessageRegistry::MessageRegistry(std::shared_ptr<IDestinationResolver> resolver)
    : resolver_(std::move(resolver)) {}

std::optional<Message> MessageRegistry::decode_incoming(FrameCodec& codec) const {
    auto raw = codec.read_uint32();
    if (!raw) {
        return std::nullopt;  // connection closed between frames
    }

    auto id = to_command_id(*raw);
    if (!id) {
        throw UnknownCommand(*raw);
    }

    switch (*id) {
        case CommandId::Exit:
            return Exit{};
        case CommandId::Register:
            return Register{};
        case CommandId::Ok:
            return Ok{};
        case CommandId::Error:
            return Error{require_string(codec)};
        case CommandId::Ping:
            return Ping{require_string(codec)};
        case CommandId::Pong:
            return Pong{require_string(codec)};
        case CommandId::Available:
            return Available{};
        case CommandId::CopyFile:
            return receive_file(codec);
        case CommandId::Process:
            return Process{require_string(codec)};
        case CommandId::Busy:
            return Busy{};
    }
    throw UnknownCommand(*raw);
}

void MessageRegistry::encode_outgoing(FrameCodec& codec, const Message& message) const {
    const std::string name(command_name(command_of(message)));

    // everything that can fail on bad input fails here, before the first byte is written
    std::optional<util::Bytes> text;
    try {
        text = std::visit(StringField{}, message);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("unable to encode " + name + ": " + e.what());
    }

    const auto* copy = std::get_if<CopyFile>(&message);
    std::ifstream source;
    if (copy) {
        source.open(copy->source, std::ios::binary);
        if (!source.is_open()) {
            throw std::runtime_error("unable to open COPY_FILE source " + copy->source.string());
        }
    }

    codec.write_uint32(static_cast<uint32_t>(command_of(message)));

    // past this point the peer has a partial frame: any failure leaves the stream unusable
    try {
        if (text) {
            codec.write_block(*text);
        }
        if (copy) {
            codec.write_chunked_stream(source);
        }
    } catch (const ProtocolError&) {
        throw;
    } catch (const std::exception& e) {
        throw ProtocolError(name + " to " + codec.peer() + " aborted mid-frame: " + e.what());
    }
}

CopyFile MessageRegistry::receive_file(FrameCodec& codec) const {
    CopyFile result;
    result.path = require_string(codec);

    if (!resolver_) {
        throw DecodeError("no destination policy for COPY_FILE " + result.path);
    }
    result.destination = resolver_->resolve(result.path);

    std::ofstream out(result.destination, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("unable to open " + result.destination.string() +
                                 " for writing");
    }
    result.bytes = codec.read_chunked_stream(out);
    out.close();
    if (!out) {
        throw std::runtime_error("failed to flush " + result.destination.string());
    }
    return result;
}

}  // namespace anp::net
