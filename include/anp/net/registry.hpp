#ifndef ANP_NET_REGISTRY_HPP
#define ANP_NET_REGISTRY_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "anp/net/codec.hpp"
#include "anp/net/message.hpp"

namespace anp::net {

// where an incoming COPY_FILE lands. implementations may create directories and must
// return a path that can be opened for writing
class IDestinationResolver {
   public:
    virtual ~IDestinationResolver() = default;

    // throws DecodeError for paths the policy refuses
    [[nodiscard]] virtual std::filesystem::path resolve(const std::string& path) = 0;
};

// joins the relative path onto base_dir. absolute paths and paths leaving base_dir are refused
class DirectoryResolver : public IDestinationResolver {
   public:
    explicit DirectoryResolver(std::filesystem::path base_dir);

    [[nodiscard]] std::filesystem::path resolve(const std::string& path) override;

    [[nodiscard]] const std::filesystem::path& base_dir() const noexcept {
        return base_dir_;
    }

   private:
    std::filesystem::path base_dir_;
};

/*
    frame: [uint32 command id][payload of that variant]
    there is no frame-level length: each field carries its own length prefix, so the id is the
    only self-describing part and decoding must know every payload shape.
*/
class MessageRegistry {
   public:
    // without a resolver an incoming COPY_FILE is a DecodeError
    explicit MessageRegistry(std::shared_ptr<IDestinationResolver> resolver = nullptr);

    // std::nullopt when the peer closed cleanly before the command id.
    // throws UnknownCommand, TruncatedStream, DecodeError
    [[nodiscard]] std::optional<Message> decode_incoming(FrameCodec& codec) const;

    /*
        bad input (invalid utf-8, a COPY_FILE source that can't be opened) throws before the first
        byte is written, so the stream stays usable. a failure once the frame has started is
        always a ProtocolError: the peer holds a partial frame and the connection must go.
    */
    void encode_outgoing(FrameCodec& codec, const Message& message) const;

   private:
    [[nodiscard]] CopyFile receive_file(FrameCodec& codec) const;

    std::shared_ptr<IDestinationResolver> resolver_;
};

}  // namespace anp::net

#endif
