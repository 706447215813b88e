#ifndef ANP_UTIL_CONFIG_HPP
#define ANP_UTIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "anp/util/logger.hpp"

namespace anp::util {

struct Config {
    // server
    std::string host = "127.0.0.1";
    uint16_t port = 41433;
    std::size_t max_connections = 1000;
    int accept_timeout_ms = 1000;
    int retry_delay_ms = 1000;
    int drain_timeout_ms = 5000;

    // transfer
    std::filesystem::path data_dir = ".";  // COPY_FILE destinations are relative to this
    std::size_t chunk_size = 256 * 1024;

    // shared secret for payload encryption. empty = disabled
    std::string encryption_key;
    std::filesystem::path encryption_key_file;

    // logging
    LogLevel log_level = LogLevel::Info;

    // Load from file (key = value lines, # comments)
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help
    // throws std::invalid_argument on malformed numbers
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // merge: CLI overrides file
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);

    // the key from encryption_key, or the trimmed contents of encryption_key_file.
    // throws std::runtime_error when the key file can't be read
    [[nodiscard]] std::string resolve_encryption_key() const;
};

}  // namespace anp::util

#endif
