#include "anp/util/config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "anp/net/codec.hpp"

namespace anp::util {

namespace {
std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

uint16_t parse_port(const std::string& s) {
    int value = std::stoi(s);
    if (value < 0 || value > 65535) {
        throw std::invalid_argument("port out of range: " + s);
    }
    return static_cast<uint16_t>(value);
}

std::size_t parse_size(const std::string& s) {
    std::size_t value = std::stoull(s);
    if (value == 0) {
        throw std::invalid_argument("value must be positive: " + s);
    }
    return value;
}

std::size_t parse_chunk_size(const std::string& s) {
    std::size_t value = parse_size(s);
    if (value > net::MAX_CHUNK_SIZE) {
        throw std::invalid_argument("chunk size " + s + " exceeds " +
                                    std::to_string(net::MAX_CHUNK_SIZE));
    }
    return value;
}

// poll() treats a negative timeout as "wait forever"
int parse_timeout_ms(const std::string& s) {
    int value = std::stoi(s);
    if (value <= 0) {
        throw std::invalid_argument("timeout must be positive: " + s);
    }
    return value;
}

int parse_delay_ms(const std::string& s) {
    int value = std::stoi(s);
    if (value < 0) {
        throw std::invalid_argument("delay must not be negative: " + s);
    }
    return value;
}

}  // namespace

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "host") {
            config.host = value;
        } else if (key == "port") {
            config.port = parse_port(value);
        } else if (key == "max_connections") {
            config.max_connections = parse_size(value);
        } else if (key == "accept_timeout_ms") {
            config.accept_timeout_ms = parse_timeout_ms(value);
        } else if (key == "retry_delay_ms") {
            config.retry_delay_ms = parse_delay_ms(value);
        } else if (key == "drain_timeout_ms") {
            config.drain_timeout_ms = parse_delay_ms(value);
        } else if (key == "data_dir") {
            config.data_dir = value;
        } else if (key == "chunk_size") {
            config.chunk_size = parse_chunk_size(value);
        } else if (key == "encryption_key") {
            config.encryption_key = value;
        } else if (key == "encryption_key_file") {
            config.encryption_key_file = value;
        } else if (key == "log_level") {
            config.log_level = parse_log_level(value);
        } else {
            LOG_WARN("ignoring unknown config key: " + key);
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  -c, --config FILE          Config file path\n"
                      << "  -H, --host HOST            Host to bind (default: 127.0.0.1)\n"
                      << "  -p, --port PORT            Port to listen on (default: 41433)\n"
                      << "  -d, --data-dir DIR         Base directory for COPY_FILE (default: .)\n"
                      << "  -k, --key SECRET           Shared encryption secret\n"
                      << "  --key-file FILE            Read the shared secret from FILE\n"
                      << "  --chunk-size BYTES         File transfer chunk size (default: 262144)\n"
                      << "  --max-connections N        Max client connections (default: 1000)\n"
                      << "  --accept-timeout MS        Accept poll interval (default: 1000)\n"
                      << "  --retry-delay MS           Delay before reopening the listener (default: 1000)\n"
                      << "  --drain-timeout MS         Wait for connections on stop (default: 5000)\n"
                      << "  -l, --log-level LEVEL      Log level: debug, info, warn, error, none\n"
                      << "  -h, --help                 Show this help\n";
            return std::nullopt;
        }
        if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = parse_port(argv[++i]);
        } else if ((arg == "-d" || arg == "--data-dir") && i + 1 < argc) {
            config.data_dir = argv[++i];
        } else if ((arg == "-k" || arg == "--key") && i + 1 < argc) {
            config.encryption_key = argv[++i];
        } else if (arg == "--key-file" && i + 1 < argc) {
            config.encryption_key_file = argv[++i];
        } else if (arg == "--chunk-size" && i + 1 < argc) {
            config.chunk_size = parse_chunk_size(argv[++i]);
        } else if (arg == "--max-connections" && i + 1 < argc) {
            config.max_connections = parse_size(argv[++i]);
        } else if (arg == "--accept-timeout" && i + 1 < argc) {
            config.accept_timeout_ms = parse_timeout_ms(argv[++i]);
        } else if (arg == "--retry-delay" && i + 1 < argc) {
            config.retry_delay_ms = parse_delay_ms(argv[++i]);
        } else if (arg == "--drain-timeout" && i + 1 < argc) {
            config.drain_timeout_ms = parse_delay_ms(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            config.log_level = parse_log_level(argv[++i]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            // Config file handled separately in main
            ++i;
        } else {
            std::cerr << "Ignoring unknown option: " << arg << std::endl;
        }
    }

    return config;
}

Config Config::merge(const Config& file_config, const Config& cli_config, const Config& defaults) {
    Config result = defaults;

    // later layers win whenever they differ from the defaults
    for (const Config* layer : {&file_config, &cli_config}) {
        const Config& c = *layer;
        if (c.host != defaults.host) result.host = c.host;
        if (c.port != defaults.port) result.port = c.port;
        if (c.max_connections != defaults.max_connections) result.max_connections = c.max_connections;
        if (c.accept_timeout_ms != defaults.accept_timeout_ms) result.accept_timeout_ms = c.accept_timeout_ms;
        if (c.retry_delay_ms != defaults.retry_delay_ms) result.retry_delay_ms = c.retry_delay_ms;
        if (c.drain_timeout_ms != defaults.drain_timeout_ms) result.drain_timeout_ms = c.drain_timeout_ms;
        if (c.data_dir != defaults.data_dir) result.data_dir = c.data_dir;
        if (c.chunk_size != defaults.chunk_size) result.chunk_size = c.chunk_size;
        if (c.encryption_key != defaults.encryption_key) result.encryption_key = c.encryption_key;
        if (c.encryption_key_file != defaults.encryption_key_file) result.encryption_key_file = c.encryption_key_file;
        if (c.log_level != defaults.log_level) result.log_level = c.log_level;
    }

    return result;
}

std::string Config::resolve_encryption_key() const {
    if (!encryption_key.empty()) {
        return encryption_key;
    }
    if (encryption_key_file.empty()) {
        return "";
    }

    std::ifstream file(encryption_key_file);
    if (!file.is_open()) {
        throw std::runtime_error("unable to read encryption key file " +
                                 encryption_key_file.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return trim(buffer.str());
}

}  // namespace anp::util
