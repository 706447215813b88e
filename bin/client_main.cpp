#include "anp/net/client/client.hpp"

#include <iostream>
#include <string>
#include <vector>

#include "anp/util/config.hpp"
#include "anp/util/logger.hpp"

using namespace anp::net;
using namespace anp::net::client;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [args]\n"
              << "Options:\n"
              << "  --host HOST       Server host (default: 127.0.0.1)\n"
              << "  --port PORT       Server port (default: 41433)\n"
              << "  --key SECRET      Shared encryption secret\n"
              << "  --key-file FILE   Read the shared secret from FILE\n"
              << "  --timeout SECS    Socket timeout (default: 30)\n"
              << "  --log-level LVL   debug, info, warn, error, none (default: warn)\n"
              << "  --help            Show this help\n"
              << "\n"
              << "Commands:\n"
              << "  ping [text]             Health check, prints the PONG text\n"
              << "  register                Register with the node\n"
              << "  available               Report this node as available\n"
              << "  process TARGET          Dispatch work\n"
              << "  copy LOCAL REMOTE       Copy a local file to REMOTE (relative path)\n";
}

// 0 for OK, 2 for BUSY, 1 for ERROR
int report(const Message& reply) {
    std::cout << to_string(reply) << std::endl;
    if (std::holds_alternative<Ok>(reply)) {
        return 0;
    }
    if (std::holds_alternative<Busy>(reply)) {
        return 2;
    }
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    ClientOptions opts;
    anp::util::Config key_config;
    std::vector<std::string> command;

    anp::util::Logger::instance().set_level(anp::util::LogLevel::Warn);

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--host" && i + 1 < argc) {
                opts.host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                opts.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--key" && i + 1 < argc) {
                key_config.encryption_key = argv[++i];
            } else if (arg == "--key-file" && i + 1 < argc) {
                key_config.encryption_key_file = argv[++i];
            } else if (arg == "--timeout" && i + 1 < argc) {
                opts.timeout_seconds = std::stoi(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                anp::util::Logger::instance().set_level(anp::util::parse_log_level(argv[++i]));
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-' && command.empty()) {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            } else {
                command.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 1;
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto encryption =
            anp::crypto::EncryptionConfig::from_secret(key_config.resolve_encryption_key());
        Client client(opts, encryption);
        client.connect();

        const std::string& cmd = command[0];
        int status = 0;

        if (cmd == "ping") {
            std::string text = command.size() > 1 ? command[1] : "ping";
            std::cout << client.ping(text) << std::endl;
        } else if (cmd == "register" && command.size() == 1) {
            status = report(client.register_node());
        } else if (cmd == "available" && command.size() == 1) {
            status = report(client.available());
        } else if (cmd == "process" && command.size() == 2) {
            status = report(client.process(command[1]));
        } else if (cmd == "copy" && command.size() == 3) {
            status = report(client.copy_file(command[1], command[2]));
        } else {
            std::cerr << "Unknown command or wrong arguments: " << cmd << std::endl;
            print_usage(argv[0]);
            status = 1;
        }

        client.disconnect();
        return status;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
