#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "anp/crypto/cipher.hpp"
#include "anp/net/registry.hpp"
#include "anp/net/server/server.hpp"
#include "anp/node/node_handler.hpp"
#include "anp/util/config.hpp"
#include "anp/util/logger.hpp"
#include "anp/util/signal_handler.hpp"

int main(int argc, char* argv[]) {
    try {
        anp::util::Config defaults;
        anp::util::Config file_config = defaults;
        anp::util::Config cli_config = defaults;

        //first pass: find config_path;
        std::filesystem::path config_path;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = argv[++i];
                break;
            }
        }

        //load config file if specified
        if (!config_path.empty()) {
            auto loaded = anp::util::Config::load_file(config_path);
            if (loaded) {
                file_config = *loaded;
            } else {
                std::cerr << "Warning: Could not load config file: " << config_path << std::endl;
            }
        }

        auto cli_result = anp::util::Config::parse_args(argc, argv);
        if (!cli_result) {
            return 0;  //--help was shown
        }
        cli_config = *cli_result;

        //Merge: CLI > file > defaults
        auto config = anp::util::Config::merge(file_config, cli_config, defaults);

        anp::util::Logger::instance().set_level(config.log_level);

        auto encryption = anp::crypto::EncryptionConfig::from_secret(config.resolve_encryption_key());
        if (encryption.enabled()) {
            LOG_INFO("payload encryption enabled");
        }

        std::filesystem::create_directories(config.data_dir);
        auto resolver = std::make_shared<anp::net::DirectoryResolver>(config.data_dir);

        auto node = std::make_shared<anp::node::NodeHandler>([](const std::string& target) {
            LOG_INFO("processing " + target);
        });

        anp::net::server::ServerOptions server_opts;
        server_opts.host = config.host;
        server_opts.port = config.port;
        server_opts.max_connections = config.max_connections;
        server_opts.accept_timeout = anp::util::Duration(config.accept_timeout_ms);
        server_opts.retry_delay = anp::util::Duration(config.retry_delay_ms);
        server_opts.drain_timeout = anp::util::Duration(config.drain_timeout_ms);
        server_opts.chunk_size = config.chunk_size;

        anp::net::server::Server server(
            [node](anp::net::FrameCodec& codec, const anp::net::Message& message) {
                (*node)(codec, message);
            },
            server_opts, encryption, resolver);

        //install signal handlers
        anp::util::SignalHandler::install();

        server.start();

        LOG_INFO("Press Ctrl+C to shutdown");

        //wait for shutdown signal
        anp::util::SignalHandler::wait_for_shutdown();

        server.stop();

        LOG_INFO("Shutdown complete (" + std::to_string(node->registrations()) +
                 " registrations, " + std::to_string(node->processed()) + " processed)");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("fatal error: " + std::string(e.what()));
        return 1;
    }
}
