/**
 * @file wopan_upload.cpp
 * @brief Upload one local file to Wopan from the shell
 *
 * EXIT CODES:
 *   0  upload confirmed by a file id
 *   1  upload failed
 *   2  bad arguments
 *   3  all parts accepted but no file id was returned
 *
 * Ctrl+C cancels between parts or during a retry wait.
 */

#include "wopan/crypto/metadata_cipher.hpp"
#include "wopan/events/components.hpp"
#include "wopan/events/event_bus.hpp"
#include "wopan/server/config.hpp"
#include "wopan/server/routes.hpp"
#include "wopan/transport/beast_gateway.hpp"
#include "wopan/upload/uploader.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

using namespace wopan;

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    auto loaded = server::load_upload_command(args);
    if (loaded.is_error()) {
        std::cerr << loaded.error().message << "\n" << server::upload_usage(argv[0]) << std::endl;
        return 2;
    }
    const auto& command = loaded.value();

    spdlog::set_level(spdlog::level::from_str(command.log_level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    events::EventBus event_bus;
    events::LoggerComponent logger(event_bus);
    events::MetricsComponent metrics(event_bus);

    transport::BeastTransportGateway transport(command.verify_tls);
    crypto::AesCbcMetadataCipher cipher;

    upload::UploaderConfig config;
    config.access_token = command.access_token;
    config.chunk_size = command.chunk_size;
    upload::Uploader uploader(config, transport, cipher, event_bus);

    // Signals are delivered on a helper thread so cancel() never runs in a signal handler
    CancellationToken token;
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&token](const boost::system::error_code& ec, int) {
        if (!ec) {
            spdlog::warn("Cancelling upload...");
            token.cancel();
        }
    });
    std::thread signal_thread([&signal_context] { signal_context.run(); });

    auto outcome = uploader.upload(command.file, command.directory_id, token);

    signal_context.stop();
    signal_thread.join();
    metrics.print_stats();

    if (outcome.is_error()) {
        std::cerr << to_string(outcome.error().kind) << ": " << outcome.error().message << std::endl;
        return 1;
    }

    std::cout << server::dump_json(server::outcome_to_json(outcome.value()), 2) << std::endl;
    return outcome.value().confirmed() ? 0 : 3;
}
